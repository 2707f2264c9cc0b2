#include "scoped_chdir.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace labbook::util {

ScopedChdir::ScopedChdir(const std::filesystem::path& dir) {
  std::error_code ec;
  previous_ = std::filesystem::current_path(ec);
  if (ec) {
    throw IOError("read working directory: " + ec.message());
  }

  std::filesystem::current_path(dir, ec);
  if (ec) {
    throw IOError("enter " + dir.string() + ": " + ec.message());
  }
}

ScopedChdir::~ScopedChdir() {
  std::error_code ec;
  std::filesystem::current_path(previous_, ec);
  if (ec) {
    LABBOOK_LOG_ERROR("failed to restore working directory",
                      {observability::StringField("path", previous_.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace labbook::util
