#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace labbook::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw IOError.

  `context` names the operation and path so the error is actionable.
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result, const std::string& context) {
  if (!result.ok()) throw labbook::util::IOError(context + ": " + result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) throw labbook::util::IOError(context + ": " + status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file, const std::string& context) {
  auto size = Unwrap(file->GetSize(), context);
  return Unwrap(file->Read(size), context);
}

} // namespace labbook::storage::common
