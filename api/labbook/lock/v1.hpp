#pragma once

#include "config/config.pb.h"
#include "labbook/lock/v1/lock_record.pb.h"

namespace labbook::v1 {
using namespace ::labbook::lock::v1;
using namespace ::labbook::runtime::config;
}
