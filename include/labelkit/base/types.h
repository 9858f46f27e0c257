#pragma once

#include <cstdint>

namespace labelkit {
namespace base {

using ObjectId = uint64_t;

} // namespace base
} // namespace labelkit
