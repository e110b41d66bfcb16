#pragma once
#include <string>
#include "model/CheckRecord.hpp"

namespace netstatus::util {

// Local time as "YYYY-MM-DD HH:MM:SS"
[[nodiscard]] std::string format_local(model::Clock::time_point tp);

} // namespace netstatus::util
