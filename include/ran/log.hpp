// include/ran/log.hpp
// Library logger — a named spdlog logger "ran" writing to stderr.

#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace ran {

// The logger used by every connection. Created on first use; if the
// application registers its own logger named "ran" first, that one is used.
std::shared_ptr<spdlog::logger> logger();

} // namespace ran
