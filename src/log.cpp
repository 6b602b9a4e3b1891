// src/log.cpp
// Lazy creation of the "ran" logger.

#include "ran/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ran {

namespace {

const char* const LOGGER_NAME = "ran";

std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

} // namespace ran
