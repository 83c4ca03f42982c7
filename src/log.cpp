/**
 * @file log.cpp
 * @brief Library logger setup.
 */

#include <lazybits/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lazybits {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
    // An application may have registered its own logger under our name
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace lazybits
