/// @file src/core/log.cpp
/// @brief Library logger on spdlog.

#include "mktpsych/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string>

namespace mktpsych::log {

namespace {

constexpr const char* LOGGER_NAME = "mktpsych";

std::shared_ptr<spdlog::logger> make_logger() {
    // Another component may already have registered the name.
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto lg = spdlog::stderr_color_mt(LOGGER_NAME);
    lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
    lg->set_level(spdlog::level::info);

    if (const char* env = std::getenv("MKTPSYCH_LOG_LEVEL")) {
        if (auto lvl = parse_level(env)) {
            lg->set_level(*lvl);
        }
    }
    return lg;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return std::nullopt;
}

bool set_level(std::string_view name) {
    auto lvl = parse_level(name);
    if (!lvl) {
        logger()->warn("unknown log level '{}', keeping '{}'",
                       name, spdlog::level::to_string_view(logger()->level()));
        return false;
    }
    logger()->set_level(*lvl);
    return true;
}

}  // namespace mktpsych::log
