#pragma once

/// @file include/mktpsych/log.hpp
/// @brief Process logger for the analysis library.
///
/// A single spdlog logger named "mktpsych" writing to stderr. It is created on
/// first use; `set_level` may be called at any time.

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string_view>

namespace mktpsych::log {

/// The shared library logger.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Parse "trace" | "debug" | "info" | "warn" | "error" | "off".
[[nodiscard]] std::optional<spdlog::level::level_enum>
parse_level(std::string_view name) noexcept;

/// Apply a level by name. Returns false (level unchanged) for unknown names.
bool set_level(std::string_view name);

} // namespace mktpsych::log
