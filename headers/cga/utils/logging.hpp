//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_LOGGING_HPP
#define CGA_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief spdlog setup shared by the library and the CLI.
 *
 * Library code logs through the spdlog default logger. The CLI calls
 * init() once so that diagnostics go to stderr and never mix with report
 * output on stdout.
 */

#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>

namespace cga::logging {

    /**
     * Parses "trace", "debug", "info", "warn", "error", "critical" or "off"
     * (case-insensitive, "warning" accepted as "warn").
     */
    [[nodiscard]] std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

    /**
     * Installs a colored stderr logger named "cga" as the default logger.
     */
    void init(spdlog::level::level_enum level = spdlog::level::info);

    void set_level(spdlog::level::level_enum level);

}  // namespace cga::logging

#endif //CGA_LOGGING_HPP
