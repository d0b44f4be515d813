//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace cga::logging {

    std::optional<spdlog::level::level_enum> parse_level(const std::string_view name) {
        std::string lowered(name);
        std::ranges::transform(lowered, lowered.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        if (lowered == "trace") return spdlog::level::trace;
        if (lowered == "debug") return spdlog::level::debug;
        if (lowered == "info") return spdlog::level::info;
        if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
        if (lowered == "error") return spdlog::level::err;
        if (lowered == "critical") return spdlog::level::critical;
        if (lowered == "off") return spdlog::level::off;
        return std::nullopt;
    }

    void init(const spdlog::level::level_enum level) {
        auto logger = spdlog::get("cga");
        if (!logger) {
            logger = spdlog::stderr_color_mt("cga");
        }
        logger->set_pattern("[%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::set_level(level);
    }

    void set_level(const spdlog::level::level_enum level) {
        spdlog::set_level(level);
    }

}  // namespace cga::logging
