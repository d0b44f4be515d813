//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_CONFIG_HPP
#define CGA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration for the analyzer and the CLI.
 *
 * Example cga.toml:
 * @code
 *     [pagerank]
 *     damping = 0.85
 *     max_iterations = 100
 *     tolerance = 1e-6
 *
 *     [cycles]
 *     max_cycles = 0          # 0 = unlimited
 *
 *     [analysis]
 *     parallel = false
 *
 *     [thresholds]
 *     max_call_cycles = 10
 *     max_average_instability = 0.8
 *     max_coupling = 20
 *     max_dependency_density = 0.3
 *     max_call_density = 0.5
 *
 *     [logging]
 *     level = "info"
 * @endcode
 *
 * Every key is optional and unknown keys are ignored. An empty document
 * yields the defaults.
 */

#include "cga/analysis/graph_analyzer.hpp"
#include "cga/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cga::config {

    struct LoggingConfig {
        std::string level = "info";
    };

    struct Config {
        analysis::AnalyzerOptions analyzer;
        LoggingConfig logging;

        /**
         * Checks value ranges.
         *
         * @return ConfigError naming the offending key on failure.
         */
        [[nodiscard]] Result<void> validate() const;
    };

    /**
     * Loads and validates a configuration file.
     *
     * @return The configuration, NotFound/IoError for unreadable files,
     *         ParseError for malformed TOML, ConfigError for bad values.
     */
    [[nodiscard]] Result<Config> load_from_file(const std::filesystem::path& path);

    /**
     * Parses and validates TOML text.
     */
    [[nodiscard]] Result<Config> load_from_string(std::string_view content);

}  // namespace cga::config

#endif //CGA_CONFIG_HPP
