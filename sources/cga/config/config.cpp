//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/config/config.hpp"
#include "cga/utils/logging.hpp"

#include <toml++/toml.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace cga::config
{
    namespace {

        /**
         * Reads a non-negative integer into @p target.
         */
        Result<void> read_count(
            const toml::table& section,
            const std::string_view key,
            const std::string& context,
            std::size_t& target
        ) {
            if (!section.contains(key)) {
                return Result<void>::success();
            }

            const auto value = section[key].value_or(static_cast<std::int64_t>(target));
            if (value < 0) {
                return Result<void>::failure(
                    Error::config_error("value must not be negative", context)
                );
            }
            target = static_cast<std::size_t>(value);
            return Result<void>::success();
        }

        /**
         * Rejects NaN, infinities and negative values.
         */
        Result<void> check_non_negative(const double value, const std::string& context) {
            if (!std::isfinite(value)) {
                return Result<void>::failure(
                    Error::config_error("value must be a finite number", context)
                );
            }
            if (value < 0.0) {
                return Result<void>::failure(
                    Error::config_error("value must not be negative", context)
                );
            }
            return Result<void>::success();
        }

    }  // namespace

    Result<void> Config::validate() const {
        const auto& pagerank = analyzer.pagerank;

        if (!std::isfinite(pagerank.damping) || pagerank.damping < 0.0 || pagerank.damping > 1.0) {
            return Result<void>::failure(
                Error::config_error("damping must be in [0, 1]", "pagerank.damping")
            );
        }
        if (auto r = check_non_negative(pagerank.tolerance, "pagerank.tolerance"); r.is_err()) {
            return r;
        }

        const auto& thresholds = analyzer.thresholds;
        if (auto r = check_non_negative(thresholds.max_average_instability,
                                        "thresholds.max_average_instability"); r.is_err()) {
            return r;
        }
        if (auto r = check_non_negative(thresholds.max_dependency_density,
                                        "thresholds.max_dependency_density"); r.is_err()) {
            return r;
        }
        if (auto r = check_non_negative(thresholds.max_call_density,
                                        "thresholds.max_call_density"); r.is_err()) {
            return r;
        }

        if (!logging::parse_level(logging.level)) {
            return Result<void>::failure(
                Error::config_error("unknown log level '" + logging.level + "'", "logging.level")
            );
        }

        return Result<void>::success();
    }

    Result<Config> load_from_file(const std::filesystem::path& path) {
        if (std::error_code ec; !std::filesystem::exists(path, ec)) {
            return Result<Config>::failure(
                Error::not_found("Configuration file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<Config>::failure(
                Error::io_error("Failed to open configuration file", path.string())
            );
        }

        std::ostringstream content;
        content << file.rdbuf();

        auto result = load_from_string(content.str());
        if (result.is_err()) {
            return Result<Config>::failure(result.error().with_context(path.string()));
        }
        return result;
    }

    Result<Config> load_from_string(const std::string_view content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(
                Error::parse_error("Failed to parse TOML configuration", std::string(err.description()))
            );
        }

        Config config;
        auto& options = config.analyzer;

        if (const auto* pagerank = tbl["pagerank"].as_table()) {
            options.pagerank.damping = (*pagerank)["damping"].value_or(options.pagerank.damping);
            options.pagerank.tolerance = (*pagerank)["tolerance"].value_or(options.pagerank.tolerance);
            if (auto r = read_count(*pagerank, "max_iterations", "pagerank.max_iterations",
                                    options.pagerank.max_iterations); r.is_err()) {
                return Result<Config>::failure(r.error());
            }
        }

        if (const auto* cycles = tbl["cycles"].as_table()) {
            if (auto r = read_count(*cycles, "max_cycles", "cycles.max_cycles", options.max_cycles); r.is_err()) {
                return Result<Config>::failure(r.error());
            }
        }

        if (const auto* analysis = tbl["analysis"].as_table()) {
            options.parallel = (*analysis)["parallel"].value_or(options.parallel);
        }

        if (const auto* thresholds = tbl["thresholds"].as_table()) {
            auto& limits = options.thresholds;
            if (auto r = read_count(*thresholds, "max_call_cycles", "thresholds.max_call_cycles",
                                    limits.max_call_cycles); r.is_err()) {
                return Result<Config>::failure(r.error());
            }
            if (auto r = read_count(*thresholds, "max_coupling", "thresholds.max_coupling",
                                    limits.max_coupling); r.is_err()) {
                return Result<Config>::failure(r.error());
            }
            limits.max_average_instability =
                (*thresholds)["max_average_instability"].value_or(limits.max_average_instability);
            limits.max_dependency_density =
                (*thresholds)["max_dependency_density"].value_or(limits.max_dependency_density);
            limits.max_call_density =
                (*thresholds)["max_call_density"].value_or(limits.max_call_density);
        }

        if (const auto* log = tbl["logging"].as_table()) {
            config.logging.level = (*log)["level"].value_or(config.logging.level);
        }

        if (auto validation = config.validate(); validation.is_err()) {
            return Result<Config>::failure(validation.error());
        }

        return Result<Config>::success(std::move(config));
    }

}  // namespace cga::config
