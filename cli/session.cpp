//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/cli/session.hpp"
#include "cga/config/config.hpp"
#include "cga/io/relations_loader.hpp"
#include "cga/utils/logging.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace cga::cli
{
    std::vector<ArgDef> session_arguments() {
        return {
            ArgDef::option("config", 'c', "FILE", "TOML configuration file"),
            ArgDef::option("max-cycles", 0, "N", "List at most N cycles per graph (0 = no limit)"),
            ArgDef::flag("parallel", 'j', "Compute the three graphs concurrently"),
        };
    }

    Result<analysis::GraphAnalyzer> open_session(const ParsedArgs& args) {
        config::Config cfg;
        if (const auto path = args.get("config")) {
            auto loaded = config::load_from_file(*path);
            if (loaded.is_err()) {
                return Result<analysis::GraphAnalyzer>::failure(loaded.error());
            }
            cfg = std::move(loaded.value());
        }

        auto level = logging::parse_level(cfg.logging.level).value_or(spdlog::level::info);
        if (args.get_flag("quiet")) {
            level = spdlog::level::err;
        } else if (args.get_flag("verbose")) {
            level = spdlog::level::debug;
        }
        logging::set_level(level);

        if (args.has("max-cycles")) {
            const auto max_cycles = args.get_count("max-cycles");
            if (!max_cycles) {
                return Result<analysis::GraphAnalyzer>::failure(
                    Error::invalid_argument("--max-cycles expects a non-negative integer",
                                            args.get_or("max-cycles", ""))
                );
            }
            cfg.analyzer.max_cycles = *max_cycles;
        }
        if (args.get_flag("parallel")) {
            cfg.analyzer.parallel = true;
        }

        if (args.positional().empty()) {
            return Result<analysis::GraphAnalyzer>::failure(
                Error::invalid_argument("No relations file specified")
            );
        }

        const auto& relations_path = args.positional().front();
        spdlog::debug("Loading relations from {}", relations_path);

        auto builder = io::load_relations(relations_path);
        if (builder.is_err()) {
            return Result<analysis::GraphAnalyzer>::failure(builder.error());
        }

        builder.value().set_options(cfg.analyzer);
        return Result<analysis::GraphAnalyzer>::success(std::move(builder.value()).build());
    }

}  // namespace cga::cli
