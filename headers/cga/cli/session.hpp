//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_SESSION_HPP
#define CGA_SESSION_HPP

/**
 * @file session.hpp
 * @brief Shared setup for the analysis commands.
 *
 * Every analysis command takes a relations file plus the same
 * configuration options. open_session() turns them into a ready
 * GraphAnalyzer and applies the configured log level.
 */

#include "cga/analysis/graph_analyzer.hpp"
#include "cga/cli/commands/command.hpp"
#include "cga/result.hpp"

#include <vector>

namespace cga::cli
{
    /**
     * Arguments understood by open_session(): --config, --max-cycles, --parallel.
     */
    [[nodiscard]] std::vector<ArgDef> session_arguments();

    /**
     * Loads configuration and relations, and builds the analyzer.
     *
     * Command-line values override the configuration file. --verbose
     * lowers the log level to debug and --quiet raises it to error.
     */
    [[nodiscard]] Result<analysis::GraphAnalyzer> open_session(const ParsedArgs& args);

}  // namespace cga::cli

#endif //CGA_SESSION_HPP
