//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/cli/commands/command.hpp"
#include "cga/cli/formatter.hpp"
#include "cga/cli/session.hpp"

#include "cga/export/json_exporter.hpp"
#include "cga/utils/json_utils.hpp"

#include <iostream>

namespace cga::cli
{
    /**
     * Analyze command - runs the full analysis over a relations file.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Compute centrality, cycles, components and coupling for a codebase";
        }

        [[nodiscard]] std::vector<std::string> examples() const override {
            return {
                "cga analyze relations.json",
                "cga analyze --top 20 --config cga.toml relations.json",
                "cga analyze --json --output report.json relations.json",
            };
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = session_arguments();
            args.push_back(ArgDef::option("output", 'o', "FILE", "Write the JSON report to FILE"));
            args.push_back(ArgDef::option("top", 't', "N", "Nodes and cycles listed per graph (0 = all)", "10"));
            args.push_back(ArgDef::flag("no-color", 0, "Disable colored output"));
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (auto problem = Command::validate(args); !problem.empty()) {
                return problem;
            }
            if (!args.get_count("top")) {
                return "--top expects a non-negative integer";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);
            if (args.get_flag("no-color")) {
                colors::set_enabled(false);
            }

            auto session = open_session(args);
            if (session.is_err()) {
                print_error(session.error().to_string());
                return 1;
            }

            const auto& analyzer = session.value();
            const auto top_count = args.get_count("top").value_or(10);

            print_verbose("Running analysis...");
            const auto result = analyzer.analyze();
            const auto report = exporters::to_json(result, analyzer);

            if (is_json()) {
                std::cout << report.dump(2) << "\n";
            } else if (!is_quiet()) {
                const SummaryPrinter printer(std::cout);
                printer.print_statistics(result.statistics);
                printer.print_centrality(result, analyzer, top_count);
                printer.print_cycles(result.cycles, analyzer, top_count);
                printer.print_coupling(result.coupling, analyzer.dependency_graph(), top_count);
                std::cout << "\n";
            }

            if (auto output_file = args.get("output")) {
                if (auto written = json_utils::write_file(*output_file, report); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                if (!is_json()) {
                    print("Results written to " + *output_file);
                }
            }

            return 0;
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace cga::cli
