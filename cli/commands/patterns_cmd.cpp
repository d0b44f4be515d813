//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/cli/commands/command.hpp"
#include "cga/cli/formatter.hpp"
#include "cga/cli/session.hpp"

#include "cga/export/json_exporter.hpp"

#include <iostream>

namespace cga::cli
{
    /**
     * Patterns command - reports structural problems.
     *
     * Exits with 2 when at least one issue is found so that CI jobs can
     * fail on it.
     */
    class PatternsCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "patterns";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detect cycles, unstable modules, coupling hubs and dense graphs (exit status 2 on issues)";
        }

        [[nodiscard]] std::vector<std::string> examples() const override {
            return {
                "cga patterns relations.json",
                "cga patterns --config strict.toml --json relations.json",
            };
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = session_arguments();
            args.push_back(ArgDef::flag("no-color", 0, "Disable colored output"));
            return args;
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

            const auto report = session.value().check_problematic_patterns();

            if (is_json()) {
                std::cout << exporters::to_json(report).dump(2) << "\n";
            } else if (!is_quiet()) {
                const SummaryPrinter printer(std::cout);
                printer.print_patterns(report);
            }

            return report.empty() ? 0 : 2;
        }
    };

    namespace {
        struct PatternsCommandRegistrar {
            PatternsCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<PatternsCommand>()
                );
            }
        } patterns_registrar;
    }
}  // namespace cga::cli
