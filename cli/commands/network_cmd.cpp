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
     * Network command - prints whole-graph metrics.
     */
    class NetworkCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "network";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show density, clustering, path length and components of each graph";
        }

        [[nodiscard]] std::vector<std::string> examples() const override {
            return {
                "cga network relations.json",
                "cga network --json relations.json",
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

            const auto metrics = session.value().calculate_network_metrics();

            if (is_json()) {
                std::cout << exporters::to_json(metrics).dump(2) << "\n";
            } else if (!is_quiet()) {
                const SummaryPrinter printer(std::cout);
                printer.print_network_metrics(metrics);
                std::cout << "\n";
            }

            return 0;
        }
    };

    namespace {
        struct NetworkCommandRegistrar {
            NetworkCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<NetworkCommand>()
                );
            }
        } network_registrar;
    }
}  // namespace cga::cli
