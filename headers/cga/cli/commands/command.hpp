//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_COMMAND_HPP
#define CGA_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Base class and registry for cga subcommands.
 *
 * Every cga subcommand reads one relations document and writes a report,
 * so the base class owns what they share: the relations-file check, the
 * --quiet/--verbose/--json switches and the help layout. Subcommands
 * register themselves from a static registrar in their own translation
 * unit; main() only looks them up by name.
 */

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cga::cli
{
    /**
     * One --long / -s option of a subcommand.
     */
    struct ArgDef {
        std::string name;
        char short_name = 0;
        std::string description;
        bool takes_value = false;
        std::string default_value;
        std::string value_name;

        /// An on/off switch such as --parallel.
        static ArgDef flag(std::string name, char short_name, std::string description);

        /// An option carrying a value such as --top N.
        static ArgDef option(
            std::string name,
            char short_name,
            std::string value_name,
            std::string description,
            std::string default_value = ""
        );
    };

    /**
     * Options accepted by every subcommand: --help, --verbose, --quiet, --json.
     */
    [[nodiscard]] const std::vector<ArgDef>& common_arguments();

    /**
     * Parsed command line of one subcommand.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, std::string value);
        void set_flag(const std::string& name);
        void add_positional(std::string value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& fallback) const;

        /**
         * Reads a non-negative count such as --top or --max-cycles.
         *
         * @return nullopt when the option is absent, negative, out of range
         *         or has trailing characters.
         */
        [[nodiscard]] std::optional<std::size_t> get_count(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::string> values_;
        std::unordered_set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,
        Normal,
        Verbose
    };

    /**
     * Base class for the analysis subcommands.
     */
    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * One-line synopsis, "Usage: cga <name> [OPTIONS] <relations.json>".
         */
        [[nodiscard]] std::string usage() const;

        /**
         * Command lines shown under "Examples:" in the help text.
         */
        [[nodiscard]] virtual std::vector<std::string> examples() const { return {}; }

        /**
         * Options of this subcommand, without the common ones.
         */
        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Checks the parsed command line before execute().
         *
         * The default accepts exactly one relations file.
         *
         * @return Problem description, empty when the arguments are usable.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        /**
         * Runs the subcommand.
         *
         * @return Exit code: 0 success, 1 failure, 2 issues reported.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        void print_help() const;

    protected:
        /**
         * Reads --quiet, --verbose and --json.
         */
        void apply_common_flags(const ParsedArgs& args);

        void print(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;
        static void print_error(std::string_view msg);

        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_json() const { return json_output_; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        bool json_output_ = false;
    };

    /**
     * Subcommands by name.
     */
    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        /**
         * Adds a subcommand. A second command with the same name replaces
         * the first.
         */
        void register_command(std::unique_ptr<Command> command);

        [[nodiscard]] Command* find(std::string_view name) const;

        /**
         * Registered subcommands in name order.
         */
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::map<std::string, std::unique_ptr<Command>, std::less<>> commands_;
    };

    /**
     * Outcome of parse_arguments(). On failure, error holds the message.
     */
    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments following the subcommand name.
     *
     * Accepts --name value, --name=value, -s value, -svalue and clusters of
     * short switches (-jv). "--" ends option parsing. The common arguments
     * are recognized in addition to @p defs, and defaults are applied
     * before parsing.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );
}  // namespace cga::cli

#endif //CGA_COMMAND_HPP
