//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/cli/commands/command.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <utility>

namespace cga::cli
{
    // ============================================================================
    // Argument definitions
    // ============================================================================

    ArgDef ArgDef::flag(std::string name, const char short_name, std::string description) {
        ArgDef def;
        def.name = std::move(name);
        def.short_name = short_name;
        def.description = std::move(description);
        return def;
    }

    ArgDef ArgDef::option(
        std::string name,
        const char short_name,
        std::string value_name,
        std::string description,
        std::string default_value
    ) {
        ArgDef def;
        def.name = std::move(name);
        def.short_name = short_name;
        def.description = std::move(description);
        def.takes_value = true;
        def.default_value = std::move(default_value);
        def.value_name = std::move(value_name);
        return def;
    }

    const std::vector<ArgDef>& common_arguments() {
        static const std::vector<ArgDef> common = {
            ArgDef::flag("help", 'h', "Show this help message"),
            ArgDef::flag("verbose", 'v', "Log progress and timings"),
            ArgDef::flag("quiet", 'q', "Only report errors"),
            ArgDef::flag("json", 0, "Write the report as JSON to stdout"),
        };
        return common;
    }

    // ============================================================================
    // ParsedArgs
    // ============================================================================

    void ParsedArgs::set(const std::string& name, std::string value) {
        values_[name] = std::move(value);
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_.insert(name);
    }

    void ParsedArgs::add_positional(std::string value) {
        positional_.push_back(std::move(value));
    }

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        if (const auto it = values_.find(name); it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& fallback) const {
        return get(name).value_or(fallback);
    }

    std::optional<std::size_t> ParsedArgs::get_count(const std::string& name) const {
        const auto text = get(name);
        if (!text || text->empty()) {
            return std::nullopt;
        }

        std::size_t count = 0;
        const char* first = text->data();
        const char* last = first + text->size();
        const auto [end, ec] = std::from_chars(first, last, count);
        if (ec != std::errc{} || end != last) {
            return std::nullopt;
        }
        return count;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    // ============================================================================
    // Command
    // ============================================================================

    std::string Command::usage() const {
        return "Usage: cga " + std::string(name()) + " [OPTIONS] <relations.json>";
    }

    std::string Command::validate(const ParsedArgs& args) const {
        if (args.positional().empty()) {
            return "No relations file specified. Use 'cga " + std::string(name()) + " <relations.json>'";
        }
        if (args.positional().size() > 1) {
            return "Only one relations file can be analyzed at a time";
        }
        return "";
    }

    namespace {

        void print_options(std::ostream& out, const std::vector<ArgDef>& defs) {
            for (const auto& def : defs) {
                std::string left = def.short_name ? std::string("-") + def.short_name + ", " : "    ";
                left += "--" + def.name;
                if (def.takes_value) {
                    left += " " + def.value_name;
                }

                out << "  " << std::left << std::setw(26) << left << def.description;
                if (!def.default_value.empty()) {
                    out << " (default: " << def.default_value << ")";
                }
                out << "\n";
            }
        }

    }  // namespace

    void Command::print_help() const {
        std::cout << "cga " << name() << " - " << description() << "\n\n";
        std::cout << usage() << "\n\n";
        std::cout << "Arguments:\n";
        std::cout << "  " << std::left << std::setw(26) << "<relations.json>"
                  << "Calls, dependencies and inheritance of the codebase\n";

        if (const auto defs = arguments(); !defs.empty()) {
            std::cout << "\nOptions:\n";
            print_options(std::cout, defs);
        }

        std::cout << "\nCommon options:\n";
        print_options(std::cout, common_arguments());

        if (const auto lines = examples(); !lines.empty()) {
            std::cout << "\nExamples:\n";
            for (const auto& line : lines) {
                std::cout << "  " << line << "\n";
            }
        }
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        } else if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        } else {
            verbosity_ = Verbosity::Normal;
        }
        json_output_ = args.get_flag("json");
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ == Verbosity::Verbose) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    // ============================================================================
    // CommandRegistry
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> command) {
        std::string key(command->name());
        commands_[std::move(key)] = std::move(command);
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = commands_.find(name);
        return it != commands_.end() ? it->second.get() : nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& entry : commands_) {
            result.push_back(entry.second.get());
        }
        return result;
    }

    // ============================================================================
    // Argument parser
    // ============================================================================

    namespace {

        class ArgumentParser {
        public:
            ArgumentParser(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args)
            {
                for (const auto* group : {&common_arguments(), &defs}) {
                    for (const auto& def : *group) {
                        by_name_[def.name] = &def;
                        if (def.short_name) {
                            by_short_[def.short_name] = &def;
                        }
                        if (def.takes_value && !def.default_value.empty()) {
                            result_.args.set(def.name, def.default_value);
                        }
                    }
                }
            }

            ParseResult run() {
                bool options_ended = false;
                while (result_.success && pos_ < args_.size()) {
                    const std::string& arg = args_[pos_++];
                    if (arg.empty()) {
                        continue;
                    }
                    if (options_ended || arg[0] != '-' || arg == "-") {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        options_ended = true;
                    } else if (arg[1] == '-') {
                        parse_long(arg.substr(2));
                    } else {
                        parse_short_cluster(arg);
                    }
                }
                return std::move(result_);
            }

        private:
            void fail(std::string message) {
                result_.success = false;
                result_.error = std::move(message);
            }

            /// Consumes the next argument as a value, empty when none is left.
            std::string next_value() {
                return pos_ < args_.size() ? args_[pos_++] : std::string();
            }

            void parse_long(std::string name) {
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const auto it = by_name_.find(name);
                if (it == by_name_.end()) {
                    fail("Unknown option: --" + name);
                    return;
                }

                const ArgDef& def = *it->second;
                if (!def.takes_value) {
                    result_.args.set_flag(def.name);
                    return;
                }

                std::string value = inline_value ? *inline_value : next_value();
                if (value.empty()) {
                    fail("Option --" + name + " requires a value");
                    return;
                }
                result_.args.set(def.name, std::move(value));
            }

            void parse_short_cluster(const std::string& arg) {
                for (std::size_t i = 1; i < arg.size(); ++i) {
                    const char c = arg[i];
                    const auto it = by_short_.find(c);
                    if (it == by_short_.end()) {
                        fail(std::string("Unknown option: -") + c);
                        return;
                    }

                    const ArgDef& def = *it->second;
                    if (!def.takes_value) {
                        result_.args.set_flag(def.name);
                        continue;
                    }

                    // The rest of the cluster, or the next argument, is the value
                    std::string value = i + 1 < arg.size() ? arg.substr(i + 1) : next_value();
                    if (value.empty()) {
                        fail(std::string("Option -") + c + " requires a value");
                        return;
                    }
                    result_.args.set(def.name, std::move(value));
                    return;
                }
            }

            const std::vector<std::string>& args_;
            std::size_t pos_ = 0;
            std::unordered_map<std::string, const ArgDef*> by_name_;
            std::unordered_map<char, const ArgDef*> by_short_;
            ParseResult result_;
        };

    }  // namespace

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        return ArgumentParser(args, defs).run();
    }
}  // namespace cga::cli
