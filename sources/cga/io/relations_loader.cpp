//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/io/relations_loader.hpp"
#include "cga/utils/json_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>
#include <utility>

namespace cga::io {

    using json = nlohmann::json;

    namespace {

        std::string entry_context(const std::string& section, const std::size_t index, const std::string& key) {
            return section + "[" + std::to_string(index) + "]." + key;
        }

        /**
         * Reads a required, non-empty string field.
         */
        Result<std::string> required_name(
            const json& entry,
            const std::string& section,
            const std::size_t index,
            const std::string& key
        ) {
            auto value = json_utils::get<std::string>(entry, key);
            if (value.is_err()) {
                return Result<std::string>::failure(
                    Error::parse_error(value.error().message(), entry_context(section, index, key))
                );
            }
            if (value.value().empty()) {
                return Result<std::string>::failure(
                    Error::parse_error("name must not be empty", entry_context(section, index, key))
                );
            }
            return value;
        }

        /**
         * Reads an optional non-negative integer field.
         */
        Result<std::size_t> optional_count(
            const json& entry,
            const std::string& section,
            const std::size_t index,
            const std::string& key,
            const std::size_t default_value
        ) {
            if (!entry.contains(key)) {
                return Result<std::size_t>::success(default_value);
            }

            const auto& value = entry.at(key);
            if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
                return Result<std::size_t>::failure(
                    Error::parse_error("expected a non-negative integer", entry_context(section, index, key))
                );
            }
            return Result<std::size_t>::success(value.get<std::size_t>());
        }

        /**
         * Returns the array stored under @p section, or an empty array.
         */
        Result<json> section_entries(const json& document, const std::string& section) {
            if (!document.contains(section)) {
                return Result<json>::success(json::array());
            }

            const auto& entries = document.at(section);
            if (!entries.is_array()) {
                return Result<json>::failure(
                    Error::parse_error("section must be an array", section)
                );
            }
            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (!entries[i].is_object()) {
                    return Result<json>::failure(
                        Error::parse_error("entry must be an object", section + "[" + std::to_string(i) + "]")
                    );
                }
            }
            return Result<json>::success(entries);
        }

        Result<void> read_calls(const json& document, analysis::GraphBuilder& builder) {
            auto entries = section_entries(document, "calls");
            if (entries.is_err()) {
                return Result<void>::failure(entries.error());
            }

            const auto& calls = entries.value();
            for (std::size_t i = 0; i < calls.size(); ++i) {
                auto caller = required_name(calls[i], "calls", i, "caller");
                if (caller.is_err()) return Result<void>::failure(caller.error());

                auto callee = required_name(calls[i], "calls", i, "callee");
                if (callee.is_err()) return Result<void>::failure(callee.error());

                auto count = optional_count(calls[i], "calls", i, "count", 1);
                if (count.is_err()) return Result<void>::failure(count.error());

                builder.add_call(caller.value(), callee.value(), count.value());
            }
            return Result<void>::success();
        }

        Result<void> read_dependencies(const json& document, analysis::GraphBuilder& builder) {
            auto entries = section_entries(document, "dependencies");
            if (entries.is_err()) {
                return Result<void>::failure(entries.error());
            }

            const auto& dependencies = entries.value();
            for (std::size_t i = 0; i < dependencies.size(); ++i) {
                auto importer = required_name(dependencies[i], "dependencies", i, "importer");
                if (importer.is_err()) return Result<void>::failure(importer.error());

                auto imported = required_name(dependencies[i], "dependencies", i, "imported");
                if (imported.is_err()) return Result<void>::failure(imported.error());

                const auto kind = json_utils::get_or<std::string>(
                    dependencies[i], "kind", graph::IMPORT_EDGE_KIND
                );
                builder.add_dependency(importer.value(), imported.value(), kind);
            }
            return Result<void>::success();
        }

        Result<void> read_inheritance(const json& document, analysis::GraphBuilder& builder) {
            auto entries = section_entries(document, "inheritance");
            if (entries.is_err()) {
                return Result<void>::failure(entries.error());
            }

            const auto& relations = entries.value();
            for (std::size_t i = 0; i < relations.size(); ++i) {
                auto child = required_name(relations[i], "inheritance", i, "child");
                if (child.is_err()) return Result<void>::failure(child.error());

                auto parent = required_name(relations[i], "inheritance", i, "parent");
                if (parent.is_err()) return Result<void>::failure(parent.error());

                builder.add_inheritance(child.value(), parent.value());
            }
            return Result<void>::success();
        }

        Result<void> read_metadata(const json& document, analysis::GraphBuilder& builder) {
            auto functions = section_entries(document, "functions");
            if (functions.is_err()) return Result<void>::failure(functions.error());

            for (std::size_t i = 0; i < functions.value().size(); ++i) {
                const auto& entry = functions.value()[i];
                auto name = required_name(entry, "functions", i, "name");
                if (name.is_err()) return Result<void>::failure(name.error());

                auto line = optional_count(entry, "functions", i, "line", 0);
                if (line.is_err()) return Result<void>::failure(line.error());

                builder.set_call_location(name.value(), json_utils::get_or<std::string>(entry, "file", ""), line.value());
            }

            auto modules = section_entries(document, "modules");
            if (modules.is_err()) return Result<void>::failure(modules.error());

            for (std::size_t i = 0; i < modules.value().size(); ++i) {
                const auto& entry = modules.value()[i];
                auto name = required_name(entry, "modules", i, "name");
                if (name.is_err()) return Result<void>::failure(name.error());

                builder.set_module_path(name.value(), json_utils::get_or<std::string>(entry, "file", ""));
                builder.set_module_external(name.value(), json_utils::get_or<bool>(entry, "external", false));
            }

            auto classes = section_entries(document, "classes");
            if (classes.is_err()) return Result<void>::failure(classes.error());

            for (std::size_t i = 0; i < classes.value().size(); ++i) {
                const auto& entry = classes.value()[i];
                auto name = required_name(entry, "classes", i, "name");
                if (name.is_err()) return Result<void>::failure(name.error());

                auto line = optional_count(entry, "classes", i, "line", 0);
                if (line.is_err()) return Result<void>::failure(line.error());

                builder.set_class_location(name.value(), json_utils::get_or<std::string>(entry, "file", ""), line.value());
            }

            return Result<void>::success();
        }

    }  // namespace

    Result<analysis::GraphBuilder> relations_from_json(const json& document) {
        if (!document.is_object()) {
            return Result<analysis::GraphBuilder>::failure(
                Error::parse_error("relations document must be a JSON object")
            );
        }

        analysis::GraphBuilder builder;

        if (auto r = read_calls(document, builder); r.is_err()) {
            return Result<analysis::GraphBuilder>::failure(r.error());
        }
        if (auto r = read_dependencies(document, builder); r.is_err()) {
            return Result<analysis::GraphBuilder>::failure(r.error());
        }
        if (auto r = read_inheritance(document, builder); r.is_err()) {
            return Result<analysis::GraphBuilder>::failure(r.error());
        }
        if (auto r = read_metadata(document, builder); r.is_err()) {
            return Result<analysis::GraphBuilder>::failure(r.error());
        }

        spdlog::debug("Loaded relations: {} functions, {} modules, {} classes",
                      builder.call_graph().node_count(),
                      builder.dependency_graph().node_count(),
                      builder.inheritance_graph().node_count());

        return Result<analysis::GraphBuilder>::success(std::move(builder));
    }

    Result<analysis::GraphBuilder> parse_relations(const std::string_view content) {
        return json_utils::parse(content).and_then([](const json& document) {
            return relations_from_json(document);
        });
    }

    Result<analysis::GraphBuilder> load_relations(const std::filesystem::path& path) {
        auto document = json_utils::read_file(path);
        if (document.is_err()) {
            return Result<analysis::GraphBuilder>::failure(document.error());
        }

        auto builder = relations_from_json(document.value());
        if (builder.is_err()) {
            return Result<analysis::GraphBuilder>::failure(builder.error().with_context(path.string()));
        }
        return builder;
    }

}  // namespace cga::io
