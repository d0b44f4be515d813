//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_JSON_UTILS_HPP
#define CGA_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON file and field helpers.
 *
 * Thin wrappers around nlohmann/json that report failures through
 * Result<T, Error> instead of exceptions.
 */

#include "cga/result.hpp"
#include "cga/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>

namespace cga::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON string.
     *
     * @param content The JSON string to parse.
     * @return The parsed JSON value or a ParseError.
     */
    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Reads and parses a JSON file.
     *
     * @param path Path to the JSON file.
     * @return The parsed JSON value, NotFound, IoError or ParseError.
     */
    inline Result<json, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<json, Error>::failure(
                Error::io_error("Failed to open JSON file", path.string())
            );
        }

        try {
            json data;
            file >> data;
            return Result<json, Error>::success(std::move(data));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", path.string() + ": " + e.what())
            );
        }
    }

    /**
     * Writes a JSON value to a file, creating parent directories.
     *
     * @param path Path to write to.
     * @param data The JSON data to write.
     * @param indent Indentation level (-1 for compact output).
     */
    inline Result<void, Error> write_file(
        const fs::path& path,
        const json& data,
        const int indent = 2
    ) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        try {
            file << data.dump(indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Reads an optional field, falling back to @p default_value when the key
     * is absent or holds a value of another type.
     */
    template<typename T>
    T get_or(const json& obj, const std::string& key, const T& default_value) {
        if (!obj.is_object() || !obj.contains(key)) {
            return default_value;
        }

        try {
            return obj.at(key).get<T>();
        } catch (const json::exception&) {
            return default_value;
        }
    }

    /**
     * Reads a required field.
     *
     * @return The value, NotFound for a missing key, or ParseError for a
     *         type mismatch.
     */
    template<typename T>
    Result<T, Error> get(const json& obj, const std::string& key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return Result<T, Error>::failure(
                Error::not_found("JSON key not found", key)
            );
        }

        try {
            return Result<T, Error>::success(obj.at(key).get<T>());
        } catch (const json::type_error& e) {
            return Result<T, Error>::failure(
                Error::parse_error("JSON type mismatch", key + ": " + e.what())
            );
        }
    }

}  // namespace cga::json_utils

#endif //CGA_JSON_UTILS_HPP
