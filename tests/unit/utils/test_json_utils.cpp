//
// Created by gregorian-rayne on 10/06/26.
//

#include <gtest/gtest.h>
#include "cga/utils/json_utils.hpp"

#include <filesystem>
#include <fstream>

using namespace cga;
using namespace cga::json_utils;
namespace fs = std::filesystem;

class JsonUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "cga_json_utils_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    [[nodiscard]] fs::path create_json_file(const std::string& filename, const std::string& content) const
    {
        const fs::path file_path = temp_dir / filename;
        std::ofstream file(file_path);
        file << content;
        return file_path;
    }

    fs::path temp_dir;
};

TEST_F(JsonUtilsTest, Parse_SimpleObject) {
    const auto result = parse(R"({"name": "parse", "count": 3})");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()["name"], "parse");
    EXPECT_EQ(result.value()["count"], 3);
}

TEST_F(JsonUtilsTest, Parse_InvalidJson) {
    const auto result = parse("{invalid json}");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(JsonUtilsTest, ReadFile_Missing) {
    const auto result = read_file(temp_dir / "missing.json");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(JsonUtilsTest, ReadFile_Malformed) {
    const auto path = create_json_file("bad.json", "[1, 2,");
    const auto result = read_file(path);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(JsonUtilsTest, WriteFile_CreatesParentDirectories) {
    const auto path = temp_dir / "nested" / "dir" / "out.json";
    const json data = {{"graphs", {"call_graph", "dependency_graph"}}};

    ASSERT_TRUE(write_file(path, data).is_ok());

    const auto reloaded = read_file(path);
    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(reloaded.value(), data);
}

TEST_F(JsonUtilsTest, WriteFile_Compact) {
    const auto path = temp_dir / "compact.json";
    ASSERT_TRUE(write_file(path, json{{"a", 1}}, -1).is_ok());

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, R"({"a":1})");
}

TEST_F(JsonUtilsTest, GetOr_FallsBack) {
    const json obj = {{"count", 4}, {"name", "run"}};

    EXPECT_EQ(get_or<int>(obj, "count", 1), 4);
    EXPECT_EQ(get_or<int>(obj, "missing", 1), 1);
    EXPECT_EQ(get_or<int>(obj, "name", 1), 1);
    EXPECT_EQ(get_or<int>(json::array(), "count", 7), 7);
}

TEST_F(JsonUtilsTest, Get_ReportsMissingAndMismatchedKeys) {
    const json obj = {{"caller", "main"}, {"count", "many"}};

    const auto caller = get<std::string>(obj, "caller");
    ASSERT_TRUE(caller.is_ok());
    EXPECT_EQ(caller.value(), "main");

    const auto missing = get<std::string>(obj, "callee");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(missing.error().context(), "callee");

    const auto mismatched = get<std::size_t>(obj, "count");
    ASSERT_TRUE(mismatched.is_err());
    EXPECT_EQ(mismatched.error().code(), ErrorCode::ParseError);
}
