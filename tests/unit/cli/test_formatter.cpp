//
// Created by gregorian-rayne on 10/06/26.
//

#include <gtest/gtest.h>
#include "cga/cli/formatter.hpp"

#include <sstream>

using namespace cga;
using namespace cga::cli;

class FormatterTest : public ::testing::Test {
protected:
    void SetUp() override {
        colors::set_enabled(false);
    }

    void TearDown() override {
        colors::set_enabled(true);
    }
};

TEST_F(FormatterTest, FormatCount) {
    EXPECT_EQ(format_count(0), "0");
    EXPECT_EQ(format_count(999), "999");
    EXPECT_EQ(format_count(1000), "1,000");
    EXPECT_EQ(format_count(1234567), "1,234,567");
}

TEST_F(FormatterTest, FormatScore) {
    EXPECT_EQ(format_score(0.5), "0.5000");
    EXPECT_EQ(format_score(1.0 / 3.0, 2), "0.33");
}

TEST_F(FormatterTest, FormatPercent) {
    EXPECT_EQ(format_percent(0.125), "12.5%");
    EXPECT_EQ(format_percent(1.0), "100.0%");
}

TEST_F(FormatterTest, FormatPath) {
    EXPECT_EQ(format_path({}), "");
    EXPECT_EQ(format_path({"a"}), "a");
    EXPECT_EQ(format_path({"a", "b", "c"}), "a -> b -> c");
}

TEST_F(FormatterTest, BarGraph_Plain) {
    EXPECT_EQ(bar_graph(5.0, 10.0, 10), "#####-----");
    EXPECT_EQ(bar_graph(20.0, 10.0, 4), "####");
    EXPECT_EQ(bar_graph(1.0, 0.0, 4), "####");
    EXPECT_EQ(bar_graph(0.0, 10.0, 3), "---");
}

TEST_F(FormatterTest, Table_AlignsColumns) {
    Table table({
        {"Name", 0, false, std::nullopt},
        {"Score", 0, true, std::nullopt},
    });
    table.add_row({"alpha", "1"});
    table.add_row({"b", "22"});

    EXPECT_EQ(table.row_count(), 2u);
    EXPECT_EQ(table.render(),
              "Name   Score\n"
              "------------\n"
              "alpha      1\n"
              "b         22\n");
}

TEST_F(FormatterTest, Table_TruncatesFixedWidth) {
    Table table({{"Node", 6, false, std::nullopt}});
    table.set_show_headers(false);
    table.add_row({"very_long_name"});

    EXPECT_EQ(table.render(), "ver...\n");
}

TEST_F(FormatterTest, Table_PadsShortRows) {
    Table table({
        {"A", 0, false, std::nullopt},
        {"B", 0, false, std::nullopt},
    });
    table.set_show_headers(false);
    table.add_row({"x"});
    table.add_separator();
    table.add_row({"y", "z"});

    EXPECT_EQ(table.render(),
              "x   \n"
              "----\n"
              "y  z\n");

    table.clear();
    EXPECT_EQ(table.row_count(), 0u);
}

TEST_F(FormatterTest, SummaryPrinter_Patterns) {
    std::ostringstream out;
    const SummaryPrinter printer(out);

    printer.print_patterns({});
    EXPECT_NE(out.str().find("No problematic patterns detected."), std::string::npos);

    out.str("");
    printer.print_patterns({{"cycles", {"Found 2 dependency cycles which can cause circular imports"}}});
    EXPECT_NE(out.str().find("Structural Issues"), std::string::npos);
    EXPECT_NE(out.str().find("cycles\n  - Found 2 dependency cycles"), std::string::npos);
}

TEST_F(FormatterTest, SummaryPrinter_Statistics) {
    graph::GraphStatistics stats;
    stats.call_graph.node_count = 1200;
    stats.call_graph.edge_count = 3;
    stats.call_graph.is_cyclic = true;

    std::ostringstream out;
    const SummaryPrinter printer(out);
    printer.print_statistics(stats);

    const auto text = out.str();
    EXPECT_NE(text.find("Graph Summary"), std::string::npos);
    EXPECT_NE(text.find("1,200"), std::string::npos);
    EXPECT_NE(text.find("dependencies"), std::string::npos);
    EXPECT_NE(text.find("yes"), std::string::npos);
}
