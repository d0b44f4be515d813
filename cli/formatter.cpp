//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/cli/formatter.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace cga::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_score(const double value, const int precision) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << value;
        return ss.str();
    }

    std::string format_percent(const double ratio) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << (ratio * 100.0) << "%";
        return ss.str();
    }

    std::string format_count(const std::size_t count) {
        std::string result = std::to_string(count);

        // Add comma separators
        int insert_pos = static_cast<int>(result.length()) - 3;
        while (insert_pos > 0) {
            result.insert(static_cast<std::size_t>(insert_pos), ",");
            insert_pos -= 3;
        }

        return result;
    }

    std::string format_path(const std::vector<std::string>& labels) {
        std::string result;
        for (std::size_t i = 0; i < labels.size(); ++i) {
            if (i > 0) {
                result += " -> ";
            }
            result += labels[i];
        }
        return result;
    }

    std::string bar_graph(const double value, double max_value, const std::size_t width) {
        if (max_value <= 0) max_value = 1.0;
        const double pct = std::clamp(value / max_value, 0.0, 1.0);
        const std::size_t filled = static_cast<std::size_t>(pct * static_cast<double>(width));

        std::string result;

        if (colors::enabled()) {
            const char* color = colors::GREEN;
            if (pct > 0.75) color = colors::RED;
            else if (pct > 0.5) color = colors::YELLOW;

            result += color;
            for (std::size_t i = 0; i < filled; ++i) {
                result += "█";
            }
            result += colors::RESET;
            result += colors::DIM;
            for (std::size_t i = filled; i < width; ++i) {
                result += "░";
            }
            result += colors::RESET;
        } else {
            result.append(filled, '#');
            result.append(width - filled, '-');
        }

        return result;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back();
        }
        rows_.push_back(std::move(row));
        separators_.push_back(false);
    }

    void Table::add_separator() {
        if (!separators_.empty()) {
            separators_.back() = true;
        }
    }

    void Table::clear() {
        rows_.clear();
        separators_.clear();
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width == 0) {
                std::size_t max_width = columns_[i].header.length();
                for (const auto& row : rows_) {
                    if (i < row.size() && row[i].length() > max_width) {
                        max_width = row[i].length();
                    }
                }
                columns_[i].width = max_width;
            }
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        // Widths are resolved on a copy so render() stays const
        Table temp = *this;
        temp.calculate_widths();

        const bool use_colors = colors::enabled();

        auto render_row = [&](const Row& row, const bool is_header = false) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width && col.width > 3) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && use_colors) {
                    out << colors::BOLD;
                } else if (!is_header && use_colors && col.color) {
                    out << *col.color;
                }

                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (use_colors && (is_header || col.color)) {
                    out << colors::RESET;
                }

                if (i < temp.columns_.size() - 1) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        auto render_separator = [&]() {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i < temp.columns_.size() - 1) {
                    out << "--";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);
            render_separator();
        }

        for (std::size_t i = 0; i < temp.rows_.size(); ++i) {
            render_row(temp.rows_[i]);
            if (i < temp.separators_.size() && temp.separators_[i]) {
                render_separator();
            }
        }
    }

    // ============================================================================
    // SummaryPrinter Implementation
    // ============================================================================

    namespace {

        std::size_t effective_limit(const std::size_t limit) {
            return limit == 0 ? std::numeric_limits<std::size_t>::max() : limit;
        }

        double score_of(const ScoreMap& scores, const NodeIndex node) {
            const auto it = scores.find(node);
            return it != scores.end() ? it->second : 0.0;
        }

        std::string yes_no(const bool value) {
            return value ? "yes" : "no";
        }

        template<typename Graph>
        void centrality_table(
            std::ostream& out,
            const std::string_view title,
            const graph::CentralityMetrics& metrics,
            const Graph& graph,
            const std::size_t limit
        ) {
            const auto top = metrics.top_pagerank(effective_limit(limit));
            if (top.empty()) {
                return;
            }

            out << title << "\n";

            Table table({
                {"#", 0, true, std::nullopt},
                {"Node", 40, false, std::nullopt},
                {"PageRank", 0, true, std::nullopt},
                {"", 0, false, std::nullopt},
                {"Betweenness", 0, true, std::nullopt},
                {"Closeness", 0, true, std::nullopt},
                {"Degree", 0, true, std::nullopt},
            });

            const double max_rank = top.front().score;
            for (std::size_t i = 0; i < top.size(); ++i) {
                const NodeIndex node = top[i].node;
                table.add_row({
                    std::to_string(i + 1),
                    graph.label(node),
                    format_score(top[i].score),
                    bar_graph(top[i].score, max_rank, 15),
                    format_score(score_of(metrics.betweenness_centrality, node)),
                    format_score(score_of(metrics.closeness_centrality, node)),
                    format_score(score_of(metrics.degree_centrality, node)),
                });
            }

            table.render(out);
            out << "\n";
        }

        template<typename Graph>
        void cycle_list(
            std::ostream& out,
            const std::string_view title,
            const std::vector<NodePath>& cycles,
            const Graph& graph,
            const std::size_t limit
        ) {
            if (cycles.empty()) {
                return;
            }

            out << title << " (" << format_count(cycles.size()) << ")\n";

            const std::size_t shown = std::min(cycles.size(), effective_limit(limit));
            for (std::size_t i = 0; i < shown; ++i) {
                std::vector<std::string> labels;
                labels.reserve(cycles[i].size());
                for (const NodeIndex node : cycles[i]) {
                    labels.push_back(graph.label(node));
                }
                out << "  " << format_path(labels) << "\n";
            }
            if (shown < cycles.size()) {
                out << "  ... and " << format_count(cycles.size() - shown) << " more\n";
            }
            out << "\n";
        }

    }  // namespace

    SummaryPrinter::SummaryPrinter(std::ostream& out)
        : out_(out)
    {}

    void SummaryPrinter::print_heading(const std::string_view title, const char underline) const {
        out_ << "\n";
        if (colors::enabled()) {
            out_ << colors::BOLD << title << colors::RESET << "\n";
        } else {
            out_ << title << "\n";
        }
        out_ << std::string(60, underline) << "\n\n";
    }

    void SummaryPrinter::print_statistics(const graph::GraphStatistics& stats) const {
        print_heading("Graph Summary", '=');

        Table table({
            {"Graph", 0, false, std::nullopt},
            {"Nodes", 0, true, std::nullopt},
            {"Edges", 0, true, std::nullopt},
            {"Density", 0, true, std::nullopt},
            {"Avg Degree", 0, true, std::nullopt},
            {"Cyclic", 0, false, std::nullopt},
        });

        auto add = [&table](const std::string& name, const graph::GraphStats& s) {
            table.add_row({
                name,
                format_count(s.node_count),
                format_count(s.edge_count),
                format_score(s.density),
                format_score(s.average_degree, 2),
                yes_no(s.is_cyclic),
            });
        };

        add("calls", stats.call_graph);
        add("dependencies", stats.dependency_graph);
        add("inheritance", stats.inheritance_graph);

        table.render(out_);
    }

    void SummaryPrinter::print_centrality(
        const graph::GraphAnalysisResult& result,
        const analysis::GraphAnalyzer& analyzer,
        const std::size_t limit
    ) const {
        print_heading("Most Central Nodes", '-');

        if (result.call_graph_centrality.pagerank.empty() &&
            result.dependency_graph_centrality.pagerank.empty() &&
            result.inheritance_graph_centrality.pagerank.empty()) {
            out_ << "No graph has enough nodes for centrality analysis.\n";
            return;
        }

        centrality_table(out_, "Functions", result.call_graph_centrality, analyzer.call_graph(), limit);
        centrality_table(out_, "Modules", result.dependency_graph_centrality, analyzer.dependency_graph(), limit);
        centrality_table(out_, "Classes", result.inheritance_graph_centrality, analyzer.inheritance_graph(), limit);
    }

    void SummaryPrinter::print_cycles(
        const graph::CycleAnalysis& cycles,
        const analysis::GraphAnalyzer& analyzer,
        const std::size_t limit
    ) const {
        print_heading("Cycles", '-');

        if (cycles.total_cycles == 0) {
            if (colors::enabled()) {
                out_ << colors::GREEN << "No cycles found." << colors::RESET << "\n";
            } else {
                out_ << "No cycles found.\n";
            }
            return;
        }

        cycle_list(out_, "Call cycles", cycles.call_cycles, analyzer.call_graph(), limit);
        cycle_list(out_, "Dependency cycles", cycles.dependency_cycles, analyzer.dependency_graph(), limit);
        cycle_list(out_, "Inheritance cycles", cycles.inheritance_cycles, analyzer.inheritance_graph(), limit);
    }

    void SummaryPrinter::print_coupling(
        const graph::CouplingMetrics& coupling,
        const graph::DependencyGraph& graph,
        const std::size_t limit
    ) const {
        print_heading("Module Coupling", '-');

        const auto& summary = coupling.summary;
        out_ << "Modules:              " << format_count(summary.total_nodes) << "\n";
        out_ << "Avg Afferent:         " << format_score(summary.avg_afferent, 2) << "\n";
        out_ << "Avg Efferent:         " << format_score(summary.avg_efferent, 2) << "\n";
        out_ << "Avg Instability:      " << format_score(summary.avg_instability, 2) << "\n";
        out_ << "Avg Distance:         " << format_score(summary.avg_distance_from_main, 2) << "\n";
        out_ << "Max Coupling:         " << format_count(summary.max_coupling) << "\n\n";

        const auto ranked = coupling.most_coupled_nodes(effective_limit(limit));
        if (ranked.empty()) {
            return;
        }

        Table table({
            {"Module", 40, false, std::nullopt},
            {"Ca", 0, true, std::nullopt},
            {"Ce", 0, true, std::nullopt},
            {"Instability", 0, true, std::nullopt},
            {"Distance", 0, true, std::nullopt},
        });

        for (const auto& entry : ranked) {
            const auto record = coupling.at(entry.node);
            if (!record) {
                continue;
            }
            table.add_row({
                graph.label(entry.node),
                std::to_string(record->afferent),
                std::to_string(record->efferent),
                format_score(record->instability, 2),
                format_score(record->distance_from_main, 2),
            });
        }

        table.render(out_);
    }

    void SummaryPrinter::print_network_metrics(const analysis::NetworkMetricsMap& metrics) const {
        print_heading("Network Metrics", '=');

        Table table({
            {"Graph", 0, false, std::nullopt},
            {"Density", 0, true, std::nullopt},
            {"Clustering", 0, true, std::nullopt},
            {"Avg Path", 0, true, std::nullopt},
            {"Diameter", 0, true, std::nullopt},
            {"Components", 0, true, std::nullopt},
            {"Largest", 0, true, std::nullopt},
            {"Complexity", 0, true, std::nullopt},
            {"Shape", 0, false, std::nullopt},
        });

        for (const auto& [name, m] : metrics) {
            std::string shape = "moderate";
            if (m.is_sparse()) shape = "sparse";
            else if (m.is_dense()) shape = "dense";

            table.add_row({
                name,
                format_score(m.density),
                format_score(m.clustering_coefficient),
                format_score(m.average_path_length, 2),
                std::to_string(m.diameter),
                format_count(m.connected_components),
                format_count(m.largest_component_size),
                format_score(m.complexity_score(), 2),
                shape,
            });
        }

        table.render(out_);
    }

    void SummaryPrinter::print_patterns(const analysis::PatternReport& report) const {
        print_heading("Structural Issues", '=');

        if (report.empty()) {
            if (colors::enabled()) {
                out_ << colors::GREEN << "No problematic patterns detected." << colors::RESET << "\n";
            } else {
                out_ << "No problematic patterns detected.\n";
            }
            return;
        }

        for (const auto& [category, messages] : report) {
            if (colors::enabled()) {
                out_ << colors::YELLOW << category << colors::RESET << "\n";
            } else {
                out_ << category << "\n";
            }
            for (const auto& message : messages) {
                out_ << "  - " << message << "\n";
            }
            out_ << "\n";
        }
    }

}  // namespace cga::cli
