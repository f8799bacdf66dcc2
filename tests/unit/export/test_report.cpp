//
// Created by gregorian-rayne on 2/9/26.
//

#include "fdeps/export/report.hpp"
#include "fdeps/utils/file_utils.hpp"

#include <gtest/gtest.h>

namespace fdeps::report
{
    class ReportTest : public ::testing::Test {
    protected:
        void SetUp() override {
            graph.set_root("/p");
            graph.add_dependency("/p/main.py", "/p/pkg/core.py");
            graph.add_dependency("/p/main.py", "/p/util.py");
            graph.add_dependency("/p/util.py", "/p/pkg/core.py");
            graph.add_external("/p/main.py", "requests");
        }

        static bool contains(const std::string& haystack, const std::string& needle) {
            return haystack.find(needle) != std::string::npos;
        }

        graph::DependencyGraph graph;
    };

    TEST(ReportFormatTest, Names) {
        EXPECT_EQ(to_string(ReportFormat::Text), "text");
        EXPECT_EQ(to_string(ReportFormat::Json), "json");
        EXPECT_EQ(to_string(ReportFormat::Dot), "dot");

        EXPECT_EQ(report_format_from_string("JSON"), ReportFormat::Json);
        EXPECT_EQ(report_format_from_string("graphviz"), ReportFormat::Dot);
        EXPECT_EQ(report_format_from_string("txt"), ReportFormat::Text);
        EXPECT_FALSE(report_format_from_string("yaml").has_value());
    }

    TEST(ReportFormatTest, FromExtension) {
        EXPECT_EQ(report_format_from_extension("out/deps.json"), ReportFormat::Json);
        EXPECT_EQ(report_format_from_extension("deps.DOT"), ReportFormat::Dot);
        EXPECT_EQ(report_format_from_extension("deps.gv"), ReportFormat::Dot);
        EXPECT_EQ(report_format_from_extension("deps.txt"), ReportFormat::Text);
        EXPECT_FALSE(report_format_from_extension("deps").has_value());
    }

    TEST_F(ReportTest, JsonStructure) {
        const auto json = to_json(graph);

        ASSERT_TRUE(json.contains("nodes"));
        EXPECT_EQ(json["nodes"].size(), 3u);
        EXPECT_EQ(json["nodes"]["main.py"]["imports_count"], 2);
        EXPECT_EQ(json["nodes"]["pkg/core.py"]["imported_by_count"], 2);
        EXPECT_EQ(json["nodes"]["main.py"]["external_count"], 1);

        EXPECT_EQ(json["edges"].size(), 3u);
        EXPECT_EQ(json["external"]["main.py"], nlohmann::json::array({"requests"}));

        const auto& stats = json["stats"];
        EXPECT_EQ(stats["total_files"], 3);
        EXPECT_EQ(stats["total_dependencies"], 3);
        EXPECT_EQ(stats["total_external"], 1);
        EXPECT_EQ(stats["cycles"], 0);
        ASSERT_FALSE(stats["most_imported"].empty());
        EXPECT_EQ(stats["most_imported"][0]["file"], "pkg/core.py");
        EXPECT_EQ(stats["most_imported"][0]["count"], 2);

        EXPECT_TRUE(json["cycles"].empty());
    }

    TEST_F(ReportTest, JsonListsCycles) {
        graph.add_dependency("/p/pkg/core.py", "/p/main.py");

        const auto json = to_json(graph);

        ASSERT_EQ(json["cycles"].size(), 1u);
        EXPECT_EQ(json["cycles"][0].size(), 3u);
        EXPECT_EQ(json["stats"]["cycles"], 1);
    }

    TEST_F(ReportTest, TextSummary) {
        const auto text = to_text(graph);

        EXPECT_TRUE(contains(text, "Dependency Analysis Report\n" + std::string(50, '=')));
        EXPECT_TRUE(contains(text, "Files analyzed: 3\n"));
        EXPECT_TRUE(contains(text, "Internal dependencies: 3\n"));
        EXPECT_TRUE(contains(text, "External dependencies: 1\n"));
        EXPECT_TRUE(contains(text, "Circular dependencies: 0\n"));
        EXPECT_TRUE(contains(text, "Most imported files:\n  pkg/core.py: 2 imports\n"));
        EXPECT_TRUE(contains(text, "Files with most imports:\n  main.py: 2 imports\n"));
        EXPECT_FALSE(contains(text, "External modules:"));
    }

    TEST_F(ReportTest, TextWithExternalModules) {
        const auto text = to_text(graph, true);

        EXPECT_TRUE(contains(text, "External modules:\n  requests\n"));
    }

    TEST_F(ReportTest, DotGraph) {
        const auto dot = to_dot(graph);

        EXPECT_TRUE(dot.starts_with("digraph dependencies {\n"));
        EXPECT_TRUE(contains(dot, "rankdir=\"LR\";"));
        EXPECT_TRUE(contains(dot, "\"pkg/core.py\" [label=\"pkg\\ncore.py\", fillcolor=\"lightgreen\", style=filled];"));
        EXPECT_TRUE(contains(dot, "\"main.py\" [label=\"main.py\", fillcolor=\"lightblue\", style=filled];"));
        EXPECT_TRUE(contains(dot, "\"util.py\" [label=\"util.py\", fillcolor=\"white\", style=filled];"));
        EXPECT_TRUE(contains(dot, "\"main.py\" -> \"pkg/core.py\";"));
        EXPECT_FALSE(contains(dot, "ext_"));
        EXPECT_TRUE(dot.ends_with("}\n"));
    }

    TEST_F(ReportTest, DotHeavilyImportedFilesAreYellow) {
        for (const auto* name : {"/p/a.py", "/p/b.py", "/p/c.py"}) {
            graph.add_dependency(name, "/p/util.py");
        }

        const auto dot = to_dot(graph);

        EXPECT_TRUE(contains(dot, "\"util.py\" [label=\"util.py\", fillcolor=\"yellow\", style=filled];"));
    }

    TEST_F(ReportTest, DotExternalNodesDeclaredOnce) {
        graph.add_external("/p/util.py", "requests");
        graph.add_external("/p/util.py", "google.protobuf");

        const auto dot = to_dot(graph, true);

        const std::string decl = "ext_requests [label=\"requests\", shape=ellipse, style=dashed];";
        const auto first = dot.find(decl);
        ASSERT_NE(first, std::string::npos);
        EXPECT_EQ(dot.find(decl, first + 1), std::string::npos);
        EXPECT_TRUE(contains(dot, "ext_google_protobuf [label=\"google.protobuf\""));
        EXPECT_TRUE(contains(dot, "\"main.py\" -> ext_requests [style=dashed];"));
        EXPECT_TRUE(contains(dot, "\"util.py\" -> ext_requests [style=dashed];"));
    }

    TEST_F(ReportTest, CyclesText) {
        EXPECT_EQ(cycles_to_text(graph, {}), "No circular dependencies found.\n");

        graph.add_dependency("/p/pkg/core.py", "/p/util.py");
        const auto text = cycles_to_text(graph, graph::find_cycles(graph));

        EXPECT_TRUE(contains(text, "Circular dependencies detected: 1\n"));
        EXPECT_TRUE(contains(text, "  Cycle 1:\n"));
        EXPECT_TRUE(contains(text, "    -> pkg/core.py\n"));
        EXPECT_TRUE(contains(text, "    -> util.py\n"));
    }

    TEST_F(ReportTest, RenderJsonParsesBack) {
        const auto rendered = render(graph, ReportFormat::Json);
        const auto parsed = nlohmann::json::parse(rendered);

        EXPECT_EQ(parsed, to_json(graph));
    }

    TEST_F(ReportTest, RenderDispatchesOnFormat) {
        EXPECT_EQ(render(graph, ReportFormat::Dot), to_dot(graph));
        EXPECT_EQ(render(graph, ReportFormat::Text, true), to_text(graph, true));
    }

    TEST_F(ReportTest, WriteReport) {
        const auto out = fs::temp_directory_path() / "fdeps_report_test" / "deps.dot";

        ASSERT_TRUE(write_report(out, graph, ReportFormat::Dot).is_ok());

        auto content = file_utils::read_file(out);
        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), to_dot(graph));

        fs::remove_all(out.parent_path());
    }
}  // namespace fdeps::report
