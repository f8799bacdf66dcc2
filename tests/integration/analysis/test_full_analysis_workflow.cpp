//
// Created by gregorian-rayne on 2/11/26.
//

#include "fdeps/fdeps.hpp"
#include "fdeps/utils/file_utils.hpp"

#include <gtest/gtest.h>
#include <set>

namespace fdeps::analysis
{
    class FullAnalysisWorkflowTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "fdeps_full_analysis_test";
            fs::remove_all(temp_dir);
            fs::create_directories(temp_dir / "proj");
            temp_dir = fs::canonical(temp_dir);
            root = temp_dir / "proj";
        }

        void TearDown() override {
            fs::remove_all(temp_dir);
        }

        void create_test_file(const std::string& relative, const std::string& content) const {
            ASSERT_TRUE(file_utils::write_file(root / relative, content).is_ok());
        }

        [[nodiscard]] static std::set<std::string> edges(const AnalysisResult& result) {
            std::set<std::string> out;
            for (const auto& [path, node] : result.graph.nodes()) {
                for (const auto& target : node.imports) {
                    out.insert(result.graph.relative_path(path).generic_string() + " -> " +
                               result.graph.relative_path(target).generic_string());
                }
            }
            return out;
        }

        fs::path temp_dir;
        fs::path root;
    };

    TEST_F(FullAnalysisWorkflowTest, TwoFileCycle) {
        create_test_file("a.py", "import b\n");
        create_test_file("b.py", "import a\n");

        const DependencyAnalyzer analyzer{AnalyzerConfig{}};
        auto result = analyzer.analyze(root);

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& analysis = result.value();

        EXPECT_EQ(analysis.root, root);
        EXPECT_EQ(analysis.graph.node_count(), 2u);
        EXPECT_EQ(edges(analysis), (std::set<std::string>{"a.py -> b.py", "b.py -> a.py"}));

        const auto cycles = graph::find_cycles(analysis.graph);
        ASSERT_EQ(cycles.size(), 1u);
        EXPECT_EQ(std::set<fs::path>(cycles[0].files.begin(), cycles[0].files.end()),
                  (std::set<fs::path>{root / "a.py", root / "b.py"}));
    }

    TEST_F(FullAnalysisWorkflowTest, PackageProject) {
        create_test_file("app/__init__.py", "");
        create_test_file("app/main.py",
                         "import os\n"
                         "import requests\n"
                         "from app.core import Engine\n"
                         "from . import helpers, settings\n"
                         "from .util.text import slugify\n");
        create_test_file("app/core.py", "from .util.text import slugify\nimport numpy as np\n");
        create_test_file("app/helpers.py", "def helper():\n    import json\n    from .core import Engine\n");
        create_test_file("app/util/__init__.py", "");
        create_test_file("app/util/text.py", "from .. import core\n");
        create_test_file("__pycache__/stale.py", "import app.main\n");

        const DependencyAnalyzer analyzer{AnalyzerConfig{}};
        auto result = analyzer.analyze(root);

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& analysis = result.value();

        EXPECT_EQ(analysis.summary.files_found, 6u);
        EXPECT_EQ(analysis.summary.files_extracted, 6u);
        EXPECT_EQ(analysis.summary.degraded_files, 0u);

        const auto found = edges(analysis);
        EXPECT_TRUE(found.contains("app/main.py -> app/core.py"));
        EXPECT_TRUE(found.contains("app/main.py -> app/helpers.py"));
        EXPECT_TRUE(found.contains("app/main.py -> app/__init__.py"));  // "settings" is not a module
        EXPECT_TRUE(found.contains("app/main.py -> app/util/text.py"));
        EXPECT_TRUE(found.contains("app/core.py -> app/util/text.py"));
        EXPECT_TRUE(found.contains("app/helpers.py -> app/core.py"));
        EXPECT_TRUE(found.contains("app/util/text.py -> app/core.py"));

        const auto* main = analysis.graph.node(root / "app" / "main.py");
        ASSERT_NE(main, nullptr);
        EXPECT_EQ(main->external_imports, std::set<std::string>{"requests"});

        const auto* core = analysis.graph.node(root / "app" / "core.py");
        ASSERT_NE(core, nullptr);
        EXPECT_EQ(core->external_imports, std::set<std::string>{"numpy"});

        EXPECT_FALSE(analysis.graph.has_file(root / "__pycache__" / "stale.py"));

        const auto cycles = graph::find_cycles(analysis.graph);
        ASSERT_EQ(cycles.size(), 1u);
        EXPECT_EQ(std::set<fs::path>(cycles[0].files.begin(), cycles[0].files.end()),
                  (std::set<fs::path>{root / "app" / "core.py", root / "app" / "util" / "text.py"}));
    }

    TEST_F(FullAnalysisWorkflowTest, InternalOnlyDropsExternalModules) {
        create_test_file("main.py", "import requests\nimport helpers\n");
        create_test_file("helpers.py", "");

        AnalyzerConfig config;
        config.internal_only = true;
        const DependencyAnalyzer analyzer(config);
        auto result = analyzer.analyze(root);

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().graph.external_count(), 0u);
        EXPECT_EQ(edges(result.value()), std::set<std::string>{"main.py -> helpers.py"});
    }

    TEST_F(FullAnalysisWorkflowTest, IgnorePatternsAndExcludedDirs) {
        create_test_file("main.py", "import lib.shared\n");
        create_test_file("lib/shared.py", "");
        create_test_file("tests/test_main.py", "import main\n");
        create_test_file("build/generated.py", "import main\n");

        AnalyzerConfig config;
        config.ignore_patterns = {"tests"};
        config.exclude_dirs.insert("build");
        const DependencyAnalyzer analyzer(config);
        auto result = analyzer.analyze(root);

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().summary.files_found, 2u);
        EXPECT_EQ(edges(result.value()), std::set<std::string>{"main.py -> lib/shared.py"});
    }

    TEST_F(FullAnalysisWorkflowTest, SingleFileTarget) {
        create_test_file("main.py", "import helpers\n");
        create_test_file("helpers.py", "import main\n");

        const DependencyAnalyzer analyzer{AnalyzerConfig{}};
        auto result = analyzer.analyze(root / "main.py");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().root, root);
        EXPECT_EQ(result.value().summary.files_found, 1u);
        // The target still links into its directory, but only its own imports are read.
        EXPECT_EQ(edges(result.value()), std::set<std::string>{"main.py -> helpers.py"});
    }

    TEST_F(FullAnalysisWorkflowTest, UnparsableFilesDegradeQuietly) {
        create_test_file("good.py", "import bad\n");
        create_test_file("bad.py", "import (\n");
        create_test_file("other.py", "import good\n");
        create_test_file("more.py", "import other\n");

        const DependencyAnalyzer analyzer{AnalyzerConfig{}};
        auto result = analyzer.analyze(root);

        ASSERT_TRUE(result.is_ok());
        const auto& analysis = result.value();
        EXPECT_EQ(analysis.summary.files_found, 4u);
        EXPECT_EQ(analysis.summary.degraded_files, 1u);
        ASSERT_TRUE(analysis.graph.has_file(root / "bad.py"));
        EXPECT_TRUE(analysis.graph.node(root / "bad.py")->imports.empty());
        EXPECT_TRUE(edges(analysis).contains("good.py -> bad.py"));
    }

    TEST_F(FullAnalysisWorkflowTest, InjectedExtractor) {
        create_test_file("a.py", "");
        create_test_file("b.py", "");

        const DependencyAnalyzer analyzer(AnalyzerConfig{}, [](const fs::path& path) {
            ImportList imports;
            if (path.filename() == "a.py") {
                imports.push_back(ImportRecord{"b", {}, 0, 1, false});
            }
            return Result<ImportList, Error>::success(std::move(imports));
        });
        auto result = analyzer.analyze(root);

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(edges(result.value()), std::set<std::string>{"a.py -> b.py"});
    }

    TEST_F(FullAnalysisWorkflowTest, MissingTarget) {
        const DependencyAnalyzer analyzer{AnalyzerConfig{}};
        auto result = analyzer.analyze(root / "nowhere");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(FullAnalysisWorkflowTest, InvalidConfigIsRejected) {
        AnalyzerConfig config;
        config.workers = -3;
        const DependencyAnalyzer analyzer(config);

        auto result = analyzer.analyze(root);
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(FullAnalysisWorkflowTest, ReportsRenderTheAnalysis) {
        create_test_file("a.py", "import b\nimport requests\n");
        create_test_file("b.py", "import a\n");

        const DependencyAnalyzer analyzer{AnalyzerConfig{}};
        auto result = analyzer.analyze(root);
        ASSERT_TRUE(result.is_ok());

        const auto json = report::to_json(result.value().graph);
        EXPECT_EQ(json["stats"]["total_files"], 2);
        EXPECT_EQ(json["stats"]["cycles"], 1);
        EXPECT_EQ(json["external"]["a.py"], nlohmann::json::array({"requests"}));

        const auto text = report::to_text(result.value().graph);
        EXPECT_NE(text.find("Circular dependencies detected: 1"), std::string::npos);
    }

    class LinkImportsTest : public FullAnalysisWorkflowTest {
    protected:
        void SetUp() override {
            FullAnalysisWorkflowTest::SetUp();
            create_test_file("pkg/__init__.py", "");
            create_test_file("pkg/mod.py", "");
            create_test_file("pkg/other.py", "");
        }
    };

    TEST_F(LinkImportsTest, BareRelativeImportLinksSubmodules) {
        const resolve::ModuleResolver resolver(root);
        graph::DependencyGraph graph;
        const auto from = root / "pkg" / "mod.py";

        link_imports(graph, resolver, from, {ImportRecord{"", {"other"}, 1, 1, true}}, false);

        EXPECT_TRUE(graph.has_dependency(from, root / "pkg" / "other.py"));
        EXPECT_FALSE(graph.has_dependency(from, root / "pkg" / "__init__.py"));
    }

    TEST_F(LinkImportsTest, WildcardAndAttributesLinkThePackage) {
        const resolve::ModuleResolver resolver(root);
        graph::DependencyGraph graph;
        const auto from = root / "pkg" / "mod.py";

        link_imports(graph, resolver, from, {ImportRecord{"", {"*"}, 1, 1, true}}, false);
        EXPECT_TRUE(graph.has_dependency(from, root / "pkg" / "__init__.py"));

        graph::DependencyGraph attrs;
        link_imports(attrs, resolver, from, {ImportRecord{"", {"VERSION"}, 1, 1, true}}, false);
        EXPECT_TRUE(attrs.has_dependency(from, root / "pkg" / "__init__.py"));
    }

    TEST_F(LinkImportsTest, UnresolvedRelativeImportsAreNotExternal) {
        const resolve::ModuleResolver resolver(root);
        graph::DependencyGraph graph;
        const auto from = root / "pkg" / "mod.py";

        link_imports(graph, resolver, from, {ImportRecord{"missing", {"x"}, 1, 1, true}}, false);

        EXPECT_TRUE(graph.has_file(from));
        EXPECT_EQ(graph.edge_count(), 0u);
        EXPECT_EQ(graph.external_count(), 0u);
    }

    TEST_F(LinkImportsTest, StandardLibraryIsNeitherEdgeNorExternal) {
        const resolve::ModuleResolver resolver(root);
        graph::DependencyGraph graph;
        const auto from = root / "pkg" / "mod.py";

        link_imports(graph, resolver, from,
                     {ImportRecord{"os.path", {}, 0, 1, false}, ImportRecord{"collections", {"OrderedDict"}, 0, 2, true}},
                     false);

        EXPECT_EQ(graph.edge_count(), 0u);
        EXPECT_EQ(graph.external_count(), 0u);
    }
}  // namespace fdeps::analysis
