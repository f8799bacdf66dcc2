//
// Created by gregorian-rayne on 2/5/26.
//

#include "fdeps/resolve/module_resolver.hpp"
#include "fdeps/resolve/stdlib_modules.hpp"
#include "fdeps/utils/file_utils.hpp"

#include <gtest/gtest.h>

namespace fdeps::resolve
{
    TEST(StdlibModulesTest, KnownModules) {
        EXPECT_TRUE(is_stdlib_module("os"));
        EXPECT_TRUE(is_stdlib_module("os.path"));
        EXPECT_TRUE(is_stdlib_module("__future__"));
        EXPECT_TRUE(is_stdlib_module("collections.abc"));
        EXPECT_TRUE(is_stdlib_module("typing"));

        EXPECT_FALSE(is_stdlib_module("requests"));
        EXPECT_FALSE(is_stdlib_module("numpy.linalg"));
        EXPECT_FALSE(is_stdlib_module(""));
        EXPECT_FALSE(is_stdlib_module("oscar"));
    }

    class ModuleResolverTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "fdeps_resolver_test";
            fs::create_directories(temp_dir / "proj");
            temp_dir = fs::canonical(temp_dir);
            root = temp_dir / "proj";

            for (const auto* file : {
                     "pkg/__init__.py",
                     "pkg/core.py",
                     "pkg/util/__init__.py",
                     "pkg/util/strings.py",
                     "app/main.py",
                     "app/helpers.py",
                     "lib/shared.py",
                 }) {
                ASSERT_TRUE(file_utils::write_file(root / file, "").is_ok());
            }
            ASSERT_TRUE(file_utils::write_file(temp_dir / "outside.py", "").is_ok());
        }

        void TearDown() override {
            fs::remove_all(temp_dir);
        }

        [[nodiscard]] fs::path file(const std::string& relative) const {
            return root / relative;
        }

        fs::path temp_dir;
        fs::path root;
    };

    TEST_F(ModuleResolverTest, BuildsIndexFromRoot) {
        const ModuleResolver resolver(root);

        EXPECT_EQ(resolver.root(), root);
        EXPECT_EQ(resolver.index().size(), 7u);
    }

    TEST_F(ModuleResolverTest, AbsoluteDirectHit) {
        const ModuleResolver resolver(root);

        EXPECT_EQ(resolver.resolve_absolute("pkg.core"), file("pkg/core.py"));
        EXPECT_EQ(resolver.resolve_absolute("pkg"), file("pkg/__init__.py"));
        EXPECT_EQ(resolver.resolve_absolute("lib.shared"), file("lib/shared.py"));
    }

    TEST_F(ModuleResolverTest, StandardLibraryAndEmptyNamesNeverResolve) {
        const ModuleResolver resolver(root);

        EXPECT_FALSE(resolver.resolve_absolute("os.path").has_value());
        EXPECT_FALSE(resolver.resolve_absolute("json").has_value());
        EXPECT_FALSE(resolver.resolve_absolute("").has_value());
    }

    TEST_F(ModuleResolverTest, ProjectNamePrefixIsStripped) {
        const ModuleResolver resolver(root);

        EXPECT_EQ(resolver.resolve_absolute("proj.pkg.core"), file("pkg/core.py"));
    }

    TEST_F(ModuleResolverTest, SiblingOfImportingFile) {
        const ModuleResolver resolver(root);

        EXPECT_EQ(resolver.resolve_absolute("helpers", file("app/main.py")), file("app/helpers.py"));
        EXPECT_FALSE(resolver.resolve_absolute("helpers").has_value());
    }

    TEST_F(ModuleResolverTest, ParentDirectoryOfImportingFile) {
        const ModuleResolver resolver(root);

        EXPECT_EQ(resolver.resolve_absolute("core", file("pkg/util/strings.py")), file("pkg/core.py"));
    }

    TEST_F(ModuleResolverTest, FallsBackToLongestKnownPrefix) {
        const ModuleResolver resolver(root);

        EXPECT_EQ(resolver.resolve_absolute("pkg.core.Engine"), file("pkg/core.py"));
        EXPECT_EQ(resolver.resolve_absolute("pkg.util.strings.slugify"), file("pkg/util/strings.py"));
        EXPECT_EQ(resolver.resolve_absolute("pkg.missing"), file("pkg/__init__.py"));
        EXPECT_FALSE(resolver.resolve_absolute("requests.adapters").has_value());
    }

    TEST_F(ModuleResolverTest, RelativeImports) {
        const ModuleResolver resolver(root);
        const auto from = file("pkg/util/strings.py");

        EXPECT_EQ(resolver.resolve_relative("", from, 1), file("pkg/util/__init__.py"));
        EXPECT_EQ(resolver.resolve_relative("core", from, 2), file("pkg/core.py"));
        EXPECT_EQ(resolver.resolve_relative("util.strings", file("pkg/core.py"), 1), file("pkg/util/strings.py"));
        EXPECT_EQ(resolver.resolve_relative("lib.shared", from, 3), file("lib/shared.py"));
    }

    TEST_F(ModuleResolverTest, RelativeImportBeyondRootFails) {
        const ModuleResolver resolver(root);
        const auto from = file("pkg/util/strings.py");

        EXPECT_FALSE(resolver.resolve_relative("", from, 3).has_value());
        EXPECT_FALSE(resolver.resolve_relative("core", from, 4).has_value());
        EXPECT_FALSE(resolver.resolve_relative("pkg", temp_dir / "outside.py", 1).has_value());
    }

    TEST_F(ModuleResolverTest, RelativeLevelZeroIsAbsolute) {
        const ModuleResolver resolver(root);

        EXPECT_EQ(resolver.resolve_relative("pkg.core", file("app/main.py"), 0), file("pkg/core.py"));
    }

    TEST_F(ModuleResolverTest, ResolveImportDispatchesOnLevel) {
        const ModuleResolver resolver(root);
        const auto from = file("pkg/core.py");

        EXPECT_EQ(resolver.resolve_import("lib.shared", from), file("lib/shared.py"));
        EXPECT_EQ(resolver.resolve_import("util", from, 1), file("pkg/util/__init__.py"));
    }

    TEST_F(ModuleResolverTest, ExternalClassification) {
        const ModuleResolver resolver(root);

        EXPECT_TRUE(resolver.is_external("requests"));
        EXPECT_TRUE(resolver.is_external("numpy.linalg"));
        EXPECT_FALSE(resolver.is_external("os"));
        EXPECT_FALSE(resolver.is_external("pkg.core"));
        EXPECT_FALSE(resolver.is_external("pkg"));
        EXPECT_FALSE(resolver.is_external(""));
    }

    TEST_F(ModuleResolverTest, AcceptsPrebuiltIndex) {
        const ModuleResolver resolver(ModuleIndex::build(root));

        EXPECT_EQ(resolver.resolve_absolute("pkg.core"), file("pkg/core.py"));
    }
}  // namespace fdeps::resolve
