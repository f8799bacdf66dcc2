//
// Created by gregorian-rayne on 2/3/26.
//

#include "fdeps/types.hpp"

#include <gtest/gtest.h>

namespace fdeps
{
    TEST(ImportRecordTest, Defaults) {
        const ImportRecord record;

        EXPECT_TRUE(record.module.empty());
        EXPECT_TRUE(record.names.empty());
        EXPECT_EQ(record.level, 0);
        EXPECT_FALSE(record.is_from);
        EXPECT_FALSE(record.is_relative());
        EXPECT_FALSE(record.is_wildcard());
    }

    TEST(ImportRecordTest, RelativeAndWildcard) {
        ImportRecord record;
        record.level = 2;
        record.is_from = true;
        record.names = {"helpers", "*"};

        EXPECT_TRUE(record.is_relative());
        EXPECT_TRUE(record.is_wildcard());
    }

    TEST(ImportRecordTest, Equality) {
        ImportRecord a{"pkg.mod", {"x"}, 1, 3, true};
        ImportRecord b{"pkg.mod", {"x"}, 1, 3, true};
        ImportRecord c{"pkg.mod", {"y"}, 1, 3, true};

        EXPECT_EQ(a, b);
        EXPECT_NE(a, c);
    }

    TEST(SourceFileTest, Classification) {
        EXPECT_TRUE(is_source_file("pkg/mod.py"));
        EXPECT_FALSE(is_source_file("pkg/mod.pyc"));
        EXPECT_FALSE(is_source_file("README.md"));

        EXPECT_TRUE(is_package_initializer("pkg/__init__.py"));
        EXPECT_FALSE(is_package_initializer("pkg/init.py"));
    }

    TEST(ModuleNameTest, SplitAndJoin) {
        EXPECT_TRUE(split_module_name("").empty());
        EXPECT_EQ(split_module_name("os"), std::vector<std::string>{"os"});
        EXPECT_EQ(split_module_name("a.b.c"), (std::vector<std::string>{"a", "b", "c"}));

        EXPECT_EQ(join_module_name({"a", "b", "c"}), "a.b.c");
        EXPECT_EQ(join_module_name({}), "");
    }

    TEST(ModuleNameTest, TopLevel) {
        EXPECT_EQ(top_level_module("os.path"), "os");
        EXPECT_EQ(top_level_module("json"), "json");
        EXPECT_EQ(top_level_module(""), "");
    }
}  // namespace fdeps
