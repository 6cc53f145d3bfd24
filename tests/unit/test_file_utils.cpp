#include <filesystem>
#include <gtest/gtest.h>
#include "core/fs/file_utils.hpp"
#include "test_support.hpp"

namespace {

using docgate::core::fs::ScopedDirectory;
using docgate::core::fs::lowercase_extension;
using docgate::testing::TempWorkspace;
using docgate::testing::write_file;

TEST(FileUtilsTest, ScopedDirectoryRemovesContentsOnExit) {
    TempWorkspace workspace;
    const auto scratch = workspace.root() / "scratch";
    {
        ScopedDirectory guard(scratch);
        write_file(scratch / "nested/deep/file.txt", "data");
        EXPECT_EQ(guard.path(), scratch);
        ASSERT_TRUE(std::filesystem::exists(scratch / "nested/deep/file.txt"));
    }
    EXPECT_FALSE(std::filesystem::exists(scratch));
}

TEST(FileUtilsTest, ScopedDirectoryToleratesMissingPath) {
    TempWorkspace workspace;
    const auto never_created = workspace.root() / "never";
    {
        ScopedDirectory guard(never_created);
    }
    EXPECT_FALSE(std::filesystem::exists(never_created));
    EXPECT_TRUE(std::filesystem::exists(workspace.root()));
}

TEST(FileUtilsTest, LowercaseExtensionKeepsDotAndFoldsCase) {
    EXPECT_EQ(lowercase_extension("Report.ODT"), ".odt");
    EXPECT_EQ(lowercase_extension("/a/b/archive.tar.GZ"), ".gz");
    EXPECT_EQ(lowercase_extension("README"), "");
    EXPECT_EQ(lowercase_extension("dir.d/README"), "");
}

}  // namespace
