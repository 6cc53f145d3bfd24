#include <filesystem>
#include <string>
#include <unistd.h>
#include <gtest/gtest.h>
#include "policy/path_policy.hpp"
#include "test_support.hpp"

namespace {

using docgate::core::errors::ErrorKind;
using docgate::core::errors::get_error;
using docgate::core::errors::get_value;
using docgate::core::errors::is_error;
using docgate::policy::PathPolicy;
using docgate::testing::TempWorkspace;
using docgate::testing::write_file;

TEST(PathPolicyTest, ResolvesRelativePathAgainstWorkingDirectory) {
    TempWorkspace workspace;
    PathPolicy policy(workspace.root());

    auto result = policy.resolve("sub/../report.odt", "path");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), workspace.root() / "report.odt");
}

TEST(PathPolicyTest, KeepsAbsolutePathsOutsideWorkingDirectory) {
    TempWorkspace workspace;
    PathPolicy policy(workspace.root() / "inner");
    const auto outside = workspace.root() / "outside.odt";

    auto result = policy.resolve(outside.string(), "path");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), outside);
}

TEST(PathPolicyTest, RejectsEmptyPath) {
    TempWorkspace workspace;
    PathPolicy policy(workspace.root());

    auto result = policy.resolve("", "target_path");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Validation);
    EXPECT_EQ(get_error(result).code, "empty_path");
    EXPECT_NE(get_error(result).message.find("target_path"), std::string::npos);
}

TEST(PathPolicyTest, RequireFileDistinguishesMissingAndDirectory) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.odt", "ok");
    PathPolicy policy(workspace.root());

    EXPECT_FALSE(is_error(policy.require_file("sub/sample.odt", "path")));

    auto missing = policy.require_file("sub/absent.odt", "path");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "file_not_found");

    auto directory = policy.require_file("sub", "path");
    ASSERT_TRUE(is_error(directory));
    EXPECT_EQ(get_error(directory).code, "not_a_file");
}

TEST(PathPolicyTest, RequireDirectory) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.odt", "ok");
    PathPolicy policy(workspace.root());

    EXPECT_FALSE(is_error(policy.require_directory("sub", "source_dir")));

    auto file = policy.require_directory("sub/sample.odt", "source_dir");
    ASSERT_TRUE(is_error(file));
    EXPECT_EQ(get_error(file).code, "directory_not_found");
}

TEST(PathPolicyTest, PrepareWritableDirectoryCreatesMissingParents) {
    TempWorkspace workspace;
    PathPolicy policy(workspace.root());
    const auto nested = workspace.root() / "a/b/c";

    auto status = policy.prepare_writable_directory(nested);
    ASSERT_FALSE(is_error(status));
    EXPECT_TRUE(std::filesystem::is_directory(nested));
}

TEST(PathPolicyTest, PrepareWritableDirectoryRejectsFileInTheWay) {
    TempWorkspace workspace;
    write_file(workspace.root() / "blocker", "x");
    PathPolicy policy(workspace.root());

    auto status = policy.prepare_writable_directory(workspace.root() / "blocker");
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).kind, ErrorKind::Validation);
}

TEST(PathPolicyTest, PrepareWritableDirectoryRejectsReadOnlyDirectory) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root bypasses permission bits";
    }
    TempWorkspace workspace;
    const auto locked = workspace.root() / "locked";
    std::filesystem::create_directories(locked);
    std::filesystem::permissions(locked, std::filesystem::perms::owner_read |
                                             std::filesystem::perms::owner_exec);
    PathPolicy policy(workspace.root());

    auto status = policy.prepare_writable_directory(locked);
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "directory_not_writable");
}

}  // namespace
