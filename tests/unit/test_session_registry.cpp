#include <chrono>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "session/session_registry.hpp"

namespace {

using docgate::core::errors::ErrorKind;
using docgate::core::errors::get_error;
using docgate::core::errors::get_value;
using docgate::core::errors::is_error;
using docgate::protocol::DocumentKind;
using docgate::session::SessionRegistry;

TEST(SessionRegistryTest, RegisterStartsClean) {
    SessionRegistry registry;
    auto entry = registry.register_document("doc-1", DocumentKind::Calc);
    ASSERT_FALSE(is_error(entry));

    EXPECT_EQ(get_value(entry).handle, "doc-1");
    EXPECT_EQ(get_value(entry).kind, DocumentKind::Calc);
    EXPECT_FALSE(get_value(entry).dirty);
    EXPECT_EQ(get_value(entry).created_at, get_value(entry).last_modified_at);
    EXPECT_TRUE(registry.contains("doc-1"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(SessionRegistryTest, RejectsDuplicateAndEmptyHandles) {
    SessionRegistry registry;
    ASSERT_FALSE(is_error(registry.register_document("doc-1", DocumentKind::Writer)));

    auto duplicate = registry.register_document("doc-1", DocumentKind::Writer);
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_handle");

    auto empty = registry.register_document("", DocumentKind::Writer);
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_handle");
}

TEST(SessionRegistryTest, DirtyFlagFollowsEditsAndSaves) {
    SessionRegistry registry;
    const auto created = get_value(registry.register_document("doc-1", DocumentKind::Writer));

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    auto dirty = registry.mark_dirty("doc-1");
    ASSERT_FALSE(is_error(dirty));
    EXPECT_TRUE(get_value(dirty).dirty);
    EXPECT_GT(get_value(dirty).last_modified_at, created.last_modified_at);

    auto clean = registry.mark_clean("doc-1");
    ASSERT_FALSE(is_error(clean));
    EXPECT_FALSE(get_value(clean).dirty);
    EXPECT_EQ(get_value(clean).last_modified_at, get_value(dirty).last_modified_at);
}

TEST(SessionRegistryTest, TouchOnlyMovesAccessTime) {
    SessionRegistry registry;
    const auto created = get_value(registry.register_document("doc-1", DocumentKind::Writer));

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    auto touched = registry.touch("doc-1");
    ASSERT_FALSE(is_error(touched));
    EXPECT_GT(get_value(touched).last_accessed_at, created.last_accessed_at);
    EXPECT_EQ(get_value(touched).last_modified_at, created.last_modified_at);
    EXPECT_FALSE(get_value(touched).dirty);
}

TEST(SessionRegistryTest, UnknownHandleIsStale) {
    SessionRegistry registry;

    auto lookup = registry.lookup("ghost");
    ASSERT_TRUE(is_error(lookup));
    EXPECT_EQ(get_error(lookup).kind, ErrorKind::StaleHandle);
    EXPECT_TRUE(is_error(registry.touch("ghost")));
    EXPECT_TRUE(is_error(registry.mark_dirty("ghost")));
    EXPECT_TRUE(is_error(registry.mark_clean("ghost")));
    EXPECT_FALSE(registry.unregister("ghost"));
}

TEST(SessionRegistryTest, ListKeepsCreationOrderAcrossRemoval) {
    SessionRegistry registry;
    ASSERT_FALSE(is_error(registry.register_document("z", DocumentKind::Writer)));
    ASSERT_FALSE(is_error(registry.register_document("a", DocumentKind::Draw)));
    ASSERT_FALSE(is_error(registry.register_document("m", DocumentKind::Impress)));

    EXPECT_TRUE(registry.unregister("a"));

    const auto active = registry.list_active();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].handle, "z");
    EXPECT_EQ(active[1].handle, "m");
    EXPECT_FALSE(registry.contains("a"));
}

}  // namespace
