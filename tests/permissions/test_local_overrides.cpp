#include "agentlink/permissions/local_overrides.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace agentlink::permissions;

namespace {

namespace fs = std::filesystem;

std::string temp_file(const char *name) {
    auto path = fs::temp_directory_path() / name;
    fs::remove(path);
    return path.string();
}

} // namespace

TEST(LocalOverrideStore, InMemory) {
    LocalOverrideStore store;
    EXPECT_FALSE(store.project_mode("/p").has_value());
    EXPECT_FALSE(store.app_mode().has_value());

    store.set_project_mode("/p", PermissionMode::AcceptEdits);
    store.set_app_mode(PermissionMode::BypassPermissions);
    EXPECT_EQ(store.project_mode("/p"), PermissionMode::AcceptEdits);
    EXPECT_EQ(store.app_mode(), PermissionMode::BypassPermissions);

    store.set_project_mode("/p", std::nullopt);
    store.set_app_mode(std::nullopt);
    EXPECT_FALSE(store.project_mode("/p").has_value());
    EXPECT_FALSE(store.app_mode().has_value());
}

TEST(LocalOverrideStore, SurvivesRestart) {
    const auto path = temp_file("agentlink_overrides_restart.json");
    {
        LocalOverrideStore store(path);
        store.set_project_mode("/home/dev/app", PermissionMode::AcceptEdits);
        store.set_project_mode("/home/dev/lib", PermissionMode::Default);
        store.set_app_mode(PermissionMode::BypassPermissions);
    }

    LocalOverrideStore reloaded(path);
    EXPECT_EQ(reloaded.project_mode("/home/dev/app"), PermissionMode::AcceptEdits);
    EXPECT_EQ(reloaded.project_mode("/home/dev/lib"), PermissionMode::Default);
    EXPECT_EQ(reloaded.app_mode(), PermissionMode::BypassPermissions);
    fs::remove(path);
}

TEST(LocalOverrideStore, ClearedOverrideStaysCleared) {
    const auto path = temp_file("agentlink_overrides_cleared.json");
    {
        LocalOverrideStore store(path);
        store.set_project_mode("/p", PermissionMode::AcceptEdits);
        store.set_project_mode("/p", std::nullopt);
    }
    EXPECT_FALSE(LocalOverrideStore(path).project_mode("/p").has_value());
    fs::remove(path);
}

TEST(LocalOverrideStore, CorruptFileStartsEmpty) {
    const auto path = temp_file("agentlink_overrides_corrupt.json");
    {
        std::ofstream out(path);
        out << "[1, 2";
    }
    LocalOverrideStore store(path);
    EXPECT_FALSE(store.app_mode().has_value());

    // The next write replaces the corrupt file.
    store.set_app_mode(PermissionMode::AcceptEdits);
    EXPECT_EQ(LocalOverrideStore(path).app_mode(), PermissionMode::AcceptEdits);
    fs::remove(path);
}

TEST(LocalOverrideStore, UnknownModesIgnored) {
    const auto path = temp_file("agentlink_overrides_unknown.json");
    {
        std::ofstream out(path);
        out << R"({"app_mode": "yolo", "projects": {"/a": "acceptEdits", "/b": "chaos", "/c": 1}})";
    }
    LocalOverrideStore store(path);
    EXPECT_FALSE(store.app_mode().has_value());
    EXPECT_EQ(store.project_mode("/a"), PermissionMode::AcceptEdits);
    EXPECT_FALSE(store.project_mode("/b").has_value());
    EXPECT_FALSE(store.project_mode("/c").has_value());
    fs::remove(path);
}
