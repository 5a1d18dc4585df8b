#include <gtest/gtest.h>
#include "core/paths.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class PathsTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("relaycraft-paths-" + std::to_string(::getpid()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string touch(const fs::path& rel) {
        fs::path p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << "x";
        return p.string();
    }

    PathContext installed() {
        PathContext ctx;
        ctx.exe_dir = (root / "app").string();
        ctx.resource_dir = (root / "res").string();
        return ctx;
    }

    PathContext dev() {
        PathContext ctx;
        ctx.dev_mode = true;
        ctx.exe_dir = (root / "app").string();
        ctx.project_root = (root / "src").string();
        return ctx;
    }
};

TEST_F(PathsTest, InstalledCandidateOrder) {
    auto c = engine_candidates(installed());
    ASSERT_EQ(c.size(), 5u);
    EXPECT_EQ(c[0], (root / "app" / "bin" / "engine").string());
    EXPECT_EQ(c[1], (root / "app" / ".core" / "engine").string());
    EXPECT_EQ(c[2], (root / "res" / "engine").string());
    EXPECT_EQ(c[3], (root / "res" / ".core" / "engine").string());
    EXPECT_EQ(c[4], (root / "app" / "engine").string());
}

TEST_F(PathsTest, DevCandidateOrder) {
    auto c = engine_candidates(dev());
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0], (root / "app" / "bin" / "engine").string());
    EXPECT_EQ(c[1], (root / "src" / "src-tauri" / "binaries" / "engine").string());
}

TEST_F(PathsTest, DevEngineFromCheckout) {
    std::string engine = touch("src/src-tauri/binaries/engine");
    auto r = resolve_engine_path(dev());
    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.path, engine);
}

TEST(ProjectRootTest, SrcTauriMapsToParent) {
    EXPECT_EQ(project_root_for("/work/relay/src-tauri"), "/work/relay");
    EXPECT_EQ(project_root_for("/work/relay/src-tauri/"), "/work/relay");
    EXPECT_EQ(project_root_for("/work/relay"), "/work/relay");
    EXPECT_EQ(project_root_for("/work/relay/build"), "/work/relay/build");
}

TEST_F(PathsTest, ResolvePicksFirstExisting) {
    touch("app/engine");
    std::string core = touch("app/.core/engine");
    auto r = resolve_engine_path(installed());
    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.path, core);
}

TEST_F(PathsTest, BinDirWinsEverywhere) {
    touch("src/src-tauri/binaries/engine");
    std::string bin = touch("app/bin/engine");
    auto r = resolve_engine_path(dev());
    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.path, bin);
}

TEST_F(PathsTest, ResolveNothingFound) {
    auto r = resolve_engine_path(installed());
    EXPECT_FALSE(r.found);
    EXPECT_NE(r.error.find("Engine executable not found"), std::string::npos);
}

TEST_F(PathsTest, DirectoryIsNotAnEngine) {
    fs::create_directories(root / "app" / "bin" / "engine");
    auto r = resolve_engine_path(installed());
    EXPECT_FALSE(r.found);
}

TEST_F(PathsTest, OverrideIsAuthoritative) {
    touch("app/bin/engine");
    auto missing = resolve_engine_path(installed(), (root / "nope" / "engine").string());
    EXPECT_FALSE(missing.found);
    EXPECT_EQ(missing.error, "Engine not found: " + (root / "nope" / "engine").string());

    std::string custom = touch("custom/engine");
    auto found = resolve_engine_path(installed(), custom);
    ASSERT_TRUE(found.found);
    EXPECT_EQ(found.path, custom);
}

TEST_F(PathsTest, PythonDevModeUsesPath) {
    EXPECT_EQ(resolve_python_path(dev(), (root / "app" / "bin" / "engine").string()), "python");
}

TEST_F(PathsTest, PythonBundledBesideEngine) {
    std::string engine = touch("app/bin/engine");
    std::string py = touch("app/bin/python3");
    EXPECT_EQ(resolve_python_path(installed(), engine), py);
}

TEST_F(PathsTest, PythonFallsBackToPath) {
    std::string engine = touch("app/bin/engine");
    EXPECT_EQ(resolve_python_path(installed(), engine), "python");
}

TEST_F(PathsTest, AddonInstalledLayouts) {
    EXPECT_EQ(find_addon(installed(), "entry.py"), "");

    std::string flat = touch("res/entry.py");
    EXPECT_EQ(find_addon(installed(), "entry.py"), flat);

    std::string nested = touch("res/resources/addons/entry.py");
    EXPECT_EQ(find_addon(installed(), "entry.py"), nested);
}

TEST_F(PathsTest, AddonDevLayout) {
    touch("res/addons/anchor.py");
    EXPECT_EQ(find_addon(dev(), "anchor.py"), "");
    std::string src = touch("src/engine-core/addons/anchor.py");
    EXPECT_EQ(find_addon(dev(), "anchor.py"), src);
}
