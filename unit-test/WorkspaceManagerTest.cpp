#include "gtest/gtest.h"
#include "polyrun/common/defer.hpp"
#include "polyrun/common/exceptions.hpp"
#include "polyrun/common/io_utils.hpp"
#include "polyrun/workspace/workspace_manager.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace polyrun;
namespace fs = std::filesystem;

class WorkspaceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = make_temp_dir("polyrun-ws");
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    fs::path root;
};

TEST_F(WorkspaceManagerTest, ProvisionAndDispose) {
    workspace_manager manager(root);
    workspace a = manager.provision();
    workspace b = manager.provision();

    EXPECT_NE(a.id, b.id);
    EXPECT_NE(a.path.string(), b.path.string());
    EXPECT_TRUE(fs::is_directory(a.path));
    EXPECT_EQ(a.path.parent_path().string(), manager.root().string());
    EXPECT_TRUE(fs::is_empty(a.path));
    EXPECT_EQ(manager.active(), 2u);

    manager.write_file(a, "main.py", "print(1)");
    EXPECT_EQ(read_file_content(a.path / "main.py"), "print(1)");

    manager.dispose(a);
    manager.dispose(b);
    EXPECT_FALSE(fs::exists(a.path));
    EXPECT_FALSE(fs::exists(b.path));
    EXPECT_EQ(manager.active(), 0u);
}

TEST_F(WorkspaceManagerTest, RejectUnsafeFilename) {
    workspace_manager manager(root);
    scoped_workspace ws(manager);
    EXPECT_THROW(manager.write_file(ws.get(), "../escape.txt", "x"), invalid_submission);
    EXPECT_THROW(manager.write_file(ws.get(), "sub/dir.txt", "x"), invalid_submission);
    EXPECT_FALSE(fs::exists(root / "escape.txt"));
}

TEST_F(WorkspaceManagerTest, ScopedWorkspaceDisposedOnException) {
    workspace_manager manager(root);
    fs::path path;
    try {
        scoped_workspace ws(manager);
        path = ws.path();
        manager.write_file(ws.get(), "data.txt", "data");
        throw internal_error("boom");
    } catch (internal_error &) {
    }
    EXPECT_FALSE(path.empty());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(manager.active(), 0u);
}

TEST_F(WorkspaceManagerTest, DisposeReadOnlyTree) {
    workspace_manager manager(root);
    workspace ws = manager.provision();
    fs::create_directories(ws.path / "locked" / "inner");
    write_file_content(ws.path / "locked" / "inner" / "f.txt", "x");
    fs::permissions(ws.path / "locked" / "inner", fs::perms::owner_read | fs::perms::owner_exec);
    fs::permissions(ws.path / "locked", fs::perms::owner_read | fs::perms::owner_exec);

    manager.dispose(ws);
    EXPECT_FALSE(fs::exists(ws.path));
}

TEST_F(WorkspaceManagerTest, LimitOfWorkspaces) {
    workspace_manager manager(root, 1);
    workspace ws = manager.provision();
    EXPECT_THROW(manager.provision(), resource_exhausted);
    manager.dispose(ws);
    workspace again = manager.provision();
    manager.dispose(again);
}

TEST_F(WorkspaceManagerTest, CreatesMissingRoot) {
    workspace_manager manager(root / "nested" / "runs");
    scoped_workspace ws(manager);
    EXPECT_TRUE(fs::is_directory(ws.path()));
}
