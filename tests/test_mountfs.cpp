#include <gtest/gtest.h>

#include "core/ioutil.hpp"
#include "core/memfs.hpp"
#include "core/osfs.hpp"
#include "core/symlink.hpp"
#include "mount/basepath.hpp"
#include "mount/mountfs.hpp"
#include "test_util.hpp"

using namespace layerfs;
using layerfs::test::expect_error;

class MountFsTest : public testing::Test {
public:
    void SetUp() override {
        root = std::make_shared<MemFs>();
        ns = std::make_unique<MountFs>(root);
    }

    std::shared_ptr<MemFs> root;
    std::unique_ptr<MountFs> ns;
};

TEST_F(MountFsTest, Construct) {
    MountFs empty(nullptr);
    ASSERT_TRUE(empty.stat("/").is_dir());

    auto mounts = ns->mounts();
    ASSERT_EQ(mounts.size(), 1u);
    ASSERT_EQ(mounts[0].path, "/");
    ASSERT_EQ(mounts[0].fs_name, "MemFs");
}

TEST_F(MountFsTest, InnermostMountWins) {
    auto outer = std::make_shared<MemFs>();
    auto inner = std::make_shared<MemFs>();
    ns->mount("/a/b", outer);
    ns->mount("/a/b/c", inner);

    Route deep = ns->find_path("/a/b/c/x");
    ASSERT_EQ(deep.fs, inner);
    ASSERT_EQ(deep.base, "/a/b/c");
    ASSERT_EQ(deep.rel, "/x");

    Route mid = ns->find_path("/a/b/y/z");
    ASSERT_EQ(mid.fs, outer);
    ASSERT_EQ(mid.rel, "/y/z");

    Route top = ns->find_path("/a/q");
    ASSERT_EQ(top.fs, root);
    ASSERT_EQ(top.rel, "/a/q");
}

TEST_F(MountFsTest, OperationsReachTheMountedBackend) {
    auto data = std::make_shared<MemFs>();
    ns->mount("/mnt/data", data);

    write_file(*ns, "/mnt/data/dir/file", "routed", fs::perms(0644));
    ASSERT_EQ(read_file(*data, "/dir/file"), "routed");
    ASSERT_FALSE(exists(*root, "/mnt/data/dir"));

    ns->chmod("/mnt/data/dir/file", fs::perms(0600));
    ASSERT_EQ(data->stat("/dir/file").perms, fs::perms(0600));

    ns->remove("/mnt/data/dir/file");
    ASSERT_FALSE(exists(*data, "/dir/file"));
}

TEST_F(MountFsTest, RejectsUnconfinedHostBackend) {
    expect_error(errc::invalid_argument, [&] { ns->mount("/host", std::make_shared<OsFs>()); });
    expect_error(errc::invalid_argument, [&] { ns->mount("/none", nullptr); });

    // Confined host access is fine
    ns->mount("/host", std::make_shared<BasePathFs>(std::make_shared<OsFs>(), "/"));
    ASSERT_GE(ns->find_node("/host"), 0);
}

TEST_F(MountFsTest, Masking) {
    root->mkdir("/existing", fs::perms(0755));
    expect_error(errc::already_exists,
                 [&] { ns->mount("/existing", std::make_shared<MemFs>()); });

    MountOptions options;
    options.allow_masking = true;
    MountFs masking(root, options);
    masking.mount("/existing", std::make_shared<MemFs>());
    ASSERT_TRUE(masking.stat("/existing").mount_point);
}

TEST_F(MountFsTest, AlreadyMounted) {
    ns->mount("/m", std::make_shared<MemFs>());
    expect_error(errc::already_mounted, [&] { ns->mount("/m", std::make_shared<MemFs>()); });

    // A placeholder created by a deeper mount can still take a backend
    ns->mount("/p/q", std::make_shared<MemFs>());
    ns->mount("/p", std::make_shared<MemFs>());
    ASSERT_EQ(ns->mounts().size(), 4u);
}

TEST_F(MountFsTest, RecursiveMount) {
    auto data = std::make_shared<MemFs>();
    ns->mount("/a", data);
    expect_error(errc::recursive_mount, [&] { ns->mount("/a/again", data); });
    expect_error(errc::recursive_mount, [&] { ns->mount("/self", root); });

    MountOptions options;
    options.allow_recursive_mount = true;
    MountFs relaxed(root, options);
    relaxed.mount("/a", data);
    relaxed.mount("/a/again", data);
    ASSERT_EQ(relaxed.mounts().size(), 3u);
}

TEST_F(MountFsTest, MountPointInfo) {
    auto data = std::make_shared<MemFs>();
    data->chmod("/", fs::perms(0750));
    ns->mount("/a/b", data);

    FileInfo point = ns->stat("/a/b");
    ASSERT_TRUE(point.mount_point);
    ASSERT_TRUE(point.is_dir());
    ASSERT_EQ(point.name, "b");
    ASSERT_EQ(point.perms, fs::perms(0750));

    FileInfo placeholder = ns->stat("/a");
    ASSERT_TRUE(placeholder.mount_point);
    ASSERT_EQ(placeholder.perms, fs::perms(0777));

    FilePtr dir = ns->open("/a/b");
    ASSERT_TRUE(dir->stat().mount_point);
    dir->close();
}

TEST_F(MountFsTest, ListingIncludesMountPoints) {
    write_file(*root, "/a/real", "r", fs::perms(0644));
    ns->mount("/a/b", std::make_shared<MemFs>());
    ns->mount("/other", std::make_shared<MemFs>());

    auto entries = read_dir(*ns, "/a");
    ASSERT_EQ(entries.size(), 2u);
    ASSERT_EQ(entries[0].name, "b");
    ASSERT_TRUE(entries[0].mount_point);
    ASSERT_EQ(entries[1].name, "real");
    ASSERT_FALSE(entries[1].mount_point);

    auto top = read_dir(*ns, "/");
    ASSERT_EQ(top.size(), 2u);
    ASSERT_EQ(top[0].name, "a");
    ASSERT_EQ(top[1].name, "other");
}

TEST_F(MountFsTest, MountPointHidesBackendEntry) {
    MountOptions options;
    options.allow_masking = true;
    MountFs masking(root, options);
    write_file(*root, "/shadowed", "file", fs::perms(0644));

    masking.mount("/shadowed", std::make_shared<MemFs>());
    auto entries = read_dir(masking, "/");
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_TRUE(entries[0].mount_point);
    ASSERT_TRUE(entries[0].is_dir());
}

TEST_F(MountFsTest, RemoveAllKeepsMounts) {
    auto data = std::make_shared<MemFs>();
    write_file(*root, "/a/outside", "o", fs::perms(0644));
    write_file(*data, "/inner/file", "i", fs::perms(0644));
    ns->mount("/a/b", data);

    ns->remove_all("/a");

    ASSERT_FALSE(exists(*root, "/a/outside"));
    ASSERT_FALSE(exists(*data, "/inner"));

    ASSERT_GE(ns->find_node("/a/b"), 0);
    ASSERT_EQ(ns->find_path("/a/b/x").fs, data);
    ASSERT_TRUE(ns->stat("/a/b").mount_point);
    ASSERT_EQ(ns->mounts().size(), 2u);

    // Still usable afterwards
    write_file(*ns, "/a/b/again", "yes", fs::perms(0644));
    ASSERT_EQ(read_file(*data, "/again"), "yes");
}

TEST_F(MountFsTest, RemoveAllMissingPath) {
    ns->remove_all("/does/not/exist");
}

TEST_F(MountFsTest, RemoveMountPointDenied) {
    ns->mount("/m", std::make_shared<MemFs>());
    expect_error(errc::permission_denied, [&] { ns->remove("/m"); });
}

TEST_F(MountFsTest, Rename) {
    auto data = std::make_shared<MemFs>();
    ns->mount("/m", data);
    write_file(*ns, "/m/a", "1", fs::perms(0644));
    write_file(*ns, "/top", "2", fs::perms(0644));

    ns->rename("/m/a", "/m/b");
    ASSERT_EQ(read_file(*data, "/b"), "1");

    expect_error(errc::cross_backend, [&] { ns->rename("/m/b", "/elsewhere"); });
    expect_error(errc::cross_backend, [&] { ns->rename("/top", "/m/top"); });
    ASSERT_EQ(read_file(*data, "/b"), "1");
}

TEST_F(MountFsTest, Umount) {
    auto outer = std::make_shared<MemFs>();
    auto inner = std::make_shared<MemFs>();
    ns->mount("/a/b", outer);
    ns->mount("/a/b/c", inner);

    ns->umount("/a/b");
    ASSERT_EQ(ns->find_path("/a/b/x").fs, root);
    ASSERT_EQ(ns->find_path("/a/b/c/x").fs, inner);
    ASSERT_GE(ns->find_node("/a/b"), 0);

    ns->umount("/a/b/c");
    ASSERT_EQ(ns->find_node("/a"), -1);
    ASSERT_EQ(ns->mounts().size(), 1u);

    expect_error(errc::not_mounted, [&] { ns->umount("/a/b"); });
    expect_error(errc::not_mounted, [&] { ns->umount("/"); });

    // Freed nodes are reused
    ns->mount("/again", outer);
    ASSERT_EQ(ns->find_path("/again/f").fs, outer);
}

TEST_F(MountFsTest, Remount) {
    auto first = std::make_shared<MemFs>();
    auto second = std::make_shared<MemFs>();
    ns->mount("/m", first);
    ns->remount("/m", second);

    ASSERT_EQ(ns->find_path("/m/x").fs, second);
    expect_error(errc::not_mounted, [&] { ns->remount("/nope", first); });
    expect_error(errc::invalid_argument, [&] { ns->remount("/m", std::make_shared<OsFs>()); });
}

TEST_F(MountFsTest, MountsInPathOrder) {
    ns->mount("/z", std::make_shared<MemFs>());
    ns->mount("/a/y", std::make_shared<MemFs>());
    ns->mount("/a", std::make_shared<MemFs>());

    auto mounts = ns->mounts();
    ASSERT_EQ(mounts.size(), 4u);
    ASSERT_EQ(mounts[0].path, "/");
    ASSERT_EQ(mounts[1].path, "/a");
    ASSERT_EQ(mounts[2].path, "/a/y");
    ASSERT_EQ(mounts[3].path, "/z");
}

TEST_F(MountFsTest, MkdirBacksPlaceholder) {
    ns->mount("/a/b", std::make_shared<MemFs>());
    ASSERT_FALSE(exists(*root, "/a"));

    ns->mkdir("/a", fs::perms(0700));
    ASSERT_TRUE(root->stat("/a").is_dir());
    ASSERT_EQ(root->stat("/a").perms, fs::perms(0700));

    ns->mkdir_all("/a/b/c/d", fs::perms(0755));
    ASSERT_TRUE(exists(*ns, "/a/b/c/d"));
}

TEST_F(MountFsTest, PlaceholderCannotBeWritten) {
    ns->mount("/a/b", std::make_shared<MemFs>());
    expect_error(errc::is_a_directory,
                 [&] { ns->open_file("/a", O_WRONLY | O_CREAT, fs::perms(0644)); });
}

TEST_F(MountFsTest, CreateBelowPlaceholder) {
    ns->mount("/p/q", std::make_shared<MemFs>());
    write_file(*ns, "/p/file", "f", fs::perms(0644));
    ASSERT_EQ(read_file(*root, "/p/file"), "f");
}

TEST_F(MountFsTest, ErrorsUseNamespacePath) {
    ns->mount("/m", std::make_shared<MemFs>());
    try {
        ns->stat("/m/missing");
        FAIL() << "stat succeeded";
    } catch (const FsError &e) {
        ASSERT_TRUE(is_not_found(e));
        ASSERT_EQ(e.path1(), fs::path("/m/missing"));
    }
}

TEST_F(MountFsTest, ChtimesOnPlaceholder) {
    ns->mount("/a/b", std::make_shared<MemFs>());
    TimePoint when = Clock::from_time_t(42);
    ns->chtimes("/a", when, when);
    ASSERT_EQ(ns->stat("/a").mod_time, when);
}

TEST_F(MountFsTest, SymlinksResolveInNamespace) {
    auto data = std::make_shared<MemFs>();
    ns->mount("/m", data);
    write_file(*ns, "/m/target", "t", fs::perms(0644));

    ASSERT_TRUE(ns->symlink_if_possible("/m/target", "/m/link"));
    ASSERT_EQ(*ns->readlink_if_possible("/m/link"), "/m/target");
    ASSERT_TRUE(ns->lstat_if_possible("/m/link").first.is_symlink());

    auto resolved = eval_symlinks(*ns, "/m/link");
    ASSERT_TRUE(resolved.has_value());
    ASSERT_EQ(*resolved, "/m/target");

    expect_error(errc::invalid_argument, [&] { ns->readlink_if_possible("/m"); });
}
