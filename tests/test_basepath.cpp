#include <gtest/gtest.h>

#include <type_traits>

#include "core/ioutil.hpp"
#include "core/memfs.hpp"
#include "core/osfs.hpp"
#include "mount/basepath.hpp"
#include "test_util.hpp"

using namespace layerfs;
using layerfs::test::expect_error;
using layerfs::test::TempDir;

class BasePathTest : public testing::Test {
public:
    void SetUp() override {
        source = std::make_shared<MemFs>();
        write_file(*source, "/jail/inside.txt", "inside", fs::perms(0644));
        write_file(*source, "/secret.txt", "secret", fs::perms(0600));
        write_file(*source, "/jailbreak/x", "sibling", fs::perms(0644));
        jail = std::make_shared<BasePathFs>(source, "/jail");
    }

    std::shared_ptr<MemFs> source;
    std::shared_ptr<BasePathFs> jail;
};

TEST_F(BasePathTest, MapsIntoBase) {
    ASSERT_EQ(read_file(*jail, "/inside.txt"), "inside");
    ASSERT_EQ(read_file(*jail, "inside.txt"), "inside");

    write_file(*jail, "/new/file", "n", fs::perms(0644));
    ASSERT_EQ(read_file(*source, "/jail/new/file"), "n");
    ASSERT_EQ(jail->real_path("stat", "/new"), "/jail/new");
}

TEST_F(BasePathTest, FileNamesAreRelative) {
    FilePtr f = jail->open("/inside.txt");
    ASSERT_EQ(f->name(), "/inside.txt");

    FilePtr root = jail->open("/");
    ASSERT_EQ(root->name(), "/");
}

TEST_F(BasePathTest, EscapesAreNotFound) {
    // ".." is cleaned against the base, so these stay inside and miss
    expect_error(errc::not_found, [&] { jail->stat("../secret.txt"); });
    expect_error(errc::not_found, [&] { jail->open("/../../secret.txt"); });

    // Prefix matching is by segment, not by string
    expect_error(errc::not_found, [&] { jail->stat("/../jailbreak/x"); });
}

TEST_F(BasePathTest, EscapeNeverReachesSource) {
    BasePathFs confined(source, "/jail/sub");
    source->mkdir("/jail/sub", fs::perms(0755));

    for (const char *name : {"..", "../inside.txt", "../../secret.txt"}) {
        expect_error(errc::not_found, [&] { confined.real_path("stat", name); });
        expect_error(errc::not_found, [&] { confined.stat(name); });
        expect_error(errc::not_found, [&] { confined.remove(name); });
        expect_error(errc::not_found, [&] { confined.remove_all(name); });
        expect_error(errc::not_found, [&] { confined.chmod(name, fs::perms(0777)); });
        expect_error(errc::not_found, [&] { confined.mkdir(name, fs::perms(0755)); });
        expect_error(errc::not_found, [&] { confined.create(name); });
        expect_error(errc::not_found, [&] { confined.rename(name, "/x"); });
    }

    ASSERT_EQ(read_file(*source, "/jail/inside.txt"), "inside");
    ASSERT_EQ(source->stat("/secret.txt").perms, fs::perms(0600));
}

TEST_F(BasePathTest, EscapeErrorCarriesCallerName) {
    try {
        jail->real_path("open", "../secret.txt");
        FAIL() << "real_path succeeded";
    } catch (const FsError &e) {
        ASSERT_EQ(e.path1(), fs::path("../secret.txt"));
    }
}

TEST_F(BasePathTest, Symlinks) {
    ASSERT_TRUE(jail->symlink_if_possible("/inside.txt", "/abs"));
    ASSERT_EQ(*source->readlink_if_possible("/jail/abs"), "/jail/inside.txt");
    ASSERT_EQ(*jail->readlink_if_possible("/abs"), "/inside.txt");
    ASSERT_EQ(read_file(*jail, "/abs"), "inside");

    ASSERT_TRUE(jail->symlink_if_possible("inside.txt", "/rel"));
    ASSERT_EQ(*jail->readlink_if_possible("/rel"), "inside.txt");
    ASSERT_TRUE(jail->lstat_if_possible("/rel").first.is_symlink());
}

TEST_F(BasePathTest, RenameInside) {
    jail->rename("/inside.txt", "/moved.txt");
    ASSERT_EQ(read_file(*source, "/jail/moved.txt"), "inside");
}

TEST(BasePathOsTest, ConfinesHostDirectory) {
    TempDir tmp;
    auto host = std::make_shared<OsFs>();
    host->mkdir(tmp.path() + "/box", fs::perms(0755));
    write_file(*host, tmp.path() + "/outside", "no", fs::perms(0644));

    BasePathFs box(host, tmp.path() + "/box");
    write_file(box, "/hello", "world", fs::perms(0644));
    ASSERT_EQ(read_file(*host, tmp.path() + "/box/hello"), "world");

    expect_error(errc::not_found, [&] { box.open("../outside"); });
    expect_error(errc::not_found, [&] { box.open("/../outside"); });
}

class RootTest : public BasePathTest {};

TEST_F(RootTest, OpenRequiresDirectory) {
    expect_error(errc::invalid_argument, [&] { Root::open_root(source, "/missing"); });
    expect_error(errc::invalid_argument, [&] { Root::open_root(source, "/secret.txt"); });

    auto root = Root::open_root(source, "/jail");
    ASSERT_EQ(root->name(), "/jail");
    ASSERT_FALSE(root->closed());
}

TEST(RootOpenTest, OnlyOpenRootConstructs) {
    // A root can only come out of open_root, which checks the directory
    static_assert(!std::is_constructible_v<Root, std::unique_ptr<BasePathFs>>);
    static_assert(!std::is_default_constructible_v<Root>);

    auto source = std::make_shared<MemFs>();
    source->mkdir("/dir", fs::perms(0755));
    std::unique_ptr<Root> root = Root::open_root(source, "/dir");
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->name(), "/dir");
}

TEST_F(RootTest, RejectsNonLocalNames) {
    auto root = Root::open_root(source, "/jail");
    ASSERT_EQ(read_file(*root, "inside.txt"), "inside");

    expect_error(errc::invalid_argument, [&] { root->open("/inside.txt"); });
    expect_error(errc::invalid_argument, [&] { root->open("../secret.txt"); });
    expect_error(errc::invalid_argument, [&] { root->stat("sub/../../secret.txt"); });
    expect_error(errc::invalid_argument, [&] { root->rename("inside.txt", "../out"); });
    expect_error(errc::invalid_argument, [&] { root->lstat(""); });
}

TEST_F(RootTest, NestedRoot) {
    source->mkdir_all("/jail/sub", fs::perms(0755));
    write_file(*source, "/jail/sub/deep", "deep", fs::perms(0644));

    auto root = Root::open_root(source, "/jail");
    auto sub = root->open_root("sub");
    ASSERT_EQ(sub->name(), "/jail/sub");
    ASSERT_EQ(read_file(*sub, "deep"), "deep");

    // Independent lifetimes
    root->close();
    ASSERT_EQ(read_file(*sub, "deep"), "deep");
    sub->close();
}

TEST_F(RootTest, ClosedRootFails) {
    auto root = Root::open_root(source, "/jail");
    root->close();

    ASSERT_TRUE(root->closed());
    ASSERT_EQ(root->name(), "");
    expect_error(errc::invalid_argument, [&] { root->stat("inside.txt"); });
    expect_error(errc::invalid_argument, [&] { root->create("x"); });
    expect_error(errc::invalid_argument, [&] { root->open_root("sub"); });
    expect_error(errc::invalid_argument, [&] { root->close(); });
}
