#include <gtest/gtest.h>

#include <regex>
#include <string>
#include <vector>

#include "core/ioutil.hpp"
#include "core/memfs.hpp"
#include "mount/filter.hpp"
#include "test_util.hpp"

using namespace layerfs;
using layerfs::test::expect_error;

TEST(ReadOnlyFsTest, ReadsPassThrough) {
    auto store = std::make_shared<MemFs>();
    write_file(*store, "/etc/conf", "value", fs::perms(0644));
    ReadOnlyFs guarded(store);

    ASSERT_EQ(read_file(guarded, "/etc/conf"), "value");
    ASSERT_TRUE(guarded.stat("/etc").is_dir());
    ASSERT_EQ(read_dir(guarded, "/etc").size(), 1u);
}

TEST(ReadOnlyFsTest, MutationsDenied) {
    auto store = std::make_shared<MemFs>();
    write_file(*store, "/f", "x", fs::perms(0644));
    ReadOnlyFs guarded(store);

    expect_error(errc::permission_denied, [&] { guarded.create("/g"); });
    expect_error(errc::permission_denied,
                 [&] { guarded.open_file("/f", O_WRONLY, fs::perms::none); });
    expect_error(errc::permission_denied,
                 [&] { guarded.open_file("/f", O_RDONLY | O_TRUNC, fs::perms::none); });
    expect_error(errc::permission_denied, [&] { guarded.mkdir("/d", fs::perms(0755)); });
    expect_error(errc::permission_denied, [&] { guarded.mkdir_all("/d/e", fs::perms(0755)); });
    expect_error(errc::permission_denied, [&] { guarded.remove("/f"); });
    expect_error(errc::permission_denied, [&] { guarded.remove_all("/"); });
    expect_error(errc::permission_denied, [&] { guarded.rename("/f", "/g"); });
    expect_error(errc::permission_denied, [&] { guarded.chmod("/f", fs::perms(0777)); });
    expect_error(errc::permission_denied,
                 [&] { guarded.chtimes("/f", Clock::now(), Clock::now()); });

    ASSERT_EQ(read_file(*store, "/f"), "x");
    ASSERT_EQ(store->stat("/f").perms, fs::perms(0644));
}

TEST(ReadOnlyFsTest, SymlinkCapabilities) {
    auto store = std::make_shared<MemFs>();
    store->symlink_if_possible("/target", "/link");
    ReadOnlyFs guarded(store);

    ASSERT_EQ(*readlink_if_possible(guarded, "/link"), "/target");
    ASSERT_TRUE(lstat_if_possible(guarded, "/link").first.is_symlink());
    ASSERT_FALSE(symlink_if_possible(guarded, "/target", "/other"));
}

static bool not_a_key(const std::string &path) {
    return path.size() < 4 || path.compare(path.size() - 4, 4, ".key") != 0;
}

class PredicateFsTest : public testing::Test {
public:
    void SetUp() override {
        store = std::make_shared<MemFs>();
        write_file(*store, "/pub/a.txt", "a", fs::perms(0644));
        write_file(*store, "/pub/b.txt", "b", fs::perms(0644));
        write_file(*store, "/pub/secret.key", "k", fs::perms(0600));
        store->mkdir("/pub/vault.key", fs::perms(0755));
        filtered = std::make_shared<PredicateFs>(store, not_a_key);
    }

    std::shared_ptr<MemFs> store;
    std::shared_ptr<PredicateFs> filtered;
};

TEST_F(PredicateFsTest, HidesRejectedFiles) {
    ASSERT_EQ(filtered->name(), "PredicateFs");
    ASSERT_EQ(read_file(*filtered, "/pub/a.txt"), "a");

    expect_error(errc::not_found, [&] { filtered->stat("/pub/secret.key"); });
    expect_error(errc::not_found, [&] { filtered->open("/pub/secret.key"); });
    expect_error(errc::not_found,
                 [&] { filtered->open_file("/pub/secret.key", O_RDWR, fs::perms::none); });
    expect_error(errc::not_found, [&] { filtered->remove("/pub/secret.key"); });
    expect_error(errc::not_found,
                 [&] { filtered->chtimes("/pub/secret.key", Clock::now(), Clock::now()); });
    ASSERT_EQ(read_file(*store, "/pub/secret.key"), "k");
}

TEST_F(PredicateFsTest, ListingsSkipRejectedFiles) {
    auto entries = read_dir(*filtered, "/pub");
    ASSERT_EQ(entries.size(), 3u);
    ASSERT_EQ(entries[0].name, "a.txt");
    ASSERT_EQ(entries[1].name, "b.txt");
    // Directories are never filtered, whatever their name
    ASSERT_EQ(entries[2].name, "vault.key");
    ASSERT_TRUE(filtered->stat("/pub/vault.key").is_dir());
}

TEST_F(PredicateFsTest, NewNamesMustPass) {
    expect_error(errc::permission_denied, [&] { filtered->create("/pub/new.key"); });
    expect_error(errc::permission_denied,
                 [&] { write_file(*filtered, "/pub/other.key", "x", fs::perms(0644)); });
    expect_error(errc::permission_denied,
                 [&] { filtered->rename("/pub/a.txt", "/pub/a.key"); });

    write_file(*filtered, "/pub/c.txt", "c", fs::perms(0644));
    filtered->rename("/pub/c.txt", "/pub/d.txt");
    ASSERT_TRUE(exists(*store, "/pub/d.txt"));
    ASSERT_FALSE(exists(*store, "/pub/new.key"));
}

TEST(PredicateFsPathTest, PredicateSeesNormalizedPaths) {
    auto store = std::make_shared<MemFs>();
    write_file(*store, "/d/f", "x", fs::perms(0644));

    std::vector<std::string> seen;
    PredicateFs filtered(store, [&seen](const std::string &path) {
        seen.push_back(path);
        return true;
    });

    filtered.stat("d//./f");
    read_dir(filtered, "/d/");
    std::vector<std::string> expected = {"/d/f", "/d", "/d/f"};
    ASSERT_EQ(seen, expected);
}

class RegexpFsTest : public testing::Test {
public:
    void SetUp() override {
        store = std::make_shared<MemFs>();
        write_file(*store, "/src/main.cpp", "int main() {}", fs::perms(0644));
        write_file(*store, "/src/util.hpp", "#pragma once", fs::perms(0644));
        write_file(*store, "/src/notes.txt", "todo", fs::perms(0644));
        write_file(*store, "/README", "readme", fs::perms(0644));
        filtered = std::make_shared<RegexpFs>(store, R"(\.(cpp|hpp)$)");
    }

    std::shared_ptr<MemFs> store;
    std::shared_ptr<RegexpFs> filtered;
};

TEST_F(RegexpFsTest, HidesNonMatchingFiles) {
    ASSERT_EQ(filtered->name(), "RegexpFs");
    ASSERT_NE(dynamic_cast<PredicateFs *>(filtered.get()), nullptr);
    ASSERT_EQ(read_file(*filtered, "/src/main.cpp"), "int main() {}");

    expect_error(errc::not_found, [&] { filtered->stat("/src/notes.txt"); });
    expect_error(errc::not_found, [&] { filtered->open("/README"); });
    expect_error(errc::not_found, [&] { filtered->remove("/src/notes.txt"); });
    expect_error(errc::not_found, [&] { filtered->chmod("/README", fs::perms(0600)); });
}

TEST_F(RegexpFsTest, DirectoriesStayVisible) {
    ASSERT_TRUE(filtered->stat("/src").is_dir());

    auto entries = read_dir(*filtered, "/src");
    ASSERT_EQ(entries.size(), 2u);
    ASSERT_EQ(entries[0].name, "main.cpp");
    ASSERT_EQ(entries[1].name, "util.hpp");

    auto top = read_dir(*filtered, "/");
    ASSERT_EQ(top.size(), 1u);
    ASSERT_EQ(top[0].name, "src");
}

TEST_F(RegexpFsTest, PagedListingSkipsFilteredBatches) {
    for (int i = 0; i < 5; ++i) {
        write_file(*store, "/mixed/a" + std::to_string(i) + ".txt", "", fs::perms(0644));
    }
    write_file(*store, "/mixed/z.cpp", "", fs::perms(0644));

    FilePtr dir = filtered->open("/mixed");
    auto batch = dir->read_dir(2);
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch->size(), 1u);
    ASSERT_EQ((*batch)[0].name, "z.cpp");
    ASSERT_FALSE(dir->read_dir(2).has_value());
}

TEST_F(RegexpFsTest, CreateMustMatch) {
    write_file(*filtered, "/src/new.cpp", "x", fs::perms(0644));
    ASSERT_TRUE(exists(*store, "/src/new.cpp"));

    expect_error(errc::permission_denied, [&] { filtered->create("/src/new.txt"); });
    expect_error(errc::permission_denied,
                 [&] { write_file(*filtered, "/src/other.txt", "x", fs::perms(0644)); });
    ASSERT_FALSE(exists(*store, "/src/new.txt"));
}

TEST_F(RegexpFsTest, RenameMustMatch) {
    filtered->rename("/src/main.cpp", "/src/app.cpp");
    ASSERT_TRUE(exists(*store, "/src/app.cpp"));

    expect_error(errc::permission_denied,
                 [&] { filtered->rename("/src/app.cpp", "/src/app.txt"); });

    // Directories are not filtered
    filtered->mkdir("/build", fs::perms(0755));
    filtered->rename("/build", "/out");
    ASSERT_TRUE(store->stat("/out").is_dir());
}

TEST(RegexpFsErrorTest, BadPattern) {
    auto store = std::make_shared<MemFs>();
    ASSERT_THROW(RegexpFs(store, "(unclosed").name(), std::regex_error);
}
