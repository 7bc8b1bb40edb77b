#include <gtest/gtest.h>

#include "core/executor.hpp"
#include "core/ioutil.hpp"
#include "core/osfs.hpp"
#include "core/planner.hpp"
#include "mount/basepath.hpp"
#include "mount/filter.hpp"
#include "mount/overlay.hpp"
#include "test_util.hpp"

using namespace layerfs;
using layerfs::test::expect_error;
using layerfs::test::TempDir;

TEST(PlannerTest, ParseSource) {
    auto mem = parse_source("mem");
    ASSERT_TRUE(mem.has_value());
    ASSERT_EQ(mem->kind, SourceKind::Mem);

    auto os = parse_source("os:/srv//data/");
    ASSERT_TRUE(os.has_value());
    ASSERT_EQ(os->kind, SourceKind::Os);
    ASSERT_EQ(os->arg, "/srv/data");

    auto ro = parse_source("readonly:os:/etc");
    ASSERT_TRUE(ro.has_value());
    ASSERT_EQ(ro->kind, SourceKind::ReadOnly);
    ASSERT_EQ(ro->inner->kind, SourceKind::Os);
    ASSERT_EQ(describe_source(*ro), "readonly:os:/etc");

    auto re = parse_source("regexp:\\.txt$:overlay:/srv");
    ASSERT_TRUE(re.has_value());
    ASSERT_EQ(re->kind, SourceKind::Regexp);
    ASSERT_EQ(re->arg, "\\.txt$");
    ASSERT_EQ(re->inner->kind, SourceKind::Overlay);
    ASSERT_EQ(describe_source(*re), "regexp:\\.txt$:overlay:/srv");
}

TEST(PlannerTest, ParseSourceRejects) {
    ASSERT_FALSE(parse_source("").has_value());
    ASSERT_FALSE(parse_source("mem:extra").has_value());
    ASSERT_FALSE(parse_source("os:relative/dir").has_value());
    ASSERT_FALSE(parse_source("os:").has_value());
    ASSERT_FALSE(parse_source("overlay").has_value());
    ASSERT_FALSE(parse_source("readonly:").has_value());
    ASSERT_FALSE(parse_source("regexp:pattern").has_value());
    ASSERT_FALSE(parse_source("regexp::mem").has_value());
    ASSERT_FALSE(parse_source("s3:bucket").has_value());
}

TEST(PlannerTest, GeneratePlan) {
    Config config;
    config.mounts = {
        {"/a/b/c", "mem"},
        {"/a", "mem"},
        {"/", "mem"},
        {"/a/", "mem"},
        {"/bad", "nope:x"},
        {"/z", "mem"},
    };

    MountPlan plan = generate_plan(config);

    ASSERT_EQ(plan.ops.size(), 3u);
    ASSERT_EQ(plan.ops[0].target, "/a");
    ASSERT_EQ(plan.ops[1].target, "/z");
    ASSERT_EQ(plan.ops[2].target, "/a/b/c");
    ASSERT_EQ(plan.rejected.size(), 3u);

    ASSERT_TRUE(plan.is_covered("/a/x"));
    ASSERT_TRUE(plan.is_covered("/z"));
    ASSERT_FALSE(plan.is_covered("/zz"));
}

TEST(ExecutorTest, BuildSource) {
    TempDir tmp;
    write_file(*std::make_shared<OsFs>(), tmp.path() + "/file", "host", fs::perms(0644));

    auto os = build_source(*parse_source("os:" + tmp.path()));
    ASSERT_NE(dynamic_cast<BasePathFs *>(os.get()), nullptr);
    ASSERT_EQ(read_file(*os, "/file"), "host");

    auto ro = build_source(*parse_source("readonly:os:" + tmp.path()));
    ASSERT_NE(dynamic_cast<ReadOnlyFs *>(ro.get()), nullptr);
    expect_error(errc::permission_denied, [&] { ro->remove("/file"); });

    auto overlay = build_source(*parse_source("overlay:" + tmp.path()));
    ASSERT_NE(dynamic_cast<CopyOnWriteFs *>(overlay.get()), nullptr);
    write_file(*overlay, "/file", "changed", fs::perms(0644));
    ASSERT_EQ(read_file(*overlay, "/file"), "changed");
    ASSERT_EQ(read_file(*os, "/file"), "host");

    expect_error(errc::not_found, [&] { build_source(*parse_source("os:" + tmp.path() + "/missing")); });
    expect_error(errc::invalid_argument, [&] { build_source(*parse_source("regexp:(:mem")); });
}

TEST(ExecutorTest, ExecutePlan) {
    TempDir tmp;
    Config config;
    config.mounts = {
        {"/scratch", "mem"},
        {"/host", "readonly:os:" + tmp.path()},
        {"/broken", "os:" + tmp.path() + "/missing"},
        {"/scratch/nested", "mem"},
    };

    ExecutionResult result = execute_plan(generate_plan(config), config);

    ASSERT_NE(result.fs, nullptr);
    ASSERT_EQ(result.mounted.size(), 3u);
    ASSERT_EQ(result.failed.size(), 1u);
    ASSERT_EQ(result.failed[0], "/broken");

    auto mounts = result.fs->mounts();
    ASSERT_EQ(mounts.size(), 4u);
    ASSERT_EQ(mounts[1].path, "/host");
    ASSERT_EQ(mounts[1].fs_name, "ReadOnlyFs");

    write_file(*result.fs, "/scratch/nested/f", "x", fs::perms(0644));
    ASSERT_EQ(read_file(*result.fs, "/scratch/nested/f"), "x");
    expect_error(errc::permission_denied,
                 [&] { write_file(*result.fs, "/host/f", "x", fs::perms(0644)); });
}

TEST(ExecutorTest, MountOptionsFromConfig) {
    Config config;
    config.allow_masking = true;
    ExecutionResult result = execute_plan(generate_plan(config), config);

    ASSERT_TRUE(result.fs->options().allow_masking);
    ASSERT_FALSE(result.fs->options().allow_recursive_mount);
    ASSERT_EQ(result.fs->mounts().size(), 1u);
}
