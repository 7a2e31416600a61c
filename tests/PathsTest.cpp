#include "service_control/Paths.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>

namespace svcctl::test {

    namespace {
        const fs::perms kExec = fs::perms::owner_all;
        const fs::perms kPlain = fs::perms::owner_read | fs::perms::owner_write;
    } // namespace

    TEST(PathsTest, LookPathFindsFirstExecutableInOrder)
    {
        TempRoot root;
        root.write("a/tool", "#!/bin/sh\n", kPlain);
        root.write("b/tool", "#!/bin/sh\n", kExec);
        root.write("c/tool", "#!/bin/sh\n", kExec);

        const std::string search = (root.path() / "a").string() + ":" +
            (root.path() / "b").string() + ":" + (root.path() / "c").string();

        EXPECT_EQ(lookPath("tool", search).string(), (root.path() / "b/tool").string());
    }

    TEST(PathsTest, LookPathSkipsDirectories)
    {
        TempRoot root;
        root.mkdir("a/tool");
        EXPECT_TRUE(lookPath("tool", (root.path() / "a").string()).empty());
    }

    TEST(PathsTest, LookPathMissing)
    {
        TempRoot root;
        EXPECT_TRUE(lookPath("no-such-tool", root.path().string()).empty());
        EXPECT_TRUE(lookPath("", root.path().string()).empty());
    }

    TEST(PathsTest, LookPathWithSlashChecksPathDirectly)
    {
        TempRoot root;
        const fs::path tool = root.write("x/tool", "#!/bin/sh\n", kExec);
        EXPECT_EQ(lookPath(tool.string(), "/nonexistent").string(), tool.string());

        const fs::path plain = root.write("x/plain", "", kPlain);
        EXPECT_TRUE(lookPath(plain.string(), "").empty());
    }

    TEST(PathsTest, ResolveFromSearchPath)
    {
        TempRoot root;
        const fs::path tool = root.write("bin/sampled", "#!/bin/sh\n", kExec);

        ServiceDescriptor d;
        d.name = "sampled";

        ResolvedExecutable exe;
        ASSERT_TRUE(resolveExecutable(d, (root.path() / "bin").string(), exe, nullptr));
        EXPECT_EQ(exe.executable.string(), tool.string());
        EXPECT_TRUE(exe.arguments.empty());
        EXPECT_EQ(exe.commandLine, tool.string());

        d.arguments = { "--flag", "-v" };
        ASSERT_TRUE(resolveExecutable(d, (root.path() / "bin").string(), exe, nullptr));
        EXPECT_EQ(exe.arguments, d.arguments);
        EXPECT_EQ(exe.commandLine, tool.string() + " --flag -v");
    }

    TEST(PathsTest, ResolveFallsBackToOwnExecutable)
    {
        TempRoot root;
        ServiceDescriptor d;
        d.name = "not-on-search-path";

        ResolvedExecutable exe;
        std::string err;
        ASSERT_TRUE(resolveExecutable(d, root.path().string(), exe, &err)) << err;
        EXPECT_EQ(exe.executable.string(), selfExePath().string());
        EXPECT_FALSE(exe.executable.empty());
    }

    TEST(PathsTest, SelfExePathIsAbsoluteAndExists)
    {
        const fs::path self = selfExePath();
        ASSERT_FALSE(self.empty());
        EXPECT_TRUE(self.is_absolute());
        EXPECT_TRUE(fs::exists(self));
    }

    TEST(PathsTest, JoinStrings)
    {
        EXPECT_EQ(joinStrings({}, " "), "");
        EXPECT_EQ(joinStrings({ "a" }, " "), "a");
        EXPECT_EQ(joinStrings({ "a", "b", "c" }, ", "), "a, b, c");
    }

} // namespace svcctl::test
