#include <gtest/gtest.h>
#include "process/Launcher.hpp"
#include "FakeLauncher.hpp"

#include <cstdlib>

using namespace ppt::process;
using ppt::test::TempDir;

namespace fs = std::filesystem;

class PosixLauncherTest : public ::testing::Test {
protected:
    PosixLauncher launcher;
    TempDir dir;
};

TEST_F(PosixLauncherTest, RunsInDirectoryWithEnvironmentAndCapturesOutput) {
    const auto cwd = fs::canonical(dir.path());
    const auto res = launcher.run({{"/bin/sh", "-c", "echo $PPT_LAUNCH_VALUE; pwd; exit 3"},
                                   cwd, {{"PPT_LAUNCH_VALUE", "bar"}}, true});

    EXPECT_EQ(res.exitCode, 3);
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.output, "bar\n" + cwd.string() + "\n");
}

TEST_F(PosixLauncherTest, LaunchValueOverridesInheritedVariable) {
    ::setenv("PPT_LAUNCH_INHERITED", "parent", 1);
    const auto res = launcher.run({{"/bin/sh", "-c", "echo $PPT_LAUNCH_INHERITED"},
                                   {}, {{"PPT_LAUNCH_INHERITED", "child"}}, true});
    ::unsetenv("PPT_LAUNCH_INHERITED");

    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.output, "child\n");
}

TEST_F(PosixLauncherTest, InheritedEnvironmentReachesChild) {
    ::setenv("PPT_LAUNCH_KEPT", "kept", 1);
    const auto res = launcher.run({{"/bin/sh", "-c", "echo $PPT_LAUNCH_KEPT"}, {}, {}, true});
    ::unsetenv("PPT_LAUNCH_KEPT");

    EXPECT_EQ(res.output, "kept\n");
}

TEST_F(PosixLauncherTest, SignalMapsTo128PlusSignal) {
    const auto res = launcher.run({{"/bin/sh", "-c", "kill -TERM $$"}, {}, {}, true});
    EXPECT_EQ(res.exitCode, 128 + 15);
}

TEST_F(PosixLauncherTest, MissingProgramIsLaunchError) {
    EXPECT_THROW((void)launcher.run({{"ppt-no-such-program-on-path"}, {}, {}, true}), LaunchError);
}

TEST_F(PosixLauncherTest, MissingDirectoryIsLaunchError) {
    try {
        (void)launcher.run({{"/bin/sh", "-c", "exit 0"}, dir / "does-not-exist", {}, true});
        FAIL() << "expected LaunchError";
    } catch (const LaunchError& e) {
        EXPECT_NE(std::string(e.what()).find("/bin/sh"), std::string::npos);
    }
}

TEST_F(PosixLauncherTest, EmptyCommandIsLaunchError) {
    EXPECT_THROW((void)launcher.run({}), LaunchError);
}
