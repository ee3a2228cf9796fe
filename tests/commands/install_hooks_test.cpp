// =============================================================================
// cadvc - Install Hooks Command Tests
// =============================================================================

#include "commands/install_hooks_command.h"

#include <gtest/gtest.h>

#include "cadvc/common/error.h"
#include "test_support.h"

namespace cadvc::commands {
namespace {

namespace fs = std::filesystem;
using test::TempDir;

TEST(InstallHooksTest, RenderScript) {
    EXPECT_EQ(renderHookScript("/usr/local/bin/cadvc", "pre-push"),
              "#!/bin/sh\n# Installed by cadvc\nexec '/usr/local/bin/cadvc' hook pre-push \"$@\"\n");
    EXPECT_EQ(renderHookScript("it's", "post-merge"),
              "#!/bin/sh\n# Installed by cadvc\nexec 'it'\\''s' hook post-merge \"$@\"\n");
}

TEST(InstallHooksTest, InstallsAllHooks) {
    TempDir dir;
    auto command = createInstallHooksCommand("/opt/cadvc", false, dir.path());
    ASSERT_EQ(command->execute(), 0);

    for (const char* name :
         {"pre-commit", "post-checkout", "post-merge", "post-rewrite", "pre-push"}) {
        const fs::path script = dir / ".git/hooks" / name;
        ASSERT_TRUE(fs::exists(script)) << name;
        EXPECT_EQ(test::readFile(script), renderHookScript("/opt/cadvc", name));
        EXPECT_NE(fs::status(script).permissions() & fs::perms::owner_exec, fs::perms::none);
    }

    // Reinstalling over our own scripts is fine
    EXPECT_EQ(command->execute(), 0);
}

TEST(InstallHooksTest, ForeignHookIsKeptUnlessForced) {
    TempDir dir;
    const fs::path foreign = dir / ".git/hooks/pre-commit";
    test::writeFile(foreign, "#!/bin/sh\necho mine\n");

    EXPECT_EQ(createInstallHooksCommand("cadvc", false, dir.path())->execute(),
              toExitCode(ErrorCode::kUsageError));
    EXPECT_EQ(test::readFile(foreign), "#!/bin/sh\necho mine\n");
    EXPECT_TRUE(fs::exists(dir / ".git/hooks/pre-push"));

    EXPECT_EQ(createInstallHooksCommand("cadvc", true, dir.path())->execute(), 0);
    EXPECT_EQ(test::readFile(foreign), renderHookScript("cadvc", "pre-commit"));
}

}  // namespace
}  // namespace cadvc::commands
