/******************************************************************************
 * OpenHD
 *
 * Licensed under the GNU General Public License (GPL) Version 3.
 *
 * This software is provided "as-is," without warranty of any kind, express or
 * implied, including but not limited to the warranties of merchantability,
 * fitness for a particular purpose, and non-infringement. For details, see the
 * full license in the LICENSE file provided with this source code.
 *
 * Non-Military Use Only:
 * This software and its associated components are explicitly intended for
 * civilian and non-military purposes. Use in any military or defense
 * applications is strictly prohibited unless explicitly and individually
 * licensed otherwise by the OpenHD Team.
 *
 * Contributors:
 * A full list of contributors can be found at the OpenHD GitHub repository:
 * https://github.com/OpenHD
 *
 * © OpenHD, All Rights Reserved.
 ******************************************************************************/

#include <gtest/gtest.h>

#include "inbd_command.h"
#include "utils/process.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

TEST(RunProcessTest, CapturesOutputStreamsAndExitCode) {
  const auto result =
      runProcess({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
  EXPECT_TRUE(result.started);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.exitCode, 3);
  EXPECT_EQ(result.output, "out\n");
  EXPECT_EQ(result.errorOutput, "err\n");
  EXPECT_TRUE(result.error.empty());
}

TEST(RunProcessTest, AddsEnvironmentOverrides) {
  const auto result = runProcess({"/bin/sh", "-c", "printf %s \"$INBD_TEST_VALUE\""},
                                 {{"INBD_TEST_VALUE", "noninteractive"}});
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "noninteractive");
}

TEST(RunProcessTest, ArgumentsAreNotInterpretedByAShell) {
  const auto result = runProcess({"/bin/echo", "a;", "rm", "-rf", "$HOME"});
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "a; rm -rf $HOME\n");
}

TEST(RunProcessTest, ReportsMissingBinary) {
  const auto result = runProcess({"/nonexistent/inbd-binary"});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.exitCode, 127);
  EXPECT_EQ(result.error, "failed to execute /nonexistent/inbd-binary");
}

TEST(RunProcessTest, RejectsEmptyCommand) {
  const auto result = runProcess({});
  EXPECT_FALSE(result.started);
  EXPECT_EQ(result.error, "empty command");
}

TEST(CommandExecutorTest, OnlyAllowlistedBinariesRun) {
  EXPECT_TRUE(is_allowed_command(kAptGetCmd));
  EXPECT_TRUE(is_allowed_command(kSnapperCmd));
  EXPECT_FALSE(is_allowed_command("/bin/sh"));
  EXPECT_FALSE(is_allowed_command("apt-get"));

  SystemCommandExecutor executor;
  const auto result = executor.execute({"/bin/sh", "-c", "true"});
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, "command not allowed: /bin/sh");

  const auto empty = executor.execute({});
  EXPECT_EQ(empty.error, "empty command");
}

TEST(CommandExecutorTest, DescribesCommandForLogs) {
  EXPECT_EQ(describe_command({kDpkgCmd, "-l", "emacs"}), "/usr/bin/dpkg -l emacs");
  EXPECT_EQ(describe_command({}), "");
}

TEST(StringUtilsTest, SplitKeepsEmptyParts) {
  EXPECT_EQ(split("a,,b,", ','), (std::vector<std::string>{"a", "", "b", ""}));
  EXPECT_EQ(join({"emacs", "wcalc"}, ","), "emacs,wcalc");
  EXPECT_EQ(trim("  value\n"), "value");
  EXPECT_EQ(toLower("Ubuntu"), "ubuntu");
  EXPECT_TRUE(startsWith("linux-6.6.efi", "linux-"));
  EXPECT_TRUE(endsWith("linux-6.6.efi", ".efi"));
}

}  // namespace
}  // namespace inbd
