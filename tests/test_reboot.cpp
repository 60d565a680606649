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

#include "inbd_image_tool.h"
#include "inbd_reboot.h"
#include "test_helpers.h"

namespace inbd {
namespace {

using test::FakeExecutor;
using test::FakeHost;

TEST(RebootGateTest, DoNotRebootWins) {
  RebootFacts facts;
  facts.do_not_reboot = true;
  facts.system_changed = true;
  facts.kernel_args_changed = true;
  EXPECT_FALSE(should_reboot(facts));
}

TEST(RebootGateTest, AlreadyInstalledPackagesDoNotReboot) {
  RebootFacts facts;
  facts.package_family = true;
  facts.packages_installed = true;
  EXPECT_FALSE(should_reboot(facts));

  facts.kernel_args_changed = true;
  EXPECT_TRUE(should_reboot(facts));
}

TEST(RebootGateTest, ChangesReboot) {
  RebootFacts facts;
  EXPECT_FALSE(should_reboot(facts));
  facts.system_changed = true;
  EXPECT_TRUE(should_reboot(facts));

  RebootFacts kernel_only;
  kernel_only.package_family = true;
  kernel_only.kernel_args_changed = true;
  EXPECT_TRUE(should_reboot(kernel_only));
}

TEST(PowerActionTest, Names) {
  EXPECT_EQ(parse_power_action("cycle"), PowerAction::Cycle);
  EXPECT_EQ(parse_power_action("Reboot"), PowerAction::Cycle);
  EXPECT_EQ(parse_power_action("off"), PowerAction::Off);
  EXPECT_EQ(parse_power_action("shutdown"), PowerAction::Off);
  EXPECT_FALSE(parse_power_action("hibernate"));
}

TEST(RebooterTest, WaitsThenRunsRebootBinary) {
  FakeExecutor executor;
  FakeHost host;
  Rebooter rebooter(executor, host);
  std::string error;
  ASSERT_TRUE(rebooter.reboot(error)) << error;
  ASSERT_EQ(host.sleeps.size(), 1u);
  EXPECT_EQ(host.sleeps[0], kRebootDelay);
  EXPECT_EQ(executor.calls(), (std::vector<std::vector<std::string>>{{kRebootCmd}}));
}

TEST(RebooterTest, ShutdownAndFailures) {
  FakeExecutor executor;
  FakeHost host;
  Rebooter rebooter(executor, host);
  std::string error;
  ASSERT_TRUE(rebooter.perform(PowerAction::Off, error)) << error;
  EXPECT_TRUE(executor.ran({kShutdownCmd, "now"}));

  executor.fail({kRebootCmd}, 1);
  EXPECT_FALSE(rebooter.perform(PowerAction::Cycle, error));
  EXPECT_EQ(error, "failed to execute /usr/sbin/reboot: exited with status 1");
}

TEST(ImageUpdateToolTest, BuildsArgv) {
  FakeExecutor executor;
  ImageUpdateTool tool(executor);
  std::string error;
  ASSERT_TRUE(tool.write("/var/cache/manageability/a.raw", "abc123", error));
  ASSERT_TRUE(tool.apply(error));
  ASSERT_TRUE(tool.commit(error));
  EXPECT_EQ(executor.calls(),
            (std::vector<std::vector<std::string>>{
                {kImageToolCmd, "-w", "-u", "/var/cache/manageability/a.raw", "-s",
                 "abc123"},
                {kImageToolCmd, "-a"},
                {kImageToolCmd, "-c"}}));
}

TEST(ImageUpdateToolTest, ReportsStderrOnFailure) {
  FakeExecutor executor;
  executor.fail({kImageToolCmd, "-a"}, 2, "no inactive slot\n");
  ImageUpdateTool tool(executor);
  std::string error;
  EXPECT_FALSE(tool.apply(error));
  EXPECT_EQ(error, "failed to apply image: exited with status 2: no inactive slot");
}

}  // namespace
}  // namespace inbd
