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

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "inbd_snapshot.h"
#include "inbd_verifier.h"
#include "test_helpers.h"

namespace inbd {
namespace {

using ::testing::HasSubstr;

const std::vector<std::string> kRouteCmd = {kIpCmd, "route", "show", "default"};
const std::vector<std::string> kUndoCmd = {kSnapperCmd, "-c", kSnapperConfig,
                                           "undochange", "7..0"};
const std::vector<std::string> kDeleteCmd = {kSnapperCmd, "-c", kSnapperConfig,
                                             "delete", "7"};

class VerifierTest : public test::AgentTest {
 protected:
  VerifyOutcome verify() {
    PostBootVerifier verifier(agent_);
    return verifier.run();
  }

  std::string status_field(const char* key) const {
    const auto log = status_log();
    return log.is_object() ? log.value(key, "") : "";
  }

  std::string granular_field(const char* key) const {
    const auto entry = last_granular_entry();
    return entry.is_object() ? entry.value(key, "") : "";
  }

  static PersistentState image_update(const std::string& previous) {
    PersistentState state;
    state.restart_reason = kRestartReasonSota;
    state.previous_version = previous;
    state.phase = UpdatePhase::Rebooting;
    return state;
  }

  static PersistentState package_update(int snapshot_id) {
    PersistentState state;
    state.restart_reason = kRestartReasonSota;
    state.snapshot_id = snapshot_id;
    state.phase = UpdatePhase::Rebooting;
    return state;
  }
};

TEST_F(VerifierTest, NoStateFileIsNothingToDo) {
  EXPECT_EQ(verify(), VerifyOutcome::NothingToDo);
  EXPECT_TRUE(executor_.calls().empty());
  EXPECT_FALSE(std::filesystem::exists(paths_.status_log));
}

TEST_F(VerifierTest, EmptyStateFileIsNothingToDo) {
  dir_.write("var/intel-manageability/inbd_state", "");
  EXPECT_EQ(verify(), VerifyOutcome::NothingToDo);
  EXPECT_TRUE(executor_.calls().empty());
  EXPECT_FALSE(std::filesystem::exists(paths_.status_log));
}

TEST_F(VerifierTest, NoRestartReasonClearsState) {
  store_state(PersistentState{});
  EXPECT_EQ(verify(), VerifyOutcome::NothingToDo);
  EXPECT_FALSE(state_exists());
  EXPECT_FALSE(rebooted());
}

TEST_F(VerifierTest, CorruptStateIsReportedAndCleared) {
  dir_.write("var/intel-manageability/inbd_state", "{not json");
  EXPECT_EQ(verify(), VerifyOutcome::Failed);
  EXPECT_EQ(status_field("Status"), "FAIL");
  EXPECT_THAT(status_field("Error"), HasSubstr("invalid state file: "));
  EXPECT_EQ(granular_field("FailureReason"), "inbm");
  EXPECT_FALSE(state_exists());
}

TEST_F(VerifierTest, UpdateInterruptedBeforeApply) {
  auto state = package_update(0);
  state.phase = UpdatePhase::Downloaded;
  store_state(state);

  EXPECT_EQ(verify(), VerifyOutcome::Failed);
  EXPECT_EQ(status_field("Error"), "update interrupted before apply");
  EXPECT_EQ(granular_field("FailureReason"), "inbm");
  EXPECT_EQ(executor_.count({kLsbReleaseCmd}), 0u);
  EXPECT_FALSE(state_exists());
}

TEST_F(VerifierTest, ImageStillOnOldVersionFallsBack) {
  use_microvisor();
  store_state(image_update("2025-10-01"));

  EXPECT_EQ(verify(), VerifyOutcome::RebootScheduled);
  EXPECT_EQ(status_field("Status"), "FAIL");
  EXPECT_EQ(granular_field("FailureReason"), "bootloader");
  EXPECT_FALSE(executor_.ran({kImageToolCmd, "-c"}));
  EXPECT_FALSE(state_exists());
  EXPECT_TRUE(rebooted());
}

TEST_F(VerifierTest, ImageNewVersionIsCommitted) {
  use_microvisor();
  dir_.write("etc/image-id", "IMAGE_BUILD_DATE=2025-11-01\n");
  store_state(image_update("2025-10-01"));

  EXPECT_EQ(verify(), VerifyOutcome::Succeeded);
  EXPECT_TRUE(executor_.ran({kImageToolCmd, "-c"}));
  EXPECT_EQ(status_field("Status"), "SUCCESS");
  EXPECT_EQ(granular_field("Version"), "2025-11-01");
  EXPECT_FALSE(state_exists());
  EXPECT_FALSE(rebooted());
}

TEST_F(VerifierTest, ImageCommitFailureReboots) {
  use_microvisor();
  dir_.write("etc/image-id", "IMAGE_BUILD_DATE=2025-11-01\n");
  executor_.fail({kImageToolCmd, "-c"}, 3, "slot not bootable");
  store_state(image_update("2025-10-01"));

  EXPECT_EQ(verify(), VerifyOutcome::RebootScheduled);
  EXPECT_EQ(granular_field("FailureReason"), "oscommit");
  EXPECT_TRUE(rebooted());
}

TEST_F(VerifierTest, ImageKernelArgsOnlyUpdate) {
  use_microvisor();
  auto state = image_update("");
  state.kernel_args = "quiet";
  store_state(state);

  EXPECT_EQ(verify(), VerifyOutcome::Succeeded);
  EXPECT_EQ(status_field("Error"), kKernelArgsSuccessMessage);
  EXPECT_FALSE(executor_.ran({kImageToolCmd, "-c"}));
}

TEST_F(VerifierTest, InstalledPackagesAreConfirmed) {
  use_ubuntu();
  executor_.succeed({kDpkgCmd, "-l", "emacs"},
                    "||/ Name  Version\nii  emacs  1:27.1  all  GNU Emacs\n");
  executor_.succeed({kDpkgCmd, "-l", "wcalc"},
                    "ii  wcalc:amd64  2.5  amd64  calculator\n");
  UpdatePhase phase_during_check = UpdatePhase::Idle;
  executor_.on_execute([&](const std::vector<std::string>& argv) {
    if (argv.front() == kDpkgCmd) {
      phase_during_check = load_state().phase;
    }
  });
  PersistentState state;
  state.restart_reason = kRestartReasonPackages;
  state.package_list = {"emacs", "wcalc"};
  state.phase = UpdatePhase::Applied;
  store_state(state);

  EXPECT_EQ(verify(), VerifyOutcome::Succeeded);
  EXPECT_EQ(phase_during_check, UpdatePhase::Verifying);
  EXPECT_EQ(status_field("Status"), "SUCCESS");
  EXPECT_EQ(granular_field("Version"), "22.04");
  EXPECT_FALSE(state_exists());
  EXPECT_FALSE(rebooted());
}

TEST_F(VerifierTest, MissingPackageFails) {
  use_ubuntu();
  executor_.succeed({kDpkgCmd, "-l", "emacs"}, "ii  emacs  1:27.1  all  GNU Emacs\n");
  executor_.succeed({kDpkgCmd, "-l", "wcalc"}, "un  wcalc  <none>  <none>\n");
  PersistentState state;
  state.restart_reason = kRestartReasonPackages;
  state.package_list = {"emacs", "wcalc"};
  state.phase = UpdatePhase::Applied;
  store_state(state);

  EXPECT_EQ(verify(), VerifyOutcome::Failed);
  EXPECT_EQ(status_field("Error"), "package wcalc is not installed");
  EXPECT_EQ(granular_field("FailureReason"), "updatetool");
  EXPECT_FALSE(rebooted());
  EXPECT_TRUE(state_exists());
}

TEST_F(VerifierTest, NetworkLossRollsBackSnapshot) {
  use_ubuntu();
  store_state(package_update(7));

  EXPECT_EQ(verify(), VerifyOutcome::RebootScheduled);
  EXPECT_TRUE(executor_.ran(kRouteCmd));
  EXPECT_TRUE(executor_.ran(kUndoCmd));
  EXPECT_TRUE(executor_.ran(kDeleteCmd));
  EXPECT_EQ(status_field("Error"), "network check failed");
  EXPECT_EQ(granular_field("FailureReason"), "criticalservices");
  EXPECT_FALSE(state_exists());
  EXPECT_TRUE(rebooted());
}

TEST_F(VerifierTest, HealthyNetworkCommitsSnapshot) {
  use_ubuntu();
  executor_.succeed(kRouteCmd, "default via 10.0.0.1 dev eth0 proto dhcp\n");
  store_state(package_update(7));

  EXPECT_EQ(verify(), VerifyOutcome::Succeeded);
  EXPECT_FALSE(executor_.ran(kUndoCmd));
  EXPECT_TRUE(executor_.ran(kDeleteCmd));
  EXPECT_EQ(status_field("Status"), "SUCCESS");
  EXPECT_FALSE(rebooted());
}

TEST_F(VerifierTest, FailedRollbackDoesNotReboot) {
  use_ubuntu();
  executor_.fail({kSnapperCmd, "-c", kSnapperConfig, "undochange"}, 1,
                 "snapshot is busy");
  store_state(package_update(7));

  EXPECT_EQ(verify(), VerifyOutcome::Failed);
  EXPECT_EQ(granular_field("FailureReason"), "inbm");
  EXPECT_THAT(status_field("Error"), HasSubstr("rollback failed"));
  EXPECT_FALSE(executor_.ran(kDeleteCmd));
  EXPECT_FALSE(rebooted());
}

TEST_F(VerifierTest, PackageKernelArgsOnlyUpdate) {
  use_ubuntu();
  auto state = package_update(0);
  state.kernel_args = "iommu=pt intel_iommu=on";
  store_state(state);

  EXPECT_EQ(verify(), VerifyOutcome::Succeeded);
  EXPECT_EQ(status_field("Error"), kKernelArgsSuccessMessage);
  EXPECT_FALSE(executor_.ran(kRouteCmd));
}

TEST_F(VerifierTest, SecondRunAfterSuccessIsIdle) {
  use_ubuntu();
  store_state(package_update(0));
  EXPECT_EQ(verify(), VerifyOutcome::Succeeded);
  EXPECT_EQ(verify(), VerifyOutcome::NothingToDo);
}

}  // namespace
}  // namespace inbd
