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
#include <nlohmann/json.hpp>

#include "inbd_state.h"
#include "test_helpers.h"

namespace inbd {
namespace {

using test::FakeExecutor;
using test::TempDir;

class StateStoreTest : public ::testing::Test {
 protected:
  TempDir dir_;
  FakeExecutor executor_;
  StateStore store_{executor_, dir_.file("var/intel-manageability/inbd_state")};
};

TEST_F(StateStoreTest, StoreThenLoadReturnsSameState) {
  PersistentState state;
  state.restart_reason = kRestartReasonPackages;
  state.snapshot_id = 7;
  state.previous_version = "2025-10-01";
  state.package_list = {"emacs", "wcalc"};
  state.kernel_args = "quiet";
  state.phase = UpdatePhase::Rebooting;
  state.start_time = 1760000000;
  state.deadline = 1760003600;

  std::string error;
  ASSERT_TRUE(store_.store(state, error)) << error;
  PersistentState loaded;
  ASSERT_EQ(store_.load(loaded, error), StateLoadResult::Loaded) << error;
  EXPECT_EQ(loaded, state);
}

TEST_F(StateStoreTest, UsesWireKeys) {
  PersistentState state;
  state.restart_reason = kRestartReasonPackages;
  state.package_list = {"emacs", "wcalc"};
  const auto doc = nlohmann::json::parse(serialize_state(state));
  EXPECT_EQ(doc["restart_reason"], "package_installation");
  EXPECT_EQ(doc["package_list"], "emacs,wcalc");
  EXPECT_EQ(doc["snapshot_number"], 0);
  EXPECT_EQ(doc["tiber-version"], "");
  EXPECT_FALSE(doc.contains("kernel_args"));
}

TEST_F(StateStoreTest, MissingFileIsNotFound) {
  PersistentState state;
  std::string error;
  EXPECT_EQ(store_.load(state, error), StateLoadResult::NotFound);
}

TEST_F(StateStoreTest, SizeZeroFileIsNotFound) {
  dir_.write("var/intel-manageability/inbd_state", "");
  PersistentState state;
  std::string error;
  EXPECT_EQ(store_.load(state, error), StateLoadResult::NotFound);
}

TEST_F(StateStoreTest, CorruptFileIsAnError) {
  dir_.write("var/intel-manageability/inbd_state", "{\"restart_reason\":");
  PersistentState state;
  std::string error;
  EXPECT_EQ(store_.load(state, error), StateLoadResult::Error);
  EXPECT_EQ(error, "state file is not a JSON object");
}

TEST_F(StateStoreTest, LegacyRecordWithoutPhaseLoadsAsApplied) {
  dir_.write("var/intel-manageability/inbd_state",
             R"({"restart_reason":"sota","snapshot_number":0,"tiber-version":"2025-10-01"})");
  PersistentState state;
  std::string error;
  ASSERT_EQ(store_.load(state, error), StateLoadResult::Loaded) << error;
  EXPECT_EQ(state.phase, UpdatePhase::Applied);
  EXPECT_EQ(state.previous_version, "2025-10-01");
  EXPECT_TRUE(state.package_list.empty());
}

TEST_F(StateStoreTest, RejectsUnknownValues) {
  PersistentState state;
  std::string error;
  EXPECT_FALSE(parse_state(R"({"restart_reason":"firmware"})", state, error));
  EXPECT_EQ(error, "unknown restart reason in state file: firmware");
  EXPECT_FALSE(parse_state(R"({"restart_reason":"sota","phase":"paused"})",
                           state, error));
  EXPECT_EQ(error, "unknown phase in state file");
  EXPECT_FALSE(parse_state(R"({"snapshot_number":-4})", state, error));
  EXPECT_FALSE(parse_state(R"({"snapshot_number":"four"})", state, error));
  EXPECT_EQ(error.rfind("malformed state file: ", 0), 0u);
}

TEST_F(StateStoreTest, TruncateUsesTruncateCommand) {
  std::string error;
  // Nothing to truncate yet.
  EXPECT_TRUE(store_.truncate_to_zero(error));
  EXPECT_TRUE(executor_.calls().empty());

  ASSERT_TRUE(store_.store(PersistentState{}, error)) << error;
  EXPECT_TRUE(store_.truncate_to_zero(error));
  EXPECT_TRUE(executor_.ran({kTruncateCmd, "-s", "0", store_.path()}));

  executor_.fail({kTruncateCmd});
  EXPECT_FALSE(store_.truncate_to_zero(error));
  EXPECT_EQ(error, "failed to truncate state file: exited with status 1");
}

TEST_F(StateStoreTest, RemoveDeletesFile) {
  std::string error;
  ASSERT_TRUE(store_.store(PersistentState{}, error)) << error;
  EXPECT_TRUE(store_.remove(error));
  PersistentState state;
  EXPECT_EQ(store_.load(state, error), StateLoadResult::NotFound);
  EXPECT_TRUE(store_.remove(error));
}

TEST(UpdatePhaseTest, NamesRoundTrip) {
  EXPECT_STREQ(phase_name(UpdatePhase::Snapshotted), "snapshotted");
  EXPECT_EQ(parse_phase("verifying"), UpdatePhase::Verifying);
  EXPECT_FALSE(parse_phase("Verifying"));
}

}  // namespace
}  // namespace inbd
