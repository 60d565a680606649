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

#include "inbd_status_log.h"
#include "test_helpers.h"

namespace inbd {
namespace {

using test::read_json;
using test::TempDir;

class UpdateLoggerTest : public ::testing::Test {
 protected:
  TempDir dir_;
  UpdateLogger logger_{dir_.file("inbm-update-status.log"),
                       dir_.file("inbm-update-log.log")};
  std::string error_;
};

TEST_F(UpdateLoggerTest, StatusRecordFields) {
  ASSERT_TRUE(logger_.write_status(UpdateStatus::Fail, R"({"mode":"FULL"})",
                                   "download failed", error_))
      << error_;
  const auto status = read_json(logger_.status_path());
  EXPECT_EQ(status["Status"], "FAIL");
  EXPECT_EQ(status["Type"], "sota");
  EXPECT_EQ(status["Metadata"], R"({"mode":"FULL"})");
  EXPECT_EQ(status["Error"], "download failed");
  EXPECT_EQ(status["Version"], "v1");
  EXPECT_EQ(status["Time"].get<std::string>().size(), 19u);
}

TEST_F(UpdateLoggerTest, StatusIsPrettyPrinted) {
  ASSERT_TRUE(logger_.write_status(UpdateStatus::Pending, "", "", error_));
  EXPECT_NE(dir_.read("inbm-update-status.log").find("\n    \"Status\": \"PENDING\""),
            std::string::npos);
}

TEST_F(UpdateLoggerTest, GranularEntriesAccumulateUntilReset) {
  ASSERT_TRUE(logger_.log_failure(FailureReason::InsufficientStorage, error_)) << error_;
  ASSERT_TRUE(logger_.log_success("2025-10-02", error_)) << error_;
  auto log = read_json(logger_.granular_path());
  ASSERT_EQ(log["UpdateLog"].size(), 2u);
  EXPECT_EQ(log["UpdateLog"][0]["StatusDetail.Status"], "FAIL");
  EXPECT_EQ(log["UpdateLog"][0]["FailureReason"], "insufficientstorage");
  EXPECT_EQ(log["UpdateLog"][1]["StatusDetail.Status"], "SUCCESS");
  EXPECT_EQ(log["UpdateLog"][1]["Version"], "2025-10-02");

  ASSERT_TRUE(logger_.reset_granular(error_));
  log = read_json(logger_.granular_path());
  EXPECT_TRUE(log["UpdateLog"].empty());
}

TEST_F(UpdateLoggerTest, UnreadableGranularLogStartsOver) {
  dir_.write("inbm-update-log.log", "garbage");
  ASSERT_TRUE(logger_.log_failure(FailureReason::Bootloader, error_));
  const auto log = read_json(logger_.granular_path());
  ASSERT_EQ(log["UpdateLog"].size(), 1u);
  EXPECT_EQ(log["UpdateLog"][0]["FailureReason"], "bootloader");
}

TEST_F(UpdateLoggerTest, WriteOutsideAllowedRootsFails) {
  UpdateLogger outside("/home/inbd/status.log", "/home/inbd/granular.log");
  EXPECT_FALSE(outside.write_status(UpdateStatus::Success, "", "", error_));
  EXPECT_FALSE(error_.empty());
}

TEST(FailureReasonTest, ClosedSetOfNames) {
  const std::vector<std::pair<FailureReason, std::string>> names = {
      {FailureReason::Download, "download"},
      {FailureReason::InsufficientStorage, "insufficientstorage"},
      {FailureReason::RsAuthentication, "rsauthentication"},
      {FailureReason::SignatureCheck, "signaturecheck"},
      {FailureReason::UtWrite, "utwrite"},
      {FailureReason::UtBootConfiguration, "utbootconfiguration"},
      {FailureReason::Bootloader, "bootloader"},
      {FailureReason::CriticalServices, "criticalservices"},
      {FailureReason::Inbm, "inbm"},
      {FailureReason::OsCommit, "oscommit"},
      {FailureReason::UpdateTool, "updatetool"},
  };
  for (const auto& [reason, name] : names) {
    EXPECT_EQ(failure_reason_name(reason), name);
    EXPECT_EQ(parse_failure_reason(name), reason);
  }
  EXPECT_FALSE(parse_failure_reason("network"));
}

TEST(UpdateStatusTest, Names) {
  EXPECT_STREQ(update_status_name(UpdateStatus::NoUpdateAvailable),
               "NO_UPDATE_AVAILABLE");
  EXPECT_STREQ(update_status_name(UpdateStatus::Success), "SUCCESS");
}

}  // namespace
}  // namespace inbd
