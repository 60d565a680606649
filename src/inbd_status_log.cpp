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

#include "inbd_status_log.h"

#include <sys/stat.h>

#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "inbd_safe_fs.h"

namespace inbd {
namespace {

using json = nlohmann::json;

constexpr mode_t kLogMode = 0644;
constexpr const char* kUpdateLogKey = "UpdateLog";
constexpr const char* kStatusDetailKey = "StatusDetail.Status";

struct ReasonName {
  FailureReason reason;
  const char* name;
};

constexpr ReasonName kReasonNames[] = {
    {FailureReason::Unspecified, "unspecified"},
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

}  // namespace

const char* failure_reason_name(FailureReason reason) {
  for (const auto& entry : kReasonNames) {
    if (entry.reason == reason) {
      return entry.name;
    }
  }
  return "unspecified";
}

std::optional<FailureReason> parse_failure_reason(const std::string& name) {
  for (const auto& entry : kReasonNames) {
    if (name == entry.name) {
      return entry.reason;
    }
  }
  return std::nullopt;
}

const char* update_status_name(UpdateStatus status) {
  switch (status) {
    case UpdateStatus::Success:
      return "SUCCESS";
    case UpdateStatus::Fail:
      return "FAIL";
    case UpdateStatus::Pending:
      return "PENDING";
    case UpdateStatus::NoUpdateAvailable:
      return "NO_UPDATE_AVAILABLE";
  }
  return "FAIL";
}

std::string format_local_time(std::time_t when) {
  std::tm local {};
  localtime_r(&when, &local);
  char buffer[32];
  if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local) ==
      0) {
    return {};
  }
  return buffer;
}

UpdateLogger::UpdateLogger(std::string status_path, std::string granular_path)
    : status_path_(std::move(status_path)),
      granular_path_(std::move(granular_path)) {}

bool UpdateLogger::write_status(UpdateStatus status,
                                const std::string& metadata,
                                const std::string& error_text,
                                std::string& error) {
  json record;
  record["Status"] = update_status_name(status);
  record["Type"] = "sota";
  record["Time"] = format_local_time(std::time(nullptr));
  record["Metadata"] = metadata;
  record["Error"] = error_text;
  record["Version"] = "v1";

  std::lock_guard<std::mutex> lock(mutex_);
  if (!write_file(status_path_, record.dump(4), kLogMode, error)) {
    std::cerr << "Status log: " << error << std::endl;
    return false;
  }
  std::cout << "Status: " << update_status_name(status)
            << (error_text.empty() ? "" : " (" + error_text + ")")
            << std::endl;
  return true;
}

bool UpdateLogger::reset_granular(std::string& error) {
  json log;
  log[kUpdateLogKey] = json::array();
  std::lock_guard<std::mutex> lock(mutex_);
  return write_file(granular_path_, log.dump(4), kLogMode, error);
}

bool UpdateLogger::log_failure(FailureReason reason, std::string& error) {
  return append_granular(update_status_name(UpdateStatus::Fail),
                         "FailureReason", failure_reason_name(reason), error);
}

bool UpdateLogger::log_success(const std::string& version,
                               std::string& error) {
  return append_granular(update_status_name(UpdateStatus::Success), "Version",
                         version, error);
}

bool UpdateLogger::append_granular(const std::string& status,
                                   const std::string& key,
                                   const std::string& value,
                                   std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  json log;
  std::string read_error;
  if (const auto existing = read_file(granular_path_, read_error)) {
    try {
      log = json::parse(*existing);
    } catch (const json::parse_error& e) {
      std::cerr << "Granular log: discarding unreadable log: " << e.what()
                << std::endl;
      log = json::object();
    }
  }
  if (!log.is_object()) {
    log = json::object();
  }
  if (!log.contains(kUpdateLogKey) || !log[kUpdateLogKey].is_array()) {
    log[kUpdateLogKey] = json::array();
  }
  json entry;
  entry[kStatusDetailKey] = status;
  entry[key] = value;
  log[kUpdateLogKey].push_back(std::move(entry));

  if (!write_file(granular_path_, log.dump(4), kLogMode, error)) {
    std::cerr << "Granular log: " << error << std::endl;
    return false;
  }
  return true;
}

}  // namespace inbd
