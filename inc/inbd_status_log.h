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

#ifndef INBD_STATUS_LOG_H
#define INBD_STATUS_LOG_H

#include <ctime>
#include <mutex>
#include <optional>
#include <string>

namespace inbd {

// Closed set of failure reasons written to the granular log.
enum class FailureReason {
  Unspecified,
  Download,
  InsufficientStorage,
  RsAuthentication,
  SignatureCheck,
  UtWrite,
  UtBootConfiguration,
  Bootloader,
  CriticalServices,
  Inbm,
  OsCommit,
  UpdateTool,
};

const char* failure_reason_name(FailureReason reason);
std::optional<FailureReason> parse_failure_reason(const std::string& name);

enum class UpdateStatus {
  Success,
  Fail,
  Pending,
  NoUpdateAvailable,
};

const char* update_status_name(UpdateStatus status);

// Local time as "YYYY-MM-DD HH:MM:SS".
std::string format_local_time(std::time_t when);

// Writes the update status file and the granular update log. Both files are
// replaced atomically so a reader never observes partial JSON.
class UpdateLogger {
 public:
  UpdateLogger(std::string status_path, std::string granular_path);

  // metadata is the JSON echo of the request.
  bool write_status(UpdateStatus status, const std::string& metadata,
                    const std::string& error_text, std::string& error);

  // Starts an empty granular log for a new run.
  bool reset_granular(std::string& error);
  bool log_failure(FailureReason reason, std::string& error);
  bool log_success(const std::string& version, std::string& error);

  const std::string& status_path() const { return status_path_; }
  const std::string& granular_path() const { return granular_path_; }

 private:
  bool append_granular(const std::string& status, const std::string& key,
                       const std::string& value, std::string& error);

  std::string status_path_;
  std::string granular_path_;
  std::mutex mutex_;
};

}  // namespace inbd

#endif  // INBD_STATUS_LOG_H
