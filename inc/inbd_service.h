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

#ifndef INBD_SERVICE_H
#define INBD_SERVICE_H

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "inbd_apt_source.h"
#include "inbd_family.h"
#include "inbd_protocol.h"
#include "inbd_reboot.h"

namespace inbd {

// Request handlers of the daemon. Each call may run on its own thread.
class RequestService {
 public:
  explicit RequestService(AgentContext& agent);

  UpdateResponse update_system_software(const UpdateRequest& request);
  UpdateResponse set_power_state(PowerAction action);

  // apt source management, package-based systems only.
  UpdateResponse update_os_source(const std::vector<std::string>& sources);
  UpdateResponse add_application_source(const ApplicationSource& source);
  UpdateResponse remove_application_source(const std::string& filename,
                                           const std::string& gpg_key_name);

  ConfigResponse load_config(const std::string& uri,
                             const std::string& signature,
                             const std::string& hash_algorithm);
  ConfigResponse get_config(const std::string& path);
  ConfigResponse set_config(const std::string& path);
  ConfigResponse append_config(const std::string& path);
  ConfigResponse remove_config(const std::string& path);

  // Dispatches one protocol line and returns the response line.
  std::string handle_line(const std::string& line);

 private:
  std::string handle_update_request(const std::string& line);
  std::string handle_power_request(const std::string& line);
  std::string handle_config_request(const std::string& line);
  std::string handle_source_request(const std::string& line);
  // Refuses source requests on systems without apt.
  bool require_package_os(const char* operation, UpdateResponse& response);

  AgentContext& agent_;
};

// Answers request lines from in until end of input. Each request runs on a
// detached worker; returns once every worker has written its response.
void serve_stream(RequestService& service, std::istream& in, std::ostream& out);

}  // namespace inbd

#endif  // INBD_SERVICE_H
