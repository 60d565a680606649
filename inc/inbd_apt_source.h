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

#ifndef INBD_APT_SOURCE_H
#define INBD_APT_SOURCE_H

#include <string>
#include <vector>

#include "inbd_family.h"

namespace inbd {

// An apt source list under sources.list.d with an optional signing key.
struct ApplicationSource {
  std::string filename;
  std::vector<std::string> sources;
  std::string gpg_key_uri;
  std::string gpg_key_name;
};

// Checks that name is a single path component.
bool is_plain_file_name(const std::string& name);

// Replaces the system sources.list with sources, one per line. The previous
// file is kept as sources.list.bak.
bool update_os_source(const Paths& paths,
                      const std::vector<std::string>& sources,
                      std::string& error);

// Adds and removes application sources and their keyrings.
class ApplicationSourceManager {
 public:
  explicit ApplicationSourceManager(AgentContext& agent);

  // The key URI must be trusted; the key is dearmored into the keyring dir.
  bool add(const ApplicationSource& source, std::string& error);
  // A missing key is only logged, a missing source file is an error.
  bool remove(const std::string& filename, const std::string& gpg_key_name,
              std::string& error);

 private:
  bool install_gpg_key(const std::string& uri, const std::string& name,
                       std::string& error);

  AgentContext& agent_;
};

}  // namespace inbd

#endif  // INBD_APT_SOURCE_H
