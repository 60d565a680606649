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

#ifndef INBD_OS_H
#define INBD_OS_H

#include <optional>
#include <string>

#include "inbd_command.h"

namespace inbd {

// Update family selected from the running distribution.
enum class OsFamily {
  // Immutable-root A/B image distribution.
  Image,
  // Mutable distribution updated through apt.
  Package,
};

const char* os_family_name(OsFamily family);

// Classifies lsb_release output. Returns nullopt for unsupported systems.
std::optional<OsFamily> classify_lsb_release(const std::string& output);

// Runs lsb_release -a and classifies its output.
std::optional<OsFamily> detect_os_family(CommandExecutor& executor,
                                         std::string& error);

// Value of IMAGE_BUILD_DATE in the image id file.
std::optional<std::string> read_image_build_date(const std::string& path,
                                                 std::string& error);

// VERSION_ID (or VERSION) from an os-release file, unquoted.
std::optional<std::string> read_os_version(const std::string& path,
                                           std::string& error);

}  // namespace inbd

#endif  // INBD_OS_H
