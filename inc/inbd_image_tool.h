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

#ifndef INBD_IMAGE_TOOL_H
#define INBD_IMAGE_TOOL_H

#include <string>
#include <vector>

#include "inbd_command.h"

namespace inbd {

// Wrapper for the A/B image-update tool.
class ImageUpdateTool {
 public:
  explicit ImageUpdateTool(CommandExecutor& executor);

  // Writes the image to the inactive slot (-w -u <file> -s <signature>).
  bool write(const std::string& image_path, const std::string& signature,
             std::string& error);
  // Makes the inactive slot the next boot target (-a).
  bool apply(std::string& error);
  // Makes the running slot permanent (-c).
  bool commit(std::string& error);

 private:
  bool run(const std::vector<std::string>& argv, const char* action,
           std::string& error);

  CommandExecutor& executor_;
};

}  // namespace inbd

#endif  // INBD_IMAGE_TOOL_H
