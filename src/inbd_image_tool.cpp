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

#include "inbd_image_tool.h"

#include <iostream>

#include "utils/string_utils.h"

namespace inbd {

ImageUpdateTool::ImageUpdateTool(CommandExecutor& executor)
    : executor_(executor) {}

bool ImageUpdateTool::run(const std::vector<std::string>& argv,
                          const char* action, std::string& error) {
  std::cout << "Image tool: " << describe_command(argv) << std::endl;
  const auto result = executor_.execute(argv);
  if (!result.ok()) {
    error = std::string("failed to ") + action + ": " + result.error;
    if (!trim(result.stderr_text).empty()) {
      error += ": " + trim(result.stderr_text);
    }
    return false;
  }
  return true;
}

bool ImageUpdateTool::write(const std::string& image_path,
                            const std::string& signature, std::string& error) {
  return run({kImageToolCmd, "-w", "-u", image_path, "-s", signature},
             "write image", error);
}

bool ImageUpdateTool::apply(std::string& error) {
  return run({kImageToolCmd, "-a"}, "apply image", error);
}

bool ImageUpdateTool::commit(std::string& error) {
  return run({kImageToolCmd, "-c"}, "commit image", error);
}

}  // namespace inbd
