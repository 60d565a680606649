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

#include "inbd_package_updater.h"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <regex>

#include "utils/string_utils.h"

namespace inbd {
namespace {

constexpr const char* kConfDef = "Dpkg::Options::=--force-confdef";
constexpr const char* kConfOld = "Dpkg::Options::=--force-confold";
constexpr const char* kNoUpdateLine =
    "0 upgraded, 0 newly installed, 0 to remove";
constexpr const char* kSizeLineMarker = "After this operation,";

std::vector<std::string> dpkg_configure() {
  return {kDpkgCmd, "--configure", "-a", "--force-confdef", "--force-confold"};
}

std::vector<std::string> with_packages(std::vector<std::string> command,
                                       const std::vector<std::string>& packages) {
  command.insert(command.end(), packages.begin(), packages.end());
  return command;
}

bool is_invalid_package_error(const std::string& text) {
  if (text.find("Unable to locate package") != std::string::npos) {
    return true;
  }
  for (const auto& line : split(text, '\n')) {
    if (startsWith(trim(line), "E: ")) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::uint64_t apt_size_to_bytes(const std::string& number,
                                const std::string& unit) {
  std::string digits;
  for (char c : number) {
    if (c != ',') {
      digits += c;
    }
  }
  char* end = nullptr;
  const double value = std::strtod(digits.c_str(), &end);
  if (digits.empty() || end == nullptr || *end != '\0' || value < 0) {
    return 0;
  }
  double scale = 1;
  if (unit == "kB") {
    scale = 1024.0;
  } else if (unit == "MB") {
    scale = 1024.0 * 1024;
  } else if (unit == "GB") {
    scale = 1024.0 * 1024 * 1024;
  }
  return static_cast<std::uint64_t>(value * scale);
}

DryRunResult parse_dry_run_output(const std::string& stdout_text,
                                  const std::string& stderr_text) {
  DryRunResult result;
  if (is_invalid_package_error(stderr_text) ||
      is_invalid_package_error(stdout_text)) {
    result.outcome = DryRunOutcome::InvalidPackages;
    result.error = "invalid package: " +
                   trim(stderr_text.empty() ? stdout_text : stderr_text);
    return result;
  }
  if (!trim(stderr_text).empty()) {
    result.error = "update size determination failed: " + trim(stderr_text);
    return result;
  }
  if (trim(stdout_text).empty()) {
    result.error = "no output from command to determine update size";
    return result;
  }

  std::string size_line;
  for (const auto& line : split(stdout_text, '\n')) {
    if (startsWith(trim(line), kNoUpdateLine)) {
      result.outcome = DryRunOutcome::NoUpdate;
      return result;
    }
    if (size_line.empty() && line.find(kSizeLineMarker) != std::string::npos) {
      size_line = line;
    }
  }

  static const std::regex kSizePattern(
      R"((\d+(?:,\d+)*(\.\d+)?)(\s*(kB|B|MB|GB)).*(freed|used))");
  std::smatch match;
  if (!std::regex_search(size_line, match, kSizePattern)) {
    result.error = "failed to get size of the update";
    return result;
  }
  result.outcome = DryRunOutcome::UpdateAvailable;
  if (match[5] == "used") {
    result.size_bytes = apt_size_to_bytes(match[1], match[4]);
  }
  return result;
}

std::vector<std::string> dry_run_command(
    const std::vector<std::string>& packages) {
  if (packages.empty()) {
    return {kAptGetCmd, "-o",       kConfDef,  "-o",         kConfOld,
            "--with-new-pkgs", "-u", "upgrade", "--assume-no"};
  }
  return with_packages(
      {kAptGetCmd, "-o", kConfDef, "-o", kConfOld, "-u", "install",
       "--assume-no"},
      packages);
}

std::vector<std::vector<std::string>> apt_command_sequence(
    UpdateMode mode, const std::vector<std::string>& packages) {
  std::vector<std::vector<std::string>> commands;
  switch (mode) {
    case UpdateMode::Full:
      commands.push_back({kAptGetCmd, "update"});
      commands.push_back({kAptGetCmd, "-yq", "-f", "install"});
      commands.push_back(dpkg_configure());
      if (packages.empty()) {
        commands.push_back({kAptGetCmd, "-yq", "-o", kConfDef, "-o", kConfOld,
                            "--with-new-pkgs", "upgrade"});
      } else {
        commands.push_back(with_packages(
            {kAptGetCmd, "-yq", "-o", kConfDef, "-o", kConfOld, "install"},
            packages));
      }
      break;
    case UpdateMode::NoDownload:
      commands.push_back(dpkg_configure());
      commands.push_back(
          {kAptGetCmd, "-o", kConfDef, "-o", kConfOld, "-yq", "-f", "install"});
      if (packages.empty()) {
        commands.push_back({kAptGetCmd, "-o", kConfDef, "-o", kConfOld,
                            "--with-new-pkgs", "--fix-missing", "-yq",
                            "upgrade"});
      } else {
        commands.push_back(with_packages({kAptGetCmd, "-o", kConfDef, "-o",
                                          kConfOld, "--fix-missing", "-yq",
                                          "install"},
                                         packages));
      }
      break;
    case UpdateMode::DownloadOnly:
      commands.push_back(dpkg_configure());
      commands.push_back({kAptGetCmd, "update"});
      if (packages.empty()) {
        commands.push_back({kAptGetCmd, "-o", kConfDef, "-o", kConfOld,
                            "--with-new-pkgs", "--download-only",
                            "--fix-missing", "-yq", "upgrade"});
      } else {
        commands.push_back(with_packages(
            {kAptGetCmd, "-o", kConfDef, "-o", kConfOld, "--download-only",
             "--fix-missing", "-yq", "install"},
            packages));
      }
      break;
  }
  return commands;
}

Environment apt_environment() {
  const char* path = std::getenv("PATH");
  std::string search_path = path != nullptr ? path : "";
  search_path += ":/usr/bin:/bin";
  return {
      {"DEBIAN_FRONTEND", "noninteractive"},
      {"NEEDRESTART_MODE", "l"},
      {"NEEDRESTART_SUSPEND", "1"},
      {"PATH", search_path},
  };
}

PackageUpdater::PackageUpdater(CommandExecutor& executor)
    : executor_(executor), environment_(apt_environment()) {}

DryRunResult PackageUpdater::estimate(const std::vector<std::string>& packages) {
  const auto command = dry_run_command(packages);
  std::cout << "Packages: sizing with " << describe_command(command)
            << std::endl;
  // --assume-no answers the prompt with "no", so apt exits nonzero even when
  // the dry run succeeded.
  const auto result = executor_.execute(command, environment_);
  if (result.exit_code < 0 && !result.error.empty()) {
    DryRunResult failed;
    failed.error = result.error;
    return failed;
  }
  auto parsed = parse_dry_run_output(result.stdout_text, result.stderr_text);
  if (parsed.outcome == DryRunOutcome::UpdateAvailable) {
    std::cout << "Packages: estimated size " << parsed.size_bytes << " bytes"
              << std::endl;
  } else if (parsed.outcome == DryRunOutcome::NoUpdate) {
    std::cout << "Packages: no update available" << std::endl;
  }
  return parsed;
}

bool PackageUpdater::run(UpdateMode mode,
                         const std::vector<std::string>& packages,
                         std::string& error) {
  for (const auto& command : apt_command_sequence(mode, packages)) {
    std::cout << "Packages: executing " << describe_command(command)
              << std::endl;
    const auto result = executor_.execute(command, environment_);
    if (!result.ok()) {
      error = "command execution error: " + result.error;
      if (!trim(result.stderr_text).empty()) {
        error += ": " + trim(result.stderr_text);
      }
      return false;
    }
    if (!result.stderr_text.empty()) {
      error = "command failed: " + trim(result.stderr_text);
      return false;
    }
  }
  return true;
}

bool PackageUpdater::verify_installed(const std::vector<std::string>& packages,
                                      std::string& error) {
  for (const auto& package : packages) {
    const auto result = executor_.execute({kDpkgCmd, "-l", package});
    bool installed = false;
    if (result.ok()) {
      const std::string prefix = "ii  " + package;
      for (const auto& line : split(result.stdout_text, '\n')) {
        if (!startsWith(line, prefix)) {
          continue;
        }
        // Reject longer names that share the prefix.
        const auto next = line.size() > prefix.size() ? line[prefix.size()]
                                                      : ' ';
        if (next == ':' || std::isspace(static_cast<unsigned char>(next))) {
          installed = true;
          break;
        }
      }
    }
    if (!installed) {
      error = "package " + package + " is not installed";
      return false;
    }
  }
  return true;
}

}  // namespace inbd
