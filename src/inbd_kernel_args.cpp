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

#include "inbd_kernel_args.h"

#include <sys/stat.h>

#include <algorithm>
#include <filesystem>
#include <utility>
#include <iostream>
#include <vector>

#include "inbd_safe_fs.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

constexpr mode_t kBootFileMode = 0600;
constexpr mode_t kBootDirMode = 0755;

std::string parent_dir(const std::string& path) {
  return std::filesystem::path(path).parent_path().string();
}

std::string loader_default_contents(const std::string& boot_entry) {
  return "default " + std::filesystem::path(boot_entry).filename().string() +
         "\n";
}

}  // namespace

std::string grub_fragment_contents(const std::string& kernel_command) {
  return "GRUB_CMDLINE_LINUX_DEFAULT=\"" + kernel_command + "\"";
}

bool write_grub_fragment(const std::string& path,
                         const std::string& kernel_command,
                         std::string& error) {
  if (!mkdir_all(parent_dir(path), kBootDirMode, error)) {
    return false;
  }
  if (!write_file(path, grub_fragment_contents(kernel_command), kBootFileMode,
                  error)) {
    error = "failed to write kernel parameters to " + path + ": " + error;
    return false;
  }
  std::cout << "Kernel args: wrote " << path << std::endl;
  return true;
}

bool refresh_grub(CommandExecutor& executor, std::string& error) {
  const auto result = executor.execute({kUpdateGrubCmd});
  if (!result.ok()) {
    error = "failed to update grub: " + result.error;
    if (!trim(result.stderr_text).empty()) {
      error += ": " + trim(result.stderr_text);
    }
    return false;
  }
  return true;
}

std::optional<std::string> find_efi_kernel(const std::string& dir,
                                           std::string& error) {
  auto entries = list_directory(dir, error);
  if (!entries) {
    return std::nullopt;
  }
  std::sort(entries->begin(), entries->end());
  for (const auto& name : *entries) {
    if (startsWith(name, "linux-") && endsWith(name, ".efi")) {
      return name;
    }
  }
  error = "no EFI kernel file found in " + dir;
  return std::nullopt;
}

std::string new_boot_entry(const std::string& efi_file,
                           const std::string& current_cmdline,
                           const std::string& kernel_command) {
  return std::string("title   ") + kBootEntryTitle + "\n" +
         "linux   /EFI/Linux/" + efi_file + "\n" + "options " +
         current_cmdline + " " + kernel_command + "\n" + "# " +
         current_cmdline + "\n";
}

std::optional<std::string> update_boot_entry(const std::string& existing,
                                             const std::string& kernel_command,
                                             std::string& error) {
  auto lines = split(existing, '\n');
  if (lines.size() < 4) {
    error = "unexpected format in boot entry";
    return std::nullopt;
  }
  auto original = trim(lines[3]);
  if (startsWith(original, "# ")) {
    original = original.substr(2);
  }
  lines[2] = "options " + original + " " + kernel_command;
  return join(lines, "\n");
}

bool write_boot_entry(const Paths& paths, const std::string& kernel_command,
                      std::string& error) {
  std::string contents;
  if (file_exists(paths.boot_entry)) {
    std::cout << "Kernel args: updating " << paths.boot_entry << std::endl;
    const auto existing = read_file(paths.boot_entry, error);
    if (!existing) {
      return false;
    }
    auto updated = update_boot_entry(*existing, kernel_command, error);
    if (!updated) {
      error += " " + paths.boot_entry;
      return false;
    }
    contents = std::move(*updated);
  } else {
    const auto cmdline = read_file(paths.proc_cmdline, error);
    if (!cmdline) {
      error = "failed to read " + paths.proc_cmdline + ": " + error;
      return false;
    }
    const auto efi_file = find_efi_kernel(paths.efi_linux_dir, error);
    if (!efi_file) {
      return false;
    }
    std::cout << "Kernel args: creating " << paths.boot_entry << std::endl;
    if (!mkdir_all(parent_dir(paths.boot_entry), kBootDirMode, error)) {
      return false;
    }
    contents = new_boot_entry(*efi_file, trim(*cmdline), kernel_command);
  }

  if (!write_file(paths.boot_entry, contents, kBootFileMode, error)) {
    return false;
  }
  if (!file_exists(paths.loader_conf)) {
    std::cout << "Kernel args: creating " << paths.loader_conf << std::endl;
    if (!write_file(paths.loader_conf,
                    loader_default_contents(paths.boot_entry), kBootFileMode,
                    error)) {
      return false;
    }
  }
  return true;
}

}  // namespace inbd
