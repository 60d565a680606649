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

#include "inbd_apt_source.h"

#include <sys/stat.h>

#include <iostream>

#include "inbd_safe_fs.h"
#include "inbd_source.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

constexpr mode_t kSourceFileMode = 0644;
constexpr mode_t kSourceDirMode = 0755;

std::string source_lines(const std::vector<std::string>& sources) {
  std::string contents;
  for (const auto& line : sources) {
    contents += line + "\n";
  }
  return contents;
}

}  // namespace

bool is_plain_file_name(const std::string& name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string::npos &&
         name.find('\0') == std::string::npos;
}

bool update_os_source(const Paths& paths,
                      const std::vector<std::string>& sources,
                      std::string& error) {
  const auto current = read_file(paths.apt_sources_list, error);
  if (!current) {
    error = "failed to backup sources list: " + error;
    return false;
  }
  if (!write_file(paths.apt_sources_list + ".bak", *current, kSourceFileMode,
                  error)) {
    error = "failed to backup sources list: " + error;
    return false;
  }
  if (!write_file(paths.apt_sources_list, source_lines(sources),
                  kSourceFileMode, error)) {
    error = "failed to write sources list: " + error;
    return false;
  }
  std::cout << "Sources: replaced " << paths.apt_sources_list << " with "
            << sources.size() << " entries" << std::endl;
  return true;
}

ApplicationSourceManager::ApplicationSourceManager(AgentContext& agent)
    : agent_(agent) {}

bool ApplicationSourceManager::install_gpg_key(const std::string& uri,
                                               const std::string& name,
                                               std::string& error) {
  if (!mkdir_all(agent_.paths.artifact_dir, kSourceDirMode, error)) {
    return false;
  }
  auto temp = create_temp(agent_.paths.artifact_dir, "gpgkey-XXXXXX", error);
  if (!temp) {
    return false;
  }

  HttpRequest request;
  request.method = HttpMethod::Get;
  request.url = uri;
  request.output_fd = temp->handle.get();
  const auto response = agent_.http.perform(request);
  temp->handle.reset();

  std::string remove_error;
  if (!response.error.empty() || response.status != 200) {
    if (!remove_file(temp->path, remove_error)) {
      std::cerr << "Sources: " << remove_error << std::endl;
    }
    if (!response.error.empty()) {
      error = "error getting GPG key: " + response.error;
    } else {
      error = "error getting GPG key. Status code: " +
              std::to_string(response.status) + ". Expected 200/Success";
    }
    return false;
  }

  const auto key_path = agent_.paths.keyring_dir + "/" + name;
  const auto result = agent_.executor.execute({kGpgCmd, "--batch", "--yes",
                                               "--dearmor", "--output",
                                               key_path, temp->path});
  if (!remove_file(temp->path, remove_error)) {
    std::cerr << "Sources: " << remove_error << std::endl;
  }
  if (!result.ok()) {
    error = "error dearmoring GPG key: " + result.error;
    if (!result.stderr_text.empty()) {
      error += ", stderr: " + trim(result.stderr_text);
    }
    return false;
  }
  std::cout << "Sources: GPG key added to " << key_path << std::endl;
  return true;
}

bool ApplicationSourceManager::add(const ApplicationSource& source,
                                   std::string& error) {
  if (!source.gpg_key_uri.empty() && !source.gpg_key_name.empty()) {
    std::string config_error;
    const auto repositories = agent_.config.trusted_repositories(config_error);
    if (!config_error.empty()) {
      error = "error loading config: " + config_error;
      return false;
    }
    if (!is_trusted(source.gpg_key_uri, repositories)) {
      error =
          "GPG key URI verification failed. URI is not in the list of trusted "
          "repositories";
      return false;
    }
    if (!install_gpg_key(source.gpg_key_uri, source.gpg_key_name, error)) {
      return false;
    }
  }

  if (!mkdir_all(agent_.paths.apt_sources_dir, kSourceDirMode, error)) {
    return false;
  }
  const auto path = agent_.paths.apt_sources_dir + "/" + source.filename;
  if (!write_file(path, source_lines(source.sources), kSourceFileMode,
                  error)) {
    error = "error writing to source list file: " + error;
    return false;
  }
  std::cout << "Sources: added " << path << std::endl;
  return true;
}

bool ApplicationSourceManager::remove(const std::string& filename,
                                      const std::string& gpg_key_name,
                                      std::string& error) {
  if (!gpg_key_name.empty()) {
    const auto key_path = agent_.paths.keyring_dir + "/" + gpg_key_name;
    if (file_exists(key_path)) {
      if (!remove_file(key_path, error)) {
        error = "error removing GPG key: " + error;
        return false;
      }
      std::cout << "Sources: GPG key removed: " << key_path << std::endl;
    } else {
      std::cerr << "Sources: GPG key does not exist: " << key_path
                << std::endl;
    }
  }

  const auto path = agent_.paths.apt_sources_dir + "/" + filename;
  if (!file_exists(path)) {
    error = "source file does not exist: " + path;
    return false;
  }
  if (!remove_file(path, error)) {
    error = "error removing application source file: " + error;
    return false;
  }
  std::cout << "Sources: removed " << path << std::endl;
  return true;
}

}  // namespace inbd
