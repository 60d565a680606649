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

#include "inbd_safe_fs.h"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/vfs.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>
#include <utility>

namespace inbd {
namespace {

// Roots under which the daemon may read or write.
constexpr const char* kAllowedRoots[] = {
    "/etc",
    "/tmp",
    "/usr/share",
    "/usr/bin",
    "/usr/sbin",
    "/opt",
    "/var/cache/manageability",
    "/var/intel-manageability",
    "/var/log",
    "/sys/class/dmi/id",
    "/sys/devices/virtual/dmi/id",
    "/proc",
    "/boot/efi",
};

// sysfs exposes these through symlinks, so they skip the symlink checks.
constexpr const char* kDmiRoots[] = {
    "/sys/class/dmi/id",
    "/sys/devices/virtual/dmi/id",
};

constexpr long kBtrfsSuperMagic = 0x9123683E;

bool has_root_prefix(const std::string& path, const std::string& root) {
  if (path == root) {
    return true;
  }
  return path.size() > root.size() &&
         path.compare(0, root.size(), root) == 0 && path[root.size()] == '/';
}

bool is_dmi_path(const std::string& path) {
  for (const auto* root : kDmiRoots) {
    if (has_root_prefix(path, root)) {
      return true;
    }
  }
  return false;
}

std::string errno_message(const std::string& what, const std::string& path) {
  return what + " " + path + ": " + std::strerror(errno);
}

// lstat-walks every existing component; stops at the first missing one.
bool check_no_symlinks(const std::string& clean, std::string& error) {
  std::string current;
  std::string::size_type start = 1;
  while (start <= clean.size()) {
    auto end = clean.find('/', start);
    if (end == std::string::npos) {
      end = clean.size();
    }
    current += "/" + clean.substr(start, end - start);
    start = end + 1;

    struct stat st {};
    if (::lstat(current.c_str(), &st) != 0) {
      if (errno == ENOENT) {
        return true;
      }
      error = errno_message("lstat", current);
      return false;
    }
    if (S_ISLNK(st.st_mode)) {
      error = "symlink not allowed in path: " + current;
      return false;
    }
  }
  return true;
}

std::string fd_real_path(int fd) {
  const std::string link = "/proc/self/fd/" + std::to_string(fd);
  char buffer[PATH_MAX];
  const ssize_t len = ::readlink(link.c_str(), buffer, sizeof(buffer) - 1);
  if (len < 0) {
    return {};
  }
  return std::string(buffer, static_cast<std::size_t>(len));
}

bool verify_descriptor(int fd, const std::string& clean, std::string& error) {
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    error = errno_message("fstat", clean);
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    error = "not a regular file: " + clean;
    return false;
  }
  if (is_dmi_path(clean)) {
    return true;
  }
  const auto real = fd_real_path(fd);
  if (real != clean) {
    error = "path changed while opening: " + clean + " resolved to " + real;
    return false;
  }
  return true;
}

bool write_all(int fd, const std::string& data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t written =
        ::write(fd, data.data() + offset, data.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    offset += static_cast<std::size_t>(written);
  }
  return true;
}

void sync_directory(const std::string& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd >= 0) {
    (void)::fsync(fd);
    ::close(fd);
  }
}

}  // namespace

FileHandle::~FileHandle() { reset(); }

FileHandle::FileHandle(FileHandle&& other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
  if (this != &other) {
    reset(other.fd_);
    other.fd_ = -1;
  }
  return *this;
}

void FileHandle::reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

std::string clean_path(const std::string& path) {
  if (path.empty() || path[0] != '/') {
    return {};
  }
  std::string clean = std::filesystem::path(path).lexically_normal().string();
  while (clean.size() > 1 && clean.back() == '/') {
    clean.pop_back();
  }
  return clean;
}

bool is_path_allowed(const std::string& path, bool is_directory,
                     std::string& error) {
  const auto clean = clean_path(path);
  if (clean.empty()) {
    error = "path must be absolute: " + path;
    return false;
  }

  const bool dmi = is_dmi_path(clean);
  const char* matched_root = nullptr;
  for (const auto* root : kAllowedRoots) {
    if (has_root_prefix(clean, root)) {
      matched_root = root;
      break;
    }
  }
  if (matched_root == nullptr) {
    error = "path is outside the allowed directories: " + clean;
    return false;
  }
  if (!is_directory && !dmi && clean == matched_root) {
    error = "path is an allowed base directory, not a file: " + clean;
    return false;
  }
  if (dmi) {
    return true;
  }
  return check_no_symlinks(clean, error);
}

FileHandle open_file(const std::string& path, int flags, mode_t mode,
                     std::string& error) {
  if (!is_path_allowed(path, false, error)) {
    return FileHandle{};
  }
  const auto clean = clean_path(path);
  const int fd = ::open(clean.c_str(), flags | O_CLOEXEC | O_NOFOLLOW, mode);
  if (fd < 0) {
    error = errno_message("open", clean);
    return FileHandle{};
  }
  FileHandle handle(fd);
  if (!verify_descriptor(handle.get(), clean, error)) {
    return FileHandle{};
  }
  return handle;
}

std::optional<std::string> read_file(const std::string& path,
                                     std::string& error) {
  auto handle = open_file(path, O_RDONLY, 0, error);
  if (!handle.valid()) {
    return std::nullopt;
  }
  std::string content;
  char buffer[8192];
  while (true) {
    const ssize_t count = ::read(handle.get(), buffer, sizeof(buffer));
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = errno_message("read", path);
      return std::nullopt;
    }
    if (count == 0) {
      break;
    }
    content.append(buffer, static_cast<std::size_t>(count));
  }
  return content;
}

bool write_file(const std::string& path, const std::string& data, mode_t mode,
                std::string& error) {
  if (!is_path_allowed(path, false, error)) {
    return false;
  }
  const std::filesystem::path target(clean_path(path));
  const std::string dir = target.parent_path().string();
  auto temp = create_temp(dir, "." + target.filename().string() + ".XXXXXX",
                          error);
  if (!temp) {
    return false;
  }

  const int fd = temp->handle.get();
  if (!write_all(fd, data) || ::fchmod(fd, mode) != 0 || ::fsync(fd) != 0) {
    error = errno_message("write", temp->path);
    ::unlink(temp->path.c_str());
    return false;
  }
  temp->handle.reset();
  if (::rename(temp->path.c_str(), target.c_str()) != 0) {
    error = errno_message("rename", target.string());
    ::unlink(temp->path.c_str());
    return false;
  }
  sync_directory(dir);
  return true;
}

bool mkdir_all(const std::string& path, mode_t mode, std::string& error) {
  if (!is_path_allowed(path, true, error)) {
    return false;
  }
  const auto clean = clean_path(path);
  std::string current;
  std::string::size_type start = 1;
  while (start <= clean.size()) {
    auto end = clean.find('/', start);
    if (end == std::string::npos) {
      end = clean.size();
    }
    current += "/" + clean.substr(start, end - start);
    start = end + 1;

    struct stat st {};
    if (::lstat(current.c_str(), &st) == 0) {
      if (!S_ISDIR(st.st_mode)) {
        error = "not a directory: " + current;
        return false;
      }
      continue;
    }
    if (::mkdir(current.c_str(), mode) != 0 && errno != EEXIST) {
      error = errno_message("mkdir", current);
      return false;
    }
  }
  return true;
}

bool remove_file(const std::string& path, std::string& error) {
  if (!is_path_allowed(path, false, error)) {
    return false;
  }
  const auto clean = clean_path(path);
  struct stat st {};
  if (::lstat(clean.c_str(), &st) != 0) {
    if (errno == ENOENT) {
      return true;
    }
    error = errno_message("lstat", clean);
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    error = "refusing to remove non-regular file: " + clean;
    return false;
  }
  if (::unlink(clean.c_str()) != 0 && errno != ENOENT) {
    error = errno_message("unlink", clean);
    return false;
  }
  return true;
}

std::optional<TempFile> create_temp(const std::string& dir,
                                    const std::string& pattern,
                                    std::string& error) {
  if (pattern.find('/') != std::string::npos ||
      pattern.size() < 6 ||
      pattern.compare(pattern.size() - 6, 6, "XXXXXX") != 0) {
    error = "invalid temp file pattern: " + pattern;
    return std::nullopt;
  }
  if (!is_path_allowed(dir, true, error)) {
    return std::nullopt;
  }
  std::string name = clean_path(dir) + "/" + pattern;
  const int fd = ::mkostemp(name.data(), O_CLOEXEC);
  if (fd < 0) {
    error = errno_message("mkstemp", name);
    return std::nullopt;
  }
  TempFile temp{FileHandle(fd), name};
  if (!verify_descriptor(fd, name, error)) {
    ::unlink(name.c_str());
    return std::nullopt;
  }
  return std::optional<TempFile>(std::move(temp));
}

std::optional<std::vector<std::string>> list_directory(const std::string& dir,
                                                       std::string& error) {
  if (!is_path_allowed(dir, true, error)) {
    return std::nullopt;
  }
  const auto clean = clean_path(dir);
  const int fd =
      ::open(clean.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
  if (fd < 0) {
    error = errno_message("open", clean);
    return std::nullopt;
  }
  DIR* stream = ::fdopendir(fd);
  if (stream == nullptr) {
    error = errno_message("fdopendir", clean);
    ::close(fd);
    return std::nullopt;
  }
  std::vector<std::string> names;
  while (const dirent* entry = ::readdir(stream)) {
    const std::string name = entry->d_name;
    if (name != "." && name != "..") {
      names.push_back(name);
    }
  }
  ::closedir(stream);
  return names;
}

bool file_exists(const std::string& path) {
  std::string error;
  if (!is_path_allowed(path, false, error)) {
    return false;
  }
  struct stat st {};
  return ::lstat(clean_path(path).c_str(), &st) == 0;
}

std::optional<off_t> file_size(const std::string& path) {
  std::string error;
  if (!is_path_allowed(path, false, error)) {
    return std::nullopt;
  }
  struct stat st {};
  if (::lstat(clean_path(path).c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return std::nullopt;
  }
  return st.st_size;
}

bool is_btrfs(const std::string& path) {
  struct statfs fs {};
  if (::statfs(path.c_str(), &fs) != 0) {
    return false;
  }
  return static_cast<long>(fs.f_type) == kBtrfsSuperMagic;
}

}  // namespace inbd
