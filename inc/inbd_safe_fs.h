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

#ifndef INBD_SAFE_FS_H
#define INBD_SAFE_FS_H

#include <sys/types.h>

#include <optional>
#include <string>
#include <vector>

namespace inbd {

// Owns a file descriptor and closes it on destruction.
class FileHandle {
 public:
  FileHandle() = default;
  explicit FileHandle(int fd) : fd_(fd) {}
  ~FileHandle();

  FileHandle(FileHandle&& other) noexcept;
  FileHandle& operator=(FileHandle&& other) noexcept;
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1);

 private:
  int fd_ = -1;
};

// A file created by create_temp. The caller renames or removes it.
struct TempFile {
  FileHandle handle;
  std::string path;
};

// Lexically normalizes an absolute path. Returns an empty string for
// relative paths.
std::string clean_path(const std::string& path);

// Checks that path is absolute, lies under an allowlisted root and has no
// symlinks on its existing components. A directory may equal a root, a file
// may not (DMI roots excepted).
bool is_path_allowed(const std::string& path, bool is_directory,
                     std::string& error);

// Opens a regular file after validation and verifies the descriptor's real
// path against the requested one.
FileHandle open_file(const std::string& path, int flags, mode_t mode,
                     std::string& error);

std::optional<std::string> read_file(const std::string& path,
                                     std::string& error);

// Replaces path atomically: temp sibling, write, fsync, rename.
bool write_file(const std::string& path, const std::string& data, mode_t mode,
                std::string& error);

bool mkdir_all(const std::string& path, mode_t mode, std::string& error);

// Removes a regular file. A missing file is not an error.
bool remove_file(const std::string& path, std::string& error);

// Creates a unique file in dir. pattern must end in "XXXXXX".
std::optional<TempFile> create_temp(const std::string& dir,
                                    const std::string& pattern,
                                    std::string& error);

// Lists entry names of a directory.
std::optional<std::vector<std::string>> list_directory(const std::string& dir,
                                                       std::string& error);

// Returns true when path exists (validated, symlinks not followed).
bool file_exists(const std::string& path);

// Size of a regular file, or nullopt if absent or not allowed.
std::optional<off_t> file_size(const std::string& path);

bool is_btrfs(const std::string& path);

}  // namespace inbd

#endif  // INBD_SAFE_FS_H
