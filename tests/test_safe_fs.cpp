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

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>

#include <gtest/gtest.h>

#include "inbd_safe_fs.h"
#include "test_helpers.h"

namespace inbd {
namespace {

using test::TempDir;

TEST(SafeFsTest, CleanPathNormalizesAbsolutePaths) {
  EXPECT_EQ(clean_path("/etc//default/./grub.d/"), "/etc/default/grub.d");
  EXPECT_EQ(clean_path("/var/log/../log/x"), "/var/log/x");
  EXPECT_EQ(clean_path("relative/path"), "");
  EXPECT_EQ(clean_path(""), "");
}

TEST(SafeFsTest, RejectsPathsOutsideAllowedRoots) {
  std::string error;
  EXPECT_FALSE(is_path_allowed("/home/user/file", false, error));
  EXPECT_EQ(error, "path is outside the allowed directories: /home/user/file");
  EXPECT_FALSE(is_path_allowed("/etcetera/file", false, error));
  EXPECT_FALSE(is_path_allowed("/tmp/../root/.ssh/id_rsa", false, error));
  EXPECT_FALSE(is_path_allowed("tmp/file", false, error));
  EXPECT_EQ(error, "path must be absolute: tmp/file");
}

TEST(SafeFsTest, AllowedRootIsNotAFile) {
  std::string error;
  EXPECT_FALSE(is_path_allowed("/etc", false, error));
  EXPECT_EQ(error, "path is an allowed base directory, not a file: /etc");
  EXPECT_TRUE(is_path_allowed("/etc", true, error));
  EXPECT_TRUE(is_path_allowed("/boot/efi/loader/loader.conf", false, error));
}

TEST(SafeFsTest, RejectsSymlinkInTraversal) {
  TempDir dir;
  dir.write("real/file", "secret");
  std::filesystem::create_directory_symlink(dir.file("real"), dir.file("link"));

  std::string error;
  EXPECT_FALSE(is_path_allowed(dir.file("link/file"), false, error));
  EXPECT_EQ(error, "symlink not allowed in path: " + dir.file("link"));
  EXPECT_FALSE(read_file(dir.file("link/file"), error));
  EXPECT_TRUE(read_file(dir.file("real/file"), error));
}

TEST(SafeFsTest, RejectsSymlinkAsFinalComponent) {
  TempDir dir;
  dir.write("target", "data");
  std::filesystem::create_symlink(dir.file("target"), dir.file("alias"));

  std::string error;
  EXPECT_FALSE(write_file(dir.file("alias"), "new", 0644, error));
  EXPECT_EQ(dir.read("target"), "data");
  EXPECT_FALSE(remove_file(dir.file("alias"), error));
  EXPECT_TRUE(std::filesystem::exists(dir.file("target")));
}

TEST(SafeFsTest, WriteIsAtomicAndSetsMode) {
  TempDir dir;
  std::string error;
  ASSERT_TRUE(write_file(dir.file("state"), "{\"a\":1}", 0640, error)) << error;
  ASSERT_TRUE(write_file(dir.file("state"), "{\"a\":2}", 0640, error)) << error;
  EXPECT_EQ(dir.read("state"), "{\"a\":2}");

  struct stat st {};
  ASSERT_EQ(::stat(dir.file("state").c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0640u);

  // No temp files are left next to the target.
  const auto entries = list_directory(dir.path(), error);
  ASSERT_TRUE(entries);
  EXPECT_EQ(*entries, std::vector<std::string>{"state"});
}

TEST(SafeFsTest, ReadsWholeFile) {
  TempDir dir;
  const std::string big(20000, 'x');
  dir.write("big", big);
  std::string error;
  const auto content = read_file(dir.file("big"), error);
  ASSERT_TRUE(content) << error;
  EXPECT_EQ(*content, big);
}

TEST(SafeFsTest, OpenVerifiesRegularFile) {
  TempDir dir;
  std::filesystem::create_directories(dir.file("subdir"));
  std::string error;
  auto handle = open_file(dir.file("subdir"), O_RDONLY, 0, error);
  EXPECT_FALSE(handle.valid());
  EXPECT_EQ(error, "not a regular file: " + dir.file("subdir"));
}

TEST(SafeFsTest, FileHandleClosesOnMove) {
  TempDir dir;
  dir.write("f", "x");
  std::string error;
  auto handle = open_file(dir.file("f"), O_RDONLY, 0, error);
  ASSERT_TRUE(handle.valid()) << error;
  const int fd = handle.get();
  FileHandle moved(std::move(handle));
  EXPECT_FALSE(handle.valid());
  EXPECT_EQ(moved.get(), fd);
  moved.reset();
  EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
}

TEST(SafeFsTest, MkdirAllAndRemove) {
  TempDir dir;
  std::string error;
  ASSERT_TRUE(mkdir_all(dir.file("a/b/c"), 0755, error)) << error;
  EXPECT_TRUE(std::filesystem::is_directory(dir.file("a/b/c")));
  dir.write("a/file", "x");
  EXPECT_FALSE(mkdir_all(dir.file("a/file/d"), 0755, error));
  EXPECT_EQ(error, "not a directory: " + dir.file("a/file"));

  EXPECT_TRUE(remove_file(dir.file("a/file"), error));
  EXPECT_FALSE(file_exists(dir.file("a/file")));
  // Removing a missing file is not an error.
  EXPECT_TRUE(remove_file(dir.file("a/file"), error));
  EXPECT_FALSE(remove_file(dir.file("a/b"), error));
}

TEST(SafeFsTest, CreateTempValidatesPattern) {
  TempDir dir;
  std::string error;
  EXPECT_FALSE(create_temp(dir.path(), "bad", error));
  EXPECT_FALSE(create_temp(dir.path(), "../XXXXXX", error));
  auto temp = create_temp(dir.path(), "download.XXXXXX", error);
  ASSERT_TRUE(temp) << error;
  EXPECT_TRUE(temp->handle.valid());
  EXPECT_EQ(std::filesystem::path(temp->path).parent_path().string(), dir.path());
}

TEST(SafeFsTest, FileSize) {
  TempDir dir;
  dir.write("sized", std::string(123, 'a'));
  EXPECT_EQ(file_size(dir.file("sized")), 123);
  EXPECT_FALSE(file_size(dir.file("missing")));
}

}  // namespace
}  // namespace inbd
