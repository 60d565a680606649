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

#include <gtest/gtest.h>

#include "inbd_os.h"
#include "test_helpers.h"

namespace inbd {
namespace {

using test::FakeExecutor;
using test::TempDir;

TEST(OsTest, ClassifiesLsbRelease) {
  EXPECT_EQ(classify_lsb_release("Distributor ID:\tUbuntu\n"), OsFamily::Package);
  EXPECT_EQ(classify_lsb_release("Description:\tEdge Microvisor Toolkit 3.0\n"),
            OsFamily::Image);
  EXPECT_FALSE(classify_lsb_release("Distributor ID:\tDebian\n"));
}

TEST(OsTest, DetectRunsLsbRelease) {
  FakeExecutor executor;
  executor.succeed({kLsbReleaseCmd}, "Distributor ID:\tUbuntu\n");
  std::string error;
  EXPECT_EQ(detect_os_family(executor, error), OsFamily::Package);
  EXPECT_TRUE(executor.ran({kLsbReleaseCmd, "-a"}));

  executor.succeed({kLsbReleaseCmd}, "Distributor ID:\tFedora\n");
  EXPECT_FALSE(detect_os_family(executor, error));
  EXPECT_EQ(error, "unsupported OS: Distributor ID:\tFedora");

  executor.fail({kLsbReleaseCmd}, 127);
  EXPECT_FALSE(detect_os_family(executor, error));
  EXPECT_EQ(error, "failed to detect OS: exited with status 127");
}

TEST(OsTest, ReadsImageBuildDate) {
  TempDir dir;
  dir.write("image-id", "IMAGE_UUID=abc\nIMAGE_BUILD_DATE=\"2025-10-01\"\n");
  std::string error;
  EXPECT_EQ(read_image_build_date(dir.file("image-id"), error), "2025-10-01");

  dir.write("empty-id", "IMAGE_UUID=abc\n");
  EXPECT_FALSE(read_image_build_date(dir.file("empty-id"), error));
  EXPECT_EQ(error, "IMAGE_BUILD_DATE not found in " + dir.file("empty-id"));
}

TEST(OsTest, ReadsOsVersion) {
  TempDir dir;
  dir.write("os-release", "NAME=\"Ubuntu\"\nVERSION=\"22.04.4 LTS\"\nVERSION_ID=\"22.04\"\n");
  std::string error;
  EXPECT_EQ(read_os_version(dir.file("os-release"), error), "22.04");

  dir.write("os-release", "NAME=\"Ubuntu\"\nVERSION=\"22.04.4 LTS\"\n");
  EXPECT_EQ(read_os_version(dir.file("os-release"), error), "22.04.4 LTS");
}

}  // namespace
}  // namespace inbd
