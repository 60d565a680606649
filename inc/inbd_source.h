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

#ifndef INBD_SOURCE_H
#define INBD_SOURCE_H

#include <string>
#include <vector>

namespace inbd {

// Requires a parseable https URL with a host.
bool validate_url(const std::string& url, std::string& error);

// Drops the query string and fragment of a URL.
std::string strip_query_and_fragment(const std::string& url);

// True when some trusted repository is a prefix of url (query and fragment
// ignored). An empty url is never trusted.
bool is_trusted(const std::string& url,
                const std::vector<std::string>& trusted_repositories);

}  // namespace inbd

#endif  // INBD_SOURCE_H
