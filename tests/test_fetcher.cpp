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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "inbd_fetcher.h"
#include "test_helpers.h"

namespace inbd {
namespace {

using test::http_response;
using test::make_jwt;
using test::MockHttpTransport;
using test::serve_body;
using test::TempDir;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::StrictMock;

constexpr const char* kUrl = "https://repo.example.com/images/a.raw";
constexpr const char* kToken = "opaque-bearer";

std::string header_value(const HttpRequest& request, const std::string& name) {
  for (const auto& [key, value] : request.headers) {
    if (key == name) {
      return value;
    }
  }
  return {};
}

HttpResponse transport_error(const std::string& message) {
  HttpResponse response;
  response.error = message;
  return response;
}

class FetcherTest : public ::testing::Test {
 protected:
  StrictMock<MockHttpTransport> http_;
  ArtifactFetcher fetcher_{http_};
};

TEST_F(FetcherTest, SizeFromHeadContentLength) {
  HttpRequest sent;
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Head)))
      .WillOnce(DoAll(SaveArg<0>(&sent),
                      Return(http_response(200, {{"content-length", "1234"}}))));
  std::string error;
  EXPECT_EQ(fetcher_.size(kUrl, kToken, error), 1234);
  EXPECT_EQ(header_value(sent, "Authorization"), "Bearer opaque-bearer");
  EXPECT_TRUE(sent.verify_tls);
}

TEST_F(FetcherTest, UnauthorizedHeadFallsBackToRangeRequest) {
  InSequence seq;
  HttpRequest ranged;
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Head)))
      .WillOnce(Return(http_response(401)));
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Get)))
      .WillOnce(DoAll(SaveArg<0>(&ranged),
                      Return(http_response(
                          206, {{"content-range", "bytes 0-0/54321"}}))));
  std::string error;
  EXPECT_EQ(fetcher_.size(kUrl, kToken, error), 54321) << error;
  EXPECT_EQ(header_value(ranged, "Range"), "bytes=0-0");
  EXPECT_EQ(header_value(ranged, "Authorization"), "Bearer opaque-bearer");
  EXPECT_TRUE(ranged.headers_only);
}

TEST_F(FetcherTest, RangeIgnoredByServerUsesContentLength) {
  InSequence seq;
  HttpRequest ranged;
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Head)))
      .WillOnce(Return(http_response(405)));
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Get)))
      .WillOnce(DoAll(SaveArg<0>(&ranged),
                      Return(http_response(200, {{"content-length", "777"}}))));
  std::string error;
  EXPECT_EQ(fetcher_.size(kUrl, kToken, error), 777) << error;
  EXPECT_TRUE(ranged.headers_only);
  EXPECT_LT(ranged.output_fd, 0);
}

TEST_F(FetcherTest, DownloadAfterRangeRequestKeepsBearer) {
  TempDir dir;
  InSequence seq;
  HttpRequest download;
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Head)))
      .WillOnce(Return(http_response(401)));
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Get)))
      .WillOnce(Return(
          http_response(206, {{"content-range", "bytes 0-0/54321"}})));
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Get)))
      .WillOnce(DoAll(SaveArg<0>(&download),
                      Invoke(serve_body(200, "image-bytes"))));

  std::string error;
  ASSERT_EQ(fetcher_.size(kUrl, kToken, error), 54321) << error;
  const auto path = fetcher_.download(kUrl, dir.file("sota"), kToken, error);
  ASSERT_TRUE(path) << error;
  EXPECT_EQ(*path, dir.file("sota/a.raw"));
  EXPECT_EQ(dir.read("sota/a.raw"), "image-bytes");
  EXPECT_EQ(header_value(download, "Authorization"), "Bearer opaque-bearer");
  EXPECT_TRUE(header_value(download, "Range").empty());
  EXPECT_FALSE(download.headers_only);
}

TEST_F(FetcherTest, ChunkedResponseWithoutLengthIsAnError) {
  InSequence seq;
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Head)))
      .WillOnce(Return(http_response(200, {{"transfer-encoding", "chunked"}})));
  EXPECT_CALL(http_, perform(Field(&HttpRequest::method, HttpMethod::Get)))
      .WillOnce(Return(http_response(200, {{"transfer-encoding", "chunked"}})));
  std::string error;
  EXPECT_FALSE(fetcher_.size(kUrl, kToken, error));
  EXPECT_THAT(error, HasSubstr("Content-Length header is missing"));
}

TEST_F(FetcherTest, RejectedBearerTriesAlternateAuthentication) {
  InSequence seq;
  HttpRequest accepted;
  EXPECT_CALL(http_, perform(_)).WillOnce(Return(http_response(401)));
  EXPECT_CALL(http_, perform(_)).WillOnce(Return(http_response(401)));
  // X-JFrog-Art-Api is refused, X-API-Key is accepted.
  EXPECT_CALL(http_, perform(_)).WillOnce(Return(http_response(401)));
  EXPECT_CALL(http_, perform(_))
      .WillOnce(DoAll(SaveArg<0>(&accepted),
                      Return(http_response(200, {{"content-length", "99"}}))));
  std::string error;
  EXPECT_EQ(fetcher_.size(kUrl, kToken, error), 99) << error;
  EXPECT_EQ(header_value(accepted, "X-API-Key"), kToken);
}

TEST_F(FetcherTest, AlternateAuthenticationExhausted) {
  const auto attempts = fallback_auth_requests(kUrl, kToken).size();
  EXPECT_CALL(http_, perform(_))
      .Times(static_cast<int>(attempts + 2))
      .WillRepeatedly(Return(http_response(401)));
  std::string error;
  EXPECT_FALSE(fetcher_.size(kUrl, kToken, error));
  EXPECT_EQ(error, "basic Auth HEAD request failed with status code: 401");
}

TEST_F(FetcherTest, AnonymousUnauthorizedDoesNotFallBack) {
  EXPECT_CALL(http_, perform(_)).Times(2).WillRepeatedly(Return(http_response(401)));
  std::string error;
  EXPECT_FALSE(fetcher_.size(kUrl, "", error));
  EXPECT_EQ(error, "size request failed with status code: 401");
}

TEST_F(FetcherTest, TransportErrorStopsSizeCheck) {
  EXPECT_CALL(http_, perform(_))
      .WillOnce(Return(transport_error("SSL certificate problem")));
  std::string error;
  EXPECT_FALSE(fetcher_.size(kUrl, kToken, error));
  EXPECT_EQ(error, "HEAD request failed: SSL certificate problem");
}

TEST_F(FetcherTest, DownloadRetriesWithoutAuthentication) {
  TempDir dir;
  InSequence seq;
  HttpRequest retry;
  EXPECT_CALL(http_, perform(_)).WillOnce(Invoke(serve_body(403, "denied")));
  EXPECT_CALL(http_, perform(_))
      .WillOnce(DoAll(SaveArg<0>(&retry), Invoke(serve_body(200, "payload"))));
  std::string error;
  const auto path = fetcher_.download(kUrl, dir.path(), kToken, error);
  ASSERT_TRUE(path) << error;
  EXPECT_EQ(dir.read("a.raw"), "payload");
  EXPECT_TRUE(header_value(retry, "Authorization").empty());
}

TEST_F(FetcherTest, FailedDownloadLeavesNoPartialFile) {
  TempDir dir;
  EXPECT_CALL(http_, perform(_)).WillOnce(Invoke(serve_body(404, "missing")));
  std::string error;
  EXPECT_FALSE(fetcher_.download(kUrl, dir.path(), "", error));
  EXPECT_EQ(error, "download failed with status code: 404");
  EXPECT_FALSE(dir.exists("a.raw"));
}

TEST_F(FetcherTest, DownloadNeedsAFileName) {
  TempDir dir;
  std::string error;
  EXPECT_FALSE(fetcher_.download("https://repo.example.com/", dir.path(), "", error));
  EXPECT_EQ(error, "cannot derive a file name from https://repo.example.com/");
}

TEST(FetcherHelpersTest, AnonymousRequestsMaySkipVerification) {
  const auto anonymous = make_http_request(HttpMethod::Get, kUrl, "");
  EXPECT_FALSE(anonymous.verify_tls);
  EXPECT_TRUE(anonymous.headers.empty());
  const auto bearer = make_http_request(HttpMethod::Head, kUrl, kToken);
  EXPECT_TRUE(bearer.verify_tls);
  EXPECT_EQ(header_value(bearer, "Authorization"), "Bearer opaque-bearer");
}

TEST(FetcherHelpersTest, FallbackSequenceAddsJwtUsernames) {
  const auto opaque = fallback_auth_requests(kUrl, kToken);
  ASSERT_EQ(opaque.size(), 15u);
  EXPECT_EQ(header_value(opaque[0], "X-JFrog-Art-Api"), kToken);
  EXPECT_EQ(header_value(opaque[3], "Authorization"), std::string("Token ") + kToken);
  ASSERT_TRUE(opaque.back().basic_auth);
  EXPECT_EQ(opaque.back().basic_auth->first, kToken);
  for (const auto& request : opaque) {
    EXPECT_EQ(request.method, HttpMethod::Head);
    EXPECT_TRUE(request.verify_tls);
  }

  const auto jwt = make_jwt({{"sub", "node-1"}, {"email", "ops@example.com"}});
  const auto with_claims = fallback_auth_requests(kUrl, jwt);
  ASSERT_EQ(with_claims.size(), 17u);
  EXPECT_EQ(with_claims[15].basic_auth->first, "node-1");
  EXPECT_EQ(with_claims[16].basic_auth->first, "ops@example.com");
}

TEST(FetcherHelpersTest, ArtifactFileName) {
  EXPECT_EQ(artifact_file_name("https://h/dir/a.raw?sig=1#x"), "a.raw");
  EXPECT_EQ(artifact_file_name("https://h/dir/a%20b.raw"), "a b.raw");
  EXPECT_EQ(artifact_file_name("https://h/"), "");
  EXPECT_EQ(artifact_file_name("::"), "");
}

TEST(FetcherHelpersTest, ContentRangeTotal) {
  EXPECT_EQ(parse_content_range_total("bytes 0-0/54321"), 54321);
  EXPECT_FALSE(parse_content_range_total("bytes 0-0/*"));
  EXPECT_FALSE(parse_content_range_total("bytes 0-0"));
}

}  // namespace
}  // namespace inbd
