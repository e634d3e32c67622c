#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "poz/api/request_builder.hpp"
#include "test_helpers.hpp"

using namespace poz::api;
using namespace poz::core;
using namespace poz::test;
using poz::ErrorCode;

namespace {

std::string header(const poz::util::HttpRequest& request, const std::string& name) {
  for (const auto& [key, value] : request.headers) {
    if (key == name) return value;
  }
  return "";
}

}  // namespace

class RequestBuilderTest : public ::testing::Test {
protected:
  RequestBuilderTest() : builder_(config_) {
    body_.content = "hello";
    body_.captured_at = 1700000000;
  }

  poz::config::Config config_ = makeConfig(true);
  RequestBuilder builder_;
  NoteBody body_;
};

TEST_F(RequestBuilderTest, CreateNoteRequest) {
  auto request = builder_.build(CreateNote{}, &body_);
  ASSERT_OK(request);

  EXPECT_EQ(request->http.method, "POST");
  EXPECT_EQ(request->http.url, "https://notes.example.com/api/v1/notes");
  EXPECT_EQ(request->shape, ResponseShape::kCreated);
  EXPECT_EQ(request->http.body,
            R"({"content":"hello","heading":"cli-1700000000","type":"markdown","workspace":"Clip"})");
}

TEST_F(RequestBuilderTest, CreateNoteWithTags) {
  body_.tags = {"work", "ideas", "work"};
  auto request = builder_.build(PostFromClipboard{}, &body_);
  ASSERT_OK(request);

  auto payload = nlohmann::json::parse(request->http.body);
  EXPECT_EQ(payload["tags"], nlohmann::json({"work", "ideas", "work"}));
}

TEST_F(RequestBuilderTest, BurnUsesCreateShape) {
  auto burn = builder_.build(Burn{}, &body_);
  auto create = builder_.build(CreateNote{}, &body_);
  ASSERT_OK(burn);
  ASSERT_OK(create);
  EXPECT_EQ(*burn, *create);
}

TEST_F(RequestBuilderTest, HeadersCarryAuthAndUserScope) {
  auto request = builder_.build(CreateNote{}, &body_);
  ASSERT_OK(request);

  // base64("alice:s3cret")
  EXPECT_EQ(header(request->http, "Authorization"), "Basic YWxpY2U6czNjcmV0");
  EXPECT_EQ(header(request->http, "X-User-ID"), "7");
  EXPECT_EQ(header(request->http, "Content-Type"), "application/json");
  EXPECT_EQ(header(request->http, "Accept"), "application/json");
}

TEST_F(RequestBuilderTest, ListLastRequest) {
  auto request = builder_.build(ListLast{});
  ASSERT_OK(request);

  EXPECT_EQ(request->http.method, "GET");
  EXPECT_EQ(request->http.url, "https://notes.example.com/api/v1/notes?workspace=Clip");
  EXPECT_TRUE(request->http.body.empty());
  EXPECT_EQ(header(request->http, "Content-Type"), "");
  EXPECT_EQ(request->shape, ResponseShape::kListing);
}

TEST_F(RequestBuilderTest, SearchEncodesQuery) {
  auto request = builder_.build(Search{"foo bar&baz"});
  ASSERT_OK(request);
  EXPECT_EQ(request->http.url,
            "https://notes.example.com/api/v1/notes?workspace=Clip&search=foo%20bar%26baz");
}

TEST_F(RequestBuilderTest, UpdateRequest) {
  auto request = builder_.build(Update{"42"}, &body_);
  ASSERT_OK(request);

  EXPECT_EQ(request->http.method, "PATCH");
  EXPECT_EQ(request->http.url, "https://notes.example.com/api/v1/notes/42");
  EXPECT_EQ(request->http.body, R"({"content":"hello"})");
  EXPECT_EQ(request->target_id, "42");
  EXPECT_EQ(request->shape, ResponseShape::kUpdated);
}

TEST_F(RequestBuilderTest, DeleteRequest) {
  auto request = builder_.build(Delete{"42"});
  ASSERT_OK(request);

  EXPECT_EQ(request->http.method, "DELETE");
  EXPECT_EQ(request->http.url, "https://notes.example.com/api/v1/notes/42");
  EXPECT_TRUE(request->http.body.empty());
  EXPECT_EQ(request->target_id, "42");
  EXPECT_EQ(request->shape, ResponseShape::kDeleted);
}

TEST_F(RequestBuilderTest, BodyActionsWithoutBodyFail) {
  EXPECT_ERROR(builder_.build(CreateNote{}), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(builder_.build(Update{"1"}), ErrorCode::kInvalidArgument);
}

TEST_F(RequestBuilderTest, Deterministic) {
  body_.tags = {"a"};
  body_.content = "line \"one\"\nline two";
  auto first = builder_.build(CreateNote{}, &body_);
  auto second = builder_.build(CreateNote{}, &body_);
  ASSERT_OK(first);
  ASSERT_OK(second);
  EXPECT_EQ(*first, *second);
  EXPECT_EQ(RequestBuilder::renderCurl(first->http), RequestBuilder::renderCurl(second->http));
}

TEST_F(RequestBuilderTest, NoteUrl) {
  EXPECT_EQ(builder_.noteUrl("42"), "https://notes.example.com/index.php?workspace=Clip&note=42");

  config_.workspace = "My Notes";
  EXPECT_EQ(builder_.noteUrl("42"), "https://notes.example.com/index.php?workspace=My%20Notes&note=42");
}

TEST_F(RequestBuilderTest, RenderCurlMatchesRequest) {
  auto request = builder_.build(CreateNote{}, &body_);
  ASSERT_OK(request);

  EXPECT_EQ(RequestBuilder::renderCurl(request->http),
            "curl -X POST 'https://notes.example.com/api/v1/notes'"
            " -H 'Authorization: Basic <redacted>'"
            " -H 'X-User-ID: 7'"
            " -H 'Accept: application/json'"
            " -H 'Content-Type: application/json'"
            " -d '{\"content\":\"hello\",\"heading\":\"cli-1700000000\",\"type\":\"markdown\",\"workspace\":\"Clip\"}'");
}

TEST_F(RequestBuilderTest, RenderCurlNeverLeaksCredentials) {
  auto request = builder_.build(Delete{"9"});
  ASSERT_OK(request);

  auto rendered = RequestBuilder::renderCurl(request->http);
  EXPECT_EQ(rendered.find("s3cret"), std::string::npos);
  EXPECT_EQ(rendered.find("YWxpY2U6czNjcmV0"), std::string::npos);
  EXPECT_EQ(rendered.find(" -d "), std::string::npos);
}

TEST_F(RequestBuilderTest, RenderCurlEscapesSingleQuotes) {
  body_.content = "it's";
  auto request = builder_.build(Update{"1"}, &body_);
  ASSERT_OK(request);
  EXPECT_NE(RequestBuilder::renderCurl(request->http).find(R"(-d '{"content":"it'\''s"}')"),
            std::string::npos);
}

TEST_F(RequestBuilderTest, InvalidUtf8ContentIsReplaced) {
  body_.content = "caf\xE9 latin-1";
  auto create = builder_.build(CreateNote{}, &body_);
  ASSERT_OK(create);
  auto payload = nlohmann::json::parse(create->http.body);
  EXPECT_EQ(payload["content"], "caf\xEF\xBF\xBD latin-1");

  auto update = builder_.build(Update{"42"}, &body_);
  ASSERT_OK(update);
  EXPECT_EQ(update->http.body, "{\"content\":\"caf\xEF\xBF\xBD latin-1\"}");
}
