#include <gtest/gtest.h>

#include "poz/util/http_client.hpp"

using poz::util::urlEncode;

TEST(UrlEncodeTest, UnreservedPassThrough) {
  EXPECT_EQ(urlEncode("Poznote-notes_1.2~x"), "Poznote-notes_1.2~x");
}

TEST(UrlEncodeTest, EncodesReserved) {
  EXPECT_EQ(urlEncode("My Notes"), "My%20Notes");
  EXPECT_EQ(urlEncode("a&b=c?d/e#f"), "a%26b%3Dc%3Fd%2Fe%23f");
  EXPECT_EQ(urlEncode("100%"), "100%25");
}

TEST(UrlEncodeTest, EncodesUtf8Bytes) {
  EXPECT_EQ(urlEncode("caf\xc3\xa9"), "caf%C3%A9");
}

TEST(UrlEncodeTest, Empty) {
  EXPECT_EQ(urlEncode(""), "");
}

TEST(UrlEncodeTest, EmptyViewIntoLongerString) {
  std::string text = "abc def";
  EXPECT_EQ(urlEncode(std::string_view(text).substr(3, 0)), "");
  EXPECT_EQ(urlEncode(std::string_view(text).substr(0, 3)), "abc");
}
