#include <gtest/gtest.h>
#include <string>

#include "utils/TextEncoding.h"

TEST(TextEncoding, Base64EncodesStandardVectors) {
  EXPECT_EQ(TextEncoding::base64Encode(""), "");
  EXPECT_EQ(TextEncoding::base64Encode("f"), "Zg==");
  EXPECT_EQ(TextEncoding::base64Encode("fo"), "Zm8=");
  EXPECT_EQ(TextEncoding::base64Encode("foo"), "Zm9v");
  EXPECT_EQ(TextEncoding::base64Encode("foobar"), "Zm9vYmFy");
}

TEST(TextEncoding, Base64DecodesPaddedInput) {
  EXPECT_EQ(TextEncoding::base64Decode("Zg==").value(), "f");
  EXPECT_EQ(TextEncoding::base64Decode("Zm8=").value(), "fo");
  EXPECT_EQ(TextEncoding::base64Decode("Zm9vYmFy").value(), "foobar");
  EXPECT_EQ(TextEncoding::base64Decode("").value(), "");
}

TEST(TextEncoding, Base64DecodeKeepsBinaryBytes) {
  std::string bytes("\x00\x01\xfe\xff", 4);
  auto decoded = TextEncoding::base64Decode(TextEncoding::base64Encode(bytes));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);
}

TEST(TextEncoding, Base64DecodeIgnoresWhitespace) {
  EXPECT_EQ(TextEncoding::base64Decode("Zm9v\nYmFy\r\n").value(), "foobar");
}

TEST(TextEncoding, Base64DecodeRejectsMalformedInput) {
  EXPECT_FALSE(TextEncoding::base64Decode("Zm9v!").has_value());
  EXPECT_FALSE(TextEncoding::base64Decode("Zg=").has_value());
  EXPECT_FALSE(TextEncoding::base64Decode("Z===").has_value());
  EXPECT_FALSE(TextEncoding::base64Decode("Zg==Zg==").has_value());
  EXPECT_FALSE(TextEncoding::base64Decode("not base64 at all").has_value());
}

TEST(TextEncoding, Sha256Hex) {
  EXPECT_EQ(TextEncoding::sha256Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(TextEncoding::sha256Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(UTF8Utils, ValidTextIsUnchanged) {
  std::string text = "plain ascii, caf\xC3\xA9, \xE4\xB8\xAD\xE6\x96\x87, \xF0\x9F\x98\x80";
  EXPECT_EQ(UTF8Utils::sanitize(text), text);
}

TEST(UTF8Utils, InvalidBytesBecomeReplacementCharacter) {
  const std::string fffd = "\xEF\xBF\xBD";
  EXPECT_EQ(UTF8Utils::sanitize("a\xFF" "b"), "a" + fffd + "b");
  EXPECT_EQ(UTF8Utils::sanitize("\xC0\xAF"), fffd + fffd);
  EXPECT_EQ(UTF8Utils::sanitize("\xED\xA0\x80"), fffd + fffd + fffd);
  EXPECT_EQ(UTF8Utils::sanitize("abc\xE2\x82"), "abc" + fffd);
}
