#include "emulator-server/Base64.hpp"
#include <gtest/gtest.h>

using namespace emuserver;

namespace {
std::vector<uint8_t> bytes_of(const std::string &s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}
} // namespace

TEST(Base64Test, EncodesRfc4648Vectors) {
  EXPECT_EQ(base64_encode(bytes_of("")), "");
  EXPECT_EQ(base64_encode(bytes_of("f")), "Zg==");
  EXPECT_EQ(base64_encode(bytes_of("fo")), "Zm8=");
  EXPECT_EQ(base64_encode(bytes_of("foo")), "Zm9v");
  EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, EncodesBinaryBytes) {
  std::vector<uint8_t> png_magic{0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a};
  EXPECT_EQ(base64_encode(png_magic), "iVBORw0KGgo=");
  EXPECT_EQ(base64_decode("iVBORw0KGgo="), png_magic);
}

TEST(Base64Test, DecodeRejectsBadInput) {
  EXPECT_THROW(base64_decode("abc"), std::invalid_argument);
  EXPECT_THROW(base64_decode("ab!="), std::invalid_argument);
}
