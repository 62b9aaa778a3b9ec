#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace emuserver {

/// Standard (RFC 4648) Base64 with padding
inline std::string base64_encode(const uint8_t *data, size_t len) {
  static const char *alphabet =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(4 * ((len + 2) / 3));

  for (size_t i = 0; i < len; i += 3) {
    uint32_t v = static_cast<uint32_t>(data[i]) << 16;
    if (i + 1 < len)
      v |= static_cast<uint32_t>(data[i + 1]) << 8;
    if (i + 2 < len)
      v |= data[i + 2];

    out += alphabet[(v >> 18) & 0x3F];
    out += alphabet[(v >> 12) & 0x3F];
    out += (i + 1 < len) ? alphabet[(v >> 6) & 0x3F] : '=';
    out += (i + 2 < len) ? alphabet[v & 0x3F] : '=';
  }
  return out;
}

inline std::string base64_encode(const std::vector<uint8_t> &data) {
  return base64_encode(data.data(), data.size());
}

inline std::vector<uint8_t> base64_decode(const std::string &in) {
  auto value_of = [](char c) -> int {
    if (c >= 'A' && c <= 'Z')
      return c - 'A';
    if (c >= 'a' && c <= 'z')
      return c - 'a' + 26;
    if (c >= '0' && c <= '9')
      return c - '0' + 52;
    if (c == '+')
      return 62;
    if (c == '/')
      return 63;
    return -1;
  };

  if (in.size() % 4 != 0)
    throw std::invalid_argument("base64 input length is not a multiple of 4");

  std::vector<uint8_t> out;
  out.reserve(in.size() / 4 * 3);
  for (size_t i = 0; i < in.size(); i += 4) {
    int a = value_of(in[i]);
    int b = value_of(in[i + 1]);
    int c = in[i + 2] == '=' ? 0 : value_of(in[i + 2]);
    int d = in[i + 3] == '=' ? 0 : value_of(in[i + 3]);
    if (a < 0 || b < 0 || c < 0 || d < 0)
      throw std::invalid_argument("invalid base64 character");

    uint32_t v = (static_cast<uint32_t>(a) << 18) |
                 (static_cast<uint32_t>(b) << 12) |
                 (static_cast<uint32_t>(c) << 6) | static_cast<uint32_t>(d);
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    if (in[i + 2] != '=')
      out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    if (in[i + 3] != '=')
      out.push_back(static_cast<uint8_t>(v & 0xFF));
  }
  return out;
}

} // namespace emuserver
