#include "base64.hpp"

namespace {
const char kTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
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
}
} // namespace

std::string base64_encode(const uint8_t *data, size_t len) {
  std::string out;
  out.reserve(((len + 2) / 3) * 4);

  size_t i = 0;
  while (i + 2 < len) {
    const uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
    i += 3;
    out.push_back(kTable[(triple >> 18) & 0x3F]);
    out.push_back(kTable[(triple >> 12) & 0x3F]);
    out.push_back(kTable[(triple >> 6) & 0x3F]);
    out.push_back(kTable[triple & 0x3F]);
  }

  if (i < len) {
    uint32_t triple = data[i] << 16;
    if (i + 1 < len)
      triple |= data[i + 1] << 8;
    out.push_back(kTable[(triple >> 18) & 0x3F]);
    out.push_back(kTable[(triple >> 12) & 0x3F]);
    if (i + 1 < len) {
      out.push_back(kTable[(triple >> 6) & 0x3F]);
    } else {
      out.push_back('=');
    }
    out.push_back('=');
  }
  return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string &in) {
  if (in.size() % 4 != 0)
    return std::nullopt;

  std::vector<uint8_t> out;
  out.reserve(in.size() / 4 * 3);
  for (size_t i = 0; i < in.size(); i += 4) {
    int v[4];
    int pad = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = in[i + k];
      if (c == '=') {
        // Padding only in the last two positions of the final quantum.
        if (i + 4 != in.size() || k < 2)
          return std::nullopt;
        v[k] = 0;
        ++pad;
        continue;
      }
      if (pad > 0)
        return std::nullopt;
      v[k] = decode_char(c);
      if (v[k] < 0)
        return std::nullopt;
    }
    const uint32_t triple = (v[0] << 18) | (v[1] << 12) | (v[2] << 6) | v[3];
    out.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
    if (pad < 2)
      out.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
    if (pad < 1)
      out.push_back(static_cast<uint8_t>(triple & 0xFF));
  }
  return out;
}
