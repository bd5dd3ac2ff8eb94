#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string base64_encode(const uint8_t *data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t> &data) {
  return base64_encode(data.data(), data.size());
}

// Returns nullopt on characters outside the alphabet or bad padding.
std::optional<std::vector<uint8_t>> base64_decode(const std::string &in);
