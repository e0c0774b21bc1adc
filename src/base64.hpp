#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string base64_encode(const uint8_t* data, size_t size);
std::string base64_encode(const std::vector<uint8_t>& data);

// Standard alphabet with '=' padding. Whitespace is skipped; anything else
// outside the alphabet makes the input invalid.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);
