#include "mrp/credentials.h"

#include <array>
#include <random>
#include <sstream>

namespace mrp {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::vector<std::string> Split(const std::string& text, char separator) {
  std::vector<std::string> parts;
  std::string part;
  std::istringstream stream(text);
  while (std::getline(stream, part, separator)) {
    parts.push_back(part);
  }
  if (!text.empty() && text.back() == separator) {
    parts.emplace_back();
  }
  return parts;
}

}  // namespace

std::string HexEncode(const std::vector<uint8_t>& data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (const uint8_t byte : data) {
    out.push_back(kHexDigits[byte >> 4]);
    out.push_back(kHexDigits[byte & 0x0f]);
  }
  return out;
}

bool HexDecode(const std::string& text, std::vector<uint8_t>* out) {
  if (!out || text.size() % 2 != 0) {
    return false;
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(text.size() / 2);
  for (size_t i = 0; i < text.size(); i += 2) {
    const int high = HexValue(text[i]);
    const int low = HexValue(text[i + 1]);
    if (high < 0 || low < 0) {
      return false;
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  *out = std::move(bytes);
  return true;
}

std::string GenerateIdentifier() {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  std::array<uint8_t, 16> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 8) {
    const uint64_t value = engine();
    for (size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(value >> (8 * j));
    }
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

  constexpr char kDigits[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kDigits[bytes[i] >> 4]);
    out.push_back(kDigits[bytes[i] & 0x0f]);
  }
  return out;
}

std::string Credentials::ToString() const {
  const std::vector<uint8_t> pairing_bytes(pairing_id.begin(), pairing_id.end());
  std::ostringstream oss;
  oss << unique_identifier << ':' << HexEncode(pairing_bytes) << ':'
      << HexEncode(device_public_key) << ':' << HexEncode(client_secret);
  return oss.str();
}

bool Credentials::Parse(const std::string& text, Credentials* out,
                        std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!out) {
    return fail("output credentials must not be null");
  }
  const auto parts = Split(text, ':');
  if (parts.size() != 4) {
    return fail("credentials must have 4 colon-separated fields");
  }
  if (parts[0].empty()) {
    return fail("unique_identifier must not be empty");
  }
  Credentials parsed;
  parsed.unique_identifier = parts[0];
  std::vector<uint8_t> pairing_bytes;
  if (!HexDecode(parts[1], &pairing_bytes) || pairing_bytes.empty()) {
    return fail("pairing_id must be non-empty hex");
  }
  parsed.pairing_id.assign(pairing_bytes.begin(), pairing_bytes.end());
  if (!HexDecode(parts[2], &parsed.device_public_key)) {
    return fail("device_public_key must be hex");
  }
  if (!HexDecode(parts[3], &parsed.client_secret)) {
    return fail("client_secret must be hex");
  }
  *out = std::move(parsed);
  return true;
}

}  // namespace mrp
