#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mrp {

/**
 * Long-term pairing record plus the per-connection session keys.
 *
 * Owned by the caller. A Session writes `read_key` and `write_key` once,
 * right after verification succeeds; nothing else mutates them.
 */
struct Credentials {
  /// Identifier of the paired device.
  std::string unique_identifier;
  /// Client pairing identifier presented during introduction.
  std::string pairing_id;
  /// Device long-term public key (Ed25519).
  std::vector<uint8_t> device_public_key;
  /// Client long-term secret seed (Ed25519).
  std::vector<uint8_t> client_secret;

  /// Session read key; empty until verification.
  std::vector<uint8_t> read_key;
  /// Session write key; empty until verification.
  std::vector<uint8_t> write_key;

  bool HasSessionKeys() const {
    return !read_key.empty() && !write_key.empty();
  }

  /**
   * Serialize the long-term part as
   * `unique_identifier:pairing_id_hex:device_public_key_hex:client_secret_hex`.
   * Session keys are never serialized.
   */
  std::string ToString() const;

  /**
   * Parse the text form produced by ToString().
   *
   * @param error Optional output string describing the first problem.
   */
  static bool Parse(const std::string& text, Credentials* out,
                    std::string* error = nullptr);
};

std::string HexEncode(const std::vector<uint8_t>& data);
bool HexDecode(const std::string& text, std::vector<uint8_t>* out);

/// Random version 4 UUID in upper case, used for pairing and request ids.
std::string GenerateIdentifier();

}  // namespace mrp
