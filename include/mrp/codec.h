#pragma once

#include "mrp/message.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mrp {

/// Upper bound on a single framed unit unless configured otherwise.
constexpr size_t kDefaultMaxFrameSize = 1024 * 1024;

/// TLV8 item type carrying the pairing step number.
constexpr uint8_t kTlvTypeState = 0x06;

/**
 * Session keys derived by verification.
 */
struct SessionKeys {
  std::vector<uint8_t> read_key;
  std::vector<uint8_t> write_key;
};

/// Append `value` as an unsigned LEB128 varint.
void AppendVarint(uint64_t value, std::vector<uint8_t>* out);

/**
 * Decode a varint prefix.
 *
 * @return true when a complete varint was read; false when more bytes are
 *         needed or the varint exceeds 10 bytes (`*overflow` set).
 */
bool ReadVarint(const uint8_t* data, size_t length, uint64_t* value,
                size_t* consumed, bool* overflow = nullptr);

/// Prefix `body` with its varint length.
std::vector<uint8_t> BuildFrame(const std::vector<uint8_t>& body);

/**
 * Reassembles length-prefixed units from an arbitrary byte stream.
 * Not thread-safe; the owner serializes access.
 */
class FrameReader {
 public:
  enum class Status {
    kFrame,
    kNeedMore,
    kOversize,
  };

  explicit FrameReader(size_t max_frame_size = kDefaultMaxFrameSize);

  void Append(const uint8_t* data, size_t length);
  /// Extract the next complete body, if one is buffered.
  Status Next(std::vector<uint8_t>* body);
  size_t buffered() const { return buffer_.size() - offset_; }
  void Reset();

 private:
  void Compact();

  size_t max_frame_size_;
  std::vector<uint8_t> buffer_;
  size_t offset_ = 0;
};

/**
 * ChaCha20-Poly1305 transform with independent read/write nonce counters.
 * Nonce layout: four zero bytes followed by the 64-bit little-endian counter.
 */
class FrameCipher {
 public:
  static constexpr size_t kKeySize = 32;
  static constexpr size_t kNonceSize = 12;
  static constexpr size_t kTagSize = 16;

  FrameCipher(std::vector<uint8_t> read_key, std::vector<uint8_t> write_key);
  ~FrameCipher();

  FrameCipher(const FrameCipher&) = delete;
  FrameCipher& operator=(const FrameCipher&) = delete;

  /// True when both keys have the expected size.
  bool valid() const;

  bool Encrypt(const std::vector<uint8_t>& plaintext,
               std::vector<uint8_t>* out, std::string* error = nullptr);
  /// The read counter advances even when authentication fails.
  bool Decrypt(const std::vector<uint8_t>& ciphertext,
               std::vector<uint8_t>* out, std::string* error = nullptr);

  bool Matches(const std::vector<uint8_t>& read_key,
               const std::vector<uint8_t>& write_key) const;

  uint64_t read_counter() const { return read_counter_; }
  uint64_t write_counter() const { return write_counter_; }

 private:
  std::vector<uint8_t> read_key_;
  std::vector<uint8_t> write_key_;
  uint64_t read_counter_ = 0;
  uint64_t write_counter_ = 0;
};

/// Serialize a message into a protocol envelope body (not framed).
bool EncodeMessage(const Message& message, std::vector<uint8_t>* out,
                   Error* error = nullptr);

/// Parse a protocol envelope body.
bool DecodeMessage(const uint8_t* data, size_t length, Message* out,
                   Error* error = nullptr);

/// Append one TLV8 item, splitting values longer than 255 bytes.
void AppendTlv8(uint8_t type, const std::vector<uint8_t>& value,
                std::vector<uint8_t>* out);

/// Parse TLV8 items; fragments of the same type are concatenated.
bool ParseTlv8(const std::vector<uint8_t>& data,
               std::map<uint8_t, std::vector<uint8_t>>* out);

}  // namespace mrp
