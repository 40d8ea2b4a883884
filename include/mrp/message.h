#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mrp {

/**
 * Error categories reported by connection and session operations.
 */
enum class ErrorKind {
  kNone,
  /// Socket-level failure; fatal to the connection.
  kTransport,
  /// Introduction or verification failed during Open().
  kHandshake,
  /// A specific wait expired.
  kTimeout,
  /// Decode or decrypt failure on an inbound unit.
  kProtocol,
  /// Request-level failure visible only to its caller (e.g. no artwork).
  kApplication,
  /// A pending wait was failed because the connection closed.
  kConnectionClosed,
  /// Operation not valid in the current state.
  kInvalidState,
  /// Caller supplied an unusable argument.
  kInvalidArgument,
};

struct Error {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;
};

const char* ErrorKindName(ErrorKind kind);

/**
 * Protocol message type identifiers carried in the envelope.
 * Unrecognised values on the wire decode as kUnknown.
 */
enum class MessageType : int {
  kUnknown = 0,
  kSendCommand = 1,
  kSendCommandResult = 2,
  kGetState = 3,
  kSetState = 4,
  kSetArtwork = 5,
  kSendHidEvent = 8,
  kNotification = 11,
  kDeviceInfo = 15,
  kClientUpdatesConfig = 16,
  kVolumeControlAvailability = 17,
  kPlaybackQueueRequest = 32,
  kTransaction = 33,
  kCryptoPairing = 34,
  kSetReadyState = 36,
  kDeviceInfoUpdate = 37,
  kSetConnectionState = 38,
  kWakeDevice = 41,
  kGeneric = 42,
};

const char* MessageTypeName(MessageType type);

/// Type of the message a device sends in reply to `request`.
MessageType ResponseTypeFor(MessageType request);

/**
 * Playback state reported in state messages.
 */
enum class PlaybackState : int {
  kUnknown = 0,
  kPlaying = 1,
  kPaused = 2,
  kStopped = 3,
  kInterrupted = 4,
  kSeeking = 5,
};

/**
 * Remote command identifiers used in supported-command lists.
 */
enum class Command : int {
  kUnknown = 0,
  kPlay = 1,
  kPause = 2,
  kTogglePlayPause = 3,
  kStop = 4,
  kNextTrack = 5,
  kPreviousTrack = 6,
  kAdvanceShuffleMode = 7,
  kAdvanceRepeatMode = 8,
  kBeginFastForward = 9,
  kEndFastForward = 10,
  kBeginRewind = 11,
  kEndRewind = 12,
  kRewind15Seconds = 13,
  kFastForward15Seconds = 14,
  kRewind30Seconds = 15,
  kFastForward30Seconds = 16,
  kSkipForward = 18,
  kSkipBackward = 19,
  kChangePlaybackRate = 20,
  kSeekToPlaybackPosition = 45,
};

enum class ConnectionState : int {
  kNone = 0,
  kConnecting = 1,
  kConnected = 2,
  kDisconnected = 3,
};

/// Introduction sent by the client and echoed back by the device.
struct DeviceInfoPayload {
  std::string unique_identifier;
  std::string name;
  std::string localized_model_name;
  std::string system_build_version;
  std::string application_bundle_identifier;
  std::string application_bundle_version;
  int32_t protocol_version = 0;
  uint32_t last_supported_message_type = 0;
  bool supports_system_pairing = false;
  bool allows_pairing = false;
};

/// Which asynchronous updates the client wants to receive.
struct ClientUpdatesConfigPayload {
  bool artwork_updates = true;
  bool now_playing_updates = true;
  bool volume_updates = false;
  bool keyboard_updates = false;
};

struct SetConnectionStatePayload {
  ConnectionState state = ConnectionState::kConnected;
};

struct PlaybackQueueRequestPayload {
  int32_t location = 0;
  int32_t length = 0;
  bool include_metadata = false;
  bool include_language_options = false;
  bool include_lyrics = false;
  std::optional<double> artwork_width;
  std::optional<double> artwork_height;
  std::string request_id;
};

struct SendHidEventPayload {
  std::vector<uint8_t> hid_event_data;
};

struct WakeDevicePayload {};

/// Pairing/verification exchange unit. `pairing_data` is TLV8 encoded.
struct CryptoPairingPayload {
  std::vector<uint8_t> pairing_data;
  int32_t status = 0;
  bool is_retrying = false;
  bool is_using_system_pairing = false;
  int32_t state = 0;
};

struct NowPlayingInfoData {
  std::string title;
  std::string artist;
  std::string album;
  std::optional<double> duration;
  std::optional<double> elapsed_time;
  std::optional<float> playback_rate;
  std::optional<double> timestamp;
  std::optional<uint64_t> unique_identifier;
};

struct CommandInfo {
  Command command = Command::kUnknown;
  bool enabled = false;
  bool active = false;
  bool can_scrub = false;
};

struct ContentItem {
  std::string identifier;
  std::string title;
  std::string artist;
  std::string album;
  std::optional<double> duration;
  /// Raw image bytes; empty when the device sent no artwork.
  std::vector<uint8_t> artwork_data;
};

struct PlaybackQueue {
  int32_t location = 0;
  std::vector<ContentItem> content_items;
};

/// Device state notification; each section is present only when sent.
struct SetStatePayload {
  std::optional<NowPlayingInfoData> now_playing_info;
  std::optional<std::vector<CommandInfo>> supported_commands;
  std::optional<PlaybackQueue> playback_queue;
  std::string display_id;
  std::string display_name;
  std::optional<PlaybackState> playback_state;
};

using Payload = std::variant<std::monostate,
                             DeviceInfoPayload,
                             ClientUpdatesConfigPayload,
                             SetConnectionStatePayload,
                             PlaybackQueueRequestPayload,
                             SendHidEventPayload,
                             WakeDevicePayload,
                             CryptoPairingPayload,
                             SetStatePayload>;

/**
 * A typed protocol message. The payload alternative always matches `type`
 * for modelled types; unmodelled or body-less messages carry std::monostate.
 */
struct Message {
  MessageType type = MessageType::kUnknown;
  Payload payload;
  /// Request identifier echoed by the device on replies (may be empty).
  std::string identifier;
  /// Structural sequence number (pairing state), when the body carries one.
  std::optional<uint32_t> sequence;
  uint32_t error_code = 0;

  bool has_payload() const {
    return !std::holds_alternative<std::monostate>(payload);
  }

  template <typename T>
  const T* As() const {
    return std::get_if<T>(&payload);
  }
};

/// Message type implied by a payload alternative.
MessageType TypeOfPayload(const Payload& payload);

/// Build a message whose type is derived from its payload.
Message MakeMessage(Payload payload);

}  // namespace mrp
