#pragma once

#include "mrp/codec.h"
#include "mrp/credentials.h"
#include "mrp/message.h"
#include "mrp/transport.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mrp {

class Session;

#ifdef MRP_TESTING
namespace test {
bool IsPollingActive(Session& session);
uint64_t PollingTaskStarts(Session& session);
size_t PendingWaitCount(Session& session);
size_t ListenerCount(Session& session);
}  // namespace test
#endif

/**
 * Default MRP port advertised by devices that do not publish one.
 */
constexpr uint16_t kDefaultPort = 49152;

/**
 * Identity of a discovered device.
 */
struct DeviceDescriptor {
  /// Display name from discovery.
  std::string name;
  /// IPv4 address of the device.
  std::string address;
  /// MRP service port.
  uint16_t port = kDefaultPort;
  /// Stable unique identifier published by the device.
  std::string unique_identifier;
};

/**
 * Remote-control keys sent as HID press/release pairs.
 */
enum class Key {
  kUp,
  kDown,
  kLeft,
  kRight,
  kMenu,
  kPlay,
  kPause,
  kNext,
  kPrevious,
  kSuspend,
  kSelect,
};

/**
 * HID usage for a key.
 */
struct KeyUsage {
  uint16_t usage_page = 0;
  uint16_t usage = 0;
};

/// Look up the HID usage for `key`.
bool LookupKeyUsage(Key key, KeyUsage* out);
/// Parse a lower-case key name ("up", "select", ...).
std::optional<Key> KeyFromString(const std::string& name);
const char* KeyName(Key key);

/**
 * Now-playing projection of a state message.
 */
struct NowPlayingInfo {
  std::string title;
  std::string artist;
  std::string album;
  /// Track duration in seconds, if known.
  std::optional<double> duration;
  /// Elapsed time in seconds at `timestamp`, if known.
  std::optional<double> elapsed_time;
  std::optional<float> playback_rate;
  std::optional<double> timestamp;
  PlaybackState playback_state = PlaybackState::kUnknown;
  /// Bundle identifier of the playing application.
  std::string app_bundle_identifier;
  /// Display name of the playing application.
  std::string app_display_name;

  /// Build from a state payload; missing sections leave defaults.
  static NowPlayingInfo FromState(const SetStatePayload& state);

  /// Compute the elapsed position at `now_seconds` (same clock as timestamp).
  std::optional<double> PositionAt(double now_seconds) const;
};

/**
 * Supported-command projection of a state message.
 */
struct SupportedCommand {
  Command command = Command::kUnknown;
  bool enabled = false;
  bool can_scrub = false;

  static std::vector<SupportedCommand> FromState(const SetStatePayload& state);
};

/**
 * Options for a playback-queue request.
 */
struct PlaybackQueueRequestOptions {
  int32_t location = 0;
  int32_t length = 1;
  bool include_metadata = false;
  bool include_language_options = false;
  bool include_lyrics = false;
  std::optional<double> artwork_width;
  std::optional<double> artwork_height;
};

/**
 * What the polling task does while the connection is closed.
 */
enum class ClosedPollBehavior {
  /// Keep the task and drop ticks until the connection is open again.
  kSkipTick,
  /// Stop the task on close; the next successful Open() restarts it.
  kStopTask,
};

/**
 * Session lifecycle states.
 */
enum class SessionState {
  kUnopened,
  kOpening,
  kIntroduced,
  kVerifying,
  kReady,
  kClosed,
  kFailed,
};

const char* SessionStateName(SessionState state);

/**
 * Counters for messages, errors, waits and polling.
 */
struct SessionMetrics {
  uint64_t messages_sent = 0;
  uint64_t messages_received = 0;
  uint64_t decode_errors = 0;
  uint64_t send_errors = 0;
  uint64_t timeouts = 0;
  uint64_t callback_exceptions = 0;
  uint64_t poll_ticks = 0;
  uint64_t poll_ticks_skipped = 0;
};

/**
 * Session configuration for the introduction identity, timeouts and polling.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Client name announced in the introduction.
  std::string client_name = "mrp-cpp";
  /// Model name announced in the introduction.
  std::string localized_model_name = "iPhone";
  /// OS build announced in the introduction.
  std::string system_build_version = "14G60";
  /// Bundle identifier of the remote application being emulated.
  std::string application_bundle_identifier = "com.apple.TVRemote";
  /// Bundle version of the remote application being emulated.
  std::string application_bundle_version = "320.18";
  int32_t protocol_version = 1;
  uint32_t last_supported_message_type = 45;
  bool allows_pairing = true;
  bool supports_system_pairing = true;

  /// Updates requested after an authenticated open.
  ClientUpdatesConfigPayload client_updates;

  /// TCP connect timeout.
  std::chrono::milliseconds connect_timeout{5000};
  /// How long Open() waits for the introduction acknowledgement.
  std::chrono::milliseconds introduction_timeout{5000};
  /// Deadline for sends that wait for a response.
  std::chrono::milliseconds response_timeout{5000};
  /// Default timeout for MessageOfType().
  std::chrono::milliseconds message_timeout{5000};
  /// Default timeout for WaitForSequence().
  std::chrono::milliseconds sequence_timeout{3000};

  /// Interval between playback-queue polls while listeners exist.
  std::chrono::milliseconds poll_interval{5000};
  /// Queue length requested by each poll.
  int32_t poll_queue_length = 100;
  /// Artwork width requested by each poll (-1 lets the device choose).
  double poll_artwork_width = -1;
  /// Artwork height requested by each poll.
  double poll_artwork_height = 368;
  ClosedPollBehavior closed_poll_behavior = ClosedPollBehavior::kSkipTick;

  /// Largest accepted inbound frame; larger prefixes close the connection.
  size_t max_frame_size = kDefaultMaxFrameSize;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Per-connection verification that derives session keys from credentials.
 *
 * Implementations exchange crypto-pairing messages through the session
 * (SendMessage / WaitForSequence) while Open() is in progress.
 */
class Verifier {
 public:
  virtual ~Verifier() = default;
  virtual bool Verify(Session& session, const Credentials& credentials,
                      SessionKeys* keys, Error* error) = 0;
};

/**
 * One-time pairing exchange.
 */
class Pairing {
 public:
  /// Completes pairing once the user has read the PIN off the screen.
  using PinCompletion = std::function<bool(const std::string& pin,
                                           Credentials* credentials,
                                           Error* error)>;

  virtual ~Pairing() = default;
  virtual bool InitiatePair(Session& session, PinCompletion* completion,
                            Error* error) = 0;
};

/**
 * MRP session: handshake, command surface, response correlation and
 * subscriber-driven polling for one device.
 *
 * Message, now-playing, supported-commands and playback-queue events run on
 * the session's event thread, so their handlers may issue waiting requests.
 * Close, error and debug events may run on the connection's reader or
 * writer thread; a call that would block on that same thread fails fast with
 * kInvalidState. A session must not be destroyed from one of its own
 * callbacks.
 */
class Session {
 public:
  using ListenerId = uint64_t;
  using ConnectCallback = std::function<void()>;
  using MessageCallback = std::function<void(const Message&)>;
  /// Receives std::nullopt when the device reports nothing is playing.
  using NowPlayingCallback =
      std::function<void(const std::optional<NowPlayingInfo>&)>;
  using SupportedCommandsCallback =
      std::function<void(const std::vector<SupportedCommand>&)>;
  using PlaybackQueueCallback = std::function<void(const PlaybackQueue&)>;
  using CloseCallback = std::function<void()>;
  using ErrorCallback = std::function<void(const Error&)>;
  using DebugCallback = std::function<void(const std::string&)>;

  /// Construct a session for `device`; a null transport means TCP.
  explicit Session(DeviceDescriptor device, Config config = Config(),
                   std::unique_ptr<Transport> transport = nullptr);
  /// Stop polling and close the connection.
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /**
   * Connect, introduce and (with credentials) verify.
   *
   * @param credentials Optional pairing record; its session keys are
   *        written on successful verification. Must outlive the session.
   */
  bool Open(Credentials* credentials = nullptr, Error* error = nullptr);
  /// Close the connection. Idempotent.
  void Close();
  SessionState GetState() const;

  /// Set the verifier used by authenticated opens.
  void SetVerifier(std::shared_ptr<Verifier> verifier);
  /// Start pairing; `completion` receives the PIN continuation.
  bool Pair(Pairing& pairing, Pairing::PinCompletion* completion,
            Error* error = nullptr);

  /// Send an arbitrary message with the session's credentials.
  bool SendMessage(const Message& message, bool wait_for_response,
                   int priority = 0, Message* response = nullptr,
                   Error* error = nullptr);
  /// Wait for the next message of `type` received after this call.
  bool MessageOfType(MessageType type, Message* out, Error* error = nullptr);
  bool MessageOfType(MessageType type, std::chrono::milliseconds timeout,
                     Message* out, Error* error = nullptr);
  /// Wait for the message carrying pairing sequence `sequence`.
  bool WaitForSequence(uint32_t sequence, Message* out,
                       Error* error = nullptr);
  bool WaitForSequence(uint32_t sequence, std::chrono::milliseconds timeout,
                       Message* out, Error* error = nullptr);

  /// Request the playback queue and project the reply.
  bool RequestPlaybackQueue(const PlaybackQueueRequestOptions& options,
                            NowPlayingInfo* info, Error* error = nullptr);
  /// Fetch artwork for the current item (400x400).
  bool RequestArtwork(std::vector<uint8_t>* data, Error* error = nullptr);
  bool RequestArtwork(int width, int height, std::vector<uint8_t>* data,
                      Error* error = nullptr);
  /// Send a press followed by a release of `key`.
  bool SendKeyCommand(Key key, Error* error = nullptr);
  /// Ask a sleeping device to wake.
  bool WakeDevice(Error* error = nullptr);

  void SetConnectCallback(ConnectCallback cb);
  void SetMessageCallback(MessageCallback cb);
  void SetPlaybackQueueCallback(PlaybackQueueCallback cb);
  void SetCloseCallback(CloseCallback cb);
  void SetErrorCallback(ErrorCallback cb);
  void SetDebugCallback(DebugCallback cb);

  /// Register a now-playing listener; the first one starts polling.
  ListenerId AddNowPlayingListener(NowPlayingCallback cb);
  /// Register a supported-commands listener; the first one starts polling.
  ListenerId AddSupportedCommandsListener(SupportedCommandsCallback cb);
  /// Remove a listener; removing the last watched one stops polling.
  bool RemoveListener(ListenerId id);

  const DeviceDescriptor& device() const;
  /// Pairing identifier presented in the current (or next) introduction.
  std::string pairing_id() const;
  /// Return the last Open() error message, if any.
  std::string GetLastError() const;
  SessionMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef MRP_TESTING
  friend bool test::IsPollingActive(Session& session);
  friend uint64_t test::PollingTaskStarts(Session& session);
  friend size_t test::PendingWaitCount(Session& session);
  friend size_t test::ListenerCount(Session& session);
#endif
};

}  // namespace mrp
