#include "mrp/mrp.h"
#include "mrp/connection.h"
#include "mrp/test_hooks.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace mrp {
namespace {

constexpr int kDefaultArtworkSize = 400;

// Fixed parts of a HID event body around the usage triple.
constexpr uint8_t kHidTimestamp[] = {0x43, 0x89, 0x22, 0xcf, 0x08, 0x02, 0x00, 0x00};
constexpr uint8_t kHidDescriptor[] = {
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x20, 0x00, 0x00, 0x00,
    0x03, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
};
constexpr uint8_t kHidTrailer[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                   0x00, 0x01, 0x00, 0x00, 0x00};

struct KeyEntry {
  Key key;
  const char* name;
  uint16_t usage_page;
  uint16_t usage;
};

constexpr KeyEntry kKeyTable[] = {
    {Key::kUp, "up", 1, 0x8c},
    {Key::kDown, "down", 1, 0x8d},
    {Key::kLeft, "left", 1, 0x8b},
    {Key::kRight, "right", 1, 0x8a},
    {Key::kMenu, "menu", 1, 0x86},
    {Key::kPlay, "play", 12, 0xb0},
    {Key::kPause, "pause", 12, 0xb1},
    {Key::kNext, "next", 12, 0xb5},
    {Key::kPrevious, "previous", 12, 0xb6},
    {Key::kSuspend, "suspend", 1, 0x82},
    {Key::kSelect, "select", 1, 0x89},
};

void AppendBe16(std::vector<uint8_t>& data, uint16_t value) {
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>(value & 0xff));
}

std::vector<uint8_t> BuildHidEventData(uint16_t usage_page, uint16_t usage,
                                       bool down) {
  std::vector<uint8_t> data;
  data.reserve(sizeof(kHidTimestamp) + sizeof(kHidDescriptor) + 6 +
               sizeof(kHidTrailer));
  data.insert(data.end(), std::begin(kHidTimestamp), std::end(kHidTimestamp));
  data.insert(data.end(), std::begin(kHidDescriptor), std::end(kHidDescriptor));
  AppendBe16(data, usage_page);
  AppendBe16(data, usage);
  AppendBe16(data, down ? 1 : 0);
  data.insert(data.end(), std::begin(kHidTrailer), std::end(kHidTrailer));
  return data;
}

void SetError(Error* error, ErrorKind kind, const std::string& message) {
  if (error) {
    error->kind = kind;
    error->message = message;
  }
}

void LogError(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[mrp] " << message << std::endl;
}

void LogCallbackError(const char* name, const Config* config) {
  std::string message = "callback threw exception: ";
  message += name;
  LogError(message, config);
}

ConnectionOptions MakeConnectionOptions(const Config& config) {
  ConnectionOptions options;
  options.connect_timeout = config.connect_timeout;
  options.response_timeout = config.response_timeout;
  options.max_frame_size = config.max_frame_size;
  options.log_callback = config.log_callback;
  return options;
}

}  // namespace

bool LookupKeyUsage(Key key, KeyUsage* out) {
  for (const auto& entry : kKeyTable) {
    if (entry.key == key) {
      if (out) {
        out->usage_page = entry.usage_page;
        out->usage = entry.usage;
      }
      return true;
    }
  }
  return false;
}

std::optional<Key> KeyFromString(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  for (const auto& entry : kKeyTable) {
    if (lower == entry.name) {
      return entry.key;
    }
  }
  return std::nullopt;
}

const char* KeyName(Key key) {
  for (const auto& entry : kKeyTable) {
    if (entry.key == key) {
      return entry.name;
    }
  }
  return "unknown";
}

NowPlayingInfo NowPlayingInfo::FromState(const SetStatePayload& state) {
  NowPlayingInfo info;
  if (state.now_playing_info.has_value()) {
    const auto& source = state.now_playing_info.value();
    info.title = source.title;
    info.artist = source.artist;
    info.album = source.album;
    info.duration = source.duration;
    info.elapsed_time = source.elapsed_time;
    info.playback_rate = source.playback_rate;
    info.timestamp = source.timestamp;
  } else if (state.playback_queue.has_value() &&
             !state.playback_queue->content_items.empty()) {
    // Queue replies describe the current item instead of now-playing info.
    const auto& item = state.playback_queue->content_items.front();
    info.title = item.title;
    info.artist = item.artist;
    info.album = item.album;
    info.duration = item.duration;
  }
  if (state.playback_state.has_value()) {
    info.playback_state = state.playback_state.value();
  }
  info.app_bundle_identifier = state.display_id;
  info.app_display_name = state.display_name;
  return info;
}

std::optional<double> NowPlayingInfo::PositionAt(double now_seconds) const {
  if (!elapsed_time.has_value()) {
    return std::nullopt;
  }
  double position = elapsed_time.value();
  if (timestamp.has_value() && playback_rate.has_value()) {
    position += (now_seconds - timestamp.value()) * playback_rate.value();
  }
  if (position < 0.0) {
    position = 0.0;
  }
  if (duration.has_value() && position > duration.value()) {
    position = duration.value();
  }
  return position;
}

std::vector<SupportedCommand> SupportedCommand::FromState(
    const SetStatePayload& state) {
  std::vector<SupportedCommand> commands;
  if (!state.supported_commands.has_value()) {
    return commands;
  }
  commands.reserve(state.supported_commands->size());
  for (const auto& entry : state.supported_commands.value()) {
    SupportedCommand command;
    command.command = entry.command;
    command.enabled = entry.enabled;
    command.can_scrub = entry.can_scrub;
    commands.push_back(command);
  }
  return commands;
}

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kUnopened:
      return "unopened";
    case SessionState::kOpening:
      return "opening";
    case SessionState::kIntroduced:
      return "introduced";
    case SessionState::kVerifying:
      return "verifying";
    case SessionState::kReady:
      return "ready";
    case SessionState::kClosed:
      return "closed";
    case SessionState::kFailed:
      return "failed";
  }
  return "unknown";
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (client_name.empty()) {
    return fail("client_name must not be empty");
  }
  if (application_bundle_identifier.empty()) {
    return fail("application_bundle_identifier must not be empty");
  }
  if (connect_timeout.count() <= 0 || introduction_timeout.count() <= 0 ||
      response_timeout.count() <= 0) {
    return fail("connect, introduction and response timeouts must be positive");
  }
  if (message_timeout.count() <= 0 || sequence_timeout.count() <= 0) {
    return fail("wait timeouts must be positive");
  }
  if (poll_interval.count() <= 0) {
    return fail("poll_interval must be positive");
  }
  if (poll_queue_length <= 0) {
    return fail("poll_queue_length must be positive");
  }
  if (max_frame_size == 0) {
    return fail("max_frame_size must be non-zero");
  }
  return true;
}

struct SessionMetricsAtomic {
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> callback_exceptions{0};
  std::atomic<uint64_t> poll_ticks{0};
  std::atomic<uint64_t> poll_ticks_skipped{0};
};

struct Session::Impl {
  Impl(Session* owner, DeviceDescriptor device, Config config,
       std::unique_ptr<Transport> transport)
      : owner_(owner),
        device_(std::move(device)),
        config_(std::move(config)),
        connection_(device_.address, device_.port, std::move(transport),
                    MakeConnectionOptions(config_)),
        pairing_id_(GenerateIdentifier()) {
    connection_.SetConnectCallback([this]() { HandleConnect(); });
    connection_.SetMessageCallback([this](const Message& message) { QueueMessage(message); });
    connection_.SetCloseCallback([this]() { HandleClose(); });
    connection_.SetErrorCallback([this](const Error& error) { HandleError(error); });
    connection_.SetDebugCallback([this](const std::string& message) { EmitDebug(message); });
    event_thread_ = std::thread(&Impl::EventLoop, this);
  }

  ~Impl() {
    StopPolling();
    connection_.SetConnectCallback(nullptr);
    connection_.SetMessageCallback(nullptr);
    connection_.SetCloseCallback(nullptr);
    connection_.SetErrorCallback(nullptr);
    connection_.SetDebugCallback(nullptr);
    connection_.Close();
    {
      std::lock_guard<std::mutex> lock(event_mutex_);
      events_running_ = false;
    }
    event_cv_.notify_all();
    if (event_thread_.joinable()) {
      event_thread_.join();
    }
  }

  bool Open(Credentials* credentials, Error* error) {
    std::lock_guard<std::mutex> open_lock(open_mutex_);
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (state_ != SessionState::kUnopened && state_ != SessionState::kClosed &&
          state_ != SessionState::kFailed) {
        std::string message = "open not allowed in state ";
        message += SessionStateName(state_);
        SetError(error, ErrorKind::kInvalidState, message);
        return false;
      }
    }
    std::string validation;
    if (!config_.Validate(&validation)) {
      SetLastError(validation);
      LogError(validation, &config_);
      SetError(error, ErrorKind::kInvalidArgument, validation);
      return false;
    }
    if (credentials && credentials->pairing_id.empty()) {
      SetError(error, ErrorKind::kInvalidArgument,
               "credentials must carry a pairing_id");
      return false;
    }

    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (credentials) {
        pairing_id_ = credentials->pairing_id;
      }
      // Introduction and verification run in the clear.
      credentials_ = nullptr;
      transport_failed_ = false;
      last_error_.clear();
      state_ = SessionState::kOpening;
    }

    auto fail = [&](const Error& cause, const char* step) {
      Error surfaced = cause;
      if (cause.kind != ErrorKind::kTransport &&
          cause.kind != ErrorKind::kConnectionClosed &&
          cause.kind != ErrorKind::kInvalidState) {
        surfaced.kind = ErrorKind::kHandshake;
        surfaced.message = std::string(step) + " failed: " + cause.message;
      }
      SetLastError(surfaced.message);
      LogError(surfaced.message, &config_);
      connection_.Close();
      SetState(surfaced.kind == ErrorKind::kTransport ? SessionState::kFailed
                                                      : SessionState::kClosed);
      if (error) {
        *error = surfaced;
      }
      return false;
    };

    Error step_error;
    if (!connection_.Open(&step_error)) {
      return fail(step_error, "connect");
    }

    if (!connection_.Request(MakeMessage(BuildIntroduction()), 0, nullptr,
                             config_.introduction_timeout, nullptr, &step_error)) {
      return fail(step_error, "introduction");
    }
    SetState(SessionState::kIntroduced);

    if (credentials) {
      SetState(SessionState::kVerifying);
      std::shared_ptr<Verifier> verifier;
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        verifier = verifier_;
      }
      if (!verifier) {
        return fail(Error{ErrorKind::kHandshake, "no verifier configured"},
                    "verification");
      }
      SessionKeys keys;
      if (!verifier->Verify(*owner_, *credentials, &keys, &step_error)) {
        return fail(step_error, "verification");
      }
      FrameCipher probe(keys.read_key, keys.write_key);
      if (!probe.valid()) {
        return fail(Error{ErrorKind::kHandshake, "session keys must be 32 bytes"},
                    "verification");
      }
      credentials->read_key = keys.read_key;
      credentials->write_key = keys.write_key;
      connection_.InstallKeys(keys);
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        credentials_ = credentials;
      }
      EmitDebug("session keys installed");

      SetConnectionStatePayload connected;
      connected.state = ConnectionState::kConnected;
      if (!connection_.Send(MakeMessage(connected), false, 0, credentials, nullptr,
                            &step_error)) {
        return fail(step_error, "connection state");
      }
      if (!connection_.Send(MakeMessage(config_.client_updates), false, 0,
                            credentials, nullptr, &step_error)) {
        return fail(step_error, "client updates config");
      }
    }

    SetState(SessionState::kReady);
    if (config_.closed_poll_behavior == ClosedPollBehavior::kStopTask) {
      std::lock_guard<std::mutex> lock(listener_mutex_);
      if (ListenerCountLocked() > 0) {
        StartPolling();
      }
    }
    return true;
  }

  void Close() {
    connection_.Close();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::kUnopened && state_ != SessionState::kFailed) {
      state_ = SessionState::kClosed;
    }
  }

  bool SendMessage(const Message& message, bool wait_for_response, int priority,
                   Message* response, Error* error) {
    Error result;
    const bool ok = connection_.Send(message, wait_for_response, priority,
                                     CurrentCredentials(), response, &result);
    if (!ok) {
      RecordFailure(result);
      if (error) {
        *error = result;
      }
    }
    return ok;
  }

  bool MessageOfType(MessageType type, std::chrono::milliseconds timeout,
                     Message* out, Error* error) {
    Error result;
    if (connection_.WaitForType(type, timeout, out, &result)) {
      return true;
    }
    if (result.kind == ErrorKind::kTimeout) {
      result.message = std::string("timed out waiting for ") +
                       MessageTypeName(type) + ": " + result.message;
    }
    RecordFailure(result);
    if (error) {
      *error = result;
    }
    return false;
  }

  bool WaitForSequence(uint32_t sequence, std::chrono::milliseconds timeout,
                       Message* out, Error* error) {
    Error result;
    if (connection_.WaitForSequence(sequence, timeout, out, &result)) {
      return true;
    }
    if (result.kind == ErrorKind::kTimeout) {
      result.message = "timed out waiting for sequence " +
                       std::to_string(sequence) + ": " + result.message;
    }
    RecordFailure(result);
    if (error) {
      *error = result;
    }
    return false;
  }

  bool RequestPlaybackQueue(const PlaybackQueueRequestOptions& options,
                            bool wait_for_response, Message* reply, Error* error) {
    PlaybackQueueRequestPayload request;
    request.location = options.location;
    request.length = options.length;
    request.include_metadata = options.include_metadata;
    request.include_language_options = options.include_language_options;
    request.include_lyrics = options.include_lyrics;
    request.artwork_width = options.artwork_width;
    request.artwork_height = options.artwork_height;
    request.request_id = GenerateIdentifier();
    return SendMessage(MakeMessage(request), wait_for_response, 0, reply, error);
  }

  bool RequestArtwork(int width, int height, std::vector<uint8_t>* data,
                      Error* error) {
    PlaybackQueueRequestOptions options;
    options.location = 0;
    options.length = 1;
    options.artwork_width = width;
    options.artwork_height = height;
    Message reply;
    if (!RequestPlaybackQueue(options, true, &reply, error)) {
      return false;
    }
    const auto* state = reply.As<SetStatePayload>();
    if (!state || !state->playback_queue.has_value() ||
        state->playback_queue->content_items.empty() ||
        state->playback_queue->content_items.front().artwork_data.empty()) {
      SetError(error, ErrorKind::kApplication, "no artwork available");
      return false;
    }
    if (data) {
      *data = state->playback_queue->content_items.front().artwork_data;
    }
    return true;
  }

  bool SendKeyCommand(Key key, Error* error) {
    KeyUsage usage;
    if (!LookupKeyUsage(key, &usage)) {
      SetError(error, ErrorKind::kInvalidArgument, "unknown key");
      return false;
    }
    SendHidEventPayload press;
    press.hid_event_data = BuildHidEventData(usage.usage_page, usage.usage, true);
    if (!SendMessage(MakeMessage(press), false, 0, nullptr, error)) {
      return false;
    }
    SendHidEventPayload release;
    release.hid_event_data = BuildHidEventData(usage.usage_page, usage.usage, false);
    return SendMessage(MakeMessage(release), false, 0, nullptr, error);
  }

  Session::ListenerId AddNowPlayingListener(NowPlayingCallback cb) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    const ListenerId id = next_listener_id_++;
    now_playing_listeners_.emplace(id, std::move(cb));
    OnListenerAdded();
    return id;
  }

  Session::ListenerId AddSupportedCommandsListener(SupportedCommandsCallback cb) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    const ListenerId id = next_listener_id_++;
    supported_commands_listeners_.emplace(id, std::move(cb));
    OnListenerAdded();
    return id;
  }

  bool RemoveListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    const size_t removed = now_playing_listeners_.erase(id) +
                           supported_commands_listeners_.erase(id);
    if (removed == 0) {
      return false;
    }
    if (ListenerCountLocked() == 0) {
      StopPolling();
    }
    return true;
  }

  // Polling follows the union of both listener kinds; callers hold
  // listener_mutex_.
  void OnListenerAdded() {
    if (ListenerCountLocked() != 1) {
      return;
    }
    if (config_.closed_poll_behavior == ClosedPollBehavior::kStopTask &&
        !connection_.IsOpen()) {
      return;
    }
    StartPolling();
  }

  size_t ListenerCountLocked() const {
    return now_playing_listeners_.size() + supported_commands_listeners_.size();
  }

  void StartPolling() {
    std::thread finished;
    {
      std::lock_guard<std::mutex> lock(poll_mutex_);
      if (poll_running_) {
        return;
      }
      if (poll_thread_.joinable()) {
        // Stopped from its own thread and not yet exited; it keeps going.
        if (poll_thread_.get_id() == std::this_thread::get_id()) {
          poll_running_ = true;
          poll_starts_.fetch_add(1);
          return;
        }
        finished = std::move(poll_thread_);
      }
    }
    if (finished.joinable()) {
      finished.join();
    }
    std::lock_guard<std::mutex> lock(poll_mutex_);
    if (poll_running_) {
      return;
    }
    poll_running_ = true;
    poll_starts_.fetch_add(1);
    poll_thread_ = std::thread(&Impl::PollLoop, this);
  }

  // A stop requested from the poll thread itself only clears the flag; the
  // thread exits after its tick and is joined by the next start or by ~Impl.
  void StopPolling() {
    std::thread worker;
    {
      std::lock_guard<std::mutex> lock(poll_mutex_);
      poll_running_ = false;
      if (poll_thread_.joinable() &&
          poll_thread_.get_id() != std::this_thread::get_id()) {
        worker = std::move(poll_thread_);
      }
    }
    poll_cv_.notify_all();
    if (worker.joinable()) {
      worker.join();
    }
  }

  void PollLoop() {
    std::unique_lock<std::mutex> lock(poll_mutex_);
    while (poll_running_) {
      if (poll_cv_.wait_for(lock, config_.poll_interval,
                            [this]() { return !poll_running_; })) {
        return;
      }
      lock.unlock();
      PollTick();
      lock.lock();
    }
  }

  void PollTick() {
    // Requests never interleave with the handshake.
    if (GetState() != SessionState::kReady || !connection_.IsOpen()) {
      metrics_.poll_ticks_skipped.fetch_add(1);
      return;
    }
    PlaybackQueueRequestOptions options;
    options.location = 0;
    options.length = config_.poll_queue_length;
    options.artwork_width = config_.poll_artwork_width;
    options.artwork_height = config_.poll_artwork_height;
    metrics_.poll_ticks.fetch_add(1);
    Error error;
    if (!RequestPlaybackQueue(options, false, nullptr, &error)) {
      EmitDebug("playback queue poll failed: " + error.message);
    }
  }

  void HandleConnect() {
    ConnectCallback cb;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb = connect_cb_;
    }
    if (cb) {
      try {
        cb();
      } catch (...) {
        RecordCallbackException("ConnectCallback");
      }
    }
  }

  void QueueMessage(const Message& message) {
    {
      std::lock_guard<std::mutex> lock(event_mutex_);
      events_.push_back(message);
    }
    event_cv_.notify_one();
  }

  // Inbound messages are dispatched here, off the reader thread, so that
  // listeners may issue waiting requests.
  void EventLoop() {
    std::unique_lock<std::mutex> lock(event_mutex_);
    while (true) {
      event_cv_.wait(lock, [this]() { return !events_running_ || !events_.empty(); });
      if (!events_running_) {
        return;
      }
      Message message = std::move(events_.front());
      events_.pop_front();
      lock.unlock();
      HandleMessage(message);
      lock.lock();
    }
  }

  void HandleMessage(const Message& message) {
    MessageCallback message_cb;
    PlaybackQueueCallback queue_cb;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      message_cb = message_cb_;
      queue_cb = playback_queue_cb_;
    }
    if (message_cb) {
      try {
        message_cb(message);
      } catch (...) {
        RecordCallbackException("MessageCallback");
      }
    }
    if (message.type != MessageType::kSetState) {
      return;
    }
    const auto* state = message.As<SetStatePayload>();
    if (!state) {
      EmitNowPlaying(std::nullopt);
      return;
    }
    if (state->now_playing_info.has_value()) {
      EmitNowPlaying(NowPlayingInfo::FromState(*state));
    }
    if (state->supported_commands.has_value()) {
      EmitSupportedCommands(SupportedCommand::FromState(*state));
    }
    if (state->playback_queue.has_value() && queue_cb) {
      try {
        queue_cb(state->playback_queue.value());
      } catch (...) {
        RecordCallbackException("PlaybackQueueCallback");
      }
    }
  }

  void EmitNowPlaying(const std::optional<NowPlayingInfo>& info) {
    std::vector<NowPlayingCallback> listeners;
    {
      std::lock_guard<std::mutex> lock(listener_mutex_);
      for (const auto& entry : now_playing_listeners_) {
        listeners.push_back(entry.second);
      }
    }
    for (const auto& listener : listeners) {
      try {
        listener(info);
      } catch (...) {
        RecordCallbackException("NowPlayingCallback");
      }
    }
  }

  void EmitSupportedCommands(const std::vector<SupportedCommand>& commands) {
    std::vector<SupportedCommandsCallback> listeners;
    {
      std::lock_guard<std::mutex> lock(listener_mutex_);
      for (const auto& entry : supported_commands_listeners_) {
        listeners.push_back(entry.second);
      }
    }
    for (const auto& listener : listeners) {
      try {
        listener(commands);
      } catch (...) {
        RecordCallbackException("SupportedCommandsCallback");
      }
    }
  }

  void HandleClose() {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_ = transport_failed_ ? SessionState::kFailed : SessionState::kClosed;
    }
    if (config_.closed_poll_behavior == ClosedPollBehavior::kStopTask) {
      StopPolling();
    }
    CloseCallback cb;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb = close_cb_;
    }
    if (cb) {
      try {
        cb();
      } catch (...) {
        RecordCallbackException("CloseCallback");
      }
    }
  }

  void HandleError(const Error& error) {
    if (error.kind == ErrorKind::kTransport) {
      std::lock_guard<std::mutex> lock(state_mutex_);
      transport_failed_ = true;
    }
    ErrorCallback cb;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb = error_cb_;
    }
    if (cb) {
      try {
        cb(error);
      } catch (...) {
        RecordCallbackException("ErrorCallback");
      }
    }
  }

  void EmitDebug(const std::string& message) {
    DebugCallback cb;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb = debug_cb_;
    }
    if (cb) {
      try {
        cb(message);
      } catch (...) {
        RecordCallbackException("DebugCallback");
      }
    }
  }

  DeviceInfoPayload BuildIntroduction() const {
    DeviceInfoPayload info;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      info.unique_identifier = pairing_id_;
    }
    info.name = config_.client_name;
    info.localized_model_name = config_.localized_model_name;
    info.system_build_version = config_.system_build_version;
    info.application_bundle_identifier = config_.application_bundle_identifier;
    info.application_bundle_version = config_.application_bundle_version;
    info.protocol_version = config_.protocol_version;
    info.last_supported_message_type = config_.last_supported_message_type;
    info.allows_pairing = config_.allows_pairing;
    info.supports_system_pairing = config_.supports_system_pairing;
    return info;
  }

  const Credentials* CurrentCredentials() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return credentials_;
  }

  void SetState(SessionState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
  }

  SessionState GetState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
  }

  void SetLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = message;
  }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
  }

  void RecordFailure(const Error& error) {
    if (error.kind == ErrorKind::kTimeout) {
      metrics_.timeouts.fetch_add(1);
    }
  }

  void RecordCallbackException(const char* name) {
    metrics_.callback_exceptions.fetch_add(1);
    LogCallbackError(name, &config_);
  }

  SessionMetrics GetMetrics() const {
    const ConnectionMetrics connection = connection_.GetMetrics();
    SessionMetrics snapshot;
    snapshot.messages_sent = connection.messages_sent;
    snapshot.messages_received = connection.messages_received;
    snapshot.decode_errors = connection.decode_errors;
    snapshot.send_errors = connection.send_errors;
    snapshot.timeouts = metrics_.timeouts.load();
    snapshot.callback_exceptions = metrics_.callback_exceptions.load();
    snapshot.poll_ticks = metrics_.poll_ticks.load();
    snapshot.poll_ticks_skipped = metrics_.poll_ticks_skipped.load();
    return snapshot;
  }

  Session* owner_;
  DeviceDescriptor device_;
  Config config_;
  Connection connection_;

  std::mutex open_mutex_;
  mutable std::mutex state_mutex_;
  SessionState state_ = SessionState::kUnopened;
  std::string pairing_id_;
  Credentials* credentials_ = nullptr;
  std::shared_ptr<Verifier> verifier_;
  bool transport_failed_ = false;
  std::string last_error_;

  std::mutex callback_mutex_;
  ConnectCallback connect_cb_;
  MessageCallback message_cb_;
  PlaybackQueueCallback playback_queue_cb_;
  CloseCallback close_cb_;
  ErrorCallback error_cb_;
  DebugCallback debug_cb_;

  std::mutex listener_mutex_;
  ListenerId next_listener_id_ = 1;
  std::map<ListenerId, NowPlayingCallback> now_playing_listeners_;
  std::map<ListenerId, SupportedCommandsCallback> supported_commands_listeners_;

  std::mutex event_mutex_;
  std::condition_variable event_cv_;
  std::deque<Message> events_;
  bool events_running_ = true;
  std::thread event_thread_;

  std::mutex poll_mutex_;
  std::condition_variable poll_cv_;
  bool poll_running_ = false;
  std::thread poll_thread_;
  std::atomic<uint64_t> poll_starts_{0};

  SessionMetricsAtomic metrics_;
};

Session::Session(DeviceDescriptor device, Config config,
                 std::unique_ptr<Transport> transport)
    : impl_(new Impl(this, std::move(device), std::move(config),
                     std::move(transport))) {}

Session::~Session() = default;

bool Session::Open(Credentials* credentials, Error* error) {
  return impl_->Open(credentials, error);
}

void Session::Close() { impl_->Close(); }

SessionState Session::GetState() const { return impl_->GetState(); }

void Session::SetVerifier(std::shared_ptr<Verifier> verifier) {
  std::lock_guard<std::mutex> lock(impl_->state_mutex_);
  impl_->verifier_ = std::move(verifier);
}

bool Session::Pair(Pairing& pairing, Pairing::PinCompletion* completion,
                   Error* error) {
  if (!impl_->connection_.IsOpen()) {
    SetError(error, ErrorKind::kInvalidState, "pairing requires an open connection");
    return false;
  }
  return pairing.InitiatePair(*this, completion, error);
}

bool Session::SendMessage(const Message& message, bool wait_for_response,
                          int priority, Message* response, Error* error) {
  return impl_->SendMessage(message, wait_for_response, priority, response, error);
}

bool Session::MessageOfType(MessageType type, Message* out, Error* error) {
  return impl_->MessageOfType(type, impl_->config_.message_timeout, out, error);
}

bool Session::MessageOfType(MessageType type, std::chrono::milliseconds timeout,
                            Message* out, Error* error) {
  return impl_->MessageOfType(type, timeout, out, error);
}

bool Session::WaitForSequence(uint32_t sequence, Message* out, Error* error) {
  return impl_->WaitForSequence(sequence, impl_->config_.sequence_timeout, out,
                                error);
}

bool Session::WaitForSequence(uint32_t sequence, std::chrono::milliseconds timeout,
                              Message* out, Error* error) {
  return impl_->WaitForSequence(sequence, timeout, out, error);
}

bool Session::RequestPlaybackQueue(const PlaybackQueueRequestOptions& options,
                                   NowPlayingInfo* info, Error* error) {
  Message reply;
  if (!impl_->RequestPlaybackQueue(options, true, &reply, error)) {
    return false;
  }
  if (info) {
    const auto* state = reply.As<SetStatePayload>();
    *info = state ? NowPlayingInfo::FromState(*state) : NowPlayingInfo();
  }
  return true;
}

bool Session::RequestArtwork(std::vector<uint8_t>* data, Error* error) {
  return impl_->RequestArtwork(kDefaultArtworkSize, kDefaultArtworkSize, data, error);
}

bool Session::RequestArtwork(int width, int height, std::vector<uint8_t>* data,
                             Error* error) {
  return impl_->RequestArtwork(width, height, data, error);
}

bool Session::SendKeyCommand(Key key, Error* error) {
  return impl_->SendKeyCommand(key, error);
}

bool Session::WakeDevice(Error* error) {
  return impl_->SendMessage(MakeMessage(WakeDevicePayload{}), false, 0, nullptr,
                            error);
}

void Session::SetConnectCallback(ConnectCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->connect_cb_ = std::move(cb);
}

void Session::SetMessageCallback(MessageCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->message_cb_ = std::move(cb);
}

void Session::SetPlaybackQueueCallback(PlaybackQueueCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->playback_queue_cb_ = std::move(cb);
}

void Session::SetCloseCallback(CloseCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->close_cb_ = std::move(cb);
}

void Session::SetErrorCallback(ErrorCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->error_cb_ = std::move(cb);
}

void Session::SetDebugCallback(DebugCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->debug_cb_ = std::move(cb);
}

Session::ListenerId Session::AddNowPlayingListener(NowPlayingCallback cb) {
  return impl_->AddNowPlayingListener(std::move(cb));
}

Session::ListenerId Session::AddSupportedCommandsListener(
    SupportedCommandsCallback cb) {
  return impl_->AddSupportedCommandsListener(std::move(cb));
}

bool Session::RemoveListener(ListenerId id) { return impl_->RemoveListener(id); }

const DeviceDescriptor& Session::device() const { return impl_->device_; }

std::string Session::pairing_id() const {
  std::lock_guard<std::mutex> lock(impl_->state_mutex_);
  return impl_->pairing_id_;
}

std::string Session::GetLastError() const { return impl_->GetLastError(); }

SessionMetrics Session::GetMetrics() const { return impl_->GetMetrics(); }

#ifdef MRP_TESTING
namespace test {

std::vector<uint8_t> BuildHidEventData(uint16_t usage_page, uint16_t usage,
                                       bool down) {
  return ::mrp::BuildHidEventData(usage_page, usage, down);
}

bool IsPollingActive(Session& session) {
  std::lock_guard<std::mutex> lock(session.impl_->poll_mutex_);
  return session.impl_->poll_running_;
}

uint64_t PollingTaskStarts(Session& session) {
  return session.impl_->poll_starts_.load();
}

size_t PendingWaitCount(Session& session) {
  return session.impl_->connection_.PendingWaitCount();
}

size_t ListenerCount(Session& session) {
  std::lock_guard<std::mutex> lock(session.impl_->listener_mutex_);
  return session.impl_->ListenerCountLocked();
}

}  // namespace test
#endif

}  // namespace mrp
