#include "mrp/codec.h"

#include "mrp.pb.h"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <memory>
#include <optional>
#include <type_traits>

namespace mrp {
namespace {

constexpr size_t kMaxVarintBytes = 10;
constexpr size_t kTlvMaxFragment = 255;

struct EvpCipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

std::array<uint8_t, FrameCipher::kNonceSize> MakeNonce(uint64_t counter) {
  std::array<uint8_t, FrameCipher::kNonceSize> nonce{};
  for (size_t i = 0; i < 8; ++i) {
    nonce[4 + i] = static_cast<uint8_t>((counter >> (8 * i)) & 0xff);
  }
  return nonce;
}

void SetError(Error* error, ErrorKind kind, const std::string& message) {
  if (error) {
    error->kind = kind;
    error->message = message;
  }
}

std::optional<uint32_t> PairingSequence(const std::vector<uint8_t>& tlv) {
  std::map<uint8_t, std::vector<uint8_t>> items;
  if (!ParseTlv8(tlv, &items)) {
    return std::nullopt;
  }
  const auto it = items.find(kTlvTypeState);
  if (it == items.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.front();
}

std::string ToBytesString(const std::vector<uint8_t>& data) {
  return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

std::vector<uint8_t> FromBytesString(const std::string& data) {
  return std::vector<uint8_t>(data.begin(), data.end());
}

// Copy an engine payload into the matching envelope field.
void FillEnvelope(const Payload& payload, wire::ProtocolMessage* pm) {
  std::visit(
      [pm](const auto& body) {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, DeviceInfoPayload>) {
          auto* out = pm->mutable_deviceinfomessage();
          out->set_uniqueidentifier(body.unique_identifier);
          out->set_name(body.name);
          out->set_localizedmodelname(body.localized_model_name);
          out->set_systembuildversion(body.system_build_version);
          out->set_applicationbundleidentifier(body.application_bundle_identifier);
          out->set_applicationbundleversion(body.application_bundle_version);
          out->set_protocolversion(body.protocol_version);
          out->set_lastsupportedmessagetype(body.last_supported_message_type);
          out->set_supportssystempairing(body.supports_system_pairing);
          out->set_allowspairing(body.allows_pairing);
        } else if constexpr (std::is_same_v<T, ClientUpdatesConfigPayload>) {
          auto* out = pm->mutable_clientupdatesconfigmessage();
          out->set_artworkupdates(body.artwork_updates);
          out->set_nowplayingupdates(body.now_playing_updates);
          out->set_volumeupdates(body.volume_updates);
          out->set_keyboardupdates(body.keyboard_updates);
        } else if constexpr (std::is_same_v<T, SetConnectionStatePayload>) {
          auto* out = pm->mutable_setconnectionstatemessage();
          out->set_state(static_cast<wire::SetConnectionStateMessage_ConnectionState>(
              static_cast<int>(body.state)));
        } else if constexpr (std::is_same_v<T, PlaybackQueueRequestPayload>) {
          auto* out = pm->mutable_playbackqueuerequestmessage();
          out->set_location(body.location);
          out->set_length(body.length);
          out->set_includemetadata(body.include_metadata);
          out->set_includelanguageoptions(body.include_language_options);
          out->set_includelyrics(body.include_lyrics);
          if (body.artwork_width.has_value()) {
            out->set_artworkwidth(body.artwork_width.value());
          }
          if (body.artwork_height.has_value()) {
            out->set_artworkheight(body.artwork_height.value());
          }
          if (!body.request_id.empty()) {
            out->set_requestid(body.request_id);
          }
        } else if constexpr (std::is_same_v<T, SendHidEventPayload>) {
          pm->mutable_sendhideventmessage()->set_hideventdata(
              ToBytesString(body.hid_event_data));
        } else if constexpr (std::is_same_v<T, WakeDevicePayload>) {
          pm->mutable_wakedevicemessage();
        } else if constexpr (std::is_same_v<T, CryptoPairingPayload>) {
          auto* out = pm->mutable_cryptopairingmessage();
          out->set_pairingdata(ToBytesString(body.pairing_data));
          out->set_status(body.status);
          out->set_isretrying(body.is_retrying);
          out->set_isusingsystempairing(body.is_using_system_pairing);
          out->set_state(body.state);
        } else if constexpr (std::is_same_v<T, SetStatePayload>) {
          auto* out = pm->mutable_setstatemessage();
          if (body.now_playing_info.has_value()) {
            const auto& info = body.now_playing_info.value();
            auto* npi = out->mutable_nowplayinginfo();
            npi->set_title(info.title);
            npi->set_artist(info.artist);
            npi->set_album(info.album);
            if (info.duration) npi->set_duration(*info.duration);
            if (info.elapsed_time) npi->set_elapsedtime(*info.elapsed_time);
            if (info.playback_rate) npi->set_playbackrate(*info.playback_rate);
            if (info.timestamp) npi->set_timestamp(*info.timestamp);
            if (info.unique_identifier) {
              npi->set_uniqueidentifier(*info.unique_identifier);
            }
          }
          if (body.supported_commands.has_value()) {
            auto* commands = out->mutable_supportedcommands();
            for (const auto& command : body.supported_commands.value()) {
              auto* entry = commands->add_supportedcommands();
              entry->set_command(static_cast<int32_t>(command.command));
              entry->set_enabled(command.enabled);
              entry->set_active(command.active);
              entry->set_canscrub(command.can_scrub);
            }
          }
          if (body.playback_queue.has_value()) {
            const auto& queue = body.playback_queue.value();
            auto* pq = out->mutable_playbackqueue();
            pq->set_location(queue.location);
            for (const auto& item : queue.content_items) {
              auto* entry = pq->add_contentitems();
              entry->set_identifier(item.identifier);
              auto* metadata = entry->mutable_metadata();
              metadata->set_title(item.title);
              metadata->set_trackartistname(item.artist);
              metadata->set_albumname(item.album);
              if (item.duration) metadata->set_duration(*item.duration);
              if (!item.artwork_data.empty()) {
                entry->set_artworkdata(ToBytesString(item.artwork_data));
              }
            }
          }
          if (!body.display_id.empty()) {
            out->set_displayid(body.display_id);
          }
          if (!body.display_name.empty()) {
            out->set_displayname(body.display_name);
          }
          if (body.playback_state.has_value()) {
            out->set_playbackstate(static_cast<int32_t>(body.playback_state.value()));
          }
        }
      },
      payload);
}

SetStatePayload ReadSetState(const wire::SetStateMessage& in) {
  SetStatePayload state;
  if (in.has_nowplayinginfo()) {
    const auto& npi = in.nowplayinginfo();
    NowPlayingInfoData info;
    info.title = npi.title();
    info.artist = npi.artist();
    info.album = npi.album();
    if (npi.has_duration()) info.duration = npi.duration();
    if (npi.has_elapsedtime()) info.elapsed_time = npi.elapsedtime();
    if (npi.has_playbackrate()) info.playback_rate = npi.playbackrate();
    if (npi.has_timestamp()) info.timestamp = npi.timestamp();
    if (npi.has_uniqueidentifier()) info.unique_identifier = npi.uniqueidentifier();
    state.now_playing_info = std::move(info);
  }
  if (in.has_supportedcommands()) {
    std::vector<CommandInfo> commands;
    commands.reserve(in.supportedcommands().supportedcommands_size());
    for (const auto& entry : in.supportedcommands().supportedcommands()) {
      CommandInfo command;
      command.command = static_cast<Command>(entry.command());
      command.enabled = entry.enabled();
      command.active = entry.active();
      command.can_scrub = entry.canscrub();
      commands.push_back(command);
    }
    state.supported_commands = std::move(commands);
  }
  if (in.has_playbackqueue()) {
    PlaybackQueue queue;
    queue.location = in.playbackqueue().location();
    for (const auto& entry : in.playbackqueue().contentitems()) {
      ContentItem item;
      item.identifier = entry.identifier();
      if (entry.has_metadata()) {
        item.title = entry.metadata().title();
        item.artist = entry.metadata().trackartistname();
        item.album = entry.metadata().albumname();
        if (entry.metadata().has_duration()) {
          item.duration = entry.metadata().duration();
        }
      }
      item.artwork_data = FromBytesString(entry.artworkdata());
      queue.content_items.push_back(std::move(item));
    }
    state.playback_queue = std::move(queue);
  }
  state.display_id = in.displayid();
  state.display_name = in.displayname();
  if (in.has_playbackstate()) {
    state.playback_state = static_cast<PlaybackState>(in.playbackstate());
  }
  return state;
}

// Pick the body that belongs to the envelope's type; others are ignored.
Payload ReadPayload(const wire::ProtocolMessage& pm, MessageType type) {
  switch (type) {
    case MessageType::kDeviceInfo:
      if (pm.has_deviceinfomessage()) {
        const auto& in = pm.deviceinfomessage();
        DeviceInfoPayload out;
        out.unique_identifier = in.uniqueidentifier();
        out.name = in.name();
        out.localized_model_name = in.localizedmodelname();
        out.system_build_version = in.systembuildversion();
        out.application_bundle_identifier = in.applicationbundleidentifier();
        out.application_bundle_version = in.applicationbundleversion();
        out.protocol_version = in.protocolversion();
        out.last_supported_message_type = in.lastsupportedmessagetype();
        out.supports_system_pairing = in.supportssystempairing();
        out.allows_pairing = in.allowspairing();
        return out;
      }
      break;
    case MessageType::kClientUpdatesConfig:
      if (pm.has_clientupdatesconfigmessage()) {
        const auto& in = pm.clientupdatesconfigmessage();
        ClientUpdatesConfigPayload out;
        out.artwork_updates = in.artworkupdates();
        out.now_playing_updates = in.nowplayingupdates();
        out.volume_updates = in.volumeupdates();
        out.keyboard_updates = in.keyboardupdates();
        return out;
      }
      break;
    case MessageType::kSetConnectionState:
      if (pm.has_setconnectionstatemessage()) {
        SetConnectionStatePayload out;
        out.state = static_cast<ConnectionState>(
            static_cast<int>(pm.setconnectionstatemessage().state()));
        return out;
      }
      break;
    case MessageType::kPlaybackQueueRequest:
      if (pm.has_playbackqueuerequestmessage()) {
        const auto& in = pm.playbackqueuerequestmessage();
        PlaybackQueueRequestPayload out;
        out.location = in.location();
        out.length = in.length();
        out.include_metadata = in.includemetadata();
        out.include_language_options = in.includelanguageoptions();
        out.include_lyrics = in.includelyrics();
        if (in.has_artworkwidth()) out.artwork_width = in.artworkwidth();
        if (in.has_artworkheight()) out.artwork_height = in.artworkheight();
        out.request_id = in.requestid();
        return out;
      }
      break;
    case MessageType::kSendHidEvent:
      if (pm.has_sendhideventmessage()) {
        SendHidEventPayload out;
        out.hid_event_data = FromBytesString(pm.sendhideventmessage().hideventdata());
        return out;
      }
      break;
    case MessageType::kWakeDevice:
      if (pm.has_wakedevicemessage()) {
        return WakeDevicePayload{};
      }
      break;
    case MessageType::kCryptoPairing:
      if (pm.has_cryptopairingmessage()) {
        const auto& in = pm.cryptopairingmessage();
        CryptoPairingPayload out;
        out.pairing_data = FromBytesString(in.pairingdata());
        out.status = in.status();
        out.is_retrying = in.isretrying();
        out.is_using_system_pairing = in.isusingsystempairing();
        out.state = in.state();
        return out;
      }
      break;
    case MessageType::kSetState:
      if (pm.has_setstatemessage()) {
        return ReadSetState(pm.setstatemessage());
      }
      break;
    default:
      break;
  }
  return std::monostate{};
}

}  // namespace

void AppendVarint(uint64_t value, std::vector<uint8_t>* out) {
  while (value >= 0x80) {
    out->push_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
    value >>= 7;
  }
  out->push_back(static_cast<uint8_t>(value));
}

bool ReadVarint(const uint8_t* data, size_t length, uint64_t* value,
                size_t* consumed, bool* overflow) {
  if (overflow) {
    *overflow = false;
  }
  uint64_t result = 0;
  for (size_t i = 0; i < length && i < kMaxVarintBytes; ++i) {
    result |= static_cast<uint64_t>(data[i] & 0x7f) << (7 * i);
    if ((data[i] & 0x80) == 0) {
      *value = result;
      *consumed = i + 1;
      return true;
    }
  }
  if (length >= kMaxVarintBytes && overflow) {
    *overflow = true;
  }
  return false;
}

std::vector<uint8_t> BuildFrame(const std::vector<uint8_t>& body) {
  std::vector<uint8_t> frame;
  frame.reserve(body.size() + kMaxVarintBytes);
  AppendVarint(body.size(), &frame);
  frame.insert(frame.end(), body.begin(), body.end());
  return frame;
}

FrameReader::FrameReader(size_t max_frame_size)
    : max_frame_size_(max_frame_size) {}

void FrameReader::Append(const uint8_t* data, size_t length) {
  if (length == 0) {
    return;
  }
  buffer_.insert(buffer_.end(), data, data + length);
}

FrameReader::Status FrameReader::Next(std::vector<uint8_t>* body) {
  const uint8_t* start = buffer_.data() + offset_;
  const size_t available = buffer_.size() - offset_;
  uint64_t frame_length = 0;
  size_t prefix = 0;
  bool overflow = false;
  if (!ReadVarint(start, available, &frame_length, &prefix, &overflow)) {
    return overflow ? Status::kOversize : Status::kNeedMore;
  }
  if (frame_length > max_frame_size_) {
    return Status::kOversize;
  }
  if (available - prefix < frame_length) {
    return Status::kNeedMore;
  }
  body->assign(start + prefix, start + prefix + frame_length);
  offset_ += prefix + static_cast<size_t>(frame_length);
  Compact();
  return Status::kFrame;
}

void FrameReader::Reset() {
  buffer_.clear();
  offset_ = 0;
}

void FrameReader::Compact() {
  if (offset_ == buffer_.size()) {
    Reset();
    return;
  }
  // Reclaim the consumed prefix once it dominates the buffer.
  if (offset_ > 4096 && offset_ * 2 > buffer_.size()) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
  }
}

FrameCipher::FrameCipher(std::vector<uint8_t> read_key,
                         std::vector<uint8_t> write_key)
    : read_key_(std::move(read_key)), write_key_(std::move(write_key)) {}

FrameCipher::~FrameCipher() {
  std::fill(read_key_.begin(), read_key_.end(), 0);
  std::fill(write_key_.begin(), write_key_.end(), 0);
}

bool FrameCipher::valid() const {
  return read_key_.size() == kKeySize && write_key_.size() == kKeySize;
}

bool FrameCipher::Matches(const std::vector<uint8_t>& read_key,
                          const std::vector<uint8_t>& write_key) const {
  return read_key_ == read_key && write_key_ == write_key;
}

bool FrameCipher::Encrypt(const std::vector<uint8_t>& plaintext,
                          std::vector<uint8_t>* out, std::string* error) {
  auto fail = [&](const char* message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!valid()) {
    return fail("write key must be 32 bytes");
  }
  EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return fail("EVP_CIPHER_CTX_new failed");
  }
  const auto nonce = MakeNonce(write_counter_);
  if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, write_key_.data(),
                         nonce.data()) != 1) {
    return fail("chacha20-poly1305 encrypt init failed");
  }
  std::vector<uint8_t> result(plaintext.size() + kTagSize);
  int written = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), result.data(), &written, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    return fail("chacha20-poly1305 encrypt failed");
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), result.data() + written, &final_len) != 1) {
    return fail("chacha20-poly1305 encrypt final failed");
  }
  written += final_len;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                          static_cast<int>(kTagSize),
                          result.data() + written) != 1) {
    return fail("chacha20-poly1305 tag read failed");
  }
  result.resize(static_cast<size_t>(written) + kTagSize);
  ++write_counter_;
  *out = std::move(result);
  return true;
}

bool FrameCipher::Decrypt(const std::vector<uint8_t>& ciphertext,
                          std::vector<uint8_t>* out, std::string* error) {
  auto fail = [&](const char* message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!valid()) {
    return fail("read key must be 32 bytes");
  }
  if (ciphertext.size() < kTagSize) {
    ++read_counter_;
    return fail("encrypted frame shorter than tag");
  }
  const auto nonce = MakeNonce(read_counter_++);
  EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return fail("EVP_CIPHER_CTX_new failed");
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, read_key_.data(),
                         nonce.data()) != 1) {
    return fail("chacha20-poly1305 decrypt init failed");
  }
  const size_t body_size = ciphertext.size() - kTagSize;
  std::vector<uint8_t> tag(ciphertext.end() - kTagSize, ciphertext.end());
  std::vector<uint8_t> result(body_size + kTagSize);
  int written = 0;
  if (body_size > 0 &&
      EVP_DecryptUpdate(ctx.get(), result.data(), &written, ciphertext.data(),
                        static_cast<int>(body_size)) != 1) {
    return fail("chacha20-poly1305 decrypt failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                          static_cast<int>(kTagSize), tag.data()) != 1) {
    return fail("chacha20-poly1305 tag set failed");
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), result.data() + written, &final_len) != 1) {
    return fail("chacha20-poly1305 authentication failed");
  }
  result.resize(static_cast<size_t>(written + final_len));
  *out = std::move(result);
  return true;
}

bool EncodeMessage(const Message& message, std::vector<uint8_t>* out,
                   Error* error) {
  if (!out) {
    SetError(error, ErrorKind::kInvalidArgument, "output buffer must not be null");
    return false;
  }
  const int raw_type = static_cast<int>(message.type);
  if (!wire::ProtocolMessage_Type_IsValid(raw_type)) {
    SetError(error, ErrorKind::kInvalidArgument,
             "unsupported message type " + std::to_string(raw_type));
    return false;
  }
  if (message.has_payload() && TypeOfPayload(message.payload) != message.type) {
    SetError(error, ErrorKind::kInvalidArgument,
             std::string("payload does not match message type ") +
                 MessageTypeName(message.type));
    return false;
  }
  wire::ProtocolMessage pm;
  pm.set_type(static_cast<wire::ProtocolMessage_Type>(raw_type));
  if (!message.identifier.empty()) {
    pm.set_identifier(message.identifier);
  }
  if (message.error_code != 0) {
    pm.set_errorcode(message.error_code);
  }
  FillEnvelope(message.payload, &pm);
  std::string serialized;
  if (!pm.SerializeToString(&serialized)) {
    SetError(error, ErrorKind::kProtocol,
             std::string("failed to serialize ") + MessageTypeName(message.type));
    return false;
  }
  out->assign(serialized.begin(), serialized.end());
  return true;
}

bool DecodeMessage(const uint8_t* data, size_t length, Message* out,
                   Error* error) {
  if (!out) {
    SetError(error, ErrorKind::kInvalidArgument, "output message must not be null");
    return false;
  }
  wire::ProtocolMessage pm;
  if (!pm.ParseFromArray(data, static_cast<int>(length))) {
    SetError(error, ErrorKind::kProtocol,
             "failed to parse protocol message (" + std::to_string(length) +
                 " bytes)");
    return false;
  }
  Message message;
  message.type = static_cast<MessageType>(static_cast<int>(pm.type()));
  message.identifier = pm.identifier();
  message.error_code = pm.errorcode();
  message.payload = ReadPayload(pm, message.type);
  if (const auto* pairing = message.As<CryptoPairingPayload>()) {
    message.sequence = PairingSequence(pairing->pairing_data);
  }
  *out = std::move(message);
  return true;
}

void AppendTlv8(uint8_t type, const std::vector<uint8_t>& value,
                std::vector<uint8_t>* out) {
  if (value.empty()) {
    out->push_back(type);
    out->push_back(0);
    return;
  }
  size_t offset = 0;
  while (offset < value.size()) {
    const size_t chunk = std::min(kTlvMaxFragment, value.size() - offset);
    out->push_back(type);
    out->push_back(static_cast<uint8_t>(chunk));
    out->insert(out->end(), value.begin() + static_cast<std::ptrdiff_t>(offset),
                value.begin() + static_cast<std::ptrdiff_t>(offset + chunk));
    offset += chunk;
  }
}

bool ParseTlv8(const std::vector<uint8_t>& data,
               std::map<uint8_t, std::vector<uint8_t>>* out) {
  if (!out) {
    return false;
  }
  std::map<uint8_t, std::vector<uint8_t>> items;
  size_t offset = 0;
  while (offset < data.size()) {
    if (data.size() - offset < 2) {
      return false;
    }
    const uint8_t type = data[offset];
    const size_t length = data[offset + 1];
    offset += 2;
    if (data.size() - offset < length) {
      return false;
    }
    auto& value = items[type];
    value.insert(value.end(), data.begin() + static_cast<std::ptrdiff_t>(offset),
                 data.begin() + static_cast<std::ptrdiff_t>(offset + length));
    offset += length;
  }
  *out = std::move(items);
  return true;
}

}  // namespace mrp
