#include "mrp/message.h"

#include <type_traits>

namespace mrp {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kTransport:
      return "transport";
    case ErrorKind::kHandshake:
      return "handshake";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kProtocol:
      return "protocol";
    case ErrorKind::kApplication:
      return "application";
    case ErrorKind::kConnectionClosed:
      return "connection_closed";
    case ErrorKind::kInvalidState:
      return "invalid_state";
    case ErrorKind::kInvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

const char* MessageTypeName(MessageType type) {
  switch (type) {
    case MessageType::kUnknown:
      return "UnknownMessage";
    case MessageType::kSendCommand:
      return "SendCommandMessage";
    case MessageType::kSendCommandResult:
      return "SendCommandResultMessage";
    case MessageType::kGetState:
      return "GetStateMessage";
    case MessageType::kSetState:
      return "SetStateMessage";
    case MessageType::kSetArtwork:
      return "SetArtworkMessage";
    case MessageType::kSendHidEvent:
      return "SendHIDEventMessage";
    case MessageType::kNotification:
      return "NotificationMessage";
    case MessageType::kDeviceInfo:
      return "DeviceInfoMessage";
    case MessageType::kClientUpdatesConfig:
      return "ClientUpdatesConfigMessage";
    case MessageType::kVolumeControlAvailability:
      return "VolumeControlAvailabilityMessage";
    case MessageType::kPlaybackQueueRequest:
      return "PlaybackQueueRequestMessage";
    case MessageType::kTransaction:
      return "TransactionMessage";
    case MessageType::kCryptoPairing:
      return "CryptoPairingMessage";
    case MessageType::kSetReadyState:
      return "SetReadyStateMessage";
    case MessageType::kDeviceInfoUpdate:
      return "DeviceInfoUpdateMessage";
    case MessageType::kSetConnectionState:
      return "SetConnectionStateMessage";
    case MessageType::kWakeDevice:
      return "WakeDeviceMessage";
    case MessageType::kGeneric:
      return "GenericMessage";
  }
  return "UnlistedMessage";
}

MessageType ResponseTypeFor(MessageType request) {
  switch (request) {
    case MessageType::kPlaybackQueueRequest:
    case MessageType::kGetState:
      return MessageType::kSetState;
    case MessageType::kSendCommand:
      return MessageType::kSendCommandResult;
    default:
      return request;
  }
}

MessageType TypeOfPayload(const Payload& payload) {
  return std::visit(
      [](const auto& body) -> MessageType {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, DeviceInfoPayload>) {
          return MessageType::kDeviceInfo;
        } else if constexpr (std::is_same_v<T, ClientUpdatesConfigPayload>) {
          return MessageType::kClientUpdatesConfig;
        } else if constexpr (std::is_same_v<T, SetConnectionStatePayload>) {
          return MessageType::kSetConnectionState;
        } else if constexpr (std::is_same_v<T, PlaybackQueueRequestPayload>) {
          return MessageType::kPlaybackQueueRequest;
        } else if constexpr (std::is_same_v<T, SendHidEventPayload>) {
          return MessageType::kSendHidEvent;
        } else if constexpr (std::is_same_v<T, WakeDevicePayload>) {
          return MessageType::kWakeDevice;
        } else if constexpr (std::is_same_v<T, CryptoPairingPayload>) {
          return MessageType::kCryptoPairing;
        } else if constexpr (std::is_same_v<T, SetStatePayload>) {
          return MessageType::kSetState;
        } else {
          return MessageType::kUnknown;
        }
      },
      payload);
}

Message MakeMessage(Payload payload) {
  Message message;
  message.type = TypeOfPayload(payload);
  message.payload = std::move(payload);
  return message;
}

}  // namespace mrp
