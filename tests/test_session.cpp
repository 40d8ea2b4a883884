// Tests for the session handshake, command surface and event dispatch.
#include "mrp/mrp.h"
#include "mrp/test_hooks.h"

#include <gtest/gtest.h>

#include "fake_transport.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

std::vector<uint8_t> Key(uint8_t fill) {
  return std::vector<uint8_t>(mrp::FrameCipher::kKeySize, fill);
}

mrp::Config QuietConfig() {
  mrp::Config config;
  config.log_callback = [](const std::string&) {};
  return config;
}

mrp::DeviceDescriptor LivingRoom() {
  mrp::DeviceDescriptor device;
  device.name = "Living Room";
  device.address = "192.168.1.20";
  device.port = 49152;
  device.unique_identifier = "device-uid";
  return device;
}

struct SessionHarness {
  explicit SessionHarness(mrp::Config config = QuietConfig()) {
    auto transport = std::make_unique<mrp_test::FakeTransport>();
    fake = transport.get();
    device = std::make_unique<mrp_test::FakeDevice>(fake);
    session = std::make_unique<mrp::Session>(LivingRoom(), config,
                                             std::move(transport));
  }

  ~SessionHarness() { session.reset(); }

  mrp_test::FakeTransport* fake = nullptr;
  std::unique_ptr<mrp_test::FakeDevice> device;
  std::unique_ptr<mrp::Session> session;
};

// Runs one clear-text pairing step, then hands out fixed session keys.
class ScriptedVerifier : public mrp::Verifier {
 public:
  ScriptedVerifier(mrp_test::FakeDevice* device, mrp::SessionKeys keys)
      : device_(device), keys_(std::move(keys)) {}

  bool Verify(mrp::Session& session, const mrp::Credentials& credentials,
              mrp::SessionKeys* keys, mrp::Error* error) override {
    seen_pairing_id = credentials.pairing_id;
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    if (!failure.empty()) {
      error->kind = mrp::ErrorKind::kProtocol;
      error->message = failure;
      return false;
    }
    mrp::CryptoPairingPayload step;
    mrp::AppendTlv8(mrp::kTlvTypeState, {0x01}, &step.pairing_data);
    mrp::Message response;
    if (!session.SendMessage(mrp::MakeMessage(step), true, 0, &response, error)) {
      return false;
    }
    if (response.sequence.value_or(0) != 2) {
      error->kind = mrp::ErrorKind::kProtocol;
      error->message = "unexpected pairing step";
      return false;
    }
    device_->EnableEncryption(keys_);
    *keys = keys_;
    return true;
  }

  std::string failure;
  std::string seen_pairing_id;
  std::chrono::milliseconds delay{0};

 private:
  mrp_test::FakeDevice* device_;
  mrp::SessionKeys keys_;
};

mrp::Credentials PairedCredentials() {
  mrp::Credentials credentials;
  credentials.unique_identifier = "device-uid";
  credentials.pairing_id = "0F7A3C52-9D1B-4E61-8B0A-6C2D4E5F7081";
  credentials.device_public_key = Key(0x33);
  credentials.client_secret = Key(0x44);
  return credentials;
}

mrp::SetStatePayload QueueWithArtwork(std::vector<uint8_t> artwork) {
  mrp::SetStatePayload state;
  mrp::PlaybackQueue queue;
  mrp::ContentItem item;
  item.identifier = "item-1";
  item.title = "Track";
  item.artist = "Band";
  item.artwork_data = std::move(artwork);
  queue.content_items.push_back(item);
  state.playback_queue = queue;
  return state;
}

}  // namespace

TEST(SessionOpenTest, UnauthenticatedOpenSendsOnlyIntroduction) {
  mrp::Config config = QuietConfig();
  config.client_name = "Kitchen Remote";
  SessionHarness h(config);
  std::atomic<int> connects{0};
  h.session->SetConnectCallback([&]() { connects++; });

  mrp::Error error;
  ASSERT_TRUE(h.session->Open(nullptr, &error)) << error.message;
  EXPECT_EQ(h.session->GetState(), mrp::SessionState::kReady);
  EXPECT_EQ(connects.load(), 1);
  EXPECT_EQ(h.fake->last_address(), "192.168.1.20");

  const auto received = h.device->received();
  ASSERT_EQ(received.size(), 1u);
  EXPECT_FALSE(received[0].encrypted);
  const auto* intro = received[0].message.As<mrp::DeviceInfoPayload>();
  ASSERT_NE(intro, nullptr);
  EXPECT_EQ(intro->name, "Kitchen Remote");
  EXPECT_EQ(intro->unique_identifier, h.session->pairing_id());
  EXPECT_EQ(intro->application_bundle_identifier, config.application_bundle_identifier);
  EXPECT_EQ(intro->last_supported_message_type, 45u);
  EXPECT_TRUE(intro->allows_pairing);
  EXPECT_FALSE(received[0].message.identifier.empty());
}

TEST(SessionOpenTest, AuthenticatedOpenVerifiesAndEncrypts) {
  std::vector<std::string> debug;
  std::mutex debug_mutex;
  SessionHarness h;
  const mrp::SessionKeys keys{Key(0x01), Key(0x02)};
  auto verifier = std::make_shared<ScriptedVerifier>(h.device.get(), keys);
  h.session->SetVerifier(verifier);
  h.session->SetDebugCallback([&](const std::string& message) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    debug.push_back(message);
  });

  mrp::Credentials credentials = PairedCredentials();
  mrp::Error error;
  ASSERT_TRUE(h.session->Open(&credentials, &error)) << error.message;
  EXPECT_EQ(h.session->GetState(), mrp::SessionState::kReady);
  EXPECT_EQ(credentials.read_key, keys.read_key);
  EXPECT_EQ(credentials.write_key, keys.write_key);
  EXPECT_EQ(verifier->seen_pairing_id, credentials.pairing_id);
  EXPECT_EQ(h.session->pairing_id(), credentials.pairing_id);

  const auto received = h.device->received();
  ASSERT_EQ(received.size(), 4u);
  EXPECT_EQ(received[0].message.type, mrp::MessageType::kDeviceInfo);
  EXPECT_EQ(received[0].message.As<mrp::DeviceInfoPayload>()->unique_identifier,
            credentials.pairing_id);
  EXPECT_EQ(received[1].message.type, mrp::MessageType::kCryptoPairing);
  EXPECT_FALSE(received[1].encrypted);
  EXPECT_EQ(received[2].message.type, mrp::MessageType::kSetConnectionState);
  EXPECT_TRUE(received[2].encrypted);
  EXPECT_EQ(received[2].message.As<mrp::SetConnectionStatePayload>()->state,
            mrp::ConnectionState::kConnected);
  EXPECT_EQ(received[3].message.type, mrp::MessageType::kClientUpdatesConfig);
  EXPECT_TRUE(received[3].encrypted);
  EXPECT_TRUE(received[3].message.As<mrp::ClientUpdatesConfigPayload>()->now_playing_updates);

  std::lock_guard<std::mutex> lock(debug_mutex);
  EXPECT_NE(std::find(debug.begin(), debug.end(), "session keys installed"), debug.end());
}

TEST(SessionOpenTest, PollingWaitsUntilHandshakeCompletes) {
  mrp::Config config = QuietConfig();
  config.poll_interval = std::chrono::milliseconds(10);
  SessionHarness h(config);
  const mrp::SessionKeys keys{Key(0x07), Key(0x08)};
  auto verifier = std::make_shared<ScriptedVerifier>(h.device.get(), keys);
  verifier->delay = std::chrono::milliseconds(100);
  h.session->SetVerifier(verifier);
  h.session->AddNowPlayingListener([](const std::optional<mrp::NowPlayingInfo>&) {});

  mrp::Credentials credentials = PairedCredentials();
  mrp::Error error;
  ASSERT_TRUE(h.session->Open(&credentials, &error)) << error.message;
  EXPECT_GT(h.session->GetMetrics().poll_ticks_skipped, 0u);
  ASSERT_TRUE(mrp_test::WaitUntil([&]() {
    return !h.device->ReceivedOfType(mrp::MessageType::kPlaybackQueueRequest).empty();
  }));

  const auto received = h.device->received();
  ASSERT_GE(received.size(), 5u);
  EXPECT_EQ(received[0].message.type, mrp::MessageType::kDeviceInfo);
  EXPECT_EQ(received[1].message.type, mrp::MessageType::kCryptoPairing);
  EXPECT_EQ(received[2].message.type, mrp::MessageType::kSetConnectionState);
  EXPECT_EQ(received[3].message.type, mrp::MessageType::kClientUpdatesConfig);
  for (size_t i = 4; i < received.size(); ++i) {
    EXPECT_EQ(received[i].message.type, mrp::MessageType::kPlaybackQueueRequest);
    EXPECT_TRUE(received[i].encrypted);
  }
}

TEST(SessionOpenTest, EncryptedRequestsRoundTripAfterVerification) {
  SessionHarness h;
  const mrp::SessionKeys keys{Key(0x05), Key(0x06)};
  h.session->SetVerifier(std::make_shared<ScriptedVerifier>(h.device.get(), keys));
  h.device->set_queue_reply(QueueWithArtwork({0xff, 0xd8, 0xff}));

  mrp::Credentials credentials = PairedCredentials();
  ASSERT_TRUE(h.session->Open(&credentials));
  std::vector<uint8_t> artwork;
  mrp::Error error;
  ASSERT_TRUE(h.session->RequestArtwork(&artwork, &error)) << error.message;
  EXPECT_EQ(artwork, (std::vector<uint8_t>{0xff, 0xd8, 0xff}));
  EXPECT_TRUE(h.device->received().back().encrypted);
}

TEST(SessionOpenTest, CredentialsWithoutVerifierFailHandshake) {
  SessionHarness h;
  mrp::Credentials credentials = PairedCredentials();
  mrp::Error error;
  EXPECT_FALSE(h.session->Open(&credentials, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kHandshake);
  EXPECT_NE(error.message.find("no verifier"), std::string::npos);
  EXPECT_EQ(h.session->GetState(), mrp::SessionState::kClosed);
  EXPECT_EQ(h.session->GetLastError(), error.message);
  EXPECT_FALSE(credentials.HasSessionKeys());
}

TEST(SessionOpenTest, VerifierFailureClosesConnection) {
  SessionHarness h;
  auto verifier = std::make_shared<ScriptedVerifier>(
      h.device.get(), mrp::SessionKeys{Key(1), Key(2)});
  verifier->failure = "bad signature";
  h.session->SetVerifier(verifier);
  std::atomic<int> closes{0};
  h.session->SetCloseCallback([&]() { closes++; });

  mrp::Credentials credentials = PairedCredentials();
  mrp::Error error;
  EXPECT_FALSE(h.session->Open(&credentials, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kHandshake);
  EXPECT_EQ(error.message, "verification failed: bad signature");
  EXPECT_EQ(h.session->GetState(), mrp::SessionState::kClosed);
  EXPECT_EQ(closes.load(), 1);
  EXPECT_FALSE(credentials.HasSessionKeys());
}

TEST(SessionOpenTest, ShortSessionKeysAreRejected) {
  SessionHarness h;
  h.session->SetVerifier(std::make_shared<ScriptedVerifier>(
      h.device.get(), mrp::SessionKeys{std::vector<uint8_t>(16, 1), Key(2)}));
  mrp::Credentials credentials = PairedCredentials();
  mrp::Error error;
  EXPECT_FALSE(h.session->Open(&credentials, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kHandshake);
  EXPECT_NE(error.message.find("32 bytes"), std::string::npos);
  EXPECT_FALSE(credentials.HasSessionKeys());
}

TEST(SessionOpenTest, CredentialsNeedPairingId) {
  SessionHarness h;
  mrp::Credentials credentials = PairedCredentials();
  credentials.pairing_id.clear();
  mrp::Error error;
  EXPECT_FALSE(h.session->Open(&credentials, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kInvalidArgument);
  EXPECT_EQ(h.fake->connect_count(), 0);
}

TEST(SessionOpenTest, UnansweredIntroductionTimesOut) {
  mrp::Config config = QuietConfig();
  config.introduction_timeout = std::chrono::milliseconds(50);
  SessionHarness h(config);
  h.device->set_answer_introduction(false);

  mrp::Error error;
  EXPECT_FALSE(h.session->Open(nullptr, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kHandshake);
  EXPECT_EQ(error.message.rfind("introduction failed", 0), 0u);
  EXPECT_EQ(h.session->GetState(), mrp::SessionState::kClosed);
  EXPECT_FALSE(h.fake->IsOpen());
  EXPECT_EQ(mrp::test::PendingWaitCount(*h.session), 0u);
}

TEST(SessionOpenTest, ConnectFailureMarksSessionFailed) {
  SessionHarness h;
  h.fake->set_fail_connect(true);
  mrp::Error error;
  EXPECT_FALSE(h.session->Open(nullptr, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kTransport);
  EXPECT_EQ(h.session->GetState(), mrp::SessionState::kFailed);
  EXPECT_EQ(h.session->GetLastError(), "connection refused");

  // A caller-driven retry succeeds once the device is reachable.
  h.fake->set_fail_connect(false);
  ASSERT_TRUE(h.session->Open(nullptr, &error)) << error.message;
  EXPECT_EQ(h.session->GetState(), mrp::SessionState::kReady);
}

TEST(SessionOpenTest, OpenWhileReadyIsRejected) {
  SessionHarness h;
  ASSERT_TRUE(h.session->Open());
  mrp::Error error;
  EXPECT_FALSE(h.session->Open(nullptr, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kInvalidState);
  EXPECT_EQ(h.fake->connect_count(), 1);
}

TEST(SessionOpenTest, CloseThenReopenKeepsPairingIdentity) {
  SessionHarness h;
  std::atomic<int> closes{0};
  h.session->SetCloseCallback([&]() { closes++; });
  ASSERT_TRUE(h.session->Open());
  const std::string pairing_id = h.session->pairing_id();

  h.session->Close();
  h.session->Close();
  EXPECT_EQ(h.session->GetState(), mrp::SessionState::kClosed);
  EXPECT_EQ(closes.load(), 1);

  h.device->ClearReceived();
  ASSERT_TRUE(h.session->Open());
  EXPECT_EQ(h.fake->connect_count(), 2);
  const auto intros = h.device->ReceivedOfType(mrp::MessageType::kDeviceInfo);
  ASSERT_EQ(intros.size(), 1u);
  EXPECT_EQ(intros[0].As<mrp::DeviceInfoPayload>()->unique_identifier, pairing_id);
}

TEST(SessionOpenTest, TransportErrorFailsSession) {
  SessionHarness h;
  std::vector<mrp::ErrorKind> kinds;
  std::mutex kinds_mutex;
  h.session->SetErrorCallback([&](const mrp::Error& error) {
    std::lock_guard<std::mutex> lock(kinds_mutex);
    kinds.push_back(error.kind);
  });
  ASSERT_TRUE(h.session->Open());

  h.fake->RemoteError("connection reset by peer");
  ASSERT_TRUE(mrp_test::WaitUntil(
      [&]() { return h.session->GetState() == mrp::SessionState::kFailed; }));
  std::lock_guard<std::mutex> lock(kinds_mutex);
  ASSERT_EQ(kinds.size(), 1u);
  EXPECT_EQ(kinds[0], mrp::ErrorKind::kTransport);
}

TEST(SessionOpenTest, RemoteCloseClosesSession) {
  SessionHarness h;
  ASSERT_TRUE(h.session->Open());
  h.fake->RemoteClose();
  ASSERT_TRUE(mrp_test::WaitUntil(
      [&]() { return h.session->GetState() == mrp::SessionState::kClosed; }));

  mrp::Error error;
  EXPECT_FALSE(h.session->SendKeyCommand(mrp::Key::kUp, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kConnectionClosed);
}

TEST(SessionCommandTest, ArtworkRequestUsesRequestedSize) {
  SessionHarness h;
  h.device->set_queue_reply(QueueWithArtwork({0x89, 0x50, 0x4e, 0x47}));
  ASSERT_TRUE(h.session->Open());

  std::vector<uint8_t> artwork;
  mrp::Error error;
  ASSERT_TRUE(h.session->RequestArtwork(640, 480, &artwork, &error)) << error.message;
  EXPECT_EQ(artwork, (std::vector<uint8_t>{0x89, 0x50, 0x4e, 0x47}));

  ASSERT_TRUE(h.session->RequestArtwork(&artwork, &error)) << error.message;

  const auto requests = h.device->ReceivedOfType(mrp::MessageType::kPlaybackQueueRequest);
  ASSERT_EQ(requests.size(), 2u);
  const auto* sized = requests[0].As<mrp::PlaybackQueueRequestPayload>();
  ASSERT_NE(sized, nullptr);
  EXPECT_EQ(sized->length, 1);
  EXPECT_EQ(sized->location, 0);
  EXPECT_DOUBLE_EQ(sized->artwork_width.value(), 640.0);
  EXPECT_DOUBLE_EQ(sized->artwork_height.value(), 480.0);
  EXPECT_FALSE(sized->request_id.empty());
  const auto* defaults = requests[1].As<mrp::PlaybackQueueRequestPayload>();
  EXPECT_DOUBLE_EQ(defaults->artwork_width.value(), 400.0);
  EXPECT_DOUBLE_EQ(defaults->artwork_height.value(), 400.0);
  EXPECT_NE(defaults->request_id, sized->request_id);
}

TEST(SessionCommandTest, MissingArtworkIsApplicationError) {
  SessionHarness h;
  h.device->set_queue_reply(QueueWithArtwork({}));
  ASSERT_TRUE(h.session->Open());

  std::vector<uint8_t> artwork;
  mrp::Error error;
  EXPECT_FALSE(h.session->RequestArtwork(&artwork, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kApplication);
  EXPECT_EQ(error.message, "no artwork available");
  EXPECT_TRUE(artwork.empty());
  EXPECT_TRUE(h.fake->IsOpen());
}

TEST(SessionCommandTest, PlaybackQueueRequestProjectsReply) {
  SessionHarness h;
  mrp::SetStatePayload reply = QueueWithArtwork({});
  reply.display_id = "com.apple.TVMusic";
  reply.playback_state = mrp::PlaybackState::kPlaying;
  h.device->set_queue_reply(reply);
  ASSERT_TRUE(h.session->Open());

  mrp::PlaybackQueueRequestOptions options;
  options.length = 5;
  options.include_metadata = true;
  mrp::NowPlayingInfo info;
  mrp::Error error;
  ASSERT_TRUE(h.session->RequestPlaybackQueue(options, &info, &error)) << error.message;
  EXPECT_EQ(info.title, "Track");
  EXPECT_EQ(info.artist, "Band");
  EXPECT_EQ(info.app_bundle_identifier, "com.apple.TVMusic");
  EXPECT_EQ(info.playback_state, mrp::PlaybackState::kPlaying);

  const auto requests = h.device->ReceivedOfType(mrp::MessageType::kPlaybackQueueRequest);
  ASSERT_EQ(requests.size(), 1u);
  const auto* sent = requests[0].As<mrp::PlaybackQueueRequestPayload>();
  EXPECT_EQ(sent->length, 5);
  EXPECT_TRUE(sent->include_metadata);
}

TEST(SessionCommandTest, KeyCommandSendsPressThenRelease) {
  SessionHarness h;
  ASSERT_TRUE(h.session->Open());
  mrp::Error error;
  ASSERT_TRUE(h.session->SendKeyCommand(mrp::Key::kSelect, &error)) << error.message;

  const auto events = h.device->ReceivedOfType(mrp::MessageType::kSendHidEvent);
  ASSERT_EQ(events.size(), 2u);
  const size_t at = mrp::test::kHidUsagePageOffset;
  const auto& press = events[0].As<mrp::SendHidEventPayload>()->hid_event_data;
  const auto& release = events[1].As<mrp::SendHidEventPayload>()->hid_event_data;
  ASSERT_EQ(press.size(), 60u);
  EXPECT_EQ(press[at + 1], 1);
  EXPECT_EQ(press[at + 3], 0x89);
  EXPECT_EQ(press[at + 5], 1);
  EXPECT_EQ(release[at + 5], 0);
  EXPECT_EQ(press, mrp::test::BuildHidEventData(1, 0x89, true));
}

TEST(SessionCommandTest, WakeDeviceSendsWakeMessage) {
  SessionHarness h;
  ASSERT_TRUE(h.session->Open());
  ASSERT_TRUE(h.session->WakeDevice());
  EXPECT_EQ(h.device->ReceivedOfType(mrp::MessageType::kWakeDevice).size(), 1u);
}

TEST(SessionCommandTest, MessageOfTypeIgnoresEarlierMessages) {
  SessionHarness h;
  std::atomic<int> messages{0};
  ASSERT_TRUE(h.session->Open());
  h.session->SetMessageCallback([&](const mrp::Message&) { messages++; });

  mrp::Message state;
  state.type = mrp::MessageType::kSetState;
  h.device->Push(state);
  // The reply to a waiting request arrives after the pushed message, so the
  // pushed one has been fully dispatched once it returns.
  ASSERT_TRUE(h.session->RequestPlaybackQueue(mrp::PlaybackQueueRequestOptions(),
                                              nullptr));
  EXPECT_TRUE(mrp_test::WaitUntil([&]() { return messages.load() == 2; }));

  mrp::Error error;
  EXPECT_FALSE(h.session->MessageOfType(mrp::MessageType::kSetState,
                                        std::chrono::milliseconds(30), nullptr,
                                        &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kTimeout);
  EXPECT_NE(error.message.find("SetStateMessage"), std::string::npos);
  EXPECT_EQ(mrp::test::PendingWaitCount(*h.session), 0u);
  EXPECT_EQ(h.session->GetMetrics().timeouts, 1u);

  mrp::Message out;
  bool resolved = false;
  std::thread waiter([&]() {
    resolved = h.session->MessageOfType(mrp::MessageType::kSetState,
                                        std::chrono::milliseconds(2000), &out);
  });
  ASSERT_TRUE(mrp_test::WaitUntil(
      [&]() { return mrp::test::PendingWaitCount(*h.session) == 1; }));
  state.identifier = "later";
  h.device->Push(state);
  waiter.join();
  EXPECT_TRUE(resolved);
  EXPECT_EQ(out.identifier, "later");
}

TEST(SessionCommandTest, WaitForSequenceMatchesPairingStep) {
  SessionHarness h;
  ASSERT_TRUE(h.session->Open());

  mrp::Message out;
  bool resolved = false;
  std::thread waiter([&]() {
    resolved = h.session->WaitForSequence(4, std::chrono::milliseconds(2000), &out);
  });
  ASSERT_TRUE(mrp_test::WaitUntil(
      [&]() { return mrp::test::PendingWaitCount(*h.session) == 1; }));

  mrp::CryptoPairingPayload step;
  mrp::AppendTlv8(mrp::kTlvTypeState, {0x04}, &step.pairing_data);
  h.device->Push(mrp::MakeMessage(step));
  waiter.join();
  EXPECT_TRUE(resolved);
  EXPECT_EQ(out.sequence.value(), 4u);

  mrp::Error error;
  EXPECT_FALSE(h.session->WaitForSequence(5, std::chrono::milliseconds(20), nullptr,
                                          &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kTimeout);
  EXPECT_NE(error.message.find("sequence 5"), std::string::npos);
}

TEST(SessionCommandTest, PairRequiresOpenConnection) {
  class OneStepPairing : public mrp::Pairing {
   public:
    bool InitiatePair(mrp::Session& session, PinCompletion* completion,
                      mrp::Error* error) override {
      mrp::CryptoPairingPayload step;
      mrp::AppendTlv8(mrp::kTlvTypeState, {0x01}, &step.pairing_data);
      if (!session.SendMessage(mrp::MakeMessage(step), true, 0, nullptr, error)) {
        return false;
      }
      *completion = [](const std::string& pin, mrp::Credentials* credentials,
                       mrp::Error*) {
        credentials->pairing_id = "paired-" + pin;
        return true;
      };
      return true;
    }
  };

  SessionHarness h;
  OneStepPairing pairing;
  mrp::Pairing::PinCompletion completion;
  mrp::Error error;
  EXPECT_FALSE(h.session->Pair(pairing, &completion, &error));
  EXPECT_EQ(error.kind, mrp::ErrorKind::kInvalidState);

  ASSERT_TRUE(h.session->Open());
  ASSERT_TRUE(h.session->Pair(pairing, &completion, &error)) << error.message;
  ASSERT_TRUE(completion);
  mrp::Credentials credentials;
  EXPECT_TRUE(completion("1234", &credentials, &error));
  EXPECT_EQ(credentials.pairing_id, "paired-1234");
}

TEST(SessionDispatchTest, EmptyStateMeansNothingPlaying) {
  SessionHarness h;
  std::mutex mutex;
  std::vector<std::optional<mrp::NowPlayingInfo>> updates;
  h.session->AddNowPlayingListener([&](const std::optional<mrp::NowPlayingInfo>& info) {
    std::lock_guard<std::mutex> lock(mutex);
    updates.push_back(info);
  });
  ASSERT_TRUE(h.session->Open());

  mrp::Message state;
  state.type = mrp::MessageType::kSetState;
  h.device->Push(state);
  ASSERT_TRUE(mrp_test::WaitUntil([&]() {
    std::lock_guard<std::mutex> lock(mutex);
    return updates.size() == 1;
  }));
  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_FALSE(updates[0].has_value());
}

TEST(SessionDispatchTest, StateSectionsAreEmittedWhenPresent) {
  SessionHarness h;
  std::mutex mutex;
  std::vector<mrp::NowPlayingInfo> now_playing;
  std::vector<std::vector<mrp::SupportedCommand>> commands;
  std::vector<mrp::PlaybackQueue> queues;
  std::atomic<int> messages{0};

  h.session->AddNowPlayingListener([&](const std::optional<mrp::NowPlayingInfo>& info) {
    std::lock_guard<std::mutex> lock(mutex);
    if (info) {
      now_playing.push_back(*info);
    }
  });
  h.session->AddSupportedCommandsListener(
      [&](const std::vector<mrp::SupportedCommand>& list) {
        std::lock_guard<std::mutex> lock(mutex);
        commands.push_back(list);
      });
  h.session->SetPlaybackQueueCallback([&](const mrp::PlaybackQueue& queue) {
    std::lock_guard<std::mutex> lock(mutex);
    queues.push_back(queue);
  });
  ASSERT_TRUE(h.session->Open());
  h.session->SetMessageCallback([&](const mrp::Message&) { messages++; });

  // Commands only: no now-playing emission.
  mrp::SetStatePayload only_commands;
  only_commands.supported_commands =
      std::vector<mrp::CommandInfo>{{mrp::Command::kPause, true, false, false}};
  h.device->Push(mrp::MakeMessage(only_commands));

  mrp::SetStatePayload full = QueueWithArtwork({});
  mrp::NowPlayingInfoData info;
  info.title = "Now";
  full.now_playing_info = info;
  h.device->Push(mrp::MakeMessage(full));

  // The queue callback runs last for the second message.
  ASSERT_TRUE(mrp_test::WaitUntil([&]() {
    std::lock_guard<std::mutex> lock(mutex);
    return queues.size() == 1;
  }));
  EXPECT_EQ(messages.load(), 2);
  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_EQ(now_playing.size(), 1u);
  EXPECT_EQ(now_playing[0].title, "Now");
  ASSERT_EQ(commands.size(), 1u);
  ASSERT_EQ(commands[0].size(), 1u);
  EXPECT_EQ(commands[0][0].command, mrp::Command::kPause);
  ASSERT_EQ(queues.size(), 1u);
  EXPECT_EQ(queues[0].content_items[0].identifier, "item-1");
}

TEST(SessionDispatchTest, ListenerCanIssueWaitingRequest) {
  std::atomic<bool> done{false};
  bool ok = false;
  std::vector<uint8_t> artwork;
  mrp::Error error;
  SessionHarness h;
  h.device->set_queue_reply(QueueWithArtwork({0x01, 0x02, 0x03}));
  h.session->AddNowPlayingListener([&](const std::optional<mrp::NowPlayingInfo>& info) {
    if (!info || done.load()) {
      return;
    }
    ok = h.session->RequestArtwork(&artwork, &error);
    done = true;
  });
  ASSERT_TRUE(h.session->Open());

  mrp::SetStatePayload state;
  mrp::NowPlayingInfoData info;
  info.title = "Next Track";
  state.now_playing_info = info;
  const auto start = std::chrono::steady_clock::now();
  h.device->Push(mrp::MakeMessage(state));

  ASSERT_TRUE(mrp_test::WaitUntil([&]() { return done.load(); }));
  EXPECT_TRUE(ok) << error.message;
  EXPECT_EQ(artwork, (std::vector<uint8_t>{0x01, 0x02, 0x03}));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(2000));
}

TEST(SessionDispatchTest, ThrowingCallbackIsCounted) {
  SessionHarness h;
  std::atomic<int> listener_calls{0};
  h.session->AddNowPlayingListener(
      [&](const std::optional<mrp::NowPlayingInfo>&) { listener_calls++; });
  ASSERT_TRUE(h.session->Open());
  h.session->SetMessageCallback(
      [](const mrp::Message&) { throw std::runtime_error("listener bug"); });

  mrp::Message state;
  state.type = mrp::MessageType::kSetState;
  h.device->Push(state);
  ASSERT_TRUE(mrp_test::WaitUntil([&]() { return listener_calls.load() == 1; }));
  EXPECT_EQ(h.session->GetMetrics().callback_exceptions, 1u);
  EXPECT_TRUE(h.fake->IsOpen());
}
