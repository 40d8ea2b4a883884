#pragma once

#include "mrp/codec.h"
#include "mrp/message.h"
#include "mrp/transport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mrp {

struct Credentials;

/**
 * Pending waits for inbound messages, keyed by type or by sequence number.
 *
 * Each entry resolves exactly once: on match, on timeout or when FailAll()
 * runs on close. A settled entry stays in the table until its caller
 * collects it with Await() or drops it with Cancel().
 */
class CorrelationTable {
 public:
  using WaitId = uint64_t;

  struct Result {
    bool ok = false;
    Message message;
    Error error;
  };

  CorrelationTable() = default;
  CorrelationTable(const CorrelationTable&) = delete;
  CorrelationTable& operator=(const CorrelationTable&) = delete;

  /// Wait for the next message of `type`; a non-empty `identifier` rejects
  /// replies that carry a different identifier.
  WaitId RegisterType(MessageType type, const std::string& identifier = {});
  WaitId RegisterSequence(uint32_t sequence);

  /// Block until the entry resolves or `timeout` expires, then remove it.
  /// An entry settled before this call returns its result immediately.
  bool Await(WaitId id, std::chrono::milliseconds timeout, Message* out,
             Error* error = nullptr);

  /// Resolve at most one waiter: type-keyed first, then sequence-keyed, each
  /// in registration order.
  bool Resolve(const Message& message);

  /// Fail every pending entry in registration order; returns how many.
  size_t FailAll(const Error& error);

  /// Remove an entry, settled or not.
  bool Cancel(WaitId id);

  /// Entries still waiting for a message.
  size_t size() const;

 private:
  struct Entry {
    bool by_sequence = false;
    MessageType type = MessageType::kUnknown;
    std::string identifier;
    uint32_t sequence = 0;
    bool settled = false;
    std::promise<Result> promise;
    std::shared_future<Result> future;
  };

  WaitId Insert(std::shared_ptr<Entry> entry);

  mutable std::mutex mutex_;
  WaitId next_id_ = 1;
  // Ordered by id, which is registration order.
  std::map<WaitId, std::shared_ptr<Entry>> entries_;
};

/**
 * Options that shape a Connection's timing and framing.
 */
struct ConnectionOptions {
  using LogCallback = std::function<void(const std::string&)>;

  std::chrono::milliseconds connect_timeout{5000};
  /// Deadline for Send(..., wait_for_response=true, ...).
  std::chrono::milliseconds response_timeout{5000};
  size_t max_frame_size = kDefaultMaxFrameSize;
  LogCallback log_callback;
};

/**
 * Counters for frame flow and errors on one connection.
 */
struct ConnectionMetrics {
  uint64_t messages_sent = 0;
  uint64_t messages_received = 0;
  uint64_t decode_errors = 0;
  uint64_t send_errors = 0;
};

/**
 * Framed, optionally encrypted message stream over a Transport.
 */
class Connection {
 public:
  using ConnectCallback = std::function<void()>;
  using MessageCallback = std::function<void(const Message&)>;
  using CloseCallback = std::function<void()>;
  using ErrorCallback = std::function<void(const Error&)>;
  using DebugCallback = std::function<void(const std::string&)>;

  Connection(std::string address, uint16_t port,
             std::unique_ptr<Transport> transport,
             ConnectionOptions options = ConnectionOptions());
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /// Connect the transport and start the reader and writer. Fails with
  /// kInvalidState when already open.
  bool Open(Error* error = nullptr);
  /// Close the transport and fail all pending waits. Idempotent.
  void Close();
  bool IsOpen() const { return open_; }

  /**
   * Queue `message` for writing and block until it has been written.
   *
   * The frame is encrypted when `credentials` carries both session keys.
   * When `wait_for_response` is true a wait keyed by the conventional
   * response type is registered before queuing, and `response` receives
   * the reply.
   */
  bool Send(const Message& message, bool wait_for_response, int priority,
            const Credentials* credentials, Message* response = nullptr,
            Error* error = nullptr);

  /// Send and wait for the conventional response within `timeout`.
  bool Request(const Message& message, int priority,
               const Credentials* credentials, std::chrono::milliseconds timeout,
               Message* response, Error* error = nullptr);

  /// Waits fail with kInvalidState when called from the thread that
  /// delivers inbound data, since that thread would have to read the reply.
  bool WaitForSequence(uint32_t sequence, std::chrono::milliseconds timeout,
                       Message* out, Error* error = nullptr);
  bool WaitForType(MessageType type, std::chrono::milliseconds timeout,
                   Message* out, Error* error = nullptr);

  void SetConnectCallback(ConnectCallback cb);
  /// Runs on the transport's reader thread, before the message is offered
  /// to pending waits.
  void SetMessageCallback(MessageCallback cb);
  void SetCloseCallback(CloseCallback cb);
  void SetErrorCallback(ErrorCallback cb);
  void SetDebugCallback(DebugCallback cb);

  /// Install session keys; later frames in both directions are encrypted.
  void InstallKeys(const SessionKeys& keys);
  bool encrypted() const;

  size_t PendingWaitCount() const { return waits_.size(); }
  size_t QueuedWriteCount() const;
  ConnectionMetrics GetMetrics() const;

  const std::string& address() const { return address_; }
  uint16_t port() const { return port_; }

 private:
  struct WriteRequest {
    int priority = 0;
    uint64_t order = 0;
    Message message;
    bool encrypt = false;
    std::promise<Error> done;
  };

  struct WriteOrder {
    bool operator()(const std::shared_ptr<WriteRequest>& a,
                    const std::shared_ptr<WriteRequest>& b) const;
  };

  bool Transmit(const Message& message, bool wait_for_response, int priority,
                const Credentials* credentials, std::chrono::milliseconds timeout,
                Message* response, Error* error);
  bool AwaitRegistered(CorrelationTable::WaitId id,
                       std::chrono::milliseconds timeout, Message* out,
                       Error* error);
  bool OnReaderThread() const;
  void WriterLoop();
  bool WriteOne(WriteRequest* request, Error* error);
  void HandleData(const uint8_t* data, size_t length);
  void HandleFrame(std::vector<uint8_t> body);
  void HandleTransportError(const std::string& message);
  void HandleTransportClose();
  void FailQueuedWrites(const Error& error);
  void EmitError(const Error& error);
  void EmitDebug(const std::string& message);
  void Log(const std::string& message) const;

  std::string address_;
  uint16_t port_ = 0;
  std::unique_ptr<Transport> transport_;
  ConnectionOptions options_;

  std::atomic<bool> open_{false};
  std::atomic<bool> close_emitted_{true};
  std::mutex lifecycle_mutex_;

  CorrelationTable waits_;

  mutable std::mutex write_mutex_;
  std::condition_variable write_cv_;
  std::vector<std::shared_ptr<WriteRequest>> write_queue_;
  uint64_t write_order_ = 0;
  bool writer_running_ = false;
  std::thread writer_thread_;
  std::atomic<std::thread::id> writer_thread_id_{std::thread::id()};

  std::mutex read_mutex_;
  FrameReader reader_;
  // Thread currently inside HandleData(), if any.
  std::atomic<std::thread::id> reader_thread_{std::thread::id()};

  mutable std::mutex cipher_mutex_;
  std::unique_ptr<FrameCipher> cipher_;

  std::mutex callback_mutex_;
  ConnectCallback connect_cb_;
  MessageCallback message_cb_;
  CloseCallback close_cb_;
  ErrorCallback error_cb_;
  DebugCallback debug_cb_;

  std::atomic<uint64_t> messages_sent_{0};
  std::atomic<uint64_t> messages_received_{0};
  std::atomic<uint64_t> decode_errors_{0};
  std::atomic<uint64_t> send_errors_{0};
};

}  // namespace mrp
