#include "mrp/connection.h"

#include "mrp/credentials.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace mrp {
namespace {

void SetError(Error* error, ErrorKind kind, const std::string& message) {
  if (error) {
    error->kind = kind;
    error->message = message;
  }
}

// The reply to a wait started on the reader thread could never be read.
constexpr char kReaderThreadWait[] =
    "cannot wait for a reply on the connection reader thread";

}  // namespace

CorrelationTable::WaitId CorrelationTable::RegisterType(
    MessageType type, const std::string& identifier) {
  auto entry = std::make_shared<Entry>();
  entry->type = type;
  entry->identifier = identifier;
  return Insert(std::move(entry));
}

CorrelationTable::WaitId CorrelationTable::RegisterSequence(uint32_t sequence) {
  auto entry = std::make_shared<Entry>();
  entry->by_sequence = true;
  entry->sequence = sequence;
  return Insert(std::move(entry));
}

CorrelationTable::WaitId CorrelationTable::Insert(std::shared_ptr<Entry> entry) {
  entry->future = entry->promise.get_future().share();
  std::lock_guard<std::mutex> lock(mutex_);
  const WaitId id = next_id_++;
  entries_.emplace(id, std::move(entry));
  return id;
}

bool CorrelationTable::Await(WaitId id, std::chrono::milliseconds timeout,
                             Message* out, Error* error) {
  std::shared_future<Result> future;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
      SetError(error, ErrorKind::kInvalidState, "unknown wait");
      return false;
    }
    future = it->second->future;
  }
  if (future.wait_for(timeout) != std::future_status::ready) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end() || !it->second->settled) {
      if (it != entries_.end()) {
        entries_.erase(it);
      }
      std::ostringstream oss;
      oss << "no response within " << timeout.count() << " ms";
      SetError(error, ErrorKind::kTimeout, oss.str());
      return false;
    }
    // Settled between the timeout and the lookup; take the result.
  }
  const Result result = future.get();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(id);
  }
  if (!result.ok) {
    if (error) {
      *error = result.error;
    }
    return false;
  }
  if (out) {
    *out = result.message;
  }
  return true;
}

bool CorrelationTable::Resolve(const Message& message) {
  std::shared_ptr<Entry> matched;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = std::find_if(entries_.begin(), entries_.end(), [&](const auto& item) {
      const Entry& entry = *item.second;
      if (entry.settled || entry.by_sequence || entry.type != message.type) {
        return false;
      }
      return entry.identifier.empty() || message.identifier.empty() ||
             entry.identifier == message.identifier;
    });
    if (found == entries_.end() && message.sequence.has_value()) {
      found = std::find_if(entries_.begin(), entries_.end(), [&](const auto& item) {
        const Entry& entry = *item.second;
        return !entry.settled && entry.by_sequence &&
               entry.sequence == message.sequence.value();
      });
    }
    if (found == entries_.end()) {
      return false;
    }
    matched = found->second;
    matched->settled = true;
  }
  Result result;
  result.ok = true;
  result.message = message;
  matched->promise.set_value(std::move(result));
  return true;
}

size_t CorrelationTable::FailAll(const Error& error) {
  std::vector<std::shared_ptr<Entry>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& item : entries_) {
      if (!item.second->settled) {
        item.second->settled = true;
        pending.push_back(item.second);
      }
    }
  }
  for (auto& entry : pending) {
    Result result;
    result.error = error;
    entry->promise.set_value(std::move(result));
  }
  return pending.size();
}

bool CorrelationTable::Cancel(WaitId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(id) > 0;
}

size_t CorrelationTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [](const auto& item) { return !item.second->settled; }));
}

bool Connection::WriteOrder::operator()(const std::shared_ptr<WriteRequest>& a,
                                        const std::shared_ptr<WriteRequest>& b) const {
  // Heap order: higher priority first, FIFO within a priority.
  if (a->priority != b->priority) {
    return a->priority < b->priority;
  }
  return a->order > b->order;
}

Connection::Connection(std::string address, uint16_t port,
                       std::unique_ptr<Transport> transport,
                       ConnectionOptions options)
    : address_(std::move(address)),
      port_(port),
      transport_(std::move(transport)),
      options_(std::move(options)),
      reader_(options_.max_frame_size) {
  if (!transport_) {
    transport_ = std::make_unique<TcpTransport>();
  }
  transport_->SetDataCallback(
      [this](const uint8_t* data, size_t length) { HandleData(data, length); });
  transport_->SetErrorCallback(
      [this](const std::string& message) { HandleTransportError(message); });
  transport_->SetCloseCallback([this]() { HandleTransportClose(); });
}

Connection::~Connection() {
  Close();
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
  transport_->SetDataCallback(nullptr);
  transport_->SetErrorCallback(nullptr);
  transport_->SetCloseCallback(nullptr);
}

bool Connection::Open(Error* error) {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (open_) {
      SetError(error, ErrorKind::kInvalidState, "connection already open");
      return false;
    }
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
    {
      std::lock_guard<std::mutex> read_lock(read_mutex_);
      reader_.Reset();
    }
    {
      std::lock_guard<std::mutex> cipher_lock(cipher_mutex_);
      cipher_.reset();
    }
    std::string message;
    if (!transport_->Connect(address_, port_, options_.connect_timeout, &message)) {
      Log("connect failed: " + message);
      SetError(error, ErrorKind::kTransport, message);
      return false;
    }
    {
      std::lock_guard<std::mutex> write_lock(write_mutex_);
      writer_running_ = true;
    }
    writer_thread_ = std::thread(&Connection::WriterLoop, this);
    close_emitted_ = false;
    open_ = true;
  }
  EmitDebug("connected to " + address_ + ":" + std::to_string(port_));
  ConnectCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = connect_cb_;
  }
  if (cb) {
    cb();
  }
  return true;
}

void Connection::Close() {
  // Only the first closer tears down; a reader or writer thread that races
  // a user Close() returns here instead of waiting on its own join.
  if (!open_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    {
      std::lock_guard<std::mutex> write_lock(write_mutex_);
      writer_running_ = false;
    }
    write_cv_.notify_all();
    // Waiters are released before the transport joins its reader, which may
    // itself be blocked in a callback waiting for a reply.
    const Error closed{ErrorKind::kConnectionClosed, "connection closed"};
    FailQueuedWrites(closed);
    waits_.FailAll(closed);
    transport_->Close();
    // The writer closes the connection itself after a failed write.
    if (writer_thread_.joinable() &&
        writer_thread_.get_id() != std::this_thread::get_id()) {
      writer_thread_.join();
    }
  }
  if (close_emitted_.exchange(true)) {
    return;
  }
  EmitDebug("connection closed");
  CloseCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = close_cb_;
  }
  if (cb) {
    cb();
  }
}

bool Connection::Send(const Message& message, bool wait_for_response,
                      int priority, const Credentials* credentials,
                      Message* response, Error* error) {
  return Transmit(message, wait_for_response, priority, credentials,
                  options_.response_timeout, response, error);
}

bool Connection::Request(const Message& message, int priority,
                         const Credentials* credentials,
                         std::chrono::milliseconds timeout, Message* response,
                         Error* error) {
  return Transmit(message, true, priority, credentials, timeout, response, error);
}

bool Connection::Transmit(const Message& message, bool wait_for_response,
                          int priority, const Credentials* credentials,
                          std::chrono::milliseconds timeout, Message* response,
                          Error* error) {
  if (!open_) {
    SetError(error, ErrorKind::kConnectionClosed, "connection is not open");
    return false;
  }
  if (wait_for_response && OnReaderThread()) {
    SetError(error, ErrorKind::kInvalidState, kReaderThreadWait);
    return false;
  }
  if (writer_thread_id_.load() == std::this_thread::get_id()) {
    SetError(error, ErrorKind::kInvalidState,
             "cannot send from the connection writer thread");
    return false;
  }
  auto request = std::make_shared<WriteRequest>();
  request->priority = priority;
  request->message = message;
  request->encrypt = credentials != nullptr && credentials->HasSessionKeys();
  if (request->encrypt) {
    std::lock_guard<std::mutex> lock(cipher_mutex_);
    if (!cipher_ || !cipher_->Matches(credentials->read_key, credentials->write_key)) {
      cipher_ = std::make_unique<FrameCipher>(credentials->read_key,
                                              credentials->write_key);
    }
  }

  CorrelationTable::WaitId wait_id = 0;
  if (wait_for_response) {
    if (request->message.identifier.empty()) {
      request->message.identifier = GenerateIdentifier();
    }
    wait_id = waits_.RegisterType(ResponseTypeFor(message.type),
                                  request->message.identifier);
  }

  std::future<Error> done = request->done.get_future();
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!writer_running_) {
      if (wait_for_response) {
        waits_.Cancel(wait_id);
      }
      SetError(error, ErrorKind::kConnectionClosed, "connection is not open");
      return false;
    }
    request->order = write_order_++;
    write_queue_.push_back(request);
    std::push_heap(write_queue_.begin(), write_queue_.end(), WriteOrder());
  }
  write_cv_.notify_one();

  const Error written = done.get();
  if (written.kind != ErrorKind::kNone) {
    if (wait_for_response) {
      waits_.Cancel(wait_id);
    }
    if (error) {
      *error = written;
    }
    return false;
  }
  if (!wait_for_response) {
    return true;
  }
  Message reply;
  if (!waits_.Await(wait_id, timeout, &reply, error)) {
    return false;
  }
  if (response) {
    *response = std::move(reply);
  }
  return true;
}

bool Connection::WaitForSequence(uint32_t sequence,
                                 std::chrono::milliseconds timeout,
                                 Message* out, Error* error) {
  if (!open_) {
    SetError(error, ErrorKind::kConnectionClosed, "connection is not open");
    return false;
  }
  if (OnReaderThread()) {
    SetError(error, ErrorKind::kInvalidState, kReaderThreadWait);
    return false;
  }
  const auto id = waits_.RegisterSequence(sequence);
  return AwaitRegistered(id, timeout, out, error);
}

bool Connection::WaitForType(MessageType type, std::chrono::milliseconds timeout,
                             Message* out, Error* error) {
  if (!open_) {
    SetError(error, ErrorKind::kConnectionClosed, "connection is not open");
    return false;
  }
  if (OnReaderThread()) {
    SetError(error, ErrorKind::kInvalidState, kReaderThreadWait);
    return false;
  }
  const auto id = waits_.RegisterType(type);
  return AwaitRegistered(id, timeout, out, error);
}

bool Connection::AwaitRegistered(CorrelationTable::WaitId id,
                                 std::chrono::milliseconds timeout, Message* out,
                                 Error* error) {
  // A Close() that ran between the open check and the registration has
  // already failed every wait it could see.
  if (!open_) {
    waits_.Cancel(id);
    SetError(error, ErrorKind::kConnectionClosed, "connection closed");
    return false;
  }
  return waits_.Await(id, timeout, out, error);
}

bool Connection::OnReaderThread() const {
  return reader_thread_.load() == std::this_thread::get_id();
}

void Connection::SetConnectCallback(ConnectCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  connect_cb_ = std::move(cb);
}

void Connection::SetMessageCallback(MessageCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  message_cb_ = std::move(cb);
}

void Connection::SetCloseCallback(CloseCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  close_cb_ = std::move(cb);
}

void Connection::SetErrorCallback(ErrorCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_cb_ = std::move(cb);
}

void Connection::SetDebugCallback(DebugCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  debug_cb_ = std::move(cb);
}

void Connection::InstallKeys(const SessionKeys& keys) {
  std::lock_guard<std::mutex> lock(cipher_mutex_);
  cipher_ = std::make_unique<FrameCipher>(keys.read_key, keys.write_key);
}

bool Connection::encrypted() const {
  std::lock_guard<std::mutex> lock(cipher_mutex_);
  return cipher_ != nullptr;
}

size_t Connection::QueuedWriteCount() const {
  std::lock_guard<std::mutex> lock(write_mutex_);
  return write_queue_.size();
}

ConnectionMetrics Connection::GetMetrics() const {
  ConnectionMetrics metrics;
  metrics.messages_sent = messages_sent_.load();
  metrics.messages_received = messages_received_.load();
  metrics.decode_errors = decode_errors_.load();
  metrics.send_errors = send_errors_.load();
  return metrics;
}

void Connection::WriterLoop() {
  writer_thread_id_ = std::this_thread::get_id();
  while (true) {
    std::shared_ptr<WriteRequest> request;
    {
      std::unique_lock<std::mutex> lock(write_mutex_);
      write_cv_.wait(lock, [this]() { return !writer_running_ || !write_queue_.empty(); });
      if (!writer_running_) {
        return;
      }
      std::pop_heap(write_queue_.begin(), write_queue_.end(), WriteOrder());
      request = std::move(write_queue_.back());
      write_queue_.pop_back();
    }
    Error result;
    const bool ok = WriteOne(request.get(), &result);
    request->done.set_value(result);
    if (!ok && result.kind == ErrorKind::kTransport && open_) {
      HandleTransportError(result.message);
      Close();
      return;
    }
  }
}

bool Connection::WriteOne(WriteRequest* request, Error* error) {
  std::vector<uint8_t> body;
  if (!EncodeMessage(request->message, &body, error)) {
    send_errors_.fetch_add(1);
    Log("encode failed: " + error->message);
    return false;
  }
  if (request->encrypt) {
    std::lock_guard<std::mutex> lock(cipher_mutex_);
    if (!cipher_) {
      send_errors_.fetch_add(1);
      SetError(error, ErrorKind::kInvalidState, "no session keys installed");
      return false;
    }
    std::vector<uint8_t> sealed;
    std::string message;
    if (!cipher_->Encrypt(body, &sealed, &message)) {
      send_errors_.fetch_add(1);
      SetError(error, ErrorKind::kProtocol, message);
      return false;
    }
    body = std::move(sealed);
  }
  std::string message;
  if (!transport_->Write(BuildFrame(body), &message)) {
    send_errors_.fetch_add(1);
    SetError(error, ErrorKind::kTransport, message);
    return false;
  }
  messages_sent_.fetch_add(1);
  EmitDebug(std::string("sent ") + MessageTypeName(request->message.type));
  return true;
}

void Connection::HandleData(const uint8_t* data, size_t length) {
  const std::thread::id self = std::this_thread::get_id();
  reader_thread_ = self;
  std::vector<std::vector<uint8_t>> bodies;
  bool oversize = false;
  {
    std::lock_guard<std::mutex> lock(read_mutex_);
    reader_.Append(data, length);
    while (true) {
      std::vector<uint8_t> body;
      const auto status = reader_.Next(&body);
      if (status == FrameReader::Status::kFrame) {
        bodies.push_back(std::move(body));
        continue;
      }
      oversize = status == FrameReader::Status::kOversize;
      break;
    }
    if (oversize) {
      reader_.Reset();
    }
  }
  for (auto& body : bodies) {
    HandleFrame(std::move(body));
  }
  if (oversize) {
    std::ostringstream oss;
    oss << "inbound frame exceeds " << options_.max_frame_size << " bytes";
    Log(oss.str());
    EmitError(Error{ErrorKind::kProtocol, oss.str()});
    Close();
  }
  std::thread::id expected = self;
  reader_thread_.compare_exchange_strong(expected, std::thread::id());
}

void Connection::HandleFrame(std::vector<uint8_t> body) {
  {
    std::lock_guard<std::mutex> lock(cipher_mutex_);
    if (cipher_) {
      std::vector<uint8_t> plain;
      std::string message;
      if (!cipher_->Decrypt(body, &plain, &message)) {
        decode_errors_.fetch_add(1);
        const Error error{ErrorKind::kProtocol, "decrypt failed: " + message};
        EmitDebug(error.message);
        EmitError(error);
        return;
      }
      body = std::move(plain);
    }
  }
  Message message;
  Error error;
  if (!DecodeMessage(body.data(), body.size(), &message, &error)) {
    decode_errors_.fetch_add(1);
    EmitDebug(error.message);
    EmitError(error);
    return;
  }
  messages_received_.fetch_add(1);
  EmitDebug(std::string("received ") + MessageTypeName(message.type));

  MessageCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = message_cb_;
  }
  if (cb) {
    cb(message);
  }
  waits_.Resolve(message);
}

void Connection::HandleTransportError(const std::string& message) {
  Log("transport error: " + message);
  EmitError(Error{ErrorKind::kTransport, message});
}

void Connection::HandleTransportClose() {
  EmitDebug("transport closed by peer");
  Close();
}

void Connection::FailQueuedWrites(const Error& error) {
  std::vector<std::shared_ptr<WriteRequest>> pending;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    pending.swap(write_queue_);
  }
  for (auto& request : pending) {
    request->done.set_value(error);
  }
}

void Connection::EmitError(const Error& error) {
  ErrorCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = error_cb_;
  }
  if (cb) {
    cb(error);
  }
}

void Connection::EmitDebug(const std::string& message) {
  DebugCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = debug_cb_;
  }
  if (cb) {
    cb(message);
  }
}

void Connection::Log(const std::string& message) const {
  if (options_.log_callback) {
    options_.log_callback(message);
    return;
  }
  std::cerr << "[mrp] " << message << std::endl;
}

}  // namespace mrp
