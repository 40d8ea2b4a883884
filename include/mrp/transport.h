#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mrp {

/**
 * Bidirectional byte stream used by a Connection.
 *
 * Implementations deliver inbound bytes, errors and the remote close through
 * the registered callbacks, typically from a background thread.
 */
class Transport {
 public:
  using DataCallback = std::function<void(const uint8_t* data, size_t length)>;
  using ErrorCallback = std::function<void(const std::string& message)>;
  using CloseCallback = std::function<void()>;

  virtual ~Transport() = default;

  /// Establish the stream and start delivering data.
  virtual bool Connect(const std::string& address, uint16_t port,
                       std::chrono::milliseconds timeout,
                       std::string* error) = 0;
  /// Write all of `data`; blocks until written or failed.
  virtual bool Write(const std::vector<uint8_t>& data, std::string* error) = 0;
  /// Tear down the stream. Safe to call more than once.
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  void SetDataCallback(DataCallback cb);
  void SetErrorCallback(ErrorCallback cb);
  void SetCloseCallback(CloseCallback cb);

 protected:
  void EmitData(const uint8_t* data, size_t length);
  void EmitError(const std::string& message);
  void EmitClose();

 private:
  std::mutex callback_mutex_;
  DataCallback data_cb_;
  ErrorCallback error_cb_;
  CloseCallback close_cb_;
};

/**
 * TCP transport over a POSIX socket with a select()-driven read thread.
 */
class TcpTransport : public Transport {
 public:
  TcpTransport() = default;
  /// Adopt an already-connected socket; Connect() then only starts reading.
  explicit TcpTransport(int connected_fd);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  bool Connect(const std::string& address, uint16_t port,
               std::chrono::milliseconds timeout,
               std::string* error) override;
  bool Write(const std::vector<uint8_t>& data, std::string* error) override;
  void Close() override;
  bool IsOpen() const override { return running_; }

 private:
  bool ConnectSocket(const std::string& address, uint16_t port,
                     std::chrono::milliseconds timeout, std::string* error);
  void RecvLoop();
  void CloseSocket();

  std::atomic<bool> running_{false};
  int fd_ = -1;
  int adopted_fd_ = -1;
  std::mutex write_mutex_;
  std::thread recv_thread_;
};

}  // namespace mrp
