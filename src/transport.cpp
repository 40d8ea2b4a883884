#include "mrp/transport.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mrp {
namespace {

constexpr size_t kRecvBufferSize = 16 * 1024;

std::string ErrnoMessage(const char* call) {
  return std::string(call) + " failed: " + std::strerror(errno);
}

timeval ToTimeval(std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return tv;
}

}  // namespace

void Transport::SetDataCallback(DataCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  data_cb_ = std::move(cb);
}

void Transport::SetErrorCallback(ErrorCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_cb_ = std::move(cb);
}

void Transport::SetCloseCallback(CloseCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  close_cb_ = std::move(cb);
}

void Transport::EmitData(const uint8_t* data, size_t length) {
  DataCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = data_cb_;
  }
  if (cb) {
    cb(data, length);
  }
}

void Transport::EmitError(const std::string& message) {
  ErrorCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = error_cb_;
  }
  if (cb) {
    cb(message);
  }
}

void Transport::EmitClose() {
  CloseCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = close_cb_;
  }
  if (cb) {
    cb();
  }
}

TcpTransport::TcpTransport(int connected_fd) : adopted_fd_(connected_fd) {}

TcpTransport::~TcpTransport() {
  Close();
  if (recv_thread_.joinable()) {
    recv_thread_.join();
  }
  if (adopted_fd_ >= 0) {
    ::close(adopted_fd_);
    adopted_fd_ = -1;
  }
}

bool TcpTransport::Connect(const std::string& address, uint16_t port,
                           std::chrono::milliseconds timeout,
                           std::string* error) {
  if (running_) {
    if (error) {
      *error = "transport already connected";
    }
    return false;
  }
  // A previous reader may still be winding down after a remote close.
  if (recv_thread_.joinable()) {
    recv_thread_.join();
  }
  CloseSocket();
  if (adopted_fd_ >= 0) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    fd_ = adopted_fd_;
    adopted_fd_ = -1;
  } else if (!ConnectSocket(address, port, timeout, error)) {
    return false;
  }
  running_ = true;
  recv_thread_ = std::thread(&TcpTransport::RecvLoop, this);
  return true;
}

bool TcpTransport::ConnectSocket(const std::string& address, uint16_t port,
                                 std::chrono::milliseconds timeout,
                                 std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const std::string service = std::to_string(port);
  const int rc = ::getaddrinfo(address.c_str(), service.c_str(), &hints, &result);
  if (rc != 0 || result == nullptr) {
    return fail("resolve(" + address + ") failed: " + ::gai_strerror(rc));
  }
  sockaddr_in addr{};
  std::memcpy(&addr, result->ai_addr, sizeof(addr));
  ::freeaddrinfo(result);

  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return fail(ErrnoMessage("socket()"));
  }
  auto close_and_fail = [&](const std::string& message) {
    ::close(fd);
    return fail(message);
  };

  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return close_and_fail(ErrnoMessage("fcntl(O_NONBLOCK)"));
  }
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (errno != EINPROGRESS) {
      std::ostringstream oss;
      oss << "connect(" << address << ":" << port << ") failed: "
          << std::strerror(errno);
      return close_and_fail(oss.str());
    }
    fd_set writefds;
    FD_ZERO(&writefds);
    FD_SET(fd, &writefds);
    timeval tv = ToTimeval(timeout);
    const int ready = ::select(fd + 1, nullptr, &writefds, nullptr, &tv);
    if (ready < 0) {
      return close_and_fail(ErrnoMessage("select()"));
    }
    if (ready == 0) {
      std::ostringstream oss;
      oss << "connect(" << address << ":" << port << ") timed out after "
          << timeout.count() << " ms";
      return close_and_fail(oss.str());
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
      return close_and_fail(ErrnoMessage("getsockopt(SO_ERROR)"));
    }
    if (so_error != 0) {
      std::ostringstream oss;
      oss << "connect(" << address << ":" << port << ") failed: "
          << std::strerror(so_error);
      return close_and_fail(oss.str());
    }
  }
  if (::fcntl(fd, F_SETFL, flags) < 0) {
    return close_and_fail(ErrnoMessage("fcntl(restore flags)"));
  }
  int nodelay = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0) {
    return close_and_fail(ErrnoMessage("setsockopt(TCP_NODELAY)"));
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  fd_ = fd;
  return true;
}

bool TcpTransport::Write(const std::vector<uint8_t>& data, std::string* error) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (fd_ < 0 || !running_) {
    if (error) {
      *error = "transport not connected";
    }
    return false;
  }
  size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t sent = ::send(fd_, data.data() + offset, data.size() - offset,
                                MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (error) {
        *error = ErrnoMessage("send()");
      }
      return false;
    }
    offset += static_cast<size_t>(sent);
  }
  return true;
}

void TcpTransport::Close() {
  running_ = false;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }
  // Called from the reader itself on a remote close; it is joined by the
  // next Connect() or the destructor.
  if (recv_thread_.joinable() &&
      recv_thread_.get_id() != std::this_thread::get_id()) {
    recv_thread_.join();
  }
  CloseSocket();
}

void TcpTransport::CloseSocket() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void TcpTransport::RecvLoop() {
  int fd = -1;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    fd = fd_;
  }
  std::array<uint8_t, kRecvBufferSize> buffer{};
  while (running_) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(fd, &readfds);
    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = 200000;
    const int ready = ::select(fd + 1, &readfds, nullptr, nullptr, &tv);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (!running_.exchange(false)) {
        return;
      }
      EmitError(ErrnoMessage("select()"));
      EmitClose();
      return;
    }
    if (ready == 0 || !FD_ISSET(fd, &readfds)) {
      continue;
    }
    const ssize_t bytes = ::recv(fd, buffer.data(), buffer.size(), 0);
    if (bytes > 0) {
      EmitData(buffer.data(), static_cast<size_t>(bytes));
      continue;
    }
    if (bytes < 0 && (errno == EINTR || errno == EAGAIN)) {
      continue;
    }
    // Local Close() already cleared running_; only report remote endings.
    if (!running_.exchange(false)) {
      return;
    }
    if (bytes < 0) {
      EmitError(ErrnoMessage("recv()"));
    }
    EmitClose();
    return;
  }
}

}  // namespace mrp
