// Copyright (c) 2025 The NTP Sample Authors
#include "internal/udp_socket.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ntpsync {
namespace internal {

namespace {
constexpr int64_t kReceivePollUs = 200000;
constexpr size_t kMaxDatagram = 1500;
}  // namespace

UdpSocket::~UdpSocket() { Close(); }

bool UdpSocket::IsOpen() const { return socket_ && socket_->IsValid(); }

bool UdpSocket::Open(const std::string& server_ip, uint16_t server_port,
                     std::function<ntpproto::TimeSpec()> get_time,
                     LogCallback log) {
  if (IsOpen()) {
    return false;  // Already open
  }

  get_time_ = std::move(get_time);
  log_ = std::move(log);

  socket_ = ntpproto::platform::CreatePlatformSocket();
  if (!socket_->Initialize()) {
    Log(LogLevel::Error,
        "socket initialization failed: " + socket_->GetLastError());
    socket_.reset();
    return false;
  }

  // Ephemeral local port
  if (!socket_->Bind(0)) {
    Log(LogLevel::Error, "socket bind failed: " + socket_->GetLastError());
    socket_->Close();
    socket_.reset();
    return false;
  }

  server_endpoint_.address = server_ip;
  server_endpoint_.port = server_port;

  running_.store(true);
  recv_thread_ = std::thread(&UdpSocket::ReceiveLoop, this);
  return true;
}

void UdpSocket::Close() {
  if (!socket_) {
    return;
  }

  // Join first: the receive thread still uses the socket.
  running_.store(false);
  queue_cv_.notify_all();
  if (recv_thread_.joinable()) {
    recv_thread_.join();
  }

  socket_->Close();
  socket_.reset();

  std::lock_guard<std::mutex> lock(queue_mtx_);
  while (!msg_queue_.empty()) {
    msg_queue_.pop();
  }
}

bool UdpSocket::Send(const std::vector<uint8_t>& data) {
  if (!IsOpen()) {
    return false;
  }

  if (!socket_->Send(server_endpoint_, data)) {
    Log(LogLevel::Warning, "send failed: " + socket_->GetLastError());
    return false;
  }
  return true;
}

bool UdpSocket::WaitMessage(int timeout_ms, Message* out_msg) {
  if (!out_msg) {
    return false;
  }

  std::unique_lock<std::mutex> lock(queue_mtx_);
  if (msg_queue_.empty()) {
    if (timeout_ms <= 0) {
      return false;
    }
    queue_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
      return !msg_queue_.empty() || !running_.load();
    });
    if (msg_queue_.empty()) {
      return false;
    }
  }

  *out_msg = std::move(msg_queue_.front());
  msg_queue_.pop();
  return true;
}

void UdpSocket::ReceiveLoop() {
  while (running_.load()) {
    // Bounded wait so a Close() is noticed.
    if (!socket_->WaitReadable(kReceivePollUs)) {
      continue;
    }

    ntpproto::platform::Endpoint from;
    std::vector<uint8_t> data;
    if (!socket_->Receive(&from, &data, kMaxDatagram)) {
      if (running_.load()) {
        Log(LogLevel::Warning, "receive failed: " + socket_->GetLastError());
      }
      continue;
    }

    // Stamp before anything else touches the datagram.
    ntpproto::TimeSpec recv_time =
        get_time_ ? get_time_() : ntpproto::TimeSpec{};

    if (from != server_endpoint_) {
      Log(LogLevel::Debug, "ignored datagram from " + from.address + ":" +
                               std::to_string(from.port));
      continue;
    }

    // Short datagrams are queued too; the peer classifies them.
    {
      std::lock_guard<std::mutex> lock(queue_mtx_);
      msg_queue_.push(Message{std::move(data), recv_time});
    }
    queue_cv_.notify_one();
  }
}

void UdpSocket::Log(LogLevel level, const std::string& text) const {
  if (log_) {
    log_(level, "[UdpSocket] " + text);
  }
}

}  // namespace internal
}  // namespace ntpsync
