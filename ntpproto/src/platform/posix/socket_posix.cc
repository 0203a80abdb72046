// Copyright (c) 2025
/**
 * @file socket_posix.cc
 * @brief BSD-sockets backend for ISocket (Linux, macOS).
 */
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "ntpproto/platform/socket_interface.hpp"

namespace ntpproto {
namespace platform {

namespace {

std::string ErrnoText(const char* what) {
  const int err = errno;
  return std::string(what) + " (errno " + std::to_string(err) + ": " +
         std::strerror(err) + ")";
}

sockaddr_in AnyAddress(uint16_t port) {
  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  sa.sin_addr.s_addr = htonl(INADDR_ANY);
  sa.sin_port = htons(port);
  return sa;
}

bool ToSockaddr(const Endpoint& ep, sockaddr_in* sa) {
  *sa = AnyAddress(ep.port);
  return inet_pton(AF_INET, ep.address.c_str(), &sa->sin_addr) == 1;
}

Endpoint FromSockaddr(const sockaddr_in& sa) {
  char text[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &sa.sin_addr, text, sizeof(text)) == nullptr) {
    text[0] = '\0';
  }
  return Endpoint(text, ntohs(sa.sin_port));
}

}  // namespace

class SocketPosix : public ISocket {
 public:
  SocketPosix() = default;
  ~SocketPosix() override { Close(); }

  bool Initialize() override {
    if (fd_ >= 0) return true;
    fd_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ < 0) return Fail(ErrnoText("socket"));
    return true;
  }

  bool Bind(uint16_t port) override {
    if (fd_ < 0) return Fail("socket not open");
    const int on = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
      return Fail(ErrnoText("setsockopt(SO_REUSEADDR)"));
    }
    const sockaddr_in sa = AnyAddress(port);
    if (bind(fd_, reinterpret_cast<const sockaddr*>(&sa), sizeof(sa)) < 0) {
      return Fail(ErrnoText("bind"));
    }
    return true;
  }

  bool WaitReadable(int64_t timeout_us) override {
    if (fd_ < 0) return Fail("socket not open");
    pollfd p{};
    p.fd = fd_;
    p.events = POLLIN;
    const int ms = timeout_us > 0 ? static_cast<int>(timeout_us / 1000) : 0;
    const int rc = poll(&p, 1, ms);
    if (rc < 0) {
      // EINTR: the caller polls again.
      if (errno != EINTR) Fail(ErrnoText("poll"));
      return false;
    }
    return rc > 0 && (p.revents & POLLIN);
  }

  bool Receive(Endpoint* from, std::vector<uint8_t>* data,
               size_t max_size) override {
    if (fd_ < 0) return Fail("socket not open");
    if (!from || !data) return Fail("null output argument");
    data->assign(max_size, 0);
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    const ssize_t n = recvfrom(fd_, data->data(), data->size(), 0,
                               reinterpret_cast<sockaddr*>(&sa), &len);
    if (n < 0) {
      data->clear();
      return Fail(ErrnoText("recvfrom"));
    }
    // Empty datagrams are delivered; the codec rejects them.
    data->resize(static_cast<size_t>(n));
    *from = FromSockaddr(sa);
    return true;
  }

  bool Send(const Endpoint& to, const std::vector<uint8_t>& data) override {
    if (fd_ < 0) return Fail("socket not open");
    sockaddr_in sa{};
    if (!ToSockaddr(to, &sa)) return Fail("not an IPv4 address: " + to.address);
    const ssize_t n = sendto(fd_, data.data(), data.size(), 0,
                             reinterpret_cast<const sockaddr*>(&sa), sizeof(sa));
    if (n < 0) return Fail(ErrnoText("sendto"));
    if (static_cast<size_t>(n) != data.size()) {
      return Fail("short send: " + std::to_string(n) + "/" +
                  std::to_string(data.size()) + " bytes");
    }
    return true;
  }

  void Close() override {
    if (fd_ < 0) return;
    shutdown(fd_, SHUT_RDWR);
    close(fd_);
    fd_ = -1;
  }

  std::string GetLastError() const override { return last_error_; }
  bool IsValid() const override { return fd_ >= 0; }

 private:
  bool Fail(const std::string& why) {
    last_error_ = why;
    return false;
  }

  int fd_ = -1;
  std::string last_error_;
};

std::unique_ptr<ISocket> CreatePlatformSocket() {
  return std::make_unique<SocketPosix>();
}

}  // namespace platform
}  // namespace ntpproto
