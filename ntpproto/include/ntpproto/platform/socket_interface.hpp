// Copyright (c) 2025
/**
 * @file socket_interface.hpp
 * @brief Platform-neutral UDP socket used by the sync service and tests.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ntpproto/export.hpp"

namespace ntpproto {
namespace platform {

/** @brief IPv4 endpoint (numeric address, no DNS). */
struct Endpoint {
  std::string address;  ///< Dotted-quad IPv4 address, e.g. "192.168.1.1"
  uint16_t port;

  Endpoint() : port(0) {}
  Endpoint(const std::string& addr, uint16_t p) : address(addr), port(p) {}
};

inline bool operator==(const Endpoint& a, const Endpoint& b) {
  return a.address == b.address && a.port == b.port;
}

inline bool operator!=(const Endpoint& a, const Endpoint& b) {
  return !(a == b);
}

/** @brief Datagram socket abstraction. */
class ISocket {
 public:
  virtual ~ISocket() = default;

  /** Create the underlying UDP socket. */
  virtual bool Initialize() = 0;

  /** Bind to INADDR_ANY:port (0 lets the OS choose). */
  virtual bool Bind(uint16_t port) = 0;

  /**
   * @brief Wait until a datagram is readable.
   * @param timeout_us Timeout in microseconds.
   * @return true if readable, false on timeout or error.
   */
  virtual bool WaitReadable(int64_t timeout_us) = 0;

  /**
   * @brief Receive one datagram.
   * @param from Sender endpoint (output).
   * @param data Payload (output, resized to the datagram length).
   * @param max_size Largest datagram accepted.
   */
  virtual bool Receive(Endpoint* from, std::vector<uint8_t>* data,
                       size_t max_size) = 0;

  /** Send one datagram to an endpoint. */
  virtual bool Send(const Endpoint& to, const std::vector<uint8_t>& data) = 0;

  /** Close the socket. Safe to call repeatedly. */
  virtual void Close() = 0;

  /** Description of the most recent failure. */
  virtual std::string GetLastError() const = 0;

  virtual bool IsValid() const = 0;
};

/** @brief Create the socket implementation for the current platform. */
NTPPROTO_API std::unique_ptr<ISocket> CreatePlatformSocket();

}  // namespace platform
}  // namespace ntpproto
