// Copyright (c) 2025 <Your Name>
/**
 * @file udp_socket.hpp
 * @brief UDP socket bound to one source, with a background receive thread.
 *
 * Each source worker owns one UdpSocket. The receive thread timestamps
 * datagrams on arrival (t4) and queues them, so the worker never blocks on
 * recvfrom and the destination timestamp is taken as close to the wire as
 * possible.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "ntpproto/platform/socket_interface.hpp"
#include "ntpproto/time_spec.hpp"
#include "ntpsync/log.hpp"

namespace ntpsync {
namespace internal {

/**
 * @brief UDP socket manager with background receive thread.
 */
class UdpSocket {
 public:
  /**
   * @brief Received datagram with its local receive timestamp.
   */
  struct Message {
    std::vector<uint8_t> data;     ///< Raw datagram bytes
    ntpproto::TimeSpec recv_time;  ///< Destination timestamp (t4)
  };

  UdpSocket() = default;
  ~UdpSocket();

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  /**
   * @brief Open an ephemeral socket and start the receive thread.
   *
   * @param server_ip Source IPv4 address (numeric string, no DNS).
   * @param server_port Source UDP port.
   * @param get_time Clock used to stamp arrivals.
   * @param log Optional sink.
   * @return true on success, false if already open or the socket failed.
   */
  bool Open(const std::string& server_ip, uint16_t server_port,
            std::function<ntpproto::TimeSpec()> get_time,
            LogCallback log = LogCallback());

  /**
   * @brief Stop the receive thread, then close the socket.
   *
   * Safe to call multiple times.
   */
  void Close();

  /** Send a datagram to the source. */
  bool Send(const std::vector<uint8_t>& data);

  /**
   * @brief Wait for a queued datagram.
   *
   * @param timeout_ms Maximum wait; 0 only checks the queue.
   * @param out_msg Receives the datagram.
   * @return true if a datagram was dequeued.
   */
  bool WaitMessage(int timeout_ms, Message* out_msg);

  bool IsOpen() const;

 private:
  void ReceiveLoop();
  void Log(LogLevel level, const std::string& text) const;

  std::unique_ptr<ntpproto::platform::ISocket> socket_;
  ntpproto::platform::Endpoint server_endpoint_;
  std::function<ntpproto::TimeSpec()> get_time_;
  LogCallback log_;
  std::atomic<bool> running_{false};
  std::thread recv_thread_;

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::queue<Message> msg_queue_;
};

}  // namespace internal
}  // namespace ntpsync
