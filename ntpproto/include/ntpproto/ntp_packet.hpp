// Copyright (c) 2025 <Your Name>
/**
 * @file ntp_packet.hpp
 * @brief NTPv4 header codec and protocol constants.
 *
 * The 48-byte header is carried big-endian on the wire:
 *
 *   - LI (2 bits) | VN (3 bits) | Mode (3 bits)
 *   - stratum (8 bits), poll (int8, log2 s), precision (int8, log2 s)
 *   - root delay, root dispersion (NTP short format, 16.16 seconds)
 *   - reference id (32 bits)
 *   - reference, origin, receive, transmit timestamps (32.32 seconds)
 *
 * Extension fields and a MAC may follow the header. They are opaque to this
 * codec and are left to the authentication collaborator.
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "ntpproto/export.hpp"
#include "ntpproto/time_spec.hpp"

namespace ntpproto {

/** @brief NTP epoch offset from UNIX epoch (seconds, 1900-01-01 vs 1970-01-01).
 */
constexpr uint32_t kNtpUnixEpochDiff = 2208988800UL;

/** @brief Size of the fixed NTP header in bytes. */
constexpr size_t kNtpHeaderSize = 48;

/** @brief Protocol version emitted by this implementation. */
constexpr uint8_t kNtpVersion = 4;

/** @brief Leap indicator (2 bits). */
enum class LeapIndicator : uint8_t {
  NoWarning = 0,
  AddSecond = 1,
  DelSecond = 2,
  Unsynchronized = 3,  ///< Alarm condition, clock not synchronized
};

/** @brief Association mode (3 bits). */
enum class Mode : uint8_t {
  Reserved = 0,
  SymmetricActive = 1,
  SymmetricPassive = 2,
  Client = 3,
  Server = 4,
  Broadcast = 5,
  Control = 6,
  Private = 7,
};

/**
 * @brief Decoded NTP header in host representation.
 *
 * Timestamps stay in raw 32.32 form so that origin matching is exact; use
 * TimeSpec::FromNtpTimestamp to convert.
 */
struct NtpHeader {
  LeapIndicator leap = LeapIndicator::NoWarning;
  uint8_t version = kNtpVersion;
  Mode mode = Mode::Client;
  uint8_t stratum = 0;
  int8_t poll = 0;
  int8_t precision = 0;
  double root_delay = 0.0;       ///< Seconds
  double root_dispersion = 0.0;  ///< Seconds
  uint32_t ref_id = 0;
  uint64_t reference_ts = 0;
  uint64_t origin_ts = 0;
  uint64_t receive_ts = 0;
  uint64_t transmit_ts = 0;
};

/** @brief Build a reference id from four ASCII characters. */
constexpr uint32_t MakeRefId(char a, char b, char c, char d) {
  return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24) |
         (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8) |
         static_cast<uint32_t>(static_cast<uint8_t>(d));
}

/** @brief Kiss-o'-Death codes carried in ref_id when stratum is 0. */
namespace kiss {
constexpr uint32_t kDeny = MakeRefId('D', 'E', 'N', 'Y');
constexpr uint32_t kRstr = MakeRefId('R', 'S', 'T', 'R');
constexpr uint32_t kRate = MakeRefId('R', 'A', 'T', 'E');
}  // namespace kiss

/**
 * @brief Decode the fixed header from a datagram.
 *
 * @param bytes Raw datagram (extension fields after byte 48 are ignored).
 * @param out Decoded header on success; untouched on failure.
 * @return false if the datagram is shorter than 48 bytes or out is null.
 * @test
 * @brief Short datagrams are rejected.
 * @steps Parse a 47-byte buffer.
 * @expected Function returns false.
 */
NTPPROTO_API bool ParseHeader(const std::vector<uint8_t>& bytes,
                              NtpHeader* out);

/**
 * @brief Encode a header into exactly 48 big-endian bytes.
 */
NTPPROTO_API std::vector<uint8_t> SerializeHeader(const NtpHeader& h);

/** @brief Convert NTP short format (16.16) to seconds. */
NTPPROTO_API double ShortToSeconds(uint32_t v);

/** @brief Convert seconds to NTP short format, saturating at the range. */
NTPPROTO_API uint32_t SecondsToShort(double seconds);

/** @brief Convert a log2 precision/poll exponent to seconds. */
inline double Log2ToSeconds(int exponent) {
  return std::ldexp(1.0, exponent);
}

}  // namespace ntpproto
