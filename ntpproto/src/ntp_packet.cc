// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file ntp_packet.cc
 * @brief Implementation of the NTP header codec.
 */
#include "ntpproto/ntp_packet.hpp"

#include <cmath>
#include <vector>

namespace ntpproto {

bool ParseHeader(const std::vector<uint8_t>& bytes, NtpHeader* out) {
  if (out == nullptr) return false;
  if (bytes.size() < kNtpHeaderSize) return false;

  auto rd32 = [&](size_t at) {
    return (static_cast<uint32_t>(bytes[at]) << 24) |
           (static_cast<uint32_t>(bytes[at + 1]) << 16) |
           (static_cast<uint32_t>(bytes[at + 2]) << 8) |
           (static_cast<uint32_t>(bytes[at + 3]));
  };
  auto rd64 = [&](size_t at) {
    return (static_cast<uint64_t>(rd32(at)) << 32) |
           static_cast<uint64_t>(rd32(at + 4));
  };

  NtpHeader h;
  const uint8_t li_vn_mode = bytes[0];
  h.leap = static_cast<LeapIndicator>((li_vn_mode >> 6) & 0x03U);
  h.version = static_cast<uint8_t>((li_vn_mode >> 3) & 0x07U);
  h.mode = static_cast<Mode>(li_vn_mode & 0x07U);
  h.stratum = bytes[1];
  h.poll = static_cast<int8_t>(bytes[2]);
  h.precision = static_cast<int8_t>(bytes[3]);
  h.root_delay = ShortToSeconds(rd32(4));
  h.root_dispersion = ShortToSeconds(rd32(8));
  h.ref_id = rd32(12);
  h.reference_ts = rd64(16);
  h.origin_ts = rd64(24);
  h.receive_ts = rd64(32);
  h.transmit_ts = rd64(40);

  *out = h;
  return true;
}

std::vector<uint8_t> SerializeHeader(const NtpHeader& h) {
  std::vector<uint8_t> out;
  out.reserve(kNtpHeaderSize);

  auto append_be32 = [&](uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xffU));
    out.push_back(static_cast<uint8_t>(v & 0xffU));
  };
  auto append_be64 = [&](uint64_t v) {
    append_be32(static_cast<uint32_t>(v >> 32));
    append_be32(static_cast<uint32_t>(v & 0xFFFFFFFFu));
  };

  out.push_back(static_cast<uint8_t>(
      ((static_cast<uint8_t>(h.leap) & 0x03U) << 6) |
      ((h.version & 0x07U) << 3) | (static_cast<uint8_t>(h.mode) & 0x07U)));
  out.push_back(h.stratum);
  out.push_back(static_cast<uint8_t>(h.poll));
  out.push_back(static_cast<uint8_t>(h.precision));
  append_be32(SecondsToShort(h.root_delay));
  append_be32(SecondsToShort(h.root_dispersion));
  append_be32(h.ref_id);
  append_be64(h.reference_ts);
  append_be64(h.origin_ts);
  append_be64(h.receive_ts);
  append_be64(h.transmit_ts);
  return out;
}

double ShortToSeconds(uint32_t v) {
  return static_cast<double>(v) / 65536.0;
}

uint32_t SecondsToShort(double seconds) {
  if (!std::isfinite(seconds) || seconds <= 0.0) return 0U;
  const double scaled = std::round(seconds * 65536.0);
  if (scaled >= 4294967295.0) return 0xFFFFFFFFu;
  return static_cast<uint32_t>(scaled);
}

}  // namespace ntpproto
