#pragma once

/** \file frame.hpp
 *  \brief Journal frame encode/decode and CRC32C verification (pure, in-memory).
 *
 * Layout (little-endian on all platforms):
 *   u32 magic | u32 len | u16 type | u16 reserved | u64 lsn | payload | u32 crc32c
 * len counts the whole frame; crc32c covers everything before it.
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "photolens/error.hpp"

namespace photolens::wal {

constexpr std::uint32_t WAL_MAGIC = 0x4C4F4850u; // "PHOL"
constexpr std::size_t WAL_HEADER_SIZE = 4 + 4 + 2 + 2 + 8; // 20 bytes
constexpr std::uint32_t MAX_FRAME_LEN = 64u * 1024u * 1024u;

/** Frame types. Only record operations are journaled today. */
enum : std::uint16_t { FRAME_RECORD_OP = 1 };

struct WalFrame {
  std::uint32_t magic;
  std::uint32_t len;       // total length including header+payload+CRC
  std::uint16_t type;
  std::uint16_t reserved;  // 0
  std::uint64_t lsn;       // log sequence number
  std::span<const std::uint8_t> payload; // does not own memory
  std::uint32_t crc32c;    // Castagnoli over [magic..payload]
};

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

// Verify CRC32C of a full frame buffer (includes CRC at the end)
auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool;

// Encode a frame into a contiguous byte vector; rejects payloads that overflow len
auto encode_frame(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

// Decode a frame from a contiguous buffer (no allocations for payload)
auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<WalFrame, core::error>;

} // namespace photolens::wal
