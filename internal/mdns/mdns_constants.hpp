#pragma once

#include <cstddef>
#include <cstdint>

namespace castproxy::mdns {

inline constexpr uint16_t kMdnsPort            = 5353;
inline constexpr const char* kMdnsGroupIPv4    = "224.0.0.251";
inline constexpr const char* kGoogleCastService = "_googlecast._tcp.local";

enum RecordType : uint16_t {
  kTypeA    = 1,
  kTypePTR  = 12,
  kTypeTXT  = 16,
  kTypeSRV  = 33,
  kTypeANY  = 255,
};

inline constexpr uint16_t kClassIN = 1;

// Top bit of the class field: QU (unicast response requested) in
// questions, cache-flush in resource records.
inline constexpr uint16_t kClassTopBit = 0x8000;
inline constexpr uint16_t kClassMask   = 0x7FFF;

// Header flags
inline constexpr uint16_t kFlagResponse      = 0x8000;
inline constexpr uint16_t kFlagAuthoritative = 0x0400;
inline constexpr uint16_t kOpcodeMask        = 0x7800;

// RFC 6762 section 6.7: legacy unicast responses carry TTLs no higher than this.
inline constexpr uint32_t kLegacyUnicastMaxTtl = 10;

inline constexpr size_t kMaxLabelLength = 63;
inline constexpr size_t kMaxNameLength  = 255;

} // namespace castproxy::mdns
