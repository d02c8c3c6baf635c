#pragma once

#include "bytes_view.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace s3session {

using Digest = std::array<std::uint8_t, 16>;

// Object key for a payload uploaded at `timestamp`: "<timestamp>_<name>".
std::string MakeObjectKey(std::int64_t timestamp, const std::string& name);

// Local file name a downloaded key is written to: prefix + last path
// component of the key.
std::string LocalNameForKey(const std::string& prefix, const std::string& key);

// XXH3-128 of the payload bytes.
Digest ComputeDigest(bytes_view data);

std::string ToHex(const Digest& digest);

inline std::string ContentDigest(bytes_view data) {
    return ToHex(ComputeDigest(data));
}

} // namespace s3session
