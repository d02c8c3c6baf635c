#include "s3session/keys.hpp"

#include <xxhash.h>

#include <cstring>
#include <iomanip>
#include <sstream>

namespace s3session {

std::string MakeObjectKey(std::int64_t timestamp, const std::string& name) {
    return std::to_string(timestamp) + "_" + name;
}

std::string LocalNameForKey(const std::string& prefix, const std::string& key) {
    std::string::size_type slash = key.find_last_of('/');
    std::string base = slash == std::string::npos ? key : key.substr(slash + 1);
    return prefix + base;
}

Digest ComputeDigest(bytes_view data) {
    XXH128_hash_t hash = XXH3_128bits(data.data(), data.size());

    // Canonical form is big-endian, so the hex reads the same on every host.
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, hash);

    Digest digest;
    static_assert(sizeof(canonical.digest) == sizeof(Digest), "XXH128 digest is 16 bytes");
    std::memcpy(digest.data(), canonical.digest, digest.size());
    return digest;
}

std::string ToHex(const Digest& digest) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : digest) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace s3session
