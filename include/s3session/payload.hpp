#pragma once

#include "bytes_view.hpp"
#include "types.hpp"
#include <string>

namespace s3session {

// One entry of the upload list: either bytes held in memory or a local
// file read at upload time. `name` becomes the suffix of the object key.
struct PayloadSpec {
    enum class Source { kInline, kFile };

    std::string name;
    Source source = Source::kInline;
    Bytes inline_bytes;
    std::string path;

    static PayloadSpec FromBytes(std::string name, Bytes bytes);
    static PayloadSpec FromText(std::string name, const std::string& text);
    // The key suffix is the file's base name.
    static PayloadSpec FromFile(const std::string& path);
};

enum class LoadResult { kLoaded, kAbsent, kUnreadable };

// Resolves the payload's bytes. Inline payloads always load; file payloads
// report kAbsent when nothing exists at the path.
LoadResult LoadPayload(const PayloadSpec& payload, Bytes* out, std::string* error);

// Writes `data` to `path`, creating missing parent directories.
StorageStatus WriteFileBytes(const std::string& path, bytes_view data);

} // namespace s3session
