#include "s3session/payload.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace s3session {

namespace fs = std::filesystem;

PayloadSpec PayloadSpec::FromBytes(std::string name, Bytes bytes) {
    PayloadSpec spec;
    spec.name = std::move(name);
    spec.source = Source::kInline;
    spec.inline_bytes = std::move(bytes);
    return spec;
}

PayloadSpec PayloadSpec::FromText(std::string name, const std::string& text) {
    return FromBytes(std::move(name), ToBytes(text));
}

PayloadSpec PayloadSpec::FromFile(const std::string& path) {
    PayloadSpec spec;
    spec.name = fs::path(path).filename().string();
    spec.source = Source::kFile;
    spec.path = path;
    return spec;
}

LoadResult LoadPayload(const PayloadSpec& payload, Bytes* out, std::string* error) {
    if (payload.source == PayloadSpec::Source::kInline) {
        *out = payload.inline_bytes;
        return LoadResult::kLoaded;
    }

    std::error_code ec;
    if (!fs::exists(payload.path, ec)) {
        if (ec) {
            *error = "Cannot stat '" + payload.path + "': " + ec.message();
            return LoadResult::kUnreadable;
        }
        return LoadResult::kAbsent;
    }
    if (!fs::is_regular_file(payload.path, ec)) {
        *error = "'" + payload.path + "' is not a regular file";
        return LoadResult::kUnreadable;
    }

    std::ifstream in(payload.path, std::ios::binary);
    if (!in) {
        *error = "Cannot open '" + payload.path + "'";
        return LoadResult::kUnreadable;
    }
    out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        *error = "Read error on '" + payload.path + "'";
        return LoadResult::kUnreadable;
    }
    return LoadResult::kLoaded;
}

StorageStatus WriteFileBytes(const std::string& path, bytes_view data) {
    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return StorageStatus::Error(StorageErrorCode::kLocalIo,
                "Cannot create directory '" + target.parent_path().string() + "': " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return StorageStatus::Error(StorageErrorCode::kLocalIo, "Cannot open '" + path + "' for writing");
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        return StorageStatus::Error(StorageErrorCode::kLocalIo, "Write error on '" + path + "'");
    }
    return StorageStatus::Ok();
}

} // namespace s3session
