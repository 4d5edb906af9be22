#pragma once

#include <optional>
#include <string>
#include <variant>
#include <core/types.hpp>

// What a RemoteSession::put consumes.
struct BufferSource {
    std::string data;
};

struct LocalFileSource {
    std::string path;
};

using UploadSource = std::variant<BufferSource, LocalFileSource, StreamSource>;

struct ResolvedUpload {
    UploadSource source;
    std::optional<int64_t> expected_size;   // unknown for streams

    const char* kind_name() const;
};

// Turn a request payload into an upload source:
//   text naming an existing local file -> that file, size from the filesystem
//   any other text                     -> literal content, size = byte length
//   bytes                              -> buffer, size = length
//   stream                             -> stream, size unknown
// Legacy {filename, data} payloads are unwrapped first.
Result<ResolvedUpload> resolve_upload(const Payload& payload);
