#include "upload_source.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

const char* ResolvedUpload::kind_name() const {
    switch (source.index()) {
        case 0: return "buffer";
        case 1: return "local-file";
        default: return "stream";
    }
}

static Result<ResolvedUpload> from_text(const std::string& text) {
    std::error_code ec;
    if (!text.empty() && fs::is_regular_file(text, ec)) {
        auto size = fs::file_size(text, ec);
        if (!ec) {
            return Result<ResolvedUpload>::Ok(
                ResolvedUpload{LocalFileSource{text}, static_cast<int64_t>(size)});
        }
    }
    return Result<ResolvedUpload>::Ok(
        ResolvedUpload{BufferSource{text}, static_cast<int64_t>(text.size())});
}

static Result<ResolvedUpload> from_bytes(const Bytes& bytes) {
    std::string data(bytes.begin(), bytes.end());
    auto size = static_cast<int64_t>(data.size());
    return Result<ResolvedUpload>::Ok(ResolvedUpload{BufferSource{std::move(data)}, size});
}

Result<ResolvedUpload> resolve_upload(const Payload& payload) {
    if (const auto* text = std::get_if<std::string>(&payload)) {
        return from_text(*text);
    }
    if (const auto* bytes = std::get_if<Bytes>(&payload)) {
        return from_bytes(*bytes);
    }
    if (const auto* stream = std::get_if<StreamSource>(&payload)) {
        if (!stream->stream) {
            return Result<ResolvedUpload>::Err(ErrorKind::Resolution, "stream payload has no stream");
        }
        return Result<ResolvedUpload>::Ok(ResolvedUpload{*stream, std::nullopt});
    }
    if (const auto* legacy = std::get_if<LegacyUpload>(&payload)) {
        if (const auto* text = std::get_if<std::string>(&legacy->data)) {
            return from_text(*text);
        }
        return from_bytes(std::get<Bytes>(legacy->data));
    }
    return Result<ResolvedUpload>::Err(ErrorKind::Resolution, "put requires a payload");
}
