#include "path_resolver.hpp"
#include <vector>

namespace path_resolver {

std::string normalize(const std::string& path) {
    if (path.empty()) return ".";

    bool absolute = path[0] == '/';
    std::vector<std::string> parts;
    std::string segment;

    auto flush = [&]() {
        if (segment.empty() || segment == ".") {
            // skip
        } else if (segment == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back("..");
            }
        } else {
            parts.push_back(segment);
        }
        segment.clear();
    };

    for (char c : path) {
        if (c == '/') flush();
        else segment += c;
    }
    flush();

    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += '/';
        out += parts[i];
    }
    if (out.empty()) return ".";
    return out;
}

std::string posix_join(const std::string& a, const std::string& b) {
    if (a.empty()) return normalize(b);
    if (b.empty()) return normalize(a);
    return normalize(a + "/" + b);
}

std::string strip_leading_slash(const std::string& name) {
    if (!name.empty() && name[0] == '/') return name.substr(1);
    return name;
}

std::string resolve_directory(const std::string& workdir) {
    return normalize(workdir.empty() ? "." : workdir);
}

Result<std::string> resolve_file(const std::string& workdir, const std::string& filename) {
    std::string name = strip_leading_slash(filename);
    if (name.empty()) {
        return Result<std::string>::Err(ErrorKind::Resolution, "no filename to resolve");
    }

    std::string joined = strip_leading_slash(posix_join(workdir.empty() ? "." : workdir, name));
    if (joined.empty() || joined == ".") {
        return Result<std::string>::Err(ErrorKind::Resolution,
            "path '" + filename + "' does not name a file");
    }
    return Result<std::string>::Ok(joined);
}

std::string parent_directory(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    if (slash == std::string::npos) return p;
    return p.substr(slash + 1);
}

std::string effective_filename(const std::string& configured, const Payload& payload) {
    if (const auto* legacy = std::get_if<LegacyUpload>(&payload)) {
        if (!legacy->filename.empty()) return legacy->filename;
    }
    return configured;
}

} // namespace path_resolver
