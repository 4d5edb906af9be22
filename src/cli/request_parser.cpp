#include "request_parser.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <iterator>

std::vector<std::string> split_args(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    bool have_token = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            cur += line[++i];
            have_token = true;
        } else if (c == '"') {
            in_quotes = !in_quotes;
            have_token = true;
        } else if (!in_quotes && (c == ' ' || c == '\t')) {
            if (have_token) {
                out.push_back(cur);
                cur.clear();
                have_token = false;
            }
        } else {
            cur += c;
            have_token = true;
        }
    }
    if (have_token) out.push_back(cur);
    return out;
}

static Result<Bytes> read_local_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<Bytes>::Err(ErrorKind::Resolution, "cannot read " + path);
    }
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return Result<Bytes>::Ok(std::move(data));
}

Result<CliRequest> parse_request(const std::vector<std::string>& args) {
    if (args.empty()) {
        return Result<CliRequest>::Err(ErrorKind::Resolution, "missing node name");
    }

    CliRequest cr;
    cr.node = args[0];
    OperationRequest& req = cr.request;
    std::optional<std::string> legacy_name;
    std::optional<std::string> legacy_data;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result<CliRequest>::Err(ErrorKind::Resolution,
                fmt::format("expected key=value, got '{}'", arg));
        }
        std::string key = arg.substr(0, eq);
        std::string value = arg.substr(eq + 1);

        if (key == "op" || key == "operation") {
            req.operation = value;
        } else if (key == "workdir") {
            req.workdir = value;
        } else if (key == "filename") {
            req.filename = value;
        } else if (key == "host") {
            req.host = value;
        } else if (key == "port") {
            int port = safe_stoi(value, -1);
            if (port <= 0 || port > 65535) {
                return Result<CliRequest>::Err(ErrorKind::Resolution, "invalid port: " + value);
            }
            req.port = port;
        } else if (key == "user") {
            req.user = value;
        } else if (key == "password") {
            req.password = value;
        } else if (key == "key") {
            req.key = value;
        } else if (key == "reuse" || key == "payload_as_path" || key == "cd") {
            auto b = parse_bool(value);
            if (!b) {
                return Result<CliRequest>::Err(ErrorKind::Resolution,
                    fmt::format("invalid {}: {}", key, value));
            }
            if (key == "reuse") req.reuse_session = *b;
            else if (key == "cd") req.change_directory = *b;
            else req.payload_as_path = *b;
        } else if (key == "payload") {
            if (value == "-") {
                // stdin is not owned by the request
                req.payload = StreamSource{std::shared_ptr<std::istream>(&std::cin, [](std::istream*) {})};
            } else {
                req.payload = value;
            }
        } else if (key == "payload_file") {
            auto data = read_local_file(value);
            if (data.is_err()) return propagate<CliRequest>(data);
            req.payload = std::move(data.value);
        } else if (key == "name") {
            legacy_name = value;
        } else if (key == "data") {
            legacy_data = value;
        } else if (key == "out") {
            cr.out_path = value;
        } else {
            return Result<CliRequest>::Err(ErrorKind::Resolution, "unknown key: " + key);
        }
    }

    if (legacy_name || legacy_data) {
        if (!legacy_data) {
            return Result<CliRequest>::Err(ErrorKind::Resolution, "name= requires data=");
        }
        LegacyUpload legacy;
        legacy.filename = legacy_name.value_or("");
        legacy.data = *legacy_data;
        req.payload = std::move(legacy);
    }
    return Result<CliRequest>::Ok(std::move(cr));
}

static const char* entry_type_char(EntryType t) {
    switch (t) {
        case EntryType::Directory: return "d";
        case EntryType::Symlink:   return "l";
        case EntryType::File:      return "-";
        case EntryType::Other:     break;
    }
    return "?";
}

std::string describe_result(const OperationResult& result) {
    if (auto* l = std::get_if<Listing>(&result)) {
        std::string s = fmt::format("{} entr{}", l->entries.size(),
                                    l->entries.size() == 1 ? "y" : "ies");
        for (const auto& e : l->entries) {
            s += fmt::format("\n      {} {:>10}  {}", entry_type_char(e.type),
                             format_bytes(e.size), e.name);
        }
        return s;
    }
    if (auto* f = std::get_if<FileContent>(&result)) {
        return fmt::format("{} ({})", f->path, format_bytes(static_cast<long long>(f->data.size())));
    }
    if (auto* t = std::get_if<TransferOutcome>(&result)) {
        return fmt::format("uploaded {} ({} bytes)", t->path, t->size);
    }
    if (auto* d = std::get_if<Deleted>(&result)) {
        return "deleted " + d->path;
    }
    if (auto* c = std::get_if<DirectoryCreated>(&result)) {
        return "created " + c->path;
    }
    if (auto* r = std::get_if<DirectoryRemoved>(&result)) {
        return "removed " + r->path;
    }
    if (auto* o = std::get_if<SessionOpened>(&result)) {
        return "session open: " + o->identity;
    }
    return "session closed";
}
