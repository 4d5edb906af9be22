#include "operation_executor.hpp"
#include <core/log.hpp>
#include <transfer/path_resolver.hpp>
#include <transfer/upload_source.hpp>
#include <fmt/format.h>

namespace pr = path_resolver;

std::optional<OperationKind> parse_operation(const std::string& name) {
    if (name == "list")   return OperationKind::List;
    if (name == "get")    return OperationKind::Get;
    if (name == "put")    return OperationKind::Put;
    if (name == "delete") return OperationKind::Delete;
    if (name == "mkdir")  return OperationKind::Mkdir;
    if (name == "rmdir")  return OperationKind::Rmdir;
    if (name == "open")   return OperationKind::Open;
    if (name == "close")  return OperationKind::Close;
    return std::nullopt;
}

const char* operation_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::List:   return "list";
        case OperationKind::Get:    return "get";
        case OperationKind::Put:    return "put";
        case OperationKind::Delete: return "delete";
        case OperationKind::Mkdir:  return "mkdir";
        case OperationKind::Rmdir:  return "rmdir";
        case OperationKind::Open:   return "open";
        case OperationKind::Close:  return "close";
    }
    return "";
}

static Completion fail(const Result<void>& r) {
    return Completion::Err(r.kind, r.error);
}

OperationExecutor::OperationExecutor(ConnectionCache& cache) : cache_(cache) {}

// ── Path resolution ─────────────────────────────────────────

Result<OperationExecutor::Target> OperationExecutor::resolve_target(OperationKind kind,
                                                                   const PendingOperation& op) const {
    Target t;
    std::string workdir = op.workdir;
    std::string filename = pr::effective_filename(op.filename, op.payload);

    const std::string* text = std::get_if<std::string>(&op.payload);
    if (op.payload_as_path && text && !text->empty()) {
        switch (kind) {
            case OperationKind::List:
            case OperationKind::Mkdir:
            case OperationKind::Rmdir:
                workdir = *text;
                break;
            case OperationKind::Get:
            case OperationKind::Delete: {
                auto slash = text->find_last_of('/');
                if (slash != std::string::npos) {
                    workdir = pr::parent_directory(*text);
                }
                filename = pr::base_name(*text);
                break;
            }
            default:
                break;
        }
    }

    switch (kind) {
        case OperationKind::Get:
        case OperationKind::Put:
        case OperationKind::Delete: {
            auto file = pr::resolve_file(workdir, filename);
            if (file.is_err()) return propagate<Target>(file);
            t.file = file.value;
            t.filename = filename;
            t.directory = pr::resolve_directory(workdir);
            break;
        }
        default:
            t.directory = pr::resolve_directory(workdir);
            break;
    }
    return Result<Target>::Ok(t);
}

// ── Execute ─────────────────────────────────────────────────

Completion OperationExecutor::execute(const PendingOperation& op, StatusReporter& status) {
    status.begin();

    auto kind = parse_operation(op.operation);
    if (!kind) {
        sftpflow_log(fmt::format("[{}] unknown op {}", op.node, op.operation));
        status.failed();
        return Completion::Err(ErrorKind::UnknownOperation, "unknown op " + op.operation);
    }

    auto target = resolve_target(*kind, op);
    if (target.is_err()) {
        sftpflow_log(fmt::format("[{}] {}: {}", op.node, op.operation, target.error));
        status.failed();
        return Completion::Err(target.kind, target.error);
    }

    // close never connects
    if (*kind == OperationKind::Close) {
        status.progress(StatusReporter::progress_text(op.operation));
        bool existed = cache_.close(op.key);
        sftpflow_log(fmt::format("[{}] close {} ({})", op.node, op.key,
                                 existed ? "was open" : "not open"));
        status.succeeded();
        return Completion::Ok(SessionClosed{true});
    }

    bool persist = *kind == OperationKind::Open || op.reuse_session;
    auto acquired = cache_.acquire(op.key, op.identity, persist,
                                   [&status] { status.connecting(); });
    if (acquired.is_err()) {
        sftpflow_log(fmt::format("[{}] connect failed: {}", op.node, acquired.error));
        status.failed();
        return Completion::Err(acquired.kind, acquired.error);
    }

    SessionLease lease = std::move(acquired.value);
    LeaseGuard guard(cache_, lease);
    RemoteSession& session = *lease.session;

    auto cwd = session.current_directory();
    sftpflow_log(fmt::format("[paths] node={} op={} prev={} workdir={} filename={}",
                             op.node, op.operation,
                             cwd.is_ok() ? cwd.value : "?",
                             target.value.directory, target.value.filename));

    status.progress(StatusReporter::progress_text(op.operation));
    Completion result = dispatch(*kind, op, target.value, session);

    if (result.is_ok()) {
        status.succeeded();
    } else {
        sftpflow_log(fmt::format("[{}] {} failed ({}): {}", op.node, op.operation,
                                 error_kind_name(result.kind), result.error));
        status.failed();
    }
    return result;
}

Completion OperationExecutor::dispatch(OperationKind kind, const PendingOperation& op,
                                       const Target& target, RemoteSession& session) {
    switch (kind) {
        case OperationKind::List: {
            auto r = session.list(target.directory);
            if (r.is_err()) return propagate<OperationResult>(r);
            return Completion::Ok(Listing{std::move(r.value)});
        }
        case OperationKind::Get: {
            auto r = session.get(target.file);
            if (r.is_err()) return propagate<OperationResult>(r);
            return Completion::Ok(FileContent{target.file, std::move(r.value)});
        }
        case OperationKind::Put:
            return run_put(op, target, session);
        case OperationKind::Delete: {
            auto r = session.remove(target.file);
            if (r.is_err()) return fail(r);
            return Completion::Ok(Deleted{target.filename, target.file});
        }
        case OperationKind::Mkdir: {
            auto r = session.mkdir(target.directory, false);
            if (r.is_err()) return fail(r);
            return Completion::Ok(DirectoryCreated{target.directory});
        }
        case OperationKind::Rmdir: {
            auto r = session.rmdir(target.directory, false);
            if (r.is_err()) return fail(r);
            return Completion::Ok(DirectoryRemoved{target.directory});
        }
        case OperationKind::Open:
            return Completion::Ok(SessionOpened{op.identity.display()});
        case OperationKind::Close:
            break;
    }
    return Completion::Err(ErrorKind::UnknownOperation, "unknown op " + op.operation);
}

// ── Upload ──────────────────────────────────────────────────

void OperationExecutor::ensure_parent(RemoteSession& session, const std::string& path) {
    std::string parent = pr::parent_directory(path);
    if (parent == "." || parent == "/") return;

    auto r = session.mkdir(parent, true);
    if (r.is_ok()) {
        sftpflow_log(fmt::format("[put] created {}", parent));
    } else if (r.kind != ErrorKind::AlreadyExists) {
        // left to surface from the upload itself
        sftpflow_log(fmt::format("[put] mkdir {} failed: {}", parent, r.error));
    }
}

Completion OperationExecutor::run_put(const PendingOperation& op, const Target& target,
                                      RemoteSession& session) {
    auto upload = resolve_upload(op.payload);
    if (upload.is_err()) return propagate<OperationResult>(upload);
    const ResolvedUpload& src = upload.value;

    sftpflow_log(fmt::format("[put] {} source -> {} (expected {})", src.kind_name(), target.file,
                             src.expected_size ? std::to_string(*src.expected_size) : "unknown"));

    ensure_parent(session, target.file);

    PutOptions options;
    if (op.change_directory) {
        auto prev = session.current_directory();
        if (prev.is_err()) return propagate<OperationResult>(prev);

        auto cd = session.change_directory(pr::parent_directory(target.file));
        if (cd.is_err()) return fail(cd);

        auto put = session.put(src.source, pr::base_name(target.file), options);

        auto back = session.change_directory(prev.value);
        if (back.is_err()) {
            sftpflow_log(fmt::format("[put] could not restore {}: {}", prev.value, back.error));
        }
        if (put.is_err()) return fail(put);
    } else {
        auto put = session.put(src.source, target.file, options);
        if (put.is_err()) return fail(put);
    }

    int64_t remote_size = -1;
    auto st = session.stat(target.file);
    if (st.is_ok()) {
        remote_size = st.value.size;
    } else {
        sftpflow_log(fmt::format("[put] stat {} failed: {}", target.file, st.error));
    }
    sftpflow_log(fmt::format("[put] remote size {}", remote_size));

    if (src.expected_size && *src.expected_size != remote_size) {
        return Completion::Err(ErrorKind::Verification,
            fmt::format("size mismatch: expected {}, got {}", *src.expected_size, remote_size));
    }
    return Completion::Ok(TransferOutcome{true, target.file, remote_size});
}
