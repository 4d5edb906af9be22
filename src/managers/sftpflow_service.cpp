#include "sftpflow_service.hpp"
#include <core/credential_resolver.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

static std::future<Completion> ready(Completion c) {
    std::promise<Completion> p;
    p.set_value(std::move(c));
    return p.get_future();
}

SftpFlowService::SftpFlowService(Config config, CredentialStore store, SessionFactory factory)
    : config_(std::move(config)),
      store_(std::move(store)),
      cache_(std::move(factory)),
      queue_(config_.settings().queue_limit),
      executor_(cache_) {
    if (!config_.settings().log_file.empty()) {
        set_sftpflow_log_path(config_.settings().log_file);
    }
    for (const auto& [name, node] : config_.nodes()) {
        reporters_[name] = std::make_unique<StatusReporter>(name);
    }
    sftpflow_log(fmt::format("service: {} node(s), {} credential(s)",
                             config_.nodes().size(), config_.credentials().size()));
}

SftpFlowService::~SftpFlowService() {
    shutdown();
}

StatusReporter& SftpFlowService::reporter(const std::string& node) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    auto& r = reporters_[node];
    if (!r) r = std::make_unique<StatusReporter>(node, listener_);
    return *r;
}

// ── Requests ──────────────────────────────────────────────────

Result<PendingOperation> SftpFlowService::prepare(const std::string& node,
                                                  const OperationRequest& request) const {
    const NodeConfig* nc = config_.find_node(node);
    if (!nc) {
        return Result<PendingOperation>::Err(ErrorKind::Resolution, "unknown node " + node);
    }
    if (!nc->setup_error.empty()) {
        return Result<PendingOperation>::Err(ErrorKind::Resolution, nc->setup_error);
    }
    const CredentialConfig* cred = config_.find_credentials(nc->credentials);
    if (!cred) {
        return Result<PendingOperation>::Err(ErrorKind::Resolution,
            fmt::format("configuration node '{}' missing", nc->credentials));
    }

    auto identity = resolve_identity(*cred, request, store_);
    if (identity.is_err()) return propagate<PendingOperation>(identity);

    PendingOperation op;
    op.node = node;
    op.operation = request.operation.value_or(nc->operation);
    op.workdir = request.workdir.value_or(nc->workdir);
    op.filename = request.filename.value_or(nc->filename);
    op.payload = request.payload;
    op.identity = std::move(identity.value);
    op.key = op.identity.cache_key();
    op.reuse_session = request.reuse_session.value_or(nc->reuse_session);
    op.payload_as_path = request.payload_as_path.value_or(nc->payload_as_path);
    op.change_directory = request.change_directory.value_or(nc->change_directory);
    return Result<PendingOperation>::Ok(std::move(op));
}

std::future<Completion> SftpFlowService::submit(const std::string& node,
                                                const OperationRequest& request) {
    auto prepared = prepare(node, request);
    if (prepared.is_err()) {
        sftpflow_log(fmt::format("service: {} rejected: {}", node, prepared.error));
        if (config_.find_node(node)) reporter(node).failed();
        return ready(Completion::Err(prepared.kind, prepared.error));
    }

    auto op = std::make_shared<PendingOperation>(std::move(prepared.value));
    StatusReporter& status = reporter(node);
    std::string key = op->key;

    auto queued = queue_.submit(key, [this, op, &status]() {
        return executor_.execute(*op, status);
    });
    if (queued.is_err()) {
        return ready(Completion::Err(queued.kind, queued.error));
    }
    return std::move(queued.value);
}

// ── Shutdown ──────────────────────────────────────────────────

void SftpFlowService::shutdown() {
    std::call_once(shutdown_once_, [this] {
        queue_.shutdown();
        cache_.close_all();
        sftpflow_log("service: shut down");
    });
}

// ── State queries ─────────────────────────────────────────────

Status SftpFlowService::status(const std::string& node) const {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    auto it = reporters_.find(node);
    if (it == reporters_.end()) return Status{};
    return it->second->current();
}

void SftpFlowService::set_status_listener(StatusReporter::Listener listener) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    listener_ = listener;
    for (auto& [name, r] : reporters_) r->set_listener(listener);
}

std::vector<std::string> SftpFlowService::node_names() const {
    std::vector<std::string> names;
    for (const auto& [name, node] : config_.nodes()) names.push_back(name);
    return names;
}
