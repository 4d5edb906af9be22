#include "operation_queue.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

OperationQueue::OperationQueue(size_t limit) : limit_(limit) {}

OperationQueue::~OperationQueue() {
    shutdown();
}

Result<std::future<Completion>> OperationQueue::submit(const std::string& key, Job job) {
    join_retired();

    std::packaged_task<Completion()> task(std::move(job));
    std::future<Completion> fut = task.get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return Result<std::future<Completion>>::Err("queue is shut down");
    }

    auto it = lanes_.find(key);
    if (it != lanes_.end()) {
        Lane& lane = *it->second;
        size_t depth = lane.jobs.size() + (lane.busy ? 1 : 0);
        if (limit_ > 0 && depth >= limit_) {
            sftpflow_log(fmt::format("queue: lane {} full ({} pending)", key, depth));
            return Result<std::future<Completion>>::Err(ErrorKind::QueueFull,
                fmt::format("queue for {} is full ({} pending)", key, depth));
        }
        lane.jobs.push_back(std::move(task));
        return Result<std::future<Completion>>::Ok(std::move(fut));
    }

    // New lane starts with its first job queued, so the worker never idles
    auto lane = std::make_unique<Lane>();
    Lane* raw = lane.get();
    raw->jobs.push_back(std::move(task));
    lanes_.emplace(key, std::move(lane));
    raw->worker = std::thread(&OperationQueue::lane_loop, this, key, raw);
    sftpflow_log(fmt::format("queue: lane {} started", key));
    return Result<std::future<Completion>>::Ok(std::move(fut));
}

void OperationQueue::lane_loop(const std::string& key, Lane* lane) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!lane->jobs.empty()) {
        auto task = std::move(lane->jobs.front());
        lane->jobs.pop_front();
        lane->busy = true;
        lock.unlock();

        // packaged_task stores a thrown exception in the future
        task();

        lock.lock();
        lane->busy = false;
    }

    // Drained under the lock: a later submit for this key starts a new lane.
    // `lane` is destroyed by the erase, so take the thread handle first.
    retired_.push_back(std::move(lane->worker));
    lanes_.erase(key);
    cv_.notify_all();
    lock.unlock();

    sftpflow_log(fmt::format("queue: lane {} retired", key));
}

void OperationQueue::join_retired() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done.swap(retired_);
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

void OperationQueue::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stopping_ = true;
        // Workers keep running what is already queued, then retire.
        cv_.wait(lock, [this] { return lanes_.empty(); });
    }
    join_retired();
}

size_t OperationQueue::pending(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(key);
    if (it == lanes_.end()) return 0;
    return it->second->jobs.size() + (it->second->busy ? 1 : 0);
}

size_t OperationQueue::lane_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lanes_.size();
}
