#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>

// OperationQueue: one FIFO lane per session key.
//
// Each lane owns a worker thread that runs its jobs one at a time in
// submission order, so a session is only ever touched from its own lane.
// Lanes of different keys run concurrently. A job that returns an error or
// throws only fails its own future.
//
// A lane lives only while it has work: the worker retires it as soon as the
// deque runs dry, and the next submit or shutdown joins retired workers.
class OperationQueue {
public:
    using Job = std::function<Completion()>;

    // limit: max queued-or-running jobs per lane, 0 = unbounded
    explicit OperationQueue(size_t limit = 0);
    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    // QueueFull when the lane is at its limit, Operation after shutdown.
    Result<std::future<Completion>> submit(const std::string& key, Job job);

    // Stop accepting, run everything already queued, join the workers.
    // Safe to call more than once.
    void shutdown();

    size_t pending(const std::string& key) const;
    size_t lane_count() const;    // lanes with queued or running work

private:
    struct Lane {
        std::deque<std::packaged_task<Completion()>> jobs;
        bool busy = false;
        std::thread worker;
    };

    size_t limit_;
    bool stopping_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::unique_ptr<Lane>> lanes_;
    std::vector<std::thread> retired_;   // exited or exiting, not yet joined

    void lane_loop(const std::string& key, Lane* lane);
    void join_retired();
};
