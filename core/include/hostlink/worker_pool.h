#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace hostlink {

// ConcurrentQueue
// - Thread-safe FIFO push/pop
// - Blocking pop with shutdown()
// - shutdown() drops whatever has not been popped yet
template <typename T>
class ConcurrentQueue {
public:
    ConcurrentQueue() = default;

    // Returns false when shut down (value is discarded).
    bool push(T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        q_.push_back(std::move(value));
        cv_.notify_one();
        return true;
    }

    // Returns false when shut down.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (closed_ || q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    // Returns the number of queued items that were dropped.
    size_t shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        size_t dropped = q_.size();
        q_.clear();
        cv_.notify_all();
        return dropped;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_{false};
};

// Fixed set of threads draining a ConcurrentQueue of tasks.
// Tasks already running when shutdown() is called finish normally.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(int threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool is shutting down.
    bool post(Task task);

    // Idempotent. Returns the number of queued tasks that never ran.
    size_t shutdown();

    int threads() const { return (int)threads_.size(); }
    size_t pending() const { return queue_.size(); }

private:
    void worker_loop();

    ConcurrentQueue<Task> queue_;
    std::vector<std::thread> threads_;
    std::mutex join_mu_;
};

} // namespace hostlink
