#include "hostlink/worker_pool.h"

#include <exception>
#include <iostream>

namespace hostlink {

WorkerPool::WorkerPool(int threads) {
    if (threads < 1) threads = 1;
    threads_.reserve((size_t)threads);
    for (int i = 0; i < threads; i++) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(Task task) {
    return queue_.push(std::move(task));
}

size_t WorkerPool::shutdown() {
    size_t dropped = queue_.shutdown();
    std::lock_guard<std::mutex> lk(join_mu_);
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    return dropped;
}

void WorkerPool::worker_loop() {
    Task task;
    while (queue_.pop(task)) {
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[serve] worker task failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[serve] worker task failed: non-standard exception\n";
        }
        task = nullptr;
    }
}

} // namespace hostlink
