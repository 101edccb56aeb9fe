#include "test_common.h"

#include "hostlink/worker_pool.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using hostlink::ConcurrentQueue;
using hostlink::WorkerPool;

int main() {
    ConcurrentQueue<std::string> q;
    q.push("first");
    q.push("second");

    std::string v;
    expect_true(q.pop(v) && v == "first", "FIFO order (1)");
    expect_true(q.pop(v) && v == "second", "FIFO order (2)");

    // Blocking pop should unblock on shutdown
    ConcurrentQueue<int> q2;
    bool popped = true;
    std::thread t([&] {
        int x = 0;
        popped = q2.pop(x);
    });

    // Give the thread a moment to block
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q2.shutdown();
    t.join();
    expect_true(popped == false, "pop should return false after shutdown on empty queue");
    expect_true(!q2.push(1), "push after shutdown is refused");

    // shutdown drops what is still queued
    ConcurrentQueue<int> q3;
    q3.push(1);
    q3.push(2);
    expect_eq_ll((long long)q3.shutdown(), 2, "dropped count");

    // Pool runs every task, survives a throwing one.
    {
        WorkerPool pool(3);
        expect_eq_ll(pool.threads(), 3, "thread count");
        std::atomic<int> ran{0};
        pool.post([] { throw std::runtime_error("boom"); });
        pool.post([] { throw 5; });
        for (int i = 0; i < 20; i++) pool.post([&] { ran++; });
        for (int i = 0; i < 200 && ran.load() < 20; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        expect_eq_ll(ran.load(), 20, "all tasks ran");
        pool.shutdown();
        expect_true(!pool.post([] {}), "post refused after shutdown");
        expect_eq_ll((long long)pool.shutdown(), 0, "second shutdown is a no-op");
    }

    // Queued tasks behind a slow one are dropped at shutdown.
    {
        WorkerPool pool(1);
        std::atomic<bool> started{false};
        std::atomic<int> ran{0};
        pool.post([&] {
            started = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        });
        while (!started.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        pool.post([&] { ran++; });
        pool.post([&] { ran++; });
        size_t dropped = pool.shutdown();
        expect_eq_ll((long long)dropped, 2, "queued tasks dropped");
        expect_eq_ll(ran.load(), 0, "dropped tasks never ran");
    }

    std::cerr << "test_worker_pool: ALL PASSED" << std::endl;
    return 0;
}
