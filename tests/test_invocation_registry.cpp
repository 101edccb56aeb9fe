#include "test_common.h"

#include "hostlink/invocation_registry.h"

#include <atomic>
#include <memory>
#include <regex>
#include <thread>
#include <vector>

using namespace hostlink;

static OutputListener listener_for(const InvocationHandle& inv) {
    OutputListener l;
    l.invocation = inv;
    l.patterns = std::make_shared<const std::vector<std::regex>>();
    l.timeout_ms = 1000;
    l.started = std::chrono::steady_clock::now();
    return l;
}

int main() {
    // ids: prefix, monotonic issue time, unique
    {
        InvocationRegistry reg;
        auto a = reg.begin("list", CommandKind::HOST);
        auto b = reg.begin("list", CommandKind::HOST);
        expect_true(a->id.rfind("cmd_", 0) == 0, "id prefix");
        expect_true(a->id != b->id, "ids differ for identical text");
        expect_true(b->issue_us > a->issue_us, "issue time strictly increases");
        expect_true(reg.status(a) == InvocationStatus::PENDING, "new invocation is pending");
    }

    // exactly-once transition, listener removed in the same step
    {
        InvocationRegistry reg;
        auto inv = reg.begin("time query daytime", CommandKind::HOST);
        expect_true(reg.attach_listener(listener_for(inv)), "attach to pending");
        expect_eq_ll((long long)reg.listener_count(), 1, "listener registered");
        expect_true(reg.append_line(inv, "The time is 1000"), "append while pending");

        expect_true(reg.finish(inv, InvocationStatus::COMPLETED), "first finish wins");
        expect_true(!reg.finish(inv, InvocationStatus::TIMED_OUT), "second finish is a no-op");
        expect_true(reg.status(inv) == InvocationStatus::COMPLETED, "status unchanged by late finish");
        expect_eq_ll((long long)reg.listener_count(), 0, "listener gone with the transition");
        expect_true(!reg.append_line(inv, "late"), "append after finish rejected");
        expect_eq_ll((long long)reg.read(inv).captured_lines.size(), 1, "lines frozen");
        expect_true(!reg.attach_listener(listener_for(inv)), "no listener for a finished invocation");
        expect_true(reg.read(inv).completed_at_ms >= reg.read(inv).created_at_ms, "completion stamped");
    }

    // racing finishers: exactly one succeeds
    {
        InvocationRegistry reg;
        for (int round = 0; round < 50; round++) {
            auto inv = reg.begin("race", CommandKind::HOST);
            reg.attach_listener(listener_for(inv));
            std::atomic<int> wins{0};
            std::vector<std::thread> ts;
            for (int t = 0; t < 4; t++) {
                ts.emplace_back([&, t] {
                    auto st = (t % 2) ? InvocationStatus::COMPLETED : InvocationStatus::TIMED_OUT;
                    if (reg.finish(inv, st)) wins++;
                });
            }
            for (auto& t : ts) t.join();
            expect_eq_ll(wins.load(), 1, "exactly one finisher");
        }
        expect_true(reg.listeners_consistent(), "no stale listeners after races");
        expect_eq_ll((long long)reg.listener_count(), 0, "all listeners removed");
    }

    // eviction keeps the most recent, pending victims end timed out
    {
        InvocationRegistry reg;
        auto oldest = reg.begin("say pending", CommandKind::HOST);
        reg.attach_listener(listener_for(oldest));
        reg.append_line(oldest, "partial");
        std::vector<InvocationHandle> rest;
        for (int i = 0; i < 4; i++) {
            auto inv = reg.begin("!!hl status", CommandKind::CONTROL);
            reg.finish(inv, InvocationStatus::COMPLETED);
            rest.push_back(inv);
        }

        size_t evicted = reg.evict(3);
        expect_eq_ll((long long)evicted, 2, "two entries dropped");
        expect_eq_ll((long long)reg.history_size(), 3, "bounded");
        expect_true(!reg.get(oldest->id).has_value(), "oldest forgotten");
        expect_true(!reg.get(rest[0]->id).has_value(), "second oldest forgotten");
        expect_true(reg.get(rest[3]->id).has_value(), "newest kept");

        expect_true(reg.status(oldest) == InvocationStatus::TIMED_OUT, "pending victim timed out");
        expect_contains(reg.read(oldest).error, "evicted", "eviction reason recorded");
        expect_eq_ll((long long)reg.read(oldest).captured_lines.size(), 1, "partial output kept");
        expect_eq_ll((long long)reg.listener_count(), 0, "victim's listener dropped");

        auto hist = reg.history();
        expect_eq_str(hist.front().id, rest[1]->id, "history oldest first");
        expect_eq_str(hist.back().id, rest[3]->id, "history newest last");
    }

    // result formatting
    {
        CommandInvocation inv;
        inv.id = "cmd_1_abcd";
        inv.raw_text = "list";
        inv.kind = CommandKind::HOST;
        inv.status = InvocationStatus::TIMED_OUT;
        inv.captured_lines = {"a", "b"};
        inv.created_at_ms = 5000;
        inv.completed_at_ms = 5250;
        InvocationResult r = to_result(inv);
        expect_true(r.success, "timed out counts as success");
        expect_eq_str(r.output, "a\nb", "joined output");
        expect_eq_ll(r.elapsed_ms, 250, "elapsed");
        expect_eq_ll(r.timestamp, 5, "timestamp in seconds");

        inv.status = InvocationStatus::FAILED;
        expect_true(!to_result(inv).success, "failed is not success");
    }

    std::cerr << "test_invocation_registry: ALL PASSED" << std::endl;
    return 0;
}
