#include <catch2/catch_test_macros.hpp>
#include <courier/coro/cancel_token.hpp>
#include <courier/runtime/blocking.hpp>
#include <courier/runtime/run.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace courier::coro;
using namespace courier::runtime;

TEST_CASE("default token is never cancelled", "[cancel]") {
    cancel_token token;
    REQUIRE_FALSE(token.can_be_cancelled());
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE_NOTHROW(token.throw_if_cancelled());
}

TEST_CASE("cancel_source cancels its tokens", "[cancel]") {
    cancel_source source;
    auto token = source.get_token();
    REQUIRE(token.can_be_cancelled());
    REQUIRE_FALSE(token.is_cancelled());

    source.cancel();
    REQUIRE(source.is_cancelled());
    REQUIRE(token.is_cancelled());
    REQUIRE_THROWS_AS(token.throw_if_cancelled(), operation_cancelled);
}

TEST_CASE("on_cancel callbacks run once", "[cancel]") {
    cancel_source source;
    int calls = 0;
    auto reg = source.get_token().on_cancel([&] { ++calls; });

    source.cancel();
    source.cancel();
    REQUIRE(calls == 1);
}

TEST_CASE("on_cancel runs immediately on a cancelled token", "[cancel]") {
    cancel_source source;
    source.cancel();
    bool called = false;
    auto reg = source.get_token().on_cancel([&] { called = true; });
    REQUIRE(called);
}

TEST_CASE("destroyed registration is not invoked", "[cancel]") {
    cancel_source source;
    bool called = false;
    {
        auto reg = source.get_token().on_cancel([&] { called = true; });
    }
    source.cancel();
    REQUIRE_FALSE(called);
}

TEST_CASE("linked source follows its parent only", "[cancel]") {
    SECTION("parent cancels child") {
        cancel_source parent;
        linked_cancel_source child(parent.get_token());
        parent.cancel();
        REQUIRE(child.is_cancelled());
        REQUIRE(child.get_token().is_cancelled());
    }

    SECTION("child leaves parent untouched") {
        cancel_source parent;
        linked_cancel_source child(parent.get_token());
        child.cancel();
        REQUIRE(child.is_cancelled());
        REQUIRE_FALSE(parent.is_cancelled());
    }

    SECTION("already cancelled parent") {
        cancel_source parent;
        parent.cancel();
        linked_cancel_source child(parent.get_token());
        REQUIRE(child.is_cancelled());
    }
}

TEST_CASE("spawn_blocking returns the callable's result", "[blocking]") {
    auto caller_thread = std::this_thread::get_id();

    auto driver = [&]() -> task<bool> {
        auto worker_thread = co_await spawn_blocking([] { return std::this_thread::get_id(); });
        // Resumed back on the loop thread
        co_return worker_thread != caller_thread && std::this_thread::get_id() == caller_thread;
    };

    REQUIRE(courier::run(driver()));
}

TEST_CASE("spawn_blocking propagates exceptions", "[blocking]") {
    auto driver = []() -> task<int> {
        co_return co_await spawn_blocking([]() -> int { throw std::runtime_error("disk on fire"); });
    };
    REQUIRE_THROWS_AS(courier::run(driver()), std::runtime_error);
}

TEST_CASE("spawn_blocking on a cancelled token does not run", "[blocking]") {
    cancel_source source;
    source.cancel();
    std::atomic<bool> ran{false};

    auto driver = [&]() -> task<void> {
        co_await spawn_blocking([&] { ran = true; }, source.get_token());
    };

    REQUIRE_THROWS_AS(courier::run(driver()), operation_cancelled);
    REQUIRE_FALSE(ran.load());
}

task<int> blocking_answer() {
    co_return co_await spawn_blocking([] { return 42; });
}

task<void> await_spawned_answer(std::atomic<int>* finished, std::atomic<int>* sum) {
    auto handle = blocking_answer().spawn();
    *sum += co_await handle;
    finished->fetch_add(1);
}

TEST_CASE("join_handle resumes once when a worker completes it", "[blocking][join_handle]") {
    // No run loop: the worker thread completes the join state while the
    // awaiter is still registering
    REQUIRE(run_loop::current() == nullptr);
    constexpr int rounds = 2000;
    std::atomic<int> finished{0};
    std::atomic<int> sum{0};

    for (int i = 0; i < rounds; ++i) {
        await_spawned_answer(&finished, &sum).go();
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (finished.load() < rounds && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(finished.load() == rounds);
    REQUIRE(sum.load() == rounds * 42);
}

task<void> cancel_after_yield(cancel_source* source) {
    co_await yield();
    source->cancel();
}

TEST_CASE("cancelling resumes a pending spawn_blocking", "[blocking]") {
    cancel_source source;
    auto token = source.get_token();

    auto driver = [&]() -> task<void> {
        cancel_after_yield(&source).go();
        // Only the token stops this callable
        co_await spawn_blocking([token] {
            while (!token.is_cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return 0;
        }, token);
    };

    REQUIRE_THROWS_AS(courier::run(driver()), operation_cancelled);
}
