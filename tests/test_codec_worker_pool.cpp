/*
 * test_codec_worker_pool.cpp - Unit tests for the codec worker pool
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"
#include "test_framework.h"

using namespace TestFramework;
using namespace std::chrono_literals;

class ResultTest : public TestCase {
public:
    ResultTest() : TestCase("Job result is returned") {}

protected:
    void runTest() override {
        CodecWorkerPool pool(2, 4);
        ASSERT_EQUALS(2u, pool.threadCount(), "Threads");
        ASSERT_EQUALS(4u, pool.queueDepth(), "Depth");

        int value = pool.run<int>([]() { return 6 * 7; }, 1000ms, ErrorKind::Decode, "answer");
        ASSERT_EQUALS(42, value, "Result");

        std::vector<uint8_t> bytes = pool.run<std::vector<uint8_t>>(
            []() { return std::vector<uint8_t>(3, 0xAB); }, 1000ms, ErrorKind::Encode, "bytes");
        ASSERT_EQUALS(3u, bytes.size(), "Moved out");
    }
};

class ExceptionTest : public TestCase {
public:
    ExceptionTest() : TestCase("Job exceptions propagate unchanged") {}

protected:
    void runTest() override {
        CodecWorkerPool pool(1, 1);
        TestPatterns::assertThrows<EncodeError>(
            [&]() {
                pool.run<int>([]() -> int { throw EncodeError("lame refused"); }, 1000ms, ErrorKind::Encode, "enc");
            },
            "lame refused");

        // The worker survives a throwing job
        ASSERT_EQUALS(1, pool.run<int>([]() { return 1; }, 1000ms, ErrorKind::Decode, "after"), "Still running");
    }
};

class TimeoutTest : public TestCase {
public:
    TimeoutTest() : TestCase("Slow job raises TimeoutError") {}

protected:
    void runTest() override {
        CodecWorkerPool pool(1, 2);
        TestPatterns::assertThrows<TimeoutError>(
            [&]() {
                pool.run<int>([]() {
                    std::this_thread::sleep_for(300ms);
                    return 0;
                }, 20ms, ErrorKind::Decode, "slow decode");
            },
            "slow decode");
    }
};

class QueueFullTest : public TestCase {
public:
    QueueFullTest() : TestCase("Full queue rejects with the stage error") {}

protected:
    void runTest() override {
        CodecWorkerPool pool(1, 1);
        auto gate = std::make_shared<std::promise<void>>();
        std::shared_future<void> open = gate->get_future().share();
        auto started = std::make_shared<std::atomic<bool>>(false);

        // Occupies the only worker until the gate opens
        std::thread busy([&pool, open, started]() {
            pool.run<int>([open, started]() {
                started->store(true);
                open.wait();
                return 0;
            }, 5000ms, ErrorKind::Decode, "busy");
        });
        while (!started->load()) std::this_thread::sleep_for(1ms);

        // Fills the queue
        std::thread queued([&pool]() {
            pool.run<int>([]() { return 0; }, 5000ms, ErrorKind::Decode, "queued");
        });
        while (pool.pending() < 1) std::this_thread::sleep_for(1ms);

        TestPatterns::assertThrows<DecodeError>(
            [&]() { pool.run<int>([]() { return 0; }, 1000ms, ErrorKind::Decode, "overflow"); },
            "queue full");
        TestPatterns::assertThrows<EncodeError>(
            [&]() { pool.run<int>([]() { return 0; }, 1000ms, ErrorKind::Encode, "overflow"); },
            "queue full");

        gate->set_value();
        busy.join();
        queued.join();
        ASSERT_EQUALS(0u, pool.pending(), "Drained");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Codec Worker Pool Tests");

    suite.addTest(std::make_unique<ResultTest>());
    suite.addTest(std::make_unique<ExceptionTest>());
    suite.addTest(std::make_unique<TimeoutTest>());
    suite.addTest(std::make_unique<QueueFullTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
