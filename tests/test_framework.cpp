/*
 * test_framework.cpp - Implementation of common test framework for Hushmark
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_framework.h"
#include <iostream>
#include <iomanip>
#include <algorithm>

namespace TestFramework {

    TestCase::TestCase(const std::string& name) : m_name(name) {
    }

    TestCaseInfo TestCase::run() {
        TestCaseInfo info(m_name);
        auto start_time = std::chrono::steady_clock::now();

        try {
            runTest();
            info.result = TestResult::PASSED;
        } catch (const AssertionFailure& e) {
            info.result = TestResult::FAILED;
            info.failure_message = e.what();
        } catch (const std::exception& e) {
            info.result = TestResult::ERROR;
            info.failure_message = std::string("Unexpected ") + typeid(e).name() + ": " + e.what();
        }

        info.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return info;
    }

    TestSuite::TestSuite(const std::string& name) : m_name(name) {
    }

    void TestSuite::addTest(std::unique_ptr<TestCase> test) {
        if (test) {
            m_tests.push_back(std::move(test));
        }
    }

    std::vector<TestCaseInfo> TestSuite::runAll() {
        std::vector<TestCaseInfo> results;
        results.reserve(m_tests.size());

        std::cout << "Running test suite: " << m_name << std::endl;
        std::cout << std::string(m_name.length() + 20, '=') << std::endl;

        for (auto& test : m_tests) {
            std::cout << "Running " << test->getName() << "... ";
            std::cout.flush();

            TestCaseInfo result = test->run();
            switch (result.result) {
                case TestResult::PASSED:
                    std::cout << "PASSED (" << result.execution_time.count() << "ms)" << std::endl;
                    break;
                case TestResult::FAILED:
                    std::cout << "FAILED (" << result.execution_time.count() << "ms)" << std::endl;
                    std::cout << "  " << result.failure_message << std::endl;
                    break;
                case TestResult::ERROR:
                    std::cout << "ERROR (" << result.execution_time.count() << "ms)" << std::endl;
                    std::cout << "  " << result.failure_message << std::endl;
                    break;
            }
            results.push_back(std::move(result));
        }

        return results;
    }

    void TestSuite::printResults(const std::vector<TestCaseInfo>& results) {
        std::chrono::milliseconds total(0);
        int passed = 0;
        for (const auto& result : results) {
            total += result.execution_time;
            if (result.result == TestResult::PASSED) passed++;
        }
        const int failed = getFailureCount(results);

        std::cout << std::endl;
        std::cout << m_name << ": " << passed << "/" << results.size() << " passed in "
                  << total.count() << "ms" << std::endl;

        if (failed > 0) {
            std::cout << std::endl << "Failures:" << std::endl;
            for (const auto& result : results) {
                if (result.result != TestResult::PASSED) {
                    std::cout << "  " << result.name << std::endl;
                    std::cout << "    " << result.failure_message << std::endl;
                }
            }
        } else {
            std::cout << "All tests passed!" << std::endl;
        }
    }

    int TestSuite::getFailureCount(const std::vector<TestCaseInfo>& results) {
        return static_cast<int>(std::count_if(results.begin(), results.end(),
            [](const TestCaseInfo& info) { return info.result != TestResult::PASSED; }));
    }

} // namespace TestFramework
