/*
 * CodecWorkerPool.cpp - Bounded worker pool for blocking codec calls
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

CodecWorkerPool::CodecWorkerPool(unsigned int threads, size_t queue_depth)
    : m_queue_depth(std::max<size_t>(queue_depth, 1))
{
    threads = std::max(threads, 1u);
    m_workers.reserve(threads);
    for (unsigned int i = 0; i < threads; ++i) {
        m_workers.emplace_back(&CodecWorkerPool::workerLoop, this, i);
    }
    Debug::log("pool", "started ", threads, " codec worker(s), queue depth ", m_queue_depth);
}

CodecWorkerPool::~CodecWorkerPool()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_cv.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t CodecWorkerPool::pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

bool CodecWorkerPool::tryEnqueue(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown || m_jobs.size() >= m_queue_depth) {
            return false;
        }
        m_jobs.push(std::move(job));
    }
    m_cv.notify_one();
    return true;
}

void CodecWorkerPool::workerLoop(unsigned int id)
{
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || !m_jobs.empty(); });
            if (m_jobs.empty()) {
                break; // shut down and drained
            }
            job = std::move(m_jobs.front());
            m_jobs.pop();
        }
        // packaged_task captures anything the job throws
        job();
    }
    Debug::log("pool", "codec worker ", id, " exiting");
}

} // namespace Codec
} // namespace Hushmark
