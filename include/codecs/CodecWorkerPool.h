/*
 * CodecWorkerPool.h - Bounded worker pool for blocking codec calls
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_CODECWORKERPOOL_H
#define HUSHMARK_CODECS_CODECWORKERPOOL_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

/**
 * @brief Fixed set of threads running codec jobs off the caller's thread.
 *
 * Submissions beyond the queue depth are rejected immediately rather than
 * blocking the caller. A job that outlives its timeout keeps running to
 * completion on its worker; its result is discarded, so jobs must own
 * (capture by value) everything they touch.
 */
class CodecWorkerPool {
public:
    /**
     * @param threads Number of worker threads (at least 1)
     * @param queue_depth Maximum jobs waiting for a worker (at least 1)
     */
    CodecWorkerPool(unsigned int threads, size_t queue_depth);

    /**
     * @brief Drains queued jobs, then joins every worker.
     */
    ~CodecWorkerPool();

    /**
     * @brief Run @p fn on a worker and wait for its result.
     *
     * Exceptions thrown by @p fn propagate unchanged.
     *
     * @param stage Error kind raised when the queue is full
     * @param what Name of the call, used in error messages
     * @throws TimeoutError if @p fn has not finished within @p timeout
     */
    template<typename R>
    R run(std::function<R()> fn, std::chrono::milliseconds timeout, ErrorKind stage, const std::string& what) {
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = task->get_future();

        if (!tryEnqueue([task]() { (*task)(); })) {
            Core::throwStageError(stage, what + ": codec queue full (" + std::to_string(m_queue_depth) + " pending)");
        }

        if (result.wait_for(timeout) != std::future_status::ready) {
            Debug::log("pool", what, " timed out after ", timeout.count(), "ms");
            throw TimeoutError(what + " did not finish within " + std::to_string(timeout.count()) + "ms");
        }
        return result.get();
    }

    unsigned int threadCount() const { return static_cast<unsigned int>(m_workers.size()); }
    size_t queueDepth() const { return m_queue_depth; }
    size_t pending() const;

private:
    CodecWorkerPool(const CodecWorkerPool&);
    CodecWorkerPool &operator=(const CodecWorkerPool&);

    bool tryEnqueue(std::function<void()> job);
    void workerLoop(unsigned int id);

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;
    size_t m_queue_depth;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_shutdown = false;
};

} // namespace Codec
} // namespace Hushmark

using Hushmark::Codec::CodecWorkerPool;

#endif // HUSHMARK_CODECS_CODECWORKERPOOL_H
