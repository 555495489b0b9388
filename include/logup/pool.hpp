/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace logup {

using Task = std::function<void()>;

// Shared background execution resource. Tasks run in FIFO order on a
// fixed set of threads; a task must handle its own errors.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start();
    // Runs queued tasks to completion before joining.
    void stop() noexcept;
    [[nodiscard]] bool submit(Task task) noexcept;
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);
    
    int workers_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    
    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::queue<Task> taskQueue_;
    
    std::vector<std::thread> workerThreads_;
};

}
