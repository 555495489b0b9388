/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/pool.hpp"
#include "logup/logger.hpp"

namespace logup {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        
        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    
    // Refuse new tasks, let workers drain what is queued
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    taskAvailable_.notify_all();
    
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    workerThreads_.clear();
    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(Task task) noexcept {
    if (!task) {
        LOG_ERROR("Refusing empty task");
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit task to stopped pool");
                return false;
            }
            taskQueue_.push(std::move(task));
        }
        
        taskAvailable_.notify_one();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue task: " + std::string(e.what()));
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName("Worker-" + std::to_string(workerId));
    LOG_TRACE("Worker-" + std::to_string(workerId) + " thread started");
    
    while (true) {
        Task task;
        
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            
            taskAvailable_.wait(lock, [this] { 
                return !taskQueue_.empty() || shutdown_.load(); 
            });
            
            if (taskQueue_.empty()) {
                // Only reachable on shutdown
                break;
            }
            
            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }
        
        // Run outside of lock
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " task escaped with error: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " task escaped with unknown error");
        }
    }
    
    LOG_TRACE("Worker " + std::to_string(workerId) + " stopped");
}

}
