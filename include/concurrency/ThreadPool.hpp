#pragma once

#include "Task.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace hs::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 1);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks and waits up to gracefulTimeout for running ones. Workers still
    // busy after that are detached; they exit once their task returns.
    void stop(std::chrono::milliseconds gracefulTimeout = std::chrono::milliseconds(1200));

    void submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    bool hasIdleWorker() const;

    // Spawns one more worker when every current one is busy. Used when a caller gives up
    // on a task that may never return, so queued and later tasks still get a thread.
    // Returns whether a worker was added.
    bool ensureIdleWorker();

    [[nodiscard]] unsigned int workerCount() const;

private:
    // Owned jointly with the workers so a detached worker never touches a destroyed pool.
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::condition_variable exited;
        std::queue<std::shared_ptr<Task>> queue;
        bool stop = false;
        unsigned int alive = 0;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> idle;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void spawnWorker();

    std::shared_ptr<State> state_;
    std::vector<Worker> workers_;
};

}
