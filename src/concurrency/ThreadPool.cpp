#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace hs::concurrency;
using namespace hs::logging;

ThreadPool::ThreadPool(unsigned int nThreads) : state_(std::make_shared<State>()) {
    if (nThreads == 0) nThreads = 1;
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop(const std::chrono::milliseconds gracefulTimeout) {
    if (workers_.empty()) return;

    {
        std::unique_lock lock(state_->mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(state_->queue, empty);
        state_->stop = true;
        state_->cv.notify_all();
        state_->exited.wait_for(lock, gracefulTimeout, [this] { return state_->alive == 0; });
    }

    size_t detached = 0;
    for (auto& w : workers_) {
        if (!w.thread.joinable()) continue;
        if (w.done->load()) w.thread.join();
        else {
            w.thread.detach(); // force release
            ++detached;
        }
    }

    if (detached > 0 && LogRegistry::isInitialized())
        LogRegistry::healthsync()->warn("[ThreadPool] Detached {} worker(s) still running a task", detached);

    workers_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(state_->mutex);
        if (state_->stop) throw std::runtime_error("ThreadPool is stopped");
        state_->queue.push(std::move(task));
    }
    state_->cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(state_->mutex);
    return state_->queue.size();
}

bool ThreadPool::hasIdleWorker() const {
    return std::ranges::any_of(workers_, [](const Worker& w) { return w.idle->load(); });
}

bool ThreadPool::ensureIdleWorker() {
    {
        std::scoped_lock lock(state_->mutex);
        if (state_->stop) return false;
    }
    if (hasIdleWorker()) return false;

    spawnWorker();
    if (LogRegistry::isInitialized())
        LogRegistry::healthsync()->warn("[ThreadPool] All {} worker(s) busy; added one", workers_.size() - 1);
    return true;
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(workers_.size());
}

void ThreadPool::spawnWorker() {
    auto idle = std::make_shared<std::atomic<bool>>(true); // idle at start
    auto done = std::make_shared<std::atomic<bool>>(false);

    {
        std::scoped_lock lock(state_->mutex);
        ++state_->alive;
    }

    std::thread t([state = state_, idle, done] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(state->mutex);
                state->cv.wait(lock, [&state] {
                    return state->stop || !state->queue.empty();
                });

                if (state->stop) break;

                task = std::move(state->queue.front());
                state->queue.pop();
            }

            if (task) {
                idle->store(false);
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    if (LogRegistry::isInitialized())
                        LogRegistry::healthsync()->error("[ThreadPool] Task escaped with exception: {}", e.what());
                }
                idle->store(true);
            }
        }

        {
            std::scoped_lock lock(state->mutex);
            done->store(true);
            --state->alive;
        }
        state->exited.notify_all();
    });

    workers_.push_back({std::move(t), std::move(idle), std::move(done)});
}
