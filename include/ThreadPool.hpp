#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <string>

// Fixed set of workers draining one FIFO of tasks. A task that throws, even a
// non-std exception, is logged under the pool's name and the worker keeps going.
class ThreadPool
{
public:
    ThreadPool(size_t WorkerCount, std::string Name);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Submit(std::function<void()> Task);

    // Blocks until every submitted task has finished running.
    void Join();

private:
    const std::string PoolName;
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Tasks;

    std::mutex PoolMutex;
    std::condition_variable TaskReady_CV;
    std::condition_variable Idle_CV;
    bool Stopping = false;
    size_t Unfinished = 0;     // queued + running

    void WorkerLoop();
};
