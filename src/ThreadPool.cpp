#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <exception>

ThreadPool::ThreadPool(size_t WorkerCount, std::string Name) : PoolName(std::move(Name))
{
    const size_t Count = WorkerCount == 0 ? 1 : WorkerCount;
    Workers.reserve(Count);
    for (size_t i = 0; i < Count; ++i)
    {
        Workers.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        Stopping = true;
    }
    TaskReady_CV.notify_all();
    for (auto& Worker : Workers)
    {
        Worker.join();
    }
}

void ThreadPool::Submit(std::function<void()> Task)
{
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        Tasks.push(std::move(Task));
        ++Unfinished;
    }
    TaskReady_CV.notify_one();
}

void ThreadPool::Join()
{
    std::unique_lock<std::mutex> Lock(PoolMutex);
    Idle_CV.wait(Lock, [this]() { return Unfinished == 0; });
}

void ThreadPool::WorkerLoop()
{
    std::unique_lock<std::mutex> Lock(PoolMutex);
    while (true)
    {
        TaskReady_CV.wait(Lock, [this]() { return Stopping || !Tasks.empty(); });
        // Queued work still runs on shutdown
        if (Tasks.empty())
        {
            return;
        }
        std::function<void()> Task = std::move(Tasks.front());
        Tasks.pop();
        Lock.unlock();

        try
        {
            Task();
        }
        catch (const std::exception& ex)
        {
            Log.Error("[ThreadPool:" + PoolName + "] Task threw: " + ex.what());
        }
        catch (...)
        {
            Log.Error("[ThreadPool:" + PoolName + "] Task threw a non-standard exception");
        }

        Lock.lock();
        if (--Unfinished == 0)
        {
            Idle_CV.notify_all();
        }
    }
}
