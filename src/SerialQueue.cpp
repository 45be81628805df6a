#include "SerialQueue.hpp"
#include "Logger.hpp"

#include <exception>
#include <string>

SerialQueue::SerialQueue()
{
    SerialThread = std::thread(&SerialQueue::SerialThreadLoop, this);
}

SerialQueue::~SerialQueue()
{
    {
        std::lock_guard<std::mutex> lock(SerialMutex);
        SerialRunning = false;
    }
    Serial_CV.notify_all();

    if (SerialThread.joinable())
    {
        SerialThread.join();
    }
}

void SerialQueue::Post(std::function<void()> Task)
{
    {
        std::lock_guard<std::mutex> lock(SerialMutex);
        Tasks.push(std::move(Task));
    }
    Serial_CV.notify_one();
}

void SerialQueue::Sync(std::function<void()> Task)
{
    if (IsCurrentThread())
    {
        Task();
        return;
    }

    std::mutex DoneMutex;
    std::condition_variable Done_CV;
    bool Done = false;
    std::exception_ptr Failure;

    Post([&]()
    {
        try
        {
            Task();
        }
        catch (...)
        {
            Failure = std::current_exception();
        }
        // Notify under the lock: the waiter owns Done_CV and may return as soon as it sees Done
        std::lock_guard<std::mutex> lock(DoneMutex);
        Done = true;
        Done_CV.notify_one();
    });

    std::unique_lock<std::mutex> lock(DoneMutex);
    Done_CV.wait(lock, [&]() { return Done; });
    if (Failure)
    {
        std::rethrow_exception(Failure);
    }
}

void SerialQueue::Drain()
{
    if (IsCurrentThread())
    {
        return;
    }
    std::unique_lock<std::mutex> lock(SerialMutex);
    SerialIdle_CV.wait(lock, [this]() { return Tasks.empty() && !SerialBusy; });
}

void SerialQueue::SerialThreadLoop()
{
    while (true)
    {
        std::function<void()> Task;
        {
            std::unique_lock<std::mutex> lock(SerialMutex);
            Serial_CV.wait(lock, [this]() { return !Tasks.empty() || !SerialRunning; });

            // Queued work still runs on shutdown
            if (Tasks.empty())
            {
                break;
            }
            Task = std::move(Tasks.front());
            Tasks.pop();
            SerialBusy = true;
        }

        try
        {
            Task();
        }
        catch (const std::exception& ex)
        {
            Log.Error(std::string("[SerialQueue] Task threw: ") + ex.what());
        }
        catch (...)
        {
            Log.Error("[SerialQueue] Task threw a non-standard exception");
        }

        {
            std::lock_guard<std::mutex> lock(SerialMutex);
            SerialBusy = false;
        }
        SerialIdle_CV.notify_all();
    }
}
