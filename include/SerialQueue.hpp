#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <functional>

// One dedicated thread running posted tasks in submission order. Everything
// posted here is serialized, so job state it touches never sees two writers.
// A posted task that throws is logged and the thread moves on to the next one.
class SerialQueue
{
public:
    SerialQueue();
    ~SerialQueue();

    // Non-copyable
    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    void Post(std::function<void()> Task);

    // Posts and blocks until the task ran.
    void Sync(std::function<void()> Task);

    // Blocks until every task posted so far has run.
    void Drain();

    bool IsCurrentThread() const { return std::this_thread::get_id() == SerialThread.get_id(); }

private:
    void SerialThreadLoop();

    std::queue<std::function<void()>> Tasks;
    std::mutex SerialMutex;
    std::condition_variable Serial_CV;
    std::condition_variable SerialIdle_CV;
    bool SerialRunning = true;
    bool SerialBusy = false;
    std::thread SerialThread;
};
