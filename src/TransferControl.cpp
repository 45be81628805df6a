#include "TransferControl.hpp"

void TransferControl::Cancel()
{
    {
        std::lock_guard<std::mutex> Lock(ControlMutex);
        Cancelled = true;
    }
    Control_CV.notify_all();
}

void TransferControl::Pause()
{
    std::lock_guard<std::mutex> Lock(ControlMutex);
    Paused = true;
}

void TransferControl::Resume()
{
    {
        std::lock_guard<std::mutex> Lock(ControlMutex);
        Paused = false;
    }
    Control_CV.notify_all();
}

bool TransferControl::WaitWhilePaused()
{
    std::unique_lock<std::mutex> Lock(ControlMutex);
    Control_CV.wait(Lock, [this] { return Cancelled.load() || !Paused.load(); });
    return !Cancelled.load();
}

