#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

// Cooperative cancel/pause flags shared by a job and every copy it runs.
// Copies look at it only at well-defined points (block boundaries, dispatch).
class TransferControl
{
public:
    TransferControl() = default;

    TransferControl(const TransferControl&) = delete;
    TransferControl& operator=(const TransferControl&) = delete;

    void Cancel();
    bool IsCancelled() const { return Cancelled.load(); }

    void Pause();
    void Resume();
    bool IsPaused() const { return Paused.load(); }

    // Blocks while paused. Returns false once cancelled, including while waiting.
    bool WaitWhilePaused();

private:
    std::atomic<bool> Cancelled{ false };
    std::atomic<bool> Paused{ false };

    std::mutex ControlMutex;
    std::condition_variable Control_CV;
};
