#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace scriptbox::execution {

// Bounds the number of sandbox runs in flight. A capacity of 0 admits
// everything.
class AdmissionGate {
public:
    class Slot {
    public:
        explicit Slot(AdmissionGate* gate) : gate_(gate) {}
        ~Slot();
        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot& operator=(Slot&&) = delete;

    private:
        AdmissionGate* gate_;
    };

    AdmissionGate(int capacity, std::chrono::milliseconds max_wait);

    // Waits up to max_wait for a free slot; nullopt when none became free.
    std::optional<Slot> TryAcquire();

    int InFlight() const;
    int Capacity() const { return capacity_; }

private:
    void Release();

    const int capacity_;
    const std::chrono::milliseconds max_wait_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int in_flight_ = 0;
};

}  // namespace scriptbox::execution
