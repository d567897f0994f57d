#include "execution/admission_gate.hpp"

namespace scriptbox::execution {

AdmissionGate::Slot::~Slot() {
    if (gate_) {
        gate_->Release();
    }
}

AdmissionGate::AdmissionGate(int capacity, std::chrono::milliseconds max_wait)
    : capacity_(capacity),
      max_wait_(max_wait) {}

std::optional<AdmissionGate::Slot> AdmissionGate::TryAcquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (capacity_ > 0) {
        const bool admitted = cv_.wait_for(lock, max_wait_, [this] { return in_flight_ < capacity_; });
        if (!admitted) {
            return std::nullopt;
        }
    }
    ++in_flight_;
    return std::optional<Slot>(std::in_place, this);
}

int AdmissionGate::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

void AdmissionGate::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    cv_.notify_one();
}

}  // namespace scriptbox::execution
