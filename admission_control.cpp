#include "admission_control.hpp"
#include <algorithm>
#include <stdexcept>

AdmissionControl::AdmissionControl(std::size_t capacity)
    : capacity_(capacity), inFlight_(0), peak_(0) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Concurrency limit must be positive");
    }
}

void AdmissionControl::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    slotFreed_.wait(lock, [this] { return inFlight_ < capacity_; });
    ++inFlight_;
    peak_ = std::max(peak_, inFlight_);
}

void AdmissionControl::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_ == 0) {
            throw std::logic_error("AdmissionControl::release without a matching acquire");
        }
        --inFlight_;
    }
    slotFreed_.notify_one();
}

std::size_t AdmissionControl::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

std::size_t AdmissionControl::peakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}
