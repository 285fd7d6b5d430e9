#ifndef ADMISSION_CONTROL_HPP
#define ADMISSION_CONTROL_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>

/**
 * @class AdmissionControl
 * @brief Counting semaphore bounding the number of in-flight probe units.
 *
 * Constructed once per run and passed by reference to everything that
 * starts or finishes a unit.
 */
class AdmissionControl {
public:
    explicit AdmissionControl(std::size_t capacity);

    AdmissionControl(const AdmissionControl&) = delete;
    AdmissionControl& operator=(const AdmissionControl&) = delete;

    /** @brief Blocks until a slot is free, then takes it. */
    void acquire();

    /**
     * @brief Returns a slot taken by acquire().
     * @throws std::logic_error when no slot is held.
     */
    void release();

    std::size_t capacity() const { return capacity_; }
    std::size_t inFlight() const;

    /** @brief Highest number of slots ever held at once. */
    std::size_t peakInFlight() const;

private:
    const std::size_t capacity_;
    std::size_t inFlight_;
    std::size_t peak_;
    mutable std::mutex mutex_;
    std::condition_variable slotFreed_;
};

/**
 * @class AdmissionSlot
 * @brief Adopts a slot already taken with acquire() and returns it on
 *        destruction, whatever path the holder leaves by.
 */
class AdmissionSlot {
public:
    explicit AdmissionSlot(AdmissionControl& control) : control_(&control) {}
    ~AdmissionSlot() { if (control_) control_->release(); }

    AdmissionSlot(AdmissionSlot&& other) : control_(other.control_) { other.control_ = nullptr; }
    AdmissionSlot& operator=(AdmissionSlot&& other) {
        if (this != &other) {
            if (control_) control_->release();
            control_ = other.control_;
            other.control_ = nullptr;
        }
        return *this;
    }

    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

private:
    AdmissionControl* control_;
};

#endif // ADMISSION_CONTROL_HPP
