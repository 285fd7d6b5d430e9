#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "admission_control.hpp"
#include "console.hpp"
#include "probe_scheduler.hpp"

// Sleeps briefly per unit and records the highest concurrency it observed.
class CountingProber : public Prober {
public:
    ProbeResult probe(const ProbeUnit& unit) override {
        int now = ++active_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active_;
        ProbeResult result;
        result.unit = unit;
        if (unit.port == 8080) {
            result.outcome = ProbeOutcome::Match;
            result.scheme = "http";
            result.status = 200;
            result.label = "MikroTik";
        }
        return result;
    }

    int peak() const { return peak_.load(); }

private:
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

TEST(ProbeSchedulerTest, EveryUnitCompletesWithinAdmissionBound) {
    std::vector<uint32_t> addresses;
    for (uint32_t a = 1; a <= 50; ++a) addresses.push_back(0x0A000000 + a);
    std::vector<uint16_t> ports = {80, 443, 8080};

    CountingProber prober;
    AdmissionControl admission(8);
    ProbeScheduler scheduler(prober, admission);

    std::map<std::pair<uint32_t, uint16_t>, int> seen;
    ScanSummary summary = scheduler.run(addresses, ports, [&](const ProbeResult& r) {
        ++seen[std::make_pair(r.unit.address, r.unit.port)];
    });

    EXPECT_EQ(summary.launched, 150u);
    EXPECT_EQ(summary.completed, 150u);
    EXPECT_EQ(summary.matches, 50u);
    EXPECT_EQ(seen.size(), 150u);
    for (const auto& entry : seen) EXPECT_EQ(entry.second, 1);
    EXPECT_LE(summary.peakInFlight, 8u);
    EXPECT_LE(prober.peak(), 8);
    EXPECT_EQ(admission.inFlight(), 0u);
}

TEST(ProbeSchedulerTest, CapacityOfOneSerializes) {
    CountingProber prober;
    AdmissionControl admission(1);
    ProbeScheduler scheduler(prober, admission);
    ScanSummary summary = scheduler.run({1, 2, 3, 4}, {80, 81}, ResultCallback());
    EXPECT_EQ(summary.completed, 8u);
    EXPECT_EQ(prober.peak(), 1);
    EXPECT_EQ(summary.peakInFlight, 1u);
}

TEST(ProbeSchedulerTest, EmptyInputsDoNothing) {
    CountingProber prober;
    AdmissionControl admission(4);
    ProbeScheduler scheduler(prober, admission);
    EXPECT_EQ(scheduler.run({}, {80}, ResultCallback()).completed, 0u);
    EXPECT_EQ(scheduler.run({1}, {}, ResultCallback()).completed, 0u);
}

// The first unit blocks until the callback has already reported the second,
// which only works if results are delivered while the run is in progress.
class GatedProber : public Prober {
public:
    ProbeResult probe(const ProbeUnit& unit) override {
        if (unit.address == 1) {
            std::unique_lock<std::mutex> lock(mutex_);
            released = cv_.wait_for(lock, std::chrono::seconds(5), [this]() { return open_; });
        }
        ProbeResult result;
        result.unit = unit;
        result.outcome = ProbeOutcome::Match;
        return result;
    }

    void openGate() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    bool released = false;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

TEST(ProbeSchedulerTest, ResultsStreamBeforeRunEnds) {
    GatedProber prober;
    AdmissionControl admission(4);
    ProbeScheduler scheduler(prober, admission);

    std::vector<uint32_t> order;
    ScanSummary summary = scheduler.run({1, 2}, {80}, [&](const ProbeResult& r) {
        order.push_back(r.unit.address);
        if (r.unit.address == 2) prober.openGate();
    });

    EXPECT_TRUE(prober.released);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 2u);
    EXPECT_EQ(order[1], 1u);
    EXPECT_EQ(summary.matches, 2u);
}

class ThrowingProber : public Prober {
public:
    ProbeResult probe(const ProbeUnit& unit) override {
        if (unit.port == 81) throw std::runtime_error("boom");
        ProbeResult result;
        result.unit = unit;
        result.outcome = ProbeOutcome::Open;
        return result;
    }
};

TEST(ProbeSchedulerTest, FailuresStayInsideTheirUnit) {
    LogLevel previous = logLevel();
    setLogLevel(LogLevel::Error);
    ThrowingProber prober;
    AdmissionControl admission(3);
    ProbeScheduler scheduler(prober, admission);
    int callbacks = 0;
    ScanSummary summary = scheduler.run({1, 2, 3}, {80, 81}, [&](const ProbeResult& r) {
        ++callbacks;
        if (r.unit.address == 3 && r.unit.port == 80) throw std::runtime_error("handler failed");
    });
    setLogLevel(previous);

    EXPECT_EQ(summary.completed, 6u);
    EXPECT_EQ(summary.open, 3u);
    EXPECT_EQ(callbacks, 6);
    EXPECT_EQ(admission.inFlight(), 0u);
}

class ForeignThrowingProber : public Prober {
public:
    ProbeResult probe(const ProbeUnit& unit) override {
        if (unit.address == 2) throw 42;
        ProbeResult result;
        result.unit = unit;
        result.outcome = ProbeOutcome::Match;
        return result;
    }
};

TEST(ProbeSchedulerTest, NonStandardExceptionsBecomeSilentResults) {
    LogLevel previous = logLevel();
    setLogLevel(LogLevel::Error);
    ForeignThrowingProber prober;
    AdmissionControl admission(2);
    ProbeScheduler scheduler(prober, admission);
    std::vector<ProbeResult> results;
    ScanSummary summary = scheduler.run({1, 2, 3}, {80}, [&](const ProbeResult& r) {
        results.push_back(r);
        if (r.unit.address == 3) throw "handler failed";
    });
    setLogLevel(previous);

    EXPECT_EQ(summary.launched, 3u);
    EXPECT_EQ(summary.completed, 3u);
    EXPECT_EQ(summary.matches, 2u);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        if (r.unit.address == 2) {
            EXPECT_EQ(r.outcome, ProbeOutcome::Silent);
            EXPECT_EQ(r.unit.port, 80);
        }
    }
    EXPECT_EQ(admission.inFlight(), 0u);
}
