#include "probe_scheduler.hpp"
#include "address_space.hpp"
#include "console.hpp"
#include <algorithm>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

ProbeScheduler::ProbeScheduler(Prober& prober, AdmissionControl& admission)
    : prober_(prober), admission_(admission) {}

ScanSummary ProbeScheduler::run(const std::vector<uint32_t>& addresses,
                                const std::vector<uint16_t>& ports,
                                const ResultCallback& onResult) {
    ScanSummary summary;
    if (addresses.empty() || ports.empty()) return summary;

    uint64_t totalUnits = uint64_t(addresses.size()) * ports.size();
    std::size_t workerCount = static_cast<std::size_t>(
        std::min<uint64_t>(admission_.capacity(), totalUnits));

    BlockingQueue<ProbeUnit> work(admission_.capacity());
    BlockingQueue<ProbeResult> completed;
    uint64_t launched = 0;

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    try {
        for (std::size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(&ProbeScheduler::workerLoop, this, std::ref(work), std::ref(completed));
        }
    } catch (const std::system_error& e) {
        if (workers.empty()) throw;
        logWarn("Started " + std::to_string(workers.size()) + " of " +
                std::to_string(workerCount) + " workers: " + e.what());
    }

    std::thread launcher;
    try {
        launcher = std::thread([&]() {
            launchUnits(addresses, ports, work, launched);
            work.close();
            for (auto& worker : workers) {
                worker.join();
            }
            completed.close();
        });
    } catch (const std::system_error&) {
        work.close();
        for (auto& worker : workers) {
            worker.join();
        }
        throw;
    }

    ProbeResult result;
    while (completed.pop(result)) {
        ++summary.completed;
        if (result.outcome == ProbeOutcome::Match) ++summary.matches;
        if (result.outcome == ProbeOutcome::Open) ++summary.open;
        if (!onResult) continue;
        try {
            onResult(result);
        } catch (const std::exception& e) {
            logError(std::string("Result handler error: ") + e.what());
        } catch (...) {
            logError("Result handler error: unknown exception");
        }
    }
    launcher.join();

    summary.launched = launched;
    summary.peakInFlight = admission_.peakInFlight();
    return summary;
}

void ProbeScheduler::launchUnits(const std::vector<uint32_t>& addresses,
                                 const std::vector<uint16_t>& ports,
                                 BlockingQueue<ProbeUnit>& work,
                                 uint64_t& launched) {
    for (uint32_t address : addresses) {
        for (uint16_t port : ports) {
            admission_.acquire();
            ProbeUnit unit = {address, port};
            if (!work.push(unit)) {
                admission_.release();
                return;
            }
            ++launched;
        }
    }
}

void ProbeScheduler::workerLoop(BlockingQueue<ProbeUnit>& work, BlockingQueue<ProbeResult>& completed) {
    ProbeUnit unit = {0, 0};
    while (work.pop(unit)) {
        AdmissionSlot slot(admission_);
        ProbeResult result;
        try {
            result = prober_.probe(unit);
        } catch (const std::exception& e) {
            logError("Probe of " + formatIPv4(unit.address) + ":" + std::to_string(unit.port) +
                     " failed: " + e.what());
            result = ProbeResult();
            result.unit = unit;
        } catch (...) {
            logError("Probe of " + formatIPv4(unit.address) + ":" + std::to_string(unit.port) +
                     " failed: unknown exception");
            result = ProbeResult();
            result.unit = unit;
        }
        completed.push(std::move(result));
    }
}
