#ifndef PROBE_SCHEDULER_HPP
#define PROBE_SCHEDULER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include "admission_control.hpp"
#include "blocking_queue.hpp"
#include "probe_types.hpp"

/**
 * @struct ScanSummary
 * @brief Counters for one completed run.
 */
struct ScanSummary {
    uint64_t launched = 0;      ///< Units handed to the worker pool.
    uint64_t completed = 0;     ///< Units that reached a terminal state.
    uint64_t matches = 0;       ///< Units that ended in Match.
    uint64_t open = 0;          ///< Units that ended in Open.
    std::size_t peakInFlight = 0; ///< Highest number of admission slots held at once.
};

typedef std::function<void(const ProbeResult&)> ResultCallback;

/**
 * @class ProbeScheduler
 * @brief Runs every (address, port) unit through a Prober with at most
 *        admission.capacity() units in flight.
 *
 * Units are launched address-major, port-minor. Results are handed to the
 * callback on the calling thread in completion order, as they arrive.
 */
class ProbeScheduler {
public:
    ProbeScheduler(Prober& prober, AdmissionControl& admission);

    /**
     * @brief Probes the cross product of addresses and ports.
     * @param addresses Read-only address snapshot shared by all units.
     * @param ports Read-only port snapshot shared by all units.
     * @param onResult Called once per unit, including Silent ones.
     * @return Counters for the run.
     */
    ScanSummary run(const std::vector<uint32_t>& addresses,
                    const std::vector<uint16_t>& ports,
                    const ResultCallback& onResult);

private:
    void launchUnits(const std::vector<uint32_t>& addresses,
                     const std::vector<uint16_t>& ports,
                     BlockingQueue<ProbeUnit>& work,
                     uint64_t& launched);
    void workerLoop(BlockingQueue<ProbeUnit>& work, BlockingQueue<ProbeResult>& completed);

    Prober& prober_;
    AdmissionControl& admission_;
};

#endif // PROBE_SCHEDULER_HPP
