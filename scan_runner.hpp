#ifndef SCAN_RUNNER_HPP
#define SCAN_RUNNER_HPP

#include <ostream>
#include "address_space.hpp"
#include "port_set.hpp"
#include "prefix_source.hpp"
#include "probe_scheduler.hpp"
#include "probe_types.hpp"
#include "scan_config.hpp"

/**
 * @struct ScanPlan
 * @brief The resolved address and port sets of one run.
 */
struct ScanPlan {
    AddressSpace addresses;
    PortSet ports;
};

/**
 * @class ScanObserver
 * @brief Hooks around the probing phase of a run.
 */
class ScanObserver {
public:
    virtual ~ScanObserver() {}
    virtual void scanStarting(const ScanPlan& /*plan*/) {}
    virtual void scanFinished(const ScanSummary& /*summary*/) {}
};

/**
 * @brief Port set selected by the config: --all-ports, --ports or the defaults.
 * @throws InvalidPortSpec
 */
PortSet selectPorts(const ScanConfig& config);

/**
 * @brief Resolves the target, the prefix file and any AS number into one plan.
 * @throws InvalidSpec, InvalidPortSpec or LookupFailure. An empty address set
 *         is reported as InvalidSpec.
 */
ScanPlan planScan(const ScanConfig& config, AsnPrefixSource& asnSource);

/**
 * @brief Probes every unit of the plan and writes Match lines (and Open lines
 *        when config.reportOpen is set) to out as they complete.
 */
ScanSummary executeScan(const ScanPlan& plan, const ScanConfig& config, Prober& prober,
                        std::ostream& out);

/**
 * @brief Plans and executes one scan.
 * @return Process exit status: 1 for input and lookup errors, 0 otherwise.
 */
int runScan(const ScanConfig& config, Prober& prober, AsnPrefixSource& asnSource,
            std::ostream& out, ScanObserver* observer = nullptr);

#endif // SCAN_RUNNER_HPP
