#include "scan_runner.hpp"
#include "admission_control.hpp"
#include "console.hpp"
#include <chrono>
#include <string>
#include <utility>

PortSet selectPorts(const ScanConfig& config) {
    if (config.allPorts) return PortSet::all();
    if (!config.portsSpec.empty()) return PortSet::parse(config.portsSpec);
    return PortSet::defaults();
}

ScanPlan planScan(const ScanConfig& config, AsnPrefixSource& asnSource) {
    PortSet ports = selectPorts(config);

    ExpandOptions prefixOptions;
    prefixOptions.sampled = config.sampled;
    prefixOptions.samplePerPrefix = config.samplePerPrefix;

    AddressSpace space;
    if (!config.asnFile.empty()) {
        std::vector<Cidr> prefixes = readPrefixFile(config.asnFile);
        logInfo("Loaded " + std::to_string(prefixes.size()) + " prefix(es) from " + config.asnFile);
        space.add(AddressSpec::prefixList(prefixes), prefixOptions);
    }

    if (!config.target.empty()) {
        if (looksLikeAsn(config.target)) {
            std::string asn = normalizeAsn(config.target);
            std::vector<Cidr> prefixes = asnSource.announcedPrefixes(asn);
            logInfo("AS" + asn + " announces " + std::to_string(prefixes.size()) + " IPv4 prefix(es)");
            space.add(AddressSpec::prefixList(prefixes), prefixOptions);
        } else {
            // An operator-named block is scanned in full; --sample only thins AS and file prefixes.
            space.add(parseAddressSpec(config.target), ExpandOptions());
        }
    }

    if (config.target.empty() && config.asnFile.empty()) {
        throw InvalidSpec("No target given (use --help for usage)");
    }
    if (space.empty()) {
        throw InvalidSpec("No targets to scan");
    }
    return ScanPlan{std::move(space), std::move(ports)};
}

ScanSummary executeScan(const ScanPlan& plan, const ScanConfig& config, Prober& prober,
                        std::ostream& out) {
    const std::vector<uint32_t>& addresses = plan.addresses.addresses();
    const std::vector<uint16_t>& ports = plan.ports.ports();
    logInfo("Scanning " + std::to_string(addresses.size()) + " address(es) x " +
            std::to_string(ports.size()) + " port(s), concurrency " +
            std::to_string(config.concurrency) + ", timeout " + std::to_string(config.timeoutMs) + "ms");

    AdmissionControl admission(static_cast<std::size_t>(config.concurrency));
    ProbeScheduler scheduler(prober, admission);

    auto started = std::chrono::steady_clock::now();
    ScanSummary summary = scheduler.run(addresses, ports, [&](const ProbeResult& result) {
        if (result.outcome == ProbeOutcome::Match ||
            (result.outcome == ProbeOutcome::Open && config.reportOpen)) {
            writeLine(out, formatResultLine(result));
        }
    });
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    logInfo("Done: " + std::to_string(summary.completed) + " probe(s), " +
            std::to_string(summary.matches) + " match(es), " +
            std::to_string(summary.open) + " open without match, peak in flight " +
            std::to_string(summary.peakInFlight) + ", " + std::to_string(elapsed.count()) + "ms");
    return summary;
}

int runScan(const ScanConfig& config, Prober& prober, AsnPrefixSource& asnSource,
            std::ostream& out, ScanObserver* observer) {
    try {
        ScanPlan plan = planScan(config, asnSource);
        if (observer) observer->scanStarting(plan);
        ScanSummary summary = executeScan(plan, config, prober, out);
        if (observer) observer->scanFinished(summary);
    } catch (const InvalidPortSpec& e) {
        logError(std::string("Error parsing ports: ") + e.what());
        return 1;
    } catch (const InvalidSpec& e) {
        logError(e.what());
        return 1;
    } catch (const LookupFailure& e) {
        logError(e.what());
        return 1;
    }
    return 0;
}
