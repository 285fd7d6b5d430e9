#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "console.hpp"
#include "endpoint_prober.hpp"
#include "prefix_source.hpp"
#include "scan_config.hpp"
#include "scan_runner.hpp"
#include "signature_detector.hpp"
#ifdef FIGSCAN_ENABLE_CAPTURE
#include "packet_capture.hpp"
#endif

static const char* kVersion = "figscan 0.3.0";

#ifdef FIGSCAN_ENABLE_CAPTURE
// Records reply traffic from the scanned ports for the duration of the scan.
class CaptureObserver : public ScanObserver {
public:
    CaptureObserver(const std::string& interface, const std::string& csvPath)
        : interface_(interface), csvPath_(csvPath), active_(false) {}

    ~CaptureObserver() override { stop(); }

    void scanStarting(const ScanPlan& plan) override {
        std::string filter = buildCaptureFilter(plan.ports.ports());
        if (!capture_.initialize(interface_, filter)) {
            logWarn("Packet capture disabled: " + capture_.lastError());
            return;
        }
        logInfo("Capturing on " + interface_ + " with filter '" + filter + "'");
        active_ = true;
        thread_ = std::thread([this]() {
            if (!capture_.startCapture()) {
                logWarn(capture_.lastError());
            }
        });
    }

    void scanFinished(const ScanSummary& /*summary*/) override {
        if (!active_) return;
        stop();
        if (capture_.saveToCSV(csvPath_)) {
            logInfo("Saved " + std::to_string(capture_.packets().size()) + " captured segment(s) to " + csvPath_);
        } else {
            logWarn("Could not write capture file " + csvPath_);
        }
    }

private:
    void stop() {
        capture_.stopCapture();
        if (thread_.joinable()) thread_.join();
    }

    std::string interface_;
    std::string csvPath_;
    bool active_;
    PacketCapture capture_;
    std::thread thread_;
};
#endif

int main(int argc, char* argv[]) {
    try {
        // TLS writes on a reset connection must not kill the process.
        signal(SIGPIPE, SIG_IGN);

        ScanConfig config;
        parseArguments(argc, argv, config);
        if (config.showHelp) {
            std::cout << usageText(argv[0]);
            return 0;
        }
        if (config.showVersion) {
            std::cout << kVersion << "\n";
            return 0;
        }
        setLogLevel(config.logLevel);
        logInfo(std::string(kVersion) + " - MikroTik WebFig scanner");

        ProberOptions options;
        options.timeout = std::chrono::milliseconds(config.timeoutMs);
        options.tcpFallback = config.tcpFallback;
        EndpointProber prober(options, SignatureDetector::mikrotik());
        RipeStatPrefixSource asnSource;

        std::unique_ptr<ScanObserver> capture;
        if (!config.captureInterface.empty()) {
#ifdef FIGSCAN_ENABLE_CAPTURE
            capture = std::make_unique<CaptureObserver>(config.captureInterface, config.captureCsv);
#else
            logWarn("Packet capture disabled: figscan was built without libpcap");
#endif
        }
        return runScan(config, prober, asnSource, std::cout, capture.get());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
