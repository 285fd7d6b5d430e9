#include "scan_config.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

static int parsePositive(const std::string& option, const std::string& value) {
    bool digits = !value.empty() && value.size() <= 9;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
    }
    if (!digits || std::stoi(value) <= 0) {
        throw std::invalid_argument(option + " expects a positive integer, got '" + value + "'");
    }
    return std::stoi(value);
}

static std::string requireValue(int argc, char* argv[], int& i, const std::string& option) {
    if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + option);
    }
    return argv[++i];
}

void parseArguments(int argc, char* argv[], ScanConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--ports" || arg == "-p") {
            config.portsSpec = requireValue(argc, argv, i, arg);
        } else if (arg == "--all-ports") {
            config.allPorts = true;
        } else if (arg == "-c" || arg == "--concurrency") {
            config.concurrency = parsePositive(arg, requireValue(argc, argv, i, arg));
        } else if (arg == "--timeout-ms") {
            config.timeoutMs = parsePositive(arg, requireValue(argc, argv, i, arg));
        } else if (arg == "--asn-file") {
            config.asnFile = requireValue(argc, argv, i, arg);
        } else if (arg == "--sample") {
            config.sampled = true;
            config.samplePerPrefix = static_cast<std::size_t>(parsePositive(arg, requireValue(argc, argv, i, arg)));
        } else if (arg == "--no-tcp-fallback") {
            config.tcpFallback = false;
        } else if (arg == "--report-open") {
            config.reportOpen = true;
        } else if (arg == "--capture") {
            config.captureInterface = requireValue(argc, argv, i, arg);
        } else if (arg == "--capture-csv") {
            config.captureCsv = requireValue(argc, argv, i, arg);
        } else if (arg == "-q" || arg == "--quiet") {
            config.logLevel = LogLevel::Warn;
        } else if (arg == "-v" || arg == "--verbose") {
            config.logLevel = LogLevel::Debug;
        } else if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else if (arg == "--version") {
            config.showVersion = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg + " (use --help for usage)");
        } else if (config.target.empty()) {
            config.target = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
}

std::string usageText(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options] [TARGET]\n"
       << "\n"
       << "TARGET is an IPv4 address, a CIDR block (10.0.0.0/24), a range\n"
       << "(10.0.0.1-10.0.0.50) or an AS number (AS13335).\n"
       << "\n"
       << "Options:\n"
       << "  -p, --ports <list>      Ports and ranges, e.g. 80,443,8080-8090 (default: 80,443,8080)\n"
       << "      --all-ports         Scan ports 1-65535\n"
       << "  -c, --concurrency <n>   Maximum probes in flight (default: 400)\n"
       << "      --timeout-ms <ms>   Per-attempt timeout (default: 800)\n"
       << "      --asn-file <path>   Read CIDR prefixes from a file, one per line\n"
       << "      --sample <n>        Probe only the first n hosts of each AS/file prefix\n"
       << "      --no-tcp-fallback   Do not try a raw TCP connect after HTTP fails\n"
       << "      --report-open       Also print ports that accept TCP but did not match\n"
       << "      --capture <iface>   Capture response traffic on an interface (needs root)\n"
       << "      --capture-csv <f>   Capture output file (default: captured_packets.csv)\n"
       << "  -q, --quiet             Only warnings and errors on stderr\n"
       << "  -v, --verbose           Per-probe diagnostics on stderr\n"
       << "      --version           Print the version\n"
       << "  -h, --help              Show this help\n";
    return ss.str();
}
