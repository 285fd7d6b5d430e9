#ifndef SCAN_CONFIG_HPP
#define SCAN_CONFIG_HPP

#include <cstddef>
#include <string>
#include "console.hpp"

/**
 * @struct ScanConfig
 * @brief Everything the command line controls, with the scanner's defaults.
 */
struct ScanConfig {
    std::string target;                 ///< IP, CIDR, range or "AS<n>"; may be empty with asnFile.
    std::string portsSpec;              ///< Raw --ports list; empty means the default ports.
    bool allPorts = false;
    int concurrency = 400;
    int timeoutMs = 800;
    std::string asnFile;                ///< One CIDR per line.
    bool sampled = false;
    std::size_t samplePerPrefix = 16;
    bool tcpFallback = true;
    bool reportOpen = false;
    std::string captureInterface;       ///< Empty disables packet capture.
    std::string captureCsv = "captured_packets.csv";
    LogLevel logLevel = LogLevel::Info;
    bool showHelp = false;
    bool showVersion = false;
};

/**
 * @brief Fills config from argv. argv[0] is skipped.
 * @throws std::invalid_argument on unknown options, missing values,
 *         non-positive numbers or more than one target.
 */
void parseArguments(int argc, char* argv[], ScanConfig& config);

/**
 * @brief Usage text printed by --help.
 */
std::string usageText(const std::string& program);

#endif // SCAN_CONFIG_HPP
