#include "probe_types.hpp"
#include "address_space.hpp"
#include <sstream>

const char* probeErrorToString(ProbeError error) {
    switch (error) {
        case ProbeError::None: return "none";
        case ProbeError::Timeout: return "timeout";
        case ProbeError::ConnectionRefused: return "connection refused";
        case ProbeError::ProtocolMismatch: return "protocol mismatch";
        case ProbeError::TooManyRedirects: return "too many redirects";
        case ProbeError::IoError: return "i/o error";
    }
    return "unknown";
}

std::string formatResultLine(const ProbeResult& result) {
    std::string address = formatIPv4(result.unit.address);
    std::ostringstream ss;
    ss << address << ":" << result.unit.port << " -> " << result.label << " [";
    if (result.status > 0) {
        ss << result.status;
    } else {
        ss << "tcp";
    }
    ss << "] " << result.scheme << "://" << address << ":" << result.unit.port << "/";
    return ss.str();
}
