#ifndef PROBE_TYPES_HPP
#define PROBE_TYPES_HPP

#include <cstdint>
#include <string>

/**
 * @struct ProbeUnit
 * @brief One (address, port) pair: the unit of scheduling.
 */
struct ProbeUnit {
    uint32_t address;  ///< IPv4 address in host byte order.
    uint16_t port;     ///< TCP port, 1..65535.
};

/**
 * @enum ProbeOutcome
 * @brief Terminal state of a probe unit.
 */
enum class ProbeOutcome {
    Silent,  ///< Nothing useful: no response, refused, or no signature.
    Open,    ///< TCP connect succeeded but no HTTP exchange matched.
    Match    ///< The management interface was identified.
};

/**
 * @enum ProbeError
 * @brief Why an attempt produced no usable response. Never fatal.
 */
enum class ProbeError {
    None,
    Timeout,
    ConnectionRefused,
    ProtocolMismatch,
    TooManyRedirects,
    IoError
};

const char* probeErrorToString(ProbeError error);

/**
 * @struct ProbeResult
 * @brief Outcome of one probe unit, consumed as soon as it is produced.
 */
struct ProbeResult {
    ProbeUnit unit;
    ProbeOutcome outcome = ProbeOutcome::Silent;
    std::string scheme;                 ///< "http", "https" or "tcp".
    int status = 0;                     ///< HTTP status, 0 when none.
    std::string label;                  ///< Product label for Match.
    ProbeError error = ProbeError::None; ///< Last attempt error, for diagnostics.
};

/**
 * @class Prober
 * @brief Performs the network work for one unit. Implementations must be
 *        safe to call from many threads at once and must not throw for
 *        network failures.
 */
class Prober {
public:
    virtual ~Prober() {}
    virtual ProbeResult probe(const ProbeUnit& unit) = 0;
};

/**
 * @brief Renders a Match or Open result as an output line:
 *        "<address>:<port> -> <label> [<status|tcp>] <scheme>://<address>:<port>/".
 */
std::string formatResultLine(const ProbeResult& result);

#endif // PROBE_TYPES_HPP
