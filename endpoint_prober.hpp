#ifndef ENDPOINT_PROBER_HPP
#define ENDPOINT_PROBER_HPP

#include <chrono>
#include <cstdint>
#include <vector>
#include "http_client.hpp"
#include "probe_types.hpp"
#include "signature_detector.hpp"

/**
 * @enum AttemptKind
 * @brief One step of the per-unit attempt plan.
 */
enum class AttemptKind {
    Https,
    Http,
    TcpConnect
};

const char* attemptScheme(AttemptKind attempt);

/**
 * @brief Ports conventionally serving HTTP over TLS: 443, 4443, 8443, 9443, 10443.
 */
std::vector<uint16_t> defaultTlsPorts();

bool prefersTls(uint16_t port, const std::vector<uint16_t>& tlsPorts);

/**
 * @brief Ordered attempts for a port: the likely scheme first, the other
 *        scheme second, then the raw connect when enabled.
 * @param tlsPorts Ports tried with https first; defaultTlsPorts() when omitted.
 */
std::vector<AttemptKind> planAttempts(uint16_t port, bool tcpFallback);
std::vector<AttemptKind> planAttempts(uint16_t port, bool tcpFallback, const std::vector<uint16_t>& tlsPorts);

/**
 * @struct ProberOptions
 * @brief Per-attempt timeout and fallback behaviour.
 */
struct ProberOptions {
    std::chrono::milliseconds timeout = std::chrono::milliseconds(800);
    bool tcpFallback = true;
    int maxRedirects = HttpClient::kDefaultMaxRedirects;
    std::vector<uint16_t> tlsPorts = defaultTlsPorts();
};

/**
 * @class EndpointProber
 * @brief Runs the attempt plan against one (address, port) and classifies
 *        the first response that matches the detector.
 */
class EndpointProber : public Prober {
public:
    EndpointProber(const ProberOptions& options, const SignatureDetector& detector);

    /**
     * @brief Probes one unit. Network failures yield Silent, never an exception.
     * @param unit Address and port to probe.
     * @return Match on the first classified response, Open when only the raw
     *         connect succeeded, Silent otherwise.
     */
    ProbeResult probe(const ProbeUnit& unit) override;

private:
    bool attemptHttp(const ProbeUnit& unit, AttemptKind attempt, ProbeResult& result) const;
    bool attemptConnect(const ProbeUnit& unit, ProbeResult& result) const;

    ProberOptions options_;
    SignatureDetector detector_;
    HttpClient client_;
};

#endif // ENDPOINT_PROBER_HPP
