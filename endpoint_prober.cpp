#include "endpoint_prober.hpp"
#include <algorithm>
#include "address_space.hpp"
#include "console.hpp"

const char* attemptScheme(AttemptKind attempt) {
    switch (attempt) {
        case AttemptKind::Https: return "https";
        case AttemptKind::Http: return "http";
        case AttemptKind::TcpConnect: return "tcp";
    }
    return "unknown";
}

std::vector<uint16_t> defaultTlsPorts() {
    return {443, 4443, 8443, 9443, 10443};
}

bool prefersTls(uint16_t port, const std::vector<uint16_t>& tlsPorts) {
    return std::find(tlsPorts.begin(), tlsPorts.end(), port) != tlsPorts.end();
}

std::vector<AttemptKind> planAttempts(uint16_t port, bool tcpFallback) {
    return planAttempts(port, tcpFallback, defaultTlsPorts());
}

std::vector<AttemptKind> planAttempts(uint16_t port, bool tcpFallback, const std::vector<uint16_t>& tlsPorts) {
    std::vector<AttemptKind> plan;
    if (prefersTls(port, tlsPorts)) {
        plan.push_back(AttemptKind::Https);
        plan.push_back(AttemptKind::Http);
    } else {
        plan.push_back(AttemptKind::Http);
        plan.push_back(AttemptKind::Https);
    }
    if (tcpFallback) plan.push_back(AttemptKind::TcpConnect);
    return plan;
}

EndpointProber::EndpointProber(const ProberOptions& options, const SignatureDetector& detector)
    : options_(options), detector_(detector), client_(options.maxRedirects) {}

ProbeResult EndpointProber::probe(const ProbeUnit& unit) {
    ProbeResult result;
    result.unit = unit;
    for (AttemptKind attempt : planAttempts(unit.port, options_.tcpFallback, options_.tlsPorts)) {
        bool done = attempt == AttemptKind::TcpConnect
                        ? attemptConnect(unit, result)
                        : attemptHttp(unit, attempt, result);
        if (done) return result;
    }
    result.outcome = ProbeOutcome::Silent;
    return result;
}

bool EndpointProber::attemptHttp(const ProbeUnit& unit, AttemptKind attempt, ProbeResult& result) const {
    Url url;
    url.scheme = attemptScheme(attempt);
    url.host = formatIPv4(unit.address);
    url.port = unit.port;
    url.path = "/";

    HttpResponse response;
    ProbeError err = client_.get(url, options_.timeout, response);
    if (err != ProbeError::None) {
        result.error = err;
        if (logLevel() == LogLevel::Debug) {
            logDebug(formatUrl(url) + " " + probeErrorToString(err));
        }
        return false;
    }

    Detection detection = detector_.classify(response.status, response.header("server"), response.body);
    if (!detection.matched) {
        result.error = ProbeError::None;
        if (logLevel() == LogLevel::Debug) {
            logDebug(formatUrl(url) + " [" + std::to_string(response.status) + "] no signature");
        }
        return false;
    }

    result.outcome = ProbeOutcome::Match;
    result.scheme = url.scheme;
    result.status = response.status;
    result.label = detection.label;
    result.error = ProbeError::None;
    return true;
}

bool EndpointProber::attemptConnect(const ProbeUnit& unit, ProbeResult& result) const {
    Socket sock;
    Deadline deadline = std::chrono::steady_clock::now() + options_.timeout;
    ProbeError err = connectWithTimeout(unit.address, unit.port, deadline, sock);
    if (err != ProbeError::None) {
        result.error = err;
        return false;
    }
    result.outcome = ProbeOutcome::Open;
    result.scheme = attemptScheme(AttemptKind::TcpConnect);
    result.status = 0;
    result.label = "open port";
    result.error = ProbeError::None;
    return true;
}
