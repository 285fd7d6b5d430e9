#include "port_set.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <utility>

static const uint16_t kDefaultPorts[] = {80, 443, 8080};

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

// Parses one decimal port; rejects 0, values above 65535 and non-digits.
static uint16_t parsePort(const std::string& text, const std::string& token) {
    std::string digits = trim(text);
    if (digits.empty() || digits.size() > 5) {
        throw InvalidPortSpec("Bad port: " + token);
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidPortSpec("Bad port: " + token);
        }
    }
    long value = std::stol(digits);
    if (value < 1 || value > 65535) {
        throw InvalidPortSpec("Bad port: " + token);
    }
    return static_cast<uint16_t>(value);
}

PortSet::PortSet(std::vector<uint16_t> ports) : ports_(std::move(ports)) {
    std::sort(ports_.begin(), ports_.end());
    ports_.erase(std::unique(ports_.begin(), ports_.end()), ports_.end());
}

PortSet PortSet::parse(const std::string& spec) {
    std::vector<uint16_t> ports;
    std::istringstream stream(spec);
    std::string part;
    while (std::getline(stream, part, ',')) {
        std::string token = trim(part);
        if (token.empty()) continue;
        size_t dash = token.find('-');
        if (dash == std::string::npos) {
            ports.push_back(parsePort(token, token));
            continue;
        }
        uint16_t lo = parsePort(token.substr(0, dash), token);
        uint16_t hi = parsePort(token.substr(dash + 1), token);
        if (lo > hi) {
            throw InvalidPortSpec("Bad range: " + token);
        }
        for (uint32_t p = lo; p <= hi; ++p) {
            ports.push_back(static_cast<uint16_t>(p));
        }
    }
    if (ports.empty()) {
        throw InvalidPortSpec("Empty ports list");
    }
    return PortSet(std::move(ports));
}

PortSet PortSet::all() {
    std::vector<uint16_t> ports;
    ports.reserve(65535);
    for (uint32_t p = 1; p <= 65535; ++p) {
        ports.push_back(static_cast<uint16_t>(p));
    }
    return PortSet(std::move(ports));
}

PortSet PortSet::defaults() {
    return PortSet(std::vector<uint16_t>(std::begin(kDefaultPorts), std::end(kDefaultPorts)));
}
