#include "address_space.hpp"
#include <algorithm>
#include <cctype>
#include <arpa/inet.h>
#include <netinet/in.h>

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static uint32_t prefixMask(int prefixLength) {
    return prefixLength == 0 ? 0u : (0xFFFFFFFFu << (32 - prefixLength));
}

AddressSpec AddressSpec::single(uint32_t address) {
    AddressSpec spec;
    spec.kind = AddressSpecKind::Single;
    spec.first = address;
    spec.last = address;
    return spec;
}

AddressSpec AddressSpec::cidr(const Cidr& block) {
    AddressSpec spec;
    spec.kind = AddressSpecKind::Cidr;
    spec.first = block.network;
    spec.last = block.network | ~prefixMask(block.prefixLength);
    spec.prefixes.push_back(block);
    return spec;
}

AddressSpec AddressSpec::range(uint32_t start, uint32_t end) {
    if (start > end) {
        throw InvalidSpec("Invalid range: " + formatIPv4(start) + "-" + formatIPv4(end) +
                          " (start is after end)");
    }
    AddressSpec spec;
    spec.kind = AddressSpecKind::Range;
    spec.first = start;
    spec.last = end;
    return spec;
}

AddressSpec AddressSpec::prefixList(const std::vector<Cidr>& blocks) {
    AddressSpec spec;
    spec.kind = AddressSpecKind::PrefixList;
    spec.first = 0;
    spec.last = 0;
    spec.prefixes = blocks;
    return spec;
}

bool parseIPv4(const std::string& text, uint32_t& out) {
    struct in_addr addr;
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) return false;
    out = ntohl(addr.s_addr);
    return true;
}

std::string formatIPv4(uint32_t address) {
    struct in_addr addr;
    addr.s_addr = htonl(address);
    char buffer[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) return "";
    return buffer;
}

bool parseCidr(const std::string& text, Cidr& out) {
    std::string cidr = trim(text);
    size_t slash = cidr.find('/');
    if (slash == std::string::npos) return false;
    std::string ipStr = cidr.substr(0, slash);
    std::string maskStr = cidr.substr(slash + 1);
    if (maskStr.empty() || maskStr.size() > 2) return false;
    for (char c : maskStr) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    int prefixLength = std::stoi(maskStr);
    if (prefixLength < 0 || prefixLength > 32) return false;
    uint32_t network = 0;
    if (!parseIPv4(ipStr, network)) return false;
    out.network = network & prefixMask(prefixLength);
    out.prefixLength = prefixLength;
    return true;
}

AddressSpec parseAddressSpec(const std::string& text) {
    std::string spec = trim(text);
    if (spec.empty()) {
        throw InvalidSpec("Empty target specification");
    }

    if (spec.find('/') != std::string::npos) {
        Cidr block;
        if (!parseCidr(spec, block)) {
            throw InvalidSpec("Invalid CIDR: " + spec);
        }
        return AddressSpec::cidr(block);
    }

    size_t dash = spec.find('-');
    if (dash != std::string::npos) {
        uint32_t start = 0;
        uint32_t end = 0;
        std::string startStr = trim(spec.substr(0, dash));
        std::string endStr = trim(spec.substr(dash + 1));
        if (!parseIPv4(startStr, start)) {
            throw InvalidSpec("Invalid range start: " + startStr);
        }
        if (!parseIPv4(endStr, end)) {
            throw InvalidSpec("Invalid range end: " + endStr);
        }
        return AddressSpec::range(start, end);
    }

    uint32_t address = 0;
    if (!parseIPv4(spec, address)) {
        throw InvalidSpec("Invalid IP address: " + spec);
    }
    return AddressSpec::single(address);
}

uint64_t usableHostCount(int prefixLength) {
    if (prefixLength >= 32) return 1;
    if (prefixLength == 31) return 2;
    return (uint64_t(1) << (32 - prefixLength)) - 2;
}

void AddressSpace::add(const AddressSpec& spec, const ExpandOptions& options) {
    switch (spec.kind) {
        case AddressSpecKind::Single:
            addresses_.push_back(spec.first);
            break;
        case AddressSpecKind::Range:
            expandRange(spec.first, spec.last);
            break;
        case AddressSpecKind::Cidr:
            expandCidr(spec.prefixes.front(), options);
            break;
        case AddressSpecKind::PrefixList:
            for (const auto& block : spec.prefixes) {
                expandCidr(block, options);
            }
            break;
    }
    normalized_ = false;
}

const std::vector<uint32_t>& AddressSpace::addresses() const {
    if (!normalized_) {
        std::sort(addresses_.begin(), addresses_.end());
        addresses_.erase(std::unique(addresses_.begin(), addresses_.end()), addresses_.end());
        normalized_ = true;
    }
    return addresses_;
}

void AddressSpace::expandCidr(const Cidr& block, const ExpandOptions& options) {
    uint32_t broadcast = block.network | ~prefixMask(block.prefixLength);
    uint32_t firstHost = block.network;
    uint32_t lastHost = broadcast;
    if (block.prefixLength <= 30) {
        firstHost = block.network + 1;
        lastHost = broadcast - 1;
    }
    if (options.sampled) {
        if (options.samplePerPrefix == 0) return;
        uint64_t available = uint64_t(lastHost) - firstHost + 1;
        if (options.samplePerPrefix < available) {
            lastHost = firstHost + static_cast<uint32_t>(options.samplePerPrefix - 1);
        }
    }
    expandRange(firstHost, lastHost);
}

void AddressSpace::expandRange(uint32_t start, uint32_t end) {
    addresses_.reserve(addresses_.size() + static_cast<size_t>(uint64_t(end) - start + 1));
    uint32_t current = start;
    while (true) {
        addresses_.push_back(current);
        if (current == end || current == 0xFFFFFFFFu) break;
        ++current;
    }
}
