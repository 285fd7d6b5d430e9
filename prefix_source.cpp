#include "prefix_source.hpp"
#include "console.hpp"
#include <cctype>
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>

// Large networks announce thousands of prefixes.
static const std::size_t kMaxLookupBytes = 32 * 1024 * 1024;

static const char* kRipeStatUrl = "https://stat.ripe.net/data/announced-prefixes/data.json?resource=AS";

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<Cidr> readPrefixFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw LookupFailure("Failed to read prefix file " + path);
    }
    std::vector<Cidr> prefixes;
    std::string line;
    int lineNo = 0;
    int skipped = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;
        Cidr block;
        if (!parseCidr(entry, block)) {
            ++skipped;
            logWarn("Invalid CIDR at " + path + ":" + std::to_string(lineNo) + ": " + entry);
            continue;
        }
        prefixes.push_back(block);
    }
    if (file.bad()) {
        throw LookupFailure("Error while reading prefix file " + path);
    }
    if (skipped > 0) {
        logInfo("Skipped " + std::to_string(skipped) + " malformed line(s) in " + path);
    }
    return prefixes;
}

bool looksLikeAsn(const std::string& text) {
    std::string s = trim(text);
    return s.size() > 2 && (s[0] == 'A' || s[0] == 'a') && (s[1] == 'S' || s[1] == 's') &&
           std::isdigit(static_cast<unsigned char>(s[2]));
}

std::string normalizeAsn(const std::string& text) {
    std::string s = trim(text);
    if (s.size() > 2 && (s[0] == 'A' || s[0] == 'a') && (s[1] == 'S' || s[1] == 's')) {
        s = s.substr(2);
    }
    if (s.empty() || s.size() > 10) {
        throw LookupFailure("Invalid ASN: " + text);
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw LookupFailure("Invalid ASN: " + text);
        }
    }
    unsigned long long value = std::stoull(s);
    if (value > 0xFFFFFFFFull) {
        throw LookupFailure("Invalid ASN: " + text);
    }
    return std::to_string(value);
}

std::vector<Cidr> parseAnnouncedPrefixes(const std::string& body) {
    std::vector<Cidr> prefixes;
    try {
        nlohmann::json doc = nlohmann::json::parse(body);
        if (!doc.is_object()) {
            throw LookupFailure("ASN lookup returned an unexpected document");
        }
        std::string status = doc.value("status", std::string());
        if (status != "ok") {
            throw LookupFailure("ASN lookup returned status '" + status + "'");
        }
        const nlohmann::json& data = doc.at("data");
        const nlohmann::json& list = data.at("prefixes");
        if (!list.is_array()) {
            throw LookupFailure("ASN lookup returned no prefix list");
        }
        for (const auto& entry : list) {
            if (!entry.is_object() || !entry.contains("prefix") || !entry["prefix"].is_string()) continue;
            Cidr block;
            // IPv6 prefixes fail to parse and are dropped here.
            if (parseCidr(entry["prefix"].get<std::string>(), block)) {
                prefixes.push_back(block);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw LookupFailure(std::string("ASN lookup returned malformed JSON: ") + e.what());
    }
    return prefixes;
}

RipeStatPrefixSource::RipeStatPrefixSource(std::chrono::milliseconds timeout)
    : timeout_(timeout), client_(HttpClient::kDefaultMaxRedirects, kMaxLookupBytes, true) {}

std::vector<Cidr> RipeStatPrefixSource::announcedPrefixes(const std::string& asn) {
    Url url;
    if (!parseUrl(std::string(kRipeStatUrl) + asn, url)) {
        throw LookupFailure("Invalid ASN: " + asn);
    }
    HttpResponse response;
    ProbeError err = client_.get(url, timeout_, response);
    if (err != ProbeError::None) {
        throw LookupFailure("ASN lookup for AS" + asn + " failed: " + probeErrorToString(err));
    }
    if (response.status != 200) {
        throw LookupFailure("ASN lookup for AS" + asn + " returned HTTP " + std::to_string(response.status));
    }
    return parseAnnouncedPrefixes(response.body);
}
