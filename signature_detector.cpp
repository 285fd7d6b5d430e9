#include "signature_detector.hpp"
#include <algorithm>
#include <cctype>

const std::size_t SignatureDetector::kLabelWindowBytes;

static const std::regex::flag_type kPatternFlags = std::regex::ECMAScript | std::regex::icase;

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

SignatureDetector::SignatureDetector(const std::string& vendor,
                                     const std::vector<Signature>& bodySignatures,
                                     const std::vector<LabelPattern>& labelPatterns,
                                     const std::string& fallbackLabel)
    : vendor_(toLower(vendor)), bodySignatures_(bodySignatures),
      labelPatterns_(labelPatterns), fallbackLabel_(fallbackLabel) {
    for (auto& rule : labelPatterns_) {
        rule.anchor = toLower(rule.anchor);
    }
}

SignatureDetector SignatureDetector::mikrotik() {
    std::vector<Signature> signatures = {
        {"product", std::regex("mikrotik", kPatternFlags)},
        {"webfig", std::regex("webfig", kPatternFlags)},
        {"os", std::regex("routeros", kPatternFlags)}
    };
    // Most specific first. Quantifiers stay bounded: bodies are untrusted.
    std::vector<LabelPattern> labels = {
        {"routeros", std::regex("^routeros\\s{1,8}v?([0-9]{1,5}(?:\\.[0-9]{1,5}){1,3})", kPatternFlags),
         "MikroTik RouterOS v$1"},
        {"routeros", std::regex("^routeros", kPatternFlags), "MikroTik RouterOS"},
        {"webfig", std::regex("^webfig", kPatternFlags), "MikroTik WebFig"}
    };
    return SignatureDetector("mikrotik", signatures, labels, "MikroTik");
}

Detection SignatureDetector::classify(int /*status*/, const std::string& serverHeader,
                                      const std::string& body) const {
    Detection detection;
    if (!vendor_.empty() && toLower(serverHeader).find(vendor_) != std::string::npos) {
        detection.matched = true;
    } else {
        for (const auto& signature : bodySignatures_) {
            if (std::regex_search(body, signature.pattern)) {
                detection.matched = true;
                break;
            }
        }
    }
    if (detection.matched) {
        detection.label = extractLabel(body);
    }
    return detection;
}

// Tries a rule at each anchor occurrence, bounded by kMaxAnchorHits.
static bool matchRule(const LabelPattern& rule, const std::string& body, const std::string& lowered,
                      std::size_t windowBytes, std::smatch& matches, std::string& window) {
    static const int kMaxAnchorHits = 16;
    if (rule.anchor.empty()) {
        window = body.substr(0, windowBytes);
        return std::regex_search(window, matches, rule.pattern);
    }
    size_t from = lowered.find(rule.anchor);
    for (int hits = 0; from != std::string::npos && hits < kMaxAnchorHits; ++hits) {
        window = body.substr(from, windowBytes);
        if (std::regex_search(window, matches, rule.pattern)) return true;
        from = lowered.find(rule.anchor, from + rule.anchor.size());
    }
    return false;
}

std::string SignatureDetector::extractLabel(const std::string& body) const {
    std::string lowered = toLower(body);
    for (const auto& rule : labelPatterns_) {
        std::smatch matches;
        std::string window;
        if (!matchRule(rule, body, lowered, kLabelWindowBytes, matches, window)) continue;
        std::string label = rule.format;
        size_t pos = label.find("$1");
        if (pos != std::string::npos) {
            label.replace(pos, 2, matches.size() > 1 ? matches[1].str() : std::string());
        }
        return label;
    }
    return fallbackLabel_;
}
