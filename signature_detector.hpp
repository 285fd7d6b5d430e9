#ifndef SIGNATURE_DETECTOR_HPP
#define SIGNATURE_DETECTOR_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

// Structure for a body signature
struct Signature {
    std::string name;        // Short name used in debug output
    std::regex pattern;      // Case-insensitive pattern searched in the body
};

// Structure for a label extraction rule. The pattern only runs on a short
// window of the body starting at the first case-insensitive occurrence of
// anchor; "$1" in format is replaced by the first capture group.
struct LabelPattern {
    std::string anchor;
    std::regex pattern;
    std::string format;
};

// Result of classifying one HTTP response
struct Detection {
    bool matched = false;
    std::string label;
};

// SignatureDetector class declaration
class SignatureDetector {
public:
    // Bytes of body handed to a label pattern after its anchor
    static const std::size_t kLabelWindowBytes = 256;

    SignatureDetector(const std::string& vendor,
                      const std::vector<Signature>& bodySignatures,
                      const std::vector<LabelPattern>& labelPatterns,
                      const std::string& fallbackLabel);

    // Detector for MikroTik RouterOS WebFig
    static SignatureDetector mikrotik();

    // Server header first, then body signatures in order. Status alone is
    // never evidence of a match.
    Detection classify(int status, const std::string& serverHeader, const std::string& body) const;

    // First label pattern that matches wins, else the fallback label
    std::string extractLabel(const std::string& body) const;

private:
    std::string vendor_;
    std::vector<Signature> bodySignatures_;
    std::vector<LabelPattern> labelPatterns_;
    std::string fallbackLabel_;
};

#endif // SIGNATURE_DETECTOR_HPP
