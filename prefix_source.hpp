#ifndef PREFIX_SOURCE_HPP
#define PREFIX_SOURCE_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include "address_space.hpp"
#include "http_client.hpp"

/**
 * @class LookupFailure
 * @brief A prefix collaborator could not produce an answer. Distinct from a
 *        successful lookup that returned zero prefixes.
 */
class LookupFailure : public std::runtime_error {
public:
    explicit LookupFailure(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Reads one CIDR per line. Blank lines and '#' comments are ignored,
 *        malformed lines are skipped with a warning.
 * @throws LookupFailure when the file cannot be opened.
 */
std::vector<Cidr> readPrefixFile(const std::string& path);

/**
 * @brief True when the text names an ASN ("AS13335", "as13335").
 */
bool looksLikeAsn(const std::string& text);

/**
 * @brief Normalizes "AS13335", "as13335" or "13335" to "13335".
 * @throws LookupFailure for anything that is not a 32-bit AS number.
 */
std::string normalizeAsn(const std::string& text);

/**
 * @brief Extracts IPv4 prefixes from a RIPEstat announced-prefixes document.
 *
 * Only data.prefixes[*].prefix is read; keys elsewhere in the document are
 * ignored.
 * @throws LookupFailure for malformed JSON or a top-level status other than "ok".
 */
std::vector<Cidr> parseAnnouncedPrefixes(const std::string& body);

/**
 * @class AsnPrefixSource
 * @brief Answers "which IPv4 prefixes does this AS announce".
 */
class AsnPrefixSource {
public:
    virtual ~AsnPrefixSource() {}

    /**
     * @param asn Normalized AS number, digits only.
     * @throws LookupFailure on network or format errors.
     */
    virtual std::vector<Cidr> announcedPrefixes(const std::string& asn) = 0;
};

/**
 * @class RipeStatPrefixSource
 * @brief Looks prefixes up through the RIPEstat data API over HTTPS.
 */
class RipeStatPrefixSource : public AsnPrefixSource {
public:
    explicit RipeStatPrefixSource(std::chrono::milliseconds timeout = std::chrono::milliseconds(15000));

    std::vector<Cidr> announcedPrefixes(const std::string& asn) override;

private:
    std::chrono::milliseconds timeout_;
    HttpClient client_;
};

#endif // PREFIX_SOURCE_HPP
