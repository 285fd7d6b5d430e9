#ifndef ADDRESS_SPACE_HPP
#define ADDRESS_SPACE_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @class InvalidSpec
 * @brief Thrown when a target specification cannot be parsed.
 */
class InvalidSpec : public std::invalid_argument {
public:
    explicit InvalidSpec(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @struct Cidr
 * @brief An IPv4 network in host byte order, already masked to its prefix.
 */
struct Cidr {
    uint32_t network;     ///< Network address with host bits cleared.
    int prefixLength;     ///< Prefix length, 0..32.
};

/**
 * @enum AddressSpecKind
 * @brief The four textual forms a target can take.
 */
enum class AddressSpecKind {
    Single,
    Cidr,
    Range,
    PrefixList
};

/**
 * @struct AddressSpec
 * @brief One parsed target specification. Immutable once built.
 */
struct AddressSpec {
    AddressSpecKind kind;
    uint32_t first;              ///< Single address, or range start.
    uint32_t last;               ///< Range end (equal to first for Single).
    std::vector<Cidr> prefixes;  ///< One entry for Cidr, many for PrefixList.

    static AddressSpec single(uint32_t address);
    static AddressSpec cidr(const Cidr& block);
    static AddressSpec range(uint32_t start, uint32_t end);
    static AddressSpec prefixList(const std::vector<Cidr>& blocks);
};

/**
 * @struct ExpandOptions
 * @brief Controls CIDR and prefix-list expansion.
 *
 * Sampling is an explicit mode: when enabled only the first
 * samplePerPrefix usable hosts of each prefix are produced. It applies
 * to single CIDR specs and prefix lists alike; callers pick the policy.
 */
struct ExpandOptions {
    bool sampled = false;
    std::size_t samplePerPrefix = 16;
};

/**
 * @brief Parses a dotted-quad IPv4 address into host byte order.
 * @return True on success; out is untouched on failure.
 */
bool parseIPv4(const std::string& text, uint32_t& out);

/**
 * @brief Formats a host-byte-order IPv4 value as a dotted quad.
 */
std::string formatIPv4(uint32_t address);

/**
 * @brief Parses "a.b.c.d/len" and masks the network to the prefix.
 * @return False when the address or the prefix length is invalid.
 */
bool parseCidr(const std::string& text, Cidr& out);

/**
 * @brief Parses a single address, a CIDR block or an "A-B" range.
 * @throws InvalidSpec on malformed input or a reversed range.
 */
AddressSpec parseAddressSpec(const std::string& text);

/**
 * @brief Number of usable hosts a prefix length denotes.
 *
 * Prefixes 0..30 exclude the network and broadcast addresses, a /31 holds
 * both of its addresses and a /32 holds exactly one.
 */
uint64_t usableHostCount(int prefixLength);

/**
 * @class AddressSpace
 * @brief Deduplicated union of every address added to it.
 */
class AddressSpace {
public:
    AddressSpace() = default;

    /**
     * @brief Expands a spec and merges it into the set.
     * @param spec Parsed target specification.
     * @param options Full or sampled CIDR/prefix-list expansion.
     */
    void add(const AddressSpec& spec, const ExpandOptions& options = ExpandOptions());

    /**
     * @brief Sorted, deduplicated snapshot of every address added so far.
     */
    const std::vector<uint32_t>& addresses() const;

    std::size_t size() const { return addresses().size(); }
    bool empty() const { return addresses().empty(); }

private:
    void expandCidr(const Cidr& block, const ExpandOptions& options);
    void expandRange(uint32_t start, uint32_t end);

    mutable std::vector<uint32_t> addresses_;
    mutable bool normalized_ = true;
};

#endif // ADDRESS_SPACE_HPP
