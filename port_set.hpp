#ifndef PORT_SET_HPP
#define PORT_SET_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @class InvalidPortSpec
 * @brief Thrown when a port specification cannot be parsed. The message names
 *        the offending token.
 */
class InvalidPortSpec : public std::invalid_argument {
public:
    explicit InvalidPortSpec(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @class PortSet
 * @brief Sorted, deduplicated ports in [1,65535].
 */
class PortSet {
public:
    /**
     * @brief Parses a comma list of single ports and inclusive "lo-hi" ranges.
     * @throws InvalidPortSpec on a bad token or when nothing remains.
     */
    static PortSet parse(const std::string& spec);

    /** @brief Every port, 1..65535. */
    static PortSet all();

    /** @brief Ports tried when the operator gives no specification. */
    static PortSet defaults();

    const std::vector<uint16_t>& ports() const { return ports_; }
    std::size_t size() const { return ports_.size(); }
    bool empty() const { return ports_.empty(); }

private:
    explicit PortSet(std::vector<uint16_t> ports);

    std::vector<uint16_t> ports_;
};

#endif // PORT_SET_HPP
