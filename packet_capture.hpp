#ifndef PACKET_CAPTURE_HPP
#define PACKET_CAPTURE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <pcap/pcap.h>

/**
 * @struct PacketInfo
 * @brief One captured TCP segment.
 */
struct PacketInfo {
    std::string timestamp;            ///< Capture time, "YYYY-MM-DD HH:MM:SS.uuuuuu".
    std::string sourceIP;
    std::string destIP;
    int sourcePort = 0;
    int destPort = 0;
    std::string flags;                ///< TCP flags as letters, e.g. "SA", "FA", "R".
    int packetLength = 0;             ///< Length on the wire.
    int payloadLength = 0;            ///< TCP payload bytes present in the frame.
};

/**
 * @brief Builds the BPF filter selecting replies from the scanned ports.
 *
 * Large port sets fall back to plain "tcp" to keep the filter compilable.
 */
std::string buildCaptureFilter(const std::vector<uint16_t>& ports);

/**
 * @class PacketCapture
 * @brief Records TCP segments on an interface while a scan runs, using libpcap.
 */
class PacketCapture {
public:
    static const std::size_t kMaxFilterPorts = 32;

    PacketCapture();
    ~PacketCapture();
    PacketCapture(const PacketCapture&) = delete;
    PacketCapture& operator=(const PacketCapture&) = delete;

    /**
     * @brief Opens the interface in non-blocking mode and installs the filter.
     * @param interface Interface name; empty picks the first pcap device.
     * @param filter BPF expression, empty for none.
     * @return False with lastError() set when the session cannot be opened.
     */
    bool initialize(const std::string& interface, const std::string& filter);

    /**
     * @brief Polls the session until stopCapture() is called.
     * @return False when the capture was never initialized.
     */
    bool startCapture();

    /**
     * @brief Reads every packet of a pcap file through the same decoder.
     */
    bool captureFromFile(const std::string& filename);

    /** @brief Safe to call from another thread. */
    void stopCapture();

    /**
     * @brief Writes every recorded segment as CSV.
     */
    bool saveToCSV(const std::string& filename) const;

    /** @brief Snapshot of the recorded segments. */
    std::vector<PacketInfo> packets() const;

    const std::string& lastError() const { return lastError_; }

    /**
     * @brief Decodes an Ethernet/IPv4/TCP frame.
     * @param frame Captured bytes.
     * @param capturedLength Bytes available in frame.
     * @param info Filled with addresses, ports, flags and payload length;
     *        timestamp and packetLength are left to the caller.
     * @return False for anything that is not a complete IPv4 TCP header.
     */
    static bool parseFrame(const u_char* frame, std::size_t capturedLength, PacketInfo& info);

    static std::string formatFlags(uint8_t flags);

private:
    void processPacket(const struct pcap_pkthdr* pkthdr, const u_char* packet);

    pcap_t* handle_;
    std::atomic<bool> running_;
    char errbuf_[PCAP_ERRBUF_SIZE];
    std::string lastError_;
    mutable std::mutex packetsMutex_;
    std::vector<PacketInfo> packets_;
};

#endif // PACKET_CAPTURE_HPP
