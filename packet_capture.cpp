#include "packet_capture.hpp"
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <thread>
#include <arpa/inet.h>
#include <netinet/if_ether.h>
#include <netinet/ip.h>
#include <netinet/tcp.h>

const std::size_t PacketCapture::kMaxFilterPorts;

static const std::size_t kEthernetHeaderLen = sizeof(struct ether_header);

std::string buildCaptureFilter(const std::vector<uint16_t>& ports) {
    if (ports.empty() || ports.size() > PacketCapture::kMaxFilterPorts) {
        return "tcp";
    }
    std::ostringstream ss;
    ss << "tcp and src port (";
    for (std::size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) ss << " or ";
        ss << ports[i];
    }
    ss << ")";
    return ss.str();
}

PacketCapture::PacketCapture() : handle_(nullptr), running_(false) {
    memset(errbuf_, 0, PCAP_ERRBUF_SIZE);
}

PacketCapture::~PacketCapture() {
    if (handle_) pcap_close(handle_);
}

bool PacketCapture::initialize(const std::string& interface, const std::string& filter) {
    if (handle_) {
        pcap_close(handle_);
        handle_ = nullptr;
    }
    std::string dev;
    if (interface.empty()) {
        pcap_if_t* alldevs = nullptr;
        if (pcap_findalldevs(&alldevs, errbuf_) == -1) {
            lastError_ = std::string("Error finding devices: ") + errbuf_;
            return false;
        }
        if (alldevs == nullptr) {
            lastError_ = "No capture devices found";
            return false;
        }
        dev = alldevs->name;
        pcap_freealldevs(alldevs);
    } else {
        dev = interface;
    }

    handle_ = pcap_open_live(dev.c_str(), BUFSIZ, 0, 100, errbuf_);
    if (!handle_) {
        lastError_ = "Error opening device " + dev + ": " + errbuf_;
        return false;
    }
    if (pcap_datalink(handle_) != DLT_EN10MB) {
        lastError_ = "Device " + dev + " is not an Ethernet interface";
        pcap_close(handle_);
        handle_ = nullptr;
        return false;
    }
    if (pcap_setnonblock(handle_, 1, errbuf_) == -1) {
        lastError_ = std::string("Error setting non-blocking mode: ") + errbuf_;
        pcap_close(handle_);
        handle_ = nullptr;
        return false;
    }

    if (!filter.empty()) {
        struct bpf_program fp;
        if (pcap_compile(handle_, &fp, filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) == -1) {
            lastError_ = std::string("Error compiling filter: ") + pcap_geterr(handle_);
            pcap_close(handle_);
            handle_ = nullptr;
            return false;
        }
        if (pcap_setfilter(handle_, &fp) == -1) {
            lastError_ = std::string("Error setting filter: ") + pcap_geterr(handle_);
            pcap_freecode(&fp);
            pcap_close(handle_);
            handle_ = nullptr;
            return false;
        }
        pcap_freecode(&fp);
    }
    return true;
}

bool PacketCapture::startCapture() {
    if (!handle_) {
        lastError_ = "Packet capture not initialized";
        return false;
    }
    running_ = true;
    while (running_) {
        struct pcap_pkthdr* header = nullptr;
        const u_char* packet = nullptr;
        int rc = pcap_next_ex(handle_, &header, &packet);
        if (rc == 1) {
            processPacket(header, packet);
        } else if (rc == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        } else {
            lastError_ = std::string("Capture stopped: ") + pcap_geterr(handle_);
            running_ = false;
            return false;
        }
    }
    return true;
}

bool PacketCapture::captureFromFile(const std::string& filename) {
    if (handle_) {
        pcap_close(handle_);
        handle_ = nullptr;
    }
    handle_ = pcap_open_offline(filename.c_str(), errbuf_);
    if (!handle_) {
        lastError_ = std::string("Error opening file: ") + errbuf_;
        return false;
    }
    struct pcap_pkthdr* header = nullptr;
    const u_char* packet = nullptr;
    while (pcap_next_ex(handle_, &header, &packet) == 1) {
        processPacket(header, packet);
    }
    return true;
}

void PacketCapture::stopCapture() {
    running_ = false;
}

bool PacketCapture::saveToCSV(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << "Timestamp,Source IP,Destination IP,Source Port,Destination Port,Flags,Packet Length,Payload Length\n";
    std::lock_guard<std::mutex> lock(packetsMutex_);
    for (const auto& packet : packets_) {
        file << packet.timestamp << ","
             << packet.sourceIP << ","
             << packet.destIP << ","
             << packet.sourcePort << ","
             << packet.destPort << ","
             << packet.flags << ","
             << packet.packetLength << ","
             << packet.payloadLength << "\n";
    }
    return static_cast<bool>(file);
}

std::vector<PacketInfo> PacketCapture::packets() const {
    std::lock_guard<std::mutex> lock(packetsMutex_);
    return packets_;
}

std::string PacketCapture::formatFlags(uint8_t flags) {
    static const struct { uint8_t bit; char letter; } kFlags[] = {
        {TH_SYN, 'S'}, {TH_ACK, 'A'}, {TH_FIN, 'F'}, {TH_RST, 'R'}, {TH_PUSH, 'P'}, {TH_URG, 'U'}
    };
    std::string out;
    for (const auto& f : kFlags) {
        if (flags & f.bit) out += f.letter;
    }
    return out;
}

bool PacketCapture::parseFrame(const u_char* frame, std::size_t capturedLength, PacketInfo& info) {
    if (capturedLength < kEthernetHeaderLen + sizeof(struct ip)) return false;

    struct ether_header ether;
    memcpy(&ether, frame, sizeof(ether));
    if (ntohs(ether.ether_type) != ETHERTYPE_IP) return false;

    struct ip ipHeader;
    memcpy(&ipHeader, frame + kEthernetHeaderLen, sizeof(ipHeader));
    std::size_t ipHeaderLen = static_cast<std::size_t>(ipHeader.ip_hl) * 4;
    if (ipHeader.ip_v != 4 || ipHeaderLen < sizeof(struct ip) || ipHeader.ip_p != IPPROTO_TCP) {
        return false;
    }
    std::size_t tcpOffset = kEthernetHeaderLen + ipHeaderLen;
    if (capturedLength < tcpOffset + sizeof(struct tcphdr)) return false;

    struct tcphdr tcpHeader;
    memcpy(&tcpHeader, frame + tcpOffset, sizeof(tcpHeader));
    std::size_t tcpHeaderLen = static_cast<std::size_t>(tcpHeader.th_off) * 4;
    if (tcpHeaderLen < sizeof(struct tcphdr)) return false;

    char sourceIP[INET_ADDRSTRLEN];
    char destIP[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &ipHeader.ip_src, sourceIP, INET_ADDRSTRLEN);
    inet_ntop(AF_INET, &ipHeader.ip_dst, destIP, INET_ADDRSTRLEN);
    info.sourceIP = sourceIP;
    info.destIP = destIP;
    info.sourcePort = ntohs(tcpHeader.th_sport);
    info.destPort = ntohs(tcpHeader.th_dport);
    info.flags = formatFlags(tcpHeader.th_flags);

    std::size_t ipTotal = ntohs(ipHeader.ip_len);
    std::size_t payload = 0;
    if (ipTotal >= ipHeaderLen + tcpHeaderLen) {
        payload = ipTotal - ipHeaderLen - tcpHeaderLen;
    }
    std::size_t available = capturedLength > tcpOffset + tcpHeaderLen ? capturedLength - tcpOffset - tcpHeaderLen : 0;
    info.payloadLength = static_cast<int>(payload < available ? payload : available);
    return true;
}

void PacketCapture::processPacket(const struct pcap_pkthdr* pkthdr, const u_char* packet) {
    PacketInfo info;
    if (!parseFrame(packet, pkthdr->caplen, info)) return;

    char timestr[64];
    time_t seconds = pkthdr->ts.tv_sec;
    struct tm ltime;
    localtime_r(&seconds, &ltime);
    strftime(timestr, sizeof(timestr), "%Y-%m-%d %H:%M:%S", &ltime);
    char usec[16];
    snprintf(usec, sizeof(usec), ".%06ld", static_cast<long>(pkthdr->ts.tv_usec));
    info.timestamp = std::string(timestr) + usec;
    info.packetLength = static_cast<int>(pkthdr->len);

    std::lock_guard<std::mutex> lock(packetsMutex_);
    packets_.push_back(info);
}
