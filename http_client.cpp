#include "http_client.hpp"
#include "address_space.hpp"
#include "console.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <openssl/err.h>

const int HttpClient::kDefaultMaxRedirects;
const std::size_t HttpClient::kDefaultMaxResponseBytes;

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static int remainingMs(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

static ProbeError classifyErrno(int err) {
    switch (err) {
        case ECONNREFUSED: return ProbeError::ConnectionRefused;
        case ETIMEDOUT: return ProbeError::Timeout;
        default: return ProbeError::IoError;
    }
}

// Waits until fd is ready for events or the deadline passes.
static ProbeError waitFor(int fd, short events, Deadline deadline) {
    while (true) {
        int timeout = remainingMs(deadline);
        if (timeout <= 0) return ProbeError::Timeout;
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int r = poll(&pfd, 1, timeout);
        if (r > 0) return ProbeError::None;
        if (r == 0) return ProbeError::Timeout;
        if (errno == EINTR) continue;
        return ProbeError::IoError;
    }
}

Socket& Socket::operator=(Socket&& other) {
    if (this != &other) {
        reset(other.fd_);
        other.fd_ = -1;
    }
    return *this;
}

void Socket::reset(int fd) {
    if (fd_ >= 0) close(fd_);
    fd_ = fd;
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

bool parseUrl(const std::string& text, Url& out) {
    std::string url = trim(text);
    size_t sep = url.find("://");
    if (sep == std::string::npos) return false;
    std::string scheme = toLower(url.substr(0, sep));
    if (scheme != "http" && scheme != "https") return false;

    std::string rest = url.substr(sep + 3);
    size_t pathStart = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, pathStart);
    std::string path = pathStart == std::string::npos ? "/" : rest.substr(pathStart);
    size_t fragment = path.find('#');
    if (fragment != std::string::npos) path.resize(fragment);
    if (path.empty() || path[0] != '/') path = "/" + path;

    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    if (authority.empty() || authority[0] == '[') return false;

    uint16_t port = scheme == "https" ? 443 : 80;
    std::string host = authority;
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portStr = authority.substr(colon + 1);
        host = authority.substr(0, colon);
        if (portStr.empty() || portStr.size() > 5) return false;
        for (char c : portStr) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        long value = std::stol(portStr);
        if (value < 1 || value > 65535) return false;
        port = static_cast<uint16_t>(value);
    }
    if (host.empty()) return false;

    out.scheme = scheme;
    out.host = toLower(host);
    out.port = port;
    out.path = path;
    return true;
}

std::string formatUrl(const Url& url) {
    std::ostringstream ss;
    ss << url.scheme << "://" << url.host;
    bool defaultPort = (url.scheme == "http" && url.port == 80) ||
                       (url.scheme == "https" && url.port == 443);
    if (!defaultPort) ss << ":" << url.port;
    ss << url.path;
    return ss.str();
}

bool resolveRedirect(const Url& base, const std::string& location, Url& out) {
    std::string loc = trim(location);
    if (loc.empty()) return false;
    std::string lower = toLower(loc);
    if (lower.compare(0, 7, "http://") == 0 || lower.compare(0, 8, "https://") == 0) {
        return parseUrl(loc, out);
    }
    if (loc.compare(0, 2, "//") == 0) {
        return parseUrl(base.scheme + ":" + loc, out);
    }
    if (lower.find("://") != std::string::npos) return false;

    Url next = base;
    std::string basePath = base.path.substr(0, base.path.find('?'));
    if (loc[0] == '/') {
        next.path = loc;
    } else if (loc[0] == '?') {
        next.path = basePath + loc;
    } else {
        next.path = basePath.substr(0, basePath.rfind('/') + 1) + loc;
    }
    size_t fragment = next.path.find('#');
    if (fragment != std::string::npos) next.path.resize(fragment);
    if (next.path.empty()) next.path = "/";
    out = next;
    return true;
}

bool isRedirectStatus(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string decodeChunked(const std::string& body) {
    std::string decoded;
    size_t pos = 0;
    while (pos < body.size()) {
        size_t lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) break;
        std::string sizeLine = body.substr(pos, lineEnd - pos);
        size_t semi = sizeLine.find(';');
        if (semi != std::string::npos) sizeLine.resize(semi);
        sizeLine = trim(sizeLine);
        if (sizeLine.empty() || sizeLine.size() > 8) break;
        char* end = nullptr;
        unsigned long chunkSize = std::strtoul(sizeLine.c_str(), &end, 16);
        if (end == nullptr || *end != '\0') break;
        if (chunkSize == 0) break;
        size_t dataStart = lineEnd + 2;
        if (dataStart >= body.size()) break;
        size_t available = std::min<size_t>(chunkSize, body.size() - dataStart);
        decoded.append(body, dataStart, available);
        if (available < chunkSize) break;
        pos = dataStart + chunkSize + 2;
    }
    return decoded;
}

// Locates the end of the header block; bodyStart is set past the blank line.
static bool findHeaderEnd(const std::string& raw, size_t from, size_t& headerEnd, size_t& bodyStart) {
    size_t crlf = raw.find("\r\n\r\n", from);
    size_t lf = raw.find("\n\n", from);
    if (crlf == std::string::npos && lf == std::string::npos) return false;
    if (crlf != std::string::npos && (lf == std::string::npos || crlf <= lf)) {
        headerEnd = crlf;
        bodyStart = crlf + 4;
    } else {
        headerEnd = lf;
        bodyStart = lf + 2;
    }
    return true;
}

static bool parseHeaderBlock(const std::string& block, int& status,
                             std::map<std::string, std::string>& headers) {
    std::istringstream stream(block);
    std::string line;
    if (!std::getline(stream, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.compare(0, 5, "HTTP/") != 0) return false;
    size_t space = line.find(' ');
    if (space == std::string::npos || line.size() < space + 4) return false;
    std::string code = line.substr(space + 1, 3);
    for (char c : code) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    status = std::stoi(code);

    headers.clear();
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        size_t colonPos = line.find(':');
        if (colonPos == std::string::npos) continue;
        std::string name = toLower(trim(line.substr(0, colonPos)));
        std::string value = trim(line.substr(colonPos + 1));
        auto it = headers.find(name);
        if (it == headers.end()) {
            headers[name] = value;
        } else {
            it->second += ", " + value;
        }
    }
    return true;
}

bool parseHttpResponse(const std::string& raw, HttpResponse& out) {
    size_t from = 0;
    while (true) {
        size_t headerEnd = 0;
        size_t bodyStart = 0;
        if (!findHeaderEnd(raw, from, headerEnd, bodyStart)) return false;
        int status = 0;
        std::map<std::string, std::string> headers;
        if (!parseHeaderBlock(raw.substr(from, headerEnd - from), status, headers)) return false;
        if (status >= 100 && status < 200 && bodyStart < raw.size()) {
            from = bodyStart;
            continue;
        }

        std::string body = raw.substr(bodyStart);
        auto te = headers.find("transfer-encoding");
        if (te != headers.end() && toLower(te->second).find("chunked") != std::string::npos) {
            body = decodeChunked(body);
        } else {
            auto cl = headers.find("content-length");
            if (cl != headers.end()) {
                char* end = nullptr;
                unsigned long length = std::strtoul(cl->second.c_str(), &end, 10);
                if (end != cl->second.c_str() && length < body.size()) body.resize(length);
            }
        }
        out.status = status;
        out.headers = std::move(headers);
        out.body = std::move(body);
        return true;
    }
}

// True once the bytes received so far hold a whole response.
static bool responseComplete(const std::string& raw) {
    size_t headerEnd = 0;
    size_t bodyStart = 0;
    if (!findHeaderEnd(raw, 0, headerEnd, bodyStart)) return false;
    int status = 0;
    std::map<std::string, std::string> headers;
    if (!parseHeaderBlock(raw.substr(0, headerEnd), status, headers)) return true;
    if (status < 200) return false;
    if (status == 204 || status == 304) return true;
    auto te = headers.find("transfer-encoding");
    if (te != headers.end() && toLower(te->second).find("chunked") != std::string::npos) {
        if (raw.compare(bodyStart, 5, "0\r\n\r\n") == 0) return true;
        return raw.size() >= 7 && raw.compare(raw.size() - 7, 7, "\r\n0\r\n\r\n") == 0;
    }
    auto cl = headers.find("content-length");
    if (cl != headers.end()) {
        char* end = nullptr;
        unsigned long length = std::strtoul(cl->second.c_str(), &end, 10);
        if (end != cl->second.c_str()) return raw.size() - bodyStart >= length;
    }
    return false;
}

bool resolveIPv4(const std::string& host, uint32_t& out) {
    if (parseIPv4(host, out)) return true;
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || res == nullptr) return false;
    const struct sockaddr_in* sin = reinterpret_cast<const struct sockaddr_in*>(res->ai_addr);
    out = ntohl(sin->sin_addr.s_addr);
    freeaddrinfo(res);
    return true;
}

ProbeError connectWithTimeout(uint32_t address, uint16_t port, Deadline deadline, Socket& out) {
    Socket sock(socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) return ProbeError::IoError;
    int flags = fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return ProbeError::IoError;
    }

    struct sockaddr_in target;
    std::memset(&target, 0, sizeof(target));
    target.sin_family = AF_INET;
    target.sin_port = htons(port);
    target.sin_addr.s_addr = htonl(address);

    if (connect(sock.get(), reinterpret_cast<struct sockaddr*>(&target), sizeof(target)) < 0) {
        if (errno != EINPROGRESS) return classifyErrno(errno);
        ProbeError err = waitFor(sock.get(), POLLOUT, deadline);
        if (err != ProbeError::None) return err;
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            return ProbeError::IoError;
        }
        if (soError != 0) return classifyErrno(soError);
    }
    out = std::move(sock);
    return ProbeError::None;
}

TlsContext::TlsContext() {
    SSL_library_init();
    SSL_load_error_strings();
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (ctx_ == nullptr) {
        ERR_print_errors_fp(stderr);
        throw std::runtime_error("Failed to create TLS context");
    }
    // Detection only: accept any certificate and old embedded TLS stacks.
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
    SSL_CTX_set_min_proto_version(ctx_, 0);
    if (SSL_CTX_set_cipher_list(ctx_, "ALL:@SECLEVEL=0") != 1) {
        ERR_clear_error();
        logWarn("Legacy TLS cipher list rejected, using library defaults");
    }
    SSL_CTX_set_options(ctx_, SSL_OP_LEGACY_SERVER_CONNECT | SSL_OP_IGNORE_UNEXPECTED_EOF);
    SSL_CTX_set_mode(ctx_, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
}

TlsContext::~TlsContext() {
    SSL_CTX_free(ctx_);
}

// Byte stream over a connected socket, optionally wrapped in TLS.
class Connection {
public:
    Connection(int fd, SSL* ssl) : fd_(fd), ssl_(ssl) {}

    ProbeError handshake(Deadline deadline) {
        while (true) {
            ERR_clear_error();
            int r = SSL_connect(ssl_);
            if (r == 1) return ProbeError::None;
            ProbeError err = waitForTls(SSL_get_error(ssl_, r), deadline);
            if (err != ProbeError::None) return err;
        }
    }

    ProbeError writeAll(const std::string& data, Deadline deadline) {
        size_t sent = 0;
        while (sent < data.size()) {
            if (ssl_ != nullptr) {
                ERR_clear_error();
                int n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
                if (n > 0) {
                    sent += static_cast<size_t>(n);
                    continue;
                }
                ProbeError err = waitForTls(SSL_get_error(ssl_, n), deadline);
                if (err != ProbeError::None) return err;
            } else {
                ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (n > 0) {
                    sent += static_cast<size_t>(n);
                    continue;
                }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    ProbeError err = waitFor(fd_, POLLOUT, deadline);
                    if (err != ProbeError::None) return err;
                    continue;
                }
                return ProbeError::IoError;
            }
        }
        return ProbeError::None;
    }

    // Appends up to maxBytes to buffer; eof is set when the peer closed.
    ProbeError readSome(std::string& buffer, size_t maxBytes, Deadline deadline, bool& eof) {
        char chunk[4096];
        size_t want = std::min(maxBytes, sizeof(chunk));
        while (true) {
            if (ssl_ != nullptr) {
                ERR_clear_error();
                int n = SSL_read(ssl_, chunk, static_cast<int>(want));
                if (n > 0) {
                    buffer.append(chunk, static_cast<size_t>(n));
                    return ProbeError::None;
                }
                int sslError = SSL_get_error(ssl_, n);
                if (sslError == SSL_ERROR_ZERO_RETURN) {
                    eof = true;
                    return ProbeError::None;
                }
                ProbeError err = waitForTls(sslError, deadline);
                if (err != ProbeError::None) return err;
            } else {
                ssize_t n = recv(fd_, chunk, want, 0);
                if (n > 0) {
                    buffer.append(chunk, static_cast<size_t>(n));
                    return ProbeError::None;
                }
                if (n == 0) {
                    eof = true;
                    return ProbeError::None;
                }
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    ProbeError err = waitFor(fd_, POLLIN, deadline);
                    if (err != ProbeError::None) return err;
                    continue;
                }
                return classifyErrno(errno);
            }
        }
    }

private:
    ProbeError waitForTls(int sslError, Deadline deadline) {
        switch (sslError) {
            case SSL_ERROR_WANT_READ:
                return waitFor(fd_, POLLIN, deadline);
            case SSL_ERROR_WANT_WRITE:
                return waitFor(fd_, POLLOUT, deadline);
            default:
                ERR_clear_error();
                return ProbeError::ProtocolMismatch;
        }
    }

    int fd_;
    SSL* ssl_;
};

static std::string buildRequest(const Url& url) {
    std::ostringstream ss;
    ss << "GET " << url.path << " HTTP/1.1\r\n";
    ss << "Host: " << url.host;
    bool defaultPort = (url.scheme == "http" && url.port == 80) ||
                       (url.scheme == "https" && url.port == 443);
    if (!defaultPort) ss << ":" << url.port;
    ss << "\r\n";
    ss << "User-Agent: Mozilla/5.0 figscan\r\n";
    ss << "Accept: */*\r\n";
    ss << "Connection: close\r\n\r\n";
    return ss.str();
}

HttpClient::HttpClient(int maxRedirects, std::size_t maxResponseBytes, bool followHostnameRedirects)
    : tls_(), maxRedirects_(maxRedirects), maxResponseBytes_(maxResponseBytes),
      followHostnameRedirects_(followHostnameRedirects) {}

ProbeError HttpClient::get(const Url& url, std::chrono::milliseconds timeout, HttpResponse& response) const {
    Deadline deadline = std::chrono::steady_clock::now() + timeout;
    Url current = url;
    for (int redirects = 0;; ++redirects) {
        ProbeError err = fetch(current, deadline, response);
        if (err != ProbeError::None) return err;
        if (!isRedirectStatus(response.status)) return ProbeError::None;
        std::string location = response.header("location");
        Url next;
        if (location.empty() || !resolveRedirect(current, location, next)) {
            return ProbeError::None;
        }
        uint32_t literal = 0;
        if (!followHostnameRedirects_ && !parseIPv4(next.host, literal)) {
            return ProbeError::None;
        }
        if (redirects >= maxRedirects_) return ProbeError::TooManyRedirects;
        current = next;
    }
}

ProbeError HttpClient::fetch(const Url& url, Deadline deadline, HttpResponse& response) const {
    uint32_t address = 0;
    if (!resolveIPv4(url.host, address)) return ProbeError::IoError;

    Socket sock;
    ProbeError err = connectWithTimeout(address, url.port, deadline, sock);
    if (err != ProbeError::None) return err;

    std::unique_ptr<SSL, void (*)(SSL*)> ssl(nullptr, SSL_free);
    if (url.scheme == "https") {
        ssl.reset(SSL_new(tls_.get()));
        if (!ssl) return ProbeError::IoError;
        if (SSL_set_fd(ssl.get(), sock.get()) != 1) return ProbeError::IoError;
        uint32_t literal = 0;
        if (!parseIPv4(url.host, literal)) {
            SSL_set_tlsext_host_name(ssl.get(), url.host.c_str());
        }
    }

    Connection conn(sock.get(), ssl.get());
    if (ssl) {
        err = conn.handshake(deadline);
        if (err != ProbeError::None) return err;
    }
    err = conn.writeAll(buildRequest(url), deadline);
    if (err != ProbeError::None) return err;

    std::string raw;
    bool eof = false;
    while (!eof && raw.size() < maxResponseBytes_) {
        err = conn.readSome(raw, maxResponseBytes_ - raw.size(), deadline, eof);
        if (err != ProbeError::None) break;
        if (responseComplete(raw)) break;
    }

    // A deadline that fires after the headers still leaves a usable response.
    if (!parseHttpResponse(raw, response)) {
        if (err != ProbeError::None) return err;
        return ProbeError::ProtocolMismatch;
    }
    return ProbeError::None;
}
