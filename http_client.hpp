#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <openssl/ssl.h>
#include "probe_types.hpp"

typedef std::chrono::steady_clock::time_point Deadline;

/**
 * @class Socket
 * @brief Owns a file descriptor and closes it on every exit path.
 */
class Socket {
public:
    Socket() : fd_(-1) {}
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { reset(); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other);

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1);

private:
    int fd_;
};

/**
 * @struct Url
 * @brief The parts of an http/https URL the client needs.
 */
struct Url {
    std::string scheme;  ///< "http" or "https", lowercase.
    std::string host;    ///< IPv4 literal or hostname.
    uint16_t port;
    std::string path;    ///< Always starts with '/'; includes the query.
};

/**
 * @struct HttpResponse
 * @brief Status, headers (names lowercased) and body of one response.
 */
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /** @brief Header value by case-insensitive name, empty when absent. */
    std::string header(const std::string& name) const;
};

bool parseUrl(const std::string& text, Url& out);
std::string formatUrl(const Url& url);

/**
 * @brief Resolves a Location header against the URL that produced it.
 * @return False when the location cannot be followed.
 */
bool resolveRedirect(const Url& base, const std::string& location, Url& out);

/**
 * @brief Parses a raw HTTP/1.x response.
 *
 * The response may be truncated: a complete status line and header block is
 * enough, whatever body arrived is kept. Chunked bodies are decoded and
 * Content-Length truncates the body.
 * @return False when no valid status line and header block is present.
 */
bool parseHttpResponse(const std::string& raw, HttpResponse& out);

/**
 * @brief Decodes a chunked transfer-encoded body, keeping whatever decodes
 *        cleanly when the data is truncated or malformed.
 */
std::string decodeChunked(const std::string& body);

bool isRedirectStatus(int status);

/**
 * @brief Resolves an IPv4 literal or a hostname to a host-byte-order address.
 */
bool resolveIPv4(const std::string& host, uint32_t& out);

/**
 * @brief Non-blocking connect bounded by a deadline.
 * @return ProbeError::None with the connected socket in out.
 */
ProbeError connectWithTimeout(uint32_t address, uint16_t port, Deadline deadline, Socket& out);

/**
 * @class TlsContext
 * @brief Client SSL_CTX with certificate verification disabled and legacy
 *        protocol versions allowed. Shared read-only across threads.
 */
class TlsContext {
public:
    TlsContext();
    ~TlsContext();
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* get() const { return ctx_; }

private:
    SSL_CTX* ctx_;
};

/**
 * @class HttpClient
 * @brief Minimal HTTP/1.1 GET over plain TCP or TLS with redirect following.
 *
 * Every call is bounded by one deadline covering connect, handshake,
 * request, response and redirects. Failures are returned, never thrown.
 * Name resolution does not honour the deadline, so unless hostname redirects
 * are enabled a redirect to a non-literal host ends the chain and the
 * redirect response itself is returned.
 */
class HttpClient {
public:
    static const int kDefaultMaxRedirects = 5;
    static const std::size_t kDefaultMaxResponseBytes = 256 * 1024;

    explicit HttpClient(int maxRedirects = kDefaultMaxRedirects,
                        std::size_t maxResponseBytes = kDefaultMaxResponseBytes,
                        bool followHostnameRedirects = false);

    ProbeError get(const Url& url, std::chrono::milliseconds timeout, HttpResponse& response) const;

private:
    ProbeError fetch(const Url& url, Deadline deadline, HttpResponse& response) const;

    TlsContext tls_;
    int maxRedirects_;
    std::size_t maxResponseBytes_;
    bool followHostnameRedirects_;
};

#endif // HTTP_CLIENT_HPP
