#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <string>
#include "http_client.hpp"
#include "loopback_server.hpp"

TEST(HttpParseTest, StatusHeadersAndBody) {
    HttpResponse r;
    ASSERT_TRUE(parseHttpResponse("HTTP/1.1 200 OK\r\nServer: Mikrotik HttpProxy\r\n"
                                  "Content-Length: 5\r\n\r\nhello", r));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.header("SERVER"), "Mikrotik HttpProxy");
    EXPECT_EQ(r.body, "hello");
    EXPECT_EQ(r.header("x-missing"), "");
}

TEST(HttpParseTest, ContentLengthTruncatesBody) {
    HttpResponse r;
    ASSERT_TRUE(parseHttpResponse("HTTP/1.0 404 Not Found\r\nContent-Length: 3\r\n\r\nabcdef", r));
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.body, "abc");
}

TEST(HttpParseTest, TruncatedBodyIsKept) {
    HttpResponse r;
    ASSERT_TRUE(parseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n<title>Web", r));
    EXPECT_EQ(r.body, "<title>Web");
}

TEST(HttpParseTest, ChunkedBody) {
    HttpResponse r;
    ASSERT_TRUE(parseHttpResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                                  "4\r\nWebF\r\n3;ext=1\r\nig!\r\n0\r\n\r\n", r));
    EXPECT_EQ(r.body, "WebFig!");
}

TEST(HttpParseTest, InterimResponseSkipped) {
    HttpResponse r;
    ASSERT_TRUE(parseHttpResponse("HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 302 Found\r\n"
                                  "Location: /webfig/\r\n\r\n", r));
    EXPECT_EQ(r.status, 302);
    EXPECT_EQ(r.header("location"), "/webfig/");
}

TEST(HttpParseTest, RepeatedHeadersAreJoined) {
    HttpResponse r;
    ASSERT_TRUE(parseHttpResponse("HTTP/1.1 200 OK\r\nX-A: 1\r\nx-a: 2\r\n\r\n", r));
    EXPECT_EQ(r.header("x-a"), "1, 2");
}

TEST(HttpParseTest, GarbageRejected) {
    HttpResponse r;
    EXPECT_FALSE(parseHttpResponse("", r));
    EXPECT_FALSE(parseHttpResponse("SSH-2.0-ROSSSH\r\n\r\n", r));
    EXPECT_FALSE(parseHttpResponse("HTTP/1.1 200 OK\r\nServer: x", r));
    EXPECT_FALSE(parseHttpResponse("HTTP/1.1 abc\r\n\r\n", r));
}

TEST(HttpParseTest, DecodeChunkedTruncated) {
    EXPECT_EQ(decodeChunked("5\r\nhel"), "hel");
    EXPECT_EQ(decodeChunked("zz\r\nhello\r\n"), "");
    EXPECT_EQ(decodeChunked("2\r\nhi\r\n0\r\n\r\n"), "hi");
}

TEST(UrlTest, ParseAndFormat) {
    Url url;
    ASSERT_TRUE(parseUrl("HTTPS://Example.COM:8443/a/b?q=1#frag", url));
    EXPECT_EQ(url.scheme, "https");
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, 8443);
    EXPECT_EQ(url.path, "/a/b?q=1");
    EXPECT_EQ(formatUrl(url), "https://example.com:8443/a/b?q=1");

    ASSERT_TRUE(parseUrl("http://10.0.0.1", url));
    EXPECT_EQ(url.port, 80);
    EXPECT_EQ(url.path, "/");
    EXPECT_EQ(formatUrl(url), "http://10.0.0.1/");
}

TEST(UrlTest, RejectsUnsupported) {
    Url url;
    EXPECT_FALSE(parseUrl("ftp://10.0.0.1/", url));
    EXPECT_FALSE(parseUrl("10.0.0.1", url));
    EXPECT_FALSE(parseUrl("http://10.0.0.1:0/", url));
    EXPECT_FALSE(parseUrl("http://10.0.0.1:99999/", url));
    EXPECT_FALSE(parseUrl("http://:80/", url));
}

TEST(UrlTest, ResolveRedirectForms) {
    Url base;
    ASSERT_TRUE(parseUrl("http://10.0.0.1:8080/dir/page?x=1", base));
    Url out;

    ASSERT_TRUE(resolveRedirect(base, "https://10.0.0.1/webfig/", out));
    EXPECT_EQ(formatUrl(out), "https://10.0.0.1/webfig/");

    ASSERT_TRUE(resolveRedirect(base, "//10.0.0.2/x", out));
    EXPECT_EQ(formatUrl(out), "http://10.0.0.2/x");

    ASSERT_TRUE(resolveRedirect(base, "/webfig/", out));
    EXPECT_EQ(formatUrl(out), "http://10.0.0.1:8080/webfig/");

    ASSERT_TRUE(resolveRedirect(base, "other", out));
    EXPECT_EQ(out.path, "/dir/other");

    ASSERT_TRUE(resolveRedirect(base, "?y=2", out));
    EXPECT_EQ(out.path, "/dir/page?y=2");

    EXPECT_FALSE(resolveRedirect(base, "", out));
    EXPECT_FALSE(resolveRedirect(base, "javascript://x", out));
}

TEST(UrlTest, RedirectStatuses) {
    for (int status : {301, 302, 303, 307, 308}) EXPECT_TRUE(isRedirectStatus(status));
    for (int status : {200, 304, 404}) EXPECT_FALSE(isRedirectStatus(status));
}

static Url loopbackUrl(uint16_t port, const std::string& path = "/") {
    Url url;
    url.scheme = "http";
    url.host = "127.0.0.1";
    url.port = port;
    url.path = path;
    return url;
}

TEST(HttpClientTest, GetFromLoopback) {
    LoopbackServer server(httpResponse(200, "Mikrotik HttpProxy", "<title>RouterOS</title>"));
    HttpClient client;
    HttpResponse response;
    ASSERT_EQ(client.get(loopbackUrl(server.port()), std::chrono::milliseconds(2000), response),
              ProbeError::None);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("server"), "Mikrotik HttpProxy");
    EXPECT_EQ(response.body, "<title>RouterOS</title>");
}

TEST(HttpClientTest, EndlessRedirectsFail) {
    LoopbackServer server("HTTP/1.1 302 Found\r\nLocation: /again\r\nContent-Length: 0\r\n\r\n");
    HttpClient client(3);
    HttpResponse response;
    EXPECT_EQ(client.get(loopbackUrl(server.port()), std::chrono::milliseconds(3000), response),
              ProbeError::TooManyRedirects);
    EXPECT_EQ(server.connections(), 4);
}

TEST(HttpClientTest, HostnameRedirectReturnedAsIs) {
    LoopbackServer server("HTTP/1.1 302 Found\r\nLocation: http://router.figscan.invalid/webfig/\r\n"
                          "Content-Length: 0\r\n\r\n");
    HttpClient client;
    HttpResponse response;
    auto started = std::chrono::steady_clock::now();
    ASSERT_EQ(client.get(loopbackUrl(server.port()), std::chrono::milliseconds(2000), response),
              ProbeError::None);
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(response.status, 302);
    EXPECT_EQ(response.header("location"), "http://router.figscan.invalid/webfig/");
    EXPECT_EQ(server.connections(), 1);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST(HttpClientTest, LiteralRedirectIsFollowed) {
    std::map<std::string, std::string> targetRoutes;
    targetRoutes["/webfig/"] = httpResponse(200, "", "webfig");
    LoopbackServer target(targetRoutes, false);
    LoopbackServer origin("HTTP/1.1 301 Moved\r\nLocation: http://127.0.0.1:" + std::to_string(target.port()) +
                          "/webfig/\r\nContent-Length: 0\r\n\r\n");

    HttpClient client;
    HttpResponse response;
    ASSERT_EQ(client.get(loopbackUrl(origin.port()), std::chrono::milliseconds(2000), response),
              ProbeError::None);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "webfig");
    EXPECT_EQ(origin.connections(), 1);
    EXPECT_EQ(target.connections(), 1);
}

TEST(HttpClientTest, TlsGetFromLoopback) {
    std::map<std::string, std::string> routes;
    routes["*"] = httpResponse(200, "", "<title>RouterOS router configuration page</title>");
    LoopbackServer server(routes, true);
    HttpClient client;
    HttpResponse response;
    Url url = loopbackUrl(server.port());
    url.scheme = "https";
    ASSERT_EQ(client.get(url, std::chrono::milliseconds(2000), response), ProbeError::None);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "<title>RouterOS router configuration page</title>");
}

TEST(HttpClientTest, RefusedConnection) {
    HttpClient client;
    HttpResponse response;
    EXPECT_EQ(client.get(loopbackUrl(closedLoopbackPort()), std::chrono::milliseconds(1000), response),
              ProbeError::ConnectionRefused);
}

TEST(HttpClientTest, SilentPeerTimesOutWithinDeadline) {
    SilentListener listener;
    HttpClient client;
    HttpResponse response;
    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(client.get(loopbackUrl(listener.port()), std::chrono::milliseconds(200), response),
              ProbeError::Timeout);
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST(HttpClientTest, TlsAgainstPlainHttpIsProtocolMismatch) {
    LoopbackServer server(httpResponse(200, "", "plain"));
    HttpClient client;
    HttpResponse response;
    Url url = loopbackUrl(server.port());
    url.scheme = "https";
    EXPECT_EQ(client.get(url, std::chrono::milliseconds(2000), response), ProbeError::ProtocolMismatch);
}
