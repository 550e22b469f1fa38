#include <gtest/gtest.h>
#include <tls/http_message.hpp>
#include <core/constants.hpp>

TEST(Url, ParsesHostPortAndTarget) {
    auto url = Url::parse("https://Example.COM:8443/a/b?x=1#frag");
    ASSERT_TRUE(url.is_ok()) << url.error;
    EXPECT_EQ(url.value.scheme, "https");
    EXPECT_EQ(url.value.host, "example.com");
    EXPECT_EQ(url.value.port, 8443);
    EXPECT_EQ(url.value.target, "/a/b?x=1");
    EXPECT_EQ(url.value.path(), "/a/b");
    EXPECT_EQ(url.value.host_header(), "example.com:8443");
}

TEST(Url, DefaultsPortAndPath) {
    auto url = Url::parse("https://localhost");
    ASSERT_TRUE(url.is_ok()) << url.error;
    EXPECT_EQ(url.value.port, 443);
    EXPECT_EQ(url.value.target, "/");
    EXPECT_EQ(url.value.host_header(), "localhost");
}

TEST(Url, QueryWithoutPath) {
    auto url = Url::parse("https://localhost?q=1");
    ASSERT_TRUE(url.is_ok()) << url.error;
    EXPECT_EQ(url.value.target, "/?q=1");
}

TEST(Url, Ipv6Literal) {
    auto url = Url::parse("https://[::1]:9000/x");
    ASSERT_TRUE(url.is_ok()) << url.error;
    EXPECT_EQ(url.value.host, "::1");
    EXPECT_EQ(url.value.port, 9000);
    EXPECT_TRUE(url.value.host_is_ip());
    EXPECT_EQ(url.value.host_header(), "[::1]:9000");
}

TEST(Url, Ipv4DetectedAsIp) {
    EXPECT_TRUE(Url::parse("https://127.0.0.1/").value.host_is_ip());
    EXPECT_FALSE(Url::parse("https://localhost/").value.host_is_ip());
    EXPECT_FALSE(Url::parse("https://1.2.3.example/").value.host_is_ip());
}

TEST(Url, RejectsMalformed) {
    EXPECT_TRUE(Url::parse("localhost:80").is_err());
    EXPECT_TRUE(Url::parse("https://").is_err());
    EXPECT_TRUE(Url::parse("https://host:99999/").is_err());
    EXPECT_TRUE(Url::parse("https://host:abc/").is_err());
    EXPECT_TRUE(Url::parse("https://user@host/").is_err());
    EXPECT_EQ(Url::parse("https://").kind, ErrorKind::Transport);
}

TEST(SerializeRequest, GetWithCookies) {
    HttpRequest req;
    req.url = "https://localhost:8443/api";
    req.headers.push_back({"Accept", "application/json"});
    req.headers.push_back({"Connection", "keep-alive"});
    auto url = Url::parse(req.url).value;

    std::string wire = serialize_request(req, url, "a=1; b=2");
    EXPECT_EQ(wire.rfind("GET /api HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(wire.find("Host: localhost:8443\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Accept: application/json\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Cookie: a=1; b=2\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("keep-alive"), std::string::npos);
    EXPECT_EQ(wire.find("Content-Length"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 4), "\r\n\r\n");
}

TEST(SerializeRequest, PostCarriesBody) {
    HttpRequest req;
    req.method = "POST";
    req.url = "https://localhost/submit";
    req.body = "{\"k\":1}";
    auto url = Url::parse(req.url).value;

    std::string wire = serialize_request(req, url, "");
    EXPECT_NE(wire.find("Content-Length: 7\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("Cookie:"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 7), req.body);
}

TEST(ParseResponse, ContentLength) {
    std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nX-Test: yes\r\n\r\nhello";
    HttpResponse resp;
    std::string err;
    ASSERT_EQ(parse_response(raw, false, true, resp, err), ParseState::Complete) << err;
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.reason, "OK");
    EXPECT_EQ(resp.body, "hello");
    EXPECT_EQ(resp.header("x-test").value_or(""), "yes");
}

TEST(ParseResponse, IncompleteUntilBodyArrives) {
    HttpResponse resp;
    std::string err;
    EXPECT_EQ(parse_response("HTTP/1.1 200 OK\r\nContent-Len", false, true, resp, err),
              ParseState::Incomplete);
    EXPECT_EQ(parse_response("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhel", false, true, resp, err),
              ParseState::Incomplete);
    EXPECT_EQ(parse_response("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhel", true, true, resp, err),
              ParseState::Error);
}

TEST(ParseResponse, ChunkedBody) {
    std::string raw =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\nhello\r\n"
        "7;ext=1\r\n, world\r\n"
        "0\r\nTrailer: x\r\n\r\n";
    HttpResponse resp;
    std::string err;
    ASSERT_EQ(parse_response(raw, false, true, resp, err), ParseState::Complete) << err;
    EXPECT_EQ(resp.body, "hello, world");
}

TEST(ParseResponse, ChunkedIncompleteAndBroken) {
    HttpResponse resp;
    std::string err;
    std::string head = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";
    EXPECT_EQ(parse_response(head + "5\r\nhel", false, true, resp, err), ParseState::Incomplete);
    EXPECT_EQ(parse_response(head + "5\r\nhel", true, true, resp, err), ParseState::Error);
    EXPECT_EQ(parse_response(head + "zz\r\n", false, true, resp, err), ParseState::Error);
}

TEST(ParseResponse, HugeChunkSizeIsRejected) {
    HttpResponse resp;
    std::string err;
    std::string head = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";
    // Wraps the read offset if added unchecked
    EXPECT_EQ(parse_response(head + "2\r\nab\r\nffffffffffffffec\r\nzz", false, true, resp, err),
              ParseState::Error);
    EXPECT_NE(err.find("exceeds"), std::string::npos) << err;

    EXPECT_EQ(parse_response(head + "4000001\r\n", false, true, resp, err), ParseState::Error);
    EXPECT_EQ(parse_response(head + "4000000\r\n", false, true, resp, err), ParseState::Incomplete);
}

TEST(ParseResponse, OversizedContentLengthIsRejected) {
    HttpResponse resp;
    std::string err;
    std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: " +
                      std::to_string(HTTP_MAX_BODY_BYTES + 1) + "\r\n\r\n";
    EXPECT_EQ(parse_response(raw, false, true, resp, err), ParseState::Error);
    EXPECT_NE(err.find("exceeds"), std::string::npos) << err;
}

TEST(ParseResponse, ReadToClose) {
    std::string raw = "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\npartial";
    HttpResponse resp;
    std::string err;
    EXPECT_EQ(parse_response(raw, false, true, resp, err), ParseState::Incomplete);
    ASSERT_EQ(parse_response(raw, true, true, resp, err), ParseState::Complete);
    EXPECT_EQ(resp.body, "partial");
}

TEST(ParseResponse, NoContentHasNoBody) {
    HttpResponse resp;
    std::string err;
    ASSERT_EQ(parse_response("HTTP/1.1 204 No Content\r\n\r\n", false, true, resp, err),
              ParseState::Complete);
    EXPECT_EQ(resp.status, 204);
    EXPECT_TRUE(resp.body.empty());
}

TEST(ParseResponse, RepeatedSetCookie) {
    std::string raw = "HTTP/1.1 200 OK\r\nSet-Cookie: a=1\r\nset-cookie: b=2\r\nContent-Length: 0\r\n\r\n";
    HttpResponse resp;
    std::string err;
    ASSERT_EQ(parse_response(raw, false, true, resp, err), ParseState::Complete);
    auto values = resp.header_values("Set-Cookie");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0], "a=1");
    EXPECT_EQ(values[1], "b=2");
}

TEST(ParseResponse, MalformedStatusLine) {
    HttpResponse resp;
    std::string err;
    EXPECT_EQ(parse_response("SSH-2.0-OpenSSH\r\n\r\n", false, true, resp, err), ParseState::Error);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(parse_response("", true, true, resp, err), ParseState::Error);
}
