/**
 * @file test_http_client.cpp
 * @brief Integration tests for the HTTP client against local servers
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Courier/Core/HttpClient.hpp>
#include <Courier/Core/RequestForwarder.hpp>
#include <Courier/Core/ErrorCodes.hpp>
#include "TestHarness.hpp"
#include <cctype>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace Courier;
using namespace Courier::Network;
using namespace Courier::Testing;

namespace {
    std::shared_ptr<HttpClient> makeClient(HttpClientConfig config = {}) {
        if (config.requestTimeout.count() == 0) {
            config.requestTimeout = Milliseconds{5000};
        }
        auto client = HttpClient::create(config);
        EXPECT_TRUE(client.isSuccess());
        return client.isSuccess() ? client.value() : nullptr;
    }
}

class HttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& svr = server.server();
        addEchoRoute(svr);

        svr.Get(R"(/redirect/(\d+))", [](const httplib::Request& req, httplib::Response& res) {
            int n = std::stoi(req.matches[1]);
            res.set_redirect("/redirect/" + std::to_string(n + 1));
        });

        svr.Post("/see-other", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/echo", 303);
        });

        svr.Post("/temporary", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/echo", 307);
        });

        svr.Post("/moved", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/echo", 301);
        });

        svr.Get("/same-host", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/echo", 302);
        });

        svr.Get("/other-host", [this](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("http://localhost:" + std::to_string(server.port()) + "/echo", 302);
        });

        svr.Get("/to-file", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("file:///etc/passwd", 302);
        });

        svr.Get("/duplicate-headers", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("X-Dup", "first");
            res.set_header("X-Dup", "second");
            res.set_content("ok", "text/plain");
        });

        svr.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            res.set_content("late", "text/plain");
        });

        ASSERT_TRUE(server.start());
    }

    std::string url(const std::string& path) const {
        return server.baseUrl() + path;
    }

    LocalServer server;
};

// ============================================================================
// Basic requests
// ============================================================================

TEST_F(HttpClientTest, Creation) {
    auto client = HttpClient::create(HttpClientConfig{});
    ASSERT_TRUE(client.isSuccess());
    EXPECT_EQ(client.value()->config().maxRedirects, 15);
}

TEST_F(HttpClientTest, NegativeRedirectCapRejected) {
    HttpClientConfig config;
    config.maxRedirects = -1;
    auto client = HttpClient::create(config);
    ASSERT_TRUE(client.isFailure());
    EXPECT_EQ(client.error(), ErrorCode::InvalidArgument);
}

TEST_F(HttpClientTest, PostEchoesHeadersAndBody) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url("/echo");
    request.headers["X-Test"] = "1";
    request.body = "hello";

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess()) << getErrorMessage(response.error());
    EXPECT_EQ(response.value().statusCode, 200);
    EXPECT_EQ(response.value().getHeader("X-Echo-Method"), "POST");
    EXPECT_EQ(response.value().getHeader("X-Echo-X-Test"), "1");
    EXPECT_EQ(response.value().bodyAsString(), "hello");
    EXPECT_EQ(response.value().redirectCount, 0);
}

TEST_F(HttpClientTest, HeaderNamesAreLowerCase) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = url("/echo");

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    for (const auto& [name, value] : response.value().headers) {
        for (char c : name) {
            EXPECT_FALSE(std::isupper(static_cast<unsigned char>(c))) << name;
        }
    }
    EXPECT_EQ(response.value().headers.count("x-echo-method"), 1u);
}

TEST_F(HttpClientTest, VerbsReachServer) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    for (HttpMethod method : {HttpMethod::GET, HttpMethod::PUT, HttpMethod::PATCH,
                              HttpMethod::DELETE_, HttpMethod::OPTIONS}) {
        HttpRequest request;
        request.method = method;
        request.url = url("/echo");

        auto response = client->send(request);

        ASSERT_TRUE(response.isSuccess()) << httpMethodToString(method);
        EXPECT_EQ(response.value().getHeader("X-Echo-Method"), httpMethodToString(method));
    }
}

TEST_F(HttpClientTest, HeadHasNoBody) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.method = HttpMethod::HEAD;
    request.url = url("/duplicate-headers");

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().statusCode, 200);
    EXPECT_TRUE(response.value().body.empty());
}

TEST_F(HttpClientTest, EmptyHeaderValueIsSent) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = url("/echo");
    request.headers["X-Empty"] = "";

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().headers.count("x-echo-x-empty"), 1u);
    EXPECT_EQ(response.value().getHeader("X-Echo-X-Empty"), "");
}

TEST_F(HttpClientTest, DuplicateHeadersLastWins) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = url("/duplicate-headers");

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().getHeader("x-dup"), "second");
}

TEST_F(HttpClientTest, NotFoundIsAResponse) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = url("/missing");

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().statusCode, 404);
}

// ============================================================================
// Redirects
// ============================================================================

TEST_F(HttpClientTest, RedirectChainStopsAtCap) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = url("/redirect/1");

    auto response = client->send(request);

    // 15 redirects followed; the 16th response is handed back as-is
    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().statusCode, 302);
    EXPECT_EQ(response.value().redirectCount, 15);
    EXPECT_EQ(response.value().effectiveUrl, url("/redirect/16"));
    EXPECT_EQ(response.value().getHeader("Location"), "/redirect/17");
}

TEST_F(HttpClientTest, RedirectsDisabled) {
    HttpClientConfig config;
    config.maxRedirects = 0;
    auto client = makeClient(config);
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = url("/redirect/1");

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().statusCode, 302);
    EXPECT_EQ(response.value().redirectCount, 0);
}

TEST_F(HttpClientTest, SeeOtherBecomesGet) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url("/see-other");
    request.body = "dropped";

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().statusCode, 200);
    EXPECT_EQ(response.value().redirectCount, 1);
    EXPECT_EQ(response.value().getHeader("X-Echo-Method"), "GET");
    EXPECT_EQ(response.value().bodyAsString(), "");
}

TEST_F(HttpClientTest, MovedPostBecomesGet) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url("/moved");
    request.body = "dropped";

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().getHeader("X-Echo-Method"), "GET");
}

TEST_F(HttpClientTest, TemporaryRedirectKeepsMethodAndBody) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url("/temporary");
    request.body = "kept";

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().getHeader("X-Echo-Method"), "POST");
    EXPECT_EQ(response.value().bodyAsString(), "kept");
}

TEST_F(HttpClientTest, CredentialsFollowSameHostOnly) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest same;
    same.url = url("/same-host");
    same.headers["Authorization"] = "Bearer secret";

    auto sameResponse = client->send(same);
    ASSERT_TRUE(sameResponse.isSuccess());
    EXPECT_EQ(sameResponse.value().getHeader("X-Echo-Authorization"), "Bearer secret");

    HttpRequest other;
    other.url = url("/other-host");
    other.headers["Authorization"] = "Bearer secret";
    other.headers["X-Keep"] = "yes";

    auto otherResponse = client->send(other);
    ASSERT_TRUE(otherResponse.isSuccess());
    EXPECT_EQ(otherResponse.value().headers.count("x-echo-authorization"), 0u);
    EXPECT_EQ(otherResponse.value().getHeader("X-Echo-X-Keep"), "yes");
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(HttpClientTest, ConnectionRefused) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(unusedPort()) + "/";

    auto response = client->send(request);

    ASSERT_TRUE(response.isFailure());
    EXPECT_EQ(response.error(), ErrorCode::ConnectionFailed);
}

TEST_F(HttpClientTest, UnsupportedScheme) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = "htp://127.0.0.1/";

    auto response = client->send(request);

    ASSERT_TRUE(response.isFailure());
    EXPECT_EQ(response.error(), ErrorCode::InvalidUrl);
}

TEST_F(HttpClientTest, NonHttpSchemesRefused) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    for (const char* target : {"file:///etc/passwd", "FILE:///etc/hostname",
                               "dict://127.0.0.1/", "ftp://127.0.0.1/", "gopher://127.0.0.1/"}) {
        HttpRequest request;
        request.url = target;

        auto response = client->send(request);

        ASSERT_TRUE(response.isFailure()) << target;
        EXPECT_EQ(response.error(), ErrorCode::InvalidUrl) << target;
    }
}

TEST_F(HttpClientTest, RedirectToFileRefused) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = url("/to-file");

    auto response = client->send(request);

    ASSERT_TRUE(response.isFailure());
    EXPECT_EQ(response.error(), ErrorCode::InvalidUrl);
}

TEST_F(HttpClientTest, RequestTimeout) {
    HttpClientConfig config;
    config.requestTimeout = Milliseconds{200};
    auto client = makeClient(config);
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = url("/slow");

    auto startTime = Clock::now();
    auto response = client->send(request);
    auto elapsed = std::chrono::duration_cast<Milliseconds>(Clock::now() - startTime);

    ASSERT_TRUE(response.isFailure());
    EXPECT_EQ(response.error(), ErrorCode::Timeout);
    EXPECT_LT(elapsed.count(), 1000);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(HttpClientTest, ConcurrentSendsShareClient) {
    auto client = makeClient();
    ASSERT_NE(client, nullptr);

    const int numThreads = 8;
    const int requestsPerThread = 10;
    std::vector<std::thread> threads;
    std::vector<int> mismatches(numThreads, 0);

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < requestsPerThread; ++i) {
                std::string body = "t" + std::to_string(t) + "-" + std::to_string(i);

                HttpRequest request;
                request.method = HttpMethod::POST;
                request.url = url("/echo");
                request.body = body;

                auto response = client->send(request);
                if (response.isFailure() || response.value().bodyAsString() != body) {
                    mismatches[t]++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < numThreads; ++t) {
        EXPECT_EQ(mismatches[t], 0) << "thread " << t;
    }
}

// ============================================================================
// Forwarding end to end
// ============================================================================

TEST_F(HttpClientTest, ForwarderEchoRoundTrip) {
    RequestForwarder forwarder;

    RequestDescriptor request;
    request.url = url("/echo");
    request.method = "post";
    request.headers = std::map<std::string, std::string>{{"X-Test", "1"}};
    request.body = "hello";

    auto response = forwarder.forward(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_TRUE(response.value().success);
    EXPECT_EQ(response.value().statusCode, 200);
    EXPECT_EQ(response.value().headers.at("x-echo-x-test"), "1");
    EXPECT_EQ(response.value().body, "hello");
}

TEST_F(HttpClientTest, ForwarderReportsTransportFailure) {
    RequestForwarder forwarder;

    RequestDescriptor request;
    request.url = "http://127.0.0.1:" + std::to_string(unusedPort()) + "/";
    request.method = "GET";

    auto response = forwarder.forward(request);

    ASSERT_TRUE(response.isFailure());
    EXPECT_EQ(response.error(), ErrorCode::TransportFailed);
}

TEST_F(HttpClientTest, ForwarderDoesNotReadLocalFiles) {
    RequestForwarder forwarder;

    for (const std::string target : {std::string("file:///etc/passwd"), url("/to-file")}) {
        RequestDescriptor request;
        request.url = target;
        request.method = "GET";

        auto response = forwarder.forward(request);

        ASSERT_TRUE(response.isFailure()) << target;
        EXPECT_EQ(response.error(), ErrorCode::TransportFailed) << target;
    }
}

// ============================================================================
// TLS
// ============================================================================

class HttpsClientTest : public TempDirFixture {
protected:
    void SetUp() override {
        TempDirFixture::SetUp();

        certPath = (tempDir / "cert.pem").string();
        keyPath = (tempDir / "key.pem").string();
        ASSERT_TRUE(generateSelfSignedCertificate(certPath, keyPath));

        server = std::make_unique<LocalServer>(certPath, keyPath);
        addEchoRoute(server->server());
        ASSERT_TRUE(server->start());
    }

    void TearDown() override {
        server.reset();
        TempDirFixture::TearDown();
    }

    std::string certPath;
    std::string keyPath;
    std::unique_ptr<LocalServer> server;
};

TEST_F(HttpsClientTest, SelfSignedAcceptedWhenRelaxed) {
    HttpClientConfig config;
    config.acceptInvalidCertificates = true;
    auto client = makeClient(config);
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = server->baseUrl() + "/echo";
    request.body = "over tls";

    auto response = client->send(request);

    ASSERT_TRUE(response.isSuccess()) << getErrorMessage(response.error());
    EXPECT_EQ(response.value().statusCode, 200);
    EXPECT_EQ(response.value().bodyAsString(), "over tls");
}

TEST_F(HttpsClientTest, SelfSignedRejectedWhenStrict) {
    HttpClientConfig config;
    config.acceptInvalidCertificates = false;
    auto client = makeClient(config);
    ASSERT_NE(client, nullptr);

    HttpRequest request;
    request.url = server->baseUrl() + "/echo";

    auto response = client->send(request);

    ASSERT_TRUE(response.isFailure());
    EXPECT_TRUE(response.error() == ErrorCode::CertificateInvalid ||
                response.error() == ErrorCode::TlsHandshakeFailed)
        << getErrorMessage(response.error());
}

TEST_F(HttpsClientTest, ForwarderRelaxedPolicy) {
    HttpClientConfig config;
    config.acceptInvalidCertificates = true;
    RequestForwarder forwarder(config);

    RequestDescriptor request;
    request.url = server->baseUrl() + "/echo";
    request.method = "GET";

    auto response = forwarder.forward(request);

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().statusCode, 200);
}
