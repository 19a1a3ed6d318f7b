/**
 * @file test_curl_transport.cpp
 * @brief Tests for the libcurl transport against a loopback server
 */

#include <gtest/gtest.h>

#include <bulkfetch/curl_transport.hpp>
#include <bulkfetch/errors.hpp>
#include <bulkfetch/transfer_controller.hpp>

#include "fake_transport.hpp"
#include "local_http_server.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace bulkfetch::test {

namespace {

std::string drain(ResponseStream& stream) {
    std::string body;
    const CancellationToken token;
    while (auto chunk = stream.read(token)) {
        body.append(chunk->begin(), chunk->end());
    }
    return body;
}

CurlTransportOptions fastOptions() {
    CurlTransportOptions options;
    options.connect_timeout = std::chrono::seconds(2);
    options.idle_timeout = std::chrono::seconds(5);
    options.poll_interval = std::chrono::milliseconds(10);
    return options;
}

} // namespace

TEST(CurlTransportTest, StreamsBodyWithContentLength) {
    LocalHttpServer server{{200, "OK", {"hello ", "recorded ", "world"}, true, false,
                            std::chrono::milliseconds(5)}};
    CurlTransport transport{fastOptions()};

    auto stream = transport.open(makeGetRequest(server.url("/api/recordings/download/cam/a.mp4"), "a.zip"),
                                 CancellationToken{});
    ASSERT_TRUE(stream);
    EXPECT_EQ(stream->statusCode(), 200);
    EXPECT_TRUE(stream->isSuccess());
    ASSERT_TRUE(stream->contentLength().has_value());
    EXPECT_EQ(*stream->contentLength(), 20u);
    EXPECT_EQ(drain(*stream), "hello recorded world");

    EXPECT_NE(server.receivedRequest().find("GET /api/recordings/download/cam/a.mp4 HTTP/1.1"),
              std::string::npos);
}

TEST(CurlTransportTest, UnknownLengthReadsUntilClose) {
    LocalHttpServer server{{200, "OK", {"part1", "part2"}, false, false, std::chrono::milliseconds(5)}};
    CurlTransport transport{fastOptions()};

    auto stream = transport.open(makeGetRequest(server.url(), "x.zip"), CancellationToken{});
    EXPECT_FALSE(stream->contentLength().has_value());
    EXPECT_EQ(drain(*stream), "part1part2");
}

TEST(CurlTransportTest, ErrorStatusExposesBody) {
    LocalHttpServer server{{500, "Internal Server Error", {R"({"detail":"zip failed"})"}}};
    CurlTransport transport{fastOptions()};

    auto stream = transport.open(makeGetRequest(server.url(), "x.zip"), CancellationToken{});
    EXPECT_EQ(stream->statusCode(), 500);
    EXPECT_FALSE(stream->isSuccess());
    EXPECT_EQ(stream->errorBody(8, CancellationToken{}), R"({"detail)");
}

TEST(CurlTransportTest, PostSendsBodyAndHeaders) {
    LocalHttpServer server{{200, "OK", {"zip"}}};
    CurlTransport transport{fastOptions()};

    auto request = bulkRecordingsDownload(server.url(), {"cam1/a.mp4", "cam2/b.mp4"});
    auto stream = transport.open(request, CancellationToken{});
    EXPECT_EQ(drain(*stream), "zip");

    const auto received = server.receivedRequest();
    EXPECT_NE(received.find("POST /api/recordings/download-bulk HTTP/1.1"), std::string::npos);
    EXPECT_NE(received.find("Content-Type: application/json"), std::string::npos);
    EXPECT_NE(received.find(R"({"recording_ids":["cam1/a.mp4","cam2/b.mp4"]})"), std::string::npos);
}

TEST(CurlTransportTest, ConnectionRefusedRaisesRequestFailed) {
    unsigned short port = 0;
    {
        // Grab a free port, then close it so nothing listens there.
        LocalHttpServer placeholder{LocalHttpServer::Response{}};
        port = static_cast<unsigned short>(std::stoi(placeholder.url().substr(17)));
    }

    CurlTransport transport{fastOptions()};
    try {
        (void)transport.open(makeGetRequest("http://127.0.0.1:" + std::to_string(port) + "/", "x.zip"),
                             CancellationToken{});
        FAIL() << "expected RequestFailed";
    } catch (const RequestFailed& ex) {
        EXPECT_EQ(ex.statusCode(), 0);
    }
}

TEST(CurlTransportTest, CancelWhileServerHangs) {
    LocalHttpServer::Response response;
    response.hang = true;
    LocalHttpServer server{response};
    CurlTransport transport{fastOptions()};

    CancellationSource source;
    auto stream = transport.open(makeGetRequest(server.url(), "x.zip"), source.token());
    ASSERT_EQ(stream->statusCode(), 200);

    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto chunk = stream->read(source.token());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(chunk->empty());
    canceller.join();

    stream->release();
    stream->release();
}

TEST(CurlTransportTest, ErrorBodyStopsWhenCancelled) {
    LocalHttpServer::Response response;
    response.status = 500;
    response.reason = "Internal Server Error";
    response.hang = true;
    LocalHttpServer server{response};
    CurlTransport transport{fastOptions()};

    CancellationSource source;
    auto stream = transport.open(makeGetRequest(server.url(), "x.zip"), source.token());
    ASSERT_EQ(stream->statusCode(), 500);

    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    const auto body = stream->errorBody(4096, source.token());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    EXPECT_TRUE(body.empty());
    canceller.join();
}

TEST(CurlTransportTest, ControllerEndToEnd) {
    LocalHttpServer server{{200, "OK", {"abc", "def", "ghi"}, true, false, std::chrono::milliseconds(2)}};
    auto sink = std::make_shared<RecordingSink>();
    ControllerOptions options;
    options.grace_delay = std::chrono::milliseconds(0);
    TransferController controller{std::make_shared<CurlTransport>(fastOptions()),
                                  ArtifactMaterializer{sink}, options};

    EXPECT_EQ(controller.start(makeGetRequest(server.url(), "e2e.zip")), TransferOutcome::Completed);

    const auto saved = sink->saved();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(std::string(saved[0].bytes.begin(), saved[0].bytes.end()), "abcdefghi");
}

} // namespace bulkfetch::test
