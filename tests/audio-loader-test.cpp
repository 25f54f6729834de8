// audio-loader-test.cpp - Audio Source Loader Tests

// stl includes
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

// lib includes
#include <boost/asio.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <whisperserve/audio.hpp>

using namespace whisperserve;
using ::testing::_;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

namespace asio = boost::asio;
using asio::ip::tcp;


class MockFetcher : public HttpFetcher {
  public:
    MOCK_METHOD3(fetch, std::string(const std::string &, const std::size_t &, const long &));
};

namespace {

std::string read_all(AudioInput &input) {
    std::ostringstream out;
    out << input.stream().rdbuf();
    return out.str();
}

// Serves exactly one http request on 127.0.0.1 with a scripted response.
class OneShotHttpServer final {

  public:
    // `head` is written first, then `body`; with `withhold_body` the server
    // sends no body and waits for the client to hang up instead
    OneShotHttpServer(std::string head, std::string body, const bool &withhold_body = false)
        : acceptor_(io_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)),
          head_(std::move(head)), body_(std::move(body)), withhold_body_(withhold_body) {
        thread_ = std::thread(&OneShotHttpServer::serve_, this);
    }

    ~OneShotHttpServer() {
        if (thread_.joinable()) thread_.join();
    }

    std::string url(const std::string &path) const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + path;
    }

    // waits for the exchange to end, returns the body bytes handed to the client
    std::size_t finish() {
        thread_.join();
        return body_written_;
    }

  private:
    void serve_() {
        boost::system::error_code ec;
        tcp::socket socket(io_);
        acceptor_.accept(socket, ec);
        if (ec) return;

        asio::streambuf request;
        asio::read_until(socket, request, "\r\n\r\n", ec);
        if (ec) return;

        asio::write(socket, asio::buffer(head_), ec);
        if (ec) return;

        if (withhold_body_) {
            char byte;
            socket.read_some(asio::buffer(&byte, 1), ec);
            return;
        }
        body_written_ = asio::write(socket, asio::buffer(body_), ec);
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::string head_;
    std::string body_;
    bool withhold_body_;
    std::size_t body_written_ = 0;
    std::thread thread_;
};

} // namespace


class AudioLoaderTest : public ::testing::Test {
  protected:
    AudioLoaderTest() : fetcher_(std::make_shared<MockFetcher>()), loader_(1024, fetcher_) {}

    std::shared_ptr<MockFetcher> fetcher_;
    AudioLoader loader_;
};


TEST_F(AudioLoaderTest, PathIsPassedThroughUnchecked) {
    EXPECT_CALL(*fetcher_, fetch(_, _, _)).Times(0);

    AudioInput input = loader_.load(LocalReference{"/data/call.wav"});

    EXPECT_TRUE(input.is_path());
    EXPECT_FALSE(input.is_stream());
    EXPECT_EQ(input.path(), "/data/call.wav");
}

TEST_F(AudioLoaderTest, InlinePayloadBecomesStream) {
    AudioInput input = loader_.load(InlinePayload{"RIFF-bytes"});

    ASSERT_TRUE(input.is_stream());
    EXPECT_EQ(input.size(), 10u);
    EXPECT_EQ(read_all(input), "RIFF-bytes");
}

TEST_F(AudioLoaderTest, InlinePayloadAtLimitIsAccepted) {
    const std::string payload(1024, 'x');
    AudioInput input = loader_.load(InlinePayload{payload});

    EXPECT_EQ(input.size(), 1024u);
}

TEST_F(AudioLoaderTest, InlinePayloadIsReadInPlace) {
    std::string payload = "RIFF-original";
    AudioInput input = loader_.load(InlinePayload{payload});
    EXPECT_FALSE(input.owns_bytes());

    // same storage, no private copy
    payload[5] = 'X';
    EXPECT_EQ(read_all(input), "RIFF-Xriginal");
}

TEST_F(AudioLoaderTest, InlinePayloadOverLimitIsRejected) {
    try {
        const std::string payload(1025, 'x');
        loader_.load(InlinePayload{payload});
        FAIL() << "expected AudioSourceError";
    } catch (const AudioSourceError &e) {
        EXPECT_EQ(std::string(e.what()), "Audio data exceeds maximum size of 1024 bytes");
    }
}

TEST_F(AudioLoaderTest, RemoteAudioIsFetchedWithTimeout) {
    EXPECT_CALL(*fetcher_, fetch(Eq("https://example.com/a.wav"), Eq(std::size_t(1024)), Eq(15L)))
        .WillOnce(Return(std::string("remote-bytes")));

    AudioInput input = loader_.load(RemoteLocator{"https://example.com/a.wav"});

    ASSERT_TRUE(input.is_stream());
    EXPECT_TRUE(input.owns_bytes());
    EXPECT_EQ(read_all(input), "remote-bytes");
}

TEST_F(AudioLoaderTest, OversizedRemoteAudioIsRejected) {
    EXPECT_CALL(*fetcher_, fetch(_, _, _)).WillOnce(Throw(RemoteTooLargeError("content-length 4096")));

    try {
        loader_.load(RemoteLocator{"https://example.com/big.wav"});
        FAIL() << "expected AudioSourceError";
    } catch (const AudioSourceError &e) {
        EXPECT_EQ(std::string(e.what()), "Remote audio file exceeds maximum size of 1024 bytes");
    }
}

TEST_F(AudioLoaderTest, FailedFetchIsRejectedWithCause) {
    EXPECT_CALL(*fetcher_, fetch(_, _, _)).WillOnce(Throw(FetchError("The requested URL returned error: 404")));

    try {
        loader_.load(RemoteLocator{"https://example.com/missing.wav"});
        FAIL() << "expected AudioSourceError";
    } catch (const AudioSourceError &e) {
        EXPECT_THAT(e.what(), HasSubstr("Failed to fetch audio URI: "));
        EXPECT_THAT(e.what(), HasSubstr("404"));
    }
}

TEST(AudioSourceTest, TypeAndLabel) {
    EXPECT_EQ(source_type(LocalReference{"/a.wav"}), "path");
    EXPECT_EQ(source_type(InlinePayload{"abc"}), "data");
    EXPECT_EQ(source_type(RemoteLocator{"http://h/a.wav"}), "uri");

    EXPECT_EQ(source_label(LocalReference{"/a.wav"}), "/a.wav");
    EXPECT_EQ(source_label(InlinePayload{"abc"}), "<bytes_payload>");
    EXPECT_EQ(source_label(RemoteLocator{"http://h/a.wav"}), "http://h/a.wav");
}

TEST(AudioInputTest, ReleaseDropsBufferedAudio) {
    AudioInput input = AudioInput::from_bytes("abc");
    ASSERT_TRUE(input.is_stream());

    input.release();

    EXPECT_FALSE(input.is_stream());
    EXPECT_FALSE(input.owns_bytes());
    EXPECT_EQ(input.size(), 0u);
    EXPECT_THROW(input.stream(), std::logic_error);
}

TEST(AudioLoaderNoFetcherTest, RemoteWithoutFetcherIsRejected) {
    AudioLoader loader(1024, nullptr);

    EXPECT_THROW(loader.load(RemoteLocator{"https://example.com/a.wav"}), AudioSourceError);
}

TEST(CurlFetcherTest, RefusedConnectionIsFetchError) {
    CurlFetcher fetcher;

    // nothing listens on port 1
    EXPECT_THROW(fetcher.fetch("http://127.0.0.1:1/audio.wav", 1024, 2), FetchError);
}

TEST(CurlFetcherTest, LoaderReportsRefusedConnection) {
    AudioLoader loader(1024, std::make_shared<CurlFetcher>());

    try {
        loader.load(RemoteLocator{"http://127.0.0.1:1/audio.wav"});
        FAIL() << "expected AudioSourceError";
    } catch (const AudioSourceError &e) {
        EXPECT_THAT(e.what(), HasSubstr("Failed to fetch audio URI: "));
    }
}

TEST(CurlFetcherTest, DeclaredOversizeAbortsBeforeBody) {
    OneShotHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 4096\r\n\r\n", std::string(4096, 'x'), true);
    CurlFetcher fetcher;

    EXPECT_THROW(fetcher.fetch(server.url("/big.wav"), 1024, 5), RemoteTooLargeError);
    EXPECT_EQ(server.finish(), 0u);
}

TEST(CurlFetcherTest, UndeclaredBodyIsBoundedWhileReceived) {
    std::string body;
    for (char fill : {'a', 'b'}) {
        body += "320\r\n" + std::string(800, fill) + "\r\n";
    }
    body += "0\r\n\r\n";
    OneShotHttpServer server("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n", body);
    CurlFetcher fetcher;

    EXPECT_THROW(fetcher.fetch(server.url("/stream.wav"), 1024, 5), RemoteTooLargeError);
    server.finish();
}

TEST(CurlFetcherTest, BodyWithoutLengthWithinLimitIsReturned) {
    OneShotHttpServer server("HTTP/1.1 200 OK\r\nConnection: close\r\n\r\n", "RIFF-remote");
    CurlFetcher fetcher;

    EXPECT_EQ(fetcher.fetch(server.url("/a.wav"), 1024, 5), "RIFF-remote");
    EXPECT_EQ(server.finish(), 11u);
}

TEST(CurlFetcherTest, ErrorStatusIsFetchError) {
    OneShotHttpServer server("HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n\r\n", "not found");
    CurlFetcher fetcher;

    try {
        fetcher.fetch(server.url("/missing.wav"), 1024, 5);
        FAIL() << "expected FetchError";
    } catch (const FetchError &e) {
        EXPECT_THAT(e.what(), HasSubstr("404"));
    }
    server.finish();
}

TEST(CurlFetcherTest, LoaderReportsDeclaredOversize) {
    OneShotHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 4096\r\n\r\n", "", true);
    AudioLoader loader(1024, std::make_shared<CurlFetcher>());

    try {
        loader.load(RemoteLocator{server.url("/big.wav")});
        FAIL() << "expected AudioSourceError";
    } catch (const AudioSourceError &e) {
        EXPECT_EQ(std::string(e.what()), "Remote audio file exceeds maximum size of 1024 bytes");
    }
    server.finish();
}
