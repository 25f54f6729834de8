// audio.hpp - Audio Source Loader Interface
#pragma once

// stl includes
#include <cstddef>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>

// lib includes
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/utility/string_view.hpp>
#include <boost/variant.hpp>

// local includes
#include "config.hpp"


namespace whisperserve {

// AUDIO SOURCES (exactly one per request)

// file already reachable by the engine
struct LocalReference {
    std::string path;
};

// audio bytes carried in the request itself, viewed in place.
// The request must outlive the loaded `AudioInput`.
struct InlinePayload {
    boost::string_view data;
};

// audio to be fetched over http(s)
struct RemoteLocator {
    std::string uri;
};

using AudioSource = boost::variant<LocalReference, InlinePayload, RemoteLocator>;

// short name of the source kind ("path", "data" or "uri")
std::string source_type(const AudioSource &source);

// loggable description of the source (payloads are not dumped)
std::string source_label(const AudioSource &source);


// Rejected request audio: missing source, size policy or failed fetch.
// Reported to callers as an invalid argument.
class AudioSourceError : public std::invalid_argument {
  public:
    explicit AudioSourceError(const std::string &message) : std::invalid_argument(message) {}
};

// Remote transfer failure (timeout, connection, non-success status).
class FetchError : public std::runtime_error {
  public:
    explicit FetchError(const std::string &message) : std::runtime_error(message) {}
};

// Remote body larger than the accepted maximum.
class RemoteTooLargeError : public std::runtime_error {
  public:
    explicit RemoteTooLargeError(const std::string &message) : std::runtime_error(message) {}
};


// Audio as handed to the engine: a local path, or a byte stream over either
// an owned buffer (fetched audio) or a caller-owned view (inline audio).
class AudioInput final {

  public:
    AudioInput() = default;

    static AudioInput from_path(const std::string &path);

    // takes ownership of `bytes`
    static AudioInput from_bytes(std::string &&bytes);

    // reads `bytes` in place, they must stay alive until `release()`
    static AudioInput view_of(const boost::string_view &bytes);

    inline bool is_path() const noexcept {
        return kind_ == Kind::PATH;
    }

    inline bool is_stream() const noexcept {
        return kind_ == Kind::STREAM && stream_ != nullptr;
    }

    inline const std::string &path() const noexcept {
        return path_;
    }

    // size of the buffered audio in bytes, 0 for paths
    inline std::size_t size() const noexcept {
        return size_;
    }

    // true when the bytes are held by this input rather than viewed
    inline bool owns_bytes() const noexcept {
        return bytes_ != nullptr;
    }

    // the buffered audio, only valid when `is_stream()`
    std::istream &stream();

    // drops the stream and any owned bytes
    void release() noexcept;

  private:
    using ByteStream = boost::iostreams::stream<boost::iostreams::array_source>;

    enum class Kind { NONE, PATH, STREAM };

    Kind kind_ = Kind::NONE;
    std::string path_;
    // heap held so the stream's view survives moves of the input
    std::unique_ptr<std::string> bytes_;
    std::unique_ptr<ByteStream> stream_;
    std::size_t size_ = 0;
};


// Blocking http(s) GET with a size bound.
class HttpFetcher {

  public:
    virtual ~HttpFetcher() = default;

    // Downloads `uri`, giving up after `timeout_sec` seconds.
    // Throws `RemoteTooLargeError` when the declared Content-Length (or the
    // received body) exceeds `max_bytes`, before buffering past the limit.
    // Throws `FetchError` on transport failures and non-success statuses.
    virtual std::string fetch(const std::string &uri,
                              const std::size_t &max_bytes,
                              const long &timeout_sec) = 0;
};

// `HttpFetcher` backed by libcurl's easy interface.
class CurlFetcher final : public HttpFetcher {

  public:
    CurlFetcher();

    std::string fetch(const std::string &uri,
                      const std::size_t &max_bytes,
                      const long &timeout_sec) override;
};


// Turns a request's audio source into engine input, enforcing the size policy.
class AudioLoader final {

  public:
    static constexpr long FETCH_TIMEOUT_SEC = 15;

    AudioLoader(const std::size_t &max_bytes, std::shared_ptr<HttpFetcher> fetcher);

    // throws `AudioSourceError`
    AudioInput load(const AudioSource &source) const;

    inline std::size_t max_bytes() const noexcept {
        return max_bytes_;
    }

  private:
    std::size_t max_bytes_;
    std::shared_ptr<HttpFetcher> fetcher_;
};

} // namespace whisperserve
