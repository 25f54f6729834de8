// audio-loader.cpp - Audio Source Loader Implementation

// stl includes
#include <string>
#include <utility>

// lib includes
#include <spdlog/spdlog.h>

// local includes
#include "whisperserve/audio.hpp"


namespace whisperserve {

namespace {

struct SourceTypeVisitor : public boost::static_visitor<std::string> {
    std::string operator()(const LocalReference &) const { return "path"; }
    std::string operator()(const InlinePayload &) const { return "data"; }
    std::string operator()(const RemoteLocator &) const { return "uri"; }
};

struct SourceLabelVisitor : public boost::static_visitor<std::string> {
    std::string operator()(const LocalReference &source) const { return source.path; }
    std::string operator()(const InlinePayload &) const { return "<bytes_payload>"; }
    std::string operator()(const RemoteLocator &source) const { return source.uri; }
};

// One acquisition strategy per source kind.
class LoadVisitor : public boost::static_visitor<AudioInput> {

  public:
    LoadVisitor(const std::size_t &max_bytes, HttpFetcher *const fetcher)
        : max_bytes_(max_bytes), fetcher_(fetcher) {}

    // the engine reads local files itself, no size check
    AudioInput operator()(const LocalReference &source) const {
        return AudioInput::from_path(source.path);
    }

    AudioInput operator()(const InlinePayload &source) const {
        if (source.data.size() > max_bytes_) {
            throw AudioSourceError("Audio data exceeds maximum size of " + std::to_string(max_bytes_) + " bytes");
        }
        return AudioInput::view_of(source.data);
    }

    AudioInput operator()(const RemoteLocator &source) const {
        if (fetcher_ == nullptr) {
            throw AudioSourceError("Failed to fetch audio URI: no http fetcher configured");
        }
        try {
            return AudioInput::from_bytes(fetcher_->fetch(source.uri, max_bytes_, AudioLoader::FETCH_TIMEOUT_SEC));
        } catch (const RemoteTooLargeError &) {
            throw AudioSourceError("Remote audio file exceeds maximum size of " + std::to_string(max_bytes_) + " bytes");
        } catch (const FetchError &e) {
            spdlog::error("Failed to fetch audio from URI {}: {}", source.uri, e.what());
            throw AudioSourceError(std::string("Failed to fetch audio URI: ") + e.what());
        }
    }

  private:
    std::size_t max_bytes_;
    HttpFetcher *fetcher_;
};

} // namespace


std::string source_type(const AudioSource &source) {
    return boost::apply_visitor(SourceTypeVisitor(), source);
}

std::string source_label(const AudioSource &source) {
    return boost::apply_visitor(SourceLabelVisitor(), source);
}


AudioInput AudioInput::from_path(const std::string &path) {
    AudioInput input;
    input.kind_ = Kind::PATH;
    input.path_ = path;
    return input;
}

AudioInput AudioInput::from_bytes(std::string &&bytes) {
    AudioInput input;
    input.bytes_ = make_uniq<std::string>(std::move(bytes));
    input.kind_ = Kind::STREAM;
    input.size_ = input.bytes_->size();
    input.stream_ = make_uniq<ByteStream>(input.bytes_->data(), input.bytes_->size());
    return input;
}

AudioInput AudioInput::view_of(const boost::string_view &bytes) {
    AudioInput input;
    input.kind_ = Kind::STREAM;
    input.size_ = bytes.size();
    input.stream_ = make_uniq<ByteStream>(bytes.data(), bytes.size());
    return input;
}

std::istream &AudioInput::stream() {
    if (!is_stream()) {
        throw std::logic_error("audio input holds no byte stream");
    }
    return *stream_;
}

void AudioInput::release() noexcept {
    stream_.reset();
    bytes_.reset();
    size_ = 0;
}


constexpr long AudioLoader::FETCH_TIMEOUT_SEC;

AudioLoader::AudioLoader(const std::size_t &max_bytes, std::shared_ptr<HttpFetcher> fetcher)
    : max_bytes_(max_bytes), fetcher_(std::move(fetcher)) {}

AudioInput AudioLoader::load(const AudioSource &source) const {
    return boost::apply_visitor(LoadVisitor(max_bytes_, fetcher_.get()), source);
}

} // namespace whisperserve
