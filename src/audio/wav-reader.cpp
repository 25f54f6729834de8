// wav-reader.cpp - WAV Decoding Implementation

// stl includes
#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>
#include <vector>

// local includes
#include "whisperserve/wav.hpp"


namespace whisperserve {

namespace {

constexpr std::uint16_t FORMAT_PCM = 0x0001;
constexpr std::uint16_t FORMAT_IEEE_FLOAT = 0x0003;
constexpr std::uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

// fmt fields read, up to the extensible sub-format tag
constexpr std::size_t FMT_HEADER_SIZE = 40;

std::uint32_t read_u32(std::istream &stream) {
    unsigned char bytes[4];
    if (!stream.read(reinterpret_cast<char *>(bytes), 4)) {
        throw WavFormatError("WaveData: unexpected end of stream");
    }
    return static_cast<std::uint32_t>(bytes[0]) |
           (static_cast<std::uint32_t>(bytes[1]) << 8) |
           (static_cast<std::uint32_t>(bytes[2]) << 16) |
           (static_cast<std::uint32_t>(bytes[3]) << 24);
}

std::string read_tag(std::istream &stream) {
    char tag[4];
    if (!stream.read(tag, 4)) {
        throw WavFormatError("WaveData: unexpected end of stream");
    }
    return std::string(tag, 4);
}

inline std::uint16_t u16_at(const char *buffer, const std::size_t &offset) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(buffer[offset]) |
                                      (static_cast<unsigned char>(buffer[offset + 1]) << 8));
}

inline std::uint32_t u32_at(const char *buffer, const std::size_t &offset) {
    return static_cast<std::uint32_t>(u16_at(buffer, offset)) |
           (static_cast<std::uint32_t>(u16_at(buffer, offset + 2)) << 16);
}

// one sample in [-1, 1]
float decode_sample(const unsigned char *data, const WavInfo &info) {
    switch (info.bits_per_sample) {
        case 8:
            return (static_cast<int>(data[0]) - 128) / 128.0f;
        case 16: {
            const std::int16_t value = static_cast<std::int16_t>(data[0] | (data[1] << 8));
            return value / 32768.0f;
        }
        case 24: {
            std::int32_t value = data[0] | (data[1] << 8) | (data[2] << 16);
            if (value & 0x800000) value |= ~0xFFFFFF;
            return value / 8388608.0f;
        }
        case 32:
        default: {
            const std::uint32_t bits = static_cast<std::uint32_t>(data[0]) |
                                       (static_cast<std::uint32_t>(data[1]) << 8) |
                                       (static_cast<std::uint32_t>(data[2]) << 16) |
                                       (static_cast<std::uint32_t>(data[3]) << 24);
            if (info.is_float) {
                float value;
                std::memcpy(&value, &bits, sizeof(value));
                return value;
            }
            return static_cast<std::int32_t>(bits) / 2147483648.0f;
        }
    }
}

} // namespace


WavInfo read_wav_mono(std::istream &wav_stream,
                      std::vector<float> &samples,
                      const int &sample_rate) {
    if (read_tag(wav_stream) != "RIFF") throw WavFormatError("WaveData: expected RIFF header");
    read_u32(wav_stream);
    if (read_tag(wav_stream) != "WAVE") throw WavFormatError("WaveData: expected WAVE format");

    WavInfo info;
    bool have_format = false;
    std::vector<char> data;

    while (true) {
        const std::string tag = read_tag(wav_stream);
        const std::uint32_t chunk_size = read_u32(wav_stream);

        if (tag == "fmt ") {
            if (chunk_size < 16) throw WavFormatError("WaveData: fmt chunk too small");
            char fmt[FMT_HEADER_SIZE] = {};
            const std::size_t header_size = std::min<std::size_t>(chunk_size, FMT_HEADER_SIZE);
            if (!wav_stream.read(fmt, static_cast<std::streamsize>(header_size))) {
                throw WavFormatError("WaveData: truncated fmt chunk");
            }
            const std::size_t extra = chunk_size - header_size;
            if (extra > 0) {
                wav_stream.ignore(static_cast<std::streamsize>(extra));
                if (static_cast<std::size_t>(wav_stream.gcount()) != extra) {
                    throw WavFormatError("WaveData: truncated fmt chunk");
                }
            }

            std::uint16_t format = u16_at(fmt, 0);
            info.num_channels = u16_at(fmt, 2);
            info.sample_rate = static_cast<int>(u32_at(fmt, 4));
            info.bits_per_sample = u16_at(fmt, 14);
            if (format == FORMAT_EXTENSIBLE && chunk_size >= 26) {
                format = u16_at(fmt, 24);
            }
            if (format != FORMAT_PCM && format != FORMAT_IEEE_FLOAT) {
                throw WavFormatError("WaveData: unsupported encoding " + std::to_string(format));
            }
            info.is_float = format == FORMAT_IEEE_FLOAT;
            have_format = true;
        } else if (tag == "data") {
            if (!have_format) throw WavFormatError("WaveData: data chunk before fmt chunk");
            // streamed files may carry a placeholder size, read what is there
            std::vector<char> buffer(64 * 1024);
            std::size_t remaining = chunk_size;
            while (remaining > 0) {
                const std::size_t wanted = std::min(remaining, buffer.size());
                wav_stream.read(buffer.data(), static_cast<std::streamsize>(wanted));
                const std::size_t got = static_cast<std::size_t>(wav_stream.gcount());
                data.insert(data.end(), buffer.begin(), buffer.begin() + got);
                remaining -= got;
                if (got < wanted) break;
            }
            break;
        } else {
            wav_stream.ignore(chunk_size);
        }

        // chunks are word aligned
        if (chunk_size % 2 == 1) wav_stream.ignore(1);
    }

    if (info.num_channels <= 0) throw WavFormatError("WaveData: no channels");
    if (info.sample_rate <= 0) throw WavFormatError("WaveData: invalid sample rate");
    const bool supported_width = info.is_float ? info.bits_per_sample == 32
                                               : (info.bits_per_sample == 8 || info.bits_per_sample == 16 ||
                                                  info.bits_per_sample == 24 || info.bits_per_sample == 32);
    if (!supported_width) {
        throw WavFormatError("WaveData: unsupported sample width " + std::to_string(info.bits_per_sample));
    }

    const std::size_t sample_width = static_cast<std::size_t>(info.bits_per_sample / 8);
    const std::size_t block_align = sample_width * info.num_channels;
    info.num_frames = data.size() / block_align;
    if (info.num_frames == 0) throw WavFormatError("WaveData: empty file (no data)");

    std::vector<float> mono(info.num_frames);
    const unsigned char *ptr = reinterpret_cast<const unsigned char *>(data.data());
    for (std::size_t i = 0; i < info.num_frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < info.num_channels; ++c) {
            sum += decode_sample(ptr, info);
            ptr += sample_width;
        }
        mono[i] = sum / info.num_channels;
    }

    resample_linear(mono, info.sample_rate, samples, sample_rate);
    return info;
}

void resample_linear(const std::vector<float> &input, const int &input_rate,
                     std::vector<float> &output, const int &output_rate) {
    if (input_rate == output_rate || input.empty()) {
        output = input;
        return;
    }

    const double ratio = static_cast<double>(input_rate) / output_rate;
    const std::size_t n_out = static_cast<std::size_t>(std::floor(input.size() / ratio));
    output.resize(n_out);

    for (std::size_t i = 0; i < n_out; ++i) {
        const double position = i * ratio;
        const std::size_t index = static_cast<std::size_t>(position);
        const double frac = position - index;
        const float a = input[index];
        const float b = index + 1 < input.size() ? input[index + 1] : a;
        output[i] = static_cast<float>(a + (b - a) * frac);
    }
}

} // namespace whisperserve
