// wav-test.cpp - WAV Decoding Tests

// stl includes
#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

// lib includes
#include <gtest/gtest.h>
#include <whisperserve/wav.hpp>

using namespace whisperserve;


namespace {

void put_u16(std::string &out, const std::uint16_t &value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void put_u32(std::string &out, const std::uint32_t &value) {
    put_u16(out, static_cast<std::uint16_t>(value & 0xFFFF));
    put_u16(out, static_cast<std::uint16_t>((value >> 16) & 0xFFFF));
}

// RIFF/WAVE container around `data`
std::string make_wav(const std::uint16_t &format, const int &channels, const int &sample_rate,
                     const int &bits, const std::string &data, const bool &with_list_chunk = false) {
    std::string body = "WAVE";

    body += "fmt ";
    put_u32(body, 16);
    put_u16(body, format);
    put_u16(body, static_cast<std::uint16_t>(channels));
    put_u32(body, static_cast<std::uint32_t>(sample_rate));
    put_u32(body, static_cast<std::uint32_t>(sample_rate * channels * bits / 8));
    put_u16(body, static_cast<std::uint16_t>(channels * bits / 8));
    put_u16(body, static_cast<std::uint16_t>(bits));

    if (with_list_chunk) {
        // odd sized chunk, padded to an even boundary
        body += "LIST";
        put_u32(body, 3);
        body += "abc";
        body.push_back('\0');
    }

    body += "data";
    put_u32(body, static_cast<std::uint32_t>(data.size()));
    body += data;

    std::string wav = "RIFF";
    put_u32(wav, static_cast<std::uint32_t>(body.size()));
    return wav + body;
}

std::string pcm16(const std::vector<std::int16_t> &samples) {
    std::string data;
    for (auto sample : samples) put_u16(data, static_cast<std::uint16_t>(sample));
    return data;
}

} // namespace


TEST(WavTest, DecodesMono16BitPcm) {
    std::istringstream wav(make_wav(1, 1, 16000, 16, pcm16({0, 16384, -16384, 32767})));
    std::vector<float> samples;

    const WavInfo info = read_wav_mono(wav, samples);

    EXPECT_EQ(info.sample_rate, 16000);
    EXPECT_EQ(info.num_channels, 1);
    EXPECT_EQ(info.bits_per_sample, 16);
    EXPECT_EQ(info.num_frames, 4u);
    ASSERT_EQ(samples.size(), 4u);
    EXPECT_FLOAT_EQ(samples[0], 0.0f);
    EXPECT_FLOAT_EQ(samples[1], 0.5f);
    EXPECT_FLOAT_EQ(samples[2], -0.5f);
    EXPECT_NEAR(samples[3], 1.0f, 1e-4);
}

TEST(WavTest, MixesChannelsDown) {
    // left, right per frame
    std::istringstream wav(make_wav(1, 2, 16000, 16, pcm16({16384, 0, -16384, -16384})));
    std::vector<float> samples;

    const WavInfo info = read_wav_mono(wav, samples);

    EXPECT_EQ(info.num_frames, 2u);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_FLOAT_EQ(samples[0], 0.25f);
    EXPECT_FLOAT_EQ(samples[1], -0.5f);
}

TEST(WavTest, ResamplesToEngineRate) {
    std::vector<std::int16_t> pcm(8000, 1000);
    std::istringstream wav(make_wav(1, 1, 8000, 16, pcm16(pcm)));
    std::vector<float> samples;

    const WavInfo info = read_wav_mono(wav, samples);

    EXPECT_EQ(info.sample_rate, 8000);
    EXPECT_EQ(samples.size(), 16000u);
    EXPECT_NEAR(samples[5000], 1000 / 32768.0f, 1e-6);
}

TEST(WavTest, DecodesFloatAnd8BitSamples) {
    std::string floats;
    for (float value : {0.25f, -0.75f}) {
        std::uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        put_u32(floats, bits);
    }
    std::istringstream float_wav(make_wav(3, 1, 16000, 32, floats));
    std::vector<float> samples;

    read_wav_mono(float_wav, samples);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_FLOAT_EQ(samples[0], 0.25f);
    EXPECT_FLOAT_EQ(samples[1], -0.75f);

    std::istringstream byte_wav(make_wav(1, 1, 16000, 8, std::string("\x80\xC0", 2)));
    read_wav_mono(byte_wav, samples);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_FLOAT_EQ(samples[0], 0.0f);
    EXPECT_FLOAT_EQ(samples[1], 0.5f);
}

TEST(WavTest, SkipsUnknownChunks) {
    std::istringstream wav(make_wav(1, 1, 16000, 16, pcm16({16384}), true));
    std::vector<float> samples;

    read_wav_mono(wav, samples);

    ASSERT_EQ(samples.size(), 1u);
    EXPECT_FLOAT_EQ(samples[0], 0.5f);
}

TEST(WavTest, RejectsNonWavInput) {
    std::istringstream mp3("ID3\x04 not a wav file at all");
    std::vector<float> samples;

    EXPECT_THROW(read_wav_mono(mp3, samples), WavFormatError);
}

TEST(WavTest, RejectsCompressedEncodings) {
    // mu-law
    std::istringstream wav(make_wav(7, 1, 8000, 8, std::string(16, '\x7F')));
    std::vector<float> samples;

    EXPECT_THROW(read_wav_mono(wav, samples), WavFormatError);
}

TEST(WavTest, RejectsEmptyData) {
    std::istringstream wav(make_wav(1, 1, 16000, 16, ""));
    std::vector<float> samples;

    EXPECT_THROW(read_wav_mono(wav, samples), WavFormatError);
}

TEST(WavTest, TruncatedHeaderIsRejected) {
    const std::string full = make_wav(1, 1, 16000, 16, pcm16({1, 2, 3}));
    std::istringstream wav(full.substr(0, 20));
    std::vector<float> samples;

    EXPECT_THROW(read_wav_mono(wav, samples), WavFormatError);
}

TEST(WavTest, OversizedFmtChunkIsRejectedWithoutBuffering) {
    // fmt chunk claiming ~4 GiB with nothing behind it
    std::string wav = "RIFF";
    put_u32(wav, 0);
    wav += "WAVEfmt ";
    put_u32(wav, 0xF0000000u);
    std::istringstream stream(wav);
    std::vector<float> samples;

    EXPECT_THROW(read_wav_mono(stream, samples), WavFormatError);
}

TEST(WavTest, LargeFmtChunkTailIsSkipped) {
    std::string wav = make_wav(1, 1, 16000, 16, pcm16({16384}));
    // grow the fmt chunk from 16 to 20 bytes with trailing padding
    wav[16] = 20;
    wav.insert(36, std::string(4, '\0'));
    std::istringstream stream(wav);
    std::vector<float> samples;

    read_wav_mono(stream, samples);

    ASSERT_EQ(samples.size(), 1u);
    EXPECT_FLOAT_EQ(samples[0], 0.5f);
}

TEST(ResampleTest, IdentityWhenRatesMatch) {
    const std::vector<float> input = {0.1f, 0.2f, 0.3f};
    std::vector<float> output;

    resample_linear(input, 16000, output, 16000);

    EXPECT_EQ(output, input);
}

TEST(ResampleTest, DownsamplingHalvesLength) {
    const std::vector<float> input = {0.0f, 1.0f, 2.0f, 3.0f};
    std::vector<float> output;

    resample_linear(input, 32000, output, 16000);

    ASSERT_EQ(output.size(), 2u);
    EXPECT_FLOAT_EQ(output[0], 0.0f);
    EXPECT_FLOAT_EQ(output[1], 2.0f);
}
