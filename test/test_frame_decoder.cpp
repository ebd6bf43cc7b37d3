/**
 * @file test_frame_decoder.cpp
 * @brief Frame decoders and WAV export
 */

#include <gtest/gtest.h>

#include "FrameDecoder.h"
#include "WavWriter.h"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace Tapir::Voice;

namespace {

uint32_t readLE32(const Bytes& data, size_t offset) {
    const uint8_t* p = data.data() + offset;
    return p[0] | (p[1] << 8) | (p[2] << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t readLE16(const Bytes& data, size_t offset) {
    const uint8_t* p = data.data() + offset;
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

} // namespace

TEST(Pcm16FrameDecoder, DecodesLittleEndianSamples) {
    Pcm16FrameDecoder decoder(16000, 2);
    const uint8_t coded[] = {0x34, 0x12, 0xFF, 0xFF};

    std::vector<int16_t> samples;
    ASSERT_TRUE(decoder.decode(Bytes(coded, sizeof(coded)), samples));
    ASSERT_EQ(2u, samples.size());
    EXPECT_EQ(0x1234, samples[0]);
    EXPECT_EQ(-1, samples[1]);
}

TEST(Pcm16FrameDecoder, DecodesFullSignedRange) {
    Pcm16FrameDecoder decoder(16000, 4);
    const uint8_t coded[] = {0x00, 0x80, 0xFF, 0x7F, 0x01, 0x80, 0x00, 0x00};

    std::vector<int16_t> samples;
    ASSERT_TRUE(decoder.decode(Bytes(coded, sizeof(coded)), samples));
    ASSERT_EQ(4u, samples.size());
    EXPECT_EQ(-32768, samples[0]);
    EXPECT_EQ(32767, samples[1]);
    EXPECT_EQ(-32767, samples[2]);
    EXPECT_EQ(0, samples[3]);
}

TEST(Pcm16FrameDecoder, RejectsWrongFrameLength) {
    Pcm16FrameDecoder decoder;
    std::vector<int16_t> samples;
    EXPECT_FALSE(decoder.decode(Bytes("odd"), samples));
    EXPECT_FALSE(decoder.decode(Bytes(), samples));
    EXPECT_EQ(Stream::SAMPLES_PER_FRAME, decoder.samplesPerFrame());
    EXPECT_EQ(Stream::SAMPLE_RATE, decoder.sampleRate());
}

TEST(FrameDecoderFactory, CreatesPcmByName) {
    std::unique_ptr<IFrameDecoder> decoder = FrameDecoderFactory::create("PCM16", 8000);
    ASSERT_NE(nullptr, decoder);
    EXPECT_EQ("pcm16", decoder->name());
    EXPECT_EQ(8000u, decoder->sampleRate());
    EXPECT_EQ(160u, decoder->samplesPerFrame());

    EXPECT_TRUE(FrameDecoderFactory::isSupported("pcm"));
}

TEST(FrameDecoderFactory, UnknownCodecIsRejected) {
    EXPECT_EQ(nullptr, FrameDecoderFactory::create("mp3"));
    EXPECT_FALSE(FrameDecoderFactory::isSupported("mp3"));
}

#ifdef TAPIR_HAVE_OPUS
TEST(FrameDecoderFactory, CreatesOpus) {
    std::unique_ptr<IFrameDecoder> decoder = FrameDecoderFactory::create("opus");
    ASSERT_NE(nullptr, decoder);
    EXPECT_EQ("opus", decoder->name());

    // Garbage is a decode failure, not a crash
    std::vector<int16_t> samples;
    const uint8_t junk[] = {0xFF, 0xFF, 0xFF};
    decoder->decode(Bytes(junk, sizeof(junk)), samples);
    decoder->reset();
}
#endif

TEST(WavWriter, HeaderDescribesMono16Bit) {
    std::vector<int16_t> samples = {1, -2, 3};
    Bytes wav = WavWriter::encode(samples, 16000);

    ASSERT_EQ(WavWriter::HEADER_SIZE + 6, wav.size());
    EXPECT_EQ("RIFF", wav.mid(0, 4).toString());
    EXPECT_EQ(36u + 6u, readLE32(wav, 4));
    EXPECT_EQ("WAVE", wav.mid(8, 4).toString());
    EXPECT_EQ("fmt ", wav.mid(12, 4).toString());
    EXPECT_EQ(16u, readLE32(wav, 16));
    EXPECT_EQ(1, readLE16(wav, 20));            // PCM
    EXPECT_EQ(1, readLE16(wav, 22));            // mono
    EXPECT_EQ(16000u, readLE32(wav, 24));
    EXPECT_EQ(32000u, readLE32(wav, 28));
    EXPECT_EQ(2, readLE16(wav, 32));
    EXPECT_EQ(16, readLE16(wav, 34));
    EXPECT_EQ("data", wav.mid(36, 4).toString());
    EXPECT_EQ(6u, readLE32(wav, 40));
    EXPECT_EQ(0xFFFE, readLE16(wav, 46));
}

TEST(WavWriter, WritesFile) {
    std::string path = ::testing::TempDir() + "tapir_clip.wav";
    std::vector<int16_t> samples(320, 7);
    ASSERT_TRUE(WavWriter::write(path, samples));

    std::ifstream file(path, std::ios::binary);
    std::vector<char> contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(WavWriter::HEADER_SIZE + 640, contents.size());
    std::remove(path.c_str());
}

TEST(WavWriter, UnwritablePathFails) {
    EXPECT_FALSE(WavWriter::write("/nonexistent-dir/clip.wav", std::vector<int16_t>(1, 0)));
}
