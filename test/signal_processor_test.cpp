#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "test_fakes.hpp"
#include "voxprompt/signal_processor.hpp"

using voxprompt::ErrorCode;
using voxprompt::SignalProcessor;
using voxprompt::VoxError;
using voxprompt::fakes::MakeTone;

namespace {

// silence | tone | silence, all at 16kHz
std::vector<float> SpeechBetweenSilence(size_t lead, size_t speech, size_t tail) {
	std::vector<float> samples(lead, 0.0f);
	auto tone = MakeTone(speech, 16000, 440.0f, 0.5f);
	samples.insert(samples.end(), tone.begin(), tone.end());
	samples.insert(samples.end(), tail, 0.0f);
	return samples;
}

float Rms(const std::vector<float> &samples, size_t begin, size_t end) {
	double sum = 0.0;
	for (size_t i = begin; i < end; i++) {
		sum += samples[i] * samples[i];
	}
	return static_cast<float>(std::sqrt(sum / static_cast<double>(end - begin)));
}

} // namespace

// =============================================================================
// Resample
// =============================================================================

TEST(SignalProcessor, ResampleAtTargetRateIsIdentity) {
	std::vector<float> input = {0.1f, -0.2f, 0.3f, -0.4f};
	std::vector<float> output;
	VoxError error;

	ASSERT_TRUE(SignalProcessor::Resample(input, 16000, output, error));
	EXPECT_EQ(output, input);
	EXPECT_FALSE(error.HasError());
}

TEST(SignalProcessor, ResampleRejectsZeroRate) {
	std::vector<float> input(100, 0.1f);
	std::vector<float> output;
	VoxError error;

	EXPECT_FALSE(SignalProcessor::Resample(input, 0, output, error));
	EXPECT_EQ(error.code, ErrorCode::RESAMPLE_ERROR);
}

TEST(SignalProcessor, ResampleDownFrom48kKeepsDuration) {
	auto input = MakeTone(48000, 48000, 440.0f, 0.5f);
	std::vector<float> output;
	VoxError error;

	ASSERT_TRUE(SignalProcessor::Resample(input, 48000, output, error));
	EXPECT_NEAR(static_cast<double>(output.size()), 16000.0, 64.0);

	// Amplitude survives the conversion
	float expected = 0.5f / std::sqrt(2.0f);
	EXPECT_NEAR(Rms(output, 4000, 12000), expected, expected * 0.05f);
}

TEST(SignalProcessor, ResampleUpFrom8kKeepsDuration) {
	auto input = MakeTone(8000 + 300, 8000, 200.0f, 0.3f);
	std::vector<float> output;
	VoxError error;

	ASSERT_TRUE(SignalProcessor::Resample(input, 8000, output, error));
	EXPECT_NEAR(static_cast<double>(output.size()), 16600.0, 64.0);
}

TEST(SignalProcessor, ResampleEmptyInput) {
	std::vector<float> input;
	std::vector<float> output = {1.0f};
	VoxError error;

	ASSERT_TRUE(SignalProcessor::Resample(input, 44100, output, error));
	EXPECT_TRUE(output.empty());
}

// =============================================================================
// TrimSilence / HasSpeech
// =============================================================================

TEST(SignalProcessor, TrimSilenceKeepsSpeechWithPadding) {
	auto samples = SpeechBetweenSilence(16000, 8000, 16000);

	auto span = SignalProcessor::TrimSilence(samples);

	// First speech frame is 33, last is 49, two frames of padding on each side
	EXPECT_EQ(span.offset, 31u * 480u);
	EXPECT_EQ(span.length, (52u - 31u) * 480u);
	EXPECT_TRUE(SignalProcessor::HasSpeech(samples));

	auto trimmed = SignalProcessor::TrimSilenceCopy(samples);
	EXPECT_EQ(trimmed.size(), span.length);
}

TEST(SignalProcessor, TrimSilenceReturnsSilenceUnchanged) {
	std::vector<float> silence(32000, 0.0f);

	auto span = SignalProcessor::TrimSilence(silence);

	EXPECT_EQ(span.offset, 0u);
	EXPECT_EQ(span.length, silence.size());
	EXPECT_FALSE(SignalProcessor::HasSpeech(silence));
	EXPECT_EQ(SignalProcessor::TrimSilenceCopy(silence).size(), silence.size());
}

TEST(SignalProcessor, ShortBurstIsNotSpeech) {
	// Five frames of signal is below the ten-frame minimum
	auto samples = SpeechBetweenSilence(4800, 5 * 480, 4800);

	auto span = SignalProcessor::TrimSilence(samples);

	EXPECT_EQ(span.offset, 0u);
	EXPECT_EQ(span.length, samples.size());
	EXPECT_FALSE(SignalProcessor::HasSpeech(samples));
}

TEST(SignalProcessor, TrimSilenceEmptyInput) {
	std::vector<float> empty;
	auto span = SignalProcessor::TrimSilence(empty);
	EXPECT_EQ(span.offset, 0u);
	EXPECT_EQ(span.length, 0u);
	EXPECT_FALSE(SignalProcessor::HasSpeech(empty));
}

TEST(SignalProcessor, TrimSilenceSpeechAtStartIsNotPaddedBeforeZero) {
	auto samples = SpeechBetweenSilence(0, 16000, 9600);

	auto span = SignalProcessor::TrimSilence(samples);

	EXPECT_EQ(span.offset, 0u);
	EXPECT_LT(span.length, samples.size());
}

// =============================================================================
// SpectralBands / ComputeLevels
// =============================================================================

TEST(SignalProcessor, SpectralBandsNeedMinimumSamples) {
	auto samples = MakeTone(63, 16000, 440.0f, 0.9f);
	auto bands = SignalProcessor::SpectralBands(samples);
	for (float level : bands) {
		EXPECT_EQ(level, 0.0f);
	}
}

TEST(SignalProcessor, SpectralBandsSilenceIsZero) {
	std::vector<float> silence(2048, 0.0f);
	auto bands = SignalProcessor::SpectralBands(silence);
	for (float level : bands) {
		EXPECT_EQ(level, 0.0f);
	}
}

TEST(SignalProcessor, SpectralBandsLowToneLandsInLowBand) {
	auto samples = MakeTone(4096, 16000, 200.0f, 0.8f);

	auto bands = SignalProcessor::SpectralBands(samples);

	ASSERT_EQ(bands.size(), 8u);
	for (float level : bands) {
		EXPECT_GE(level, 0.0f);
		EXPECT_LE(level, 1.0f);
	}
	EXPECT_GT(bands[1], 0.0f);
	EXPECT_GT(bands[1], bands[7]);
}

TEST(SignalProcessor, SpectralBandsClampLoudInput) {
	// Full-scale square wave saturates several bands
	std::vector<float> samples(1024);
	for (size_t i = 0; i < samples.size(); i++) {
		samples[i] = (i / 8) % 2 == 0 ? 1.0f : -1.0f;
	}
	auto bands = SignalProcessor::SpectralBands(samples);
	for (float level : bands) {
		EXPECT_LE(level, 1.0f);
	}
}

TEST(SignalProcessor, ComputeLevels) {
	std::vector<float> samples = {0.5f, -1.0f, 0.0f};
	float rms = 0.0f;
	float peak = 0.0f;

	SignalProcessor::ComputeLevels(samples.data(), samples.size(), rms, peak);

	EXPECT_FLOAT_EQ(peak, 1.0f);
	EXPECT_NEAR(rms, std::sqrt(1.25f / 3.0f), 1e-6f);

	SignalProcessor::ComputeLevels(nullptr, 0, rms, peak);
	EXPECT_EQ(rms, 0.0f);
	EXPECT_EQ(peak, 0.0f);
}
