#pragma once

#include "voxprompt/vox_error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxprompt {

// Half-open sample range [offset, offset + length) inside a buffer
struct SampleSpan {
	size_t offset;
	size_t length;
};

// Stateless signal conditioning for 32-bit float mono audio
class SignalProcessor {
public:
	static constexpr uint32_t TARGET_SAMPLE_RATE = 16000;
	static constexpr size_t RESAMPLE_BLOCK_SIZE = 1024;

	// VAD framing: 480 samples = 30ms at 16kHz
	static constexpr size_t VAD_FRAME_SIZE = 480;
	static constexpr float VAD_ENERGY_THRESHOLD = 0.005f;
	static constexpr size_t VAD_MIN_SPEECH_FRAMES = 10;
	static constexpr size_t VAD_PADDING_FRAMES = 2;

	static constexpr size_t BAND_COUNT = 8;
	static constexpr size_t SPECTRUM_MIN_SAMPLES = 64;
	static constexpr size_t SPECTRUM_MAX_WINDOW = 1024;
	static constexpr float SPECTRUM_GAIN = 10.0f;

	using BandLevels = std::array<float, BAND_COUNT>;

	// Convert to 16kHz. Identity copy when the source already is 16kHz.
	static bool Resample(const std::vector<float> &samples, uint32_t source_rate, std::vector<float> &output,
	                     VoxError &error);

	// Locate the speech region. Returns the whole input when no speech frame
	// exists or the speech span is shorter than VAD_MIN_SPEECH_FRAMES.
	static SampleSpan TrimSilence(const std::vector<float> &samples);
	static std::vector<float> TrimSilenceCopy(const std::vector<float> &samples);

	static bool HasSpeech(const std::vector<float> &samples);

	// Eight visualization levels in [0, 1] computed over the most recent
	// window of the buffer
	static BandLevels SpectralBands(const std::vector<float> &samples);

	// RMS and peak magnitude of a buffer
	static void ComputeLevels(const float *samples, size_t count, float &rms, float &peak);
};

} // namespace voxprompt
