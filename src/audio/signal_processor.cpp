#include "voxprompt/signal_processor.hpp"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/tx.h>
#include <libswresample/swresample.h>
}

#include <algorithm>
#include <cmath>
#include <memory>

namespace voxprompt {

constexpr uint32_t SignalProcessor::TARGET_SAMPLE_RATE;
constexpr size_t SignalProcessor::RESAMPLE_BLOCK_SIZE;
constexpr size_t SignalProcessor::VAD_FRAME_SIZE;
constexpr float SignalProcessor::VAD_ENERGY_THRESHOLD;
constexpr size_t SignalProcessor::VAD_MIN_SPEECH_FRAMES;
constexpr size_t SignalProcessor::VAD_PADDING_FRAMES;
constexpr size_t SignalProcessor::BAND_COUNT;
constexpr size_t SignalProcessor::SPECTRUM_MIN_SAMPLES;
constexpr size_t SignalProcessor::SPECTRUM_MAX_WINDOW;
constexpr float SignalProcessor::SPECTRUM_GAIN;

static std::string AvErrorString(int errnum) {
	char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
	av_strerror(errnum, buf, sizeof(buf));
	return buf;
}

struct SwrContextDeleter {
	void operator()(SwrContext *ctx) const {
		swr_free(&ctx);
	}
};
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;

// ============================================================================
// Resampling
// ============================================================================

// Push one block through the resampler and append what comes out
static bool ConvertBlock(SwrContext *swr, const float *input, int input_frames, std::vector<float> &output,
                         VoxError &error) {
	int capacity = swr_get_out_samples(swr, input_frames);
	if (capacity < 0) {
		error.Set(ErrorCode::RESAMPLE_ERROR, "Resampler failed: " + AvErrorString(capacity));
		return false;
	}
	if (capacity == 0) {
		return true;
	}
	std::vector<float> buffer(static_cast<size_t>(capacity));
	uint8_t *out_buf = reinterpret_cast<uint8_t *>(buffer.data());
	const uint8_t *in_buf = reinterpret_cast<const uint8_t *>(input);

	int converted = swr_convert(swr, &out_buf, capacity, input ? &in_buf : nullptr, input_frames);
	if (converted < 0) {
		error.Set(ErrorCode::RESAMPLE_ERROR, "Resampler failed: " + AvErrorString(converted));
		return false;
	}
	output.insert(output.end(), buffer.begin(), buffer.begin() + converted);
	return true;
}

bool SignalProcessor::Resample(const std::vector<float> &samples, uint32_t source_rate, std::vector<float> &output,
                               VoxError &error) {
	if (source_rate == TARGET_SAMPLE_RATE) {
		output = samples;
		return true;
	}
	if (source_rate == 0 || source_rate > static_cast<uint32_t>(INT32_MAX)) {
		error.Set(ErrorCode::RESAMPLE_ERROR,
		          "Cannot create resampler for " + std::to_string(source_rate) + "Hz -> 16000Hz");
		return false;
	}

	AVChannelLayout mono = AV_CHANNEL_LAYOUT_MONO;
	SwrContext *raw_ctx = nullptr;
	int ret = swr_alloc_set_opts2(&raw_ctx, &mono, AV_SAMPLE_FMT_FLT, TARGET_SAMPLE_RATE, &mono, AV_SAMPLE_FMT_FLT,
	                              static_cast<int>(source_rate), 0, nullptr);
	SwrContextPtr swr(raw_ctx);
	if (ret < 0 || !swr) {
		error.Set(ErrorCode::RESAMPLE_ERROR, "Cannot create resampler for " + std::to_string(source_rate) +
		                                         "Hz -> 16000Hz: " + AvErrorString(ret));
		return false;
	}
	ret = swr_init(swr.get());
	if (ret < 0) {
		error.Set(ErrorCode::RESAMPLE_ERROR, "Cannot initialize resampler for " + std::to_string(source_rate) +
		                                         "Hz -> 16000Hz: " + AvErrorString(ret));
		return false;
	}

	output.clear();
	output.reserve(static_cast<size_t>(
	    static_cast<double>(samples.size()) * TARGET_SAMPLE_RATE / static_cast<double>(source_rate) + 1));

	const size_t block = RESAMPLE_BLOCK_SIZE;
	const size_t full_blocks = samples.size() / block;
	const size_t remainder = samples.size() % block;

	for (size_t i = 0; i < full_blocks; i++) {
		if (!ConvertBlock(swr.get(), samples.data() + i * block, static_cast<int>(block), output, error)) {
			return false;
		}
	}

	if (remainder > 0) {
		// Last partial block: zero-pad, drain the filter, then keep only the
		// samples that correspond to real input
		std::vector<float> padded(block, 0.0f);
		std::copy(samples.begin() + full_blocks * block, samples.end(), padded.begin());

		std::vector<float> tail;
		if (!ConvertBlock(swr.get(), padded.data(), static_cast<int>(block), tail, error)) {
			return false;
		}
		while (swr_get_delay(swr.get(), TARGET_SAMPLE_RATE) > 0) {
			size_t before = tail.size();
			if (!ConvertBlock(swr.get(), nullptr, 0, tail, error)) {
				return false;
			}
			if (tail.size() == before) {
				break;
			}
		}

		auto expected = static_cast<size_t>(static_cast<double>(remainder) / static_cast<double>(source_rate) *
		                                    static_cast<double>(TARGET_SAMPLE_RATE));
		tail.resize(std::min(expected, tail.size()));
		output.insert(output.end(), tail.begin(), tail.end());
	} else {
		while (swr_get_delay(swr.get(), TARGET_SAMPLE_RATE) > 0) {
			size_t before = output.size();
			if (!ConvertBlock(swr.get(), nullptr, 0, output, error)) {
				return false;
			}
			if (output.size() == before) {
				break;
			}
		}
	}

	return true;
}

// ============================================================================
// Voice activity
// ============================================================================

static float FrameRms(const float *frame, size_t count) {
	if (count == 0) {
		return 0.0f;
	}
	double sum = 0.0;
	for (size_t i = 0; i < count; i++) {
		sum += static_cast<double>(frame[i]) * frame[i];
	}
	return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

// Energy flag per 480-sample frame; the trailing partial frame counts too
static std::vector<bool> ClassifyFrames(const std::vector<float> &samples) {
	const size_t frame_size = SignalProcessor::VAD_FRAME_SIZE;
	std::vector<bool> speech;
	speech.reserve(samples.size() / frame_size + 1);
	for (size_t offset = 0; offset < samples.size(); offset += frame_size) {
		size_t count = std::min(frame_size, samples.size() - offset);
		speech.push_back(FrameRms(samples.data() + offset, count) > SignalProcessor::VAD_ENERGY_THRESHOLD);
	}
	return speech;
}

SampleSpan SignalProcessor::TrimSilence(const std::vector<float> &samples) {
	SampleSpan whole {0, samples.size()};
	if (samples.empty()) {
		return whole;
	}

	auto frames = ClassifyFrames(samples);
	auto first = std::find(frames.begin(), frames.end(), true);
	if (first == frames.end()) {
		return whole;
	}
	auto last = std::find(frames.rbegin(), frames.rend(), true);

	size_t first_idx = static_cast<size_t>(first - frames.begin());
	size_t last_idx = frames.size() - 1 - static_cast<size_t>(last - frames.rbegin());
	if (last_idx - first_idx < VAD_MIN_SPEECH_FRAMES) {
		return whole;
	}

	size_t start_frame = first_idx >= VAD_PADDING_FRAMES ? first_idx - VAD_PADDING_FRAMES : 0;
	size_t start = start_frame * VAD_FRAME_SIZE;
	size_t end = std::min((last_idx + 1 + VAD_PADDING_FRAMES) * VAD_FRAME_SIZE, samples.size());
	return SampleSpan {start, end - start};
}

std::vector<float> SignalProcessor::TrimSilenceCopy(const std::vector<float> &samples) {
	auto span = TrimSilence(samples);
	return std::vector<float>(samples.begin() + span.offset, samples.begin() + span.offset + span.length);
}

bool SignalProcessor::HasSpeech(const std::vector<float> &samples) {
	auto frames = ClassifyFrames(samples);
	auto speech_frames = static_cast<size_t>(std::count(frames.begin(), frames.end(), true));
	return speech_frames >= VAD_MIN_SPEECH_FRAMES;
}

// ============================================================================
// Spectrum
// ============================================================================

static constexpr double PI = 3.14159265358979323846;

static size_t PreviousPowerOfTwo(size_t value) {
	size_t result = 1;
	while (result * 2 <= value) {
		result *= 2;
	}
	return result;
}

SignalProcessor::BandLevels SignalProcessor::SpectralBands(const std::vector<float> &samples) {
	BandLevels levels;
	levels.fill(0.0f);
	if (samples.size() < SPECTRUM_MIN_SAMPLES) {
		return levels;
	}

	const size_t fft_size = PreviousPowerOfTwo(std::min(SPECTRUM_MAX_WINDOW, samples.size()));
	const size_t half = fft_size / 2;
	const float *window = samples.data() + (samples.size() - fft_size);

	std::vector<AVComplexFloat> in(fft_size);
	std::vector<AVComplexFloat> out(fft_size);
	for (size_t i = 0; i < fft_size; i++) {
		double hann = 0.5 * (1.0 - std::cos(2.0 * PI * static_cast<double>(i) / static_cast<double>(fft_size)));
		in[i].re = static_cast<float>(window[i] * hann);
		in[i].im = 0.0f;
	}

	AVTXContext *tx = nullptr;
	av_tx_fn tx_fn = nullptr;
	float scale = 1.0f;
	if (av_tx_init(&tx, &tx_fn, AV_TX_FLOAT_FFT, 0, static_cast<int>(fft_size), &scale, 0) < 0 || !tx) {
		return levels;
	}
	tx_fn(tx, out.data(), in.data(), sizeof(AVComplexFloat));
	av_tx_uninit(&tx);

	std::vector<float> magnitudes(half);
	for (size_t i = 0; i < half; i++) {
		magnitudes[i] = std::sqrt(out[i].re * out[i].re + out[i].im * out[i].im) / static_cast<float>(half);
	}

	// Quadratic split: low bands cover few bins, high bands many
	for (size_t band = 0; band < BAND_COUNT; band++) {
		double lo = static_cast<double>(band) / BAND_COUNT;
		double hi = static_cast<double>(band + 1) / BAND_COUNT;
		size_t start = static_cast<size_t>(lo * lo * half);
		size_t end = static_cast<size_t>(hi * hi * half);
		end = std::min(std::max(end, start + 1), half);
		if (start >= end) {
			continue;
		}

		float sum = 0.0f;
		for (size_t i = start; i < end; i++) {
			sum += magnitudes[i];
		}
		float level = sum / static_cast<float>(end - start) * SPECTRUM_GAIN;
		if (!(level > 0.0f)) {
			level = 0.0f;
		}
		levels[band] = std::min(level, 1.0f);
	}
	return levels;
}

void SignalProcessor::ComputeLevels(const float *samples, size_t count, float &rms, float &peak) {
	rms = 0.0f;
	peak = 0.0f;
	if (!samples || count == 0) {
		return;
	}
	float sum_squares = 0.0f;
	for (size_t i = 0; i < count; i++) {
		float magnitude = std::fabs(samples[i]);
		if (magnitude > peak) {
			peak = magnitude;
		}
		sum_squares += samples[i] * samples[i];
	}
	rms = std::sqrt(sum_squares / static_cast<float>(count));
}

} // namespace voxprompt
