#pragma once

#include "voxprompt/audio_backend.hpp"
#include "voxprompt/signal_processor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace voxprompt {

// Called on the audio thread for every buffer; must return quickly
using LevelCallback = std::function<void(float rms, float peak)>;

struct CapturedAudio {
	std::vector<float> samples;
	uint32_t sample_rate;
	uint16_t channels;
};

struct CaptureLevels {
	float rms;
	float peak;
	uint64_t sample_count;
	uint32_t sample_rate;
};

// Owns the microphone lifecycle. The stream handle lives on a private
// controller thread; Start/Stop send commands to it and wait for the reply,
// so a Stop racing a Start always observes a fully started (or absent)
// session. The audio thread only appends to the accumulator under a short
// lock and publishes levels through atomics.
class CaptureSession {
public:
	static constexpr uint32_t DEFAULT_SAMPLE_RATE = 44100;

	explicit CaptureSession(std::shared_ptr<AudioInputBackend> backend);
	~CaptureSession();

	CaptureSession(const CaptureSession &) = delete;
	CaptureSession &operator=(const CaptureSession &) = delete;

	// No-op success when already recording. An empty device_name selects the
	// system default input.
	bool Start(const std::string &device_name, LevelCallback level_callback, VoxError &error);

	// Never fails. Returns no samples and DEFAULT_SAMPLE_RATE when idle.
	CapturedAudio Stop();

	bool IsRecording() const {
		return recording_.load(std::memory_order_acquire);
	}

	CaptureLevels GetLevels() const;
	// Spectrum of the most recent audio, computed on a copy of the tail
	SignalProcessor::BandLevels GetBandLevels() const;

	std::vector<AudioDevice> ListDevices();

private:
	enum class CommandType { START, STOP, SHUTDOWN };

	struct Command {
		CommandType type;
		std::string device_name;
		LevelCallback level_callback;
		std::promise<VoxError> start_reply;
		std::promise<CapturedAudio> stop_reply;
	};

	// State touched from the audio thread
	struct StreamContext {
		LevelCallback level_callback;
		std::vector<float> mono_scratch;
	};

	void ControllerLoop();
	void Post(std::unique_ptr<Command> command);
	VoxError HandleStart(const std::string &device_name, LevelCallback level_callback);
	CapturedAudio HandleStop();
	void OnAudio(StreamContext &context, const float *interleaved, size_t frame_count, uint16_t channels);

	std::shared_ptr<AudioInputBackend> backend_;

	// Single source of truth for "a session is logically active"
	std::atomic<bool> recording_;

	// Controller-thread only
	std::unique_ptr<AudioInputStream> stream_;
	std::unique_ptr<StreamContext> stream_context_;
	uint32_t sample_rate_;
	uint16_t channels_;

	// Accumulator, appended by the audio thread
	mutable std::mutex buffer_mutex_;
	std::vector<float> buffer_;

	// Snapshots
	std::atomic<float> last_rms_;
	std::atomic<float> last_peak_;
	std::atomic<uint64_t> sample_count_;
	std::atomic<uint32_t> active_rate_;

	std::mutex command_mutex_;
	std::condition_variable command_cv_;
	std::deque<std::unique_ptr<Command>> commands_;
	std::thread controller_;
};

} // namespace voxprompt
