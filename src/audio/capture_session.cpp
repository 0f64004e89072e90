#include "voxprompt/capture_session.hpp"
#include "voxprompt/logger.hpp"

#include <algorithm>
#include <cstdio>

namespace voxprompt {

constexpr uint32_t CaptureSession::DEFAULT_SAMPLE_RATE;

static constexpr size_t INITIAL_SCRATCH_FRAMES = 4096;

CaptureSession::CaptureSession(std::shared_ptr<AudioInputBackend> backend)
    : backend_(std::move(backend)), recording_(false), sample_rate_(DEFAULT_SAMPLE_RATE), channels_(0),
      last_rms_(0.0f), last_peak_(0.0f), sample_count_(0), active_rate_(DEFAULT_SAMPLE_RATE) {
	controller_ = std::thread(&CaptureSession::ControllerLoop, this);
}

CaptureSession::~CaptureSession() {
	auto command = std::make_unique<Command>();
	command->type = CommandType::SHUTDOWN;
	Post(std::move(command));
	if (controller_.joinable()) {
		controller_.join();
	}
}

void CaptureSession::Post(std::unique_ptr<Command> command) {
	{
		std::lock_guard<std::mutex> lock(command_mutex_);
		commands_.push_back(std::move(command));
	}
	command_cv_.notify_one();
}

bool CaptureSession::Start(const std::string &device_name, LevelCallback level_callback, VoxError &error) {
	auto command = std::make_unique<Command>();
	command->type = CommandType::START;
	command->device_name = device_name;
	command->level_callback = std::move(level_callback);
	auto reply = command->start_reply.get_future();
	Post(std::move(command));

	VoxError result = reply.get();
	if (result.HasError()) {
		error = result;
		return false;
	}
	return true;
}

CapturedAudio CaptureSession::Stop() {
	auto command = std::make_unique<Command>();
	command->type = CommandType::STOP;
	auto reply = command->stop_reply.get_future();
	Post(std::move(command));
	return reply.get();
}

CaptureLevels CaptureSession::GetLevels() const {
	CaptureLevels levels;
	levels.rms = last_rms_.load(std::memory_order_relaxed);
	levels.peak = last_peak_.load(std::memory_order_relaxed);
	levels.sample_count = sample_count_.load(std::memory_order_relaxed);
	levels.sample_rate = active_rate_.load(std::memory_order_relaxed);
	return levels;
}

SignalProcessor::BandLevels CaptureSession::GetBandLevels() const {
	std::vector<float> tail;
	{
		std::lock_guard<std::mutex> lock(buffer_mutex_);
		size_t count = std::min(buffer_.size(), SignalProcessor::SPECTRUM_MAX_WINDOW);
		tail.assign(buffer_.end() - static_cast<std::ptrdiff_t>(count), buffer_.end());
	}
	return SignalProcessor::SpectralBands(tail);
}

std::vector<AudioDevice> CaptureSession::ListDevices() {
	return backend_->ListDevices();
}

// ============================================================================
// Controller thread
// ============================================================================

void CaptureSession::ControllerLoop() {
	while (true) {
		std::unique_ptr<Command> command;
		{
			std::unique_lock<std::mutex> lock(command_mutex_);
			command_cv_.wait(lock, [this]() { return !commands_.empty(); });
			command = std::move(commands_.front());
			commands_.pop_front();
		}

		switch (command->type) {
		case CommandType::START:
			command->start_reply.set_value(HandleStart(command->device_name, std::move(command->level_callback)));
			break;
		case CommandType::STOP:
			command->stop_reply.set_value(HandleStop());
			break;
		case CommandType::SHUTDOWN:
			if (recording_.load()) {
				HandleStop();
			}
			return;
		}
	}
}

VoxError CaptureSession::HandleStart(const std::string &device_name, LevelCallback level_callback) {
	VoxError error;
	if (recording_.load(std::memory_order_acquire)) {
		return error;
	}

	auto context = std::make_unique<StreamContext>();
	context->level_callback = std::move(level_callback);
	context->mono_scratch.resize(INITIAL_SCRATCH_FRAMES);
	StreamContext *context_ptr = context.get();

	{
		std::lock_guard<std::mutex> lock(buffer_mutex_);
		buffer_.clear();
	}
	sample_count_.store(0);
	last_rms_.store(0.0f);
	last_peak_.store(0.0f);

	auto stream = backend_->OpenStream(
	    device_name,
	    [this, context_ptr](const float *interleaved, size_t frame_count, uint16_t channels) {
		    OnAudio(*context_ptr, interleaved, frame_count, channels);
	    },
	    error);
	if (!stream) {
		if (!error.HasError()) {
			error.Set(ErrorCode::STREAM_ERROR, "Failed to open input stream");
		}
		VOXPROMPT_LOG_ERROR("capture", error.ToString());
		return error;
	}

	if (!stream->Start(error)) {
		stream->Close();
		VOXPROMPT_LOG_ERROR("capture", error.ToString());
		return error;
	}

	sample_rate_ = stream->GetSampleRate();
	channels_ = stream->GetChannelCount();
	active_rate_.store(sample_rate_);
	stream_ = std::move(stream);
	stream_context_ = std::move(context);
	recording_.store(true, std::memory_order_release);

	VOXPROMPT_LOG_INFO("capture", "Recording started (" + std::to_string(sample_rate_) + "Hz, " +
	                                  std::to_string(channels_) + "ch)");
	return error;
}

CapturedAudio CaptureSession::HandleStop() {
	CapturedAudio captured;
	captured.sample_rate = DEFAULT_SAMPLE_RATE;
	captured.channels = 0;

	if (!recording_.load(std::memory_order_acquire)) {
		return captured;
	}
	recording_.store(false, std::memory_order_release);

	// After Close() returns the backend guarantees no further callbacks
	if (stream_) {
		stream_->Close();
		stream_.reset();
	}
	stream_context_.reset();

	{
		std::lock_guard<std::mutex> lock(buffer_mutex_);
		captured.samples.swap(buffer_);
	}
	captured.sample_rate = sample_rate_;
	captured.channels = channels_;

	sample_count_.store(0);
	last_rms_.store(0.0f);
	last_peak_.store(0.0f);

	char duration[32];
	snprintf(duration, sizeof(duration), "%.2f",
	         sample_rate_ > 0 ? static_cast<double>(captured.samples.size()) / sample_rate_ : 0.0);
	VOXPROMPT_LOG_INFO("capture", "Recording stopped: " + std::to_string(captured.samples.size()) + " samples at " +
	                                  std::to_string(sample_rate_) + "Hz (" + duration + "s)");
	return captured;
}

// ============================================================================
// Audio thread
// ============================================================================

void CaptureSession::OnAudio(StreamContext &context, const float *interleaved, size_t frame_count,
                             uint16_t channels) {
	if (!interleaved || frame_count == 0 || channels == 0) {
		return;
	}

	auto &mono = context.mono_scratch;
	if (mono.size() < frame_count) {
		mono.resize(frame_count);
	}
	if (channels == 1) {
		std::copy(interleaved, interleaved + frame_count, mono.begin());
	} else {
		for (size_t frame = 0; frame < frame_count; frame++) {
			float sum = 0.0f;
			const float *in = interleaved + frame * channels;
			for (uint16_t ch = 0; ch < channels; ch++) {
				sum += in[ch];
			}
			mono[frame] = sum / static_cast<float>(channels);
		}
	}

	float rms = 0.0f;
	float peak = 0.0f;
	SignalProcessor::ComputeLevels(mono.data(), frame_count, rms, peak);
	last_rms_.store(rms, std::memory_order_relaxed);
	last_peak_.store(peak, std::memory_order_relaxed);

	if (context.level_callback) {
		context.level_callback(rms, peak);
	}

	{
		std::lock_guard<std::mutex> lock(buffer_mutex_);
		buffer_.insert(buffer_.end(), mono.begin(), mono.begin() + static_cast<std::ptrdiff_t>(frame_count));
	}
	sample_count_.fetch_add(frame_count, std::memory_order_relaxed);
}

} // namespace voxprompt
