#include "voxprompt/sdl_audio_backend.hpp"
#include "voxprompt/logger.hpp"

#include <SDL.h>

#include <mutex>

namespace voxprompt {

static std::mutex sdl_init_mutex;

static constexpr int FALLBACK_SAMPLE_RATE = 44100;
static constexpr Uint16 CALLBACK_FRAMES = 1024;

// ============================================================================
// SdlAudioInputStream
// ============================================================================

class SdlAudioInputStream : public AudioInputStream {
public:
	SdlAudioInputStream(std::string device_name, AudioDataCallback callback)
	    : device_name_(std::move(device_name)), callback_(std::move(callback)), device_id_(0), sample_rate_(0),
	      channels_(0) {
	}

	~SdlAudioInputStream() override {
		Close();
	}

	bool Open(int preferred_rate, int preferred_channels, VoxError &error) {
		SDL_AudioSpec desired, obtained;
		SDL_zero(desired);
		SDL_zero(obtained);
		desired.freq = preferred_rate > 0 ? preferred_rate : FALLBACK_SAMPLE_RATE;
		desired.format = AUDIO_F32SYS;
		desired.channels = static_cast<Uint8>(preferred_channels > 0 ? preferred_channels : 1);
		desired.samples = CALLBACK_FRAMES;
		desired.callback = AudioCallback;
		desired.userdata = this;

		const char *name = device_name_.empty() ? nullptr : device_name_.c_str();
		SDL_AudioDeviceID dev = SDL_OpenAudioDevice(name, 1, &desired, &obtained,
		                                            SDL_AUDIO_ALLOW_FREQUENCY_CHANGE | SDL_AUDIO_ALLOW_CHANNELS_CHANGE);
		if (dev == 0) {
			error.Set(ErrorCode::STREAM_ERROR, std::string("Failed to open audio device: ") + SDL_GetError());
			return false;
		}

		device_id_ = dev;
		sample_rate_ = static_cast<uint32_t>(obtained.freq);
		channels_ = obtained.channels;
		return true;
	}

	bool Start(VoxError &error) override {
		if (device_id_ == 0) {
			error.Set(ErrorCode::STREAM_ERROR, "Audio stream is not open");
			return false;
		}
		SDL_PauseAudioDevice(device_id_, 0);
		if (SDL_GetAudioDeviceStatus(device_id_) != SDL_AUDIO_PLAYING) {
			error.Set(ErrorCode::STREAM_ERROR, std::string("Failed to start audio stream: ") + SDL_GetError());
			return false;
		}
		return true;
	}

	void Close() override {
		if (device_id_ != 0) {
			// Blocks until a running callback has returned
			SDL_PauseAudioDevice(device_id_, 1);
			SDL_CloseAudioDevice(device_id_);
			device_id_ = 0;
		}
	}

	uint32_t GetSampleRate() const override {
		return sample_rate_;
	}
	uint16_t GetChannelCount() const override {
		return channels_;
	}
	const std::string &GetDeviceName() const override {
		return device_name_;
	}

private:
	static void AudioCallback(void *userdata, Uint8 *stream, int len) {
		auto *self = static_cast<SdlAudioInputStream *>(userdata);
		if (!self || self->channels_ == 0 || len <= 0) {
			return;
		}
		size_t frame_count = static_cast<size_t>(len) / (sizeof(float) * self->channels_);
		self->callback_(reinterpret_cast<const float *>(stream), frame_count, self->channels_);
	}

	std::string device_name_;
	AudioDataCallback callback_;
	SDL_AudioDeviceID device_id_;
	uint32_t sample_rate_;
	uint16_t channels_;
};

// ============================================================================
// SdlAudioBackend
// ============================================================================

SdlAudioBackend::SdlAudioBackend() : sdl_initialized_(false) {
}

SdlAudioBackend::~SdlAudioBackend() {
	std::lock_guard<std::mutex> lock(sdl_init_mutex);
	if (sdl_initialized_) {
		SDL_QuitSubSystem(SDL_INIT_AUDIO);
		sdl_initialized_ = false;
	}
}

bool SdlAudioBackend::EnsureInitialized(std::string &error) {
	if (!sdl_initialized_) {
		if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
			error = std::string("Failed to initialize SDL audio: ") + SDL_GetError();
			return false;
		}
		sdl_initialized_ = true;
	}
	return true;
}

static std::string GetDefaultCaptureName(SDL_AudioSpec *spec) {
	std::string result;
#if SDL_VERSION_ATLEAST(2, 24, 0)
	char *name = nullptr;
	SDL_AudioSpec default_spec;
	SDL_zero(default_spec);
	if (SDL_GetDefaultAudioInfo(&name, &default_spec, 1) == 0) {
		if (name) {
			result = name;
			SDL_free(name);
		}
		if (spec) {
			*spec = default_spec;
		}
	}
#else
	(void)spec;
#endif
	return result;
}

std::vector<AudioDevice> SdlAudioBackend::ListDevices() {
	std::lock_guard<std::mutex> lock(sdl_init_mutex);

	std::vector<AudioDevice> devices;
	std::string error;
	if (!EnsureInitialized(error)) {
		VOXPROMPT_LOG_WARNING("capture", error);
		return devices;
	}

	std::string default_name = GetDefaultCaptureName(nullptr);
	int count = SDL_GetNumAudioDevices(1); // 1 = capture devices
	for (int i = 0; i < count; i++) {
		const char *name = SDL_GetAudioDeviceName(i, 1);
		if (!name) {
			continue;
		}
		AudioDevice dev;
		dev.name = name;
		// Without a reported default, SDL opens the first device
		dev.is_default = default_name.empty() ? (i == 0) : (dev.name == default_name);
		devices.push_back(dev);
	}
	return devices;
}

std::unique_ptr<AudioInputStream> SdlAudioBackend::OpenStream(const std::string &device_name,
                                                              AudioDataCallback callback, VoxError &error) {
	std::lock_guard<std::mutex> lock(sdl_init_mutex);

	std::string init_error;
	if (!EnsureInitialized(init_error)) {
		error.Set(ErrorCode::STREAM_ERROR, init_error);
		return nullptr;
	}

	int count = SDL_GetNumAudioDevices(1);
	int preferred_rate = 0;
	int preferred_channels = 0;

	if (device_name.empty()) {
		if (count <= 0) {
			error.Set(ErrorCode::NO_DEFAULT_DEVICE, "No default input device available");
			return nullptr;
		}
		SDL_AudioSpec spec;
		SDL_zero(spec);
		GetDefaultCaptureName(&spec);
		preferred_rate = spec.freq;
		preferred_channels = spec.channels;
	} else {
		int index = -1;
		for (int i = 0; i < count; i++) {
			const char *name = SDL_GetAudioDeviceName(i, 1);
			if (name && device_name == name) {
				index = i;
				break;
			}
		}
		if (index < 0) {
			error.Set(ErrorCode::DEVICE_NOT_FOUND, "Input device '" + device_name + "' not found");
			return nullptr;
		}
#if SDL_VERSION_ATLEAST(2, 0, 16)
		SDL_AudioSpec spec;
		SDL_zero(spec);
		if (SDL_GetAudioDeviceSpec(index, 1, &spec) == 0) {
			preferred_rate = spec.freq;
			preferred_channels = spec.channels;
		}
#endif
	}

	auto stream = std::make_unique<SdlAudioInputStream>(device_name, std::move(callback));
	if (!stream->Open(preferred_rate, preferred_channels, error)) {
		return nullptr;
	}
	return std::move(stream);
}

} // namespace voxprompt
