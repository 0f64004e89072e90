#pragma once

#include "voxprompt/audio_backend.hpp"

namespace voxprompt {

// SDL2 capture backend. SDL is initialised lazily on first use.
class SdlAudioBackend : public AudioInputBackend {
public:
	SdlAudioBackend();
	~SdlAudioBackend() override;

	std::vector<AudioDevice> ListDevices() override;
	std::unique_ptr<AudioInputStream> OpenStream(const std::string &device_name, AudioDataCallback callback,
	                                             VoxError &error) override;

private:
	bool EnsureInitialized(std::string &error);

	bool sdl_initialized_;
};

} // namespace voxprompt
