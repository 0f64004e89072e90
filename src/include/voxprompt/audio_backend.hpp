#pragma once

#include "voxprompt/vox_error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voxprompt {

struct AudioDevice {
	std::string name;
	bool is_default;
};

// Receives interleaved float frames on the audio thread
using AudioDataCallback = std::function<void(const float *interleaved, size_t frame_count, uint16_t channels)>;

// An opened capture stream. Destroying or closing it must not return while
// the data callback is still running, and no callback may fire afterwards.
class AudioInputStream {
public:
	virtual ~AudioInputStream() = default;

	virtual bool Start(VoxError &error) = 0;
	virtual void Close() = 0;

	virtual uint32_t GetSampleRate() const = 0;
	virtual uint16_t GetChannelCount() const = 0;
	virtual const std::string &GetDeviceName() const = 0;
};

class AudioInputBackend {
public:
	virtual ~AudioInputBackend() = default;

	virtual std::vector<AudioDevice> ListDevices() = 0;

	// Open (but do not start) a stream at the device's native format.
	// An empty device_name selects the system default input.
	virtual std::unique_ptr<AudioInputStream> OpenStream(const std::string &device_name, AudioDataCallback callback,
	                                                     VoxError &error) = 0;
};

} // namespace voxprompt
