#pragma once

#include "voxprompt/vox_error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace voxprompt {

class AudioFileLoader {
public:
	// Decode the first audio stream of a file into mono float32 samples at
	// the stream's own sample rate. Resampling is left to SignalProcessor.
	static bool LoadAudioFile(const std::string &file_path, std::vector<float> &output, uint32_t &sample_rate,
	                          VoxError &error);

	// Configure FFmpeg logging (true = AV_LOG_INFO, false = AV_LOG_QUIET)
	static void SetFFmpegLogging(bool enabled);
};

} // namespace voxprompt
