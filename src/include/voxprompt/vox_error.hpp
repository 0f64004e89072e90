#pragma once

#include <string>
#include <utility>

namespace voxprompt {

enum class ErrorCode {
	NONE = 0,
	// capture
	DEVICE_NOT_FOUND,
	NO_DEFAULT_DEVICE,
	STREAM_ERROR,
	// signal processing
	RESAMPLE_ERROR,
	AUDIO_DECODE_ERROR,
	// models on disk
	DOWNLOAD_FAILED,
	INTEGRITY_ERROR,
	UNKNOWN_MODEL,
	INVALID_MODEL_FILENAME,
	MODEL_NOT_DOWNLOADED,
	NOT_DOWNLOADED,
	IO_ERROR,
	// inference
	FILE_NOT_FOUND,
	LOAD_ERROR,
	NOT_LOADED,
	GENERATION_ERROR,
	TRANSCRIPTION_ERROR,
	BUSY,
	// pipeline
	NO_AUDIO_CAPTURED,
	NO_SPEECH_DETECTED
};

const char *ErrorCodeToString(ErrorCode code);

// Error carried through the out-parameter of core operations. The message is
// always a complete, human-readable sentence.
struct VoxError {
	ErrorCode code;
	std::string message;

	VoxError() : code(ErrorCode::NONE) {
	}
	VoxError(ErrorCode code_p, std::string message_p) : code(code_p), message(std::move(message_p)) {
	}

	bool HasError() const {
		return code != ErrorCode::NONE;
	}

	void Set(ErrorCode code_p, const std::string &message_p) {
		code = code_p;
		message = message_p;
	}

	void Clear() {
		code = ErrorCode::NONE;
		message.clear();
	}

	std::string ToString() const;
};

} // namespace voxprompt
