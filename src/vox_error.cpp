#include "voxprompt/vox_error.hpp"

namespace voxprompt {

const char *ErrorCodeToString(ErrorCode code) {
	switch (code) {
	case ErrorCode::NONE:
		return "None";
	case ErrorCode::DEVICE_NOT_FOUND:
		return "DeviceNotFound";
	case ErrorCode::NO_DEFAULT_DEVICE:
		return "NoDefaultDevice";
	case ErrorCode::STREAM_ERROR:
		return "StreamError";
	case ErrorCode::RESAMPLE_ERROR:
		return "ResampleError";
	case ErrorCode::AUDIO_DECODE_ERROR:
		return "AudioDecodeError";
	case ErrorCode::DOWNLOAD_FAILED:
		return "DownloadFailed";
	case ErrorCode::INTEGRITY_ERROR:
		return "IntegrityError";
	case ErrorCode::UNKNOWN_MODEL:
		return "UnknownModel";
	case ErrorCode::INVALID_MODEL_FILENAME:
		return "InvalidModelFilename";
	case ErrorCode::MODEL_NOT_DOWNLOADED:
		return "ModelNotDownloaded";
	case ErrorCode::NOT_DOWNLOADED:
		return "NotDownloaded";
	case ErrorCode::IO_ERROR:
		return "IOError";
	case ErrorCode::FILE_NOT_FOUND:
		return "FileNotFound";
	case ErrorCode::LOAD_ERROR:
		return "LoadError";
	case ErrorCode::NOT_LOADED:
		return "NotLoaded";
	case ErrorCode::GENERATION_ERROR:
		return "GenerationError";
	case ErrorCode::TRANSCRIPTION_ERROR:
		return "TranscriptionError";
	case ErrorCode::BUSY:
		return "Busy";
	case ErrorCode::NO_AUDIO_CAPTURED:
		return "NoAudioCaptured";
	case ErrorCode::NO_SPEECH_DETECTED:
		return "NoSpeechDetected";
	default:
		return "Unknown";
	}
}

std::string VoxError::ToString() const {
	if (!HasError()) {
		return "";
	}
	if (message.empty()) {
		return ErrorCodeToString(code);
	}
	return message;
}

} // namespace voxprompt
