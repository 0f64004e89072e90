#include "voxprompt/result_json.hpp"

#include <cmath>
#include <iomanip>

namespace voxprompt {

std::string EscapeJsonString(const std::string &str) {
	std::ostringstream escaped;
	for (char c : str) {
		switch (c) {
		case '"':
			escaped << "\\\"";
			break;
		case '\\':
			escaped << "\\\\";
			break;
		case '\b':
			escaped << "\\b";
			break;
		case '\f':
			escaped << "\\f";
			break;
		case '\n':
			escaped << "\\n";
			break;
		case '\r':
			escaped << "\\r";
			break;
		case '\t':
			escaped << "\\t";
			break;
		default:
			if (static_cast<unsigned char>(c) < 0x20) {
				// Control character - encode as \u00XX
				escaped << "\\u00" << std::hex << ((c >> 4) & 0xf) << (c & 0xf) << std::dec;
			} else {
				escaped << c;
			}
			break;
		}
	}
	return escaped.str();
}

void JsonObjectWriter::Key(const std::string &key) {
	out_ << (first_ ? "{" : ",") << "\"" << EscapeJsonString(key) << "\":";
	first_ = false;
}

JsonObjectWriter &JsonObjectWriter::String(const std::string &key, const std::string &value) {
	Key(key);
	out_ << "\"" << EscapeJsonString(value) << "\"";
	return *this;
}

JsonObjectWriter &JsonObjectWriter::Number(const std::string &key, double value) {
	Key(key);
	if (std::isfinite(value)) {
		out_ << std::setprecision(6) << value;
	} else {
		out_ << "null";
	}
	return *this;
}

JsonObjectWriter &JsonObjectWriter::Integer(const std::string &key, int64_t value) {
	Key(key);
	out_ << value;
	return *this;
}

JsonObjectWriter &JsonObjectWriter::Bool(const std::string &key, bool value) {
	Key(key);
	out_ << (value ? "true" : "false");
	return *this;
}

JsonObjectWriter &JsonObjectWriter::Null(const std::string &key) {
	Key(key);
	out_ << "null";
	return *this;
}

JsonObjectWriter &JsonObjectWriter::FloatArray(const std::string &key, const float *values, size_t count) {
	Key(key);
	out_ << "[";
	for (size_t i = 0; i < count; i++) {
		if (i > 0) {
			out_ << ",";
		}
		if (std::isfinite(values[i])) {
			out_ << std::setprecision(6) << values[i];
		} else {
			out_ << "0";
		}
	}
	out_ << "]";
	return *this;
}

std::string JsonObjectWriter::Finish() {
	if (first_) {
		out_ << "{";
		first_ = false;
	}
	out_ << "}";
	return out_.str();
}

std::string RenderError(const VoxError &error) {
	return JsonObjectWriter()
	    .String("error", error.message.empty() ? error.ToString() : error.message)
	    .String("code", ErrorCodeToString(error.code))
	    .Finish();
}

std::string RenderPipelineResult(const PipelineResult &result) {
	if (!result.success) {
		return RenderError(result.error);
	}
	JsonObjectWriter json;
	json.String("raw_transcript", result.raw_transcript)
	    .String("optimized_prompt", result.optimized_prompt)
	    .String("mode", result.mode)
	    .String("provider", result.provider)
	    .Number("duration_secs", result.duration_secs)
	    .Bool("degraded", result.degraded);
	if (result.degraded) {
		json.String("degraded_reason", result.degraded_reason);
	}
	if (result.history_id.empty()) {
		json.Null("history_id");
	} else {
		json.String("history_id", result.history_id);
	}
	return json.Finish();
}

std::string RenderTranscriptionResult(const TranscriptionResult &result) {
	if (!result.success) {
		return RenderError(result.error);
	}
	return JsonObjectWriter()
	    .String("text", result.text)
	    .String("language", result.language)
	    .Number("duration_secs", result.duration_secs)
	    .Finish();
}

std::string RenderOptimizationResult(const OptimizationResult &result) {
	JsonObjectWriter json;
	json.String("raw_transcript", result.raw_transcript)
	    .String("optimized_prompt", result.optimized_prompt)
	    .String("mode", result.mode)
	    .String("provider", result.provider)
	    .Bool("degraded", result.degraded);
	if (result.degraded) {
		json.String("degraded_reason", result.degraded_reason);
	}
	return json.Finish();
}

std::string RenderDownloadState(const DownloadState &state) {
	return JsonObjectWriter()
	    .String("model_id", state.model_id)
	    .Integer("bytes_downloaded", static_cast<int64_t>(state.bytes_downloaded))
	    .Integer("bytes_total", static_cast<int64_t>(state.bytes_total))
	    .Number("fraction", state.fraction)
	    .Finish();
}

std::string RenderCaptureSummary(const CapturedAudio &audio) {
	double duration = audio.sample_rate > 0 ? static_cast<double>(audio.samples.size()) / audio.sample_rate : 0.0;
	return JsonObjectWriter()
	    .Integer("sample_count", static_cast<int64_t>(audio.samples.size()))
	    .Integer("sample_rate", audio.sample_rate)
	    .Number("duration_secs", duration)
	    .Finish();
}

std::string RenderLevels(const CaptureLevels &levels, const SignalProcessor::BandLevels &bands) {
	return JsonObjectWriter()
	    .Number("rms", levels.rms)
	    .Number("peak", levels.peak)
	    .Integer("sample_count", static_cast<int64_t>(levels.sample_count))
	    .FloatArray("bands", bands.data(), bands.size())
	    .Finish();
}

} // namespace voxprompt
