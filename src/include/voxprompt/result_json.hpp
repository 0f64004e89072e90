#pragma once

#include "voxprompt/capture_session.hpp"
#include "voxprompt/model_downloader.hpp"
#include "voxprompt/pipeline_orchestrator.hpp"

#include <sstream>
#include <string>

namespace voxprompt {

std::string EscapeJsonString(const std::string &str);

// Flat JSON object builder for function results
class JsonObjectWriter {
public:
	JsonObjectWriter &String(const std::string &key, const std::string &value);
	JsonObjectWriter &Number(const std::string &key, double value);
	JsonObjectWriter &Integer(const std::string &key, int64_t value);
	JsonObjectWriter &Bool(const std::string &key, bool value);
	JsonObjectWriter &Null(const std::string &key);
	JsonObjectWriter &FloatArray(const std::string &key, const float *values, size_t count);

	std::string Finish();

private:
	void Key(const std::string &key);

	std::ostringstream out_;
	bool first_ = true;
};

std::string RenderError(const VoxError &error);
std::string RenderPipelineResult(const PipelineResult &result);
std::string RenderTranscriptionResult(const TranscriptionResult &result);
std::string RenderOptimizationResult(const OptimizationResult &result);
std::string RenderDownloadState(const DownloadState &state);
std::string RenderCaptureSummary(const CapturedAudio &audio);
std::string RenderLevels(const CaptureLevels &levels, const SignalProcessor::BandLevels &bands);

} // namespace voxprompt
