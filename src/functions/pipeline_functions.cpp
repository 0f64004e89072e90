#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/printer.hpp"

#include "config_manager.hpp"
#include "duckdb_history_store.hpp"
#include "voxprompt_functions.hpp"
#include "voxprompt/audio_file_loader.hpp"
#include "voxprompt/result_json.hpp"
#include "voxprompt/voxprompt_runtime.hpp"

namespace duckdb {

using voxprompt::PipelineRequest;
using voxprompt::PipelineResult;
using voxprompt::VoxPromptRuntime;

static PipelineRequest MakeRequest(ClientContext &context, const voxprompt::VoxPromptConfig &config) {
	PipelineRequest request;
	request.settings = config;
	request.history = std::make_shared<DuckDBHistoryStore>(DatabaseInstance::GetDatabase(context).shared_from_this());
	return request;
}

static void PrintResult(const voxprompt::VoxPromptConfig &config, const PipelineResult &result) {
	if (!config.verbose) {
		return;
	}
	if (!result.success) {
		Printer::Print(OutputStream::STREAM_STDERR, "Pipeline failed: " + result.error.ToString());
	} else if (result.degraded) {
		Printer::Print(OutputStream::STREAM_STDERR, "Optimization failed, returning raw transcript");
	} else {
		Printer::Print(OutputStream::STREAM_STDERR, "Transcript: " + result.raw_transcript);
	}
}

// ============================================================================
// voxprompt_stop_and_process() - Stop recording and run the full pipeline
// ============================================================================

static void StopAndProcessFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &context = state.GetContext();
	auto config = VoxPromptConfigManager::GetConfig(context);

	if (config.verbose) {
		Printer::Print(OutputStream::STREAM_STDERR, "Processing recording...");
	}

	auto pending = VoxPromptRuntime::GetInstance().GetOrchestrator().ProcessCurrentRecordingAsync(
	    MakeRequest(context, config));
	PipelineResult pipeline = AwaitWithTimeout(pending, config, "Processing");

	PrintResult(config, pipeline);
	SetConstantString(result, voxprompt::RenderPipelineResult(pipeline));
}

// ============================================================================
// voxprompt_process_file(path) - Run the pipeline on an audio file
// ============================================================================

static void ProcessFileFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &context = state.GetContext();
	auto config = VoxPromptConfigManager::GetConfig(context);
	auto &orchestrator = VoxPromptRuntime::GetInstance().GetOrchestrator();

	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t path_val) {
		std::vector<float> samples;
		uint32_t sample_rate = 0;
		voxprompt::VoxError error;
		if (!voxprompt::AudioFileLoader::LoadAudioFile(path_val.GetString(), samples, sample_rate, error)) {
			return StringVector::AddString(result, voxprompt::RenderError(error));
		}

		auto pending = orchestrator.ProcessSamplesAsync(std::move(samples), sample_rate, MakeRequest(context, config));
		PipelineResult pipeline = AwaitWithTimeout(pending, config, "Processing");

		PrintResult(config, pipeline);
		return StringVector::AddString(result, voxprompt::RenderPipelineResult(pipeline));
	});
}

// ============================================================================
// voxprompt_transcribe_file(path) - Speech-to-text only
// ============================================================================

static void TranscribeFileFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());
	auto &orchestrator = VoxPromptRuntime::GetInstance().GetOrchestrator();

	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t path_val) {
		std::vector<float> samples;
		uint32_t sample_rate = 0;
		voxprompt::VoxError error;
		if (!voxprompt::AudioFileLoader::LoadAudioFile(path_val.GetString(), samples, sample_rate, error)) {
			return StringVector::AddString(result, voxprompt::RenderError(error));
		}

		auto pending = orchestrator.TranscribeSamplesAsync(std::move(samples), sample_rate, config);
		voxprompt::TranscriptionResult transcription = AwaitWithTimeout(pending, config, "Transcription");
		return StringVector::AddString(result, voxprompt::RenderTranscriptionResult(transcription));
	});
}

// ============================================================================
// voxprompt_optimize(text) - Prompt optimization only
// ============================================================================

static void OptimizeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());
	auto &optimizer = VoxPromptRuntime::GetInstance().GetOptimizer();

	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t text_val) {
		auto pending = optimizer.OptimizeAsync(text_val.GetString(), config);
		voxprompt::OptimizationResult optimized = AwaitWithTimeout(pending, config, "Optimization");
		return StringVector::AddString(result, voxprompt::RenderOptimizationResult(optimized));
	});
}

// ============================================================================
// Registration
// ============================================================================

void RegisterPipelineFunctions(ExtensionLoader &loader) {
	ScalarFunction stop_and_process("voxprompt_stop_and_process", {}, LogicalType::VARCHAR, StopAndProcessFunction);
	stop_and_process.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(stop_and_process);

	ScalarFunction process_file("voxprompt_process_file", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                            ProcessFileFunction);
	process_file.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(process_file);

	ScalarFunction transcribe_file("voxprompt_transcribe_file", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                               TranscribeFileFunction);
	transcribe_file.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(transcribe_file);

	ScalarFunction optimize("voxprompt_optimize", {LogicalType::VARCHAR}, LogicalType::VARCHAR, OptimizeFunction);
	optimize.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(optimize);
}

} // namespace duckdb
