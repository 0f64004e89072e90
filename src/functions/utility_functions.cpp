#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "config_manager.hpp"
#include "voxprompt_functions.hpp"
#include "voxprompt/result_json.hpp"
#include "whisper.h"

namespace duckdb {

// Extension version
#ifndef EXT_VERSION_VOXPROMPT
#define EXT_VERSION_VOXPROMPT "0.1.0"
#endif

// ============================================================================
// voxprompt_version() - Returns extension and whisper.cpp version info
// ============================================================================

static void VersionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	std::string version_info = "voxprompt extension v" + std::string(EXT_VERSION_VOXPROMPT) +
	                           " (whisper.cpp: " + std::string(whisper_version()) + ")";
	SetConstantString(result, version_info);
}

// ============================================================================
// voxprompt_get_config() - Effective settings as JSON
// ============================================================================

static void GetConfigFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());

	std::string json = voxprompt::JsonObjectWriter()
	                       .String("data_path", config.data_path)
	                       .String("models_root", config.GetModelsRoot())
	                       .String("input_device", config.input_device)
	                       .String("whisper_model", config.whisper_model)
	                       .String("language", config.language)
	                       .Bool("force_transcription", config.force_transcription)
	                       .Bool("use_gpu", config.use_gpu)
	                       .String("prompt_mode", config.prompt_mode)
	                       .String("custom_system_prompt", config.custom_system_prompt)
	                       .String("llm_model", config.llm_model)
	                       .Integer("timeout", config.timeout_seconds)
	                       .Bool("verbose", config.verbose)
	                       .Finish();
	SetConstantString(result, json);
}

// ============================================================================
// Registration
// ============================================================================

void RegisterUtilityFunctions(ExtensionLoader &loader) {
	auto version_func = ScalarFunction("voxprompt_version", {}, LogicalType::VARCHAR, VersionFunction);
	loader.RegisterFunction(version_func);

	auto config_func = ScalarFunction("voxprompt_get_config", {}, LogicalType::VARCHAR, GetConfigFunction);
	config_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(config_func);
}

} // namespace duckdb
