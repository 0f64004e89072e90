#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/printer.hpp"

#include "config_manager.hpp"
#include "voxprompt_functions.hpp"
#include "voxprompt/result_json.hpp"
#include "voxprompt/voxprompt_runtime.hpp"

namespace duckdb {

using voxprompt::VoxPromptRuntime;

// ============================================================================
// voxprompt_list_devices() - Lists available audio input devices
// ============================================================================

struct ListDevicesState : public GlobalTableFunctionState {
	std::vector<voxprompt::AudioDevice> devices;
	idx_t current_idx;

	ListDevicesState() : current_idx(0) {
	}

	idx_t MaxThreads() const override {
		return 1;
	}
};

static unique_ptr<FunctionData> ListDevicesBind(ClientContext &context, TableFunctionBindInput &input,
                                                vector<LogicalType> &return_types, vector<string> &names) {
	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("device_name");

	return_types.push_back(LogicalType::BOOLEAN);
	names.push_back("is_default");

	return nullptr;
}

static unique_ptr<GlobalTableFunctionState> ListDevicesInit(ClientContext &context, TableFunctionInitInput &input) {
	auto state = make_uniq<ListDevicesState>();
	state->devices = VoxPromptRuntime::GetInstance().GetCapture().ListDevices();
	return std::move(state);
}

static void ListDevicesExecute(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &state = data.global_state->Cast<ListDevicesState>();

	idx_t output_idx = 0;
	while (state.current_idx < state.devices.size() && output_idx < STANDARD_VECTOR_SIZE) {
		const auto &device = state.devices[state.current_idx];

		output.SetValue(0, output_idx, Value(device.name));
		output.SetValue(1, output_idx, Value::BOOLEAN(device.is_default));

		state.current_idx++;
		output_idx++;
	}

	output.SetCardinality(output_idx);
}

// ============================================================================
// voxprompt_start_recording([device_name]) - Opens the microphone
// ============================================================================

static std::string StartRecording(const voxprompt::VoxPromptConfig &config, const std::string &device_name) {
	auto &capture = VoxPromptRuntime::GetInstance().GetCapture();
	if (capture.IsRecording()) {
		return "Already recording";
	}

	voxprompt::VoxError error;
	if (!capture.Start(device_name, nullptr, error)) {
		throw InvalidInputException("Failed to start recording: " + error.ToString());
	}

	if (config.verbose) {
		Printer::Print(OutputStream::STREAM_STDERR, "Listening...");
	}
	return "Recording started";
}

static void StartRecordingFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());
	SetConstantString(result, StartRecording(config, config.input_device));
}

static void StartRecordingDeviceFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());

	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t device_name) {
		return StringVector::AddString(result, StartRecording(config, device_name.GetString()));
	});
}

// ============================================================================
// voxprompt_stop_recording() - Stops capture and discards the audio
// ============================================================================

static void StopRecordingFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());

	voxprompt::CapturedAudio audio = VoxPromptRuntime::GetInstance().GetCapture().Stop();

	if (config.verbose) {
		Printer::Print(OutputStream::STREAM_STDERR, "Stopped");
	}
	SetConstantString(result, voxprompt::RenderCaptureSummary(audio));
}

// ============================================================================
// voxprompt_is_recording() / voxprompt_mic_levels()
// ============================================================================

static void IsRecordingFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	result.SetVectorType(VectorType::CONSTANT_VECTOR);
	ConstantVector::SetNull(result, false);
	*ConstantVector::GetData<bool>(result) = VoxPromptRuntime::GetInstance().GetCapture().IsRecording();
}

static void MicLevelsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &capture = VoxPromptRuntime::GetInstance().GetCapture();
	SetConstantString(result, voxprompt::RenderLevels(capture.GetLevels(), capture.GetBandLevels()));
}

// ============================================================================
// Registration
// ============================================================================

void RegisterRecordFunctions(ExtensionLoader &loader) {
	// voxprompt_list_devices()
	TableFunction list_devices("voxprompt_list_devices", {}, ListDevicesExecute, ListDevicesBind, ListDevicesInit);
	loader.RegisterFunction(list_devices);

	// voxprompt_start_recording() and voxprompt_start_recording(device_name)
	ScalarFunctionSet start_set("voxprompt_start_recording");
	ScalarFunction start_default({}, LogicalType::VARCHAR, StartRecordingFunction);
	start_default.stability = FunctionStability::VOLATILE;
	start_set.AddFunction(start_default);
	ScalarFunction start_device({LogicalType::VARCHAR}, LogicalType::VARCHAR, StartRecordingDeviceFunction);
	start_device.stability = FunctionStability::VOLATILE;
	start_set.AddFunction(start_device);
	loader.RegisterFunction(start_set);

	// voxprompt_stop_recording()
	ScalarFunction stop_func("voxprompt_stop_recording", {}, LogicalType::VARCHAR, StopRecordingFunction);
	stop_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(stop_func);

	// voxprompt_is_recording()
	ScalarFunction is_recording_func("voxprompt_is_recording", {}, LogicalType::BOOLEAN, IsRecordingFunction);
	is_recording_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(is_recording_func);

	// voxprompt_mic_levels()
	ScalarFunction levels_func("voxprompt_mic_levels", {}, LogicalType::VARCHAR, MicLevelsFunction);
	levels_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(levels_func);
}

} // namespace duckdb
