#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/printer.hpp"

#include "config_manager.hpp"
#include "voxprompt_functions.hpp"
#include "voxprompt/model_catalog.hpp"
#include "voxprompt/result_json.hpp"
#include "voxprompt/voxprompt_runtime.hpp"

namespace duckdb {

using voxprompt::ModelCatalog;
using voxprompt::ModelCategory;
using voxprompt::VoxPromptRuntime;

static const ModelCatalog &GetCatalog(const std::string &category_name) {
	ModelCategory category;
	if (!ModelCatalog::ParseCategory(category_name, category)) {
		throw InvalidInputException("Unknown model category: " + category_name +
		                            ". Use 'whisper' (speech) or 'llm' (language).");
	}
	return ModelCatalog::ForCategory(category);
}

// ============================================================================
// voxprompt_list_models([category]) - Catalog with download status
// ============================================================================

struct ListModelsBindData : public TableFunctionData {
	std::vector<const ModelCatalog *> catalogs;
};

struct ListModelsState : public GlobalTableFunctionState {
	struct Row {
		const char *category;
		voxprompt::ModelInfo info;
	};
	std::vector<Row> rows;
	idx_t current_idx;

	ListModelsState() : current_idx(0) {
	}

	idx_t MaxThreads() const override {
		return 1;
	}
};

static unique_ptr<FunctionData> ListModelsBind(ClientContext &context, TableFunctionBindInput &input,
                                               vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<ListModelsBindData>();
	if (!input.inputs.empty() && !input.inputs[0].IsNull()) {
		bind_data->catalogs.push_back(&GetCatalog(input.inputs[0].GetValue<string>()));
	} else {
		bind_data->catalogs.push_back(&ModelCatalog::Speech());
		bind_data->catalogs.push_back(&ModelCatalog::Language());
	}

	return_types.push_back(LogicalType::VARCHAR); // category
	names.push_back("category");

	return_types.push_back(LogicalType::VARCHAR); // id
	names.push_back("id");

	return_types.push_back(LogicalType::INTEGER); // size_mb
	names.push_back("size_mb");

	return_types.push_back(LogicalType::BOOLEAN); // is_downloaded
	names.push_back("is_downloaded");

	return_types.push_back(LogicalType::BIGINT); // file_size
	names.push_back("file_size");

	return_types.push_back(LogicalType::VARCHAR); // file_path
	names.push_back("file_path");

	return_types.push_back(LogicalType::VARCHAR); // description
	names.push_back("description");

	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> ListModelsInit(ClientContext &context, TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<ListModelsBindData>();
	auto state = make_uniq<ListModelsState>();
	auto config = VoxPromptConfigManager::GetConfig(context);

	for (auto catalog : bind_data.catalogs) {
		for (auto &info : voxprompt::ModelDownloader::ListModels(*catalog, config.GetModelsRoot())) {
			state->rows.push_back(ListModelsState::Row {ModelCatalog::CategoryToString(catalog->GetCategory()), info});
		}
	}
	return std::move(state);
}

static void ListModelsExecute(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &state = data.global_state->Cast<ListModelsState>();

	idx_t output_idx = 0;
	while (state.current_idx < state.rows.size() && output_idx < STANDARD_VECTOR_SIZE) {
		const auto &row = state.rows[state.current_idx];
		const auto &model = row.info;

		output.SetValue(0, output_idx, Value(row.category));
		output.SetValue(1, output_idx, Value(model.descriptor.id));
		output.SetValue(2, output_idx, Value::INTEGER(static_cast<int32_t>(model.descriptor.size_mb)));
		output.SetValue(3, output_idx, Value::BOOLEAN(model.is_downloaded));
		output.SetValue(4, output_idx, model.is_downloaded ? Value::BIGINT(model.file_size) : Value());
		output.SetValue(5, output_idx, Value(model.file_path));
		output.SetValue(6, output_idx, Value(model.descriptor.description));

		state.current_idx++;
		output_idx++;
	}

	output.SetCardinality(output_idx);
}

// ============================================================================
// voxprompt_download_model(category, id) - Download and verify a model
// ============================================================================

static void DownloadModelFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());
	auto &downloader = VoxPromptRuntime::GetInstance().GetDownloader();

	BinaryExecutor::Execute<string_t, string_t, string_t>(
	    args.data[0], args.data[1], result, args.size(), [&](string_t category_val, string_t id_val) {
		    const ModelCatalog &catalog = GetCatalog(category_val.GetString());
		    std::string model_id = id_val.GetString();

		    if (config.verbose) {
			    Printer::Print(OutputStream::STREAM_STDERR, "Downloading " + model_id + "...");
		    }

		    // Downloads are not bounded by voxprompt_timeout
		    auto pending = downloader.DownloadAsync(catalog, model_id, config.GetModelsRoot());
		    voxprompt::DownloadResult download = pending.get();

		    if (!download.success) {
			    throw InvalidInputException("Failed to download model: " + download.error.ToString());
		    }
		    if (download.already_present) {
			    return StringVector::AddString(result, "Model '" + model_id + "' is already downloaded");
		    }
		    return StringVector::AddString(result, "Successfully downloaded model '" + model_id + "'");
	    });
}

// ============================================================================
// voxprompt_download_progress() - Active download or NULL
// ============================================================================

static void DownloadProgressFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	voxprompt::DownloadState progress;
	if (!VoxPromptRuntime::GetInstance().GetDownloader().GetProgress(progress)) {
		result.SetVectorType(VectorType::CONSTANT_VECTOR);
		ConstantVector::SetNull(result, true);
		return;
	}
	SetConstantString(result, voxprompt::RenderDownloadState(progress));
}

// ============================================================================
// voxprompt_delete_model(category, id)
// ============================================================================

static void DeleteModelFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());
	auto &runtime = VoxPromptRuntime::GetInstance();

	BinaryExecutor::Execute<string_t, string_t, string_t>(
	    args.data[0], args.data[1], result, args.size(), [&](string_t category_val, string_t id_val) {
		    const ModelCatalog &catalog = GetCatalog(category_val.GetString());
		    std::string model_id = id_val.GetString();

		    voxprompt::VoxError error;
		    std::string path;
		    if (catalog.GetCategory() == ModelCategory::SPEECH &&
		        voxprompt::ModelDownloader::GetModelPath(catalog, model_id, config.GetModelsRoot(), path, error)) {
			    runtime.EvictSpeechModel(path);
		    }
		    error.Clear();

		    if (!runtime.GetDownloader().DeleteModel(catalog, model_id, config.GetModelsRoot(), error)) {
			    throw InvalidInputException("Failed to delete model: " + error.ToString());
		    }
		    return StringVector::AddString(result, "Deleted model '" + model_id + "'");
	    });
}

// ============================================================================
// voxprompt_load_llm([id]) / voxprompt_unload_llm() / voxprompt_llm_status()
// ============================================================================

static std::string LoadLanguageModel(voxprompt::VoxPromptConfig config) {
	voxprompt::VoxError error;
	if (!VoxPromptRuntime::GetInstance().GetOptimizer().EnsureModelLoaded(config, error)) {
		throw InvalidInputException("Failed to load language model: " + error.ToString());
	}
	return "Loaded language model '" + config.llm_model + "'";
}

static void LoadLlmFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());
	SetConstantString(result, LoadLanguageModel(config));
}

static void LoadLlmIdFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto config = VoxPromptConfigManager::GetConfig(state.GetContext());

	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t id_val) {
		voxprompt::VoxPromptConfig local_config = config;
		local_config.llm_model = id_val.GetString();
		return StringVector::AddString(result, LoadLanguageModel(local_config));
	});
}

static void UnloadLlmFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &engine = VoxPromptRuntime::GetInstance().GetEngine();
	std::string path = engine.GetLoadedPath();
	engine.Unload();
	SetConstantString(result, path.empty() ? "No language model loaded" : "Unloaded " + path);
}

static void LlmStatusFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &engine = VoxPromptRuntime::GetInstance().GetEngine();
	std::string status = voxprompt::InferenceEngine::StateToString(engine.GetState());
	std::string path = engine.GetLoadedPath();
	if (!path.empty()) {
		status += ": " + path;
	}
	SetConstantString(result, status);
}

// ============================================================================
// Registration
// ============================================================================

void RegisterModelFunctions(ExtensionLoader &loader) {
	// voxprompt_list_models() and voxprompt_list_models(category)
	TableFunctionSet list_models("voxprompt_list_models");
	list_models.AddFunction(TableFunction({}, ListModelsExecute, ListModelsBind, ListModelsInit));
	list_models.AddFunction(TableFunction({LogicalType::VARCHAR}, ListModelsExecute, ListModelsBind, ListModelsInit));
	loader.RegisterFunction(list_models);

	ScalarFunction download_func("voxprompt_download_model", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                             LogicalType::VARCHAR, DownloadModelFunction);
	download_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(download_func);

	ScalarFunction progress_func("voxprompt_download_progress", {}, LogicalType::VARCHAR, DownloadProgressFunction);
	progress_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(progress_func);

	ScalarFunction delete_func("voxprompt_delete_model", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                           LogicalType::VARCHAR, DeleteModelFunction);
	delete_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(delete_func);

	ScalarFunctionSet load_set("voxprompt_load_llm");
	ScalarFunction load_default({}, LogicalType::VARCHAR, LoadLlmFunction);
	load_default.stability = FunctionStability::VOLATILE;
	load_set.AddFunction(load_default);
	ScalarFunction load_id({LogicalType::VARCHAR}, LogicalType::VARCHAR, LoadLlmIdFunction);
	load_id.stability = FunctionStability::VOLATILE;
	load_set.AddFunction(load_id);
	loader.RegisterFunction(load_set);

	ScalarFunction unload_func("voxprompt_unload_llm", {}, LogicalType::VARCHAR, UnloadLlmFunction);
	unload_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(unload_func);

	ScalarFunction status_func("voxprompt_llm_status", {}, LogicalType::VARCHAR, LlmStatusFunction);
	status_func.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(status_func);
}

} // namespace duckdb
