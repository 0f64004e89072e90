#define DUCKDB_EXTENSION_MAIN

#include "voxprompt_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "config_manager.hpp"
#include "voxprompt_functions.hpp"
#include "voxprompt/voxprompt_runtime.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	// Register configuration settings FIRST
	VoxPromptConfigManager::RegisterSettings(loader.GetDatabaseInstance());
	VoxPromptConfigManager::InstallLogSink();

	// Services live for the rest of the process
	voxprompt::VoxPromptRuntime::GetInstance();

	// Register all functions
	RegisterRecordFunctions(loader);
	RegisterPipelineFunctions(loader);
	RegisterModelFunctions(loader);
	RegisterUtilityFunctions(loader);
}

void VoxpromptExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string VoxpromptExtension::Name() {
	return "voxprompt";
}

std::string VoxpromptExtension::Version() const {
#ifdef EXT_VERSION_VOXPROMPT
	return EXT_VERSION_VOXPROMPT;
#else
	return "0.1.0";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(voxprompt, loader) {
	duckdb::LoadInternal(loader);
}
}
