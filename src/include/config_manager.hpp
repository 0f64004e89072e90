#pragma once

#include "duckdb.hpp"
#include "duckdb/main/database.hpp"

#include "voxprompt/voxprompt_config.hpp"

namespace duckdb {

class VoxPromptConfigManager {
public:
	// Register DuckDB extension settings via AddExtensionOption
	static void RegisterSettings(DatabaseInstance &db);

	// Get current configuration from context (reads from DuckDB settings)
	static voxprompt::VoxPromptConfig GetConfig(ClientContext &context);

	// Route core logging through DuckDB's printer; INFO and above when verbose
	static void InstallLogSink();
	static void ApplyLogging(const voxprompt::VoxPromptConfig &config);
};

} // namespace duckdb
