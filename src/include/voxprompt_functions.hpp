#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"

#include "voxprompt/voxprompt_config.hpp"

#include <chrono>
#include <future>
#include <string>

namespace duckdb {

void RegisterRecordFunctions(ExtensionLoader &loader);
void RegisterPipelineFunctions(ExtensionLoader &loader);
void RegisterModelFunctions(ExtensionLoader &loader);
void RegisterUtilityFunctions(ExtensionLoader &loader);

// Block on a worker result for at most voxprompt_timeout seconds. The work
// itself keeps running after a timeout; only this call gives up.
template <class T>
T AwaitWithTimeout(std::future<T> &future, const voxprompt::VoxPromptConfig &config, const std::string &operation) {
	auto timeout = std::chrono::seconds(config.timeout_seconds > 0 ? config.timeout_seconds : 1);
	if (future.wait_for(timeout) == std::future_status::timeout) {
		throw InvalidInputException(operation + " timed out after " + std::to_string(config.timeout_seconds) +
		                            " seconds. Increase voxprompt_timeout if needed.");
	}
	return future.get();
}

// Result for zero-argument scalar functions
inline void SetConstantString(Vector &result, const std::string &value) {
	result.SetVectorType(VectorType::CONSTANT_VECTOR);
	ConstantVector::SetNull(result, false);
	auto result_data = ConstantVector::GetData<string_t>(result);
	*result_data = StringVector::AddString(result, value);
}

} // namespace duckdb
