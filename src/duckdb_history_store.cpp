#include "duckdb_history_store.hpp"
#include "duckdb/common/types/uuid.hpp"
#include "duckdb/main/connection.hpp"

namespace duckdb {

constexpr const char *DuckDBHistoryStore::TABLE_NAME;

DuckDBHistoryStore::DuckDBHistoryStore(shared_ptr<DatabaseInstance> db) : db_(std::move(db)), table_ready_(false) {
}

bool DuckDBHistoryStore::Append(const voxprompt::HistoryRecord &record, std::string &id,
                                voxprompt::VoxError &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	Connection con(*db_);

	if (!table_ready_) {
		auto created = con.Query(std::string("CREATE TABLE IF NOT EXISTS ") + TABLE_NAME +
		                         " (id VARCHAR PRIMARY KEY, raw_transcript VARCHAR, optimized_prompt VARCHAR, "
		                         "prompt_mode VARCHAR, llm_provider VARCHAR, duration_secs DOUBLE, "
		                         "created_at TIMESTAMP)");
		if (created->HasError()) {
			error.Set(voxprompt::ErrorCode::IO_ERROR, "Failed to create history table: " + created->GetError());
			return false;
		}
		table_ready_ = true;
	}

	auto prepared = con.Prepare(std::string("INSERT INTO ") + TABLE_NAME +
	                            " VALUES ($1, $2, $3, $4, $5, $6, make_timestamp($7))");
	if (prepared->HasError()) {
		error.Set(voxprompt::ErrorCode::IO_ERROR, "Failed to prepare history insert: " + prepared->GetError());
		return false;
	}

	std::string new_id = UUID::ToString(UUID::GenerateRandomUUID());
	vector<Value> values;
	values.push_back(Value(new_id));
	values.push_back(Value(record.raw_transcript));
	values.push_back(Value(record.optimized_prompt));
	values.push_back(Value(record.mode));
	values.push_back(Value(record.provider));
	values.push_back(Value::DOUBLE(record.duration_secs));
	values.push_back(Value::BIGINT(record.created_at_micros));

	auto inserted = prepared->Execute(values, false);
	if (inserted->HasError()) {
		error.Set(voxprompt::ErrorCode::IO_ERROR, "Failed to save history: " + inserted->GetError());
		return false;
	}

	id = new_id;
	return true;
}

} // namespace duckdb
