#pragma once

#include "duckdb.hpp"

#include "voxprompt/history_store.hpp"

#include <mutex>
#include <string>

namespace duckdb {

// Appends pipeline runs to the voxprompt_history table of the attached
// database, through a connection of its own
class DuckDBHistoryStore : public voxprompt::HistoryStore {
public:
	static constexpr const char *TABLE_NAME = "voxprompt_history";

	explicit DuckDBHistoryStore(shared_ptr<DatabaseInstance> db);

	bool Append(const voxprompt::HistoryRecord &record, std::string &id, voxprompt::VoxError &error) override;

private:
	shared_ptr<DatabaseInstance> db_;
	std::mutex mutex_;
	bool table_ready_;
};

} // namespace duckdb
