#pragma once

#include "voxprompt/vox_error.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace voxprompt {

struct HistoryRecord {
	std::string raw_transcript;
	std::string optimized_prompt;
	std::string mode;
	std::string provider;
	double duration_secs;
	int64_t created_at_micros; // Unix epoch, microseconds

	HistoryRecord() : duration_secs(0.0), created_at_micros(0) {
	}

	static int64_t NowMicros();
};

// Persistence for completed pipeline runs
class HistoryStore {
public:
	virtual ~HistoryStore() = default;

	// On success id holds the identifier assigned by the store
	virtual bool Append(const HistoryRecord &record, std::string &id, VoxError &error) = 0;
};

class InMemoryHistoryStore : public HistoryStore {
public:
	InMemoryHistoryStore() : next_id_(1) {
	}

	bool Append(const HistoryRecord &record, std::string &id, VoxError &error) override;

	std::vector<HistoryRecord> GetRecords() const;

private:
	mutable std::mutex mutex_;
	std::vector<HistoryRecord> records_;
	uint64_t next_id_;
};

} // namespace voxprompt
