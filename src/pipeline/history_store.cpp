#include "voxprompt/history_store.hpp"

#include <chrono>

namespace voxprompt {

int64_t HistoryRecord::NowMicros() {
	auto now = std::chrono::system_clock::now().time_since_epoch();
	return std::chrono::duration_cast<std::chrono::microseconds>(now).count();
}

bool InMemoryHistoryStore::Append(const HistoryRecord &record, std::string &id, VoxError &error) {
	(void)error;
	std::lock_guard<std::mutex> lock(mutex_);
	records_.push_back(record);
	id = std::to_string(next_id_++);
	return true;
}

std::vector<HistoryRecord> InMemoryHistoryStore::GetRecords() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return records_;
}

} // namespace voxprompt
