#include "voxprompt/logger.hpp"

#include <cstdio>

namespace voxprompt {

static void StderrSink(LogLevel level, const char *category, const std::string &message, void *user_data) {
	(void)user_data;
	fprintf(stderr, "[voxprompt][%s][%s] %s\n", Logger::LevelToString(level), category, message.c_str());
	fflush(stderr);
}

Logger::Logger() : sink_(StderrSink), user_data_(nullptr), min_level_(LogLevel::LOG_WARNING) {
}

Logger &Logger::GetInstance() {
	// Leaked on purpose: worker threads may still log during static destruction
	static Logger *instance = new Logger();
	return *instance;
}

void Logger::SetSink(LogSink sink, void *user_data) {
	std::lock_guard<std::mutex> lock(mutex_);
	sink_ = sink ? sink : StderrSink;
	user_data_ = user_data;
}

void Logger::ResetSink() {
	SetSink(nullptr, nullptr);
}

void Logger::SetMinLevel(LogLevel level) {
	std::lock_guard<std::mutex> lock(mutex_);
	min_level_ = level;
}

LogLevel Logger::GetMinLevel() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return min_level_;
}

bool Logger::IsEnabled(LogLevel level) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Log(LogLevel level, const char *category, const std::string &message) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (static_cast<int>(level) < static_cast<int>(min_level_)) {
		return;
	}
	sink_(level, category, message, user_data_);
}

const char *Logger::LevelToString(LogLevel level) {
	switch (level) {
	case LogLevel::LOG_DEBUG:
		return "DEBUG";
	case LogLevel::LOG_INFO:
		return "INFO";
	case LogLevel::LOG_WARNING:
		return "WARN";
	case LogLevel::LOG_ERROR:
		return "ERROR";
	default:
		return "???";
	}
}

} // namespace voxprompt
