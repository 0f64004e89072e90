#pragma once

#include <mutex>
#include <string>

namespace voxprompt {

enum class LogLevel : int { LOG_DEBUG = 0, LOG_INFO = 1, LOG_WARNING = 2, LOG_ERROR = 3 };

// Sink for formatted log lines. Called with the logger mutex held, so it must
// not log itself.
using LogSink = void (*)(LogLevel level, const char *category, const std::string &message, void *user_data);

class Logger {
public:
	static Logger &GetInstance();

	void SetSink(LogSink sink, void *user_data = nullptr);
	void ResetSink();

	void SetMinLevel(LogLevel level);
	LogLevel GetMinLevel() const;

	bool IsEnabled(LogLevel level) const;
	void Log(LogLevel level, const char *category, const std::string &message);

	static const char *LevelToString(LogLevel level);

private:
	Logger();

	mutable std::mutex mutex_;
	LogSink sink_;
	void *user_data_;
	LogLevel min_level_;
};

} // namespace voxprompt

#define VOXPROMPT_LOG(level, category, message)                                                                        \
	do {                                                                                                               \
		auto &vox_logger_ = ::voxprompt::Logger::GetInstance();                                                        \
		if (vox_logger_.IsEnabled(level)) {                                                                            \
			vox_logger_.Log(level, category, message);                                                                 \
		}                                                                                                              \
	} while (0)

#define VOXPROMPT_LOG_DEBUG(category, message)   VOXPROMPT_LOG(::voxprompt::LogLevel::LOG_DEBUG, category, message)
#define VOXPROMPT_LOG_INFO(category, message)    VOXPROMPT_LOG(::voxprompt::LogLevel::LOG_INFO, category, message)
#define VOXPROMPT_LOG_WARNING(category, message) VOXPROMPT_LOG(::voxprompt::LogLevel::LOG_WARNING, category, message)
#define VOXPROMPT_LOG_ERROR(category, message)   VOXPROMPT_LOG(::voxprompt::LogLevel::LOG_ERROR, category, message)
