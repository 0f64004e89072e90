#include "voxprompt/voxprompt_config.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace voxprompt {

constexpr const char *VoxPromptConfig::DEFAULT_INPUT_DEVICE;
constexpr const char *VoxPromptConfig::DEFAULT_WHISPER_MODEL;
constexpr const char *VoxPromptConfig::DEFAULT_LANGUAGE;
constexpr const char *VoxPromptConfig::DEFAULT_PROMPT_MODE;
constexpr const char *VoxPromptConfig::DEFAULT_CUSTOM_SYSTEM_PROMPT;
constexpr const char *VoxPromptConfig::DEFAULT_LLM_MODEL;

VoxPromptConfig::VoxPromptConfig()
    : data_path(GetDefaultDataPath()), input_device(DEFAULT_INPUT_DEVICE), whisper_model(DEFAULT_WHISPER_MODEL),
      language(DEFAULT_LANGUAGE), force_transcription(DEFAULT_FORCE_TRANSCRIPTION), use_gpu(DEFAULT_USE_GPU),
      prompt_mode(DEFAULT_PROMPT_MODE), custom_system_prompt(DEFAULT_CUSTOM_SYSTEM_PROMPT),
      llm_model(DEFAULT_LLM_MODEL), timeout_seconds(DEFAULT_TIMEOUT_SECONDS), verbose(DEFAULT_VERBOSE) {
}

std::string VoxPromptConfig::GetModelsRoot() const {
#ifdef _WIN32
	return data_path + "\\models";
#else
	return data_path + "/models";
#endif
}

std::string VoxPromptConfig::GetDefaultDataPath() {
	std::string home_dir;

#ifdef _WIN32
	char path[MAX_PATH];
	if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path))) {
		home_dir = path;
	} else {
		home_dir = std::getenv("USERPROFILE") ? std::getenv("USERPROFILE") : "C:\\";
	}
	return home_dir + "\\.duckdb\\voxprompt";
#else
	const char *home = std::getenv("HOME");
	if (!home) {
		struct passwd *pw = getpwuid(getuid());
		home = pw ? pw->pw_dir : "/tmp";
	}
	home_dir = home;
	return home_dir + "/.duckdb/voxprompt";
#endif
}

} // namespace voxprompt
