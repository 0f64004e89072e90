#include "voxprompt/voxprompt_runtime.hpp"
#include "voxprompt/http_client.hpp"
#include "voxprompt/llama_backend.hpp"
#include "voxprompt/logger.hpp"
#include "voxprompt/model_catalog.hpp"
#include "voxprompt/sdl_audio_backend.hpp"
#include "voxprompt/whisper_context.hpp"

namespace voxprompt {

constexpr size_t VoxPromptRuntime::IO_THREADS;
constexpr size_t VoxPromptRuntime::INFERENCE_THREADS;

static std::shared_ptr<HttpTransport> CreateHttpTransport() {
	CurlHttpClient::GlobalInit();
	return std::make_shared<CurlHttpClient>();
}

VoxPromptRuntime &VoxPromptRuntime::GetInstance() {
	static VoxPromptRuntime *instance = new VoxPromptRuntime();
	return *instance;
}

VoxPromptRuntime::VoxPromptRuntime()
    : io_pool_("io", IO_THREADS), inference_pool_("inference", INFERENCE_THREADS),
      capture_(std::make_shared<SdlAudioBackend>()), engine_(std::make_shared<LlamaBackend>()),
      downloader_(CreateHttpTransport(), io_pool_, &engine_),
      runner_(std::make_shared<WhisperRecognizer>(), ModelCatalog::Speech(), inference_pool_),
      optimizer_(engine_, ModelCatalog::Language(), inference_pool_),
      orchestrator_(capture_, runner_, optimizer_, io_pool_) {
	VOXPROMPT_LOG_DEBUG("runtime", "Runtime initialized");
}

void VoxPromptRuntime::EvictSpeechModel(const std::string &model_path) {
	WhisperContextCache::GetInstance().ClearContext(model_path);
}

} // namespace voxprompt
