#pragma once

#include "voxprompt/audio_backend.hpp"
#include "voxprompt/http_client.hpp"
#include "voxprompt/inference_engine.hpp"
#include "voxprompt/transcription_runner.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace voxprompt {
namespace fakes {

// ============================================================================
// Audio
// ============================================================================

class FakeAudioBackend;

class FakeAudioStream : public AudioInputStream {
public:
	FakeAudioStream(FakeAudioBackend &backend, std::string device_name, AudioDataCallback callback);
	~FakeAudioStream() override;

	bool Start(VoxError &error) override;
	void Close() override;

	uint32_t GetSampleRate() const override;
	uint16_t GetChannelCount() const override;
	const std::string &GetDeviceName() const override {
		return device_name_;
	}

private:
	FakeAudioBackend &backend_;
	std::string device_name_;
	AudioDataCallback callback_;
	bool closed_;
};

// Delivers audio synchronously through Push() while a stream is started
class FakeAudioBackend : public AudioInputBackend {
public:
	FakeAudioBackend();

	std::vector<AudioDevice> ListDevices() override;
	std::unique_ptr<AudioInputStream> OpenStream(const std::string &device_name, AudioDataCallback callback,
	                                             VoxError &error) override;

	// Returns false when no stream is running
	bool Push(const std::vector<float> &interleaved, uint16_t channels);

	uint32_t sample_rate;
	uint16_t channels;
	bool fail_start;
	std::atomic<int> open_count;
	std::atomic<int> close_count;

private:
	friend class FakeAudioStream;

	void Attach(AudioDataCallback callback);
	void Detach();

	std::mutex mutex_;
	AudioDataCallback active_;
};

// ============================================================================
// HTTP
// ============================================================================

class FakeHttpTransport : public HttpTransport {
public:
	FakeHttpTransport();

	HttpResult Get(const std::string &url, HttpResponseSink &sink) override;

	// Block every request inside Get() until Release() is called
	void HoldRequests();
	void WaitUntilHeld();
	void Release();

	long status_code;
	std::string body;
	// -1 sends no content length
	int64_t content_length;
	// Break the transfer after this many body bytes; 0 sends all of it
	size_t fail_after_bytes;
	std::atomic<int> request_count;
	std::string last_url;

private:
	std::mutex mutex_;
	std::condition_variable cv_;
	bool hold_;
	bool held_;
};

// ============================================================================
// Language model
// ============================================================================

struct FakeModelScript {
	std::string chat_template;
	bool fail_template = false;
	bool fail_create_context = false;
	size_t prompt_tokens = 8;
	// Fail the n-th Decode call (1-based, the prompt batch included); 0 never fails
	size_t fail_decode_at = 0;
	// Pieces emitted in order, followed by the end-of-generation token
	std::vector<std::string> pieces;
};

class FakeLanguageModel : public LanguageModel {
public:
	static constexpr int32_t EOG_TOKEN = -1;

	explicit FakeLanguageModel(FakeModelScript script);

	std::string GetChatTemplate() const override {
		return script_.chat_template;
	}
	bool ApplyChatTemplate(const std::string &chat_template, const std::vector<ChatMessage> &messages,
	                       std::string &rendered, VoxError &error) const override;
	bool Tokenize(const std::string &text, std::vector<int32_t> &tokens, VoxError &error) const override;
	std::string TokenToPiece(int32_t token) const override;
	bool IsEndOfGeneration(int32_t token) const override {
		return token == EOG_TOKEN;
	}
	std::unique_ptr<GenerationContext> CreateContext(const SamplingParams &params, VoxError &error) override;

	// Messages seen by the last ApplyChatTemplate call
	mutable std::vector<ChatMessage> last_messages;
	mutable std::vector<std::string> templates_seen;

private:
	FakeModelScript script_;
};

class FakeLanguageModelBackend : public LanguageModelBackend {
public:
	std::unique_ptr<LanguageModel> LoadModel(const std::string &path, bool use_gpu, VoxError &error) override;

	FakeModelScript script;
	bool fail_load = false;
	// Runs inside LoadModel while the engine holds its slot
	std::function<void()> on_load;
	std::atomic<int> load_count {0};
	// Last model handed out; owned by the engine
	FakeLanguageModel *last_model = nullptr;
};

// ============================================================================
// Speech
// ============================================================================

class FakeSpeechRecognizer : public SpeechRecognizer {
public:
	bool Transcribe(const std::string &model_path, const std::vector<float> &samples,
	                const RecognitionOptions &options, std::string &text, std::string &detected_language,
	                VoxError &error) override;

	std::string text = "  hello world  ";
	std::string language = "en";
	bool fail = false;
	std::atomic<int> call_count {0};
	size_t last_sample_count = 0;
	std::string last_model_path;
};

// ============================================================================
// Files
// ============================================================================

// Fresh directory under /tmp, removed with its contents on destruction
class TempDir {
public:
	TempDir();
	~TempDir();

	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	const std::string &Path() const {
		return path_;
	}

private:
	std::string path_;
};

bool WriteFile(const std::string &path, const std::string &content);
bool ReadFile(const std::string &path, std::string &content);
bool PathExists(const std::string &path);
bool MakeDirectories(const std::string &path);

// Sine tone at the given rate
std::vector<float> MakeTone(size_t count, uint32_t sample_rate, float frequency, float amplitude);

} // namespace fakes
} // namespace voxprompt
