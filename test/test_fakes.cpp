#include "test_fakes.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <ftw.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace voxprompt {
namespace fakes {

// ============================================================================
// FakeAudioStream / FakeAudioBackend
// ============================================================================

FakeAudioStream::FakeAudioStream(FakeAudioBackend &backend, std::string device_name, AudioDataCallback callback)
    : backend_(backend), device_name_(std::move(device_name)), callback_(std::move(callback)), closed_(false) {
}

FakeAudioStream::~FakeAudioStream() {
	Close();
}

bool FakeAudioStream::Start(VoxError &error) {
	if (backend_.fail_start) {
		error.Set(ErrorCode::STREAM_ERROR, "Fake stream refused to start");
		return false;
	}
	backend_.Attach(callback_);
	return true;
}

void FakeAudioStream::Close() {
	if (closed_) {
		return;
	}
	closed_ = true;
	backend_.Detach();
	backend_.close_count++;
}

uint32_t FakeAudioStream::GetSampleRate() const {
	return backend_.sample_rate;
}

uint16_t FakeAudioStream::GetChannelCount() const {
	return backend_.channels;
}

FakeAudioBackend::FakeAudioBackend()
    : sample_rate(48000), channels(1), fail_start(false), open_count(0), close_count(0) {
}

std::vector<AudioDevice> FakeAudioBackend::ListDevices() {
	return {AudioDevice {"Fake Microphone", true}, AudioDevice {"Fake Line In", false}};
}

std::unique_ptr<AudioInputStream> FakeAudioBackend::OpenStream(const std::string &device_name,
                                                               AudioDataCallback callback, VoxError &error) {
	if (!device_name.empty() && device_name != "Fake Microphone" && device_name != "Fake Line In") {
		error.Set(ErrorCode::DEVICE_NOT_FOUND, "Input device not found: " + device_name);
		return nullptr;
	}
	open_count++;
	return std::make_unique<FakeAudioStream>(*this, device_name.empty() ? "Fake Microphone" : device_name,
	                                         std::move(callback));
}

bool FakeAudioBackend::Push(const std::vector<float> &interleaved, uint16_t channel_count) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (!active_) {
		return false;
	}
	active_(interleaved.data(), interleaved.size() / channel_count, channel_count);
	return true;
}

void FakeAudioBackend::Attach(AudioDataCallback callback) {
	std::lock_guard<std::mutex> lock(mutex_);
	active_ = std::move(callback);
}

void FakeAudioBackend::Detach() {
	std::lock_guard<std::mutex> lock(mutex_);
	active_ = nullptr;
}

// ============================================================================
// FakeHttpTransport
// ============================================================================

FakeHttpTransport::FakeHttpTransport()
    : status_code(200), content_length(-1), fail_after_bytes(0), request_count(0), hold_(false), held_(false) {
}

HttpResult FakeHttpTransport::Get(const std::string &url, HttpResponseSink &sink) {
	request_count++;
	{
		std::unique_lock<std::mutex> lock(mutex_);
		last_url = url;
		if (hold_) {
			held_ = true;
			cv_.notify_all();
			cv_.wait(lock, [this]() { return !hold_; });
		}
	}

	HttpResult result;
	result.status_code = status_code;
	if (!sink.OnResponse(status_code, content_length)) {
		result.aborted = true;
		result.error = "Transfer aborted by receiver";
		return result;
	}

	// Deliver the body in a few chunks
	const size_t chunk = 3;
	size_t limit = fail_after_bytes > 0 ? std::min(fail_after_bytes, body.size()) : body.size();
	for (size_t offset = 0; offset < limit; offset += chunk) {
		size_t size = std::min(chunk, limit - offset);
		if (!sink.OnData(body.data() + offset, size)) {
			result.aborted = true;
			result.error = "Transfer aborted by receiver";
			return result;
		}
	}
	if (fail_after_bytes > 0) {
		result.error = "Connection reset by peer";
		return result;
	}
	result.completed = true;
	return result;
}

void FakeHttpTransport::HoldRequests() {
	std::lock_guard<std::mutex> lock(mutex_);
	hold_ = true;
	held_ = false;
}

void FakeHttpTransport::WaitUntilHeld() {
	std::unique_lock<std::mutex> lock(mutex_);
	cv_.wait(lock, [this]() { return held_; });
}

void FakeHttpTransport::Release() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		hold_ = false;
	}
	cv_.notify_all();
}

// ============================================================================
// FakeLanguageModel
// ============================================================================

constexpr int32_t FakeLanguageModel::EOG_TOKEN;

namespace {

class FakeGenerationContext : public GenerationContext {
public:
	FakeGenerationContext(size_t piece_count, size_t fail_decode_at)
	    : piece_count_(piece_count), fail_decode_at_(fail_decode_at), decode_calls_(0), next_(0) {
	}

	bool Decode(const std::vector<int32_t> &tokens, int32_t start_pos, VoxError &error) override {
		if (tokens.empty() || start_pos < 0) {
			error.Set(ErrorCode::GENERATION_ERROR, "Bad decode request");
			return false;
		}
		decode_calls_++;
		if (fail_decode_at_ > 0 && decode_calls_ == fail_decode_at_) {
			error.Set(ErrorCode::GENERATION_ERROR, "Decode failed at position " + std::to_string(start_pos));
			return false;
		}
		return true;
	}

	int32_t Sample() override {
		if (next_ >= piece_count_) {
			return FakeLanguageModel::EOG_TOKEN;
		}
		return static_cast<int32_t>(next_++);
	}

private:
	size_t piece_count_;
	size_t fail_decode_at_;
	size_t decode_calls_;
	size_t next_;
};

} // namespace

FakeLanguageModel::FakeLanguageModel(FakeModelScript script) : script_(std::move(script)) {
}

bool FakeLanguageModel::ApplyChatTemplate(const std::string &chat_template, const std::vector<ChatMessage> &messages,
                                          std::string &rendered, VoxError &error) const {
	templates_seen.push_back(chat_template);
	last_messages = messages;
	if (script_.fail_template && chat_template != InferenceEngine::FALLBACK_CHAT_TEMPLATE) {
		error.Set(ErrorCode::GENERATION_ERROR, "Unsupported chat template");
		return false;
	}
	std::ostringstream out;
	for (const auto &message : messages) {
		out << "[" << message.role << "]" << message.content << "\n";
	}
	out << "[assistant]";
	rendered = out.str();
	return true;
}

bool FakeLanguageModel::Tokenize(const std::string &text, std::vector<int32_t> &tokens, VoxError &error) const {
	if (text.empty()) {
		error.Set(ErrorCode::GENERATION_ERROR, "Nothing to tokenize");
		return false;
	}
	tokens.assign(script_.prompt_tokens, 7);
	return true;
}

std::string FakeLanguageModel::TokenToPiece(int32_t token) const {
	if (token < 0 || static_cast<size_t>(token) >= script_.pieces.size()) {
		return std::string();
	}
	return script_.pieces[static_cast<size_t>(token)];
}

std::unique_ptr<GenerationContext> FakeLanguageModel::CreateContext(const SamplingParams &params, VoxError &error) {
	if (script_.fail_create_context) {
		error.Set(ErrorCode::GENERATION_ERROR, "Failed to create context");
		return nullptr;
	}
	return std::make_unique<FakeGenerationContext>(script_.pieces.size(), script_.fail_decode_at);
}

std::unique_ptr<LanguageModel> FakeLanguageModelBackend::LoadModel(const std::string &path, bool use_gpu,
                                                                   VoxError &error) {
	load_count++;
	if (on_load) {
		on_load();
	}
	if (fail_load) {
		error.Set(ErrorCode::LOAD_ERROR, "Failed to load model: " + path);
		return nullptr;
	}
	auto model = std::make_unique<FakeLanguageModel>(script);
	last_model = model.get();
	return std::move(model);
}

// ============================================================================
// FakeSpeechRecognizer
// ============================================================================

bool FakeSpeechRecognizer::Transcribe(const std::string &model_path, const std::vector<float> &samples,
                                      const RecognitionOptions &options, std::string &out_text,
                                      std::string &detected_language, VoxError &error) {
	call_count++;
	last_sample_count = samples.size();
	last_model_path = model_path;
	if (fail) {
		error.Set(ErrorCode::TRANSCRIPTION_ERROR, "Failed to run whisper transcription");
		return false;
	}
	out_text = text;
	detected_language = language;
	return true;
}

// ============================================================================
// Files
// ============================================================================

static int RemoveEntry(const char *path, const struct stat *, int, struct FTW *) {
	return std::remove(path);
}

TempDir::TempDir() {
	char pattern[] = "/tmp/voxprompt_test_XXXXXX";
	const char *created = mkdtemp(pattern);
	path_ = created ? created : "";
}

TempDir::~TempDir() {
	if (!path_.empty()) {
		nftw(path_.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
	}
}

bool WriteFile(const std::string &path, const std::string &content) {
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	out << content;
	return static_cast<bool>(out);
}

bool ReadFile(const std::string &path, std::string &content) {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		return false;
	}
	std::ostringstream buffer;
	buffer << in.rdbuf();
	content = buffer.str();
	return true;
}

bool PathExists(const std::string &path) {
	struct stat buffer;
	return stat(path.c_str(), &buffer) == 0;
}

bool MakeDirectories(const std::string &path) {
	std::string current;
	for (size_t i = 0; i < path.size(); i++) {
		current += path[i];
		if (path[i] == '/' || i == path.size() - 1) {
			if (!PathExists(current) && mkdir(current.c_str(), 0755) != 0) {
				return false;
			}
		}
	}
	return true;
}

std::vector<float> MakeTone(size_t count, uint32_t sample_rate, float frequency, float amplitude) {
	const double two_pi = 6.283185307179586;
	std::vector<float> samples(count);
	for (size_t i = 0; i < count; i++) {
		samples[i] = amplitude * static_cast<float>(std::sin(two_pi * frequency * i / sample_rate));
	}
	return samples;
}

} // namespace fakes
} // namespace voxprompt
