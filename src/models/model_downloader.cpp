#include "voxprompt/model_downloader.hpp"
#include "voxprompt/inference_engine.hpp"
#include "voxprompt/logger.hpp"
#include "voxprompt/worker_pool.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sys/stat.h>

#ifdef _WIN32
#include <direct.h>
#endif

namespace voxprompt {

constexpr const char *ModelDownloader::PARTIAL_SUFFIX;

// Helper to create directories recursively
static bool CreateDirectories(const std::string &path) {
	std::string current;
	for (size_t i = 0; i < path.size(); i++) {
		current += path[i];
		if (path[i] == '/' || path[i] == '\\' || i == path.size() - 1) {
			struct stat buffer;
			if (stat(current.c_str(), &buffer) != 0) {
#ifdef _WIN32
				if (_mkdir(current.c_str()) != 0 && errno != EEXIST) {
					return false;
				}
#else
				if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
					return false;
				}
#endif
			}
		}
	}
	return true;
}

static bool FileExists(const std::string &path, int64_t *size = nullptr) {
	struct stat buffer;
	if (stat(path.c_str(), &buffer) != 0) {
		return false;
	}
	if (size) {
		*size = static_cast<int64_t>(buffer.st_size);
	}
	return true;
}

static std::string ParentDirectory(const std::string &path) {
	auto pos = path.find_last_of("/\\");
	return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

static bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
	return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
		       return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
	       });
}

static std::string ToHex(const unsigned char *data, size_t size) {
	static const char *digits = "0123456789abcdef";
	std::string hex;
	hex.reserve(size * 2);
	for (size_t i = 0; i < size; i++) {
		hex += digits[data[i] >> 4];
		hex += digits[data[i] & 0xf];
	}
	return hex;
}

// ============================================================================
// DownloadSink - writes the body to the partial file while hashing it
// ============================================================================

class DownloadSink : public HttpResponseSink {
public:
	DownloadSink(ModelDownloader &downloader, std::string model_id, std::string partial_path)
	    : status_(0), bad_status_(false), io_error_(false), bytes_(0), downloader_(downloader),
	      model_id_(std::move(model_id)), partial_path_(std::move(partial_path)), total_(0),
	      digest_(EVP_MD_CTX_new()) {
	}

	~DownloadSink() override {
		if (file_.is_open()) {
			file_.close();
		}
		EVP_MD_CTX_free(digest_);
	}

	bool OnResponse(long status_code, int64_t content_length) override {
		status_ = status_code;
		if (status_code < 200 || status_code >= 300) {
			bad_status_ = true;
			return false;
		}
		if (!digest_ || EVP_DigestInit_ex(digest_, EVP_sha256(), nullptr) != 1) {
			io_error_ = true;
			error_ = "Failed to initialize SHA-256";
			return false;
		}
		file_.open(partial_path_, std::ios::binary | std::ios::trunc);
		if (!file_.is_open()) {
			io_error_ = true;
			error_ = "Cannot write to " + partial_path_;
			return false;
		}
		total_ = content_length > 0 ? static_cast<uint64_t>(content_length) : 0;
		downloader_.SetProgress(model_id_, 0, total_);
		return true;
	}

	bool OnData(const char *data, size_t size) override {
		file_.write(data, static_cast<std::streamsize>(size));
		if (!file_) {
			io_error_ = true;
			error_ = "Failed to write to " + partial_path_;
			return false;
		}
		EVP_DigestUpdate(digest_, data, size);
		bytes_ += size;
		downloader_.SetProgress(model_id_, bytes_, total_);
		return true;
	}

	bool Finish(std::string &hex) {
		file_.close();
		if (file_.fail()) {
			io_error_ = true;
			error_ = "Failed to flush " + partial_path_;
			return false;
		}
		unsigned char hash[EVP_MAX_MD_SIZE];
		unsigned int hash_len = 0;
		if (EVP_DigestFinal_ex(digest_, hash, &hash_len) != 1) {
			io_error_ = true;
			error_ = "Failed to finalize SHA-256";
			return false;
		}
		hex = ToHex(hash, hash_len);
		return true;
	}

	long status_;
	bool bad_status_;
	bool io_error_;
	std::string error_;
	uint64_t bytes_;

private:
	ModelDownloader &downloader_;
	std::string model_id_;
	std::string partial_path_;
	uint64_t total_;
	EVP_MD_CTX *digest_;
	std::ofstream file_;
};

// ============================================================================
// ModelDownloader
// ============================================================================

ModelDownloader::ModelDownloader(std::shared_ptr<HttpTransport> transport, WorkerPool &io_pool,
                                 InferenceEngine *engine)
    : transport_(std::move(transport)), io_pool_(io_pool), engine_(engine), download_active_(false),
      has_progress_(false) {
	progress_.bytes_downloaded = 0;
	progress_.bytes_total = 0;
	progress_.fraction = 0.0;
}

bool ModelDownloader::IsSafeFilename(const std::string &filename) {
	if (filename.empty() || filename == "." || filename == "..") {
		return false;
	}
	if (filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) {
		return false;
	}
	return filename.find("..") == std::string::npos;
}

bool ModelDownloader::GetModelPath(const ModelCatalog &catalog, const std::string &model_id,
                                   const std::string &models_root, std::string &path, VoxError &error) {
	const ModelDescriptor *model = catalog.Find(model_id);
	if (!model) {
		error.Set(ErrorCode::UNKNOWN_MODEL, std::string("Unknown ") + ModelCatalog::CategoryToString(catalog.GetCategory()) +
		                                        " model: " + model_id);
		return false;
	}
	if (!IsSafeFilename(model->remote_filename)) {
		error.Set(ErrorCode::INVALID_MODEL_FILENAME, "Invalid model filename: " + model->remote_filename);
		return false;
	}
	path = models_root + "/" + catalog.GetDirectoryName() + "/" + model->remote_filename;
	return true;
}

bool ModelDownloader::IsModelDownloaded(const ModelCatalog &catalog, const std::string &model_id,
                                        const std::string &models_root) {
	std::string path;
	VoxError error;
	return GetModelPath(catalog, model_id, models_root, path, error) && FileExists(path);
}

std::vector<ModelInfo> ModelDownloader::ListModels(const ModelCatalog &catalog, const std::string &models_root) {
	std::vector<ModelInfo> models;
	for (const auto &descriptor : catalog.GetModels()) {
		ModelInfo info;
		info.descriptor = descriptor;
		info.file_size = 0;
		info.is_downloaded = false;
		VoxError error;
		if (GetModelPath(catalog, descriptor.id, models_root, info.file_path, error)) {
			info.is_downloaded = FileExists(info.file_path, &info.file_size);
		}
		models.push_back(info);
	}
	return models;
}

std::future<DownloadResult> ModelDownloader::DownloadAsync(const ModelCatalog &catalog, const std::string &model_id,
                                                           const std::string &models_root) {
	const ModelCatalog *catalog_ptr = &catalog;
	return io_pool_.Submit(
	    [this, catalog_ptr, model_id, models_root]() { return Download(*catalog_ptr, model_id, models_root); });
}

DownloadResult ModelDownloader::Download(const ModelCatalog &catalog, const std::string &model_id,
                                         const std::string &models_root) {
	DownloadResult result;
	result.model_id = model_id;

	if (!GetModelPath(catalog, model_id, models_root, result.path, result.error)) {
		return result;
	}
	const ModelDescriptor &model = *catalog.Find(model_id);

	int64_t existing_size = 0;
	if (FileExists(result.path, &existing_size)) {
		result.success = true;
		result.already_present = true;
		result.bytes = static_cast<uint64_t>(existing_size);
		return result;
	}

	bool expected = false;
	if (!download_active_.compare_exchange_strong(expected, true)) {
		result.error.Set(ErrorCode::BUSY, "Another model download is already in progress");
		return result;
	}

	// Progress must be gone on every exit path
	struct ActiveGuard {
		ModelDownloader &downloader;
		~ActiveGuard() {
			downloader.ClearProgress();
			downloader.download_active_.store(false);
		}
	} guard {*this};

	std::string directory = ParentDirectory(result.path);
	if (!CreateDirectories(directory)) {
		result.error.Set(ErrorCode::IO_ERROR, "Failed to create model directory: " + directory);
		return result;
	}

	const std::string partial_path = result.path + PARTIAL_SUFFIX;
	std::remove(partial_path.c_str());

	VOXPROMPT_LOG_INFO("download", "Downloading " + model.id + " from " + model.download_url);
	SetProgress(model.id, 0, 0);

	DownloadSink sink(*this, model.id, partial_path);
	HttpResult http = transport_->Get(model.download_url, sink);
	result.http_status = sink.bad_status_ ? sink.status_ : http.status_code;
	result.bytes = sink.bytes_;

	if (sink.bad_status_) {
		result.error.Set(ErrorCode::DOWNLOAD_FAILED,
		                 "Download of " + model.id + " failed with HTTP status " + std::to_string(sink.status_));
		VOXPROMPT_LOG_WARNING("download", result.error.ToString());
		return result;
	}

	std::string actual;
	if (sink.io_error_ || !http.completed || !sink.Finish(actual)) {
		std::remove(partial_path.c_str());
		if (sink.io_error_) {
			result.error.Set(ErrorCode::IO_ERROR, "Download of " + model.id + " failed: " + sink.error_);
		} else {
			result.error.Set(ErrorCode::DOWNLOAD_FAILED, "Download of " + model.id + " failed: " + http.error);
		}
		VOXPROMPT_LOG_WARNING("download", result.error.ToString());
		return result;
	}

	if (!model.sha256.empty() && !EqualsIgnoreCase(model.sha256, actual)) {
		std::remove(partial_path.c_str());
		result.expected_sha256 = model.sha256;
		result.actual_sha256 = actual;
		result.error.Set(ErrorCode::INTEGRITY_ERROR, "Checksum mismatch for " + model.id + ": expected " +
		                                                 model.sha256 + ", got " + actual);
		VOXPROMPT_LOG_ERROR("download", result.error.ToString());
		return result;
	}
	if (model.sha256.empty()) {
		VOXPROMPT_LOG_WARNING("download", "No checksum known for " + model.id + ", skipping verification");
	}

	if (std::rename(partial_path.c_str(), result.path.c_str()) != 0) {
		std::remove(partial_path.c_str());
		result.error.Set(ErrorCode::IO_ERROR, "Failed to move downloaded file to " + result.path);
		return result;
	}

	VOXPROMPT_LOG_INFO("download", "Downloaded " + model.id + " (" + std::to_string(result.bytes) + " bytes)");
	result.success = true;
	return result;
}

bool ModelDownloader::DeleteModel(const ModelCatalog &catalog, const std::string &model_id,
                                  const std::string &models_root, VoxError &error) {
	std::string path;
	if (!GetModelPath(catalog, model_id, models_root, path, error)) {
		return false;
	}
	if (!FileExists(path)) {
		error.Set(ErrorCode::NOT_DOWNLOADED, "Model '" + model_id + "' is not downloaded");
		return false;
	}

	auto remove_file = [&path]() {
		return std::remove(path.c_str()) == 0;
	};
	bool removed;
	if (engine_) {
		// Unload and remove under the engine slot so no Load can pick the file up in between
		if (engine_->IsLoaded(path)) {
			VOXPROMPT_LOG_INFO("download", "Unloading " + model_id + " before deleting it");
		}
		removed = engine_->UnloadAndRun(path, remove_file);
	} else {
		removed = remove_file();
	}

	if (!removed) {
		error.Set(ErrorCode::IO_ERROR, "Failed to delete model file: " + path);
		return false;
	}
	VOXPROMPT_LOG_INFO("download", "Deleted " + model_id);
	return true;
}

bool ModelDownloader::GetProgress(DownloadState &state) const {
	std::lock_guard<std::mutex> lock(progress_mutex_);
	if (!has_progress_) {
		return false;
	}
	state = progress_;
	return true;
}

void ModelDownloader::SetProgress(const std::string &model_id, uint64_t downloaded, uint64_t total) {
	std::lock_guard<std::mutex> lock(progress_mutex_);
	has_progress_ = true;
	progress_.model_id = model_id;
	progress_.bytes_downloaded = downloaded;
	progress_.bytes_total = total;
	progress_.fraction = total > 0 ? static_cast<double>(downloaded) / static_cast<double>(total) : 0.0;
}

void ModelDownloader::ClearProgress() {
	std::lock_guard<std::mutex> lock(progress_mutex_);
	has_progress_ = false;
	progress_ = DownloadState();
	progress_.bytes_downloaded = 0;
	progress_.bytes_total = 0;
	progress_.fraction = 0.0;
}

} // namespace voxprompt
