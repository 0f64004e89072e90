#pragma once

#include "voxprompt/http_client.hpp"
#include "voxprompt/model_catalog.hpp"
#include "voxprompt/vox_error.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxprompt {

class InferenceEngine;
class WorkerPool;

// Progress of the download currently in flight
struct DownloadState {
	std::string model_id;
	uint64_t bytes_downloaded;
	uint64_t bytes_total; // 0 when the server sent no length
	double fraction;
};

struct DownloadResult {
	bool success;
	bool already_present;
	std::string model_id;
	std::string path;
	uint64_t bytes;
	long http_status;
	// Filled on INTEGRITY_ERROR
	std::string expected_sha256;
	std::string actual_sha256;
	VoxError error;

	DownloadResult() : success(false), already_present(false), bytes(0), http_status(0) {
	}
};

// Fetches catalog models into <models_root>/<category dir>/<remote_filename>.
// Data is streamed into "<file>.part" and only renamed into place after the
// SHA-256 matched, so the final path never holds an unverified file.
class ModelDownloader {
public:
	static constexpr const char *PARTIAL_SUFFIX = ".part";

	ModelDownloader(std::shared_ptr<HttpTransport> transport, WorkerPool &io_pool, InferenceEngine *engine = nullptr);

	// Runs Download on the I/O pool. The catalog must outlive the future.
	std::future<DownloadResult> DownloadAsync(const ModelCatalog &catalog, const std::string &model_id,
	                                          const std::string &models_root);

	// Blocking download on the calling thread. Only one download may be in
	// flight; a second one fails with BUSY.
	DownloadResult Download(const ModelCatalog &catalog, const std::string &model_id, const std::string &models_root);

	// Snapshot of the active download; false when none is running
	bool GetProgress(DownloadState &state) const;

	// Unloads the inference engine first when it holds this file
	bool DeleteModel(const ModelCatalog &catalog, const std::string &model_id, const std::string &models_root,
	                 VoxError &error);

	static bool GetModelPath(const ModelCatalog &catalog, const std::string &model_id,
	                         const std::string &models_root, std::string &path, VoxError &error);
	static bool IsModelDownloaded(const ModelCatalog &catalog, const std::string &model_id,
	                              const std::string &models_root);
	static std::vector<ModelInfo> ListModels(const ModelCatalog &catalog, const std::string &models_root);

	// Rejects separators, parent-directory segments and empty names
	static bool IsSafeFilename(const std::string &filename);

private:
	friend class DownloadSink;

	void SetProgress(const std::string &model_id, uint64_t downloaded, uint64_t total);
	void ClearProgress();

	std::shared_ptr<HttpTransport> transport_;
	WorkerPool &io_pool_;
	InferenceEngine *engine_;

	std::atomic<bool> download_active_;
	mutable std::mutex progress_mutex_;
	bool has_progress_;
	DownloadState progress_;
};

} // namespace voxprompt
