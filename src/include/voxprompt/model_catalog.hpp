#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace voxprompt {

enum class ModelCategory { SPEECH, LANGUAGE };

struct ModelDescriptor {
	std::string id;
	std::string remote_filename;
	uint32_t size_mb;
	std::string description;
	std::string download_url;
	std::string sha256; // Lowercase hex; empty for legacy entries without a checksum
};

struct ModelInfo {
	ModelDescriptor descriptor;
	std::string file_path; // Empty when the path could not be resolved
	int64_t file_size;     // File size in bytes
	bool is_downloaded;    // Whether the model exists locally
};

// Immutable registry of downloadable models of one category
class ModelCatalog {
public:
	ModelCatalog(ModelCategory category, std::string directory_name, std::vector<ModelDescriptor> models);

	// Built-in whisper.cpp models
	static const ModelCatalog &Speech();
	// Built-in GGUF instruction models
	static const ModelCatalog &Language();
	static const ModelCatalog &ForCategory(ModelCategory category);

	// Accepts "speech"/"whisper" and "language"/"llm"
	static bool ParseCategory(const std::string &name, ModelCategory &category);
	static const char *CategoryToString(ModelCategory category);

	const ModelDescriptor *Find(const std::string &id) const;
	const std::vector<ModelDescriptor> &GetModels() const {
		return models_;
	}
	ModelCategory GetCategory() const {
		return category_;
	}
	// Subdirectory of the models root holding this category's files
	const std::string &GetDirectoryName() const {
		return directory_name_;
	}

private:
	ModelCategory category_;
	std::string directory_name_;
	std::vector<ModelDescriptor> models_;
};

} // namespace voxprompt
