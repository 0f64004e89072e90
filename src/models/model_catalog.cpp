#include "voxprompt/model_catalog.hpp"

namespace voxprompt {

static const char *WHISPER_BASE_URL = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/";

static ModelDescriptor WhisperModel(const std::string &id, uint32_t size_mb, const std::string &description,
                                    const std::string &sha256) {
	ModelDescriptor model;
	model.id = id;
	model.remote_filename = "ggml-" + id + ".bin";
	model.size_mb = size_mb;
	model.description = description;
	model.download_url = std::string(WHISPER_BASE_URL) + model.remote_filename;
	model.sha256 = sha256;
	return model;
}

// English-only and older large variants carry no checksum
static std::vector<ModelDescriptor> BuildSpeechModels() {
	return {
	    WhisperModel("tiny", 75, "Tiny multilingual model (~75MB, fastest)",
	                 "be07e048e1e599ad46341c8d2a135645097a538221678b7acdd1b1919c6e1b21"),
	    WhisperModel("tiny.en", 75, "Tiny English-only model (~75MB, fastest)", ""),
	    WhisperModel("base", 142, "Base multilingual model (~142MB)",
	                 "60ed5bc3dd14eea856493d334349b405782ddcaf0028d4b5df4088345fba2efe"),
	    WhisperModel("base.en", 142, "Base English-only model (~142MB)", ""),
	    WhisperModel("small", 466, "Small multilingual model (~466MB)",
	                 "1be3a9b2063867b937e64e2ec7483364a79917e157fa98c5d94b5c1fffea987b"),
	    WhisperModel("small.en", 466, "Small English-only model (~466MB)", ""),
	    WhisperModel("medium", 1500, "Medium multilingual model (~1.5GB)",
	                 "6c14d5adee5f86394037b4e4e8b59f1673b6cee10e3cf0b11bbdbee79c156208"),
	    WhisperModel("medium.en", 1500, "Medium English-only model (~1.5GB)", ""),
	    WhisperModel("large-v2", 2900, "Large multilingual model v2 (~2.9GB)", ""),
	    WhisperModel("large-v3", 3100, "Large multilingual model v3 (~3.1GB, most accurate)",
	                 "64d182b440b98d5203c4f9bd541544d84c605196c4f7b845dfa11fb23594d1e2"),
	    WhisperModel("large-v3-turbo", 1600, "Large multilingual model v3 turbo (~1.6GB, fast + accurate)", ""),
	};
}

static std::vector<ModelDescriptor> BuildLanguageModels() {
	std::vector<ModelDescriptor> models;

	ModelDescriptor qwen3_4b;
	qwen3_4b.id = "qwen3-4b-instruct-q4km";
	qwen3_4b.remote_filename = "Qwen3-4B-Instruct-2507-Q4_K_M.gguf";
	qwen3_4b.size_mb = 2700;
	qwen3_4b.description = "Qwen3 4B, best quality for prompt optimization";
	qwen3_4b.download_url =
	    "https://huggingface.co/unsloth/Qwen3-4B-Instruct-2507-GGUF/resolve/main/Qwen3-4B-Instruct-2507-Q4_K_M.gguf";
	qwen3_4b.sha256 = "3605803b982cb64aead44f6c1b2ae36e3acdb41d8e46c8a94c6533bc4c67e597";
	models.push_back(qwen3_4b);

	ModelDescriptor qwen25_3b;
	qwen25_3b.id = "qwen2.5-3b-instruct-q4km";
	qwen25_3b.remote_filename = "qwen2.5-3b-instruct-q4_k_m.gguf";
	qwen25_3b.size_mb = 2020;
	qwen25_3b.description = "Qwen2.5 3B, great balance of speed and quality";
	qwen25_3b.download_url =
	    "https://huggingface.co/Qwen/Qwen2.5-3B-Instruct-GGUF/resolve/main/qwen2.5-3b-instruct-q4_k_m.gguf";
	qwen25_3b.sha256 = "626b4a6678b86442240e33df819e00132d3ba7dddfe1cdc4fbb18e0a9615c62d";
	models.push_back(qwen25_3b);

	ModelDescriptor qwen25_1_5b;
	qwen25_1_5b.id = "qwen2.5-1.5b-instruct-q4km";
	qwen25_1_5b.remote_filename = "qwen2.5-1.5b-instruct-q4_k_m.gguf";
	qwen25_1_5b.size_mb = 1010;
	qwen25_1_5b.description = "Qwen2.5 1.5B, smallest and fastest, minimal resource usage";
	qwen25_1_5b.download_url =
	    "https://huggingface.co/Qwen/Qwen2.5-1.5B-Instruct-GGUF/resolve/main/qwen2.5-1.5b-instruct-q4_k_m.gguf";
	qwen25_1_5b.sha256 = "6a1a2eb6d15622bf3c96857206351ba97e1af16c30d7a74ee38970e434e9407e";
	models.push_back(qwen25_1_5b);

	return models;
}

ModelCatalog::ModelCatalog(ModelCategory category, std::string directory_name, std::vector<ModelDescriptor> models)
    : category_(category), directory_name_(std::move(directory_name)), models_(std::move(models)) {
}

const ModelCatalog &ModelCatalog::Speech() {
	static const ModelCatalog catalog(ModelCategory::SPEECH, "whisper", BuildSpeechModels());
	return catalog;
}

const ModelCatalog &ModelCatalog::Language() {
	static const ModelCatalog catalog(ModelCategory::LANGUAGE, "llm", BuildLanguageModels());
	return catalog;
}

const ModelCatalog &ModelCatalog::ForCategory(ModelCategory category) {
	return category == ModelCategory::SPEECH ? Speech() : Language();
}

bool ModelCatalog::ParseCategory(const std::string &name, ModelCategory &category) {
	if (name == "speech" || name == "whisper") {
		category = ModelCategory::SPEECH;
		return true;
	}
	if (name == "language" || name == "llm") {
		category = ModelCategory::LANGUAGE;
		return true;
	}
	return false;
}

const char *ModelCatalog::CategoryToString(ModelCategory category) {
	return category == ModelCategory::SPEECH ? "speech" : "language";
}

const ModelDescriptor *ModelCatalog::Find(const std::string &id) const {
	for (const auto &model : models_) {
		if (model.id == id) {
			return &model;
		}
	}
	return nullptr;
}

} // namespace voxprompt
