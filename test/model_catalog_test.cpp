#include <gtest/gtest.h>

#include <set>
#include <string>

#include "voxprompt/model_catalog.hpp"
#include "voxprompt/model_downloader.hpp"

using voxprompt::ModelCatalog;
using voxprompt::ModelCategory;
using voxprompt::ModelDownloader;

TEST(ModelCatalog, ParseCategoryAliases) {
	ModelCategory category;

	ASSERT_TRUE(ModelCatalog::ParseCategory("whisper", category));
	EXPECT_EQ(category, ModelCategory::SPEECH);
	ASSERT_TRUE(ModelCatalog::ParseCategory("speech", category));
	EXPECT_EQ(category, ModelCategory::SPEECH);
	ASSERT_TRUE(ModelCatalog::ParseCategory("llm", category));
	EXPECT_EQ(category, ModelCategory::LANGUAGE);
	ASSERT_TRUE(ModelCatalog::ParseCategory("language", category));
	EXPECT_EQ(category, ModelCategory::LANGUAGE);

	EXPECT_FALSE(ModelCatalog::ParseCategory("video", category));
	EXPECT_FALSE(ModelCatalog::ParseCategory("", category));
}

TEST(ModelCatalog, CategoryNames) {
	EXPECT_STREQ(ModelCatalog::CategoryToString(ModelCategory::SPEECH), "speech");
	EXPECT_STREQ(ModelCatalog::CategoryToString(ModelCategory::LANGUAGE), "language");
	EXPECT_EQ(&ModelCatalog::ForCategory(ModelCategory::SPEECH), &ModelCatalog::Speech());
	EXPECT_EQ(&ModelCatalog::ForCategory(ModelCategory::LANGUAGE), &ModelCatalog::Language());
}

TEST(ModelCatalog, SpeechCatalogContents) {
	const auto &catalog = ModelCatalog::Speech();
	EXPECT_EQ(catalog.GetCategory(), ModelCategory::SPEECH);
	EXPECT_EQ(catalog.GetDirectoryName(), "whisper");

	const auto *base = catalog.Find("base");
	ASSERT_NE(base, nullptr);
	EXPECT_EQ(base->remote_filename, "ggml-base.bin");
	EXPECT_EQ(base->download_url, "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.bin");
	EXPECT_EQ(base->sha256.size(), 64u);

	// English-only variants are listed without a checksum
	const auto *tiny_en = catalog.Find("tiny.en");
	ASSERT_NE(tiny_en, nullptr);
	EXPECT_TRUE(tiny_en->sha256.empty());

	EXPECT_EQ(catalog.Find("huge"), nullptr);
}

TEST(ModelCatalog, LanguageCatalogContents) {
	const auto &catalog = ModelCatalog::Language();
	EXPECT_EQ(catalog.GetDirectoryName(), "llm");

	const auto *qwen = catalog.Find("qwen3-4b-instruct-q4km");
	ASSERT_NE(qwen, nullptr);
	EXPECT_EQ(qwen->remote_filename, "Qwen3-4B-Instruct-2507-Q4_K_M.gguf");
	EXPECT_NE(catalog.Find("qwen2.5-1.5b-instruct-q4km"), nullptr);
}

TEST(ModelCatalog, EntriesAreWellFormed) {
	for (const auto *catalog : {&ModelCatalog::Speech(), &ModelCatalog::Language()}) {
		std::set<std::string> ids;
		for (const auto &model : catalog->GetModels()) {
			EXPECT_TRUE(ids.insert(model.id).second) << "duplicate id " << model.id;
			EXPECT_TRUE(ModelDownloader::IsSafeFilename(model.remote_filename)) << model.remote_filename;
			EXPECT_EQ(model.download_url.compare(0, 8, "https://"), 0) << model.download_url;
			EXPECT_GT(model.size_mb, 0u);
			if (!model.sha256.empty()) {
				EXPECT_EQ(model.sha256.size(), 64u) << model.id;
				EXPECT_EQ(model.sha256.find_first_not_of("0123456789abcdef"), std::string::npos) << model.id;
			}
		}
	}
}
