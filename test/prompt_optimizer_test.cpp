#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "test_fakes.hpp"
#include "voxprompt/inference_engine.hpp"
#include "voxprompt/model_catalog.hpp"
#include "voxprompt/prompt_optimizer.hpp"
#include "voxprompt/worker_pool.hpp"

using namespace voxprompt;
using namespace voxprompt::fakes;

namespace {

const char *TEST_MODEL_ID = "qwen2.5-1.5b-instruct-q4km";

class PromptOptimizerTest : public ::testing::Test {
protected:
	PromptOptimizerTest()
	    : backend(std::make_shared<FakeLanguageModelBackend>()), engine(backend), pool("inference", 1),
	      optimizer(engine, ModelCatalog::Language(), pool) {
		settings.data_path = temp.Path();
		settings.llm_model = TEST_MODEL_ID;
		settings.prompt_mode = "clean";
		backend->script.pieces = {"Write a haiku about autumn."};
	}

	void InstallModel() {
		std::string dir = settings.GetModelsRoot() + "/llm";
		ASSERT_TRUE(MakeDirectories(dir));
		ASSERT_TRUE(WriteFile(dir + "/qwen2.5-1.5b-instruct-q4_k_m.gguf", "GGUF"));
	}

	std::string SystemPromptSeen() const {
		const auto &messages = backend->last_model->last_messages;
		return !messages.empty() && messages[0].role == "system" ? messages[0].content : std::string();
	}

	TempDir temp;
	VoxPromptConfig settings;
	std::shared_ptr<FakeLanguageModelBackend> backend;
	InferenceEngine engine;
	WorkerPool pool;
	PromptOptimizer optimizer;
};

} // namespace

TEST_F(PromptOptimizerTest, RawModePassesTranscriptThrough) {
	settings.prompt_mode = "raw";

	auto result = optimizer.Optimize("  um, write a haiku  ", settings);

	EXPECT_EQ(result.mode, "raw");
	EXPECT_EQ(result.raw_transcript, "um, write a haiku");
	EXPECT_EQ(result.optimized_prompt, "um, write a haiku");
	EXPECT_EQ(result.provider, "none");
	EXPECT_FALSE(result.degraded);
	EXPECT_EQ(backend->load_count.load(), 0);
}

TEST_F(PromptOptimizerTest, EmptyTranscriptProducesEmptyResult) {
	InstallModel();

	auto result = optimizer.Optimize(" \n ", settings);

	EXPECT_TRUE(result.raw_transcript.empty());
	EXPECT_TRUE(result.optimized_prompt.empty());
	EXPECT_EQ(result.provider, "none");
	EXPECT_FALSE(result.degraded);
	EXPECT_EQ(backend->load_count.load(), 0);
}

TEST_F(PromptOptimizerTest, MissingModelDegradesToRawTranscript) {
	auto result = optimizer.Optimize("um write a haiku about autumn", settings);

	EXPECT_TRUE(result.degraded);
	EXPECT_EQ(result.optimized_prompt, "um write a haiku about autumn");
	EXPECT_EQ(result.degraded_reason, "Local LLM model 'qwen2.5-1.5b-instruct-q4km' not downloaded. Download it "
	                                  "with voxprompt_download_model.");
	EXPECT_EQ(result.provider, "local (failed: " + result.degraded_reason + ")");
	EXPECT_EQ(result.mode, "clean");
}

TEST_F(PromptOptimizerTest, OptimizesWithLocalModel) {
	InstallModel();

	auto result = optimizer.Optimize("um write a haiku about autumn", settings);

	EXPECT_FALSE(result.degraded);
	EXPECT_EQ(result.provider, "local");
	EXPECT_EQ(result.optimized_prompt, "Write a haiku about autumn.");
	EXPECT_EQ(result.raw_transcript, "um write a haiku about autumn");
	EXPECT_EQ(SystemPromptSeen(), PromptOptimizer::GetSystemPrompt(PromptMode::CLEAN));
}

TEST_F(PromptOptimizerTest, LoadedModelIsReused) {
	InstallModel();

	optimizer.Optimize("first", settings);
	optimizer.Optimize("second", settings);

	EXPECT_EQ(backend->load_count.load(), 1);
}

TEST_F(PromptOptimizerTest, EachModeUsesItsSystemPrompt) {
	InstallModel();

	settings.prompt_mode = "Technical";
	auto result = optimizer.Optimize("make a rest endpoint", settings);
	EXPECT_EQ(result.mode, "technical");
	EXPECT_EQ(SystemPromptSeen(), PromptOptimizer::GetSystemPrompt(PromptMode::TECHNICAL));

	settings.prompt_mode = "code";
	optimizer.Optimize("make a rest endpoint", settings);
	EXPECT_EQ(SystemPromptSeen(), PromptOptimizer::GetSystemPrompt(PromptMode::CODE));
}

TEST_F(PromptOptimizerTest, CustomModeUsesConfiguredPrompt) {
	InstallModel();
	settings.prompt_mode = "custom";
	settings.custom_system_prompt = "Translate to pirate speak.";

	auto result = optimizer.Optimize("hello friend", settings);

	EXPECT_EQ(result.mode, "custom");
	EXPECT_EQ(SystemPromptSeen(), "Translate to pirate speak.");
}

TEST_F(PromptOptimizerTest, CustomModeWithoutPromptFallsBack) {
	InstallModel();
	settings.prompt_mode = "custom";
	settings.custom_system_prompt = "";

	optimizer.Optimize("hello friend", settings);

	EXPECT_EQ(SystemPromptSeen(), PromptOptimizer::CUSTOM_FALLBACK_PROMPT);
}

TEST_F(PromptOptimizerTest, UnknownModeFallsBackToClean) {
	InstallModel();
	settings.prompt_mode = "shakespearean";

	auto result = optimizer.Optimize("hello friend", settings);

	EXPECT_EQ(result.mode, "clean");
	EXPECT_EQ(SystemPromptSeen(), PromptOptimizer::GetSystemPrompt(PromptMode::CLEAN));
}

TEST_F(PromptOptimizerTest, LoadFailureDegrades) {
	InstallModel();
	backend->fail_load = true;

	auto result = optimizer.Optimize("hello friend", settings);

	EXPECT_TRUE(result.degraded);
	EXPECT_EQ(result.optimized_prompt, "hello friend");
	EXPECT_NE(result.provider.find("local (failed: Failed to load model"), std::string::npos);
}

TEST_F(PromptOptimizerTest, ThinkingOnlyOutputDegrades) {
	InstallModel();
	backend->script.pieces = {"<think>", "never finishes"};

	auto result = optimizer.Optimize("hello friend", settings);

	EXPECT_TRUE(result.degraded);
	EXPECT_EQ(result.optimized_prompt, "hello friend");
	EXPECT_EQ(result.degraded_reason, "Language model returned an empty response");
}

TEST_F(PromptOptimizerTest, OptimizeAsyncRunsOnPool) {
	InstallModel();

	auto result = optimizer.OptimizeAsync("hello friend", settings).get();

	EXPECT_EQ(result.provider, "local");
	EXPECT_EQ(result.optimized_prompt, "Write a haiku about autumn.");
}

TEST_F(PromptOptimizerTest, EnsureModelLoadedReportsUnknownModel) {
	settings.llm_model = "gpt-17";
	VoxError error;

	EXPECT_FALSE(optimizer.EnsureModelLoaded(settings, error));
	EXPECT_EQ(error.code, ErrorCode::UNKNOWN_MODEL);
}

TEST(PromptMode, ParseAndFormat) {
	PromptMode mode;
	ASSERT_TRUE(PromptOptimizer::ParsePromptMode("VERBATIM", mode));
	EXPECT_EQ(mode, PromptMode::VERBATIM);
	EXPECT_STREQ(PromptOptimizer::PromptModeToString(mode), "verbatim");
	EXPECT_FALSE(PromptOptimizer::ParsePromptMode("loud", mode));

	EXPECT_STREQ(PromptOptimizer::GetSystemPrompt(PromptMode::RAW), "");
	EXPECT_STREQ(PromptOptimizer::GetSystemPrompt(PromptMode::CUSTOM), "");
	EXPECT_NE(std::string(PromptOptimizer::GetSystemPrompt(PromptMode::FORMAL)).find("Output ONLY"),
	          std::string::npos);
}
