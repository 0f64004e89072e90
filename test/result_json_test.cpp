#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "voxprompt/result_json.hpp"

using namespace voxprompt;

// =============================================================================
// EscapeJsonString / JsonObjectWriter
// =============================================================================

TEST(ResultJson, EscapesSpecialCharacters) {
	EXPECT_EQ(EscapeJsonString("say \"hi\""), "say \\\"hi\\\"");
	EXPECT_EQ(EscapeJsonString("C:\\models"), "C:\\\\models");
	EXPECT_EQ(EscapeJsonString("a\nb\tc\r"), "a\\nb\\tc\\r");
	EXPECT_EQ(EscapeJsonString(std::string("\x01", 1)), "\\u0001");
	EXPECT_EQ(EscapeJsonString(std::string("\x1f", 1)), "\\u001f");
	// UTF-8 passes through untouched
	EXPECT_EQ(EscapeJsonString("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(ResultJson, WriterBuildsFlatObject) {
	float bands[] = {0.0f, 0.5f, 1.0f};
	std::string json = JsonObjectWriter()
	                       .String("name", "vox")
	                       .Integer("count", 3)
	                       .Number("ratio", 0.25)
	                       .Bool("ok", true)
	                       .Null("missing")
	                       .FloatArray("bands", bands, 3)
	                       .Finish();

	EXPECT_EQ(json, "{\"name\":\"vox\",\"count\":3,\"ratio\":0.25,\"ok\":true,\"missing\":null,\"bands\":[0,0.5,1]}");
}

TEST(ResultJson, EmptyObject) {
	EXPECT_EQ(JsonObjectWriter().Finish(), "{}");
}

TEST(ResultJson, NonFiniteNumbersBecomeNull) {
	std::string json = JsonObjectWriter().Number("nan", std::numeric_limits<double>::quiet_NaN()).Finish();
	EXPECT_EQ(json, "{\"nan\":null}");
}

// =============================================================================
// Renderers
// =============================================================================

TEST(ResultJson, RenderError) {
	VoxError error(ErrorCode::NO_SPEECH_DETECTED, "No speech detected in recording");
	EXPECT_EQ(RenderError(error), "{\"error\":\"No speech detected in recording\",\"code\":\"NoSpeechDetected\"}");

	VoxError bare(ErrorCode::BUSY, "");
	EXPECT_EQ(RenderError(bare), "{\"error\":\"Busy\",\"code\":\"Busy\"}");
}

TEST(ResultJson, RenderSuccessfulPipelineResult) {
	PipelineResult result;
	result.success = true;
	result.raw_transcript = "um write a \"haiku\"";
	result.optimized_prompt = "Write a haiku.";
	result.mode = "clean";
	result.provider = "local";
	result.duration_secs = 2.5;
	result.history_id = "42";

	EXPECT_EQ(RenderPipelineResult(result),
	          "{\"raw_transcript\":\"um write a \\\"haiku\\\"\",\"optimized_prompt\":\"Write a haiku.\","
	          "\"mode\":\"clean\",\"provider\":\"local\",\"duration_secs\":2.5,\"degraded\":false,"
	          "\"history_id\":\"42\"}");
}

TEST(ResultJson, RenderDegradedPipelineResult) {
	PipelineResult result;
	result.success = true;
	result.raw_transcript = "hi";
	result.optimized_prompt = "hi";
	result.mode = "clean";
	result.provider = "local (failed: no model)";
	result.duration_secs = 1.0;
	result.degraded = true;
	result.degraded_reason = "no model";

	std::string json = RenderPipelineResult(result);
	EXPECT_NE(json.find("\"degraded\":true,\"degraded_reason\":\"no model\""), std::string::npos);
	EXPECT_NE(json.find("\"history_id\":null"), std::string::npos);
}

TEST(ResultJson, RenderFailedPipelineResultIsError) {
	PipelineResult result;
	result.error.Set(ErrorCode::NO_AUDIO_CAPTURED, "No audio samples captured");

	EXPECT_EQ(RenderPipelineResult(result), "{\"error\":\"No audio samples captured\",\"code\":\"NoAudioCaptured\"}");
}

TEST(ResultJson, RenderTranscription) {
	TranscriptionResult result;
	result.success = true;
	result.text = "hello";
	result.language = "en";
	result.duration_secs = 0.5;

	EXPECT_EQ(RenderTranscriptionResult(result), "{\"text\":\"hello\",\"language\":\"en\",\"duration_secs\":0.5}");
}

TEST(ResultJson, RenderDownloadState) {
	DownloadState state;
	state.model_id = "base";
	state.bytes_downloaded = 50;
	state.bytes_total = 200;
	state.fraction = 0.25;

	EXPECT_EQ(RenderDownloadState(state),
	          "{\"model_id\":\"base\",\"bytes_downloaded\":50,\"bytes_total\":200,\"fraction\":0.25}");
}

TEST(ResultJson, RenderCaptureSummary) {
	CapturedAudio audio;
	audio.samples.assign(22050, 0.0f);
	audio.sample_rate = 44100;
	audio.channels = 1;

	EXPECT_EQ(RenderCaptureSummary(audio), "{\"sample_count\":22050,\"sample_rate\":44100,\"duration_secs\":0.5}");
}

TEST(ResultJson, RenderLevels) {
	CaptureLevels levels {0.5f, 1.0f, 480, 16000};
	SignalProcessor::BandLevels bands;
	bands.fill(0.0f);
	bands[0] = 0.75f;

	EXPECT_EQ(RenderLevels(levels, bands),
	          "{\"rms\":0.5,\"peak\":1,\"sample_count\":480,\"bands\":[0.75,0,0,0,0,0,0,0]}");
}
