#include <gtest/gtest.h>

#include <string>

#include "voxprompt/vox_error.hpp"

using namespace voxprompt;

TEST(VoxError, SetClearAndFormat) {
	VoxError error;
	EXPECT_FALSE(error.HasError());
	EXPECT_EQ(error.ToString(), "");

	error.Set(ErrorCode::INTEGRITY_ERROR, "Checksum mismatch");
	EXPECT_TRUE(error.HasError());
	EXPECT_EQ(error.ToString(), "Checksum mismatch");
	EXPECT_STREQ(ErrorCodeToString(error.code), "IntegrityError");

	error.Clear();
	EXPECT_FALSE(error.HasError());
	EXPECT_TRUE(error.message.empty());

	VoxError bare(ErrorCode::NOT_LOADED, "");
	EXPECT_EQ(bare.ToString(), "NotLoaded");
}

TEST(VoxError, CodeNames) {
	EXPECT_STREQ(ErrorCodeToString(ErrorCode::NONE), "None");
	EXPECT_STREQ(ErrorCodeToString(ErrorCode::BUSY), "Busy");
	EXPECT_STREQ(ErrorCodeToString(ErrorCode::GENERATION_ERROR), "GenerationError");
	EXPECT_STREQ(ErrorCodeToString(ErrorCode::NO_SPEECH_DETECTED), "NoSpeechDetected");
}
