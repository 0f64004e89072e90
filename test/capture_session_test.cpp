#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "test_fakes.hpp"
#include "voxprompt/capture_session.hpp"

using voxprompt::CapturedAudio;
using voxprompt::CaptureSession;
using voxprompt::ErrorCode;
using voxprompt::VoxError;
using voxprompt::fakes::FakeAudioBackend;

namespace {

class CaptureSessionTest : public ::testing::Test {
protected:
	void SetUp() override {
		backend = std::make_shared<FakeAudioBackend>();
		session = std::make_unique<CaptureSession>(backend);
	}

	std::shared_ptr<FakeAudioBackend> backend;
	std::unique_ptr<CaptureSession> session;
};

} // namespace

TEST_F(CaptureSessionTest, StopWhileIdleReturnsEmpty) {
	CapturedAudio audio = session->Stop();

	EXPECT_TRUE(audio.samples.empty());
	EXPECT_EQ(audio.sample_rate, 44100u);
	EXPECT_FALSE(session->IsRecording());
}

TEST_F(CaptureSessionTest, StartStopCollectsSamples) {
	VoxError error;
	ASSERT_TRUE(session->Start("", nullptr, error));
	EXPECT_TRUE(session->IsRecording());

	ASSERT_TRUE(backend->Push(std::vector<float>(480, 0.25f), 1));
	ASSERT_TRUE(backend->Push(std::vector<float>(480, -0.25f), 1));

	auto levels = session->GetLevels();
	EXPECT_EQ(levels.sample_count, 960u);
	EXPECT_EQ(levels.sample_rate, 48000u);
	EXPECT_FLOAT_EQ(levels.peak, 0.25f);

	CapturedAudio audio = session->Stop();
	EXPECT_FALSE(session->IsRecording());
	EXPECT_EQ(audio.samples.size(), 960u);
	EXPECT_EQ(audio.sample_rate, 48000u);
	EXPECT_FLOAT_EQ(audio.samples.front(), 0.25f);
	EXPECT_FLOAT_EQ(audio.samples.back(), -0.25f);

	// Stream is gone after stop
	EXPECT_EQ(backend->close_count.load(), 1);
	EXPECT_FALSE(backend->Push(std::vector<float>(10, 0.1f), 1));
}

TEST_F(CaptureSessionTest, DoubleStartOpensOneStream) {
	VoxError error;
	ASSERT_TRUE(session->Start("", nullptr, error));
	ASSERT_TRUE(session->Start("", nullptr, error));

	EXPECT_EQ(backend->open_count.load(), 1);
	EXPECT_FALSE(error.HasError());
	session->Stop();
}

TEST_F(CaptureSessionTest, StopClearsAccumulator) {
	VoxError error;
	ASSERT_TRUE(session->Start("", nullptr, error));
	backend->Push(std::vector<float>(100, 0.1f), 1);
	session->Stop();

	ASSERT_TRUE(session->Start("", nullptr, error));
	backend->Push(std::vector<float>(50, 0.1f), 1);
	CapturedAudio audio = session->Stop();

	EXPECT_EQ(audio.samples.size(), 50u);
	EXPECT_EQ(session->GetLevels().sample_count, 0u);
}

TEST_F(CaptureSessionTest, StereoIsDownmixed) {
	backend->channels = 2;
	VoxError error;
	ASSERT_TRUE(session->Start("", nullptr, error));

	// Interleaved L/R pairs
	ASSERT_TRUE(backend->Push({1.0f, 0.0f, 0.5f, 0.5f, -1.0f, 1.0f}, 2));

	CapturedAudio audio = session->Stop();
	ASSERT_EQ(audio.samples.size(), 3u);
	EXPECT_FLOAT_EQ(audio.samples[0], 0.5f);
	EXPECT_FLOAT_EQ(audio.samples[1], 0.5f);
	EXPECT_FLOAT_EQ(audio.samples[2], 0.0f);
	EXPECT_EQ(audio.channels, 2);
}

TEST_F(CaptureSessionTest, LevelCallbackSeesEveryBuffer) {
	std::atomic<int> calls(0);
	std::atomic<float> last_peak(0.0f);
	VoxError error;
	ASSERT_TRUE(session->Start(
	    "",
	    [&](float rms, float peak) {
		    calls++;
		    last_peak.store(peak);
	    },
	    error));

	backend->Push(std::vector<float>(64, 0.5f), 1);
	backend->Push(std::vector<float>(64, 0.75f), 1);
	session->Stop();

	EXPECT_EQ(calls.load(), 2);
	EXPECT_FLOAT_EQ(last_peak.load(), 0.75f);
}

TEST_F(CaptureSessionTest, UnknownDeviceFails) {
	VoxError error;
	EXPECT_FALSE(session->Start("No Such Device", nullptr, error));
	EXPECT_EQ(error.code, ErrorCode::DEVICE_NOT_FOUND);
	EXPECT_FALSE(session->IsRecording());
}

TEST_F(CaptureSessionTest, StreamStartFailureLeavesSessionIdle) {
	backend->fail_start = true;
	VoxError error;

	EXPECT_FALSE(session->Start("", nullptr, error));
	EXPECT_EQ(error.code, ErrorCode::STREAM_ERROR);
	EXPECT_FALSE(session->IsRecording());
	EXPECT_EQ(backend->close_count.load(), 1);
}

TEST_F(CaptureSessionTest, BandLevelsFromRecentAudio) {
	VoxError error;
	ASSERT_TRUE(session->Start("", nullptr, error));

	auto quiet = session->GetBandLevels();
	for (float level : quiet) {
		EXPECT_EQ(level, 0.0f);
	}

	backend->Push(voxprompt::fakes::MakeTone(2048, 48000, 1000.0f, 0.8f), 1);
	auto bands = session->GetBandLevels();
	float total = 0.0f;
	for (float level : bands) {
		EXPECT_GE(level, 0.0f);
		EXPECT_LE(level, 1.0f);
		total += level;
	}
	EXPECT_GT(total, 0.0f);
	session->Stop();
}

TEST_F(CaptureSessionTest, ConcurrentStartStopIsConsistent) {
	std::vector<std::thread> threads;
	for (int i = 0; i < 4; i++) {
		threads.emplace_back([this, i]() {
			for (int round = 0; round < 20; round++) {
				if ((round + i) % 2 == 0) {
					VoxError error;
					session->Start("", nullptr, error);
				} else {
					session->Stop();
				}
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}
	session->Stop();

	EXPECT_FALSE(session->IsRecording());
	EXPECT_EQ(backend->open_count.load(), backend->close_count.load());
}

TEST_F(CaptureSessionTest, ListDevicesComesFromBackend) {
	auto devices = session->ListDevices();
	ASSERT_EQ(devices.size(), 2u);
	EXPECT_TRUE(devices[0].is_default);
}
