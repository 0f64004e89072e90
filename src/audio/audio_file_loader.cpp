#include "voxprompt/audio_file_loader.hpp"
#include "voxprompt/logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/log.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace voxprompt {

// Owns every FFmpeg object used while decoding one file
struct DecodeState {
	AVFormatContext *format_ctx = nullptr;
	AVCodecContext *codec_ctx = nullptr;
	SwrContext *swr_ctx = nullptr;
	AVPacket *packet = nullptr;
	AVFrame *frame = nullptr;

	~DecodeState() {
		if (packet) {
			av_packet_free(&packet);
		}
		if (frame) {
			av_frame_free(&frame);
		}
		if (swr_ctx) {
			swr_free(&swr_ctx);
		}
		if (codec_ctx) {
			avcodec_free_context(&codec_ctx);
		}
		if (format_ctx) {
			avformat_close_input(&format_ctx);
		}
	}
};

// Downmix one decoded frame (any layout, any sample format) to mono float
static bool ConvertFrame(DecodeState &state, AVFrame *frame, int rate, std::vector<float> &output,
                         VoxError &error) {
	int64_t delay = swr_get_delay(state.swr_ctx, rate);
	int out_samples = static_cast<int>(delay + frame->nb_samples);
	std::vector<float> buffer(static_cast<size_t>(out_samples));
	uint8_t *out_buf = reinterpret_cast<uint8_t *>(buffer.data());

	int converted = swr_convert(state.swr_ctx, &out_buf, out_samples,
	                            const_cast<const uint8_t **>(frame->extended_data), frame->nb_samples);
	if (converted < 0) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Failed to convert decoded audio");
		return false;
	}
	output.insert(output.end(), buffer.begin(), buffer.begin() + converted);
	return true;
}

static bool ReceiveFrames(DecodeState &state, int rate, std::vector<float> &output, VoxError &error) {
	while (avcodec_receive_frame(state.codec_ctx, state.frame) >= 0) {
		bool ok = ConvertFrame(state, state.frame, rate, output, error);
		av_frame_unref(state.frame);
		if (!ok) {
			return false;
		}
	}
	return true;
}

bool AudioFileLoader::LoadAudioFile(const std::string &file_path, std::vector<float> &output, uint32_t &sample_rate,
                                    VoxError &error) {
	DecodeState state;

	if (avformat_open_input(&state.format_ctx, file_path.c_str(), nullptr, nullptr) < 0) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Failed to open audio file: " + file_path);
		return false;
	}
	if (avformat_find_stream_info(state.format_ctx, nullptr) < 0) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Failed to find stream info");
		return false;
	}

	int stream_idx = av_find_best_stream(state.format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
	if (stream_idx < 0) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "No audio stream found in file");
		return false;
	}
	AVCodecParameters *codecpar = state.format_ctx->streams[stream_idx]->codecpar;

	const AVCodec *codec = avcodec_find_decoder(codecpar->codec_id);
	if (!codec) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Unsupported audio codec");
		return false;
	}
	state.codec_ctx = avcodec_alloc_context3(codec);
	if (!state.codec_ctx) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Failed to allocate codec context");
		return false;
	}
	if (avcodec_parameters_to_context(state.codec_ctx, codecpar) < 0) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Failed to copy codec parameters");
		return false;
	}
	if (avcodec_open2(state.codec_ctx, codec, nullptr) < 0) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Failed to open codec");
		return false;
	}

	const int rate = state.codec_ctx->sample_rate;
	if (rate <= 0) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Audio stream reports no sample rate");
		return false;
	}

	// Mono float at the native rate
	AVChannelLayout out_ch_layout = AV_CHANNEL_LAYOUT_MONO;
	AVChannelLayout in_ch_layout;
	if (state.codec_ctx->ch_layout.nb_channels > 0) {
		av_channel_layout_copy(&in_ch_layout, &state.codec_ctx->ch_layout);
	} else {
		av_channel_layout_default(&in_ch_layout,
		                          codecpar->ch_layout.nb_channels > 0 ? codecpar->ch_layout.nb_channels : 2);
	}
	swr_alloc_set_opts2(&state.swr_ctx, &out_ch_layout, AV_SAMPLE_FMT_FLT, rate, &in_ch_layout,
	                    state.codec_ctx->sample_fmt, rate, 0, nullptr);
	av_channel_layout_uninit(&in_ch_layout);
	if (!state.swr_ctx || swr_init(state.swr_ctx) < 0) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Failed to initialize sample converter");
		return false;
	}

	state.packet = av_packet_alloc();
	state.frame = av_frame_alloc();
	if (!state.packet || !state.frame) {
		error.Set(ErrorCode::AUDIO_DECODE_ERROR, "Failed to allocate packet/frame");
		return false;
	}

	output.clear();
	while (av_read_frame(state.format_ctx, state.packet) >= 0) {
		bool ok = true;
		if (state.packet->stream_index == stream_idx && avcodec_send_packet(state.codec_ctx, state.packet) >= 0) {
			ok = ReceiveFrames(state, rate, output, error);
		}
		av_packet_unref(state.packet);
		if (!ok) {
			return false;
		}
	}

	// Flush decoder
	avcodec_send_packet(state.codec_ctx, nullptr);
	if (!ReceiveFrames(state, rate, output, error)) {
		return false;
	}

	sample_rate = static_cast<uint32_t>(rate);
	VOXPROMPT_LOG_DEBUG("audio", "Decoded " + std::to_string(output.size()) + " samples at " + std::to_string(rate) +
	                                 "Hz from " + file_path);
	return true;
}

void AudioFileLoader::SetFFmpegLogging(bool enabled) {
	av_log_set_level(enabled ? AV_LOG_INFO : AV_LOG_QUIET);
}

} // namespace voxprompt
