#include "voxprompt/http_client.hpp"
#include "voxprompt/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace voxprompt {

struct CurlTransferState {
	CURL *curl;
	HttpResponseSink *sink;
	bool response_seen;
	bool aborted;
};

static bool EmitResponse(CurlTransferState &state) {
	state.response_seen = true;
	long status = 0;
	curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &status);
	curl_off_t length = -1;
	curl_easy_getinfo(state.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
	return state.sink->OnResponse(status, static_cast<int64_t>(length));
}

// Callback for libcurl to stream response data into the sink
static size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
	auto *state = static_cast<CurlTransferState *>(userp);
	size_t total_size = size * nmemb;

	if (!state->response_seen && !EmitResponse(*state)) {
		state->aborted = true;
		return 0;
	}
	if (!state->sink->OnData(static_cast<const char *>(contents), total_size)) {
		state->aborted = true;
		return 0;
	}
	return total_size;
}

struct CurlHandleDeleter {
	void operator()(CURL *curl) const {
		curl_easy_cleanup(curl);
	}
};

CurlHttpClient::CurlHttpClient() : connect_timeout_seconds(30), low_speed_bytes(1024), low_speed_seconds(60) {
}

void CurlHttpClient::GlobalInit() {
	static std::once_flag once;
	std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResult CurlHttpClient::Get(const std::string &url, HttpResponseSink &sink) {
	HttpResult result;

	std::unique_ptr<CURL, CurlHandleDeleter> handle(curl_easy_init());
	if (!handle) {
		result.error = "Failed to initialize HTTP client";
		return result;
	}
	CURL *curl = handle.get();

	CurlTransferState state {curl, &sink, false, false};

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
	curl_easy_setopt(curl, CURLOPT_USERAGENT, "voxprompt/0.1");

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);

	// Model files are large: no total timeout, only connect and stall limits
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds);
	curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, low_speed_bytes);
	curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, low_speed_seconds);

	// Required for multi-threaded environments - don't use signals for timeout
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	// HuggingFace serves files through redirects to a CDN
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

	CURLcode res = curl_easy_perform(curl);
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);

	if (state.aborted) {
		result.aborted = true;
		result.error = "Transfer aborted";
		return result;
	}

	if (res != CURLE_OK) {
		if (res == CURLE_OPERATION_TIMEDOUT) {
			result.error = "Download stalled or timed out: " + url;
		} else if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
			result.error = "Cannot connect to " + url;
		} else {
			result.error = std::string("HTTP request failed: ") + curl_easy_strerror(res);
		}
		VOXPROMPT_LOG_WARNING("http", result.error);
		return result;
	}

	// Empty bodies never reach the write callback
	if (!state.response_seen && !EmitResponse(state)) {
		result.aborted = true;
		result.error = "Transfer aborted";
		return result;
	}

	result.completed = true;
	return result;
}

} // namespace voxprompt
