#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace voxprompt {

// Receives a streamed response body. Returning false from either method
// aborts the transfer.
class HttpResponseSink {
public:
	virtual ~HttpResponseSink() = default;

	// Called once, before any body data. content_length is -1 when unknown.
	virtual bool OnResponse(long status_code, int64_t content_length) = 0;
	virtual bool OnData(const char *data, size_t size) = 0;
};

struct HttpResult {
	bool completed;   // Transfer ran to the end of the body
	bool aborted;     // The sink stopped the transfer
	long status_code; // 0 if no response was received
	std::string error;

	HttpResult() : completed(false), aborted(false), status_code(0) {
	}
};

class HttpTransport {
public:
	virtual ~HttpTransport() = default;

	// Streaming GET following redirects
	virtual HttpResult Get(const std::string &url, HttpResponseSink &sink) = 0;
};

// libcurl implementation. One easy handle per request, so instances can be
// shared across worker threads.
class CurlHttpClient : public HttpTransport {
public:
	CurlHttpClient();

	HttpResult Get(const std::string &url, HttpResponseSink &sink) override;

	// Seconds allowed for establishing the connection
	long connect_timeout_seconds;
	// Abort when fewer than low_speed_bytes per second arrive for low_speed_seconds
	long low_speed_bytes;
	long low_speed_seconds;

	// Call once per process before any transfer
	static void GlobalInit();
};

} // namespace voxprompt
