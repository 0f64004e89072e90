#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxprompt {

// Fixed-size pool of named worker threads draining a FIFO of jobs.
// Two instances exist at runtime: "io" (downloads, pipeline coordination)
// and "inference" (whisper and llama work), so long inference runs never
// starve network I/O.
class WorkerPool {
public:
	WorkerPool(std::string name, size_t thread_count);
	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	// Queue a callable and get a future for its result. Exceptions thrown by
	// the callable are delivered through the future.
	template <class F>
	auto Submit(F &&fn) -> std::future<decltype(fn())> {
		using R = decltype(fn());
		auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
		std::future<R> future = task->get_future();
		Enqueue([task]() { (*task)(); });
		return future;
	}

	// Stop accepting work, drain queued jobs and join all threads
	void Shutdown();

	const std::string &GetName() const {
		return name_;
	}
	size_t GetThreadCount() const {
		return threads_.size();
	}
	// True when called from one of this pool's threads
	bool IsWorkerThread() const;

private:
	void Enqueue(std::function<void()> job);
	void WorkerLoop();

	std::string name_;
	std::vector<std::thread> threads_;
	std::deque<std::function<void()>> jobs_;
	std::mutex mutex_;
	std::condition_variable cv_;
	bool stopping_;
};

} // namespace voxprompt
