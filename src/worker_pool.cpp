#include "voxprompt/worker_pool.hpp"
#include "voxprompt/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace voxprompt {

WorkerPool::WorkerPool(std::string name, size_t thread_count) : name_(std::move(name)), stopping_(false) {
	if (thread_count == 0) {
		thread_count = 1;
	}
	threads_.reserve(thread_count);
	for (size_t i = 0; i < thread_count; i++) {
		threads_.emplace_back(&WorkerPool::WorkerLoop, this);
	}
	VOXPROMPT_LOG_DEBUG("worker", "Started pool '" + name_ + "' with " + std::to_string(thread_count) + " threads");
}

WorkerPool::~WorkerPool() {
	Shutdown();
}

void WorkerPool::Enqueue(std::function<void()> job) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (stopping_) {
			throw std::runtime_error("Worker pool '" + name_ + "' is shut down");
		}
		jobs_.push_back(std::move(job));
	}
	cv_.notify_one();
}

void WorkerPool::WorkerLoop() {
	while (true) {
		std::function<void()> job;
		{
			std::unique_lock<std::mutex> lock(mutex_);
			cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
			if (jobs_.empty()) {
				return;
			}
			job = std::move(jobs_.front());
			jobs_.pop_front();
		}
		// packaged_task captures exceptions into the future
		job();
	}
}

void WorkerPool::Shutdown() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (stopping_) {
			return;
		}
		stopping_ = true;
	}
	cv_.notify_all();
	for (auto &thread : threads_) {
		if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
			thread.join();
		} else if (thread.joinable()) {
			thread.detach();
		}
	}
	VOXPROMPT_LOG_DEBUG("worker", "Stopped pool '" + name_ + "'");
}

bool WorkerPool::IsWorkerThread() const {
	auto self = std::this_thread::get_id();
	return std::any_of(threads_.begin(), threads_.end(),
	                   [&](const std::thread &thread) { return thread.get_id() == self; });
}

} // namespace voxprompt
