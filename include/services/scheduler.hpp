#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace vtrack {

// Runs a task on its own thread: once right away, then `interval` after each run finishes,
// so two runs never overlap.
class scheduler {
public:
	using task = std::function<void(std::stop_token)>;

	scheduler(std::chrono::milliseconds interval, task fn);
	~scheduler();

	scheduler(const scheduler &) = delete;
	scheduler &operator=(const scheduler &) = delete;

	auto start() -> void;
	// Asks the current run to wind down and joins the worker.
	auto stop() -> void;

	[[nodiscard]] auto running() const -> bool { return worker_.joinable(); }

private:
	std::chrono::milliseconds interval_;
	task fn_;
	std::mutex mutex_;
	std::condition_variable_any cv_;
	std::jthread worker_;

	auto loop(std::stop_token st) -> void;
};

} // namespace vtrack
