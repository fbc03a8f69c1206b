#include "services/scheduler.hpp"

namespace vtrack {

scheduler::scheduler(std::chrono::milliseconds interval, task fn) : interval_(interval), fn_(std::move(fn)) {}

scheduler::~scheduler() { stop(); }

auto scheduler::start() -> void
{
	if (worker_.joinable()) {
		return;
	}
	worker_ = std::jthread([this](std::stop_token st) { loop(std::move(st)); });
}

auto scheduler::stop() -> void
{
	if (!worker_.joinable()) {
		return;
	}
	worker_.request_stop();
	worker_.join();
}

auto scheduler::loop(std::stop_token st) -> void
{
	while (!st.stop_requested()) {
		fn_(st);

		std::unique_lock lock(mutex_);
		// Wakes early only when a stop is requested.
		cv_.wait_for(lock, st, interval_, [] { return false; });
	}
}

} // namespace vtrack
