#pragma once

#include "core/context.hpp"

#include <chrono>
#include <stop_token>

namespace vtrack {

struct pass_summary {
	std::size_t accounts{};
	std::size_t new_matches{};
	std::size_t notified{};
	std::size_t errors{};
	// Ended early: store unreachable or stop requested.
	bool aborted{};
	std::chrono::milliseconds duration{};

	[[nodiscard]] auto str(this const auto &self) -> std::string
	{
		return std::format("Tracker pass {} in {}: {} account(s) checked, {} new match(es), {} notification(s) sent, {} error(s)",
											 self.aborted ? "aborted" : "completed", self.duration, self.accounts, self.new_matches, self.notified, self.errors);
	}
};

// One full pass over the roster. Never throws: every failure is logged, counted and
// confined to the account it happened on.
[[nodiscard]] auto run_tracker_pass(const app_context &ctx, std::stop_token stop = {}) -> pass_summary;

} // namespace vtrack
