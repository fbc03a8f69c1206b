#pragma once

#include "core/utils.hpp"
#include "models/match.hpp"
#include <dpp/dpp.h>

#include <variant>

namespace vtrack {

class notifier {
public:
	virtual ~notifier() = default;

	// Delivers one match notification. Failures are final: nothing is retried or queued.
	[[nodiscard]] virtual auto notify(const match_record &match, dpp::snowflake owner) -> std::expected<std::monostate, type::error> = 0;
};

// Sends the match embed as a direct message.
class dm_notifier final : public notifier {
public:
	dm_notifier(dpp::cluster &bot, std::chrono::seconds timeout);

	[[nodiscard]] auto notify(const match_record &match, dpp::snowflake owner) -> std::expected<std::monostate, type::error> override;

private:
	dpp::cluster &bot_;
	std::chrono::seconds timeout_;
};

} // namespace vtrack
