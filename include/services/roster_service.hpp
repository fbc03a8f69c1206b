#pragma once

#include "core/utils.hpp"
#include "models/player.hpp"
#include "services/match_store.hpp"

#include <memory>
#include <vector>

namespace vtrack {

enum class add_outcome { added, already_tracked };
enum class remove_outcome { removed, not_found };

// Registration bookkeeping behind the chat commands. Errors are storage failures only;
// input validation happens before a riot_id exists.
class roster_service {
public:
	explicit roster_service(std::shared_ptr<match_store> store);

	[[nodiscard]] auto add(riot_id id, dpp::snowflake owner, std::string region = {}) -> std::expected<add_outcome, type::error>;
	[[nodiscard]] auto remove(const riot_id &id, dpp::snowflake owner) -> std::expected<remove_outcome, type::error>;
	[[nodiscard]] auto list(dpp::snowflake owner) const -> std::expected<std::vector<tracked_player>, type::error>;

	[[nodiscard]] auto is_tracking(const riot_id &id, dpp::snowflake owner) const -> std::expected<bool, type::error>;

	// nullopt when nothing was recorded for the player yet
	[[nodiscard]] auto last_match(const riot_id &id) const -> std::expected<std::optional<match_record>, type::error>;

private:
	std::shared_ptr<match_store> store_;
};

} // namespace vtrack
