#pragma once

#include "core/utils.hpp"
#include "models/match.hpp"
#include "models/player.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace vtrack {

// Storage for tracked players and recorded matches.
// Uniqueness is enforced by the store itself; duplicates are reported through the
// boolean results, never as errors.
class match_store {
public:
	virtual ~match_store() = default;

	[[nodiscard]] virtual auto ensure_schema() -> std::expected<std::monostate, type::error> = 0;

	// false when the fingerprint is already registered
	[[nodiscard]] virtual auto upsert_player(const tracked_player &player) -> std::expected<bool, type::error> = 0;
	// false when no such registration exists
	[[nodiscard]] virtual auto remove_player(std::string_view handle, std::string_view tag, dpp::snowflake owner) -> std::expected<bool, type::error> = 0;
	[[nodiscard]] virtual auto list_players(dpp::snowflake owner) -> std::expected<std::vector<tracked_player>, type::error> = 0;
	[[nodiscard]] virtual auto list_all_players() -> std::expected<std::vector<tracked_player>, type::error> = 0;

	// Atomic insert-if-absent keyed on the match id. true only for a match never seen before.
	[[nodiscard]] virtual auto try_insert_match(const match_record &match) -> std::expected<bool, type::error> = 0;
	// Everyone tracking handle#tag (case-insensitive).
	[[nodiscard]] virtual auto owners_of(std::string_view handle, std::string_view tag) -> std::expected<std::vector<dpp::snowflake>, type::error> = 0;
	[[nodiscard]] virtual auto latest_match(std::string_view handle, std::string_view tag) -> std::expected<std::optional<match_record>, type::error> = 0;

	[[nodiscard]] virtual auto is_connected() const -> bool = 0;
};

} // namespace vtrack
