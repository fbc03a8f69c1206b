#pragma once

#include "models/match.hpp"
#include "models/player.hpp"
#include <dpp/dpp.h>

#include <span>

namespace vtrack::ui {

class embed_builder {
public:
	// Build help embed
	[[nodiscard]] static auto build_help() -> dpp::embed;

	// Tracked players of one user
	[[nodiscard]] static auto build_player_list(std::span<const tracked_player> players, std::string_view default_region) -> dpp::embed;

	// Per-match notification card
	[[nodiscard]] static auto build_match(const match_record &match) -> dpp::embed;

	[[nodiscard]] static auto result_color(const match_record &match) -> std::uint32_t;
};

} // namespace vtrack::ui
