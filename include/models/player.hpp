#pragma once

#include "core/hash.hpp"
#include "core/utils.hpp"

#include <optional>

namespace vtrack {

// handle#tag as typed by a user.
struct riot_id {
	std::string handle;
	std::string tag;

	[[nodiscard]] auto str(this const auto &self) -> std::string { return std::format("{}#{}", self.handle, self.tag); }

	// Splits on the first '#'; both halves are trimmed and must be non-empty.
	[[nodiscard]] static auto parse(std::string_view text) -> std::expected<riot_id, type::error>;
};

class tracked_player {
public:
	std::string handle;
	std::string tag;
	dpp::snowflake owner_id{};
	std::string fingerprint;
	// Empty means the configured default region.
	std::string region;
	type::timestamp created_at{};

	[[nodiscard]] auto operator==(const tracked_player &) const -> bool = default;

	[[nodiscard]] static auto make(riot_id id, dpp::snowflake owner, std::string region = {}) -> tracked_player
	{
		auto fp = hash::player_fingerprint(id.handle, id.tag, util::id_to_u64(owner));
		return {.handle = std::move(id.handle),
						.tag = std::move(id.tag),
						.owner_id = owner,
						.fingerprint = std::move(fp),
						.region = std::move(region),
						.created_at = util::now()};
	}

	[[nodiscard]] auto display_name(this const auto &self) -> std::string { return std::format("{}#{}", self.handle, self.tag); }

	[[nodiscard]] auto region_or(this const auto &self, std::string_view fallback) -> std::string
	{
		return self.region.empty() ? std::string{fallback} : self.region;
	}
};

} // namespace vtrack
