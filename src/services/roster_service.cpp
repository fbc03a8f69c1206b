#include "services/roster_service.hpp"

#include <algorithm>

namespace vtrack {

roster_service::roster_service(std::shared_ptr<match_store> store) : store_(std::move(store)) {}

auto roster_service::add(riot_id id, dpp::snowflake owner, std::string region) -> std::expected<add_outcome, type::error>
{
	auto player = tracked_player::make(std::move(id), owner, util::to_lower(region));

	auto created = store_->upsert_player(player);
	if (!created) {
		return std::unexpected(created.error());
	}
	return *created ? add_outcome::added : add_outcome::already_tracked;
}

auto roster_service::remove(const riot_id &id, dpp::snowflake owner) -> std::expected<remove_outcome, type::error>
{
	auto removed = store_->remove_player(id.handle, id.tag, owner);
	if (!removed) {
		return std::unexpected(removed.error());
	}
	return *removed ? remove_outcome::removed : remove_outcome::not_found;
}

auto roster_service::list(dpp::snowflake owner) const -> std::expected<std::vector<tracked_player>, type::error> { return store_->list_players(owner); }

auto roster_service::is_tracking(const riot_id &id, dpp::snowflake owner) const -> std::expected<bool, type::error>
{
	auto players = store_->list_players(owner);
	if (!players) {
		return std::unexpected(players.error());
	}

	return std::ranges::any_of(*players, [&](const tracked_player &p) { return util::iequals(p.handle, id.handle) && util::iequals(p.tag, id.tag); });
}

auto roster_service::last_match(const riot_id &id) const -> std::expected<std::optional<match_record>, type::error> { return store_->latest_match(id.handle, id.tag); }

} // namespace vtrack
