#pragma once

#include "services/match_source.hpp"
#include "services/match_store.hpp"
#include "services/notifier.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <mutex>
#include <set>

namespace vtrack::testing {

// match_store over std containers, with switches to simulate an unhealthy database.
class memory_store final : public match_store {
public:
	bool connected = true;
	bool fail_inserts = false;
	bool fail_listing = false;
	// The next insert loses the connection, as a database restart would.
	bool drop_on_insert = false;

	auto ensure_schema() -> std::expected<std::monostate, type::error> override { return std::monostate{}; }

	auto upsert_player(const tracked_player &player) -> std::expected<bool, type::error> override
	{
		std::scoped_lock lock(mutex_);
		if (!connected)
			return std::unexpected(type::error{"connection refused"});
		if (std::ranges::any_of(players_, [&](const tracked_player &p) { return p.fingerprint == player.fingerprint; }))
			return false;
		players_.push_back(player);
		return true;
	}

	auto remove_player(std::string_view handle, std::string_view tag, dpp::snowflake owner) -> std::expected<bool, type::error> override
	{
		std::scoped_lock lock(mutex_);
		if (!connected)
			return std::unexpected(type::error{"connection refused"});
		auto fp = hash::player_fingerprint(handle, tag, util::id_to_u64(owner));
		return std::erase_if(players_, [&](const tracked_player &p) { return p.fingerprint == fp; }) > 0;
	}

	auto list_players(dpp::snowflake owner) -> std::expected<std::vector<tracked_player>, type::error> override
	{
		std::scoped_lock lock(mutex_);
		if (!connected || fail_listing)
			return std::unexpected(type::error{"connection refused"});
		std::vector<tracked_player> out;
		std::ranges::copy_if(players_, std::back_inserter(out), [&](const tracked_player &p) { return p.owner_id == owner; });
		return out;
	}

	auto list_all_players() -> std::expected<std::vector<tracked_player>, type::error> override
	{
		std::scoped_lock lock(mutex_);
		if (!connected || fail_listing)
			return std::unexpected(type::error{"connection refused"});
		return players_;
	}

	auto try_insert_match(const match_record &match) -> std::expected<bool, type::error> override
	{
		std::scoped_lock lock(mutex_);
		if (drop_on_insert) {
			connected = false;
			return std::unexpected(type::error{"server closed the connection unexpectedly"});
		}
		if (!connected || fail_inserts)
			return std::unexpected(type::error{"insert failed"});
		auto [it, inserted] = matches_.emplace(match.match_id, match);
		if (inserted)
			order_.push_back(match.match_id);
		return inserted;
	}

	auto owners_of(std::string_view handle, std::string_view tag) -> std::expected<std::vector<dpp::snowflake>, type::error> override
	{
		std::scoped_lock lock(mutex_);
		if (!connected)
			return std::unexpected(type::error{"connection refused"});
		std::set<std::uint64_t> ids;
		for (const auto &p : players_) {
			if (util::iequals(p.handle, handle) && util::iequals(p.tag, tag))
				ids.insert(util::id_to_u64(p.owner_id));
		}
		return std::vector<dpp::snowflake>(ids.begin(), ids.end());
	}

	auto latest_match(std::string_view handle, std::string_view tag) -> std::expected<std::optional<match_record>, type::error> override
	{
		std::scoped_lock lock(mutex_);
		if (!connected)
			return std::unexpected(type::error{"connection refused"});
		for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
			const auto &m = matches_.at(*it);
			if (util::iequals(m.player_name, handle) && util::iequals(m.player_tag, tag))
				return m;
		}
		return std::nullopt;
	}

	auto is_connected() const -> bool override { return connected; }

	auto player_count() const -> std::size_t
	{
		std::scoped_lock lock(mutex_);
		return players_.size();
	}

	auto match_count() const -> std::size_t
	{
		std::scoped_lock lock(mutex_);
		return matches_.size();
	}

private:
	mutable std::mutex mutex_;
	std::vector<tracked_player> players_;
	std::map<std::string, match_record> matches_;
	std::vector<std::string> order_;
};

// Serves canned answers keyed by case-folded "handle#tag".
class fake_source final : public match_source {
public:
	using answer = std::expected<std::optional<match_record>, type::error>;

	std::map<std::string, answer> answers;
	std::vector<std::string> calls;
	std::vector<std::string> regions;

	auto set(std::string_view riot, answer a) -> void { answers.insert_or_assign(util::fold_case(riot), std::move(a)); }

	auto latest_match(const riot_id &id, std::string_view region) -> answer override
	{
		{
			std::scoped_lock lock(mutex_);
			calls.push_back(id.str());
			regions.emplace_back(region);
		}
		if (auto it = answers.find(util::fold_case(id.str())); it != answers.end())
			return it->second;
		return std::nullopt;
	}

private:
	std::mutex mutex_;
};

class recording_notifier final : public notifier {
public:
	struct delivery {
		match_record match;
		dpp::snowflake owner;
	};

	std::vector<delivery> delivered;
	std::set<std::uint64_t> unreachable;

	auto notify(const match_record &match, dpp::snowflake owner) -> std::expected<std::monostate, type::error> override
	{
		if (unreachable.contains(util::id_to_u64(owner)))
			return std::unexpected(type::error{"Cannot send messages to this user"});
		delivered.push_back({match, owner});
		return std::monostate{};
	}
};

inline auto sample_match(std::string id, std::string handle = "Foo", std::string tag = "123") -> match_record
{
	match_record m;
	m.match_id = std::move(id);
	m.player_name = std::move(handle);
	m.player_tag = std::move(tag);
	m.agent = "Jett";
	m.game_score = "13-11";
	m.kills = 20;
	m.deaths = 10;
	m.assists = 5;
	m.damage_delta = 812;
	m.headshot_percentage = 27.3;
	m.adr = 164.2;
	m.acs = 251.7;
	m.team_placement = 2;
	m.map_name = "Ascent";
	m.match_result = "Victory";
	m.created_at = type::timestamp{std::chrono::seconds{1'700'000'000}};
	return m;
}

} // namespace vtrack::testing
