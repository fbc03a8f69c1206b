#include "services/tracker_job.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <future>
#include <map>
#include <span>
#include <system_error>
#include <tuple>

namespace vtrack {

namespace {

struct account {
	riot_id id;
	std::string region;
};

// Players tracked by several users (or registered with different casing) are fetched once.
auto group_accounts(const std::vector<tracked_player> &players, std::string_view default_region) -> std::vector<account>
{
	std::map<std::tuple<std::string, std::string, std::string>, std::size_t> seen;
	std::vector<account> accounts;

	for (const auto &p : players) {
		auto region = util::to_lower(p.region_or(default_region));
		auto key = std::make_tuple(util::fold_case(p.handle), util::fold_case(p.tag), region);
		if (seen.contains(key)) {
			continue;
		}
		seen.emplace(std::move(key), accounts.size());
		accounts.push_back({.id = {.handle = p.handle, .tag = p.tag}, .region = std::move(region)});
	}
	return accounts;
}

enum class step { next, abort };

using fetch_result = std::expected<std::optional<match_record>, type::error>;

// Starts the data-source calls for one batch; with a single account the call runs inline.
auto fetch_batch(const app_context &ctx, std::span<const account> batch) -> std::vector<std::future<fetch_result>>
{
	const auto policy = batch.size() > 1 ? std::launch::async : std::launch::deferred;
	std::vector<std::future<fetch_result>> fetches;
	fetches.reserve(batch.size());
	for (const auto &acc : batch) {
		auto fetch = [&ctx, &acc] { return ctx.source->latest_match(acc.id, acc.region); };
		try {
			fetches.push_back(std::async(policy, fetch));
		} catch (const std::system_error &) {
			// no thread available: run this one on the pass thread
			fetches.push_back(std::async(std::launch::deferred, fetch));
		}
	}
	return fetches;
}

// Stores the fetched match and notifies its owners.
auto record_account(const app_context &ctx, const account &acc, fetch_result latest, pass_summary &summary) -> step
{
	if (!latest) {
		++summary.errors;
		ctx.log(dpp::ll_warning, std::format("Data source error for {}: {}", acc.id.str(), latest.error().what()));
		return step::next;
	}
	if (!*latest) {
		return step::next;
	}

	const auto &match = **latest;
	auto inserted = ctx.store->try_insert_match(match);
	if (!inserted) {
		++summary.errors;
		ctx.log(dpp::ll_error, std::format("Could not record match {} for {}: {}", match.match_id, acc.id.str(), inserted.error().what()));
		return ctx.store->is_connected() ? step::next : step::abort;
	}
	if (!*inserted) {
		ctx.log(dpp::ll_debug, std::format("Match {} for {} already recorded", match.match_id, acc.id.str()));
		return step::next;
	}

	++summary.new_matches;
	ctx.log(dpp::ll_info, std::format("New match recorded for {} ({})", acc.id.str(), match.match_id));

	// From here on the match counts as handled: a lost notification is not retried.
	auto owners = ctx.store->owners_of(match.player_name, match.player_tag);
	if (!owners) {
		++summary.errors;
		ctx.log(dpp::ll_error, std::format("Could not resolve owners of {}: {}", acc.id.str(), owners.error().what()));
		return ctx.store->is_connected() ? step::next : step::abort;
	}

	for (const auto &owner : *owners) {
		if (auto sent = ctx.notify->notify(match, owner); !sent) {
			++summary.errors;
			ctx.log(dpp::ll_warning, std::format("Cannot send DM to user {} ({})", util::id_to_u64(owner), sent.error().what()));
			continue;
		}
		++summary.notified;
		ctx.log(dpp::ll_info, std::format("Sent match notification to Discord user {}", util::id_to_u64(owner)));
	}
	return step::next;
}

} // namespace

auto run_tracker_pass(const app_context &ctx, std::stop_token stop) -> pass_summary
{
	const auto started = std::chrono::steady_clock::now();
	pass_summary summary;

	auto finish = [&] {
		summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
		return summary;
	};

	auto players = ctx.store->list_all_players();
	if (!players) {
		++summary.errors;
		summary.aborted = true;
		ctx.log(dpp::ll_error, std::format("Could not load tracked players: {}", players.error().what()));
		return finish();
	}

	const auto accounts = group_accounts(*players, ctx.default_region);
	const auto batch_size = std::max<std::size_t>(ctx.fetch_concurrency, 1);

	for (std::size_t first = 0; first < accounts.size() && !summary.aborted; first += batch_size) {
		if (stop.stop_requested()) {
			summary.aborted = true;
			ctx.log(dpp::ll_info, "Tracker pass interrupted by shutdown");
			break;
		}

		const auto batch = std::span{accounts}.subspan(first, std::min(batch_size, accounts.size() - first));
		auto fetches = fetch_batch(ctx, batch);

		// Results are recorded in roster order, one at a time.
		for (std::size_t i = 0; i < batch.size(); ++i) {
			const auto &acc = batch[i];
			++summary.accounts;
			try {
				if (record_account(ctx, acc, fetches[i].get(), summary) == step::abort) {
					summary.aborted = true;
					ctx.log(dpp::ll_error, "Database unreachable, ending tracker pass early");
					break;
				}
			} catch (const std::exception &e) {
				++summary.errors;
				ctx.log(dpp::ll_error, std::format("Unexpected failure while checking {}: {}", acc.id.str(), e.what()));
			}
		}
	}

	return finish();
}

} // namespace vtrack
