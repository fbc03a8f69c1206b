#include "core/config.hpp"
#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "ui/embed_builder.hpp"
#include "ui/message_builder.hpp"

#include <format>

namespace vtrack {

namespace {

auto player_option() -> dpp::command_option { return dpp::command_option(dpp::co_string, "player", "Riot id, e.g. AGreenFruit#PEPE", true); }

} // namespace

command_handler::command_handler(std::shared_ptr<roster_service> roster, std::string default_region, type::log_sink log)
		: roster_(std::move(roster)), default_region_(std::move(default_region)), log_(std::move(log))
{
}

auto command_handler::on_slash(const dpp::slashcommand_t &ev) -> void
{
	auto name = ev.command.get_command_name();

	if (name == "help")
		return cmd_help(ev);
	if (name == "ping")
		return cmd_ping(ev);
	if (name == "add")
		return cmd_add(ev);
	if (name == "remove")
		return cmd_remove(ev);
	if (name == "list")
		return cmd_list(ev);
	if (name == "last")
		return cmd_last(ev);

	return ui::message_builder::reply_error(ev, constants::text::unknown_command);
}

auto command_handler::commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>
{
	std::vector<dpp::slashcommand> cmds;

	cmds.emplace_back("help", "Show the available commands", bot_id);

	cmds.emplace_back("ping", "Check that the bot is alive", bot_id);

	auto region = dpp::command_option(dpp::co_string, "region", "Account region (defaults to the server setting)", false);
	for (auto [label, code] : {std::pair{"Europe", "eu"}, std::pair{"North America", "na"}, std::pair{"Latin America", "latam"}, std::pair{"Brazil", "br"},
														 std::pair{"Asia Pacific", "ap"}, std::pair{"Korea", "kr"}}) {
		region.add_choice(dpp::command_option_choice(label, std::string{code}));
	}
	cmds.emplace_back("add", "Start tracking a player's competitive matches", bot_id).add_option(player_option()).add_option(region);

	cmds.emplace_back("remove", "Stop tracking a player", bot_id).add_option(player_option());

	cmds.emplace_back("list", "Show the players you track", bot_id);

	cmds.emplace_back("last", "Show the last recorded match of a tracked player", bot_id).add_option(player_option());

	return cmds;
}

auto command_handler::reply_storage_error(const dpp::slashcommand_t &ev, const type::error &err) -> void
{
	log_(dpp::ll_error, std::format("/{} from {} failed: {}", ev.command.get_command_name(), util::id_to_u64(ev.command.usr.id), err.what()));
	ui::message_builder::reply_error(ev, constants::text::storage_failed);
}

auto command_handler::cmd_help(const dpp::slashcommand_t &ev) -> void
{
	auto embed = ui::embed_builder::build_help();
	ev.reply(dpp::message().add_embed(embed));
}

auto command_handler::cmd_ping(const dpp::slashcommand_t &ev) -> void { ev.reply(std::format("🏓 Pong! Latency: {:.0f}ms", ev.owner->rest_ping * 1000.0)); }

auto command_handler::cmd_add(const dpp::slashcommand_t &ev) -> void
{
	auto id = riot_id::parse(std::get<std::string>(ev.get_parameter("player")));
	if (!id) {
		return ui::message_builder::reply_error(ev, id.error().what());
	}

	std::string region;
	if (auto p = ev.get_parameter("region"); std::holds_alternative<std::string>(p)) {
		region = util::to_lower(std::get<std::string>(p));
		if (!is_valid_region(region)) {
			return ui::message_builder::reply_error(ev, constants::text::invalid_region);
		}
	}

	const auto owner = ev.command.usr.id;
	const auto name = id->str();

	auto res = roster_->add(std::move(*id), owner, region);
	if (!res) {
		return reply_storage_error(ev, res.error());
	}

	if (*res == add_outcome::already_tracked) {
		return ev.reply(ui::message_builder::info(std::format("**{}** is already being tracked.\nYou will continue to receive match notifications.", name)));
	}

	log_(dpp::ll_info, std::format("Added player {} for Discord user {}", name, util::id_to_u64(owner)));
	return ev.reply(ui::message_builder::success(std::format("Successfully added **{}** to tracking!\nDiscord User: {}\n"
																													 "You will receive notifications when new matches are detected.",
																													 name, util::mention(owner))));
}

auto command_handler::cmd_remove(const dpp::slashcommand_t &ev) -> void
{
	auto id = riot_id::parse(std::get<std::string>(ev.get_parameter("player")));
	if (!id) {
		return ui::message_builder::reply_error(ev, id.error().what());
	}

	auto res = roster_->remove(*id, ev.command.usr.id);
	if (!res) {
		return reply_storage_error(ev, res.error());
	}

	if (*res == remove_outcome::not_found) {
		return ui::message_builder::reply_error(ev, std::format("**{}** is not in your tracking list", id->str()));
	}

	log_(dpp::ll_info, std::format("Removed player {} for Discord user {}", id->str(), util::id_to_u64(ev.command.usr.id)));
	return ev.reply(ui::message_builder::success(std::format("🗑️ Stopped tracking **{}**", id->str())));
}

auto command_handler::cmd_list(const dpp::slashcommand_t &ev) -> void
{
	auto players = roster_->list(ev.command.usr.id);
	if (!players) {
		return reply_storage_error(ev, players.error());
	}

	if (players->empty()) {
		return ev.reply(ui::message_builder::info(constants::text::no_players));
	}

	auto embed = ui::embed_builder::build_player_list(*players, default_region_);
	return ev.reply(dpp::message().add_embed(embed));
}

auto command_handler::cmd_last(const dpp::slashcommand_t &ev) -> void
{
	auto id = riot_id::parse(std::get<std::string>(ev.get_parameter("player")));
	if (!id) {
		return ui::message_builder::reply_error(ev, id.error().what());
	}

	auto tracking = roster_->is_tracking(*id, ev.command.usr.id);
	if (!tracking) {
		return reply_storage_error(ev, tracking.error());
	}
	if (!*tracking) {
		return ui::message_builder::reply_error(ev, constants::text::not_tracking);
	}

	auto match = roster_->last_match(*id);
	if (!match) {
		return reply_storage_error(ev, match.error());
	}
	if (!*match) {
		return ui::message_builder::reply_error(ev, constants::text::no_recorded_match);
	}

	auto embed = ui::embed_builder::build_match(**match);
	embed.set_title(std::format("Last match of {}", id->str()));
	return ev.reply(dpp::message().add_embed(embed));
}

} // namespace vtrack
