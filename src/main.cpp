#include "core/config.hpp"
#include "core/context.hpp"
#include "handlers/command_handler.hpp"
#include "services/henrik_client.hpp"
#include "services/notifier.hpp"
#include "services/postgres_store.hpp"
#include "services/roster_service.hpp"
#include "services/scheduler.hpp"
#include "services/tracker_job.hpp"
#include "ui/message_builder.hpp"
#include <dpp/dpp.h>

#include <format>
#include <iostream>
#include <memory>

using namespace vtrack;

int main()
{
	// Load configuration
	auto cfg = config::from_env();
	if (!cfg) {
		std::cerr << "Configuration error: " << cfg.error().what() << "\n";
		return 1;
	}

	// Create bot
	dpp::cluster bot(cfg->bot_token);
	bot.on_log(dpp::utility::cout_logger());

	type::log_sink log = [&bot](dpp::loglevel level, const std::string &msg) { bot.log(level, msg); };

	// Initialize services
	auto store = std::make_shared<postgres_store>(cfg->db.conninfo(), log);
	if (auto res = store->connect(); !res) {
		std::cerr << "Database error: " << res.error().what() << "\n";
		return 1;
	}
	if (auto res = store->ensure_schema(); !res) {
		std::cerr << "Database error: " << res.error().what() << "\n";
		return 1;
	}

	auto source = std::make_shared<henrik_client>(bot, cfg->api_key, cfg->platform, cfg->request_timeout, log);
	auto notify = std::make_shared<dm_notifier>(bot, constants::limits::delivery_timeout);
	auto roster = std::make_shared<roster_service>(store);

	const app_context ctx{.store = store, .source = source, .notify = notify, .default_region = cfg->region, .fetch_concurrency = cfg->fetch_concurrency, .log = log};

	// Create handlers
	auto cmd_handler = std::make_shared<command_handler>(roster, cfg->region, log);

	scheduler tracker(cfg->interval, [ctx](std::stop_token stop) {
		ctx.log(dpp::ll_info, "Starting tracker pass");
		auto summary = run_tracker_pass(ctx, stop);
		ctx.log(summary.errors > 0 ? dpp::ll_warning : dpp::ll_info, summary.str());
	});

	// Wire events
	bot.on_slashcommand([cmd_handler](const dpp::slashcommand_t &ev) {
		try {
			cmd_handler->on_slash(ev);
		} catch (const std::exception &e) {
			ui::message_builder::reply_error(ev, e.what());
		}
	});

	bot.on_ready([&](const dpp::ready_t &) {
		// Reconnects fire on_ready again
		if (!dpp::run_once<struct register_bot_commands>()) {
			return;
		}

		bot.log(dpp::ll_info, std::format("{} has connected to Discord", bot.me.format_username()));

		auto cmds = command_handler::commands(bot.me.id);
		if (cfg->guild_id) {
			bot.guild_bulk_command_create(cmds, *cfg->guild_id);
		}
		else {
			bot.global_bulk_command_create(cmds);
		}

		// Runs the first pass immediately
		tracker.start();
		bot.log(dpp::ll_info, std::format("Scheduler started - tracker job will run every {}", cfg->interval));
	});

	// Start bot
	bot.start(dpp::st_wait);

	tracker.stop();
	return 0;
}
