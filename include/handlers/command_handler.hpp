#pragma once

#include "core/utils.hpp"
#include "services/roster_service.hpp"
#include <dpp/dpp.h>

#include <memory>

namespace vtrack {

class command_handler {
public:
	command_handler(std::shared_ptr<roster_service> roster, std::string default_region, type::log_sink log);

	// Command dispatch
	auto on_slash(const dpp::slashcommand_t &ev) -> void;

	// Get command definitions for registration
	[[nodiscard]] static auto commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>;

private:
	std::shared_ptr<roster_service> roster_;
	std::string default_region_;
	type::log_sink log_;

	// Command implementations
	auto cmd_help(const dpp::slashcommand_t &ev) -> void;
	auto cmd_ping(const dpp::slashcommand_t &ev) -> void;
	auto cmd_add(const dpp::slashcommand_t &ev) -> void;
	auto cmd_remove(const dpp::slashcommand_t &ev) -> void;
	auto cmd_list(const dpp::slashcommand_t &ev) -> void;
	auto cmd_last(const dpp::slashcommand_t &ev) -> void;

	// Logs the storage failure and answers with a generic message.
	auto reply_storage_error(const dpp::slashcommand_t &ev, const type::error &err) -> void;
};

} // namespace vtrack
