#include "services/notifier.hpp"
#include "ui/embed_builder.hpp"

#include <future>
#include <memory>

namespace vtrack {

dm_notifier::dm_notifier(dpp::cluster &bot, std::chrono::seconds timeout) : bot_(bot), timeout_(timeout) {}

auto dm_notifier::notify(const match_record &match, dpp::snowflake owner) -> std::expected<std::monostate, type::error>
{
	auto done = std::make_shared<std::promise<std::expected<std::monostate, type::error>>>();
	auto result = done->get_future();

	dpp::message msg;
	msg.add_embed(ui::embed_builder::build_match(match));

	bot_.direct_message_create(owner, msg, [done](const dpp::confirmation_callback_t &cc) {
		if (cc.is_error()) {
			done->set_value(std::unexpected(type::error{cc.get_error().message}));
		}
		else {
			done->set_value(std::monostate{});
		}
	});

	if (result.wait_for(timeout_) != std::future_status::ready) {
		return std::unexpected(type::error{std::format("direct message to {} timed out", util::id_to_u64(owner))});
	}
	return result.get();
}

} // namespace vtrack
