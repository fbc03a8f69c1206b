#pragma once

#include "core/constants.hpp"
#include <dpp/dpp.h>

#include <format>
#include <string_view>

namespace vtrack::ui {

// for type safety
template <typename T>
concept Replyable = requires(T t, dpp::message m) { t.reply(m); };

class message_builder {
public:
	[[nodiscard]] static auto error(std::string_view msg) -> dpp::message
	{
		return dpp::message{std::format("{}{}", constants::text::err_prefix, msg)}.set_flags(dpp::m_ephemeral);
	}

	[[nodiscard]] static auto success(std::string_view msg) -> dpp::message { return dpp::message{std::format("{}{}", constants::text::ok_prefix, msg)}; }

	[[nodiscard]] static auto info(std::string_view msg) -> dpp::message { return dpp::message{std::format("{}{}", constants::text::info_prefix, msg)}; }

	static auto reply_error(Replyable auto &event, std::string_view msg) -> void { event.reply(error(msg)); }
};

} // namespace vtrack::ui
