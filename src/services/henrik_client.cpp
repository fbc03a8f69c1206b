#include "core/constants.hpp"
#include "services/henrik_client.hpp"
#include "services/henrik_parser.hpp"

#include <format>
#include <memory>

namespace vtrack {

namespace henrik {

auto build_url(const riot_id &id, std::string_view region, std::string_view platform) -> std::string
{
	return std::format("{}/{}/{}/{}/{}?mode={}&size={}", constants::api::base_url, region, platform, dpp::utility::url_encode(id.handle),
										 dpp::utility::url_encode(id.tag), constants::api::mode, constants::api::page_size);
}

auto request_headers(std::string_view api_key) -> std::multimap<std::string, std::string>
{
	return {{"Authorization", std::string{api_key}}, {"Accept", "application/json"}};
}

auto interpret_response(const dpp::http_request_completion_t &rv, const riot_id &id) -> std::expected<std::optional<match_record>, type::error>
{
	if (rv.error != dpp::h_success) {
		return std::unexpected(type::error{std::format("request for {} failed (transport error {})", id.str(), static_cast<int>(rv.error))});
	}

	if (rv.status == 404) {
		return std::nullopt;
	}

	if (rv.status != 200) {
		return std::unexpected(type::error{std::format("request for {} returned HTTP {}", id.str(), rv.status)});
	}

	auto parsed = parse_latest_match(std::string_view{rv.body}, id.handle, id.tag);
	if (!parsed) {
		return std::unexpected(type::error{std::format("{}: {}", id.str(), parsed.error().what())});
	}
	return parsed;
}

auto await_response(std::future<dpp::http_request_completion_t> &result, std::chrono::milliseconds timeout, const riot_id &id)
		-> std::expected<dpp::http_request_completion_t, type::error>
{
	if (result.wait_for(timeout) != std::future_status::ready) {
		return std::unexpected(type::error{std::format("request for {} timed out after {}", id.str(), timeout)});
	}
	return result.get();
}

} // namespace henrik

henrik_client::henrik_client(dpp::cluster &bot, std::string api_key, std::string platform, std::chrono::seconds timeout, type::log_sink log)
		: bot_(bot), api_key_(std::move(api_key)), platform_(std::move(platform)), timeout_(timeout), log_(std::move(log))
{
}

auto henrik_client::latest_match(const riot_id &id, std::string_view region) -> std::expected<std::optional<match_record>, type::error>
{
	// The promise outlives this frame if the request completes after we gave up on it.
	auto done = std::make_shared<std::promise<dpp::http_request_completion_t>>();
	auto result = done->get_future();

	bot_.request(
			build_url(id, region), dpp::m_get, [done](const dpp::http_request_completion_t &rv) { done->set_value(rv); }, "", "application/json",
			henrik::request_headers(api_key_), "1.1", static_cast<time_t>(timeout_.count()));

	// D++ gives up on its own after `timeout_`; the extra second lets its error callback win.
	auto rv = henrik::await_response(result, timeout_ + std::chrono::seconds{1}, id);
	if (!rv) {
		return std::unexpected(rv.error());
	}

	auto parsed = henrik::interpret_response(*rv, id);
	if (parsed && !*parsed) {
		log_(dpp::ll_debug, std::format("No competitive match found for {} (HTTP {})", id.str(), rv->status));
	}
	return parsed;
}

} // namespace vtrack
