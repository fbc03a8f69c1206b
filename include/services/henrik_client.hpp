#pragma once

#include "services/match_source.hpp"
#include <dpp/dpp.h>

#include <chrono>
#include <future>
#include <map>

namespace vtrack {

namespace henrik {

// <base>/<region>/<platform>/<handle>/<tag>?mode=competitive&size=1, handle and tag url-encoded.
[[nodiscard]] auto build_url(const riot_id &id, std::string_view region, std::string_view platform) -> std::string;

// Sent with every request; the API rejects calls without the key.
[[nodiscard]] auto request_headers(std::string_view api_key) -> std::multimap<std::string, std::string>;

// 200 is parsed, 404 means no competitive history, anything else is a data-source error.
[[nodiscard]] auto interpret_response(const dpp::http_request_completion_t &rv, const riot_id &id)
		-> std::expected<std::optional<match_record>, type::error>;

// Waits at most `timeout` for the completion handed over by the request callback.
[[nodiscard]] auto await_response(std::future<dpp::http_request_completion_t> &result, std::chrono::milliseconds timeout, const riot_id &id)
		-> std::expected<dpp::http_request_completion_t, type::error>;

} // namespace henrik

// HenrikDev API client. Requests are issued through the cluster's HTTP queue
// and waited on, so callers get a plain blocking call with a hard timeout.
class henrik_client final : public match_source {
public:
	henrik_client(dpp::cluster &bot, std::string api_key, std::string platform, std::chrono::seconds timeout, type::log_sink log);

	[[nodiscard]] auto latest_match(const riot_id &id, std::string_view region) -> std::expected<std::optional<match_record>, type::error> override;

	[[nodiscard]] auto build_url(const riot_id &id, std::string_view region) const -> std::string { return henrik::build_url(id, region, platform_); }

private:
	dpp::cluster &bot_;
	std::string api_key_;
	std::string platform_;
	std::chrono::seconds timeout_;
	type::log_sink log_;
};

} // namespace vtrack
