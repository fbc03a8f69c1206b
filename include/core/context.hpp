#pragma once

#include "core/utils.hpp"
#include "services/match_source.hpp"
#include "services/match_store.hpp"
#include "services/notifier.hpp"

#include <memory>

namespace vtrack {

// Everything a polling pass needs, built once in main and handed to the pass explicitly.
struct app_context {
	std::shared_ptr<match_store> store;
	std::shared_ptr<match_source> source;
	std::shared_ptr<notifier> notify;
	std::string default_region{"na"};
	// Accounts fetched from the data source at the same time.
	std::size_t fetch_concurrency{1};
	type::log_sink log{util::null_sink()};
};

} // namespace vtrack
