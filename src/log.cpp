#include <syslog.h>
#include <algorithm>
#include <array>
#include <exception>
#include <string>
#include <string_view>

#include <boost/algorithm/string.hpp>

#include "qsnest/log.hpp"

namespace qsnest::logging
{

// Report a failure
void
fail(const std::exception& e, char const* what)
{
	syslog(LOG_ERR, "%s: %s", what, e.what());
}

struct level_name
{
	std::string_view name;
	int priority;
};

static constexpr std::array<level_name, 7> levels{{
	{"debug", LOG_DEBUG},
	{"info", LOG_INFO},
	{"notice", LOG_NOTICE},
	{"warning", LOG_WARNING},
	{"error", LOG_ERR},
	{"critical", LOG_CRIT},
	{"alert", LOG_ALERT},
}};

bool
set_log_level(std::string_view level)
{
	auto it = std::find_if(levels.begin(), levels.end(),
		[level](const level_name& l)
		{
			return boost::iequals(level, l.name);
		});

	if(it == levels.end())
	{
		// level is not guaranteed to be NUL terminated
		syslog(LOG_ALERT, "Unknown log level %s", std::string(level).c_str());
		return false;
	}

	setlogmask(LOG_UPTO(it->priority));
	return true;
}

} // namespace qsnest::logging
