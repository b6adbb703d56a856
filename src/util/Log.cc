/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Log.hh"

#ifdef ICDN_SYSTEMD_FOUND
#include <systemd/sd-journal.h>
#endif

#include <atomic>

namespace icdn {
namespace {

std::atomic<int> threshold{LOG_INFO};

}

namespace detail {

void DetailLog(int priority, std::string &&line)
{
	// preprocessor is bad
#ifdef ICDN_SYSTEMD_FOUND
	::sd_journal_print
#else
	syslog
#endif
	(priority, "%s", line.c_str());
}

} // end of detail namespace

void SetLogThreshold(int priority)
{
	threshold = priority;
}

int LogThreshold()
{
	return threshold.load(std::memory_order_relaxed);
}

std::optional<int> LogPriority(std::string_view name)
{
	if (name == "debug")   return LOG_DEBUG;
	if (name == "info")    return LOG_INFO;
	if (name == "notice")  return LOG_NOTICE;
	if (name == "warning") return LOG_WARNING;
	if (name == "err")     return LOG_ERR;
	if (name == "crit")    return LOG_CRIT;
	return std::nullopt;
}

} // end of namespace
