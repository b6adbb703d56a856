/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <boost/format.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <syslog.h>

namespace icdn {

namespace detail {
void DetailLog(int priority, std::string&& line);
}

/// Messages less severe than \a priority (e.g. LOG_DEBUG when it is LOG_INFO) are dropped.
void SetLogThreshold(int priority);
int LogThreshold();

/// Converts "debug", "info", "notice", "warning", "err" or "crit" to a syslog priority.
std::optional<int> LogPriority(std::string_view name);

template <typename... Args>
void Log(int priority, const std::string& fmt, Args... args)
{
	if (priority > LogThreshold())
		return;

	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

} // end of namespace
