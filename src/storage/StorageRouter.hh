/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "StorageBackend.hh"

#include "util/Exception.hh"

#include <boost/exception/error_info.hpp>

#include <map>
#include <memory>

namespace icdn {

class Configuration;
class DiskConfig;

/// \brief  Named registry of the configured disks.
///
/// All backends are created when the router is constructed and live as long as it does.
/// After construction the router is read-only and can be shared by all sessions.
class StorageRouter
{
public:
	struct DiskNotConfigured : virtual Exception {};
	struct UnknownDriver : virtual Exception {};
	using Disk   = boost::error_info<struct tag_disk,   std::string>;
	using Driver = boost::error_info<struct tag_driver, std::string>;

public:
	explicit StorageRouter(const Configuration& cfg);

	/// Router with only the "local" disk. Use add() to register more before sharing it.
	explicit StorageRouter(std::unique_ptr<StorageBackend> local, std::string default_disk = "local");

	StorageRouter(StorageRouter&&) = default;
	StorageRouter& operator=(StorageRouter&&) = default;

	void add(std::string name, std::unique_ptr<StorageBackend> backend);

	/// The default disk if \a name is empty. Throws DiskNotConfigured for unknown names.
	StorageBackend& disk(std::string_view name = {}) const;

	/// Same as disk(), but returns nullptr instead of throwing.
	StorageBackend* find(std::string_view name = {}) const;

	const std::string& default_disk() const {return m_default;}
	std::vector<std::string> names() const;

	static std::unique_ptr<StorageBackend> create(const DiskConfig& cfg, std::chrono::seconds timeout);

private:
	std::map<std::string, std::unique_ptr<StorageBackend>, std::less<>> m_disks;
	std::string m_default;
};

} // end of namespace
