/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "StorageRouter.hh"

#include "AzureBackend.hh"
#include "GCSBackend.hh"
#include "LocalBackend.hh"
#include "S3Backend.hh"

#include "util/Configuration.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>

namespace icdn {

StorageRouter::StorageRouter(const Configuration& cfg) :
	m_default{cfg.default_disk()}
{
	for (auto&& disk : cfg.disks())
	{
		Log(LOG_INFO, "configuring disk \"%1%\" with driver \"%2%\"", disk.name(), disk.driver());
		add(disk.name(), create(disk, cfg.backend_timeout()));
	}

	// "local" always resolves, even when it is not configured explicitly.
	if (m_disks.find("local") == m_disks.end())
		add("local", create(cfg.local_disk(), cfg.backend_timeout()));

	if (m_disks.find(m_default) == m_disks.end())
		BOOST_THROW_EXCEPTION(DiskNotConfigured() << Disk{m_default});
}

StorageRouter::StorageRouter(std::unique_ptr<StorageBackend> local, std::string default_disk) :
	m_default{std::move(default_disk)}
{
	add("local", std::move(local));
}

void StorageRouter::add(std::string name, std::unique_ptr<StorageBackend> backend)
{
	m_disks.insert_or_assign(std::move(name), std::move(backend));
}

StorageBackend* StorageRouter::find(std::string_view name) const
{
	auto it = m_disks.find(name.empty() ? std::string_view{m_default} : name);
	return it != m_disks.end() ? it->second.get() : nullptr;
}

StorageBackend& StorageRouter::disk(std::string_view name) const
{
	if (auto backend = find(name))
		return *backend;

	BOOST_THROW_EXCEPTION(DiskNotConfigured() << Disk{std::string{name.empty() ? m_default : name}});
}

std::vector<std::string> StorageRouter::names() const
{
	std::vector<std::string> result;
	for (auto&& disk : m_disks)
		result.push_back(disk.first);
	return result;
}

std::unique_ptr<StorageBackend> StorageRouter::create(const DiskConfig& cfg, std::chrono::seconds timeout)
{
	try
	{
		if (cfg.driver() == "local")
			return std::make_unique<LocalBackend>(cfg);
		else if (cfg.driver() == "s3")
			return std::make_unique<S3Backend>(cfg, timeout);
		else if (cfg.driver() == "azure")
			return std::make_unique<AzureBackend>(cfg, timeout);
		else if (cfg.driver() == "gcs")
			return std::make_unique<GCSBackend>(cfg, timeout);
	}
	catch (Exception& e)
	{
		e << Disk{cfg.name()} << Driver{cfg.driver()};
		throw;
	}

	BOOST_THROW_EXCEPTION(UnknownDriver() << Disk{cfg.name()} << Driver{cfg.driver()});
}

} // end of namespace
