/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "ObjectStore.hh"

namespace icdn {

class DiskConfig;

/// Google Cloud Storage bucket accessed by its XML API with a service account key.
class GCSBackend : public ObjectStore
{
public:
	GCSBackend(const DiskConfig& cfg, std::chrono::seconds timeout);

	std::string_view driver() const override;
};

} // end of namespace
