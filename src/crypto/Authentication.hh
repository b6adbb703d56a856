/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <system_error>

namespace icdn {

/// Verifies and issues HS256 bearer tokens (compact JWS) signed with a shared secret.
/// Verification yields the subject id of the caller and nothing else.
class Authentication
{
public:
	explicit Authentication(std::string secret);

	/// Issues a token for \a subject that expires after \a lifetime.
	std::string issue(std::string_view subject, std::chrono::seconds lifetime) const;

	/// Returns the subject of a valid token. Sets \a ec to Error::unauthorized if the
	/// token is malformed, badly signed or expired.
	std::string verify(std::string_view token, std::error_code& ec) const;

	/// Same as verify() but takes the value of the "Authorization" header,
	/// i.e. "Bearer <token>".
	std::string verify_header(std::string_view authorization, std::error_code& ec) const;

	bool enabled() const {return !m_secret.empty();}

private:
	std::string sign(std::string_view header_payload) const;

private:
	std::string m_secret;
};

} // end of namespace
