/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace icdn {

/// One field of a "multipart/form-data" body. All views point into the body.
struct FormPart
{
	std::string_view name;
	std::string_view filename;      //!< empty for plain text fields
	std::string_view content_type;
	std::string_view data;
};

/// Parser of "multipart/form-data" request bodies (RFC 7578).
/// The parsed parts refer to the body passed to the constructor, so it must outlive the parser.
class Multipart
{
public:
	/// Sets \a ec to Error::validation_failed if the content type is not
	/// multipart/form-data or the body is malformed.
	Multipart(std::string_view content_type, std::string_view body, std::error_code& ec);

	std::optional<FormPart> find(std::string_view name) const;
	const std::vector<FormPart>& parts() const {return m_parts;}

	/// Boundary parameter of a "multipart/form-data" content type.
	static std::optional<std::string_view> boundary(std::string_view content_type);

private:
	bool parse(std::string_view body, std::string_view boundary);
	static bool parse_headers(std::string_view headers, FormPart& part);

private:
	std::vector<FormPart> m_parts;
};

} // end of namespace
