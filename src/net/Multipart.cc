/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Multipart.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/StringFields.hh"

#include <string>

namespace icdn {
namespace {

const std::string_view crlf{"\r\n"};

std::string_view unquote(std::string_view value)
{
	value = trim(value);
	if (value.size() >= 2 && value.front() == '\"' && value.back() == '\"')
		value = value.substr(1, value.size()-2);
	return value;
}

bool starts_with(std::string_view str, std::string_view prefix)
{
	return str.substr(0, prefix.size()) == prefix;
}

}

Multipart::Multipart(std::string_view content_type, std::string_view body, std::error_code& ec)
{
	auto bound = boundary(content_type);
	if (!bound || !parse(body, *bound))
	{
		m_parts.clear();
		ec = Error::validation_failed;
	}
	else
		ec.clear();
}

std::optional<std::string_view> Multipart::boundary(std::string_view content_type)
{
	auto type = trim(std::get<0>(tokenize<1>(content_type, ";")));
	if (to_lower(type) != "multipart/form-data")
		return std::nullopt;

	auto [bound] = header_params.find_optional(content_type, "boundary");
	if (!bound)
		return std::nullopt;

	auto result = unquote(*bound);
	return result.empty() || result.size() > 70 ? std::nullopt : std::optional<std::string_view>{result};
}

std::optional<FormPart> Multipart::find(std::string_view name) const
{
	for (auto&& part : m_parts)
		if (part.name == name)
			return part;
	return std::nullopt;
}

bool Multipart::parse(std::string_view body, std::string_view boundary)
{
	std::string delimiter{"--"};
	delimiter.append(boundary);

	// skip the preamble
	auto start = body.find(delimiter);
	if (start == body.npos)
		return false;
	body.remove_prefix(start + delimiter.size());

	// The data of every part ends with CRLF followed by the next delimiter.
	auto separator = std::string{crlf} + delimiter;

	while (true)
	{
		// close-delimiter
		if (starts_with(body, "--"))
			return true;

		if (!starts_with(body, crlf))
			return false;
		body.remove_prefix(crlf.size());

		auto header_end = body.find("\r\n\r\n");
		if (header_end == body.npos)
			return false;

		FormPart part;
		if (!parse_headers(body.substr(0, header_end), part))
			return false;
		body.remove_prefix(header_end + 4);

		auto data_end = body.find(separator);
		if (data_end == body.npos)
			return false;

		part.data = body.substr(0, data_end);
		m_parts.push_back(part);

		body.remove_prefix(data_end + separator.size());
	}
}

bool Multipart::parse_headers(std::string_view headers, FormPart& part)
{
	bool disposition = false;
	while (!headers.empty())
	{
		auto line = split_front_substring(headers, crlf);

		auto [name, colon] = split_left(line, ":");
		if (colon != ':')
			continue;

		auto field = to_lower(trim(name));
		if (field == "content-disposition")
		{
			auto type = trim(std::get<0>(tokenize<1>(line, ";")));
			if (to_lower(type) != "form-data")
				return false;

			auto [field_name, filename] = header_params.find_optional(line, "name", "filename");
			if (!field_name)
				return false;

			part.name = unquote(*field_name);
			if (filename)
				part.filename = unquote(*filename);
			disposition = true;
		}
		else if (field == "content-type")
			part.content_type = trim(line);
	}
	return disposition;
}

} // end of namespace
