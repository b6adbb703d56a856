/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "RequestHandler.hh"
#include "RequestHandler.ipp"

#include "config.hh"

#include "crypto/Authentication.hh"
#include "net/Multipart.hh"
#include "util/Escape.hh"
#include "util/StringFields.hh"

#include <sstream>

namespace icdn {
namespace {

const auto features = nlohmann::json::array({"image-processing", "format-conversion", "dynamic-resizing", "caching"});

std::string size_limit(std::size_t bytes)
{
	std::ostringstream ss;
	ss << bytes / 1024 / 1024 << "MB";
	return ss.str();
}

}

RequestHandler::RequestHandler(ImageService& service, const Authentication& auth, bool production) :
	m_service{service}, m_auth{auth}, m_production{production}
{
}

RequestHandler::RequestBodyType RequestHandler::on_request_header(const RequestHeader& header) const
{
	std::string_view query;
	auto path = split_path({header.target().data(), header.target().size()}, query);

	return header.method() == http::verb::post && path.size() == 2 && path[0] == "api" && path[1] == "upload" ?
		RequestBodyType::string : RequestBodyType::empty;
}

std::vector<std::string_view> RequestHandler::split_path(std::string_view target, std::string_view& query)
{
	auto qmark = target.find('?');
	query = qmark != target.npos ? target.substr(qmark+1) : std::string_view{};
	target = target.substr(0, qmark);

	std::vector<std::string_view> result;
	while (!target.empty())
	{
		auto [segment, sep] = split_left(target, "/");
		if (!segment.empty())
			result.push_back(segment);
	}
	return result;
}

StringResponse RequestHandler::json_response(const nlohmann::json& json, http::status status, unsigned version)
{
	// request targets and filenames may carry bytes that are not UTF-8
	StringResponse res{
		std::piecewise_construct,
		std::make_tuple(json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)),
		std::make_tuple(status, version)
	};
	res.set(http::field::content_type, "application/json");
	return res;
}

StringResponse RequestHandler::bad_request(std::string_view why, unsigned version)
{
	return json_response(
		{{"success", false}, {"error", "Bad Request"}, {"message", why}},
		http::status::bad_request,
		version
	);
}

StringResponse RequestHandler::not_found(const RequestHeader& header)
{
	std::ostringstream msg;
	msg << "Cannot " << header.method_string() << ' ' << header.target();
	return json_response(
		{{"error", "Not Found"}, {"message", msg.str()}},
		http::status::not_found,
		header.version()
	);
}

StringResponse RequestHandler::internal_error(unsigned version)
{
	return json_response(
		{{"success", false}, {"error", "Internal Server Error"}, {"message", "Failed to process request"}},
		http::status::internal_server_error,
		version
	);
}

StringResponse RequestHandler::error_response(std::error_code ec, std::string_view message, unsigned version) const
{
	nlohmann::json json{
		{"success", false},
		{"error",   ec.message()},
		{"message", message}
	};
	if (!m_production)
		json.emplace("details", nlohmann::json{{"code", ec.value()}, {"category", ec.category().name()}});

	return json_response(json, http_status(ec), version);
}

std::string RequestHandler::authenticate(const RequestHeader& req, std::error_code& ec) const
{
	auto authorization = req[http::field::authorization];
	auto subject = m_auth.verify_header({authorization.data(), authorization.size()}, ec);
	if (ec)
		Log(LOG_INFO, "rejected %1% %2%: no valid bearer token", req.method_string(), req.target());
	return subject;
}

StringResponse RequestHandler::on_upload(const StringRequest& req)
{
	std::error_code ec;
	auto subject = authenticate(req, ec);
	if (ec)
		return error_response(ec, "A valid bearer token is required", req.version());

	auto content_type = req[http::field::content_type];
	Multipart form{{content_type.data(), content_type.size()}, req.body(), ec};
	if (ec)
		return error_response(ec, "Expecting a multipart/form-data body", req.version());

	auto image = form.find("image");
	if (!image || image->filename.empty())
		return error_response(Error::validation_failed, "No file uploaded", req.version());

	auto disk = form.find("disk");
	auto file = m_service.upload(
		buffer_view(image->data),
		image->filename,
		image->content_type,
		disk ? trim(disk->data) : std::string_view{},
		subject,
		ec
	);
	if (ec)
		return error_response(ec, "Upload failed", req.version());

	return json_response(
		{
			{"success", true},
			{"file", {
				{"id",              file.id},
				{"originalName",    file.original_name},
				{"filename",        file.filename},
				{"path",            file.path},
				{"size",            file.size},
				{"mimetype",        file.mime},
				{"disk",            file.disk},
				{"uploadedBy",      file.uploaded_by},
				{"uploadedAt",      file.uploaded_at.iso8601()},
				{"url",             file.url},
				{"urls",            ImageService::preset_urls(file.id)}
			}}
		},
		http::status::created,
		req.version()
	);
}

StringResponse RequestHandler::on_delete(std::string_view id, std::string_view query, const RequestHeader& req)
{
	std::error_code ec;
	auto subject = authenticate(req, ec);
	if (ec)
		return error_response(ec, "A valid bearer token is required", req.version());

	auto [disk] = urlform.find(query, "disk");
	m_service.remove(id, url_decode(disk), ec);
	if (ec)
		return error_response(ec, "Failed to delete image", req.version());

	Log(LOG_INFO, "image %1% deleted by %2%", id, subject);
	return json_response(
		{{"success", true}, {"message", "Image deleted successfully"}, {"deletedBy", subject}},
		http::status::ok,
		req.version()
	);
}

StringResponse RequestHandler::on_info(std::string_view id, unsigned version) const
{
	std::error_code ec;
	auto image = m_service.info(id, ec);
	if (ec)
		return error_response(ec, "Image not found", version);

	nlohmann::json metadata{{"format", image.format}};
	if (image.info)
	{
		metadata.emplace("width",    image.info->width);
		metadata.emplace("height",   image.info->height);
		metadata.emplace("channels", image.info->channels);
		metadata.emplace("hasAlpha", image.info->has_alpha);
	}

	auto sizes = nlohmann::json::array();
	for (auto&& preset : presets)
		sizes.push_back(preset.name);
	sizes.push_back("custom");

	return json_response(
		{
			{"id",          image.id},
			{"filename",    image.filename},
			{"size",        image.meta.size},
			{"uploadedAt",  image.meta.last_modified.iso8601()},
			{"metadata",    std::move(metadata)},
			{"availableFormats", {"jpeg", "png", "webp", "gif"}},
			{"availableSizes",   std::move(sizes)}
		},
		http::status::ok,
		version
	);
}

StringResponse RequestHandler::on_list(unsigned version) const
{
	auto images = nlohmann::json::array();
	for (auto&& image : m_service.list())
		images.push_back({
			{"id",          image.id},
			{"filename",    image.filename},
			{"size",        image.meta.size},
			{"uploadedAt",  image.meta.last_modified.iso8601()},
			{"urls",        ImageService::preset_urls(image.id)}
		});

	return json_response(
		{{"success", true}, {"count", images.size()}, {"images", std::move(images)}},
		http::status::ok,
		version
	);
}

StringResponse RequestHandler::on_health(unsigned version) const
{
	return json_response(
		{
			{"status",    "healthy"},
			{"service",   constants::service_name},
			{"version",   constants::version},
			{"features",  features},
			{"timestamp", Timestamp::now().iso8601()}
		},
		http::status::ok,
		version
	);
}

StringResponse RequestHandler::on_stats(unsigned version) const
{
	using namespace std::chrono;

	return json_response(
		{
			{"service",  constants::service_name},
			{"version",  constants::version},
			{"features", features},
			{"stats", {
				{"uploadedImages", m_service.index().size()},
				{"cachedImages",   m_service.cache().count()}
			}},
			{"limits", {
				{"maxFileSize",      size_limit(m_service.upload_limit())},
				{"supportedFormats", {"jpeg", "jpg", "png", "webp", "gif", "svg", "bmp", "tiff"}}
			}},
			{"uptime", duration_cast<duration<double>>(Timestamp::now() - m_service.started()).count()}
		},
		http::status::ok,
		version
	);
}

} // end of namespace
