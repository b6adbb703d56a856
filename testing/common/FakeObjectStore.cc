/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "FakeObjectStore.hh"

#include "net/Request.hh"
#include "util/Escape.hh"
#include "util/StringFields.hh"
#include "util/Timestamp.hh"

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <sstream>

namespace icdn {
namespace {

const std::size_t page_size = 2;

std::string query_param(std::string_view query, std::string_view name)
{
	auto [value] = urlform.find(query, name);
	return url_decode(value);
}

}

FakeObjectStore::FakeObjectStore() :
	m_acceptor{m_ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}},
	m_thread{[this]{serve();}}
{
}

FakeObjectStore::~FakeObjectStore()
{
	m_stop = true;

	// wake up the blocking accept()
	boost::system::error_code ec;
	tcp::socket wake{m_ioc};
	wake.connect(m_acceptor.local_endpoint(), ec);

	m_thread.join();
}

std::string FakeObjectStore::endpoint() const
{
	return "http://127.0.0.1:" + std::to_string(m_acceptor.local_endpoint().port());
}

bool FakeObjectStore::has(const std::string& key) const
{
	std::unique_lock lock{m_mutex};
	return m_objects.find(key) != m_objects.end();
}

std::string FakeObjectStore::body(const std::string& key) const
{
	std::unique_lock lock{m_mutex};
	auto it = m_objects.find(key);
	return it != m_objects.end() ? it->second.body : std::string{};
}

void FakeObjectStore::serve()
{
	while (!m_stop)
	{
		boost::system::error_code ec;
		tcp::socket socket{m_ioc};
		m_acceptor.accept(socket, ec);
		if (ec || m_stop)
			continue;

		boost::beast::flat_buffer buffer;
		StringRequest req;
		http::read(socket, buffer, req, ec);
		if (ec)
			continue;

		m_requests++;

		std::string_view target{req.target().data(), req.target().size()};
		auto qmark = target.find('?');
		auto query = qmark == target.npos ? std::string_view{} : target.substr(qmark+1);
		auto key   = url_decode(target.substr(0, qmark));

		StringResponse res{http::status::ok, req.version()};
		res.keep_alive(false);

		std::size_t head_length = 0;

		std::unique_lock lock{m_mutex};
		auto obj = m_objects.find(key);

		if (m_fail != 0)
		{
			res.result(m_fail.load());
		}
		else if (req.method() == http::verb::get && (query_param(query, "list-type") == "2" || query_param(query, "comp") == "list"))
		{
			// S3 pages by continuation token and Azure by marker. Both are the last key of the previous page here.
			bool azure  = query_param(query, "comp") == "list";
			auto prefix = query_param(query, "prefix");
			auto after  = query_param(query, azure ? "marker" : "continuation-token");

			std::vector<std::string> page;
			bool truncated = false;
			for (auto&& entry : m_objects)
			{
				auto&& name = entry.first;
				if (name.compare(0, key.size(), key) != 0 || name.size() <= key.size())
					continue;

				auto rel = name.substr(key.back() == '/' ? key.size() : key.size() + 1);
				if (rel.compare(0, prefix.size(), prefix) != 0 || (!after.empty() && rel <= after))
					continue;

				if (page.size() == page_size)
				{
					truncated = true;
					break;
				}
				page.push_back(rel);
			}

			std::ostringstream xml;
			xml << R"(<?xml version="1.0" encoding="UTF-8"?>)";
			if (azure)
			{
				xml << "<EnumerationResults><Blobs>";
				for (auto&& name : page)
					xml << "<Blob><Name>" << name << "</Name><Properties/></Blob>";
				xml << "</Blobs><NextMarker>" << (truncated ? page.back() : "") << "</NextMarker></EnumerationResults>";
			}
			else
			{
				xml << "<ListBucketResult><IsTruncated>" << (truncated ? "true" : "false") << "</IsTruncated>";
				for (auto&& name : page)
					xml << "<Contents><Key>" << name << "</Key><Size>1</Size></Contents>";
				if (truncated)
					xml << "<NextContinuationToken>" << page.back() << "</NextContinuationToken>";
				xml << "</ListBucketResult>";
			}
			res.set(http::field::content_type, "application/xml");
			res.body() = xml.str();
		}
		else if (req.method() == http::verb::put)
		{
			// S3 and GCS name the source "/bucket/key", Azure by its full URL
			auto amz_copy = req["x-amz-copy-source"];
			if (amz_copy.empty())
				amz_copy = req["x-goog-copy-source"];
			auto ms_copy  = req["x-ms-copy-source"];
			if (!amz_copy.empty() || !ms_copy.empty())
			{
				std::string source;
				if (!amz_copy.empty())
					source = url_decode({amz_copy.data(), amz_copy.size()});
				else
				{
					std::string_view url{ms_copy.data(), ms_copy.size()};
					url.remove_prefix(url.find("://") + 3);
					source = url_decode(url.substr(url.find('/')));
				}

				auto src = m_objects.find(source);
				if (src == m_objects.end())
					res.result(http::status::not_found);
				else
				{
					m_objects[key] = src->second;
					if (!ms_copy.empty())
					{
						res.result(http::status::accepted);
						res.set("x-ms-copy-status", "success");
					}
					else
						res.body() = "<CopyObjectResult/>";
				}
			}
			else
			{
				auto content_type = req[http::field::content_type];
				m_objects[key] = Object{req.body(), std::string{content_type.data(), content_type.size()}};
				res.result(http::status::created);
			}
		}
		else if (req.method() == http::verb::delete_)
		{
			if (obj == m_objects.end())
				res.result(http::status::not_found);
			else
			{
				m_objects.erase(obj);
				res.result(http::status::accepted);
			}
		}
		else if (obj == m_objects.end())
		{
			res.result(http::status::not_found);
		}
		else if (req.method() == http::verb::head || req.method() == http::verb::get)
		{
			head_length = obj->second.body.size();
			res.set(http::field::content_type, obj->second.content_type);
			res.set(http::field::last_modified, Timestamp::now().http_format());
			if (req.method() == http::verb::get)
				res.body() = obj->second.body;
		}
		else
			res.result(http::status::bad_request);

		lock.unlock();

		if (req.method() == http::verb::head && res.result() == http::status::ok)
		{
			// A HEAD response reports the length of the body it does not carry.
			EmptyResponse head{res.result(), res.version()};
			for (auto&& field : res)
				head.set(field.name_string(), field.value());
			head.content_length(head_length);
			head.keep_alive(false);

			http::response_serializer<http::empty_body> sr{head};
			http::write_header(socket, sr, ec);
		}
		else
		{
			res.prepare_payload();
			http::write(socket, res, ec);
		}

		socket.shutdown(tcp::socket::shutdown_both, ec);
	}
}

} // end of namespace
