/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "EVPWrapper.hh"

#include "util/Escape.hh"

#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>

namespace icdn {
namespace {

struct BIORelease
{
	void operator()(BIO *bio) const {::BIO_free(bio);}
};

}

void HashCTXRelease::operator()(EVP_MD_CTX *ctx) const
{
	// This is a macro, so can't take its address and put it to unique_ptr
	::EVP_MD_CTX_free(ctx);
}

HashCTX NewHashCTX()
{
	return HashCTX{::EVP_MD_CTX_new(), HashCTXRelease{}};
}

void PKeyRelease::operator()(EVP_PKEY *key) const
{
	::EVP_PKEY_free(key);
}

SHA256Digest hmac_sha256(std::string_view key, std::string_view data)
{
	SHA256Digest result{};
	unsigned len = result.size();
	::HMAC(
		::EVP_sha256(),
		key.data(), static_cast<int>(key.size()),
		reinterpret_cast<const unsigned char*>(data.data()), data.size(),
		result.data(), &len
	);
	return result;
}

std::string sha256_hex(BufferView data)
{
	SHA256Digest result{};
	unsigned len = result.size();

	auto ctx = NewHashCTX();
	::EVP_DigestInit_ex(ctx.get(), ::EVP_sha256(), nullptr);
	::EVP_DigestUpdate(ctx.get(), data.data(), data.size());
	::EVP_DigestFinal_ex(ctx.get(), result.data(), &len);
	return to_hex(result);
}

PKey load_private_key(std::string_view pem)
{
	std::unique_ptr<BIO, BIORelease> bio{::BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()))};
	if (!bio)
		return {};

	return PKey{::PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)};
}

std::optional<std::string> rsa_sha256_sign(EVP_PKEY *key, std::string_view data)
{
	if (!key)
		return std::nullopt;

	auto ctx = NewHashCTX();
	if (::EVP_DigestSignInit(ctx.get(), nullptr, ::EVP_sha256(), nullptr, key) != 1)
		return std::nullopt;

	if (::EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) != 1)
		return std::nullopt;

	std::size_t size{};
	if (::EVP_DigestSignFinal(ctx.get(), nullptr, &size) != 1)
		return std::nullopt;

	std::string signature(size, '\0');
	if (::EVP_DigestSignFinal(ctx.get(), reinterpret_cast<unsigned char*>(&signature[0]), &size) != 1)
		return std::nullopt;

	signature.resize(size);
	return signature;
}

bool secure_equal(std::string_view lhs, std::string_view rhs)
{
	return lhs.size() == rhs.size() && ::CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

} // end of namespace icdn
