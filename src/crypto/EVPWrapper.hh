/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "util/BufferView.hh"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace icdn {

struct HashCTXRelease
{
	void operator()(EVP_MD_CTX *ctx) const;
};
using HashCTX = std::unique_ptr<EVP_MD_CTX, HashCTXRelease>;

HashCTX NewHashCTX();

struct PKeyRelease
{
	void operator()(EVP_PKEY *key) const;
};
using PKey = std::unique_ptr<EVP_PKEY, PKeyRelease>;

using SHA256Digest = std::array<unsigned char, 32>;

SHA256Digest hmac_sha256(std::string_view key, std::string_view data);
std::string sha256_hex(BufferView data);

/// Loads a private key in PEM format. Returns an empty pointer if the key is invalid.
PKey load_private_key(std::string_view pem);

/// RSASSA-PKCS1-v1_5 signature with SHA-256. Returns std::nullopt on failure.
std::optional<std::string> rsa_sha256_sign(EVP_PKEY *key, std::string_view data);

/// Compares two strings in constant time with respect to their content.
bool secure_equal(std::string_view lhs, std::string_view rhs);

} // end of namespace icdn
