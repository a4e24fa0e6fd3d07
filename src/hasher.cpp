/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/hasher.hpp"
#include "rootledger/errors.hpp"
#include "rootledger/json.hpp"
#include <array>
#include <memory>

#include <openssl/evp.h>

namespace rootledger {

namespace {
// Fold -0.0 into 0.0 so both spellings of zero hash alike.
double normalizeZero(double value) noexcept {
    return value == 0.0 ? 0.0 : value;
}

std::string toHex(const unsigned char* data, unsigned int size) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (unsigned int i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}
}

std::string sha256Hex(const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int size = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &size) != 1) {
        // Without a working digest neither dedup nor the chain can be trusted
        throw OrchestratorError(ErrorKind::LedgerIo, "SHA-256 digest unavailable");
    }
    return toHex(digest.data(), size);
}

Json::Value canonicalize(const ResultPayload& payload) {
    Json::Value canon(Json::objectValue);
    canon["t"] = normalizeZero(payload.t);
    canon["root_val"] = normalizeZero(payload.rootVal);
    return canon;
}

CanonicalHash canonicalHash(const ResultPayload& payload) {
    return identityHash(canonicalize(payload));
}

CanonicalHash identityHash(const Json::Value& identity) {
    return kHashPrefix + sha256Hex(canonicalJson(identity));
}

std::string chainDigest(const std::string& previous, const std::string& content) {
    return kHashPrefix + sha256Hex(previous + content);
}

}
