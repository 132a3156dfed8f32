#include "security/request_signer.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace security {
namespace {

std::string hex_encode(const unsigned char *data, std::size_t length) {
    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return stream.str();
}

}  // namespace

std::string hmacSha256Hex(const std::string &key, const std::string &message) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char *>(message.data()), message.size(), hash,
             &hash_len) == nullptr) {
        throw std::runtime_error("Unable to compute HMAC-SHA256 request signature");
    }
    return hex_encode(hash, hash_len);
}

RequestSigner::RequestSigner(std::string api_secret) : api_secret_(std::move(api_secret)) {
    if (api_secret_.empty()) {
        throw std::invalid_argument("RequestSigner requires a non-empty API secret");
    }
}

std::string RequestSigner::canonicalQuery(const Parameters &params) {
    Parameters sorted;
    sorted.reserve(params.size());
    for (const auto &entry : params) {
        if (entry.first != kSignatureField) {
            sorted.push_back(entry);
        }
    }
    // Ties on key fall back to value so duplicate keys still serialize deterministically.
    std::sort(sorted.begin(), sorted.end());

    std::string query;
    for (const auto &[key, value] : sorted) {
        if (!query.empty()) {
            query.push_back('&');
        }
        query += key;
        query.push_back('=');
        query += value;
    }
    return query;
}

std::string RequestSigner::sign(const Parameters &params) const {
    return hmacSha256Hex(api_secret_, canonicalQuery(params));
}

Parameters RequestSigner::signParameters(Parameters params) const {
    params.erase(std::remove_if(params.begin(), params.end(),
                                [](const auto &entry) { return entry.first == kSignatureField; }),
                 params.end());
    std::string signature = sign(params);
    params.emplace_back(kSignatureField, std::move(signature));
    return params;
}

}  // namespace security
