#pragma once

#include <string>
#include <utility>
#include <vector>

namespace security {

using Parameters = std::vector<std::pair<std::string, std::string>>;

// Lowercase hex HMAC-SHA256 of |message| keyed with |key|.
std::string hmacSha256Hex(const std::string &key, const std::string &message);

// RequestSigner authenticates exchange requests. The signature covers every
// parameter except "sign", serialized as key=value pairs sorted by key and
// joined with '&', so the caller's insertion order never changes the result.
class RequestSigner {
  public:
    static constexpr const char *kSignatureField = "sign";

    explicit RequestSigner(std::string api_secret);

    [[nodiscard]] std::string sign(const Parameters &params) const;

    // Returns |params| with a freshly computed "sign" entry appended last.
    // A stale "sign" entry in the input is dropped first.
    [[nodiscard]] Parameters signParameters(Parameters params) const;

    // Sorted key=value&key=value form the signature is computed over.
    static std::string canonicalQuery(const Parameters &params);

  private:
    std::string api_secret_;
};

}  // namespace security
