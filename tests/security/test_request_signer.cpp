#include "security/request_signer.h"

#include <algorithm>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "support/fakes.h"

namespace {

using test_support::Expect;

bool TestHmacKnownVector() {
    // RFC 4231 test case 2.
    const std::string digest = security::hmacSha256Hex("Jefe", "what do ya want for nothing?");
    return Expect(digest == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
                  "HMAC-SHA256 did not match the RFC 4231 vector");
}

bool TestCanonicalQuerySortsAndSkipsSignature() {
    const security::Parameters params = {
        {"timestamp", "1700000000000"},
        {"apiKey", "key"},
        {"sign", "stale"},
        {"accountType", "UNIFIED"},
    };
    const std::string query = security::RequestSigner::canonicalQuery(params);
    return Expect(query == "accountType=UNIFIED&apiKey=key&timestamp=1700000000000",
                  "Canonical query was not key-sorted or still contained sign");
}

bool TestSignatureMatchesManualHmac() {
    security::RequestSigner signer("secret");
    const security::Parameters params = {{"b", "2"}, {"a", "1"}};
    return Expect(signer.sign(params) == security::hmacSha256Hex("secret", "a=1&b=2"),
                  "Signature was not computed over the sorted serialization");
}

bool TestSignatureIgnoresInsertionOrder() {
    security::RequestSigner signer("order-independent");
    security::Parameters params = {
        {"apiKey", "abc"},
        {"symbol", "SOLUSDT"},
        {"side", "Buy"},
        {"orderType", "Market"},
        {"qty", "1.5"},
        {"timestamp", "1700000000000"},
        {"timeInForce", "GoodTillCancel"},
    };
    const std::string expected = signer.sign(params);

    std::mt19937 rng(42);
    for (int i = 0; i < 20; ++i) {
        std::shuffle(params.begin(), params.end(), rng);
        if (signer.sign(params) != expected) {
            std::cerr << "Signature changed after reordering parameters" << std::endl;
            return false;
        }
    }
    return true;
}

bool TestSignParametersAppendsSignatureLast() {
    security::RequestSigner signer("secret");
    const auto signed_params = signer.signParameters({{"sign", "old"}, {"x", "1"}, {"a", "2"}});

    if (!Expect(signed_params.size() == 3, "Expected stale sign to be replaced, not kept")) {
        return false;
    }
    if (!Expect(signed_params.back().first == "sign", "Signature was not appended last")) {
        return false;
    }
    return Expect(signed_params.back().second == security::hmacSha256Hex("secret", "a=2&x=1"),
                  "Appended signature does not cover the remaining parameters");
}

bool TestRejectsEmptySecret() {
    try {
        security::RequestSigner signer("");
        std::cerr << "RequestSigner accepted an empty secret" << std::endl;
        return false;
    } catch (const std::invalid_argument&) {
        return true;
    }
}

}  // namespace

int main() {
    if (!TestHmacKnownVector()) {
        return 1;
    }
    if (!TestCanonicalQuerySortsAndSkipsSignature()) {
        return 1;
    }
    if (!TestSignatureMatchesManualHmac()) {
        return 1;
    }
    if (!TestSignatureIgnoresInsertionOrder()) {
        return 1;
    }
    if (!TestSignParametersAppendsSignatureLast()) {
        return 1;
    }
    if (!TestRejectsEmptySecret()) {
        return 1;
    }
    return 0;
}
