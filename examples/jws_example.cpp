/**
 * @file jws_example.cpp
 * @brief Signing and verifying compact JWSs
 *
 * This example shows how to:
 * 1. Sign with HS256, PS256 and ES384
 * 2. Verify a received compact JWS
 * 3. Accept a "crit" header parameter the application understands
 */

#include "jose/error.hpp"
#include "jose/jws.hpp"

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace jose;

int main() {
    std::cout << "JWS Example\n";

    try {
        const std::string claims = R"({"iss":"joe","exp":1300819380,"http://example.com/is_root":true})";

        // Step 1: Set up one signer/verifier pair per algorithm family
        std::cout << "1. Creating keys...\n";
        auto secret = CryptoContext::defaultContext().randomSecret(32);
        auto rsa = RsaKey::generate(2048);
        auto ec = EcKey::generate(Curve::P384);

        std::vector<std::pair<std::unique_ptr<JwsSigner>, std::unique_ptr<JwsVerifier>>> pairs;
        pairs.emplace_back(std::make_unique<MacSigner>(secret),
                           std::make_unique<MacVerifier>(secret));
        pairs.emplace_back(std::make_unique<RsaSsaSigner>(rsa),
                           std::make_unique<RsaSsaVerifier>(rsa.publicKey()));
        pairs.emplace_back(std::make_unique<EcdsaSigner>(ec),
                           std::make_unique<EcdsaVerifier>(ec.publicKey()));
        const JwsAlgorithm algs[] = {JwsAlgorithm::HS256, JwsAlgorithm::PS256,
                                     JwsAlgorithm::ES384};
        std::cout << "   RSA modulus: " << rsa.modulusBits() << " bits\n";
        std::cout << "   EC key: " << ec.toPublicJwk().dump() << "\n\n";

        // Step 2: Sign and verify
        std::cout << "2. Signing and verifying...\n";
        for (size_t i = 0; i < pairs.size(); ++i) {
            JwsObject jws(JwsHeader::Builder(algs[i]).type("JWT").build(), claims);
            jws.sign(*pairs[i].first);
            auto compact = jws.serialize();

            auto received = JwsObject::parse(compact);
            bool valid = received.verify(*pairs[i].second);
            std::cout << "   " << name(algs[i]) << ": " << compact.size()
                      << " characters, signature "
                      << (valid ? "VALID" : "INVALID") << "\n";
        }
        std::cout << "\n";

        // Step 3: Critical header parameters
        std::cout << "3. Critical header parameters...\n";
        JwsObject critical(JwsHeader::Builder(JwsAlgorithm::HS256)
                               .customParam("exp", 1363284000)
                               .criticalParams({"exp"})
                               .build(),
                           claims);
        critical.sign(MacSigner(secret));
        auto compact = critical.serialize();

        bool strict = JwsObject::parse(compact).verify(MacVerifier(secret));
        std::cout << "   Default policy: " << (strict ? "VALID" : "REJECTED") << "\n";

        bool deferred = JwsObject::parse(compact).verify(
            MacVerifier(secret, CriticalParamsPolicy(std::set<std::string>{"exp"})));
        std::cout << "   With \"exp\" deferred: " << (deferred ? "VALID" : "REJECTED") << "\n";

    } catch (const JoseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
