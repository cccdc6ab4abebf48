/**
 * @file jwe_example.cpp
 * @brief Encrypting and decrypting compact JWEs
 *
 * This example shows how to:
 * 1. Encrypt to a recipient's published EC public key with ECDH-ES+A128KW
 * 2. Parse and decrypt the compact serialization
 * 3. Protect a compressed payload with a password (PBES2)
 * 4. Observe that tampering is reported as a single decryption error
 */

#include "jose/error.hpp"
#include "jose/jwe.hpp"
#include "jose/jwk.hpp"
#include "jose/logging.hpp"

#include <iostream>
#include <string>

using namespace jose;

int main() {
    std::cout << "JWE Example\n";
    logging::Logger::getInstance().setLogLevel("info");

    try {
        // Step 1: The recipient generates a key pair and publishes its JWK
        std::cout << "1. Creating recipient key pair...\n";
        auto recipient = EcKey::generate(Curve::P256);
        auto published = recipient.toPublicJwk();
        std::cout << "   Public JWK: " << published.dump() << "\n";
        std::cout << "   Thumbprint: " << recipient.thumbprint() << "\n\n";

        // Step 2: The sender encrypts to the published key
        std::cout << "2. Encrypting with ECDH-ES+A128KW and A128GCM...\n";
        auto header = JweHeader::Builder(JweAlgorithm::ECDH_ES_A128KW,
                                         EncryptionMethod::A128GCM)
                          .keyId(recipient.thumbprint())
                          .build();
        JweObject jwe(header, std::string_view("Live long and prosper."));
        jwe.encrypt(JweEncrypter{EcdhKeyManagement(EcKey::fromPublicJwk(published))});
        auto compact = jwe.serialize();
        std::cout << "   Protected header: " << jwe.header().toJson().dump() << "\n";
        std::cout << "   Compact: " << compact << "\n\n";

        // Step 3: The recipient parses and decrypts
        std::cout << "3. Decrypting...\n";
        auto received = JweObject::parse(compact);
        received.decrypt(JweDecrypter{EcdhKeyManagement(recipient)});
        std::cout << "   Plaintext: " << received.payloadAsString() << "\n\n";

        // Step 4: Password based encryption of a compressed document
        std::cout << "4. Encrypting with PBES2-HS256+A128KW and zip=DEF...\n";
        auto password = secure_utils::toSecret(std::string_view("correct horse battery staple"));
        std::string document(512, '.');
        JweObject protected_doc(JweHeader::Builder(JweAlgorithm::PBES2_HS256_A128KW,
                                                   EncryptionMethod::A128CBC_HS256)
                                    .compression(CompressionAlgorithm::DEF)
                                    .build(),
                                document);
        protected_doc.encrypt(JweEncrypter{PasswordKeyManagement(password, 16, 10000)});
        std::cout << "   Ciphertext bytes: " << protected_doc.cipherText().decode().size()
                  << " for " << document.size() << " plaintext bytes\n";
        std::cout << "   p2c: " << protected_doc.header().pbes2Count().value_or(0) << "\n\n";

        auto opened = JweObject::parse(protected_doc.serialize());
        opened.decrypt(JweDecrypter{PasswordKeyManagement(password)});
        std::cout << "   Decrypted " << opened.payload().size() << " bytes\n\n";

        // Step 5: Tampering
        std::cout << "5. Tampering with the ciphertext...\n";
        auto tampered = compact;
        auto ct_start = tampered.find('.', tampered.find('.', tampered.find('.') + 1) + 1) + 1;
        tampered[ct_start] = tampered[ct_start] == 'A' ? 'B' : 'A';
        try {
            auto forged = JweObject::parse(tampered);
            forged.decrypt(JweDecrypter{EcdhKeyManagement(recipient)});
            std::cout << "   Expected: rejected\n   Obtained: accepted\n";
        } catch (const DecryptionError& e) {
            std::cout << "   Expected: rejected\n   Obtained: rejected (" << e.what() << ")\n";
        }

    } catch (const JoseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
