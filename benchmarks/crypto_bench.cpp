#include <benchmark/benchmark.h>
#include "jose/content_crypto.hpp"
#include "jose/crypto.hpp"
#include "jose/ecdsa.hpp"
#include "jose/jwk.hpp"
#include "jose/jws.hpp"
#include "jose/kdf.hpp"
#include <vector>
#include <string>

using namespace jose;

static const CryptoContext& Ctx() { return CryptoContext::defaultContext(); }

static std::vector<uint8_t> CreateData(size_t size) {
    return std::vector<uint8_t>(size, 0x42);
}

// Content encryption
static void BM_AesGcm_Encrypt(benchmark::State& state) {
    auto key = Ctx().randomSecret(32);
    auto iv = Ctx().randomBytes(crypto_constants::GCM_IV_SIZE);
    auto data = CreateData(static_cast<size_t>(state.range(0)));
    std::vector<uint8_t> aad(64, 0x61);
    for (auto _ : state) {
        auto sealed = aes_gcm::encrypt(key, iv, data, aad, Ctx());
        benchmark::DoNotOptimize(sealed);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AesGcm_Encrypt)->Range(64, 64<<10);

static void BM_CbcHmac_Encrypt(benchmark::State& state) {
    auto cek = Ctx().randomSecret(32);
    auto iv = Ctx().randomBytes(16);
    auto data = CreateData(static_cast<size_t>(state.range(0)));
    std::vector<uint8_t> aad(64, 0x61);
    for (auto _ : state) {
        auto sealed = cbc_hmac::encryptAuthenticated(cek, iv, data, aad, Ctx());
        benchmark::DoNotOptimize(sealed);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CbcHmac_Encrypt)->Range(64, 64<<10);

static void BM_CbcHmac_Decrypt(benchmark::State& state) {
    auto cek = Ctx().randomSecret(64);
    auto iv = Ctx().randomBytes(16);
    auto data = CreateData(static_cast<size_t>(state.range(0)));
    std::vector<uint8_t> aad(64, 0x61);
    auto sealed = cbc_hmac::encryptAuthenticated(cek, iv, data, aad, Ctx());
    for (auto _ : state) {
        auto opened = cbc_hmac::decryptAuthenticated(cek, iv, sealed.cipherText, aad,
                                                     sealed.authTag, Ctx());
        benchmark::DoNotOptimize(opened);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CbcHmac_Decrypt)->Range(64, 64<<10);

// Key wrapping and derivation
static void BM_AesKw_Wrap(benchmark::State& state) {
    auto kek = Ctx().randomSecret(32);
    auto cek = Ctx().randomSecret(32);
    for (auto _ : state) {
        auto wrapped = aes_kw::wrap(kek, cek, Ctx());
        benchmark::DoNotOptimize(wrapped);
    }
}
BENCHMARK(BM_AesKw_Wrap);

static void BM_ConcatKdf(benchmark::State& state) {
    auto z = Ctx().randomSecret(32);
    auto other_info = CreateData(32);
    const auto bits = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        auto key = concat_kdf::deriveKey(z, bits, other_info, "SHA256", Ctx());
        benchmark::DoNotOptimize(key);
    }
}
BENCHMARK(BM_ConcatKdf)->Arg(128)->Arg(256)->Arg(512);

static void BM_Pbkdf2(benchmark::State& state) {
    auto password = secure_utils::toSecret(std::string_view("correct horse"));
    auto salt = Ctx().randomBytes(16);
    const auto iterations = static_cast<uint32_t>(state.range(0));
    for (auto _ : state) {
        auto key = pbkdf2::deriveKey(password, salt, iterations, "SHA256", 16, Ctx());
        benchmark::DoNotOptimize(key);
    }
}
BENCHMARK(BM_Pbkdf2)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

// Signatures
static void BM_Hmac_Sign(benchmark::State& state) {
    MacSigner signer(Ctx().randomSecret(32));
    auto header = JwsHeader::Builder(JwsAlgorithm::HS256).build();
    auto data = CreateData(256);
    for (auto _ : state) {
        auto signature = signer.sign(header, data);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_Hmac_Sign);

static void BM_Ecdsa_Sign(benchmark::State& state) {
    auto curve = static_cast<Curve>(state.range(0));
    auto key = EcKey::generate(curve);
    EcdsaSigner signer(key);
    auto header = JwsHeader::Builder(ecdsa::resolveAlgorithm(curve)).build();
    auto data = CreateData(256);
    for (auto _ : state) {
        auto signature = signer.sign(header, data);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_Ecdsa_Sign)
    ->Arg(static_cast<int>(Curve::P256))
    ->Arg(static_cast<int>(Curve::P384))
    ->Arg(static_cast<int>(Curve::P521));

static void BM_Ecdsa_Verify(benchmark::State& state) {
    auto key = EcKey::generate(Curve::P256);
    EcdsaSigner signer(key);
    EcdsaVerifier verifier(key.publicKey());
    auto header = JwsHeader::Builder(JwsAlgorithm::ES256).build();
    auto data = CreateData(256);
    auto signature = signer.sign(header, data);
    for (auto _ : state) {
        bool valid = verifier.verify(header, data, signature);
        benchmark::DoNotOptimize(valid);
    }
}
BENCHMARK(BM_Ecdsa_Verify);

static void BM_RsaPss_Sign(benchmark::State& state) {
    RsaSsaSigner signer(RsaKey::generate(2048));
    auto header = JwsHeader::Builder(JwsAlgorithm::PS256).build();
    auto data = CreateData(256);
    for (auto _ : state) {
        auto signature = signer.sign(header, data);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_RsaPss_Sign)->Unit(benchmark::kMicrosecond);
