/**
 * @file openssl_util.hpp
 * @brief RAII wrappers and fetch helpers shared by the OpenSSL-backed
 * sources (not installed)
 */

#pragma once

#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/param_build.h>

#include <string>
#include <string_view>

#include "jose/crypto_context.hpp"
#include "jose/error.hpp"

namespace jose {

/**
 * @brief RAII wrapper for OpenSSL handles with a free function
 */
template <typename T, void (*Deleter)(T*)>
class OpenSSLWrapper {
 public:
  explicit OpenSSLWrapper(T* ptr = nullptr) : ptr_(ptr) {}
  ~OpenSSLWrapper() {
    if (ptr_) Deleter(ptr_);
  }

  OpenSSLWrapper(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper& operator=(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper(OpenSSLWrapper&& other) noexcept : ptr_(other.ptr_) {
    other.ptr_ = nullptr;
  }
  OpenSSLWrapper& operator=(OpenSSLWrapper&& other) noexcept {
    if (this != &other) {
      if (ptr_) Deleter(ptr_);
      ptr_ = other.ptr_;
      other.ptr_ = nullptr;
    }
    return *this;
  }

  T* get() const noexcept { return ptr_; }
  T* release() noexcept {
    T* tmp = ptr_;
    ptr_ = nullptr;
    return tmp;
  }
  T** out() noexcept { return &ptr_; }

 private:
  T* ptr_;
};

using EvpMdWrapper = OpenSSLWrapper<EVP_MD, EVP_MD_free>;
using EvpMdCtxWrapper = OpenSSLWrapper<EVP_MD_CTX, EVP_MD_CTX_free>;
using EvpPkeyCtxWrapper = OpenSSLWrapper<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;
using EvpKdfWrapper = OpenSSLWrapper<EVP_KDF, EVP_KDF_free>;
using EvpKdfCtxWrapper = OpenSSLWrapper<EVP_KDF_CTX, EVP_KDF_CTX_free>;
using BignumWrapper = OpenSSLWrapper<BIGNUM, BN_free>;
using BnCtxWrapper = OpenSSLWrapper<BN_CTX, BN_CTX_free>;
using ParamBldWrapper = OpenSSLWrapper<OSSL_PARAM_BLD, OSSL_PARAM_BLD_free>;
using ParamWrapper = OpenSSLWrapper<OSSL_PARAM, OSSL_PARAM_free>;

inline EvpMdWrapper fetchDigest(std::string_view digest_name,
                                const CryptoContext& ctx) {
  std::string name(digest_name);
  EvpMdWrapper md(
      EVP_MD_fetch(ctx.libraryContext(), name.c_str(), ctx.propertyQuery()));
  if (!md.get()) {
    throw CryptoError("Digest " + name + " is not available");
  }
  return md;
}

inline EvpKdfCtxWrapper newKdfContext(const char* kdf_name,
                                      const CryptoContext& ctx) {
  EvpKdfWrapper kdf(
      EVP_KDF_fetch(ctx.libraryContext(), kdf_name, ctx.propertyQuery()));
  if (!kdf.get()) {
    throw CryptoError(std::string("KDF ") + kdf_name + " is not available");
  }
  EvpKdfCtxWrapper kctx(EVP_KDF_CTX_new(kdf.get()));
  if (!kctx.get()) {
    throw CryptoError(std::string("Failed to create ") + kdf_name +
                      " context");
  }
  return kctx;
}

}  // namespace jose
