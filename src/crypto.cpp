#include "trustchain/crypto.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "trustchain/base64.hpp"
#include "trustchain/logging.hpp"

namespace trustchain {

void EvpKeyDeleter::operator()(EVP_PKEY* key) const noexcept {
  if (key) EVP_PKEY_free(key);
}

/**
 * @brief RAII wrapper for OpenSSL contexts
 */
template <typename T, void (*Deleter)(T*)>
class OpenSSLWrapper {
 public:
  explicit OpenSSLWrapper(T* ptr) : ptr_(ptr) {}
  ~OpenSSLWrapper() {
    if (ptr_) Deleter(ptr_);
  }

  OpenSSLWrapper(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper& operator=(const OpenSSLWrapper&) = delete;

  T* get() const noexcept { return ptr_; }

 private:
  T* ptr_;
};

using EvpMdCtxWrapper = OpenSSLWrapper<EVP_MD_CTX, EVP_MD_CTX_free>;
using EvpPkeyCtxWrapper = OpenSSLWrapper<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;

namespace {

std::string lastOpenSslError() {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return "no OpenSSL error queued";
  }
  char buf[256];
  ERR_error_string_n(err, buf, sizeof(buf));
  return buf;
}

EvpKeyPtr generateEd25519Key() {
  auto pctx = EvpPkeyCtxWrapper(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!pctx.get()) {
    throw CryptoError("Failed to create Ed25519 key context");
  }
  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize Ed25519 key generation");
  }
  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &pkey) <= 0) {
    throw CryptoError("Failed to generate Ed25519 key pair: " +
                      lastOpenSslError());
  }
  return EvpKeyPtr(pkey);
}

}  // namespace

std::vector<uint8_t> hashSha256(std::span<const uint8_t> data) {
  std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
  SHA256(data.data(), data.size(), hash.data());
  return hash;
}

std::string sha256Hex(std::string_view data) {
  auto bytes = reinterpret_cast<const uint8_t*>(data.data());
  return hexEncode(hashSha256({bytes, data.size()}));
}

std::string randomHex(size_t bytes) {
  std::vector<uint8_t> buf(bytes);
  if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    throw CryptoError("RAND_bytes failed: " + lastOpenSslError());
  }
  return hexEncode(buf);
}

//
// HmacSha256Algorithm
//

HmacSha256Algorithm::HmacSha256Algorithm(SecureVector<uint8_t> key)
    : key_(std::move(key)) {
  if (!crypto_constants::is_valid_hmac_key_size(key_.size())) {
    throw CryptoError("Invalid HMAC key size");
  }
}

SecureVector<uint8_t> HmacSha256Algorithm::generateSecureKey() {
  SecureVector<uint8_t> key(crypto_constants::HMAC_KEY_SIZE);
  if (RAND_bytes(key.data(), crypto_constants::HMAC_KEY_SIZE) != 1) {
    TC_LOG_ERROR("Failed to generate random bytes for HMAC key");
    unsigned long err = ERR_get_error();
    if (err == 0) {
      throwOsError("RAND_bytes");
    }
    throw CryptoError("Failed to generate random key: OpenSSL error " +
                      std::to_string(err));
  }
  return key;
}

std::vector<uint8_t> HmacSha256Algorithm::signImpl(
    std::span<const uint8_t> data) const {
  SecureVector<uint8_t> secure_result(EVP_MAX_MD_SIZE);
  unsigned int len = 0;

  if (!HMAC(EVP_sha256(), key_.data(), static_cast<int>(key_.size()),
            data.data(), data.size(), secure_result.data(), &len)) {
    throw CryptoError("HMAC signing failed");
  }

  return std::vector<uint8_t>(secure_result.begin(),
                              secure_result.begin() + len);
}

bool HmacSha256Algorithm::verifyImpl(std::span<const uint8_t> data,
                                     std::span<const uint8_t> signature) const {
  try {
    auto computed = signImpl(data);
    return secure_utils::constantTimeEqual(computed, signature);
  } catch (const CryptoError&) {
    return false;
  }
}

//
// Ed25519Algorithm
//

struct Ed25519Algorithm::Impl {
  EvpKeyPtr key;
  bool hasPrivate = false;
};

Ed25519Algorithm::Ed25519Algorithm() : pImpl_(std::make_unique<Impl>()) {
  pImpl_->key = generateEd25519Key();
  pImpl_->hasPrivate = true;
  TC_LOG_DEBUG("Generated Ed25519 key pair");
}

Ed25519Algorithm::Ed25519Algorithm(const SecureVector<uint8_t>& privateSeed)
    : pImpl_(std::make_unique<Impl>()) {
  if (privateSeed.size() != crypto_constants::ED25519_PRIVATE_KEY_SIZE) {
    throw CryptoError("Ed25519 private key must be 32 bytes");
  }
  pImpl_->key.reset(EVP_PKEY_new_raw_private_key(
      EVP_PKEY_ED25519, nullptr, privateSeed.data(), privateSeed.size()));
  if (!pImpl_->key) {
    throw CryptoError("Failed to load Ed25519 private key: " +
                      lastOpenSslError());
  }
  pImpl_->hasPrivate = true;
}

Ed25519Algorithm::Ed25519Algorithm(std::unique_ptr<Impl> impl)
    : pImpl_(std::move(impl)) {}

Ed25519Algorithm Ed25519Algorithm::fromPublicKey(
    std::span<const uint8_t> publicKey) {
  if (publicKey.size() != crypto_constants::ED25519_PUBLIC_KEY_SIZE) {
    throw CryptoError("Ed25519 public key must be 32 bytes");
  }
  auto impl = std::make_unique<Impl>();
  impl->key.reset(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                              publicKey.data(),
                                              publicKey.size()));
  if (!impl->key) {
    throw CryptoError("Failed to load Ed25519 public key: " +
                      lastOpenSslError());
  }
  return Ed25519Algorithm(std::move(impl));
}

Ed25519Algorithm::~Ed25519Algorithm() = default;

Ed25519Algorithm::Ed25519Algorithm(Ed25519Algorithm&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

Ed25519Algorithm& Ed25519Algorithm::operator=(
    Ed25519Algorithm&& other) noexcept {
  if (this != &other) {
    pImpl_ = std::move(other.pImpl_);
  }
  return *this;
}

bool Ed25519Algorithm::canSign() const noexcept {
  return pImpl_ && pImpl_->hasPrivate;
}

std::vector<uint8_t> Ed25519Algorithm::publicKey() const {
  if (!pImpl_ || !pImpl_->key) {
    throw CryptoError("Ed25519 key not loaded");
  }
  size_t len = crypto_constants::ED25519_PUBLIC_KEY_SIZE;
  std::vector<uint8_t> out(len);
  if (EVP_PKEY_get_raw_public_key(pImpl_->key.get(), out.data(), &len) != 1) {
    throw CryptoError("Failed to export Ed25519 public key");
  }
  out.resize(len);
  return out;
}

std::vector<uint8_t> Ed25519Algorithm::signImpl(
    std::span<const uint8_t> data) const {
  if (!canSign()) {
    throw CryptoError("Ed25519 private key not available");
  }

  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx.get()) {
    throw CryptoError("Failed to create digest context");
  }
  // PureEdDSA: no digest is configured
  if (EVP_DigestSignInit(mdctx.get(), nullptr, nullptr, nullptr,
                         pImpl_->key.get()) <= 0) {
    throw CryptoError("Failed to initialize Ed25519 signing");
  }

  size_t sigLen = crypto_constants::ED25519_SIGNATURE_SIZE;
  std::vector<uint8_t> signature(sigLen);
  if (EVP_DigestSign(mdctx.get(), signature.data(), &sigLen, data.data(),
                     data.size()) <= 0) {
    TC_LOG_ERROR("Ed25519 signing failed: {}", lastOpenSslError());
    throw CryptoError("Ed25519 signing failed");
  }
  signature.resize(sigLen);
  return signature;
}

bool Ed25519Algorithm::verifyImpl(std::span<const uint8_t> data,
                                  std::span<const uint8_t> signature) const {
  if (!pImpl_ || !pImpl_->key ||
      signature.size() != crypto_constants::ED25519_SIGNATURE_SIZE) {
    return false;
  }

  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx.get()) {
    return false;
  }
  if (EVP_DigestVerifyInit(mdctx.get(), nullptr, nullptr, nullptr,
                           pImpl_->key.get()) <= 0) {
    return false;
  }
  int result = EVP_DigestVerify(mdctx.get(), signature.data(),
                                signature.size(), data.data(), data.size());
  if (result != 1) {
    ERR_clear_error();
  }
  return result == 1;
}

Ed25519Capability probeEd25519() {
  auto pctx = EvpPkeyCtxWrapper(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!pctx.get() || EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    std::string reason = lastOpenSslError();
    TC_LOG_WARN("Ed25519 unavailable in linked OpenSSL: {}", reason);
    return Ed25519Unavailable{reason};
  }
  return Ed25519Available{};
}

bool verifyEd25519(std::span<const uint8_t> publicKey,
                   std::span<const uint8_t> data,
                   std::span<const uint8_t> signature) noexcept {
  try {
    auto verifier = Ed25519Algorithm::fromPublicKey(publicKey);
    return verifier.verify(data, signature);
  } catch (const std::exception& e) {
    TC_LOG_DEBUG("Ed25519 verification rejected input: {}", e.what());
    return false;
  }
}

}  // namespace trustchain
