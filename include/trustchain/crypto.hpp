/**
 * @file crypto.hpp
 * @brief Signing algorithms and digests used for tool-call envelopes
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "error.hpp"
#include "secure_vector.hpp"

// Forward declarations for OpenSSL types
typedef struct evp_pkey_st EVP_PKEY;

namespace trustchain {

/// Wire names of the supported signature algorithms
constexpr std::string_view ALG_ED25519 = "ed25519";
constexpr std::string_view ALG_HMAC_SHA256 = "hmac-sha256";

namespace crypto_constants {
constexpr size_t HMAC_KEY_SIZE = 32;          ///< HMAC-SHA256 key size
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;  ///< Raw seed size
constexpr size_t ED25519_SIGNATURE_SIZE = 64;
constexpr size_t SHA256_DIGEST_SIZE = 32;

constexpr bool is_valid_hmac_key_size(size_t size) noexcept {
  return size >= 16 && size <= 64;
}
}  // namespace crypto_constants

static_assert(
    crypto_constants::is_valid_hmac_key_size(crypto_constants::HMAC_KEY_SIZE),
    "HMAC key size is invalid");

struct EvpKeyDeleter {
  void operator()(EVP_PKEY* key) const noexcept;
};
using EvpKeyPtr = std::unique_ptr<EVP_PKEY, EvpKeyDeleter>;

/**
 * @brief Concept for byte buffers accepted by the algorithms
 */
template <typename T>
concept CryptoData = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Abstract base class for signature algorithms
 */
class CryptographicAlgorithm {
 public:
  virtual ~CryptographicAlgorithm() = default;

  /**
   * @brief Sign data with the algorithm
   * @param data Data to sign
   * @return Signature bytes
   */
  template <CryptoData T>
  std::vector<uint8_t> sign(const T& data) const {
    return signImpl({std::data(data), std::size(data)});
  }

  /**
   * @brief Verify a signature
   * @return True if signature is valid; never throws on malformed input
   */
  template <CryptoData T1, CryptoData T2>
  bool verify(const T1& data, const T2& signature) const {
    return verifyImpl({std::data(data), std::size(data)},
                      {std::data(signature), std::size(signature)});
  }

  /**
   * @brief Algorithm name as written in envelopes ("ed25519", ...)
   */
  virtual std::string_view name() const = 0;

  /**
   * @brief Material a verifier needs: public key for asymmetric algorithms,
   * empty for symmetric ones
   */
  virtual std::vector<uint8_t> publicKey() const = 0;

 protected:
  virtual std::vector<uint8_t> signImpl(
      std::span<const uint8_t> data) const = 0;
  virtual bool verifyImpl(std::span<const uint8_t> data,
                          std::span<const uint8_t> signature) const = 0;
};

/**
 * @brief HMAC-SHA256; only permitted in relaxed (non-strict) deployments
 */
class HmacSha256Algorithm : public CryptographicAlgorithm {
 private:
  SecureVector<uint8_t> key_;

 public:
  explicit HmacSha256Algorithm(SecureVector<uint8_t> key);

  static SecureVector<uint8_t> generateSecureKey();

  std::string_view name() const override { return ALG_HMAC_SHA256; }
  std::vector<uint8_t> publicKey() const override { return {}; }

  std::vector<uint8_t> signImpl(std::span<const uint8_t> data) const override;
  bool verifyImpl(std::span<const uint8_t> data,
                  std::span<const uint8_t> signature) const override;
};

/**
 * @brief Ed25519 (PureEdDSA) backed by OpenSSL EVP
 */
class Ed25519Algorithm : public CryptographicAlgorithm {
 public:
  struct Impl;

 private:
  std::unique_ptr<Impl> pImpl_;

 public:
  /// Generate a fresh keypair
  Ed25519Algorithm();

  /// Load from a 32-byte raw private seed
  explicit Ed25519Algorithm(const SecureVector<uint8_t>& privateSeed);

  /// Verification only, from a 32-byte raw public key
  static Ed25519Algorithm fromPublicKey(std::span<const uint8_t> publicKey);

  ~Ed25519Algorithm() override;

  Ed25519Algorithm(Ed25519Algorithm&& other) noexcept;
  Ed25519Algorithm& operator=(Ed25519Algorithm&& other) noexcept;

  Ed25519Algorithm(const Ed25519Algorithm&) = delete;
  Ed25519Algorithm& operator=(const Ed25519Algorithm&) = delete;

  /**
   * @brief Raw 32-byte public key
   */
  std::vector<uint8_t> publicKey() const override;

  bool canSign() const noexcept;

  std::string_view name() const override { return ALG_ED25519; }

  std::vector<uint8_t> signImpl(std::span<const uint8_t> data) const override;
  bool verifyImpl(std::span<const uint8_t> data,
                  std::span<const uint8_t> signature) const override;

 private:
  Ed25519Algorithm(std::unique_ptr<Impl> impl);
};

/**
 * @brief Outcome of the one-time Ed25519 capability probe
 */
struct Ed25519Available {};
struct Ed25519Unavailable {
  std::string reason;
};
using Ed25519Capability = std::variant<Ed25519Available, Ed25519Unavailable>;

/**
 * @brief Check once whether the linked OpenSSL provides Ed25519
 */
Ed25519Capability probeEd25519();

/**
 * @brief Verify a raw Ed25519 signature without constructing an algorithm
 * object; false on malformed key or signature
 */
bool verifyEd25519(std::span<const uint8_t> publicKey,
                   std::span<const uint8_t> data,
                   std::span<const uint8_t> signature) noexcept;

/**
 * @brief Compute SHA-256 hash
 */
std::vector<uint8_t> hashSha256(std::span<const uint8_t> data);

/**
 * @brief SHA-256 of a UTF-8 string as lowercase hex
 */
std::string sha256Hex(std::string_view data);

/**
 * @brief Lowercase hex of `bytes` bytes from the OpenSSL CSPRNG
 */
std::string randomHex(size_t bytes);

}  // namespace trustchain
