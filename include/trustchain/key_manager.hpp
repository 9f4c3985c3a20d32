/**
 * @file key_manager.hpp
 * @brief Active signing key: local Ed25519 / HMAC or an external signer
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>

#include "crypto.hpp"
#include "envelope.hpp"
#include "external_signer.hpp"

namespace trustchain {

struct KeyInfo {
  std::string key_id;
  SignatureAlgorithm algorithm = SignatureAlgorithm::Ed25519;
  bool external = false;
  bool revoked = false;
  std::string created_at;
  size_t rotation_count = 0;
  std::string public_key;  ///< base64; empty for hmac-sha256
};

void to_json(nlohmann::json& j, const KeyInfo& info);

/**
 * @brief Owns the active key and the revocation set
 *
 * Not thread-safe; Session serializes access.
 */
class KeyManager {
 public:
  /**
   * @param strictMode Refuse the HMAC fallback when Ed25519 is unavailable
   * @param external Optional delegated signer; used when it yields key
   * material
   */
  explicit KeyManager(bool strictMode,
                      std::shared_ptr<ExternalSignerBridge> external = nullptr);

  /**
   * @brief Resolve the signing key; no-op once initialized
   * @throws SigningFailure if strict mode is on and Ed25519 is unavailable
   */
  void initialize();

  bool isInitialized() const noexcept { return initialized_; }

  /**
   * @brief Drop the current key and bind a new one; revocations persist
   */
  void rotateKey();

  /**
   * @brief Replace a delegated key with a freshly generated local one
   * @throws SigningFailure if strict mode is on and Ed25519 is unavailable
   */
  void useLocalKey();

  /// True when the external signer config asks for local fallback on timeout
  bool localFallbackEnabled() const noexcept {
    return external_ && external_->config().fallback_to_local;
  }

  void revoke(std::string_view keyId);
  bool isRevoked(std::string_view keyId) const;

  /**
   * @brief Sign bytes with the active key
   * @return "<algorithm>:<base64 signature>"
   * @throws RevokedKeyError if the active key id is revoked
   * @throws ExternalSignerTimeout, SigningFailure from the external signer
   */
  std::string sign(std::span<const uint8_t> payload);

  /**
   * @brief Check a "<algorithm>:<base64>" signature against the active key;
   * the only way to verify hmac-sha256 since the key is never exported
   */
  bool verifyLocal(std::span<const uint8_t> payload,
                   std::string_view signature) const noexcept;

  KeyInfo keyInfo() const;

  const std::string& keyId() const noexcept { return key_id_; }
  SignatureAlgorithm algorithm() const noexcept { return algorithm_; }
  const std::string& publicKeyBase64() const noexcept { return public_key_; }
  bool isExternal() const noexcept { return external_mode_; }
  bool strictMode() const noexcept { return strict_mode_; }

 private:
  bool bindExternal();
  void generateLocal();

  bool strict_mode_;
  std::shared_ptr<ExternalSignerBridge> external_;
  std::optional<Ed25519Capability> capability_;

  bool initialized_ = false;
  bool external_mode_ = false;
  std::unique_ptr<CryptographicAlgorithm> local_;
  SignatureAlgorithm algorithm_ = SignatureAlgorithm::Ed25519;
  std::string key_id_;
  std::string public_key_;
  std::string created_at_;
  size_t rotation_count_ = 0;
  std::set<std::string, std::less<>> revoked_;
};

}  // namespace trustchain
