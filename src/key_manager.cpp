#include "trustchain/key_manager.hpp"

#include "trustchain/base64.hpp"
#include "trustchain/logging.hpp"
#include "trustchain/time_util.hpp"

namespace trustchain {

void to_json(nlohmann::json& j, const KeyInfo& info) {
  j = nlohmann::json{{"key_id", info.key_id},
                     {"algorithm", algorithmToString(info.algorithm)},
                     {"external", info.external},
                     {"revoked", info.revoked},
                     {"created_at", info.created_at},
                     {"rotation_count", info.rotation_count},
                     {"public_key", info.public_key}};
}

KeyManager::KeyManager(bool strictMode,
                       std::shared_ptr<ExternalSignerBridge> external)
    : strict_mode_(strictMode), external_(std::move(external)) {}

void KeyManager::initialize() {
  if (initialized_) {
    return;
  }

  if (!bindExternal()) {
    generateLocal();
  }
  created_at_ = formatRfc3339(Clock::now());
  initialized_ = true;
  TC_LOG_INFO("Signing key {} ready ({}, {})", key_id_,
              algorithmToString(algorithm_),
              external_mode_ ? "external" : "local");
}

bool KeyManager::bindExternal() {
  if (!external_) {
    return false;
  }

  auto publicKey = external_->publicKey();
  if (!publicKey) {
    external_->healthCheck();
    publicKey = external_->publicKey();
  }
  auto keyId = external_->keyId();
  if (!publicKey || !keyId) {
    TC_LOG_WARN("External signer provided no key material; signing locally");
    return false;
  }

  std::vector<uint8_t> raw;
  try {
    raw = base64Decode(*publicKey);
  } catch (const InvalidBase64Error& e) {
    TC_LOG_WARN("External signer public key rejected: {}", e.what());
    return false;
  }
  if (raw.size() != crypto_constants::ED25519_PUBLIC_KEY_SIZE) {
    TC_LOG_WARN("External signer public key has {} bytes; signing locally",
                raw.size());
    return false;
  }

  local_.reset();
  external_mode_ = true;
  algorithm_ = SignatureAlgorithm::Ed25519;
  public_key_ = *publicKey;
  key_id_ = *keyId;
  return true;
}

void KeyManager::generateLocal() {
  if (!capability_) {
    capability_ = probeEd25519();
  }

  if (std::holds_alternative<Ed25519Available>(*capability_)) {
    auto key = std::make_unique<Ed25519Algorithm>();
    public_key_ = base64Encode(key->publicKey());
    key_id_ = deriveKeyId(public_key_);
    algorithm_ = SignatureAlgorithm::Ed25519;
    local_ = std::move(key);
    external_mode_ = false;
    return;
  }

  const auto& reason = std::get<Ed25519Unavailable>(*capability_).reason;
  if (strict_mode_) {
    throw SigningFailure("Ed25519 unavailable and strict mode forbids "
                         "HMAC fallback: " +
                         reason);
  }

  TC_LOG_WARN("Ed25519 unavailable ({}); falling back to HMAC-SHA256", reason);
  auto secret = HmacSha256Algorithm::generateSecureKey();
  // Identity of a symmetric key is derived from its digest, never the key
  auto digest = hashSha256(std::span<const uint8_t>(secret.data(), secret.size()));
  key_id_ = deriveKeyId(base64Encode(digest));
  public_key_.clear();
  algorithm_ = SignatureAlgorithm::HmacSha256;
  local_ = std::make_unique<HmacSha256Algorithm>(std::move(secret));
  external_mode_ = false;
}

void KeyManager::useLocalKey() {
  std::string previous = key_id_;
  generateLocal();
  created_at_ = formatRfc3339(Clock::now());
  initialized_ = true;
  TC_LOG_WARN("Signing key {} replaced by local key {}", previous, key_id_);
}

void KeyManager::rotateKey() {
  std::string previous = key_id_;
  local_.reset();
  initialized_ = false;
  initialize();
  ++rotation_count_;
  TC_LOG_INFO("Rotated signing key {} -> {}", previous, key_id_);
}

void KeyManager::revoke(std::string_view keyId) {
  revoked_.emplace(keyId);
  TC_LOG_WARN("Signing key {} revoked", keyId);
}

bool KeyManager::isRevoked(std::string_view keyId) const {
  return revoked_.find(keyId) != revoked_.end();
}

std::string KeyManager::sign(std::span<const uint8_t> payload) {
  initialize();
  if (isRevoked(key_id_)) {
    throw RevokedKeyError(key_id_);
  }

  std::string prefix(algorithmToString(algorithm_));
  if (external_mode_) {
    return prefix + ":" + external_->sign(payload);
  }
  if (!local_) {
    throw SigningFailure("no signing key available");
  }
  return prefix + ":" + base64Encode(local_->sign(payload));
}

bool KeyManager::verifyLocal(std::span<const uint8_t> payload,
                             std::string_view signature) const noexcept {
  auto parts = splitSignature(signature);
  if (!parts || parts->first != algorithm_) {
    return false;
  }
  try {
    auto raw = base64Decode(parts->second);
    if (algorithm_ == SignatureAlgorithm::HmacSha256) {
      return local_ && local_->verify(payload, raw);
    }
    auto publicKey = base64Decode(public_key_);
    return verifyEd25519(publicKey, payload, raw);
  } catch (const std::exception& e) {
    TC_LOG_DEBUG("Local verification rejected input: {}", e.what());
    return false;
  }
}

KeyInfo KeyManager::keyInfo() const {
  KeyInfo info;
  info.key_id = key_id_;
  info.algorithm = algorithm_;
  info.external = external_mode_;
  info.revoked = isRevoked(key_id_);
  info.created_at = created_at_;
  info.rotation_count = rotation_count_;
  info.public_key = public_key_;
  return info;
}

}  // namespace trustchain
