#include "trustchain/external_signer.hpp"

#include <nlohmann/json.hpp>

#include "trustchain/base64.hpp"
#include "trustchain/crypto.hpp"
#include "trustchain/error.hpp"
#include "trustchain/logging.hpp"

namespace trustchain {

using json = nlohmann::json;

namespace {

constexpr size_t KEY_ID_HEX_CHARS = 24;

std::optional<std::string> nonEmptyString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string responseError(const HttpResponse& response) {
  auto body = json::parse(response.body, nullptr, false);
  if (body.is_object()) {
    if (auto error = nonEmptyString(body, "error")) {
      return "HTTP " + std::to_string(response.status) + ": " + *error;
    }
  }
  return "HTTP " + std::to_string(response.status);
}

}  // namespace

std::string_view signerHealthToString(SignerHealthState state) noexcept {
  switch (state) {
    case SignerHealthState::Unknown:
      return "unknown";
    case SignerHealthState::Healthy:
      return "healthy";
    case SignerHealthState::Degraded:
      return "degraded";
    case SignerHealthState::Down:
      return "down";
  }
  return "unknown";
}

std::string stripVaultPrefix(std::string_view signature) {
  auto first = signature.find(':');
  if (first == std::string_view::npos) {
    return std::string(signature);
  }
  auto second = signature.find(':', first + 1);
  if (second == std::string_view::npos) {
    return std::string(signature);
  }
  return std::string(signature.substr(signature.rfind(':') + 1));
}

std::string deriveKeyId(std::string_view publicKeyBase64) {
  return sha256Hex(publicKeyBase64).substr(0, KEY_ID_HEX_CHARS);
}

ExternalSignerBridge::ExternalSignerBridge(SignerConfig config,
                                           std::shared_ptr<HttpClient> http,
                                           NowFunction now)
    : config_(std::move(config)), http_(std::move(http)), now_(std::move(now)) {
  if (config_.url.empty()) {
    throw ConfigurationError("external signer url is empty");
  }
  if (!http_) {
    throw ConfigurationError("external signer needs an HTTP client");
  }
}

std::string ExternalSignerBridge::sign(std::span<const uint8_t> payload) {
  json request = {{"payload_base64", base64Encode(payload)}};
  HttpError error;
  auto started = now_();
  auto response = http_->postJson(joinUrl(config_.url, "sign"), request.dump(),
                                  config_.timeout, error);
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(now_() - started);

  if (!response) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      health_.state = SignerHealthState::Down;
      health_.last_error = error.message;
    }
    TC_LOG_ERROR("External signer request failed: {}", error.message);
    if (error.timed_out) {
      throw ExternalSignerTimeout(error.message);
    }
    throw SigningFailure("external signer unreachable: " + error.message);
  }
  if (!response->ok()) {
    throw SigningFailure(responseError(*response));
  }

  auto body = json::parse(response->body, nullptr, false);
  if (!body.is_object()) {
    throw SigningFailure("external signer returned malformed JSON");
  }
  if (auto ok = body.find("ok"); ok != body.end() && ok->is_boolean() &&
                                 !ok->get<bool>()) {
    throw SigningFailure(responseError(*response));
  }

  auto signature = nonEmptyString(body, "signature");
  if (!signature) {
    signature = nonEmptyString(body, "signature_base64");
  }
  if (!signature) {
    throw SigningFailure("external signer response has no signature");
  }

  std::string stripped = stripVaultPrefix(*signature);
  std::vector<uint8_t> raw;
  try {
    raw = base64Decode(stripped);
  } catch (const InvalidBase64Error& e) {
    throw SigningFailure(std::string("external signature is not base64: ") +
                         e.what());
  }
  if (raw.size() != crypto_constants::ED25519_SIGNATURE_SIZE) {
    throw SigningFailure("external signature has " +
                         std::to_string(raw.size()) + " bytes, expected " +
                         std::to_string(crypto_constants::ED25519_SIGNATURE_SIZE));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    health_.last_latency = latency;
  }
  TC_LOG_DEBUG("External signer signed {} bytes in {} ms", payload.size(),
               latency.count());
  return stripped;
}

ExternalSignerHealth ExternalSignerBridge::healthCheck(bool force) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!force && last_probe_ &&
        now_() - *last_probe_ < config_.min_health_interval) {
      return health_;
    }
  }

  HttpError error;
  auto started = now_();
  auto response =
      http_->get(joinUrl(config_.url, "health"), config_.timeout, error);
  auto finished = now_();
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(finished - started);

  ExternalSignerHealth probed;
  probed.last_check = Clock::now();
  probed.last_latency = latency;

  if (!response) {
    probed.state = SignerHealthState::Down;
    probed.last_error = error.message;
  } else if (!response->ok()) {
    probed.state = SignerHealthState::Down;
    probed.last_error = responseError(*response);
  } else {
    auto body = json::parse(response->body, nullptr, false);
    if (body.is_object()) {
      probed.key_id = nonEmptyString(body, "key_id");
      probed.public_key = nonEmptyString(body, "public_key");
    }
    // a key id can always be derived, the public key cannot
    bool hasKeyMaterial =
        config_.public_key.has_value() || probed.public_key.has_value();
    if (!hasKeyMaterial) {
      probed.state = SignerHealthState::Degraded;
      probed.last_error = "signer reported no key material";
    } else if (latency > config_.degraded_latency) {
      probed.state = SignerHealthState::Degraded;
      probed.last_error = "latency " + std::to_string(latency.count()) +
                          " ms exceeds " +
                          std::to_string(config_.degraded_latency.count()) +
                          " ms";
    } else {
      probed.state = SignerHealthState::Healthy;
    }
  }

  TC_LOG_INFO("External signer health: {} ({} ms)",
              signerHealthToString(probed.state), latency.count());

  std::lock_guard<std::mutex> lock(mutex_);
  last_probe_ = finished;
  health_ = probed;
  return health_;
}

ExternalSignerHealth ExternalSignerBridge::health() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return health_;
}

std::optional<std::string> ExternalSignerBridge::keyId() const {
  if (config_.key_id) {
    return config_.key_id;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (health_.key_id) {
    return health_.key_id;
  }
  const auto& publicKey = config_.public_key ? config_.public_key
                                             : health_.public_key;
  if (publicKey) {
    return deriveKeyId(*publicKey);
  }
  return std::nullopt;
}

std::optional<std::string> ExternalSignerBridge::publicKey() const {
  if (config_.public_key) {
    return config_.public_key;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return health_.public_key;
}

}  // namespace trustchain
