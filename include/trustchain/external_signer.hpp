/**
 * @file external_signer.hpp
 * @brief Delegated signing over HTTP (KMS / HSM / Vault transit bridge)
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "config.hpp"
#include "http_client.hpp"
#include "time_util.hpp"

namespace trustchain {

enum class SignerHealthState { Unknown, Healthy, Degraded, Down };

std::string_view signerHealthToString(SignerHealthState state) noexcept;

struct ExternalSignerHealth {
  SignerHealthState state = SignerHealthState::Unknown;
  std::optional<std::chrono::milliseconds> last_latency;
  std::optional<TimePoint> last_check;
  std::string last_error;
  std::optional<std::string> key_id;      ///< as reported by /health
  std::optional<std::string> public_key;  ///< as reported by /health
};

/**
 * @brief Client for the external signer contract
 *
 * - GET  <url>/health -> {key_id, public_key, ...}
 * - POST <url>/sign   {payload_base64} -> {signature} or {signature_base64}
 *
 * Thread-safe.
 */
class ExternalSignerBridge {
 public:
  using SteadyClock = std::chrono::steady_clock;
  using NowFunction = std::function<SteadyClock::time_point()>;

  ExternalSignerBridge(SignerConfig config, std::shared_ptr<HttpClient> http,
                       NowFunction now = &SteadyClock::now);

  /**
   * @brief Have the remote signer sign `payload`
   * @return Base64 Ed25519 signature (vault:vN: prefixes removed)
   * @throws ExternalSignerTimeout if the request timed out
   * @throws SigningFailure on any other transport or response error
   */
  std::string sign(std::span<const uint8_t> payload);

  /**
   * @brief Probe /health unless a probe ran within the minimum interval
   * @param force Probe regardless of the interval
   */
  ExternalSignerHealth healthCheck(bool force = false);

  /// Last known health without probing
  ExternalSignerHealth health() const;

  /**
   * @brief Key id from configuration, else from /health, else derived from
   * the public key
   */
  std::optional<std::string> keyId() const;

  /// Base64 public key from configuration, else from /health
  std::optional<std::string> publicKey() const;

  const SignerConfig& config() const noexcept { return config_; }

 private:
  SignerConfig config_;
  std::shared_ptr<HttpClient> http_;
  NowFunction now_;

  mutable std::mutex mutex_;
  ExternalSignerHealth health_;
  std::optional<SteadyClock::time_point> last_probe_;
};

/**
 * @brief Strip a Vault transit prefix ("vault:v1:<b64>") if present
 */
std::string stripVaultPrefix(std::string_view signature);

/**
 * @brief Key id for a base64 public key: first 24 hex chars of its SHA-256
 */
std::string deriveKeyId(std::string_view publicKeyBase64);

}  // namespace trustchain
