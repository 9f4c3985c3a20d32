/**
 * @file config.hpp
 * @brief Runtime configuration for sessions, signer and trust gate
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "envelope.hpp"
#include "error.hpp"

namespace trustchain {

namespace config_defaults {
constexpr std::chrono::milliseconds SIGNER_TIMEOUT{5000};
constexpr std::chrono::milliseconds SIGNER_DEGRADED_LATENCY{1500};
constexpr std::chrono::seconds SIGNER_HEALTH_INTERVAL{30};
constexpr std::chrono::milliseconds REGISTRY_TIMEOUT{5000};
constexpr std::chrono::hours LOCAL_BOOTSTRAP_WINDOW{24};
constexpr size_t AUDIT_VISIBLE_LIMIT = 10;
/// Lowest signer timeout accepted for production deployments
constexpr std::chrono::milliseconds PRODUCTION_MIN_SIGNER_TIMEOUT{1000};
}  // namespace config_defaults

/**
 * @brief Delegated (KMS / HSM) signer endpoint
 */
struct SignerConfig {
  std::string url;
  std::chrono::milliseconds timeout = config_defaults::SIGNER_TIMEOUT;
  std::optional<std::string> key_id;
  std::optional<std::string> public_key;  ///< base64 raw Ed25519 key
  std::chrono::milliseconds min_health_interval =
      config_defaults::SIGNER_HEALTH_INTERVAL;
  std::chrono::milliseconds degraded_latency =
      config_defaults::SIGNER_DEGRADED_LATENCY;
  /// On a signer timeout, switch to a local key instead of failing the call
  bool fallback_to_local = false;

  /**
   * @brief Read TRUSTCHAIN_EXTERNAL_SIGNER_{URL,TIMEOUT_MS,KEY_ID,PUBLIC_KEY,
   * FALLBACK_LOCAL}
   * @return std::nullopt when no URL is set
   */
  static std::optional<SignerConfig> fromEnvironment();
};

struct ValidationReport {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

/**
 * @brief Everything a Session and the trust gate need, passed at construction
 */
struct TrustChainConfig {
  std::string agent_id = "trustchain-agent";
  Tier tier = Tier::Community;

  /// Require Ed25519; refuse HMAC fallback
  bool strict_mode = true;
  /// Permit calls to unregistered loopback servers
  bool allow_unsigned_local = false;
  /// Permit unsigned retry of read-only calls rejected for signature reasons
  bool unsigned_read_fallback = false;

  std::optional<SignerConfig> external_signer;

  size_t audit_visible_limit = config_defaults::AUDIT_VISIBLE_LIMIT;

  std::optional<std::string> registry_url;
  std::chrono::milliseconds registry_timeout =
      config_defaults::REGISTRY_TIMEOUT;
  std::string registry_path;  ///< empty: registry is not persisted
  bool local_bootstrap = false;
  std::chrono::hours local_bootstrap_window =
      config_defaults::LOCAL_BOOTSTRAP_WINDOW;

  std::string log_level = "info";

  /**
   * @brief Load from a JSON document; unknown keys are ignored
   * @throws ConfigurationError on mistyped or out-of-range values
   */
  static TrustChainConfig fromJson(const nlohmann::json& j);

  /**
   * @brief Build from TRUSTCHAIN_* environment variables over the defaults
   */
  static TrustChainConfig fromEnvironment();

  /**
   * @brief Check the settings a production deployment must have
   */
  [[nodiscard]] ValidationReport validateForProduction() const;

  nlohmann::json toJson() const;
};

}  // namespace trustchain
