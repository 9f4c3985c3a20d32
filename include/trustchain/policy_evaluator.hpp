/**
 * @file policy_evaluator.hpp
 * @brief Allow / deny decisions for calls to remote tool servers
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "time_util.hpp"
#include "trust_registry.hpp"

namespace trustchain {

namespace deny_codes {
constexpr std::string_view SERVER_REVOKED = "SERVER_REVOKED";
constexpr std::string_view SERVER_EXPIRED = "SERVER_EXPIRED";
constexpr std::string_view SERVER_NOT_YET_VALID = "SERVER_NOT_YET_VALID";
constexpr std::string_view SERVER_INACTIVE = "SERVER_INACTIVE";
constexpr std::string_view INSUFFICIENT_TRUST_TIER = "INSUFFICIENT_TRUST_TIER";
constexpr std::string_view SERVER_UNTRUSTED = "SERVER_UNTRUSTED";
constexpr std::string_view POLICY_DENIED = "POLICY_DENIED";
}  // namespace deny_codes

namespace allow_codes {
constexpr std::string_view TRUSTED = "TRUSTED";
constexpr std::string_view ALLOW_UNSIGNED_LOCAL = "ALLOW_UNSIGNED_LOCAL";
}  // namespace allow_codes

/**
 * @brief A remote tool server as the caller knows it
 */
struct ServerConfig {
  std::string id;
  std::string url;
};

struct TrustDecision {
  bool allowed = false;
  std::string code;
  std::string reason;
  std::optional<TrustRecord> record;
};

/**
 * @brief Denial found in a tool server response
 */
struct PolicyDenial {
  std::string code;
  std::string message;
  std::optional<std::string> policy;
};

struct PolicyOptions {
  bool allow_unsigned_local = false;
  bool unsigned_read_fallback = false;
  bool local_bootstrap = false;
  std::chrono::hours local_bootstrap_window =
      config_defaults::LOCAL_BOOTSTRAP_WINDOW;

  static PolicyOptions fromConfig(const TrustChainConfig& config);
};

/**
 * @brief Heuristic for state-changing tools
 *
 * Name starts with create_, update_, delete_, upsert_, write_, apply_, set_,
 * run_ or execute_, or contains approve, block or revoke (case-insensitive).
 */
bool isMutatingTool(std::string_view toolName);

/**
 * @brief Deny code or message says the signature was invalid or missing
 */
bool isSignatureDenial(std::string_view denyCode, std::string_view denyMessage);

/**
 * @brief Look for a policy denial in a tool result
 *
 * Walks arrays, objects, JSON-encoded strings and the text / content /
 * result / data wrappers down to `maxDepth`. An object denies if its action
 * is "deny", it names a policy, or it reports success == false.
 */
std::optional<PolicyDenial> extractPolicyDenial(const nlohmann::json& result,
                                                size_t maxDepth = 8);

/**
 * @brief Flag a result obtained through the unsigned read fallback
 */
nlohmann::json markUnsignedFallback(nlohmann::json result,
                                    std::string_view reason);

class PolicyEvaluator {
 public:
  PolicyEvaluator(TrustRegistry& registry, PolicyOptions options);

  /**
   * @brief Decide whether `server` may be called (for `toolName`, if given)
   *
   * Known servers are checked for revocation, validity window, status and,
   * for mutating tools, a trusted tier. Unknown loopback servers may be
   * bootstrapped or let through under allow_unsigned_local.
   */
  TrustDecision evaluateTrust(const ServerConfig& server,
                              std::optional<std::string_view> toolName,
                              TimePoint now = Clock::now());

  /**
   * @brief Only read-only tools on loopback servers, with the flag set, after
   * a signature-class denial
   */
  bool shouldAllowUnsignedReadFallback(const ServerConfig& server,
                                       std::string_view toolName,
                                       std::string_view denyCode,
                                       std::string_view denyMessage) const;

  /**
   * @brief evaluateTrust, throwing on denial
   * @throws UntrustedServerError
   */
  TrustDecision enforce(const ServerConfig& server, std::string_view toolName,
                        TimePoint now = Clock::now());

  const PolicyOptions& options() const noexcept { return options_; }

 private:
  TrustRegistry& registry_;
  PolicyOptions options_;
};

}  // namespace trustchain
