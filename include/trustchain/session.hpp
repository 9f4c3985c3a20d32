/**
 * @file session.hpp
 * @brief Caller-owned signing session: keys, audit trail and engines
 */

#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "audit_trail.hpp"
#include "config.hpp"
#include "envelope.hpp"
#include "external_signer.hpp"
#include "http_client.hpp"
#include "key_manager.hpp"
#include "signing_engine.hpp"
#include "verification_engine.hpp"

namespace trustchain {

/**
 * @brief One agent's signing context
 *
 * Lifecycle: create -> startSession -> sign / verify ... -> endSession.
 * All members are serialized by one mutex, so sequence numbers follow the
 * order in which callers acquire it.
 *
 * @code
 * auto session = Session::create(config);
 * session->setCurrentQuery("list my tasks");
 * auto envelope = session->sign("list_tasks", {{"limit", 10}});
 * @endcode
 */
class Session {
 public:
  /**
   * @param http Transport for the external signer; libcurl when null
   */
  static std::unique_ptr<Session> create(
      TrustChainConfig config, std::shared_ptr<HttpClient> http = nullptr);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /**
   * @brief Begin a new session id; sequence restarts at 1 and the audit
   * trail is cleared
   * @return The new session id ("sess_<hex>")
   */
  std::string startSession();

  /**
   * @brief Close the session and return its final state; the next sign()
   * opens a new session
   */
  SessionInfo endSession();

  /// @copydoc SigningEngine::sign
  Envelope sign(std::string_view toolName, const nlohmann::json& args);

  FinalResponseProof signFinalResponse(
      std::string_view responseText,
      const std::vector<std::string>& toolSignatures,
      const nlohmann::json& extraContext = nlohmann::json::object());

  bool verify(const Envelope& envelope, std::string_view toolName,
              const nlohmann::json& args) const;

  bool verifyFinalResponse(const FinalResponseProof& proof,
                           std::string_view responseText,
                           const std::vector<std::string>& toolSignatures) const;

  void setCurrentQuery(std::string query);
  void setTier(Tier tier);
  void setDecisionContext(std::optional<nlohmann::json> context);
  void setExecutionContext(std::optional<ExecutionContext> context);
  void setTenantId(std::optional<std::string> tenantId);

  SessionInfo sessionInfo() const;

  /// Audit entries visible at the current tier
  std::vector<AuditEntry> auditTrail() const;
  nlohmann::json exportAuditTrail() const;
  bool chainIntegrity() const;

  /// @return std::nullopt below the enterprise tier
  std::optional<nlohmann::json> exportComplianceReport() const;

  void rotateKey();
  void revokeKey(std::string_view keyId);
  /// Resolves the key first if no call has been signed yet
  KeyInfo keyInfo();

  /// @return std::nullopt when no external signer is configured
  std::optional<ExternalSignerHealth> signerHealth(bool force = false);

  const TrustChainConfig& config() const noexcept { return config_; }

 private:
  Session(TrustChainConfig config, std::shared_ptr<HttpClient> http);

  void startSessionLocked();
  SessionInfo infoLocked() const;

  mutable std::mutex mutex_;
  TrustChainConfig config_;
  std::shared_ptr<ExternalSignerBridge> signer_;
  KeyManager keys_;
  AuditTrail audit_;
  SigningEngine signing_;
  VerificationEngine verification_;
  bool active_ = false;
};

}  // namespace trustchain
