/**
 * @file signing_engine.hpp
 * @brief Builds signed envelopes for tool calls and final responses
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "audit_trail.hpp"
#include "envelope.hpp"
#include "key_manager.hpp"

namespace trustchain {

/**
 * @brief Fields covered by the signature, as a JSON object
 *
 * {arguments, execution_context, key_id, name, sequence,
 *  signature_schema_version, tenant_id, timestamp}; absent optionals are null.
 */
nlohmann::json buildSigningPayload(
    std::string_view toolName, const nlohmann::json& args, uint64_t sequence,
    std::string_view timestamp, std::string_view keyId, int schemaVersion,
    const std::optional<std::string>& tenantId,
    const std::optional<ExecutionContext>& executionContext);

/**
 * @brief SHA-256 hex of the sorted signatures joined by '\n'
 */
std::string toolSignaturesHash(std::vector<std::string> signatures);

/**
 * @brief Final-response pseudo tool arguments
 */
nlohmann::json finalResponseArguments(const std::string& responseHash,
                                      const std::string& signaturesHash,
                                      size_t signatureCount,
                                      const nlohmann::json& context);

/**
 * @brief Per-session signing state
 *
 * Holds the sequence counter and last signature; writes to the referenced
 * AuditTrail. Not thread-safe; Session serializes access.
 */
class SigningEngine {
 public:
  SigningEngine(KeyManager& keys, AuditTrail& audit, std::string agentId,
                Tier tier);

  /**
   * @brief Sign a tool call
   *
   * The sequence number is reserved up front and committed only when the
   * signature and audit entry exist; a failed call leaves no trace.
   *
   * @throws RevokedKeyError if the active key is revoked
   * @throws SigningFailure in strict mode without Ed25519, or on signer error
   * @throws ExternalSignerTimeout if the delegated signer timed out and
   * local fallback is not configured
   * @throws CanonicalizationError if the arguments cannot be canonicalized
   */
  Envelope sign(std::string_view toolName, const nlohmann::json& args);

  /**
   * @brief Bind a response text to the tool signatures that produced it
   */
  FinalResponseProof signFinalResponse(
      std::string_view responseText,
      const std::vector<std::string>& toolSignatures,
      const nlohmann::json& extraContext = nlohmann::json::object());

  /**
   * @brief Start a new session id; resets sequence, chain and audit trail
   */
  void reset(std::string sessionId, std::string startedAt);

  void setCurrentQuery(std::string query) { user_query_ = std::move(query); }
  void setTier(Tier tier);
  void setDecisionContext(std::optional<nlohmann::json> context) {
    decision_context_ = std::move(context);
  }
  void setExecutionContext(std::optional<ExecutionContext> context);
  void setTenantId(std::optional<std::string> tenantId) {
    tenant_id_ = std::move(tenantId);
  }

  uint64_t sequence() const noexcept { return sequence_; }
  size_t totalCalls() const noexcept { return total_calls_; }
  const std::string& sessionId() const noexcept { return session_id_; }
  const std::string& agentId() const noexcept { return agent_id_; }
  const std::string& startedAt() const noexcept { return started_at_; }
  Tier tier() const noexcept { return tier_; }
  const Certificate& certificate() const noexcept { return certificate_; }
  const std::optional<std::string>& lastSignature() const noexcept {
    return last_signature_;
  }

 private:
  std::optional<std::string> effectiveTenant() const;

  KeyManager& keys_;
  AuditTrail& audit_;
  std::string agent_id_;
  Tier tier_;
  Certificate certificate_;

  std::string session_id_;
  std::string started_at_;
  uint64_t sequence_ = 0;
  size_t total_calls_ = 0;
  std::optional<std::string> last_signature_;

  std::string user_query_;
  std::optional<nlohmann::json> decision_context_;
  std::optional<ExecutionContext> execution_context_;
  std::optional<std::string> tenant_id_;
};

}  // namespace trustchain
