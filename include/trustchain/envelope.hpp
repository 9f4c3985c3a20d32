/**
 * @file envelope.hpp
 * @brief Signed envelope, certificate and audit records
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "time_util.hpp"

namespace trustchain {

/// Version of the canonical payload layout covered by the signature
constexpr int SIGNATURE_SCHEMA_VERSION = 1;

/// Pseudo tool name under which final answers are signed
constexpr std::string_view FINAL_RESPONSE_TOOL = "__final_response__";

/// Field carrying the envelope on outgoing tool-call requests
constexpr std::string_view ENVELOPE_FIELD = "trustchain";

/**
 * @brief Feature tier gating audit visibility, chaining and compliance export
 */
enum class Tier { Community, Pro, Enterprise };

std::string_view tierToString(Tier tier) noexcept;
std::optional<Tier> tierFromString(std::string_view name) noexcept;

enum class SignatureAlgorithm { Ed25519, HmacSha256 };

std::string_view algorithmToString(SignatureAlgorithm alg) noexcept;
std::optional<SignatureAlgorithm> algorithmFromString(
    std::string_view name) noexcept;

/**
 * @brief Issuer metadata embedded in every envelope
 */
struct Certificate {
  std::string owner = "TrustChain Agent";
  std::string organization = "TrustChain";
  std::string role = "ai-assistant";
  Tier tier = Tier::Community;
  std::string issued;
  std::optional<bool> policy_engine;    ///< pro and above
  std::vector<std::string> compliance;  ///< compliance markers

  /**
   * @brief Certificate with the tier's default features
   */
  static Certificate forTier(Tier tier, std::string issued);
};

/**
 * @brief Where the agent is running; signed as part of the payload
 */
struct ExecutionContext {
  std::optional<std::string> instance;
  std::optional<std::string> context;
  std::optional<std::string> document_mode;
  std::optional<std::string> tenant_id;

  [[nodiscard]] bool empty() const noexcept {
    return !instance && !context && !document_mode && !tenant_id;
  }
};

/**
 * @brief Signed record attached to a tool call
 */
struct Envelope {
  std::string signature;  ///< "<algorithm>:<base64>"
  std::string agent_id;
  std::string session_id;
  std::string timestamp;  ///< RFC 3339
  std::string user_query;
  uint64_t sequence = 0;
  int signature_schema_version = SIGNATURE_SCHEMA_VERSION;
  std::string key_id;
  std::optional<std::string> tenant_id;
  SignatureAlgorithm algorithm = SignatureAlgorithm::Ed25519;
  std::string public_key;  ///< base64; empty for hmac-sha256
  std::optional<std::string> parent_signature;
  Certificate certificate;
  std::optional<nlohmann::json> decision_context;
  std::optional<ExecutionContext> execution_context;
};

/**
 * @brief One line of the audit ledger
 */
struct AuditEntry {
  std::string tool_name;
  std::string args_hash;
  std::string signature;
  std::string timestamp;
  uint64_t sequence = 0;
  std::string key_id;
  std::string session_id;
  std::string user_query;
  SignatureAlgorithm algorithm = SignatureAlgorithm::Ed25519;
  int signature_schema_version = SIGNATURE_SCHEMA_VERSION;
  std::optional<std::string> parent_signature;
  std::optional<std::string> decision_context_hash;
  std::optional<std::string> execution_context_hash;
};

struct SessionInfo {
  std::string session_id;
  std::string agent_id;
  std::string started_at;
  uint64_t sequence = 0;
  size_t total_calls = 0;
  Tier tier = Tier::Community;
  size_t chain_length = 0;
};

/**
 * @brief Binds a natural-language answer to the tool signatures behind it
 */
struct FinalResponseProof {
  Envelope envelope;
  std::string response_hash;
  std::string tool_signatures_hash;
  size_t tool_signature_count = 0;
  nlohmann::json context = nlohmann::json::object();  ///< caller-supplied
};

/**
 * @brief Split "<algorithm>:<base64>" into its parts
 * @return std::nullopt if there is no recognised algorithm prefix
 */
std::optional<std::pair<SignatureAlgorithm, std::string>> splitSignature(
    std::string_view signature) noexcept;

/**
 * @brief Attach an envelope to an outgoing request under "trustchain"
 */
nlohmann::json attachEnvelope(nlohmann::json request, const Envelope& envelope);

void to_json(nlohmann::json& j, const Certificate& cert);
void from_json(const nlohmann::json& j, Certificate& cert);

void to_json(nlohmann::json& j, const ExecutionContext& ctx);
void from_json(const nlohmann::json& j, ExecutionContext& ctx);

void to_json(nlohmann::json& j, const Envelope& env);

/**
 * @throws InvalidEnvelopeError when required fields are missing or mistyped
 */
void from_json(const nlohmann::json& j, Envelope& env);

void to_json(nlohmann::json& j, const AuditEntry& entry);
void from_json(const nlohmann::json& j, AuditEntry& entry);

void to_json(nlohmann::json& j, const SessionInfo& info);

void to_json(nlohmann::json& j, const FinalResponseProof& proof);
void from_json(const nlohmann::json& j, FinalResponseProof& proof);

}  // namespace trustchain
