#include "trustchain/signing_engine.hpp"

#include <algorithm>

#include "trustchain/canonical_json.hpp"
#include "trustchain/crypto.hpp"
#include "trustchain/logging.hpp"
#include "trustchain/time_util.hpp"

namespace trustchain {

using json = nlohmann::json;

json buildSigningPayload(std::string_view toolName, const json& args,
                         uint64_t sequence, std::string_view timestamp,
                         std::string_view keyId, int schemaVersion,
                         const std::optional<std::string>& tenantId,
                         const std::optional<ExecutionContext>& executionContext) {
  json payload = json::object();
  payload["arguments"] = args;
  payload["execution_context"] =
      executionContext ? json(*executionContext) : json(nullptr);
  payload["key_id"] = keyId;
  payload["name"] = toolName;
  payload["sequence"] = sequence;
  payload["signature_schema_version"] = schemaVersion;
  payload["tenant_id"] = tenantId ? json(*tenantId) : json(nullptr);
  payload["timestamp"] = timestamp;
  return payload;
}

std::string toolSignaturesHash(std::vector<std::string> signatures) {
  std::sort(signatures.begin(), signatures.end());
  std::string joined;
  for (size_t i = 0; i < signatures.size(); ++i) {
    if (i > 0) joined.push_back('\n');
    joined += signatures[i];
  }
  return sha256Hex(joined);
}

json finalResponseArguments(const std::string& responseHash,
                            const std::string& signaturesHash,
                            size_t signatureCount, const json& context) {
  return json{{"response_hash", responseHash},
              {"tool_signatures_hash", signaturesHash},
              {"tool_signature_count", signatureCount},
              {"context", context}};
}

SigningEngine::SigningEngine(KeyManager& keys, AuditTrail& audit,
                             std::string agentId, Tier tier)
    : keys_(keys),
      audit_(audit),
      agent_id_(std::move(agentId)),
      tier_(tier),
      certificate_(Certificate::forTier(tier, formatRfc3339(Clock::now()))) {}

void SigningEngine::reset(std::string sessionId, std::string startedAt) {
  session_id_ = std::move(sessionId);
  started_at_ = std::move(startedAt);
  sequence_ = 0;
  total_calls_ = 0;
  last_signature_.reset();
  audit_.clear();
}

void SigningEngine::setTier(Tier tier) {
  tier_ = tier;
  certificate_ = Certificate::forTier(tier, certificate_.issued);
  TC_LOG_INFO("Tier set to {}", tierToString(tier));
}

void SigningEngine::setExecutionContext(
    std::optional<ExecutionContext> context) {
  if (context && context->empty()) {
    context.reset();
  }
  execution_context_ = std::move(context);
}

std::optional<std::string> SigningEngine::effectiveTenant() const {
  if (tenant_id_) {
    return tenant_id_;
  }
  if (execution_context_ && execution_context_->tenant_id) {
    return execution_context_->tenant_id;
  }
  return std::nullopt;
}

Envelope SigningEngine::sign(std::string_view toolName, const json& args) {
  keys_.initialize();

  if (keys_.isRevoked(keys_.keyId())) {
    throw RevokedKeyError(keys_.keyId());
  }
  if (keys_.strictMode() && keys_.algorithm() != SignatureAlgorithm::Ed25519) {
    throw SigningFailure("strict mode requires ed25519");
  }

  const uint64_t sequence = sequence_ + 1;
  const std::string timestamp = formatRfc3339(Clock::now());
  const auto tenant = effectiveTenant();

  // key_id is signed, so the bytes are rebuilt if the key changes
  auto payloadBytes = [&] {
    return canonicalBytes(buildSigningPayload(
        toolName, args, sequence, timestamp, keys_.keyId(),
        SIGNATURE_SCHEMA_VERSION, tenant, execution_context_));
  };
  auto bytes = payloadBytes();

  std::optional<std::string> decisionHash;
  std::optional<std::string> executionHash;
  if (decision_context_) {
    decisionHash = sha256Hex(canonicalize(*decision_context_));
  }
  if (execution_context_) {
    executionHash = sha256Hex(canonicalize(json(*execution_context_)));
  }

  std::string signature;
  try {
    signature = keys_.sign(bytes);
  } catch (const ExternalSignerTimeout& e) {
    if (!keys_.localFallbackEnabled()) {
      throw;
    }
    TC_LOG_WARN("{}; signing {} seq={} locally", e.what(), toolName, sequence);
    keys_.useLocalKey();
    bytes = payloadBytes();
    signature = keys_.sign(bytes);
  }

  Envelope envelope;
  envelope.signature = signature;
  envelope.agent_id = agent_id_;
  envelope.session_id = session_id_;
  envelope.timestamp = timestamp;
  envelope.user_query = user_query_;
  envelope.sequence = sequence;
  envelope.key_id = keys_.keyId();
  envelope.tenant_id = tenant;
  envelope.algorithm = keys_.algorithm();
  envelope.public_key = keys_.publicKeyBase64();
  if (tier_ != Tier::Community && last_signature_) {
    envelope.parent_signature = last_signature_;
  }
  envelope.certificate = certificate_;
  envelope.decision_context = decision_context_;
  envelope.execution_context = execution_context_;

  AuditEntry entry;
  entry.tool_name = std::string(toolName);
  entry.args_hash = sha256Hex(args.dump());
  entry.signature = signature;
  entry.timestamp = timestamp;
  entry.sequence = sequence;
  entry.key_id = envelope.key_id;
  entry.session_id = session_id_;
  entry.user_query = user_query_;
  entry.algorithm = envelope.algorithm;
  entry.signature_schema_version = SIGNATURE_SCHEMA_VERSION;
  entry.parent_signature = envelope.parent_signature;
  entry.decision_context_hash = decisionHash;
  entry.execution_context_hash = executionHash;

  audit_.append(std::move(entry));
  sequence_ = sequence;
  ++total_calls_;
  last_signature_ = std::move(signature);

  TC_LOG_DEBUG("Signed {} seq={} session={}", toolName, sequence, session_id_);
  return envelope;
}

FinalResponseProof SigningEngine::signFinalResponse(
    std::string_view responseText,
    const std::vector<std::string>& toolSignatures, const json& extraContext) {
  FinalResponseProof proof;
  proof.response_hash = sha256Hex(responseText);
  proof.tool_signatures_hash = toolSignaturesHash(toolSignatures);
  proof.tool_signature_count = toolSignatures.size();
  proof.context = extraContext.is_null() ? json::object() : extraContext;
  proof.envelope = sign(
      FINAL_RESPONSE_TOOL,
      finalResponseArguments(proof.response_hash, proof.tool_signatures_hash,
                             proof.tool_signature_count, proof.context));
  return proof;
}

}  // namespace trustchain
