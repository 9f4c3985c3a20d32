#include "trustchain/envelope.hpp"

namespace trustchain {

using json = nlohmann::json;

std::string_view tierToString(Tier tier) noexcept {
  switch (tier) {
    case Tier::Community:
      return "community";
    case Tier::Pro:
      return "pro";
    case Tier::Enterprise:
      return "enterprise";
  }
  return "community";
}

std::optional<Tier> tierFromString(std::string_view name) noexcept {
  if (name == "community") return Tier::Community;
  if (name == "pro") return Tier::Pro;
  if (name == "enterprise") return Tier::Enterprise;
  return std::nullopt;
}

std::string_view algorithmToString(SignatureAlgorithm alg) noexcept {
  switch (alg) {
    case SignatureAlgorithm::Ed25519:
      return "ed25519";
    case SignatureAlgorithm::HmacSha256:
      return "hmac-sha256";
  }
  return "ed25519";
}

std::optional<SignatureAlgorithm> algorithmFromString(
    std::string_view name) noexcept {
  if (name == "ed25519") return SignatureAlgorithm::Ed25519;
  if (name == "hmac-sha256") return SignatureAlgorithm::HmacSha256;
  return std::nullopt;
}

Certificate Certificate::forTier(Tier tier, std::string issued) {
  Certificate cert;
  cert.tier = tier;
  cert.issued = std::move(issued);
  switch (tier) {
    case Tier::Community:
      break;
    case Tier::Pro:
      cert.policy_engine = true;
      cert.compliance = {"SOC2"};
      break;
    case Tier::Enterprise:
      cert.policy_engine = true;
      cert.compliance = {"SOC2", "HIPAA", "AI-Act"};
      break;
  }
  return cert;
}

std::optional<std::pair<SignatureAlgorithm, std::string>> splitSignature(
    std::string_view signature) noexcept {
  auto colon = signature.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  auto alg = algorithmFromString(signature.substr(0, colon));
  if (!alg) {
    return std::nullopt;
  }
  try {
    return std::make_pair(*alg, std::string(signature.substr(colon + 1)));
  } catch (const std::bad_alloc&) {
    return std::nullopt;
  }
}

json attachEnvelope(json request, const Envelope& envelope) {
  request[std::string(ENVELOPE_FIELD)] = envelope;
  return request;
}

void to_json(json& j, const Certificate& cert) {
  j = json::object();
  j["owner"] = cert.owner;
  j["organization"] = cert.organization;
  j["role"] = cert.role;
  j["tier"] = tierToString(cert.tier);
  j["issued"] = cert.issued;
  if (cert.policy_engine.has_value()) {
    j["policy_engine"] = cert.policy_engine.value();
  }
  if (!cert.compliance.empty()) {
    j["compliance"] = cert.compliance;
  }
}

void from_json(const json& j, Certificate& cert) {
  cert.owner = j.value("owner", std::string());
  cert.organization = j.value("organization", std::string());
  cert.role = j.value("role", std::string());
  cert.tier = tierFromString(j.value("tier", std::string("community")))
                  .value_or(Tier::Community);
  cert.issued = j.value("issued", std::string());
  if (j.contains("policy_engine") && j["policy_engine"].is_boolean()) {
    cert.policy_engine = j["policy_engine"].get<bool>();
  }
  if (j.contains("compliance") && j["compliance"].is_array()) {
    cert.compliance = j["compliance"].get<std::vector<std::string>>();
  }
}

void to_json(json& j, const ExecutionContext& ctx) {
  j = json::object();
  if (ctx.instance) j["instance"] = *ctx.instance;
  if (ctx.context) j["context"] = *ctx.context;
  if (ctx.document_mode) j["document_mode"] = *ctx.document_mode;
  if (ctx.tenant_id) j["tenant_id"] = *ctx.tenant_id;
}

void from_json(const json& j, ExecutionContext& ctx) {
  auto optionalString = [&j](const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
  };
  ctx.instance = optionalString("instance");
  ctx.context = optionalString("context");
  ctx.document_mode = optionalString("document_mode");
  ctx.tenant_id = optionalString("tenant_id");
}

void to_json(json& j, const Envelope& env) {
  j = json::object();
  j["signature"] = env.signature;
  j["agent_id"] = env.agent_id;
  j["session_id"] = env.session_id;
  j["timestamp"] = env.timestamp;
  j["user_query"] = env.user_query;
  j["sequence"] = env.sequence;
  j["signature_schema_version"] = env.signature_schema_version;
  j["key_id"] = env.key_id;
  if (env.tenant_id) {
    j["tenant_id"] = *env.tenant_id;
  }
  j["algorithm"] = algorithmToString(env.algorithm);
  j["public_key"] = env.public_key;
  if (env.parent_signature) {
    j["parent_signature"] = *env.parent_signature;
  }
  j["certificate"] = env.certificate;
  if (env.decision_context) {
    j["decision_context"] = *env.decision_context;
  }
  if (env.execution_context) {
    j["execution_context"] = *env.execution_context;
  }
}

void from_json(const json& j, Envelope& env) {
  if (!j.is_object()) {
    throw InvalidEnvelopeError("envelope must be a JSON object");
  }
  try {
    env.signature = j.at("signature").get<std::string>();
    env.agent_id = j.value("agent_id", std::string());
    env.session_id = j.value("session_id", std::string());
    env.timestamp = j.at("timestamp").get<std::string>();
    env.user_query = j.value("user_query", std::string());
    env.sequence = j.at("sequence").get<uint64_t>();
    env.signature_schema_version =
        j.value("signature_schema_version", SIGNATURE_SCHEMA_VERSION);
    env.key_id = j.value("key_id", std::string());

    auto tenant = j.find("tenant_id");
    env.tenant_id = (tenant != j.end() && tenant->is_string())
                        ? std::optional<std::string>(tenant->get<std::string>())
                        : std::nullopt;

    auto alg = algorithmFromString(j.at("algorithm").get<std::string>());
    if (!alg) {
      throw InvalidEnvelopeError("unknown algorithm");
    }
    env.algorithm = *alg;
    env.public_key = j.value("public_key", std::string());

    auto parent = j.find("parent_signature");
    env.parent_signature =
        (parent != j.end() && parent->is_string())
            ? std::optional<std::string>(parent->get<std::string>())
            : std::nullopt;

    if (j.contains("certificate") && j["certificate"].is_object()) {
      env.certificate = j["certificate"].get<Certificate>();
    }
    auto decision = j.find("decision_context");
    env.decision_context = (decision != j.end() && !decision->is_null())
                               ? std::optional<json>(*decision)
                               : std::nullopt;
    auto exec = j.find("execution_context");
    env.execution_context =
        (exec != j.end() && exec->is_object())
            ? std::optional<ExecutionContext>(exec->get<ExecutionContext>())
            : std::nullopt;
  } catch (const json::exception& e) {
    throw InvalidEnvelopeError(e.what());
  }
}

void to_json(json& j, const AuditEntry& entry) {
  j = json::object();
  j["tool_name"] = entry.tool_name;
  j["args_hash"] = entry.args_hash;
  j["signature"] = entry.signature;
  j["timestamp"] = entry.timestamp;
  j["sequence"] = entry.sequence;
  j["key_id"] = entry.key_id;
  j["session_id"] = entry.session_id;
  j["user_query"] = entry.user_query;
  j["algorithm"] = algorithmToString(entry.algorithm);
  j["signature_schema_version"] = entry.signature_schema_version;
  if (entry.parent_signature) {
    j["parent_signature"] = *entry.parent_signature;
  }
  if (entry.decision_context_hash) {
    j["decision_context_hash"] = *entry.decision_context_hash;
  }
  if (entry.execution_context_hash) {
    j["execution_context_hash"] = *entry.execution_context_hash;
  }
}

// Lenient: audit exports are checked field by field by verifyAuditProof
void from_json(const json& j, AuditEntry& entry) {
  entry.tool_name = j.value("tool_name", std::string());
  entry.args_hash = j.value("args_hash", std::string());
  entry.signature = j.value("signature", std::string());
  entry.timestamp = j.value("timestamp", std::string());
  entry.sequence = j.value("sequence", uint64_t{0});
  entry.key_id = j.value("key_id", std::string());
  entry.session_id = j.value("session_id", std::string());
  entry.user_query = j.value("user_query", std::string());
  entry.algorithm = algorithmFromString(j.value("algorithm", std::string()))
                        .value_or(SignatureAlgorithm::Ed25519);
  entry.signature_schema_version = j.value("signature_schema_version", 0);

  auto optionalString = [&j](const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
  };
  entry.parent_signature = optionalString("parent_signature");
  entry.decision_context_hash = optionalString("decision_context_hash");
  entry.execution_context_hash = optionalString("execution_context_hash");
}

void to_json(json& j, const SessionInfo& info) {
  j = json{{"session_id", info.session_id},
           {"agent_id", info.agent_id},
           {"started_at", info.started_at},
           {"sequence", info.sequence},
           {"total_calls", info.total_calls},
           {"tier", tierToString(info.tier)},
           {"chain_length", info.chain_length}};
}

void to_json(json& j, const FinalResponseProof& proof) {
  j = json{{"envelope", proof.envelope},
           {"response_hash", proof.response_hash},
           {"tool_signatures_hash", proof.tool_signatures_hash},
           {"tool_signature_count", proof.tool_signature_count},
           {"context", proof.context}};
}

void from_json(const json& j, FinalResponseProof& proof) {
  try {
    proof.envelope = j.at("envelope").get<Envelope>();
    proof.response_hash = j.at("response_hash").get<std::string>();
    proof.tool_signatures_hash = j.at("tool_signatures_hash").get<std::string>();
    proof.tool_signature_count = j.value("tool_signature_count", size_t{0});
    proof.context = j.value("context", json::object());
  } catch (const json::exception& e) {
    throw InvalidEnvelopeError(e.what());
  }
}

}  // namespace trustchain
