#include "trustchain/policy_evaluator.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "trustchain/error.hpp"
#include "trustchain/http_client.hpp"
#include "trustchain/logging.hpp"

namespace trustchain {

using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 9> MUTATING_PREFIXES = {
    "create_", "update_", "delete_", "upsert_", "write_",
    "apply_",  "set_",    "run_",    "execute_"};

constexpr std::array<std::string_view, 3> MUTATING_WORDS = {"approve", "block",
                                                            "revoke"};

constexpr std::array<std::string_view, 6> SIGNATURE_DENY_CODES = {
    "SIGNATURE_INVALID",           "SIGNATURE_MISSING",
    "TRUSTCHAIN_SIGNATURE_INVALID", "TRUSTCHAIN_SIGNATURE_MISSING",
    "INVALID_SIGNATURE",           "MISSING_SIGNATURE"};

constexpr std::array<std::string_view, 4> SIGNATURE_DENY_WORDS = {
    "invalid", "missing", "required", "verification failed"};

constexpr std::array<std::string_view, 4> RESULT_WRAPPERS = {
    "text", "content", "result", "data"};

std::string toLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string toUpper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return out;
}

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

std::optional<std::string> stringField(const json& j,
                                       std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string() &&
        !it->get_ref<const std::string&>().empty()) {
      return it->get<std::string>();
    }
  }
  return std::nullopt;
}

std::optional<PolicyDenial> denialFromObject(const json& obj) {
  bool deny = false;
  if (auto action = stringField(obj, {"action"})) {
    deny = toLower(*action) == "deny";
  }

  std::optional<std::string> policy;
  if (auto it = obj.find("policy"); it != obj.end()) {
    if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
      policy = it->get<std::string>();
    } else if (it->is_object() && !it->empty()) {
      policy = stringField(*it, {"name", "id"}).value_or(it->dump());
    }
  }
  if (policy) deny = true;

  if (auto it = obj.find("success");
      it != obj.end() && it->is_boolean() && !it->get<bool>()) {
    deny = true;
  }
  if (!deny) {
    return std::nullopt;
  }

  PolicyDenial denial;
  denial.code = stringField(obj, {"code", "deny_code", "error_code"})
                    .value_or(std::string(deny_codes::POLICY_DENIED));
  denial.message = stringField(obj, {"message", "reason", "error"})
                       .value_or("denied by tool server policy");
  denial.policy = std::move(policy);
  return denial;
}

std::optional<PolicyDenial> walk(const json& value, size_t depth,
                                 size_t maxDepth) {
  if (depth > maxDepth) {
    return std::nullopt;
  }

  switch (value.type()) {
    case json::value_t::string: {
      const auto& text = value.get_ref<const std::string&>();
      auto first = text.find_first_not_of(" \t\r\n");
      if (first == std::string::npos ||
          (text[first] != '{' && text[first] != '[')) {
        return std::nullopt;
      }
      auto parsed = json::parse(text, nullptr, false);
      if (parsed.is_discarded()) {
        return std::nullopt;
      }
      return walk(parsed, depth + 1, maxDepth);
    }
    case json::value_t::array:
      for (const auto& element : value) {
        if (auto denial = walk(element, depth + 1, maxDepth)) {
          return denial;
        }
      }
      return std::nullopt;
    case json::value_t::object: {
      if (auto denial = denialFromObject(value)) {
        return denial;
      }
      for (auto key : RESULT_WRAPPERS) {
        auto it = value.find(std::string(key));
        if (it != value.end()) {
          if (auto denial = walk(*it, depth + 1, maxDepth)) {
            return denial;
          }
        }
      }
      return std::nullopt;
    }
    default:
      return std::nullopt;
  }
}

}  // namespace

PolicyOptions PolicyOptions::fromConfig(const TrustChainConfig& config) {
  PolicyOptions options;
  options.allow_unsigned_local = config.allow_unsigned_local;
  options.unsigned_read_fallback = config.unsigned_read_fallback;
  options.local_bootstrap = config.local_bootstrap;
  options.local_bootstrap_window = config.local_bootstrap_window;
  return options;
}

bool isMutatingTool(std::string_view toolName) {
  const std::string name = toLower(toolName);
  for (auto prefix : MUTATING_PREFIXES) {
    if (std::string_view(name).substr(0, prefix.size()) == prefix) {
      return true;
    }
  }
  for (auto word : MUTATING_WORDS) {
    if (contains(name, word)) {
      return true;
    }
  }
  return false;
}

bool isSignatureDenial(std::string_view denyCode,
                       std::string_view denyMessage) {
  const std::string code = toUpper(denyCode);
  if (std::find(SIGNATURE_DENY_CODES.begin(), SIGNATURE_DENY_CODES.end(),
                code) != SIGNATURE_DENY_CODES.end()) {
    return true;
  }
  const std::string message = toLower(denyMessage);
  if (!contains(message, "signature")) {
    return false;
  }
  return std::any_of(
      SIGNATURE_DENY_WORDS.begin(), SIGNATURE_DENY_WORDS.end(),
      [&message](std::string_view word) { return contains(message, word); });
}

std::optional<PolicyDenial> extractPolicyDenial(const json& result,
                                                size_t maxDepth) {
  return walk(result, 0, maxDepth);
}

json markUnsignedFallback(json result, std::string_view reason) {
  if (!result.is_object()) {
    result = json{{"result", std::move(result)}};
  }
  result["trustchain_fallback_unsigned"] = true;
  result["trustchain_fallback_reason"] = reason;
  return result;
}

PolicyEvaluator::PolicyEvaluator(TrustRegistry& registry,
                                 PolicyOptions options)
    : registry_(registry), options_(options) {}

TrustDecision PolicyEvaluator::evaluateTrust(
    const ServerConfig& server, std::optional<std::string_view> toolName,
    TimePoint now) {
  TrustDecision decision;
  if (options_.local_bootstrap) {
    // creates a record only for unknown or lapsed bootstrap entries
    registry_.bootstrapLocal(server.id, server.url, now,
                             options_.local_bootstrap_window);
  }
  auto record = registry_.find(server.id);

  if (!record) {
    if (options_.allow_unsigned_local && isLoopbackUrl(server.url)) {
      decision.allowed = true;
      decision.code = allow_codes::ALLOW_UNSIGNED_LOCAL;
      decision.reason =
          "unregistered loopback server allowed by configuration";
      return decision;
    }
    decision.code = deny_codes::SERVER_UNTRUSTED;
    decision.reason =
        "server '" + server.id + "' is not in the trust registry";
    return decision;
  }

  decision.record = record;
  if (record->isRevoked()) {
    decision.code = deny_codes::SERVER_REVOKED;
    decision.reason = "server '" + server.id + "' is revoked";
    if (record->revocation_reason) {
      decision.reason += ": " + *record->revocation_reason;
    }
    return decision;
  }
  if (record->valid_to && *record->valid_to < now) {
    decision.code = deny_codes::SERVER_EXPIRED;
    decision.reason = "trust for '" + server.id + "' expired at " +
                      formatRfc3339(*record->valid_to);
    return decision;
  }
  if (record->valid_from > now) {
    decision.code = deny_codes::SERVER_NOT_YET_VALID;
    decision.reason = "trust for '" + server.id + "' starts at " +
                      formatRfc3339(record->valid_from);
    return decision;
  }
  if (record->status != TrustStatus::Active) {
    decision.code = deny_codes::SERVER_INACTIVE;
    decision.reason = "server '" + server.id + "' is " +
                      std::string(trustStatusToString(record->status));
    return decision;
  }
  if (toolName && isMutatingTool(*toolName) &&
      record->trust_tier < ServerTrustTier::Trusted) {
    decision.code = deny_codes::INSUFFICIENT_TRUST_TIER;
    decision.reason = "mutating tool '" + std::string(*toolName) +
                      "' requires a trusted server, '" + server.id + "' is " +
                      std::string(serverTierToString(record->trust_tier));
    return decision;
  }

  decision.allowed = true;
  decision.code = allow_codes::TRUSTED;
  decision.reason = "issued by " + record->issuer;
  return decision;
}

bool PolicyEvaluator::shouldAllowUnsignedReadFallback(
    const ServerConfig& server, std::string_view toolName,
    std::string_view denyCode, std::string_view denyMessage) const {
  return options_.unsigned_read_fallback && !isMutatingTool(toolName) &&
         isLoopbackUrl(server.url) && isSignatureDenial(denyCode, denyMessage);
}

TrustDecision PolicyEvaluator::enforce(const ServerConfig& server,
                                       std::string_view toolName,
                                       TimePoint now) {
  auto decision = evaluateTrust(server, toolName, now);
  if (!decision.allowed) {
    TC_LOG_WARN("Blocked {} on {}: {} ({})", toolName, server.id,
                decision.code, decision.reason);
    throw UntrustedServerError(decision.code, decision.reason);
  }
  return decision;
}

}  // namespace trustchain
