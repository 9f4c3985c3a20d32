#include "trustchain/config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "trustchain/logging.hpp"

namespace trustchain {

using json = nlohmann::json;

namespace {

std::optional<std::string> readEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  std::string text(value);
  auto notSpace = [](unsigned char c) { return !std::isspace(c); };
  text.erase(text.begin(), std::find_if(text.begin(), text.end(), notSpace));
  text.erase(std::find_if(text.rbegin(), text.rend(), notSpace).base(),
             text.end());
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

bool parseBool(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower == "1" || lower == "true" || lower == "yes";
}

std::optional<long long> parseNumber(const std::string& text) {
  char* end = nullptr;
  errno = 0;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

template <typename T>
T field(const json& j, const char* key, const T& fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigurationError(std::string(key) + ": " + e.what());
  }
}

std::chrono::milliseconds positiveMillis(const json& j, const char* key,
                                         std::chrono::milliseconds fallback) {
  auto value = field<long long>(j, key, fallback.count());
  if (value <= 0) {
    throw ConfigurationError(std::string(key) + " must be positive");
  }
  return std::chrono::milliseconds(value);
}

bool hasHttpScheme(const std::string& url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

}  // namespace

std::optional<SignerConfig> SignerConfig::fromEnvironment() {
  auto url = readEnv("TRUSTCHAIN_EXTERNAL_SIGNER_URL");
  if (!url) {
    return std::nullopt;
  }

  SignerConfig config;
  config.url = *url;
  if (auto timeout = readEnv("TRUSTCHAIN_EXTERNAL_SIGNER_TIMEOUT_MS")) {
    auto ms = parseNumber(*timeout);
    if (ms && *ms > 0) {
      config.timeout = std::chrono::milliseconds(*ms);
    } else {
      TC_LOG_WARN("Ignoring invalid TRUSTCHAIN_EXTERNAL_SIGNER_TIMEOUT_MS '{}'",
                  *timeout);
    }
  }
  config.key_id = readEnv("TRUSTCHAIN_EXTERNAL_SIGNER_KEY_ID");
  config.public_key = readEnv("TRUSTCHAIN_EXTERNAL_SIGNER_PUBLIC_KEY");
  if (auto v = readEnv("TRUSTCHAIN_EXTERNAL_SIGNER_FALLBACK_LOCAL")) {
    config.fallback_to_local = parseBool(*v);
  }
  return config;
}

TrustChainConfig TrustChainConfig::fromJson(const json& j) {
  if (!j.is_object()) {
    throw ConfigurationError("configuration must be a JSON object");
  }

  TrustChainConfig config;
  config.agent_id = field<std::string>(j, "agent_id", config.agent_id);

  auto tierName = field<std::string>(j, "tier", "community");
  auto tier = tierFromString(tierName);
  if (!tier) {
    throw ConfigurationError("unknown tier '" + tierName + "'");
  }
  config.tier = *tier;

  config.strict_mode = field<bool>(j, "strict_mode", config.strict_mode);
  config.allow_unsigned_local =
      field<bool>(j, "allow_unsigned_local", config.allow_unsigned_local);
  config.unsigned_read_fallback =
      field<bool>(j, "unsigned_read_fallback", config.unsigned_read_fallback);
  config.audit_visible_limit =
      field<size_t>(j, "audit_visible_limit", config.audit_visible_limit);

  if (auto it = j.find("external_signer"); it != j.end() && !it->is_null()) {
    if (!it->is_object()) {
      throw ConfigurationError("external_signer must be an object");
    }
    SignerConfig signer;
    signer.url = field<std::string>(*it, "url", "");
    if (signer.url.empty()) {
      throw ConfigurationError("external_signer.url is required");
    }
    signer.timeout = positiveMillis(*it, "timeout_ms", signer.timeout);
    signer.min_health_interval = positiveMillis(
        *it, "min_health_interval_ms", signer.min_health_interval);
    signer.degraded_latency =
        positiveMillis(*it, "degraded_latency_ms", signer.degraded_latency);
    auto keyId = field<std::string>(*it, "key_id", "");
    auto publicKey = field<std::string>(*it, "public_key", "");
    if (!keyId.empty()) signer.key_id = keyId;
    if (!publicKey.empty()) signer.public_key = publicKey;
    signer.fallback_to_local =
        field<bool>(*it, "fallback_to_local", signer.fallback_to_local);
    config.external_signer = std::move(signer);
  }

  if (auto it = j.find("registry"); it != j.end() && !it->is_null()) {
    if (!it->is_object()) {
      throw ConfigurationError("registry must be an object");
    }
    auto url = field<std::string>(*it, "url", "");
    if (!url.empty()) config.registry_url = url;
    config.registry_timeout =
        positiveMillis(*it, "timeout_ms", config.registry_timeout);
    config.registry_path = field<std::string>(*it, "path", "");
    config.local_bootstrap =
        field<bool>(*it, "local_bootstrap", config.local_bootstrap);
    auto hours = field<long long>(*it, "local_bootstrap_hours",
                                  config.local_bootstrap_window.count());
    if (hours <= 0) {
      throw ConfigurationError("local_bootstrap_hours must be positive");
    }
    config.local_bootstrap_window = std::chrono::hours(hours);
  }

  config.log_level = field<std::string>(j, "log_level", config.log_level);
  if (!logging::isLevelName(config.log_level)) {
    throw ConfigurationError("unknown log_level '" + config.log_level + "'");
  }
  return config;
}

TrustChainConfig TrustChainConfig::fromEnvironment() {
  TrustChainConfig config;
  if (auto v = readEnv("TRUSTCHAIN_AGENT_ID")) config.agent_id = *v;
  if (auto v = readEnv("TRUSTCHAIN_TIER")) {
    if (auto tier = tierFromString(*v)) {
      config.tier = *tier;
    } else {
      TC_LOG_WARN("Ignoring unknown TRUSTCHAIN_TIER '{}'", *v);
    }
  }
  if (auto v = readEnv("TRUSTCHAIN_STRICT_MODE")) {
    config.strict_mode = parseBool(*v);
  }
  if (auto v = readEnv("TRUSTCHAIN_ALLOW_LOCAL_UNSIGNED_MCP")) {
    config.allow_unsigned_local = parseBool(*v);
  }
  if (auto v = readEnv("TRUSTCHAIN_UNSIGNED_READ_FALLBACK")) {
    config.unsigned_read_fallback = parseBool(*v);
  }
  if (auto v = readEnv("TRUSTCHAIN_REGISTRY_URL")) config.registry_url = *v;
  if (auto v = readEnv("TRUSTCHAIN_REGISTRY_PATH")) config.registry_path = *v;
  if (auto v = readEnv("TRUSTCHAIN_LOCAL_BOOTSTRAP")) {
    config.local_bootstrap = parseBool(*v);
  }
  if (auto v = readEnv("TRUSTCHAIN_LOG_LEVEL")) {
    if (logging::isLevelName(*v)) {
      config.log_level = *v;
    } else {
      TC_LOG_WARN("Ignoring unknown TRUSTCHAIN_LOG_LEVEL '{}'", *v);
    }
  }
  config.external_signer = SignerConfig::fromEnvironment();
  return config;
}

ValidationReport TrustChainConfig::validateForProduction() const {
  ValidationReport report;
  if (!strict_mode) {
    report.errors.emplace_back("strict_mode must be enabled");
  }
  if (allow_unsigned_local) {
    report.errors.emplace_back("allow_unsigned_local must be disabled");
  }
  if (unsigned_read_fallback) {
    report.errors.emplace_back("unsigned_read_fallback must be disabled");
  }

  if (external_signer) {
    if (!hasHttpScheme(external_signer->url)) {
      report.errors.emplace_back(
          "external_signer.url must start with http:// or https://");
    }
    if (external_signer->timeout <
        config_defaults::PRODUCTION_MIN_SIGNER_TIMEOUT) {
      report.errors.emplace_back("external_signer.timeout_ms must be >= 1000");
    }
    if (!external_signer->key_id) {
      report.errors.emplace_back("external_signer.key_id is required");
    }
    if (!external_signer->public_key) {
      report.errors.emplace_back("external_signer.public_key is required");
    }
    if (external_signer->fallback_to_local) {
      report.warnings.emplace_back(
          "external signer timeouts fall back to an in-memory key");
    }
  } else {
    report.warnings.emplace_back(
        "no external signer configured; keys are held in process memory");
  }

  if (!registry_url) {
    report.warnings.emplace_back(
        "no registry url; only locally registered servers are trusted");
  }
  if (local_bootstrap) {
    report.errors.emplace_back("local_bootstrap must be disabled");
  }
  return report;
}

json TrustChainConfig::toJson() const {
  json j = {{"agent_id", agent_id},
            {"tier", tierToString(tier)},
            {"strict_mode", strict_mode},
            {"allow_unsigned_local", allow_unsigned_local},
            {"unsigned_read_fallback", unsigned_read_fallback},
            {"audit_visible_limit", audit_visible_limit},
            {"log_level", log_level}};
  if (external_signer) {
    json signer = {
        {"url", external_signer->url},
        {"timeout_ms", external_signer->timeout.count()},
        {"min_health_interval_ms", external_signer->min_health_interval.count()},
        {"degraded_latency_ms", external_signer->degraded_latency.count()},
        {"fallback_to_local", external_signer->fallback_to_local}};
    if (external_signer->key_id) signer["key_id"] = *external_signer->key_id;
    if (external_signer->public_key) {
      signer["public_key"] = *external_signer->public_key;
    }
    j["external_signer"] = std::move(signer);
  }
  json registry = {{"timeout_ms", registry_timeout.count()},
                   {"path", registry_path},
                   {"local_bootstrap", local_bootstrap},
                   {"local_bootstrap_hours", local_bootstrap_window.count()}};
  if (registry_url) registry["url"] = *registry_url;
  j["registry"] = std::move(registry);
  return j;
}

}  // namespace trustchain
