#include "trustchain/trust_registry.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include "trustchain/logging.hpp"

namespace trustchain {

using json = nlohmann::json;

namespace {

constexpr std::string_view SERVERS_PATH = "api/mcp-trust/servers";

TimePoint parseTime(const json& value, const char* field) {
  if (!value.is_string()) {
    throw RegistrySyncError(std::string(field) + " must be a string");
  }
  auto parsed = parseRfc3339(value.get<std::string>());
  if (!parsed) {
    throw RegistrySyncError(std::string(field) + " is not RFC 3339: " +
                            value.get<std::string>());
  }
  return *parsed;
}

std::optional<TrustSource> trustSourceFromString(std::string_view name) {
  if (name == "registry") return TrustSource::Registry;
  if (name == "local-bootstrap") return TrustSource::LocalBootstrap;
  if (name == "manual") return TrustSource::Manual;
  return std::nullopt;
}

bool isBootstrapCandidate(std::string_view serverId) {
  return std::find(std::begin(LOCAL_BOOTSTRAP_SERVERS),
                   std::end(LOCAL_BOOTSTRAP_SERVERS),
                   serverId) != std::end(LOCAL_BOOTSTRAP_SERVERS);
}

}  // namespace

std::string_view trustStatusToString(TrustStatus status) noexcept {
  switch (status) {
    case TrustStatus::Active:
      return "active";
    case TrustStatus::Revoked:
      return "revoked";
    case TrustStatus::Expired:
      return "expired";
    case TrustStatus::Suspended:
      return "suspended";
  }
  return "suspended";
}

std::optional<TrustStatus> trustStatusFromString(
    std::string_view name) noexcept {
  if (name == "active") return TrustStatus::Active;
  if (name == "revoked") return TrustStatus::Revoked;
  if (name == "expired") return TrustStatus::Expired;
  if (name == "suspended") return TrustStatus::Suspended;
  return std::nullopt;
}

std::string_view serverTierToString(ServerTrustTier tier) noexcept {
  switch (tier) {
    case ServerTrustTier::Sandbox:
      return "sandbox";
    case ServerTrustTier::Standard:
      return "standard";
    case ServerTrustTier::Trusted:
      return "trusted";
  }
  return "sandbox";
}

std::optional<ServerTrustTier> serverTierFromString(
    std::string_view name) noexcept {
  if (name == "sandbox") return ServerTrustTier::Sandbox;
  if (name == "standard") return ServerTrustTier::Standard;
  if (name == "trusted") return ServerTrustTier::Trusted;
  return std::nullopt;
}

std::string_view trustSourceToString(TrustSource source) noexcept {
  switch (source) {
    case TrustSource::Registry:
      return "registry";
    case TrustSource::LocalBootstrap:
      return "local-bootstrap";
    case TrustSource::Manual:
      return "manual";
  }
  return "manual";
}

void to_json(json& j, const TrustRecord& record) {
  j = json{{"server_id", record.server_id},
           {"issuer", record.issuer},
           {"fingerprint", record.fingerprint},
           {"valid_from", formatRfc3339(record.valid_from)},
           {"valid_to", record.valid_to ? json(formatRfc3339(*record.valid_to))
                                        : json(nullptr)},
           {"status", trustStatusToString(record.status)},
           {"revoked", record.revoked},
           {"trust_tier", serverTierToString(record.trust_tier)},
           {"source", trustSourceToString(record.source)}};
  if (record.revocation_reason) {
    j["revocation_reason"] = *record.revocation_reason;
  }
}

void from_json(const json& j, TrustRecord& record) {
  if (!j.is_object()) {
    throw RegistrySyncError("trust record must be an object");
  }
  auto id = j.find("server_id");
  if (id == j.end()) {
    id = j.find("id");
  }
  if (id == j.end() || !id->is_string() || id->get<std::string>().empty()) {
    throw RegistrySyncError("trust record without server_id");
  }
  record.server_id = id->get<std::string>();
  record.issuer = j.value("issuer", std::string());
  record.fingerprint = j.value("fingerprint", std::string());

  auto from = j.find("valid_from");
  record.valid_from = (from != j.end() && !from->is_null())
                          ? parseTime(*from, "valid_from")
                          : TimePoint{};
  auto to = j.find("valid_to");
  record.valid_to = (to != j.end() && !to->is_null())
                        ? std::optional<TimePoint>(parseTime(*to, "valid_to"))
                        : std::nullopt;

  record.revoked = j.value("revoked", false);
  auto statusName = j.value("status", std::string());
  if (statusName.empty()) {
    record.status = record.revoked ? TrustStatus::Revoked : TrustStatus::Active;
  } else {
    auto status = trustStatusFromString(statusName);
    if (!status) {
      throw RegistrySyncError("unknown status '" + statusName + "'");
    }
    record.status = *status;
  }

  auto tierName = j.value("trust_tier", std::string("sandbox"));
  auto tier = serverTierFromString(tierName);
  if (!tier) {
    throw RegistrySyncError("unknown trust_tier '" + tierName + "'");
  }
  record.trust_tier = *tier;

  auto reason = j.find("revocation_reason");
  record.revocation_reason =
      (reason != j.end() && reason->is_string())
          ? std::optional<std::string>(reason->get<std::string>())
          : std::nullopt;
  record.source = trustSourceFromString(j.value("source", std::string()))
                      .value_or(TrustSource::Registry);
}

std::vector<TrustRecord> parseTrustRecords(const json& document) {
  const json* list = nullptr;
  if (document.is_array()) {
    list = &document;
  } else if (document.is_object()) {
    auto it = document.find("servers");
    if (it != document.end() && it->is_array()) {
      list = &*it;
    }
  }

  std::vector<TrustRecord> records;
  if (list == nullptr) {
    return records;
  }
  for (const auto& item : *list) {
    try {
      records.push_back(item.get<TrustRecord>());
    } catch (const RegistrySyncError& e) {
      TC_LOG_WARN("Skipping trust record: {}", e.what());
    } catch (const json::exception& e) {
      TC_LOG_WARN("Skipping trust record: {}", e.what());
    }
  }
  return records;
}

//
// FileRegistryStorage
//

FileRegistryStorage::FileRegistryStorage(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileRegistryStorage::pathFor(std::string_view key) const {
  return directory_ / (std::string(key) + ".json");
}

std::optional<std::string> FileRegistryStorage::read(
    std::string_view key) const {
  std::ifstream in(pathFor(key), std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

void FileRegistryStorage::write(std::string_view key, std::string_view value) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throwOsError("create " + directory_.string(), ec.value());
  }

  const auto target = pathFor(key);
  auto temp = target;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throwOsError("open " + temp.string(), errno);
    }
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
    out.flush();
    if (!out) {
      throwOsError("write " + temp.string(), errno);
    }
  }
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    throwOsError("rename " + temp.string(), ec.value());
  }
}

//
// TrustRegistry
//

TrustRegistry::TrustRegistry(std::shared_ptr<RegistryStorage> storage)
    : storage_(std::move(storage)) {}

void TrustRegistry::upsertLocked(TrustRecord record) {
  auto it = records_.find(record.server_id);
  if (it != records_.end() && it->second.isRevoked() && !record.isRevoked()) {
    TC_LOG_WARN("Ignoring reactivation of revoked server {}", record.server_id);
    record.revoked = true;
    record.status = TrustStatus::Revoked;
    record.revocation_reason = it->second.revocation_reason;
  }
  std::string id = record.server_id;
  records_.insert_or_assign(std::move(id), std::move(record));
}

void TrustRegistry::upsert(TrustRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  upsertLocked(std::move(record));
}

bool TrustRegistry::revoke(std::string_view serverId, std::string reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(serverId);
  if (it == records_.end()) {
    return false;
  }
  it->second.revoked = true;
  it->second.status = TrustStatus::Revoked;
  it->second.revocation_reason = std::move(reason);
  TC_LOG_WARN("Server {} revoked: {}", serverId,
              *it->second.revocation_reason);
  return true;
}

std::optional<TrustRecord> TrustRegistry::find(std::string_view serverId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(serverId);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TrustRecord> TrustRegistry::records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TrustRecord> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    out.push_back(record);
  }
  return out;
}

size_t TrustRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

TcResult<size_t> TrustRegistry::syncFromAuthority(
    const HttpClient& http, std::string_view baseUrl,
    std::chrono::milliseconds timeout) {
  HttpError error;
  auto response = http.get(joinUrl(baseUrl, SERVERS_PATH), timeout, error);
  if (!response) {
    TC_LOG_WARN("Trust registry sync failed: {}", error.message);
    return TcResult<size_t>::error(RegistrySyncError(error.message));
  }
  if (!response->ok()) {
    return TcResult<size_t>::error(
        RegistrySyncError("HTTP " + std::to_string(response->status)));
  }

  auto document = json::parse(response->body, nullptr, false);
  if (document.is_discarded() ||
      !(document.is_array() ||
        (document.is_object() && document.contains("servers")))) {
    return TcResult<size_t>::error(
        RegistrySyncError("response is not a server list"));
  }

  auto parsed = parseTrustRecords(document);
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& record : parsed) {
    record.source = TrustSource::Registry;
    upsertLocked(std::move(record));
  }
  TC_LOG_INFO("Synced {} trust records from {}", parsed.size(), baseUrl);
  return TcResult<size_t>::success(parsed.size());
}

bool TrustRegistry::bootstrapLocal(std::string_view serverId,
                                   std::string_view url, TimePoint now,
                                   std::chrono::hours window) {
  if (!isBootstrapCandidate(serverId) || !isLoopbackUrl(url)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(serverId);
  if (it != records_.end()) {
    const auto& existing = it->second;
    bool expiredBootstrap = existing.source == TrustSource::LocalBootstrap &&
                            !existing.isRevoked() && existing.valid_to &&
                            *existing.valid_to <= now;
    if (!expiredBootstrap) {
      return false;
    }
  }

  TrustRecord record;
  record.server_id = std::string(serverId);
  record.issuer = std::string(LOCAL_BOOTSTRAP_ISSUER);
  record.fingerprint = "local:" + urlHost(url);
  record.valid_from = now;
  record.valid_to = now + window;
  record.status = TrustStatus::Active;
  record.trust_tier = ServerTrustTier::Standard;
  record.source = TrustSource::LocalBootstrap;
  records_.insert_or_assign(record.server_id, record);
  TC_LOG_INFO("Bootstrapped local server {} for {} h", serverId,
              window.count());
  return true;
}

size_t TrustRegistry::load() {
  if (!storage_) {
    return 0;
  }
  auto stored = storage_->read(REGISTRY_STORAGE_KEY);
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
  if (!stored) {
    return 0;
  }
  auto document = json::parse(*stored, nullptr, false);
  if (!document.is_array()) {
    TC_LOG_WARN("Persisted trust registry is malformed; starting empty");
    return 0;
  }
  for (auto& record : parseTrustRecords(document)) {
    std::string id = record.server_id;
    records_.insert_or_assign(std::move(id), std::move(record));
  }
  return records_.size();
}

void TrustRegistry::save() const {
  if (!storage_) {
    return;
  }
  json document = json::array();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, record] : records_) {
      document.push_back(record);
    }
  }
  storage_->write(REGISTRY_STORAGE_KEY, document.dump());
}

}  // namespace trustchain
