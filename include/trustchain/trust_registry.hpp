/**
 * @file trust_registry.hpp
 * @brief Trust records for remote tool servers, with sync and persistence
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "http_client.hpp"
#include "time_util.hpp"

namespace trustchain {

/// Storage key of the persisted registry
constexpr std::string_view REGISTRY_STORAGE_KEY = "trustchain_mcp_trust_registry";

/// Issuer written on automatically trusted loopback servers
constexpr std::string_view LOCAL_BOOTSTRAP_ISSUER = "local-dev-bootstrap";

/// Server ids eligible for local bootstrap
constexpr std::string_view LOCAL_BOOTSTRAP_SERVERS[] = {
    "panel", "local", "playwright", "trustchain-local", "localhost"};

enum class TrustStatus { Active, Revoked, Expired, Suspended };

/// Ordered: sandbox < standard < trusted
enum class ServerTrustTier { Sandbox = 0, Standard = 1, Trusted = 2 };

enum class TrustSource { Registry, LocalBootstrap, Manual };

std::string_view trustStatusToString(TrustStatus status) noexcept;
std::optional<TrustStatus> trustStatusFromString(std::string_view name) noexcept;
std::string_view serverTierToString(ServerTrustTier tier) noexcept;
std::optional<ServerTrustTier> serverTierFromString(
    std::string_view name) noexcept;
std::string_view trustSourceToString(TrustSource source) noexcept;

struct TrustRecord {
  std::string server_id;
  std::string issuer;
  std::string fingerprint;
  TimePoint valid_from{};
  std::optional<TimePoint> valid_to;
  TrustStatus status = TrustStatus::Active;
  bool revoked = false;
  ServerTrustTier trust_tier = ServerTrustTier::Sandbox;
  std::optional<std::string> revocation_reason;
  TrustSource source = TrustSource::Manual;

  [[nodiscard]] bool isRevoked() const noexcept {
    return revoked || status == TrustStatus::Revoked;
  }
};

void to_json(nlohmann::json& j, const TrustRecord& record);

/**
 * @throws nlohmann::json::exception or RegistrySyncError on malformed input
 */
void from_json(const nlohmann::json& j, TrustRecord& record);

/**
 * @brief Key/value persistence for the registry
 */
class RegistryStorage {
 public:
  virtual ~RegistryStorage() = default;

  virtual std::optional<std::string> read(std::string_view key) const = 0;
  virtual void write(std::string_view key, std::string_view value) = 0;
};

/**
 * @brief One file per key, `<directory>/<key>.json`, replaced atomically
 */
class FileRegistryStorage final : public RegistryStorage {
 public:
  explicit FileRegistryStorage(std::filesystem::path directory);

  std::optional<std::string> read(std::string_view key) const override;

  /// @throws IoError / PermissionError on filesystem failure
  void write(std::string_view key, std::string_view value) override;

 private:
  std::filesystem::path pathFor(std::string_view key) const;

  std::filesystem::path directory_;
};

/**
 * @brief Thread-safe map of server id to TrustRecord
 *
 * Records are never deleted; revocation keeps them queryable and is not
 * undone by later upserts.
 */
class TrustRegistry {
 public:
  explicit TrustRegistry(std::shared_ptr<RegistryStorage> storage = nullptr);

  void upsert(TrustRecord record);

  /**
   * @return False if the server is unknown
   */
  bool revoke(std::string_view serverId, std::string reason);

  std::optional<TrustRecord> find(std::string_view serverId) const;
  std::vector<TrustRecord> records() const;
  size_t size() const;

  /**
   * @brief Pull records from `GET <baseUrl>/api/mcp-trust/servers`
   * @return Number of records applied; never throws on remote failure
   */
  TcResult<size_t> syncFromAuthority(const HttpClient& http,
                                     std::string_view baseUrl,
                                     std::chrono::milliseconds timeout);

  /**
   * @brief Trust a well-known loopback server for `window`
   *
   * Only for ids in LOCAL_BOOTSTRAP_SERVERS and loopback URLs; an existing
   * record is left alone unless it is an expired bootstrap record.
   *
   * @return True if a record was created or refreshed
   */
  bool bootstrapLocal(std::string_view serverId, std::string_view url,
                      TimePoint now, std::chrono::hours window);

  /**
   * @brief Replace in-memory records with the persisted ones
   * @return Records loaded; 0 when nothing is stored or the data is malformed
   */
  size_t load();

  /// @throws IoError / PermissionError from the storage backend
  void save() const;

 private:
  void upsertLocked(TrustRecord record);

  std::shared_ptr<RegistryStorage> storage_;
  mutable std::mutex mutex_;
  std::map<std::string, TrustRecord, std::less<>> records_;
};

/**
 * @brief Parse a registry document: {"servers": [...]} or a bare array;
 * malformed entries are skipped
 */
std::vector<TrustRecord> parseTrustRecords(const nlohmann::json& document);

}  // namespace trustchain
