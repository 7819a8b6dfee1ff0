#pragma once

#include <mutex>
#include <oirun/registry/compiler.hh>
#include <oirun/sqlite.hh>
#include <optional>
#include <string>
#include <string_view>

namespace oirun::registry {

constexpr std::string_view cache_key = "oicode.cachedCompilers";
constexpr std::string_view cache_schema_version = "1.0";

// JSON record: {version, timestamp, success, compilers, recommended, suggestions, errors}
std::string serialize_detection_result(const DetectionResult& res);

// std::nullopt if @p json is not a well-formed record
std::optional<DetectionResult> parse_detection_result(std::string_view json);

// Persisted home of the detection result. Implementations replace the
// record wholesale, a reader never sees a partially written one.
class DetectionCacheStore {
public:
    DetectionCacheStore() = default;
    DetectionCacheStore(const DetectionCacheStore&) = delete;
    DetectionCacheStore(DetectionCacheStore&&) = delete;
    DetectionCacheStore& operator=(const DetectionCacheStore&) = delete;
    DetectionCacheStore& operator=(DetectionCacheStore&&) = delete;
    virtual ~DetectionCacheStore() = default;

    // Stored record regardless of its age and version, std::nullopt if there
    // is none or it is unreadable
    virtual std::optional<DetectionResult> load() = 0;

    virtual void store(const DetectionResult& res) = 0;

    virtual void clear() = 0;
};

class MemoryCacheStore final : public DetectionCacheStore {
    std::mutex mutex_;
    std::optional<std::string> record_;

public:
    std::optional<DetectionResult> load() override;

    void store(const DetectionResult& res) override;

    void clear() override;
};

// Single key-value table in an SQLite database
class SqliteCacheStore final : public DetectionCacheStore {
    std::mutex mutex_;
    SQLite::Connection db_;

public:
    // Creates the database file and its parent directories if needed
    explicit SqliteCacheStore(const std::string& db_path);

    std::optional<DetectionResult> load() override;

    void store(const DetectionResult& res) override;

    void clear() override;
};

} // namespace oirun::registry
