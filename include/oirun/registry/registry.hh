#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <oirun/command_runner.hh>
#include <oirun/language.hh>
#include <oirun/registry/candidate_scanner.hh>
#include <oirun/registry/compiler.hh>
#include <oirun/registry/detection_cache.hh>
#include <optional>
#include <vector>

namespace oirun::registry {

struct RegistryOptions {
    std::chrono::nanoseconds ttl = std::chrono::hours{24};
    std::chrono::nanoseconds probe_timeout = std::chrono::seconds{10};
    std::function<std::chrono::system_clock::time_point()> now = [] {
        return std::chrono::system_clock::now();
    };
};

/**
 * Discovers compilers on the host and caches the result in memory and in a
 * persisted store. The in-memory result is owned by the registry, callers
 * always receive copies. Scans are serialized.
 */
class Registry {
public:
    Registry(
        CandidateScanner& scanner,
        CommandRunner& runner,
        DetectionCacheStore& store,
        RegistryOptions options = {}
    )
    : scanner_(scanner)
    , runner_(runner)
    , store_(store)
    , options_(std::move(options)) {}

    Registry(const Registry&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry& operator=(Registry&&) = delete;
    ~Registry() = default;

    /**
     * @brief Returns the compilers available on the host
     * @details Without @p force_rescan the in-memory result is returned, then
     *   a persisted one of the current schema version younger than the TTL.
     *   Otherwise a scan is performed and both caches are replaced.
     *   A failing scan yields success = false with suggestions, it is not
     *   cached.
     */
    DetectionResult detect(bool force_rescan = false);

    // Drops both the in-memory and the persisted result
    void clear_cache();

    // Compilers able to build @p lang, best first
    std::vector<CompilerDescriptor> filter_suitable(Language lang);

private:
    [[nodiscard]] bool is_fresh(const DetectionResult& res) const;

    DetectionResult scan();

    std::optional<DetectionResult> probe_all(const std::vector<std::string>& paths);

    CandidateScanner& scanner_;
    CommandRunner& runner_;
    DetectionCacheStore& store_;
    RegistryOptions options_;
    std::mutex mutex_;
    std::optional<DetectionResult> cached_;
};

// Kinds able to build @p lang
bool is_suitable(Kind kind, Language lang) noexcept;

} // namespace oirun::registry
