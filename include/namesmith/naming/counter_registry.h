// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <namesmith/core/types.h>
#include <namesmith/naming/name_builder.h>

#include <atomic>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace namesmith::naming {

// Everything needed to find the next free counter in one directory.
struct CounterQuery {
    std::filesystem::path directory;
    int digits = 4;
    CounterPosition position = CounterPosition::Last;
    std::string extension = ".webp";
    std::string prefix;          // Only part of the scope when perDirectory is false
    std::string delimiter = "-"; // Separates the counter from the rest of the name
    bool perDirectory = true;
};

// Identity of one counter series.
struct ScopeKey {
    std::string directory; // Normalized absolute path
    CounterPosition position = CounterPosition::Last;
    std::string extension;
    std::string prefix; // Empty for per-directory scopes
    bool perDirectory = true;

    auto operator<=>(const ScopeKey&) const = default;

    std::string toString() const;
};

struct CounterStats {
    std::size_t cacheSize = 0;
    bool cacheEnabled = true;
    std::uint64_t directoryScans = 0;
};

/**
 * @brief Absolute, lexically normal form of @p dir with symlinks resolved where the path
 * exists. Never throws.
 */
[[nodiscard]] std::string normalizeDirectory(const std::filesystem::path& dir);

[[nodiscard]] ScopeKey makeScopeKey(const CounterQuery& query);

/**
 * @brief Highest counter already used in the query's directory.
 *
 * A file counts when it ends in the extension, has exactly query.digits digits at the
 * counter position separated by the delimiter, and (for per-prefix scopes) carries the
 * prefix on the name side of the counter. A missing directory yields 0.
 *
 * @return ErrorCode::PermissionDenied or ErrorCode::IOError when the directory cannot be
 * listed.
 */
[[nodiscard]] Result<std::uint64_t> findMaxCounter(const CounterQuery& query);

/**
 * @brief Hands out sequential counters per scope, seeded once from a directory scan.
 *
 * The first query for a scope scans its directory and caches max + 1; later queries return
 * the cached value and advance it. Scanning and seeding hold a per-scope lock, so
 * concurrent first queries for the same scope never see the same seed. Counters are not
 * coordinated across processes.
 */
class CounterRegistry {
public:
    struct Config {
        bool cacheEnabled = true; // When false every query rescans its directory
    };

    CounterRegistry();
    explicit CounterRegistry(Config config);

    CounterRegistry(const CounterRegistry&) = delete;
    CounterRegistry& operator=(const CounterRegistry&) = delete;

    /**
     * @brief Claim the next counter for the query's scope.
     *
     * Directory read failures are logged and treated as an empty directory.
     */
    std::uint64_t getNext(const CounterQuery& query);

    /**
     * @brief Seed scopes for existing directories without consuming a counter.
     *
     * Each directory is combined with the other fields of @p query.
     */
    void preload(const std::vector<std::filesystem::path>& directories, const CounterQuery& query);

    void invalidate(const ScopeKey& key);
    void invalidateAll();
    // Drops every scope whose directory is @p dir or lies below it; returns the count.
    std::size_t invalidateDirectory(const std::filesystem::path& dir);

    void setCacheEnabled(bool enabled);
    bool cacheEnabled() const;

    CounterStats stats() const;

private:
    struct Slot {
        std::mutex mutex;
        std::optional<std::uint64_t> next;
    };

    std::shared_ptr<Slot> slotFor(const ScopeKey& key);
    std::uint64_t scanSeed(const CounterQuery& query);

    Config config_;
    mutable std::mutex mutex_;
    std::map<ScopeKey, std::shared_ptr<Slot>> slots_;
    std::mutex uncachedMutex_;
    std::atomic<std::uint64_t> scans_{0};
};

} // namespace namesmith::naming
