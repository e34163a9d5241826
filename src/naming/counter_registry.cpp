// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/naming/counter_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <regex>
#include <system_error>

namespace namesmith::naming {

namespace fs = std::filesystem;

namespace {

std::string escapeRegex(std::string_view text) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (kSpecial.find(c) != std::string_view::npos)
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// "<prefix>...<delim><digits><ext>" or "<digits><delim><prefix>...<ext>".
std::regex buildCounterPattern(const CounterQuery& query) {
    const std::string digits = "(\\d{" + std::to_string(std::max(query.digits, 1)) + "})";
    const std::string prefix = query.perDirectory ? std::string{} : escapeRegex(query.prefix);
    const std::string ext = escapeRegex(query.extension);
    const std::string delim = escapeRegex(query.delimiter);

    std::string pattern;
    if (query.position == CounterPosition::Last) {
        // Without a delimiter the digit run must still be exactly query.digits long.
        const std::string gap = query.delimiter.empty() ? "(?:.*\\D)?" : ".*" + delim;
        pattern = prefix + gap + digits + ext;
    } else {
        const std::string gap = query.delimiter.empty() ? "(?!\\d)" : delim;
        pattern = digits + gap + prefix + ".*" + ext;
    }
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

ErrorCode classifyFsError(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        return ErrorCode::PermissionDenied;
    return ErrorCode::IOError;
}

} // namespace

std::string ScopeKey::toString() const {
    return directory + "|" + counterPositionToString(position) + "|" + extension + "|" +
           (perDirectory ? std::string("global") : "prefix:" + prefix);
}

std::string normalizeDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::path normal = fs::weakly_canonical(dir, ec);
    if (ec) {
        ec.clear();
        normal = fs::absolute(dir, ec);
        if (ec)
            normal = dir;
        normal = normal.lexically_normal();
    }
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path())
        normal = normal.parent_path();
    return normal.string();
}

ScopeKey makeScopeKey(const CounterQuery& query) {
    ScopeKey key;
    key.directory = normalizeDirectory(query.directory);
    key.position = query.position;
    key.extension = query.extension;
    key.perDirectory = query.perDirectory;
    if (!query.perDirectory)
        key.prefix = query.prefix;
    return key;
}

Result<std::uint64_t> findMaxCounter(const CounterQuery& query) {
    std::error_code ec;
    if (!fs::exists(query.directory, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory)
            return Error{classifyFsError(ec), "Cannot stat " + query.directory.string() + ": " +
                                                  ec.message()};
        return std::uint64_t{0};
    }

    fs::directory_iterator it(query.directory, ec);
    if (ec) {
        return Error{classifyFsError(ec),
                     "Cannot list " + query.directory.string() + ": " + ec.message()};
    }

    const std::regex pattern = buildCounterPattern(query);
    std::uint64_t maxCounter = 0;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        const std::string name = it->path().filename().string();
        std::smatch match;
        if (!std::regex_match(name, match, pattern))
            continue;
        const auto digits = match[1].str();
        std::uint64_t value = 0;
        auto [ptr, err] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (err == std::errc{} && ptr == digits.data() + digits.size())
            maxCounter = std::max(maxCounter, value);
    }
    if (ec) {
        return Error{classifyFsError(ec),
                     "Error while listing " + query.directory.string() + ": " + ec.message()};
    }
    return maxCounter;
}

CounterRegistry::CounterRegistry() : CounterRegistry(Config{}) {}

CounterRegistry::CounterRegistry(Config config) : config_(config) {}

std::uint64_t CounterRegistry::scanSeed(const CounterQuery& query) {
    scans_.fetch_add(1, std::memory_order_relaxed);
    auto result = findMaxCounter(query);
    if (!result) {
        spdlog::warn("Counter scan failed, starting from 1: {}", result.error().message);
        return 1;
    }
    return result.value() + 1;
}

std::shared_ptr<CounterRegistry::Slot> CounterRegistry::slotFor(const ScopeKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[key];
    if (!slot)
        slot = std::make_shared<Slot>();
    return slot;
}

std::uint64_t CounterRegistry::getNext(const CounterQuery& query) {
    if (!cacheEnabled()) {
        std::lock_guard<std::mutex> lock(uncachedMutex_);
        return scanSeed(query);
    }

    const ScopeKey key = makeScopeKey(query);
    auto slot = slotFor(key);

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->next) {
        slot->next = scanSeed(query);
        spdlog::debug("Counter scope {} seeded at {}", key.toString(), *slot->next);
    }
    return (*slot->next)++;
}

void CounterRegistry::preload(const std::vector<fs::path>& directories, const CounterQuery& query) {
    if (!cacheEnabled())
        return;
    for (const auto& dir : directories) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec))
            continue;
        CounterQuery scoped = query;
        scoped.directory = dir;
        auto slot = slotFor(makeScopeKey(scoped));
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!slot->next)
            slot->next = scanSeed(scoped);
    }
}

void CounterRegistry::invalidate(const ScopeKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.erase(key);
}

void CounterRegistry::invalidateAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
}

std::size_t CounterRegistry::invalidateDirectory(const fs::path& dir) {
    const fs::path root(normalizeDirectory(dir));
    std::lock_guard<std::mutex> lock(mutex_);
    return std::erase_if(slots_, [&](const auto& entry) {
        const fs::path scoped(entry.first.directory);
        return std::mismatch(root.begin(), root.end(), scoped.begin(), scoped.end()).first ==
               root.end();
    });
}

void CounterRegistry::setCacheEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.cacheEnabled = enabled;
    if (!enabled)
        slots_.clear();
}

bool CounterRegistry::cacheEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.cacheEnabled;
}

CounterStats CounterRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CounterStats stats;
    stats.cacheSize = slots_.size();
    stats.cacheEnabled = config_.cacheEnabled;
    stats.directoryScans = scans_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace namesmith::naming
