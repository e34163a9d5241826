// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/naming/path_resolver.h>
#include <namesmith/naming/sanitizer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace namesmith::naming {

namespace fs = std::filesystem;

namespace {

fs::path normalizeBase(const fs::path& base) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(base.empty() ? fs::path(".") : base, ec);
    if (ec) {
        ec.clear();
        p = fs::absolute(base, ec);
        if (ec)
            p = base;
    }
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path())
        p = p.parent_path();
    return p;
}

bool isPrefixOf(const fs::path& root, const fs::path& path) {
    auto rootEnd = root.end();
    // A trailing separator shows up as an empty final element.
    if (!root.empty() && root.filename().empty())
        --rootEnd;
    return std::mismatch(root.begin(), rootEnd, path.begin(), path.end()).first == rootEnd;
}

std::size_t pruneEmpty(const fs::path& dir, int depth, int maxDepth) {
    if (depth >= maxDepth)
        return 0;
    std::size_t removed = 0;
    std::error_code ec;
    std::vector<fs::path> children;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc) && !it->is_symlink(typeEc))
            children.push_back(it->path());
    }
    if (ec) {
        spdlog::debug("Skipping {} while pruning: {}", dir.string(), ec.message());
        return 0;
    }
    for (const auto& child : children) {
        removed += pruneEmpty(child, depth + 1, maxDepth);
        std::error_code rmEc;
        if (fs::is_empty(child, rmEc) && !rmEc && fs::remove(child, rmEc))
            ++removed;
    }
    return removed;
}

} // namespace

std::vector<std::string> splitFolderSpec(std::string_view spec) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= spec.size()) {
        const auto pos = spec.find_first_of("/\\", start);
        const auto part =
            pos == std::string_view::npos ? spec.substr(start) : spec.substr(start, pos - start);
        if (part == "..") {
            segments.emplace_back(part);
        } else if (!part.empty() && part != ".") {
            auto clean = sanitizeSegment(part);
            if (!clean.empty())
                segments.push_back(std::move(clean));
        }
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return segments;
}

fs::path joinFolderSpec(const fs::path& base, std::string_view spec) {
    fs::path out = base;
    for (const auto& segment : splitFolderSpec(spec))
        out /= segment;
    out = out.lexically_normal();
    if (!out.has_filename() && out.has_parent_path() && out != out.root_path())
        out = out.parent_path();
    return out;
}

PathResolver::PathResolver(Config config)
    : config_(std::move(config)), base_(normalizeBase(config_.baseDirectory)) {}

fs::path PathResolver::resolveDirectory(std::string_view folderSpec) const {
    fs::path dir = joinFolderSpec(base_, folderSpec);
    if (!config_.allowParentEscape && !isWithinBase(dir)) {
        spdlog::warn("Folder '{}' escapes the output directory {}; using the output directory",
                     folderSpec, base_.string());
        return base_;
    }
    return dir;
}

Result<void> PathResolver::ensureExists(const fs::path& dir) const {
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return {};
    if (fs::exists(dir, ec)) {
        return Error{ErrorCode::InvalidArgument, dir.string() + " exists and is not a directory"};
    }
    fs::create_directories(dir, ec);
    if (ec) {
        ErrorCode code = ErrorCode::IOError;
        if (ec == std::errc::permission_denied)
            code = ErrorCode::PermissionDenied;
        else if (ec == std::errc::no_space_on_device)
            code = ErrorCode::StorageFull;
        else if (ec == std::errc::not_a_directory || ec == std::errc::file_exists)
            code = ErrorCode::InvalidArgument;
        return Error{code, "Cannot create " + dir.string() + ": " + ec.message()};
    }
    return {};
}

fs::path PathResolver::createOutputPath(std::string_view folderSpec) const {
    fs::path dir = resolveDirectory(folderSpec);
    if (auto created = ensureExists(dir); !created) {
        spdlog::warn("{}; falling back to {}", created.error().message, base_.string());
        if (auto base = ensureExists(base_); !base) {
            spdlog::warn("Cannot create base output directory {}: {}", base_.string(),
                         base.error().message);
        }
        return base_;
    }
    return dir;
}

bool PathResolver::isWithinBase(const fs::path& path) const {
    fs::path candidate = path.is_absolute() ? path : base_ / path;
    return isPrefixOf(base_, candidate.lexically_normal());
}

std::string PathResolver::subfolderOf(const fs::path& filePath) const {
    const fs::path parent = filePath.lexically_normal().parent_path();
    if (!isWithinBase(parent))
        return {};
    const fs::path rel = parent.lexically_relative(base_);
    if (rel.empty() || rel == ".")
        return {};
    return rel.generic_string();
}

std::optional<std::uintmax_t> PathResolver::availableSpace() const {
    std::error_code ec;
    const auto info = fs::space(base_, ec);
    if (ec)
        return std::nullopt;
    return info.available;
}

std::size_t PathResolver::removeEmptyDirectories(int maxDepth) const {
    return pruneEmpty(base_, 0, maxDepth);
}

} // namespace namesmith::naming
