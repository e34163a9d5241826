// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/naming/name_builder.h>
#include <namesmith/naming/sanitizer.h>
#include <namesmith/pipeline/save_pipeline.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <system_error>

namespace namesmith::pipeline {

namespace fs = std::filesystem;

namespace {

// Existing files skipped per image before the claim gives up.
constexpr int kMaxClaimAttempts = 1000;

std::unique_ptr<naming::PathResolver> makePathResolver(const config::SaveConfig& config) {
    return std::make_unique<naming::PathResolver>(
        naming::PathResolver::Config{config.baseOutputDirectory, config.allowParentEscape});
}

} // namespace

SavePipeline::SavePipeline(config::SaveConfig config, std::shared_ptr<IImageEncoder> encoder)
    : config_(std::move(config)), filenameTemplate_(config_.filenameTokens()),
      foldernameTemplate_(config_.foldernameTokens()), encoder_(std::move(encoder)),
      paths_(makePathResolver(config_)) {}

NamePlan SavePipeline::planNames(const naming::ParameterTree& tree, TimePoint when) const {
    NamePlan plan;
    plan.baseName =
        naming::buildName(filenameTemplate_, resolver_.resolve(filenameTemplate_, tree, when),
                          config_.filenamePrefix, config_.delimiter);

    if (!foldernameTemplate_.empty() || !config_.foldernamePrefix.empty()) {
        plan.folderSpec = naming::buildName(foldernameTemplate_,
                                            resolver_.resolve(foldernameTemplate_, tree, when),
                                            config_.foldernamePrefix, config_.delimiter);
    }

    // Path markers in the file name template put the file in a subfolder.
    if (const auto slash = plan.baseName.rfind(naming::kPathSeparator);
        slash != std::string::npos) {
        const std::string dirPart = plan.baseName.substr(0, slash);
        std::string leaf = naming::sanitizeSegment(plan.baseName.substr(slash + 1));
        plan.folderSpec = plan.folderSpec.empty()
                              ? dirPart
                              : plan.folderSpec + naming::kPathSeparator + dirPart;
        plan.baseName = leaf.empty() ? std::string(naming::kDefaultName) : std::move(leaf);
    }
    return plan;
}

SavePipeline::Target SavePipeline::prepareTarget(const naming::ParameterTree& tree,
                                                 TimePoint when) {
    auto plan = planNames(tree, when);
    return Target{paths_->createOutputPath(plan.folderSpec), std::move(plan.baseName)};
}

Result<SavedImage> SavePipeline::claim(const Target& target) {
    naming::CounterQuery query;
    query.directory = target.directory;
    query.digits = config_.counterDigits;
    query.position = config_.counterPosition;
    query.extension = config_.extension;
    query.prefix = target.baseName;
    query.delimiter = config_.delimiter;
    query.perDirectory = config_.perDirectoryCounter;

    SavedImage saved;
    for (int attempt = 0; attempt < kMaxClaimAttempts; ++attempt) {
        saved.counter = counters_.getNext(query);
        saved.filename =
            naming::buildFilename(target.baseName, saved.counter, config_.counterDigits,
                                  config_.counterPosition, config_.extension, config_.delimiter);
        saved.path = target.directory / saved.filename;
        std::error_code ec;
        if (!fs::exists(saved.path, ec) && !ec) {
            saved.subfolder = paths_->subfolderOf(saved.path);
            return saved;
        }
        // Written by someone else since the directory was scanned.
        spdlog::debug("{} already exists, taking the next counter", saved.path.string());
    }
    return Error{ErrorCode::WriteError,
                 fmt::format("No free file name for '{}' in {} after {} attempts",
                             target.baseName, target.directory.string(), kMaxClaimAttempts)};
}

Result<std::vector<SavedImage>> SavePipeline::save(const std::vector<DecodedImage>& images,
                                                   const naming::ParameterTree& tree,
                                                   const nlohmann::json& metadata,
                                                   TimePoint when) {
    std::vector<SavedImage> saved;
    if (images.empty())
        return saved;
    if (!encoder_)
        return Error{ErrorCode::NotSupported, "No image encoder configured"};

    const Target target = prepareTarget(tree, when);
    const nlohmann::json emptyMetadata = nlohmann::json::object();
    const nlohmann::json& passMetadata = config_.saveMetadata ? metadata : emptyMetadata;

    saved.reserve(images.size());
    for (const auto& image : images) {
        auto claimed = claim(target);
        if (!claimed) {
            spdlog::error("{}", claimed.error().message);
            return claimed.error();
        }
        auto entry = std::move(claimed).value();
        if (auto written = encoder_->encode(image, entry.path, passMetadata, config_.quality);
            !written) {
            spdlog::error("Failed to write {}: {}", entry.path.string(),
                          written.error().message);
            return written.error();
        }
        spdlog::debug("Saved {}", entry.path.string());
        saved.push_back(std::move(entry));
    }
    return saved;
}

Result<std::vector<SavedImage>> SavePipeline::reserve(std::size_t count,
                                                      const naming::ParameterTree& tree,
                                                      TimePoint when) {
    std::vector<SavedImage> reserved;
    if (count == 0)
        return reserved;
    const Target target = prepareTarget(tree, when);
    reserved.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto claimed = claim(target);
        if (!claimed)
            return claimed.error();
        reserved.push_back(std::move(claimed).value());
    }
    return reserved;
}

SavePreview SavePipeline::preview(const naming::ParameterTree& tree, std::uint64_t counter,
                                  TimePoint when) const {
    const auto plan = planNames(tree, when);
    SavePreview out;
    out.folderPath = paths_->resolveDirectory(plan.folderSpec);
    out.filePath = out.folderPath / naming::buildFilename(plan.baseName, counter,
                                                          config_.counterDigits,
                                                          config_.counterPosition,
                                                          config_.extension, config_.delimiter);
    return out;
}

void SavePipeline::clearCaches() {
    counters_.invalidateAll();
}

void SavePipeline::updateConfig(config::SaveConfig config) {
    config_ = std::move(config);
    filenameTemplate_ = config_.filenameTokens();
    foldernameTemplate_ = config_.foldernameTokens();
    paths_ = makePathResolver(config_);
    clearCaches();
}

} // namespace namesmith::pipeline
