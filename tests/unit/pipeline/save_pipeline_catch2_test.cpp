// Tests for the end-to-end save flow with a recording encoder.

#include <catch2/catch_test_macros.hpp>

#include <namesmith/pipeline/save_pipeline.h>

#include <spdlog/fmt/fmt.h>

#include <mutex>
#include <set>
#include <thread>

#include "../../common/test_helpers_catch2.h"

namespace fs = std::filesystem;

using namesmith::Error;
using namesmith::ErrorCode;
using namesmith::Result;
using namesmith::config::SaveConfig;
using namesmith::naming::ParameterTree;
using namesmith::pipeline::DecodedImage;
using namesmith::pipeline::IImageEncoder;
using namesmith::pipeline::SavedImage;
using namesmith::pipeline::SavePipeline;
using namesmith::test::TempDir;

namespace {

const auto kWhen = namesmith::test::local_time(2024, 6, 15, 12, 0, 0);

// Writes a small placeholder file per image and records what it was given.
class RecordingEncoder : public IImageEncoder {
public:
    Result<void> encode(const DecodedImage& image, const fs::path& path,
                        const nlohmann::json& metadata, int quality) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        if (failAt_ != 0 && calls_ == failAt_)
            return Error{ErrorCode::StorageFull, "No space left on device"};
        namesmith::test::write_file(path, std::string(image.pixels.begin(), image.pixels.end()));
        lastMetadata_ = metadata;
        lastQuality_ = quality;
        return {};
    }

    void failOnCall(int n) { failAt_ = n; }
    int calls() const { return calls_; }
    const nlohmann::json& lastMetadata() const { return lastMetadata_; }
    int lastQuality() const { return lastQuality_; }

private:
    std::mutex mutex_;
    int calls_ = 0;
    int failAt_ = 0;
    nlohmann::json lastMetadata_;
    int lastQuality_ = 0;
};

ParameterTree workflow() {
    return ParameterTree::parse(R"({
        "3": {"inputs": {"sampler_name": "euler", "steps": 20, "seed": 5}},
        "4": {"inputs": {"ckpt_name": "sd_xl_base_1.0.safetensors"}}
    })");
}

std::vector<DecodedImage> images(std::size_t n) {
    DecodedImage img;
    img.width = 2;
    img.height = 1;
    img.channels = 3;
    img.pixels = {1, 2, 3, 4, 5, 6};
    return std::vector<DecodedImage>(n, img);
}

SaveConfig testConfig(const fs::path& base) {
    SaveConfig config;
    config.baseOutputDirectory = base;
    config.filenamePrefix = "Test";
    config.filenameTemplate = "sampler_name, steps";
    config.foldernameTemplate = "";
    config.delimiter = "_";
    return config;
}

std::vector<std::string> filenames(const std::vector<SavedImage>& saved) {
    std::vector<std::string> names;
    for (const auto& s : saved)
        names.push_back(s.filename);
    return names;
}

} // namespace

TEST_CASE("SavePipeline - single image lands in the base directory",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    auto encoder = std::make_shared<RecordingEncoder>();
    SavePipeline pipeline(testConfig(tmp.path()), encoder);

    auto saved = pipeline.save(images(1), workflow(), {{"prompt", "cat"}}, kWhen);
    REQUIRE(saved);
    REQUIRE(saved.value().size() == 1);
    const auto& first = saved.value().front();
    CHECK(first.filename == "Test_euler_20_0001.webp");
    CHECK(first.subfolder.empty());
    CHECK(first.counter == 1);
    CHECK(first.path == pipeline.paths().baseDirectory() / "Test_euler_20_0001.webp");
    CHECK(fs::exists(first.path));
    CHECK(encoder->lastMetadata().at("prompt") == "cat");
    CHECK(encoder->lastQuality() == 75);
}

TEST_CASE("SavePipeline - every image in a batch gets its own counter",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    auto encoder = std::make_shared<RecordingEncoder>();
    SavePipeline pipeline(testConfig(tmp.path()), encoder);

    auto batch = pipeline.save(images(3), workflow(), {}, kWhen);
    REQUIRE(batch);
    CHECK(filenames(batch.value()) ==
          std::vector<std::string>{"Test_euler_20_0001.webp", "Test_euler_20_0002.webp",
                                   "Test_euler_20_0003.webp"});

    auto next = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE(next);
    CHECK(next.value().front().filename == "Test_euler_20_0004.webp");
}

TEST_CASE("SavePipeline - counting resumes from files on disk", "[pipeline][save][catch2]") {
    TempDir tmp;
    namesmith::test::write_file(tmp.path() / "Test_euler_20_0041.webp", "old");
    SavePipeline pipeline(testConfig(tmp.path()), std::make_shared<RecordingEncoder>());

    auto saved = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE(saved);
    CHECK(saved.value().front().counter == 42);
}

TEST_CASE("SavePipeline - folder template selects the subfolder", "[pipeline][save][catch2]") {
    TempDir tmp;
    auto config = testConfig(tmp.path());
    config.foldernameTemplate = "ckpt_name";
    SavePipeline pipeline(config, std::make_shared<RecordingEncoder>());

    auto saved = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE(saved);
    const auto& entry = saved.value().front();
    CHECK(entry.subfolder == "sd_xl_base_1.0");
    CHECK(fs::is_directory(pipeline.paths().baseDirectory() / "sd_xl_base_1.0"));
    CHECK(entry.filename == "Test_euler_20_0001.webp");
}

TEST_CASE("SavePipeline - folder template with date and marker", "[pipeline][save][catch2]") {
    TempDir tmp;
    auto config = testConfig(tmp.path());
    config.foldernameTemplate = "%Y-%m-%d, ./ckpt_name";
    SavePipeline pipeline(config, std::make_shared<RecordingEncoder>());

    auto plan = pipeline.planNames(workflow(), kWhen);
    CHECK(plan.folderSpec == "2024-06-15/ckpt_name");

    auto saved = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE(saved);
    CHECK(saved.value().front().subfolder == "2024-06-15/ckpt_name");
}

TEST_CASE("SavePipeline - path marker in the file name moves the file into a folder",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    auto config = testConfig(tmp.path());
    config.filenameTemplate = "sampler_name, ./grid, seed";
    config.delimiter = "-";
    SavePipeline pipeline(config, std::make_shared<RecordingEncoder>());

    auto plan = pipeline.planNames(workflow(), kWhen);
    CHECK(plan.baseName == "grid-5");
    CHECK(plan.folderSpec == "Test-euler");

    auto saved = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE(saved);
    CHECK(saved.value().front().subfolder == "Test-euler");
    CHECK(saved.value().front().filename == "grid-5-0001.webp");
}

TEST_CASE("SavePipeline - folders cannot escape the output directory",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    auto config = testConfig(tmp.path() / "out");
    config.foldernamePrefix = "x/../../elsewhere";
    SavePipeline pipeline(config, std::make_shared<RecordingEncoder>());

    auto saved = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE(saved);
    CHECK(saved.value().front().subfolder.empty());
    CHECK_FALSE(fs::exists(tmp.path() / "elsewhere"));
}

TEST_CASE("SavePipeline - encoder failure aborts the event", "[pipeline][save][catch2]") {
    TempDir tmp;
    auto encoder = std::make_shared<RecordingEncoder>();
    encoder->failOnCall(2);
    SavePipeline pipeline(testConfig(tmp.path()), encoder);

    auto saved = pipeline.save(images(3), workflow(), {}, kWhen);
    REQUIRE_FALSE(saved);
    CHECK(saved.error().code == ErrorCode::StorageFull);
    CHECK(encoder->calls() == 2);
    CHECK(fs::exists(pipeline.paths().baseDirectory() / "Test_euler_20_0001.webp"));
    CHECK_FALSE(fs::exists(pipeline.paths().baseDirectory() / "Test_euler_20_0003.webp"));
}

TEST_CASE("SavePipeline - metadata is withheld when disabled", "[pipeline][save][catch2]") {
    TempDir tmp;
    auto encoder = std::make_shared<RecordingEncoder>();
    auto config = testConfig(tmp.path());
    config.saveMetadata = false;
    config.quality = 95;
    SavePipeline pipeline(config, encoder);

    REQUIRE(pipeline.save(images(1), workflow(), {{"prompt", "cat"}}, kWhen));
    CHECK(encoder->lastMetadata().empty());
    CHECK(encoder->lastQuality() == 95);
}

TEST_CASE("SavePipeline - empty batches and missing encoders", "[pipeline][save][catch2]") {
    TempDir tmp;

    SavePipeline withEncoder(testConfig(tmp.path()), std::make_shared<RecordingEncoder>());
    auto none = withEncoder.save({}, workflow(), {}, kWhen);
    REQUIRE(none);
    CHECK(none.value().empty());

    SavePipeline noEncoder(testConfig(tmp.path()), nullptr);
    auto failed = noEncoder.save(images(1), workflow(), {}, kWhen);
    REQUIRE_FALSE(failed);
    CHECK(failed.error().code == ErrorCode::NotSupported);
}

TEST_CASE("SavePipeline - files written behind the cache are skipped",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    SavePipeline pipeline(testConfig(tmp.path()), std::make_shared<RecordingEncoder>());

    REQUIRE(pipeline.save(images(1), workflow(), {}, kWhen));
    namesmith::test::write_file(pipeline.paths().baseDirectory() / "Test_euler_20_0002.webp",
                                "other process");

    auto saved = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE(saved);
    CHECK(saved.value().front().filename == "Test_euler_20_0003.webp");
}

TEST_CASE("SavePipeline - claiming gives up when every candidate name is taken",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    auto encoder = std::make_shared<RecordingEncoder>();
    SavePipeline pipeline(testConfig(tmp.path()), encoder);

    REQUIRE(pipeline.save(images(1), workflow(), {}, kWhen));
    const auto dir = pipeline.paths().baseDirectory();
    for (int counter = 2; counter <= 1001; ++counter) {
        namesmith::test::write_file(dir / fmt::format("Test_euler_20_{:04d}.webp", counter),
                                    "other process");
    }

    auto saved = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE_FALSE(saved);
    CHECK(saved.error().code == ErrorCode::WriteError);
    CHECK(encoder->calls() == 1);

    auto reserved = pipeline.reserve(1, workflow(), kWhen);
    REQUIRE(reserved);
    CHECK(reserved.value().front().counter == 1002);
}

TEST_CASE("SavePipeline - preview touches nothing", "[pipeline][preview][catch2]") {
    TempDir tmp;
    auto config = testConfig(tmp.path());
    config.foldernameTemplate = "ckpt_name";
    SavePipeline pipeline(config, nullptr);

    const auto out = pipeline.preview(workflow(), 7, kWhen);
    CHECK(out.folderPath == pipeline.paths().baseDirectory() / "sd_xl_base_1.0");
    CHECK(out.filePath == out.folderPath / "Test_euler_20_0007.webp");
    CHECK_FALSE(fs::exists(out.folderPath));
    CHECK(pipeline.counters().stats().cacheSize == 0);
}

TEST_CASE("SavePipeline - reserve claims counters without writing",
          "[pipeline][reserve][catch2]") {
    TempDir tmp;
    SavePipeline pipeline(testConfig(tmp.path()), nullptr);

    auto reserved = pipeline.reserve(3, workflow(), kWhen);
    REQUIRE(reserved);
    REQUIRE(reserved.value().size() == 3);
    CHECK(reserved.value()[0].counter == 1);
    CHECK(reserved.value()[2].counter == 3);
    CHECK_FALSE(fs::exists(reserved.value()[0].path));

    auto none = pipeline.reserve(0, workflow(), kWhen);
    REQUIRE(none);
    CHECK(none.value().empty());
}

TEST_CASE("SavePipeline - preview leaves a missing output directory alone",
          "[pipeline][preview][catch2]") {
    TempDir tmp;
    const fs::path base = tmp.path() / "out";
    SavePipeline pipeline(testConfig(base), nullptr);

    const auto out = pipeline.preview(workflow(), 1, kWhen);
    CHECK(out.filePath.filename() == "Test_euler_20_0001.webp");
    CHECK_FALSE(fs::exists(base));
}

TEST_CASE("SavePipeline - control characters in values still give distinct files",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    auto encoder = std::make_shared<RecordingEncoder>();
    SavePipeline pipeline(testConfig(tmp.path()), encoder);
    const auto tree =
        ParameterTree::parse(R"({"3": {"inputs": {"sampler_name": "eu\u0000ler", "steps": 20}}})");

    auto saved = pipeline.save(images(2), tree, {}, kWhen);
    REQUIRE(saved);
    CHECK(filenames(saved.value()) ==
          std::vector<std::string>{"Test_eu_ler_20_0001.webp", "Test_eu_ler_20_0002.webp"});
    for (const auto& entry : saved.value()) {
        CHECK(entry.path.filename().string() == entry.filename);
        CHECK(fs::exists(entry.path));
    }
    CHECK(encoder->calls() == 2);
}

TEST_CASE("SavePipeline - updateConfig switches names and drops counters",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    SavePipeline pipeline(testConfig(tmp.path()), std::make_shared<RecordingEncoder>());
    REQUIRE(pipeline.save(images(2), workflow(), {}, kWhen));
    CHECK(pipeline.counters().stats().cacheSize == 1);

    auto config = testConfig(tmp.path());
    config.extension = ".png";
    config.counterPosition = namesmith::naming::CounterPosition::First;
    pipeline.updateConfig(config);
    CHECK(pipeline.counters().stats().cacheSize == 0);

    auto saved = pipeline.save(images(1), workflow(), {}, kWhen);
    REQUIRE(saved);
    CHECK(saved.value().front().filename == "0001_Test_euler_20.png");
}

TEST_CASE("SavePipeline - concurrent events never share a file name",
          "[pipeline][save][catch2]") {
    TempDir tmp;
    SavePipeline pipeline(testConfig(tmp.path()), std::make_shared<RecordingEncoder>());

    std::mutex namesMutex;
    std::vector<std::string> names;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 10; ++i) {
                auto saved = pipeline.save(images(2), workflow(), {}, kWhen);
                if (!saved)
                    continue;
                std::lock_guard<std::mutex> lock(namesMutex);
                for (const auto& s : saved.value())
                    names.push_back(s.filename);
            }
        });
    }
    for (auto& th : threads)
        th.join();

    REQUIRE(names.size() == 80);
    CHECK(std::set<std::string>(names.begin(), names.end()).size() == 80);
}
