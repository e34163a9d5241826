// Tests for token resolution against a parameter tree.

#include <catch2/catch_test_macros.hpp>

#include <namesmith/naming/parameter_tree.h>
#include <namesmith/naming/template_resolver.h>

#include "../../common/test_helpers_catch2.h"

using namesmith::naming::findFirstKey;
using namesmith::naming::formatDateDirective;
using namesmith::naming::isValidDateDirective;
using namesmith::naming::ParameterTree;
using namesmith::naming::Template;
using namesmith::naming::TemplateResolver;
using namesmith::naming::TokenKind;
using namesmith::naming::valueToString;

namespace {

const auto kWhen = namesmith::test::local_time(2024, 6, 15, 14, 5, 9);

ParameterTree workflowTree() {
    return ParameterTree::parse(R"({
        "3": {"class_type": "KSampler",
              "inputs": {"seed": 42, "steps": 20, "cfg": 7.5, "sampler_name": "euler",
                         "denoise": 1.0, "model": ["4", 0]}},
        "4": {"class_type": "CheckpointLoaderSimple",
              "inputs": {"ckpt_name": "sd_xl_base_1.0.safetensors"}},
        "9": {"class_type": "KSampler",
              "inputs": {"seed": 7, "sampler_name": "dpmpp_2m"}}
    })");
}

} // namespace

TEST_CASE("TemplateResolver - node reference reads node inputs",
          "[naming][resolver][catch2]") {
    TemplateResolver resolver;
    auto tree = ParameterTree::parse(R"({"5":{"inputs":{"seed":42}}})");
    auto values = resolver.resolve(Template::parse("5.seed"), tree, kWhen);
    REQUIRE(values.at("5.seed").has_value());
    CHECK(*values.at("5.seed") == "42");
}

TEST_CASE("TemplateResolver - node reference misses yield nullopt",
          "[naming][resolver][catch2]") {
    TemplateResolver resolver;
    auto tree = workflowTree();
    auto values = resolver.resolve(Template::parse("99.seed, 3.nothing, 4.seed"), tree, kWhen);
    CHECK_FALSE(values.at("99.seed").has_value());
    CHECK_FALSE(values.at("3.nothing").has_value());
    CHECK_FALSE(values.at("4.seed").has_value());
}

TEST_CASE("TemplateResolver - literal deep search returns the first match in order",
          "[naming][resolver][catch2]") {
    TemplateResolver resolver;
    auto tree = workflowTree();
    auto values = resolver.resolve(Template::parse("sampler_name, seed, ckpt_name"), tree, kWhen);
    CHECK(*values.at("sampler_name") == "euler");
    CHECK(*values.at("seed") == "42");
    CHECK(*values.at("ckpt_name") == "sd_xl_base_1.0.safetensors");
}

TEST_CASE("TemplateResolver - a parent key wins over deeper keys", "[naming][resolver][catch2]") {
    auto tree = ParameterTree::parse(R"({"a": {"steps": 5}, "steps": 30})");
    const auto* hit = findFirstKey(tree, "steps");
    REQUIRE(hit != nullptr);
    CHECK(hit->get<int>() == 30);
}

TEST_CASE("TemplateResolver - deep search walks arrays", "[naming][resolver][catch2]") {
    auto tree = ParameterTree::parse(R"({"nodes": [{"x": 1}, {"lora": "detail"}]})");
    const auto* hit = findFirstKey(tree, "lora");
    REQUIRE(hit != nullptr);
    CHECK(valueToString(*hit) == "detail");
    CHECK(findFirstKey(tree, "missing") == nullptr);
}

TEST_CASE("TemplateResolver - value rendering", "[naming][resolver][catch2]") {
    CHECK(valueToString(ParameterTree(20)) == "20");
    CHECK(valueToString(ParameterTree(7.5)) == "7.5");
    CHECK(valueToString(ParameterTree(true)) == "true");
    CHECK(valueToString(ParameterTree("euler")) == "euler");
    CHECK(valueToString(ParameterTree::parse(R"(["4", 0])")) == R"(["4",0])");
    CHECK_FALSE(valueToString(ParameterTree(nullptr)).has_value());
}

TEST_CASE("TemplateResolver - date directives use the event time", "[naming][resolver][catch2]") {
    TemplateResolver resolver;
    auto values = resolver.resolve(Template::parse("%Y, %Y-%m-%d, %H-%M-%S"), {}, kWhen);
    CHECK(*values.at("%Y") == "2024");
    CHECK(*values.at("%Y-%m-%d") == "2024-06-15");
    CHECK(*values.at("%H-%M-%S") == "14-05-09");
}

TEST_CASE("TemplateResolver - invalid date directives resolve to nothing",
          "[naming][resolver][catch2]") {
    CHECK(isValidDateDirective("%Y%m%d_%H%M%S"));
    CHECK(isValidDateDirective("%Ey %Od"));
    CHECK(isValidDateDirective("%%"));
    CHECK_FALSE(isValidDateDirective("%Q"));
    CHECK_FALSE(isValidDateDirective("%Y-%"));
    CHECK_FALSE(isValidDateDirective("%Ez"));

    CHECK_FALSE(formatDateDirective("%Q", kWhen).has_value());

    TemplateResolver resolver;
    auto values = resolver.resolve(Template::parse("%Q"), {}, kWhen);
    CHECK_FALSE(values.at("%Q").has_value());
}

TEST_CASE("TemplateResolver - path markers resolve to their segment",
          "[naming][resolver][catch2]") {
    TemplateResolver resolver;
    auto values = resolver.resolve(Template::parse("./portraits"), {}, kWhen);
    CHECK(*values.at("./portraits") == "portraits");
}

TEST_CASE("TemplateResolver - resolution is pure", "[naming][resolver][catch2]") {
    TemplateResolver resolver;
    auto tmpl = Template::parse("sampler_name, steps");
    auto first = resolver.resolve(tmpl, workflowTree(), kWhen);
    auto other = ParameterTree::parse(R"({"sampler_name": "ddim"})");
    auto second = resolver.resolve(tmpl, other, kWhen);
    CHECK(*first.at("sampler_name") == "euler");
    CHECK(*second.at("sampler_name") == "ddim");
    CHECK_FALSE(second.at("steps").has_value());
}

TEST_CASE("TemplateResolver - diagnose lists tokens that contribute nothing",
          "[naming][resolver][catch2]") {
    TemplateResolver resolver;
    auto issues = resolver.diagnose(
        Template::parse("sampler_name, scheduler, 3.seed, 8.seed, %Q, ./out"), workflowTree(),
        kWhen);
    REQUIRE(issues.size() == 3);
    CHECK(issues[0].token == "scheduler");
    CHECK(issues[0].kind == TokenKind::Literal);
    CHECK(issues[1].token == "8.seed");
    CHECK(issues[1].kind == TokenKind::NodeReference);
    CHECK(issues[2].token == "%Q");
    CHECK(issues[2].kind == TokenKind::DateDirective);
}
