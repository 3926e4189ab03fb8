/**
 * @file test_env_merge.cpp
 * @brief Tests for vars.toml / secrets.toml merging
 */

#include "test_framework.h"
#include "test_fixtures.hpp"

#include "core/env_merge.hpp"

#include <string>

using namespace setupforge;
using namespace setupforge_test;

namespace {

component_catalog service_catalog() {
    auto service = make_component("service");
    service.env_specs.push_back(
        make_env("LOG_LEVEL", false, "Log verbosity", std::string("info")));
    service.env_specs.push_back(make_env("API_KEY", true, "Service API key"));
    return make_catalog({service});
}

component_catalog plain_only_catalog() {
    auto logger_component = make_component("logger");
    logger_component.env_specs.push_back(
        make_env("LOG_LEVEL", false, "Log verbosity", std::string("info")));
    return make_catalog({logger_component});
}

} // namespace

TEST(EnvMerge, PreservesExistingSecret) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});
    const std::string existing_secret = "API_KEY = \"abc\"\n";

    auto merged = merge_env_documents(order, catalog, std::nullopt,
                                      existing_secret);
    test_assert_ok(merged);
    test_assert(merged.value().secret == existing_secret);
    test_assert(merged.value().plain.find("API_KEY") == std::string::npos);
    test_assert(merged.value().plain.find("LOG_LEVEL = \"info\"") !=
                std::string::npos);
    test_assert(merged.value().misplaced.empty());
    return 0;
}

TEST(EnvMerge, InsertsDefaultIntoEmptyDocument) {
    auto catalog = plain_only_catalog();
    auto order = resolve_ok(catalog, {"logger"});

    auto merged = merge_env_documents(order, catalog, std::string(""),
                                      std::string(""));
    test_assert_ok(merged);
    test_assert(merged.value().plain.find("LOG_LEVEL = \"info\"\n") !=
                std::string::npos);
    test_assert(merged.value().plain.find("# Log verbosity\n") !=
                std::string::npos);
    test_assert(merged.value().secret.empty());
    return 0;
}

TEST(EnvMerge, AbsentDocumentsBehaveLikeEmpty) {
    auto catalog = plain_only_catalog();
    auto order = resolve_ok(catalog, {"logger"});

    auto from_absent =
        merge_env_documents(order, catalog, std::nullopt, std::nullopt);
    auto from_empty = merge_env_documents(order, catalog, std::string(""),
                                          std::string(""));
    test_assert_ok(from_absent);
    test_assert_ok(from_empty);
    test_assert(from_absent.value().plain == from_empty.value().plain);
    test_assert(from_absent.value().secret == from_empty.value().secret);
    return 0;
}

TEST(EnvMerge, SecretPlaceholderIsEmptyString) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});

    auto merged = merge_env_documents(order, catalog, std::nullopt, std::nullopt);
    test_assert_ok(merged);
    test_assert(merged.value().secret.find("API_KEY = \"\"\n") !=
                std::string::npos);
    test_assert(merged.value().secret.find("# Service API key\n") !=
                std::string::npos);
    return 0;
}

TEST(EnvMerge, KeepsUserValuesAndComments) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});
    const std::string existing_plain =
        "# my settings\nLOG_LEVEL = \"debug\" # chatty\n";

    auto merged =
        merge_env_documents(order, catalog, existing_plain, std::nullopt);
    test_assert_ok(merged);
    test_assert(merged.value().plain == existing_plain);
    return 0;
}

TEST(EnvMerge, AppendsAfterExistingText) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});
    const std::string existing_plain = "OTHER = \"x\"";

    auto merged =
        merge_env_documents(order, catalog, existing_plain, std::nullopt);
    test_assert_ok(merged);
    const std::string &plain = merged.value().plain;
    test_assert(plain.rfind("OTHER = \"x\"\n", 0) == 0);
    test_assert(plain.find("LOG_LEVEL = \"info\"") != std::string::npos);
    test_assert(plain.find("Non-secret environment configuration") ==
                std::string::npos);
    return 0;
}

TEST(EnvMerge, RejectsMalformedDocument) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});

    auto merged = merge_env_documents(order, catalog,
                                      std::string("not = [valid"), std::nullopt);
    test_assert(!merged);
    test_assert(merged.error().kind == setup_error_kind::malformed_env_toml);
    return 0;
}

TEST(EnvMerge, RejectsMalformedSecretDocument) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});

    auto merged = merge_env_documents(order, catalog, std::nullopt,
                                      std::string("API_KEY = "));
    test_assert(!merged);
    test_assert(merged.error().kind == setup_error_kind::malformed_env_toml);
    test_assert(merged.error().reason.find("secrets.toml") != std::string::npos);
    return 0;
}

TEST(EnvMerge, RejectsNestedTables) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});

    auto merged = merge_env_documents(
        order, catalog, std::string("[section]\nLOG_LEVEL = \"info\"\n"),
        std::nullopt);
    test_assert(!merged);
    test_assert(merged.error().kind == setup_error_kind::malformed_env_toml);
    return 0;
}

TEST(EnvMerge, FixedPoint) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});

    auto first = merge_env_documents(order, catalog, std::nullopt, std::nullopt);
    test_assert_ok(first);
    auto second = merge_env_documents(order, catalog, first.value().plain,
                                      first.value().secret);
    test_assert_ok(second);
    test_assert(second.value().plain == first.value().plain);
    test_assert(second.value().secret == first.value().secret);
    return 0;
}

TEST(EnvMerge, FirstDeclarationWins) {
    auto a = make_component("a");
    a.env_specs.push_back(make_env("SHARED", false, "from a", std::string("1")));
    auto b = make_component("b", {"a"});
    b.env_specs.push_back(make_env("SHARED", false, "from b", std::string("2")));
    auto catalog = make_catalog({a, b});
    auto order = resolve_ok(catalog, {"b"});

    auto merged = merge_env_documents(order, catalog, std::nullopt, std::nullopt);
    test_assert_ok(merged);
    const std::string &plain = merged.value().plain;
    test_assert(plain.find("SHARED = \"1\"") != std::string::npos);
    test_assert(plain.find("SHARED = \"2\"") == std::string::npos);
    test_assert(plain.find("# from b") == std::string::npos);
    return 0;
}

TEST(EnvMerge, ReportsMisplacedKey) {
    auto catalog = service_catalog();
    auto order = resolve_ok(catalog, {"service"});
    const std::string existing_plain = "API_KEY = \"leaked\"\n";

    auto merged =
        merge_env_documents(order, catalog, existing_plain, std::nullopt);
    test_assert_ok(merged);
    test_assert(merged.value().misplaced.size() == 1);
    test_assert(merged.value().misplaced[0].name == "API_KEY");
    test_assert(merged.value().misplaced[0].declared_secret);
    // Never moved: the plain copy stays, the secret side gets a placeholder
    test_assert(merged.value().plain.find("API_KEY = \"leaked\"") !=
                std::string::npos);
    test_assert(merged.value().secret.find("API_KEY = \"\"") !=
                std::string::npos);
    return 0;
}

TEST(EnvMerge, EscapesDefaultValues) {
    auto tool = make_component("tool");
    tool.env_specs.push_back(
        make_env("GREETING", false, "", std::string("say \"hi\"\\now")));
    auto catalog = make_catalog({tool});
    auto order = resolve_ok(catalog, {"tool"});

    auto merged = merge_env_documents(order, catalog, std::nullopt, std::nullopt);
    test_assert_ok(merged);
    test_assert(merged.value().plain.find(
                    "GREETING = \"say \\\"hi\\\"\\\\now\"") != std::string::npos);
    // Empty description falls back to name and owner
    test_assert(merged.value().plain.find("# GREETING (tool)") !=
                std::string::npos);
    return 0;
}

TEST(EnvMerge, NothingToAddKeepsDocumentsAsIs) {
    auto catalog = make_catalog({make_component("bare")});
    auto order = resolve_ok(catalog, {"bare"});

    auto merged = merge_env_documents(order, catalog, std::string("   \n"),
                                      std::nullopt);
    test_assert_ok(merged);
    test_assert(merged.value().plain == "   \n");
    test_assert(merged.value().secret.empty());
    return 0;
}

TEST(EnvMerge, KeepsWhitespaceOnlyDocument) {
    auto c = make_component("c");
    c.env_specs.push_back(make_env("PORT", false, "", std::string("8080")));
    auto catalog = make_catalog({c});
    auto order = resolve_ok(catalog, {"c"});

    auto merged = merge_env_documents(order, catalog, std::string("  \n\t"),
                                      std::nullopt);
    test_assert_ok(merged);
    const std::string &plain = merged.value().plain;
    test_assert(plain.compare(0, 5, "  \n\t\n") == 0);
    test_assert(plain.find("# Non-secret environment configuration") == 5);
    test_assert(plain.find("PORT = \"8080\"") != std::string::npos);

    auto again = merge_env_documents(order, catalog, plain, std::nullopt);
    test_assert_ok(again);
    test_assert(again.value().plain == plain);
    return 0;
}
