#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "translate/TranslationRequestBuilder.hpp"
#include "translate/TranslationService.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/fake_collaborators.hpp"

using namespace translate;
using test_utils::CannedModelBackend;

TEST_CASE("TranslationService returns cleaned model output", "[translate][service]") {
    CannedModelBackend backend;
    backend.reply = "```python\ndef add(a, b):\n\treturn a + b\n```\n";
    TranslationService service(&backend);
    REQUIRE(service.isReady());

    auto outcome = service.translate("add two numbers", "python", { { "chunk_index", 4 } });

    REQUIRE(outcome.success);
    REQUIRE(outcome.code == "def add(a, b):\n    return a + b");
    REQUIRE(outcome.errors.empty());
    REQUIRE(outcome.warnings.empty());

    SECTION("The backend sees the rendered prompt and enriched context") {
        REQUIRE(backend.calls == 1);
        REQUIRE(backend.lastPrompt.find("Translate the following pseudocode to Python:") != std::string::npos);
        REQUIRE(backend.lastPrompt.find("add two numbers") != std::string::npos);
        REQUIRE(backend.lastContext["chunk_index"] == 4);
        REQUIRE(backend.lastContext["approach"] == "llm_first");
        REQUIRE(backend.lastContext.contains("translation_id"));
    }

    SECTION("Metadata describes the request") {
        const auto& meta = outcome.metadata;
        REQUIRE(meta["translation_id"] == 1);
        REQUIRE(meta["approach"] == "llm_first");
        REQUIRE(meta["target_language"] == "python");
        REQUIRE(meta["input_length"] == 15);
        REQUIRE(meta["success"] == true);
        REQUIRE(meta["service"] == "TranslationService");
        REQUIRE(meta.contains("duration_ms"));

        auto second = service.translate("again", "", nlohmann::json::array());
        REQUIRE(second.metadata["translation_id"] == 2);
        REQUIRE(second.metadata["target_language"] == "python");
    }
}

TEST_CASE("TranslationService keeps tabs for other languages", "[translate][service]") {
    CannedModelBackend backend;
    backend.reply = "function f() {\n\treturn 1;\n}";
    TranslationService service(&backend);

    auto outcome = service.translate("return one", "javascript", nlohmann::json::object());
    REQUIRE(outcome.success);
    REQUIRE(outcome.code == "function f() {\n\treturn 1;\n}");
    REQUIRE(outcome.warnings.empty());
    REQUIRE(backend.lastPrompt.find("to JavaScript:") != std::string::npos);
}

TEST_CASE("TranslationService warns about questionable code", "[translate][service]") {
    CannedModelBackend backend;
    TranslationService service(&backend);

    SECTION("Syntax errors and very short output") {
        backend.reply = "x = (1";
        auto outcome = service.translate("make a tuple", "python", {});
        REQUIRE(outcome.success);
        REQUIRE(outcome.code == "x = (1");
        REQUIRE(outcome.warnings == std::vector<std::string>{ "Python syntax error: line 1: '(' was never closed",
                                                               "Generated code seems too short" });
    }

    SECTION("Leftover markers") {
        backend.reply = "def f():\n    pass  # TODO";
        auto outcome = service.translate("stub", "python", {});
        REQUIRE(outcome.success);
        REQUIRE(outcome.warnings == std::vector<std::string>{ "Generated code contains TODO/FIXME comments" });
    }
}

TEST_CASE("TranslationService failures", "[translate][service]") {
    utils::ErrorReporter::ClearErrors();
    CannedModelBackend backend;
    backend.reply = "x = 1\n";

    SECTION("Blank input") {
        TranslationService service(&backend);
        auto outcome = service.translate("  \n", "python", {});
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.errors == std::vector<std::string>{ "Input validation failed: Empty text" });
        REQUIRE(backend.calls == 0);
        REQUIRE(outcome.metadata["success"] == false);
    }

    SECTION("Input over the limit") {
        TranslationService service(&backend, 5);
        auto outcome = service.translate("abcdefgh", "python", {});
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.errors.front() == "Input validation failed: canned text too long: 8 bytes (limit: 5 bytes). "
                                          "Consider splitting into smaller chunks.");
        REQUIRE(backend.calls == 0);
    }

    SECTION("Backend throws") {
        backend.throwMessage = "boom";
        TranslationService service(&backend);
        auto outcome = service.translate("anything", "python", {});
        REQUIRE(outcome.errors == std::vector<std::string>{ "LLM translation failed: boom" });
    }

    SECTION("Backend returns nothing usable") {
        TranslationService service(&backend);
        backend.reply.reset();
        REQUIRE(service.translate("anything", "python", {}).errors.front() == "Model returned empty or invalid result");

        backend.reply = "```\n```";
        REQUIRE(service.translate("anything", "python", {}).errors.front() == "Model returned empty or invalid result");
    }

    SECTION("No backend or shut down") {
        TranslationService detached(nullptr);
        REQUIRE_FALSE(detached.isReady());
        REQUIRE(detached.translate("x", "python", {}).errors.front() == "Translation service is not ready");

        TranslationService service(&backend);
        service.shutdown();
        service.shutdown();
        REQUIRE_FALSE(service.isReady());
        REQUIRE(service.translate("x", "python", {}).errors.front() == "Translation service is not ready");
        REQUIRE(backend.calls == 0);
    }

    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Translation);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("TranslationService statistics", "[translate][service]") {
    CannedModelBackend backend;
    backend.reply = "def f():\n    return 1\n";
    TranslationService service(&backend);

    service.translate("one", "python", {});
    service.translate("", "python", {});
    service.translate(" ", "python", {});

    auto stats = service.statistics();
    REQUIRE(stats.successful == 1);
    REQUIRE(stats.failed == 2);
    REQUIRE(stats.total == 3);
    REQUIRE(stats.success_rate_percent == Catch::Approx(100.0 / 3.0));
    REQUIRE(stats.average_processing_seconds >= 0.0);

    service.resetStatistics();
    stats = service.statistics();
    REQUIRE(stats.total == 0);
    REQUIRE(stats.success_rate_percent == 0.0);
    REQUIRE(stats.total_processing_seconds == 0.0);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Translation request building", "[translate][request]") {
    REQUIRE(language_display_name("python") == "Python");
    REQUIRE(language_display_name("CPP") == "C++");
    REQUIRE(language_display_name("rust") == "Rust");
    REQUIRE(language_display_name("objective-c") == "Objective-C");
    REQUIRE(language_display_name("") == "target language");

    auto req = build_translation_request("use {language}", "", nlohmann::json::array(), "{language}: {source_text}");
    REQUIRE(req.target_language == "python");
    REQUIRE(req.prompt == "Python: use {language}");
    REQUIRE(req.context.is_object());
    REQUIRE(req.input_text == "use {language}");

    auto fallback = build_translation_request("sum a list", "go", { { "k", 1 } });
    REQUIRE(fallback.prompt.find("Translate the following pseudocode to Go:") == 0);
    REQUIRE(fallback.prompt.find("Go Code:") != std::string::npos);
    REQUIRE(fallback.context["k"] == 1);

    std::string text = "a-b-c";
    replace_all(text, "-", "--");
    REQUIRE(text == "a--b--c");
}
