#include <catch2/catch_test_macros.hpp>
#include "assembly/SourceScanner.hpp"

#include <string>

using namespace assembly;

TEST_CASE("SourceScanner splits top-level statements", "[assembly][scanner]") {
    const std::string source = "import os\n"
                               "from typing import List as L\n"
                               "\n"
                               "MAX = 3\n"
                               "\n"
                               "# helper\n"
                               "@decorator\n"
                               "def f(x):\n"
                               "    return x\n"
                               "\n"
                               "class A:\n"
                               "    pass\n"
                               "\n"
                               "print(f(MAX))\n";

    SECTION("Kinds, names and line spans") {
        auto result = SourceScanner::scan(source);
        REQUIRE(result.ok);
        REQUIRE(result.statements.size() == 6);

        REQUIRE(result.statements[0].kind == StatementKind::Import);
        REQUIRE(result.statements[1].kind == StatementKind::Import);

        REQUIRE(result.statements[2].kind == StatementKind::Assignment);
        REQUIRE(result.statements[2].name == "MAX");

        const auto& fn = result.statements[3];
        REQUIRE(fn.kind == StatementKind::Function);
        REQUIRE(fn.name == "f");
        REQUIRE(fn.first_line == 6);
        REQUIRE(fn.last_line == 9);
        REQUIRE(fn.text == "# helper\n@decorator\ndef f(x):\n    return x");

        REQUIRE(result.statements[4].kind == StatementKind::Class);
        REQUIRE(result.statements[4].name == "A");

        REQUIRE(result.statements[5].kind == StatementKind::Other);
        REQUIRE(result.statements[5].text == "print(f(MAX))");
    }

    SECTION("Comments can be left unattached") {
        auto result = SourceScanner::scan(source, false);
        REQUIRE(result.ok);
        REQUIRE(result.statements[3].first_line == 7);
        REQUIRE(result.statements[3].text.rfind("@decorator", 0) == 0);
    }

    SECTION("Imports carry module, name and alias") {
        auto result = SourceScanner::scan(source);
        REQUIRE(result.imports.size() == 2);
        REQUIRE(result.imports[0].module == "os");
        REQUIRE_FALSE(result.imports[0].from_import);
        REQUIRE(result.imports[1].module == "typing");
        REQUIRE(result.imports[1].name == "List");
        REQUIRE(result.imports[1].alias == "L");
        REQUIRE(result.imports[1].from_import);
    }
}

TEST_CASE("SourceScanner finds nested and parenthesized imports", "[assembly][scanner]") {
    auto result = SourceScanner::scan("def f():\n"
                                      "    import json\n"
                                      "    return json.dumps(1)\n"
                                      "from .models import (User,\n"
                                      "    Group as G)\n");
    REQUIRE(result.ok);
    REQUIRE(result.statements.size() == 2);
    REQUIRE(result.imports.size() == 3);
    REQUIRE(result.imports[0].module == "json");
    REQUIRE(result.imports[1].module == ".models");
    REQUIRE(result.imports[1].name == "User");
    REQUIRE(result.imports[2].name == "Group");
    REQUIRE(result.imports[2].alias == "G");
}

TEST_CASE("SourceScanner recognises a leading docstring", "[assembly][scanner]") {
    auto result = SourceScanner::scan("\"\"\"Module doc.\"\"\"\nx = \"text\"\n");
    REQUIRE(result.ok);
    REQUIRE(result.statements.size() == 2);
    REQUIRE(result.statements[0].kind == StatementKind::Docstring);
    REQUIRE(result.statements[1].kind == StatementKind::Assignment);
}

TEST_CASE("SourceScanner rejects malformed code", "[assembly][scanner]") {
    std::string error;

    SECTION("Header without a body") {
        REQUIRE_FALSE(SourceScanner::check("def f():\n", &error));
        REQUIRE(error == "line 1: expected an indented block after line 1");
    }

    SECTION("Unterminated string") {
        auto result = SourceScanner::scan("x = \"abc\n");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "unterminated string literal");
        REQUIRE(result.error_line == 1);
    }

    SECTION("Unclosed bracket") {
        auto result = SourceScanner::scan("foo(1,\n    2\n");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "'(' was never closed");
    }

    SECTION("Unexpected indent") {
        auto result = SourceScanner::scan("x = 1\n    y = 2\n");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "unexpected indent");
        REQUIRE(result.error_line == 2);
    }

    SECTION("Valid code passes") {
        REQUIRE(SourceScanner::check("if x:\n    y()\nelse:\n    z()\n", &error));
    }
}

TEST_CASE("SourceScanner line structure", "[assembly][scanner]") {
    auto info = SourceScanner::lineStructure("x = \"\"\"a\nb\"\"\"\ny = (1,\n2)\nif y:\n    # note\n    pass\n");
    REQUIRE(info.size() == 7);
    REQUIRE(info[0].starts_logical);
    REQUIRE_FALSE(info[1].starts_logical);
    REQUIRE(info[1].in_string);
    REQUIRE(info[2].starts_logical);
    REQUIRE_FALSE(info[3].starts_logical);
    REQUIRE_FALSE(info[3].in_string);
    REQUIRE(info[4].opens_block);
    REQUIRE(info[5].comment_only);
}

TEST_CASE("SourceScanner helpers", "[assembly][scanner]") {
    REQUIRE(SourceScanner::indentWidth("  x") == 2);
    REQUIRE(SourceScanner::indentWidth("\tx") == 8);
    REQUIRE(SourceScanner::indentWidth("  \tx") == 8);

    auto lines = SourceScanner::splitLines("a\r\nb\rc\n");
    REQUIRE(lines == std::vector<std::string>{ "a", "b", "c" });
}
