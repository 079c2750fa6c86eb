#include <catch2/catch.hpp>
#include "directive.hpp"

using namespace toolrelay;

// ── parse_tool_directives ───────────────────────────────────────

TEST_CASE("parse_tool_directives: single directive", "[directive]") {
    auto ds = parse_tool_directives(
        "I'll check.\nTOOL_CALL: get_weather\nPARAMETERS: {\"city\": \"Paris\"}\n");
    REQUIRE(ds.size() == 1);
    REQUIRE(ds[0].tool_name == "get_weather");
    REQUIRE(ds[0].raw_parameters == "{\"city\": \"Paris\"}");
    REQUIRE(ds[0].arguments.has_value());
    REQUIRE((*ds[0].arguments)["city"] == "Paris");
}

TEST_CASE("parse_tool_directives: nested object with trailing prose", "[directive]") {
    std::string text = "TOOL_CALL: foo\nPARAMETERS: {\"a\": {\"b\": 1}} trailing junk";
    auto ds = parse_tool_directives(text);
    REQUIRE(ds.size() == 1);
    REQUIRE(ds[0].raw_parameters == "{\"a\": {\"b\": 1}}");
    REQUIRE((*ds[0].arguments)["a"]["b"] == 1);
    REQUIRE(text.substr(ds[0].end) == " trailing junk");
    REQUIRE(ds[0].begin == 0);
}

TEST_CASE("parse_tool_directives: braces inside strings are literal", "[directive]") {
    auto ds = parse_tool_directives(
        "TOOL_CALL: search\nPARAMETERS: {\"query\": \"a } b {\", \"n\": 2}");
    REQUIRE(ds.size() == 1);
    REQUIRE(ds[0].arguments.has_value());
    REQUIRE((*ds[0].arguments)["query"] == "a } b {");
    REQUIRE((*ds[0].arguments)["n"] == 2);
}

TEST_CASE("parse_tool_directives: trailing comma is repaired", "[directive]") {
    auto ds = parse_tool_directives("TOOL_CALL: add\nPARAMETERS: {\"a\": 1, \"b\": 2,}");
    REQUIRE(ds.size() == 1);
    REQUIRE(ds[0].arguments.has_value());
    REQUIRE((*ds[0].arguments)["b"] == 2);
}

TEST_CASE("parse_tool_directives: invalid JSON leaves arguments unset", "[directive]") {
    auto ds = parse_tool_directives("TOOL_CALL: add\nPARAMETERS: {a: 1}");
    REQUIRE(ds.size() == 1);
    REQUIRE(ds[0].tool_name == "add");
    REQUIRE(ds[0].raw_parameters == "{a: 1}");
    REQUIRE_FALSE(ds[0].arguments.has_value());
}

TEST_CASE("parse_tool_directives: non-object payload leaves arguments unset", "[directive]") {
    auto ds = parse_tool_directives("TOOL_CALL: add\nPARAMETERS: [1, 2]\nThanks");
    REQUIRE(ds.size() == 1);
    REQUIRE(ds[0].raw_parameters == "[1, 2]");
    REQUIRE_FALSE(ds[0].arguments.has_value());
}

TEST_CASE("parse_tool_directives: unbalanced object runs to end of line", "[directive]") {
    auto ds = parse_tool_directives("TOOL_CALL: add\nPARAMETERS: {\"a\": 1\nmore text");
    REQUIRE(ds.size() == 1);
    REQUIRE(ds[0].raw_parameters == "{\"a\": 1");
    REQUIRE_FALSE(ds[0].arguments.has_value());
}

TEST_CASE("parse_tool_directives: PARAMETERS on the same line", "[directive]") {
    auto ds = parse_tool_directives("TOOL_CALL: ping PARAMETERS: {}");
    REQUIRE(ds.size() == 1);
    REQUIRE(ds[0].tool_name == "ping");
    REQUIRE(ds[0].arguments.has_value());
    REQUIRE(ds[0].arguments->empty());
}

TEST_CASE("parse_tool_directives: qualified and dotted names", "[directive]") {
    auto ds = parse_tool_directives(
        "TOOL_CALL: files:read_file\nPARAMETERS: {\"path\": \"/tmp\"}\n"
        "TOOL_CALL: v1.search-all\nPARAMETERS: {}");
    REQUIRE(ds.size() == 2);
    REQUIRE(ds[0].tool_name == "files:read_file");
    REQUIRE(ds[1].tool_name == "v1.search-all");
}

TEST_CASE("parse_tool_directives: multiple directives keep order", "[directive]") {
    auto ds = parse_tool_directives(
        "First:\nTOOL_CALL: a\nPARAMETERS: {\"x\": 1}\n"
        "Then:\nTOOL_CALL: b\nPARAMETERS: {\"y\": 2}\n");
    REQUIRE(ds.size() == 2);
    REQUIRE(ds[0].tool_name == "a");
    REQUIRE(ds[1].tool_name == "b");
    REQUIRE(ds[0].end <= ds[1].begin);
}

TEST_CASE("parse_tool_directives: TOOL_CALL without PARAMETERS is ignored", "[directive]") {
    auto ds = parse_tool_directives("TOOL_CALL: lonely\nJust chatting.");
    REQUIRE(ds.empty());
}

TEST_CASE("parse_tool_directives: TOOL_CALL without a name is ignored", "[directive]") {
    auto ds = parse_tool_directives("TOOL_CALL: \nPARAMETERS: {}");
    REQUIRE(ds.empty());
}

TEST_CASE("parse_tool_directives: plain answer has no directives", "[directive]") {
    REQUIRE(parse_tool_directives("The capital of France is Paris.").empty());
    REQUIRE(parse_tool_directives("").empty());
}

// ── extract_balanced_object ─────────────────────────────────────

TEST_CASE("extract_balanced_object: first complete object", "[directive]") {
    auto obj = extract_balanced_object("prefix {\"a\": {\"b\": 2}} {\"c\": 3}");
    REQUIRE(obj.has_value());
    REQUIRE(*obj == "{\"a\": {\"b\": 2}}");
}

TEST_CASE("extract_balanced_object: respects start offset", "[directive]") {
    std::string text = "{\"a\": 1} {\"b\": 2}";
    auto obj = extract_balanced_object(text, 1);
    REQUIRE(obj.has_value());
    REQUIRE(*obj == "{\"b\": 2}");
}

TEST_CASE("extract_balanced_object: escaped quotes inside strings", "[directive]") {
    auto obj = extract_balanced_object(R"({"s": "say \"}\" now"} tail)");
    REQUIRE(obj.has_value());
    REQUIRE(*obj == R"({"s": "say \"}\" now"})");
}

TEST_CASE("extract_balanced_object: none when absent or unbalanced", "[directive]") {
    REQUIRE_FALSE(extract_balanced_object("no braces").has_value());
    REQUIRE_FALSE(extract_balanced_object("{\"a\": {").has_value());
}

// ── repair_json ─────────────────────────────────────────────────

TEST_CASE("repair_json: removes trailing commas", "[directive]") {
    REQUIRE(repair_json("{\"a\": 1,}") == "{\"a\": 1}");
    REQUIRE(repair_json("[1, 2, ]") == "[1, 2 ]");
    REQUIRE(repair_json("{\"a\": [1,],\n}") == "{\"a\": [1]\n}");
}

TEST_CASE("repair_json: leaves commas inside strings", "[directive]") {
    REQUIRE(repair_json("{\"a\": \",}\"}") == "{\"a\": \",}\"}");
}

TEST_CASE("repair_json: valid JSON unchanged", "[directive]") {
    std::string ok = "{\"a\": 1, \"b\": [1, 2]}";
    REQUIRE(repair_json(ok) == ok);
}

// ── parse_selection ─────────────────────────────────────────────

TEST_CASE("parse_selection: comma separated names are lower-cased", "[directive]") {
    auto names = parse_selection("toolA, toolB", "no tools");
    REQUIRE(names.size() == 2);
    REQUIRE(names[0] == "toola");
    REQUIRE(names[1] == "toolb");
}

TEST_CASE("parse_selection: 'none' selects nothing", "[directive]") {
    REQUIRE(parse_selection("None", "no tools").empty());
    REQUIRE(parse_selection("none needed, thanks", "no tools").empty());
}

TEST_CASE("parse_selection: negative phrase selects nothing", "[directive]") {
    REQUIRE(parse_selection("NO TOOLS NEEDED", "no tools").empty());
    REQUIRE(parse_selection("No resources", "no resources").empty());
}

TEST_CASE("parse_selection: empty items dropped", "[directive]") {
    auto names = parse_selection(" weather ,, search ,", "no tools");
    REQUIRE(names.size() == 2);
    REQUIRE(names[0] == "weather");
    REQUIRE(names[1] == "search");
    REQUIRE(parse_selection("   ", "no tools").empty());
}

// ── result formatting ───────────────────────────────────────────

TEST_CASE("format helpers: fixed texts", "[directive]") {
    REQUIRE(format_tool_result("echo", "hi") == "Tool 'echo' result: hi");
    REQUIRE(format_tool_failed("echo") == "Tool 'echo' failed to execute");
    REQUIRE(format_tool_error("echo", "timeout") == "Tool 'echo' execution failed: timeout");
    REQUIRE(format_parameters_unparsable("echo") == "Tool 'echo' parameters could not be parsed");
}
