#include <catch2/catch.hpp>
#include "agent.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include <algorithm>
#include <stdexcept>

using namespace toolrelay;
using json = nlohmann::json;

// ── Mock language model ──────────────────────────────────────────

class MockLanguageModel : public LanguageModel {
public:
    // Replies in order; nullopt entries simulate an unreachable model.
    // Once exhausted, next_reply is returned.
    std::vector<std::optional<std::string>> replies;
    std::optional<std::string> next_reply = std::string("default reply");
    std::vector<std::string> prompts;

    std::optional<std::string> generate(const std::string& prompt) override {
        prompts.push_back(prompt);
        size_t idx = prompts.size() - 1;
        if (idx < replies.size()) return replies[idx];
        return next_reply;
    }

    std::string model_name() const override { return "mock-model"; }

    size_t call_count() const { return prompts.size(); }
};

// ── Mock tool manager ────────────────────────────────────────────

class MockToolManager : public ToolManager {
public:
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    size_t providers = 1;
    bool throw_on_list = false;
    bool throw_on_call = false;

    // tool name -> reply; absent means the tool is unknown (nullopt)
    std::map<std::string, ToolResult> results;

    struct Call {
        std::string name;
        json arguments;
        std::chrono::milliseconds timeout;
    };
    std::vector<Call> calls;
    int list_tools_count = 0;
    int list_resources_count = 0;

    std::vector<ToolDescriptor> get_available_tools() override {
        list_tools_count++;
        if (throw_on_list) throw ToolRelayError(ErrorKind::Internal, "catalog exploded");
        return tools;
    }

    std::vector<ResourceDescriptor> get_available_resources() override {
        list_resources_count++;
        return resources;
    }

    std::optional<ToolResult> call_tool(const std::string& name, const json& arguments,
                                        std::chrono::milliseconds timeout) override {
        calls.push_back({name, arguments, timeout});
        if (throw_on_call) throw std::runtime_error("provider vanished");
        auto it = results.find(name);
        if (it == results.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, StatusRecord> get_server_status() override { return {}; }
    void shutdown() override {}
    std::string manager_type() const override { return "mock"; }
    size_t provider_count() const override { return providers; }

    void add_tool(const std::string& name, const std::string& provider = "mock") {
        ToolDescriptor t;
        t.name = name;
        t.provider = provider;
        t.description = "The " + name + " tool";
        tools.push_back(t);
    }

    void add_result(const std::string& name, const std::string& text, bool is_error = false) {
        ToolResult r;
        r.text = text;
        r.is_error = is_error;
        results[name] = r;
    }
};

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ── No providers / no tools ──────────────────────────────────────

TEST_CASE("Agent: no providers means exactly one model call", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.providers = 0;
    model.next_reply = "Paris is the capital of France.";

    Agent agent(model, manager);
    auto reply = agent.process_request("What is the capital of France?");

    REQUIRE(reply == "Paris is the capital of France.");
    REQUIRE(model.call_count() == 1);
    REQUIRE(manager.list_tools_count == 0);
    REQUIRE(manager.list_resources_count == 0);
    REQUIRE_FALSE(contains(model.prompts[0], "TOOL_CALL"));
}

TEST_CASE("Agent: empty catalog returns the execution reply directly", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    model.next_reply = "TOOL_CALL: echo\nPARAMETERS: {}";

    Agent agent(model, manager);
    auto reply = agent.process_request("hi");

    REQUIRE(reply == "TOOL_CALL: echo\nPARAMETERS: {}");
    REQUIRE(model.call_count() == 1);
    REQUIRE(manager.calls.empty());
    REQUIRE(manager.list_tools_count == 1);
}

TEST_CASE("Agent: unreachable model without providers", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.providers = 0;
    model.next_reply = std::nullopt;

    Agent agent(model, manager);
    REQUIRE(agent.process_request("hi") == kNoBackendMessage);
}

TEST_CASE("Agent: unreachable model with providers", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.add_tool("echo");
    model.next_reply = std::nullopt;

    Agent agent(model, manager);
    REQUIRE(agent.process_request("hi") == kNoResponseMessage);
}

// ── Selection ────────────────────────────────────────────────────

TEST_CASE("Agent: determine_needed_resources skips the model when empty", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    Agent agent(model, manager);
    REQUIRE(agent.determine_needed_resources("q", {}).empty());
    REQUIRE(model.call_count() == 0);
}

TEST_CASE("Agent: determine_needed_resources parses the reply", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    ResourceDescriptor notes;
    notes.name = "notes";
    model.next_reply = "Notes, Todo";

    Agent agent(model, manager);
    auto picked = agent.determine_needed_resources("q", {notes});
    REQUIRE(picked.size() == 2);
    REQUIRE(picked[0] == "notes");
    REQUIRE(picked[1] == "todo");
    REQUIRE(contains(model.prompts[0], "- notes: No description"));
}

TEST_CASE("Agent: determine_needed_resources honours a negative reply", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    ResourceDescriptor notes;
    notes.name = "notes";
    model.next_reply = "No resources needed.";

    Agent agent(model, manager);
    REQUIRE(agent.determine_needed_resources("q", {notes}).empty());
}

TEST_CASE("Agent: determine_needed_tools parses the reply", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.add_tool("get_weather", "weather");
    manager.add_tool("search", "web");
    model.next_reply = "get_weather, search";

    Agent agent(model, manager);
    ToolCatalog catalog(manager.tools);
    auto picked = agent.determine_needed_tools("q", {"notes"}, catalog);
    REQUIRE(picked.size() == 2);
    REQUIRE(contains(model.prompts[0], "Resources that will be available: notes"));
    REQUIRE(contains(model.prompts[0], "- get_weather (weather): The get_weather tool"));
}

TEST_CASE("Agent: determine_needed_tools with NO TOOLS NEEDED", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.add_tool("echo");
    model.next_reply = "NO TOOLS NEEDED";

    Agent agent(model, manager);
    REQUIRE(agent.determine_needed_tools("q", {}, ToolCatalog(manager.tools)).empty());
}

TEST_CASE("Agent: determine_needed_tools skips the model for an empty catalog", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    Agent agent(model, manager);
    REQUIRE(agent.determine_needed_tools("q", {}, ToolCatalog()).empty());
    REQUIRE(model.call_count() == 0);
}

// ── process_tool_calls ───────────────────────────────────────────

TEST_CASE("Agent: process_tool_calls executes every directive", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.add_result("echo", "hello");
    manager.add_result("add", "5");

    Agent agent(model, manager, AgentOptions{std::chrono::milliseconds(1234)});
    auto outcome = agent.process_tool_calls(
        "TOOL_CALL: echo\nPARAMETERS: {\"text\": \"hello\"}\n"
        "TOOL_CALL: add\nPARAMETERS: {\"a\": 2, \"b\": 3}");

    REQUIRE(outcome.recognized == 2);
    REQUIRE(outcome.result_lines.size() == 2);
    REQUIRE(outcome.result_lines[0] == "Tool 'echo' result: hello");
    REQUIRE(outcome.result_lines[1] == "Tool 'add' result: 5");
    REQUIRE(manager.calls.size() == 2);
    REQUIRE(manager.calls[0].arguments["text"] == "hello");
    REQUIRE(manager.calls[1].arguments["b"] == 3);
    REQUIRE(manager.calls[0].timeout == std::chrono::milliseconds(1234));
}

TEST_CASE("Agent: process_tool_calls reports unknown tools", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    Agent agent(model, manager);
    auto outcome = agent.process_tool_calls("TOOL_CALL: ghost\nPARAMETERS: {}");
    REQUIRE(outcome.recognized == 1);
    REQUIRE(outcome.result_lines[0] == "Tool 'ghost' failed to execute");
}

TEST_CASE("Agent: process_tool_calls reports unparsable parameters", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.add_result("echo", "never");
    Agent agent(model, manager);
    auto outcome = agent.process_tool_calls("TOOL_CALL: echo\nPARAMETERS: {text: hi}");
    REQUIRE(outcome.recognized == 1);
    REQUIRE(outcome.result_lines[0] == "Tool 'echo' parameters could not be parsed");
    REQUIRE(manager.calls.empty());
}

TEST_CASE("Agent: process_tool_calls reports thrown failures", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.throw_on_call = true;
    Agent agent(model, manager);
    auto outcome = agent.process_tool_calls("TOOL_CALL: echo\nPARAMETERS: {}");
    REQUIRE(outcome.result_lines[0] == "Tool 'echo' execution failed: provider vanished");
}

TEST_CASE("Agent: process_tool_calls without directives", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    Agent agent(model, manager);
    auto outcome = agent.process_tool_calls("Just an answer.");
    REQUIRE(outcome.recognized == 0);
    REQUIRE(outcome.result_lines.empty());
}

// ── Full request ─────────────────────────────────────────────────

TEST_CASE("Agent: full request runs selection, tools and synthesis", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.add_tool("get_weather", "weather");
    manager.add_tool("search", "web");
    manager.add_result("get_weather", "Sunny, 21C");
    model.replies = {
        std::string("get_weather"),
        std::string("I'll check.\nTOOL_CALL: get_weather\nPARAMETERS: {\"city\": \"Oslo\"}"),
        std::string("It is sunny and 21C in Oslo.")
    };

    Agent agent(model, manager);
    auto reply = agent.process_request("Weather in Oslo?");

    REQUIRE(reply == "It is sunny and 21C in Oslo.");
    REQUIRE(model.call_count() == 3);
    // Only the selected tool is offered for execution
    REQUIRE(contains(model.prompts[1], "get_weather"));
    REQUIRE_FALSE(contains(model.prompts[1], "- search"));
    REQUIRE(contains(model.prompts[2], "Tool 'get_weather' result: Sunny, 21C"));
    REQUIRE(manager.calls.size() == 1);
    REQUIRE(manager.calls[0].arguments["city"] == "Oslo");
    REQUIRE(manager.list_tools_count == 1);
    REQUIRE(manager.list_resources_count == 1);
}

TEST_CASE("Agent: resources phase runs when resources exist", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    ResourceDescriptor notes;
    notes.name = "notes";
    manager.resources.push_back(notes);
    manager.add_tool("echo");
    model.replies = {std::string("notes"), std::string("none"), std::string("Plain answer")};

    Agent agent(model, manager);
    REQUIRE(agent.process_request("Read my notes") == "Plain answer");
    REQUIRE(model.call_count() == 3);
    REQUIRE(contains(model.prompts[1], "Resources that will be available: notes"));
    // Nothing selected: execution prompt offers no tools
    REQUIRE_FALSE(contains(model.prompts[2], "TOOL_CALL"));
}

TEST_CASE("Agent: reply without directives is returned as is", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.add_tool("echo");
    model.replies = {std::string("echo"), std::string("No tool needed, hello!")};

    Agent agent(model, manager);
    REQUIRE(agent.process_request("hi") == "No tool needed, hello!");
    REQUIRE(model.call_count() == 2);
    REQUIRE(manager.calls.empty());
}

TEST_CASE("Agent: synthesis failure falls back to raw results", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.add_tool("echo");
    manager.add_result("echo", "hello");
    model.replies = {std::string("echo"),
                     std::string("TOOL_CALL: echo\nPARAMETERS: {\"text\": \"hello\"}"),
                     std::nullopt};

    Agent agent(model, manager);
    auto reply = agent.process_request("say hello");
    REQUIRE(reply == std::string(kSynthesisFallbackPrefix) + "Tool 'echo' result: hello");
}

TEST_CASE("Agent: catalog failure becomes an apology", "[agent]") {
    MockLanguageModel model;
    MockToolManager manager;
    manager.throw_on_list = true;

    Agent agent(model, manager);
    auto reply = agent.process_request("hi");
    REQUIRE(reply == std::string(kErrorMessagePrefix) + "catalog exploded");
    REQUIRE(model.call_count() == 0);
}

// ── Events ───────────────────────────────────────────────────────

TEST_CASE("Agent: publishes model traffic on the event bus", "[agent]") {
    EventBus bus;
    std::vector<std::string> categories;
    subscribe<DebugEvent>(bus, [&](const DebugEvent& ev) {
        categories.push_back(ev.category);
    });

    MockLanguageModel model;
    MockToolManager manager;
    manager.providers = 0;
    Agent agent(model, manager);
    agent.set_event_bus(&bus);
    agent.process_request("hi");

    auto count = [&](const std::string& c) {
        return std::count(categories.begin(), categories.end(), c);
    };
    REQUIRE(count("agent-llm") == 1);
    REQUIRE(count("llm-agent") == 1);
    REQUIRE(count("agent") >= 1);
}
