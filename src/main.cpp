#include "agent.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "debug_log.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "manager.hpp"
#include "models/ollama.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: toolrelay [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Config file (default: ./config.json)\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --model NAME         Use specific Ollama model\n"
              << "  --persistent         Keep MCP servers running between requests\n"
              << "  --debug              Print debug events as they happen\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /tools               List tools from all MCP servers\n"
              << "  /resources           List resources from all MCP servers\n"
              << "  /status              Show MCP server status\n"
              << "  /models              List installed Ollama models\n"
              << "  /model NAME          Switch model\n"
              << "  /debug [ARG]         Debug events: last N (default 20), a category\n"
              << "                       (agent, agent-llm, llm-agent, agent-mcp, mcp-agent),\n"
              << "                       json, or clear\n"
              << "  /timeout [MS]        Show or set the tool call timeout\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  OLLAMA_HOST              Base URL for Ollama (default: http://localhost:11434)\n"
              << "  OLLAMA_MODEL             Model name (default: mistral)\n"
              << "  TOOLRELAY_TOOL_TIMEOUT   Tool call timeout in milliseconds\n";
}

static void print_event(const toolrelay::DebugEvent& ev) {
    std::cerr << "[debug] " << ev.timestamp << " " << ev.category << ": " << ev.message;
    if (!ev.data.empty()) std::cerr << " " << toolrelay::truncate(ev.data.dump(), 300);
    std::cerr << "\n";
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string config_path = "config.json";
    std::string message;
    std::string model_name;
    bool persistent = false;
    bool debug = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--persistent") == 0) {
            persistent = true;
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            debug = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = toolrelay::Config::load(config_path);

    // Override config with CLI args
    if (!model_name.empty()) {
        config.ollama.model = model_name;
    }
    if (persistent) {
        config.manager.mode = toolrelay::ManagerMode::Persistent;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    toolrelay::http_set_abort_flag(&g_shutdown);

    // Event bus + debug log
    toolrelay::EventBus bus;
    toolrelay::DebugLog debug_log(config.debug.max_events);
    debug_log.attach(bus);
    if (debug) {
        toolrelay::subscribe<toolrelay::DebugEvent>(bus, print_event);
    }
    toolrelay::subscribe<toolrelay::ToolCallRequestEvent>(bus,
        [](const toolrelay::ToolCallRequestEvent& ev) {
            std::cerr << "[tool] " << ev.tool_name << " (" << ev.provider << ")\n";
        });

    // Language model
    toolrelay::SocketHttpClient http_client;
    toolrelay::OllamaModel model(http_client, config.ollama.host, config.ollama.model,
                                 static_cast<long>(config.ollama.timeout));
    if (!model.setup()) {
        std::cerr << "Warning: Ollama is not reachable at " << config.ollama.host
                  << "; requests will fail until it is.\n";
    }

    // Tool providers
    auto manager = toolrelay::create_tool_manager(config);
    manager->set_event_bus(&bus);

    toolrelay::AgentOptions agent_options;
    agent_options.tool_timeout = std::chrono::milliseconds(config.manager.tool_timeout_ms);
    toolrelay::Agent agent(model, *manager, agent_options);
    agent.set_event_bus(&bus);

    // Single message mode
    if (!message.empty()) {
        std::string response = agent.process_request(message);
        std::cout << response << '\n';
        manager->shutdown();
        return 0;
    }

    // Interactive REPL
    std::cout << "ToolRelay\n"
              << "Model: " << model.model_name()
              << " | MCP servers: " << manager->provider_count()
              << " (" << manager->manager_type() << ")\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "toolrelay> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        line = toolrelay::trim(line);
        if (line.empty()) continue;

        // Handle slash commands
        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/tools") {
                std::cout << toolrelay::cmd_tools(*manager);
            } else if (line == "/resources") {
                std::cout << toolrelay::cmd_resources(*manager);
            } else if (line == "/status") {
                std::cout << toolrelay::cmd_status(*manager, model.model_name());
            } else if (line == "/models") {
                try {
                    for (const auto& name : model.list_models()) {
                        std::cout << "  " << name
                                  << (name == model.model_name() ? "  (current)" : "") << "\n";
                    }
                } catch (const toolrelay::ToolRelayError& e) {
                    std::cout << e.what() << "\n";
                }
            } else if (line.substr(0, 7) == "/model ") {
                std::string new_model = toolrelay::trim(line.substr(7));
                model.set_model(new_model);
                std::cout << "Model set to: " << new_model << "\n";
            } else if (line == "/debug" || line.substr(0, 7) == "/debug ") {
                std::cout << toolrelay::cmd_debug(debug_log, line.substr(6));
            } else if (line == "/timeout" || line.substr(0, 9) == "/timeout ") {
                std::cout << toolrelay::cmd_timeout(agent, line.substr(8));
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /tools      List available tools\n"
                          << "  /resources  List available resources\n"
                          << "  /status     Show MCP server status\n"
                          << "  /models     List installed models\n"
                          << "  /model X    Switch to model X\n"
                          << "  /debug [X]  Recent debug events (N, category, json, clear)\n"
                          << "  /timeout [MS] Show or set the tool timeout\n"
                          << "  /quit       Exit\n"
                          << "  /exit       Exit\n"
                          << "  /help       Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        // Process user message
        std::string response = agent.process_request(line);
        std::cout << "\n" << response << "\n\n";
    }

    manager->shutdown();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
