#pragma once
#include <string>

namespace toolrelay {

class Agent;
class DebugLog;
class ToolManager;

// REPL command handlers. Each returns the text for the caller to print.

std::string cmd_tools(ToolManager& manager);
std::string cmd_resources(ToolManager& manager);
std::string cmd_status(ToolManager& manager, const std::string& model_name);

// args: "" (last 20), N, "clear", "json", or a category name
std::string cmd_debug(DebugLog& log, const std::string& args);

// args: "" shows the current timeout, otherwise milliseconds
std::string cmd_timeout(Agent& agent, const std::string& args);

} // namespace toolrelay
