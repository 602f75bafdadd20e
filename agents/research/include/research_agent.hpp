#pragma once
#include "tool_registry.hpp"
#include "../../../shared/cpp/llm_sdk/include/conversation_memory.hpp"
#include "../../../shared/cpp/llm_sdk/include/gateways.hpp"
#include <optional>
#include <string>
#include <vector>

struct AgentConfig {
    int max_iterations{3};
    bool verbose{false};
};

// AGENT_MAX_ITERATIONS over the defaults above.
AgentConfig agent_config_from_env();

enum class AgentState { Thinking, ActingOnTool, Observing, Finished };

const char* agent_state_name(AgentState s);

// What the model asked for on one turn.
struct AgentAction {
    enum class Kind { UseTool, Finish };
    Kind kind{Kind::Finish};
    std::string thought;
    std::string tool;
    std::string tool_input;
    std::string answer;
    std::string log; // model output the action was parsed from
};

// ReAct-style output: "Action: <tool>" + "Action Input: <input>" requests a
// tool, a line starting with "AI:" or "Final Answer:" finishes. Anything else
// is taken verbatim as the final answer.
AgentAction parse_agent_output(const std::string& text);

struct AgentStep {
    int sequence{0};
    std::string thought;
    std::string tool;
    std::string tool_input;
    std::string observation;
    std::string log;
};

using AgentTrace = std::vector<AgentStep>;

struct ResearchResult {
    bool success{false};
    std::string response;
    std::vector<std::string> tools_used; // every registered tool, as the host reports them
    std::optional<std::string> error;
    AgentTrace steps;
    bool early_stopped{false};
};

// Bounded think/act/observe loop over the tool registry. Owns the agent's
// conversation memory; the gateway is borrowed and must outlive the agent.
class ResearchAgent {
public:
    explicit ResearchAgent(LlmGateway& llm, AgentConfig cfg = {}, ToolRegistry tools = {});

    // Never throws for model failures: they come back with success == false.
    ResearchResult research(const std::string& query);
    ResearchResult research(const std::string& query, int max_iterations);

    std::vector<ToolSpec> get_available_tools() const { return tools_.specs(); }
    void clear_memory() { memory_.clear(); }

    const ConversationMemory& memory() const { return memory_; }
    const AgentConfig& config() const { return cfg_; }

private:
    std::string run_loop(const std::string& query, int max_iterations, AgentTrace& trace, bool& early_stopped);
    std::string think(const std::string& prompt);
    std::string observe(const AgentAction& action) const;
    std::string build_prompt(const std::string& query, const AgentTrace& trace) const;
    void trace_log(AgentState state, const std::string& msg) const;

    LlmGateway& llm_;
    AgentConfig cfg_;
    ToolRegistry tools_;
    ConversationMemory memory_;
};
