#include "../include/research_agent.hpp"
#include "../../../shared/cpp/llm_sdk/include/errors.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <iostream>

namespace {

const char* kAiPrefix = "AI:";
const char* kFinalAnswer = "Final Answer:";
const char* kAction = "Action:";
const char* kActionInput = "Action Input:";
const char* kObservation = "Observation:";
const char* kThought = "Thought:";
const char* kFinalizeInstruction = "\n\nI now need to return a final answer based on the previous steps:";

// Position of `marker` at the start of a line, or npos.
size_t find_line_marker(const std::string& text, const std::string& marker, size_t from = 0) {
    for (size_t pos = text.find(marker, from); pos != std::string::npos; pos = text.find(marker, pos + 1)) {
        size_t line = pos;
        while (line > 0 && (text[line - 1] == ' ' || text[line - 1] == '\t')) --line;
        if (line == 0 || text[line - 1] == '\n') return pos;
    }
    return std::string::npos;
}

std::string strip_quotes(std::string s) {
    s = trim(s);
    while (s.size() >= 2) {
        char a = s.front(), b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'') || (a == '`' && b == '`') || (a == '[' && b == ']')) {
            s = trim(s.substr(1, s.size() - 2));
        } else {
            break;
        }
    }
    return s;
}

std::string strip_thought(const std::string& s) {
    std::string t = trim(s);
    if (t.compare(0, std::string(kThought).size(), kThought) == 0) t = trim(t.substr(std::string(kThought).size()));
    return t;
}

std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

} // namespace

AgentConfig agent_config_from_env() {
    AgentConfig c;
    c.max_iterations = getenv_int_or("AGENT_MAX_ITERATIONS", c.max_iterations);
    if (c.max_iterations < 1) throw ConfigError("AGENT_MAX_ITERATIONS must be at least 1");
    return c;
}

const char* agent_state_name(AgentState s) {
    switch (s) {
    case AgentState::Thinking: return "thinking";
    case AgentState::ActingOnTool: return "acting";
    case AgentState::Observing: return "observing";
    case AgentState::Finished: return "finished";
    }
    return "unknown";
}

AgentAction parse_agent_output(const std::string& raw) {
    AgentAction a;
    std::string text = raw;

    size_t action = find_line_marker(text, kAction);
    size_t input = action == std::string::npos ? std::string::npos : find_line_marker(text, kActionInput, action);
    if (input != std::string::npos) {
        // the model sometimes invents the observation itself
        size_t obs = find_line_marker(text, kObservation, input);
        if (obs != std::string::npos) text.erase(obs);
    }
    a.log = trim(text);

    size_t finish = find_line_marker(text, kAiPrefix);
    size_t finish_len = std::string(kAiPrefix).size();
    size_t final_answer = find_line_marker(text, kFinalAnswer);
    if (final_answer != std::string::npos && (finish == std::string::npos || final_answer < finish)) {
        finish = final_answer;
        finish_len = std::string(kFinalAnswer).size();
    }

    if (input != std::string::npos && (finish == std::string::npos || action < finish)) {
        a.kind = AgentAction::Kind::UseTool;
        a.thought = strip_thought(text.substr(0, action));
        size_t name_begin = action + std::string(kAction).size();
        a.tool = strip_quotes(text.substr(name_begin, text.find('\n', name_begin) - name_begin));
        a.tool_input = strip_quotes(text.substr(input + std::string(kActionInput).size()));
        return a;
    }

    a.kind = AgentAction::Kind::Finish;
    if (finish != std::string::npos) {
        a.thought = strip_thought(text.substr(0, finish));
        a.answer = trim(text.substr(finish + finish_len));
    } else {
        a.answer = trim(raw);
    }
    return a;
}

ResearchAgent::ResearchAgent(LlmGateway& llm, AgentConfig cfg, ToolRegistry tools)
    : llm_(llm), cfg_(cfg), tools_(std::move(tools)) {
    if (cfg_.max_iterations < 1) throw ConfigError("max_iterations must be at least 1");
}

ResearchResult ResearchAgent::research(const std::string& query) {
    return research(query, cfg_.max_iterations);
}

ResearchResult ResearchAgent::research(const std::string& query, int max_iterations) {
    if (max_iterations < 1) throw ConfigError("max_iterations must be at least 1");
    ResearchResult res;
    res.tools_used = tools_.names();
    try {
        res.response = run_loop(query, max_iterations, res.steps, res.early_stopped);
        res.success = true;
        memory_.append_exchange(query, res.response);
    } catch (const AgentError& e) {
        std::cerr << "[agent] Research failed: " << e.what() << "\n";
        res.success = false;
        res.error = e.what();
        res.response = std::string("I encountered an error while researching: ") + e.what();
    }
    return res;
}

std::string ResearchAgent::run_loop(const std::string& query, int max_iterations, AgentTrace& trace,
                                    bool& early_stopped) {
    AgentState state = AgentState::Thinking;
    AgentAction action;
    AgentStep step;
    std::string answer;
    early_stopped = false;

    while (state != AgentState::Finished) {
        switch (state) {
        case AgentState::Thinking:
            if ((int)trace.size() >= max_iterations) {
                trace_log(state, "iteration cap reached, asking for a final answer");
                auto last = parse_agent_output(think(build_prompt(query, trace) + kFinalizeInstruction));
                answer = last.kind == AgentAction::Kind::Finish ? last.answer : last.log;
                early_stopped = true;
                state = AgentState::Finished;
                break;
            }
            action = parse_agent_output(think(build_prompt(query, trace)));
            if (action.kind == AgentAction::Kind::Finish) {
                answer = action.answer;
                state = AgentState::Finished;
            } else {
                state = AgentState::ActingOnTool;
            }
            break;
        case AgentState::ActingOnTool:
            trace_log(state, "Action: " + action.tool + " | Input: " + action.tool_input);
            step = AgentStep{(int)trace.size() + 1, action.thought, action.tool, action.tool_input,
                             observe(action), action.log};
            state = AgentState::Observing;
            break;
        case AgentState::Observing:
            trace_log(state, "Observation: " + step.observation);
            trace.push_back(std::move(step));
            state = AgentState::Thinking;
            break;
        case AgentState::Finished:
            break;
        }
    }
    trace_log(state, "Finished after " + std::to_string(trace.size()) + " tool call(s)");
    return answer;
}

std::string ResearchAgent::think(const std::string& prompt) {
    try {
        return llm_.generate(prompt, memory_);
    } catch (const GatewayError& e) {
        throw AgentError(e.what());
    }
}

std::string ResearchAgent::observe(const AgentAction& action) const {
    if (auto out = tools_.run(action.tool, action.tool_input)) return *out;
    return action.tool + " is not a valid tool, try one of [" + join(tools_.names(), ", ") + "].";
}

std::string ResearchAgent::build_prompt(const std::string& query, const AgentTrace& trace) const {
    std::string tool_lines;
    for (auto& s : tools_.specs()) tool_lines += "> " + s.name + ": " + s.description + "\n";
    std::string names = join(tools_.names(), ", ");

    std::string prompt =
        "Assistant is a research assistant that answers questions and uses tools when they help.\n\n"
        "TOOLS:\n------\n\nAssistant has access to the following tools:\n\n" + tool_lines +
        "\nTo use a tool, please use the following format:\n\n"
        "```\nThought: Do I need to use a tool? Yes\n"
        "Action: the action to take, should be one of [" + names + "]\n"
        "Action Input: the input to the action\n"
        "Observation: the result of the action\n```\n\n"
        "When you have a response to say to the Human, or if you do not need to use a tool, you MUST use the format:\n\n"
        "```\nThought: Do I need to use a tool? No\nAI: [your response here]\n```\n\n"
        "Begin!\n\nNew input: " + query + "\n";
    for (auto& s : trace) {
        prompt += s.log + "\n" + kObservation + " " + s.observation + "\n" + kThought + " ";
    }
    return prompt;
}

void ResearchAgent::trace_log(AgentState state, const std::string& msg) const {
    if (cfg_.verbose) std::cerr << "[agent] " << agent_state_name(state) << ": " << msg << "\n";
}
