#include "../include/tool_registry.hpp"
#include "../../../shared/cpp/llm_sdk/include/errors.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <type_traits>

const char* tool_name(const Tool& t) {
    return std::visit([](const auto& tool) { return std::decay_t<decltype(tool)>::kName; }, t);
}

const char* tool_description(const Tool& t) {
    return std::visit([](const auto& tool) { return std::decay_t<decltype(tool)>::kDescription; }, t);
}

ToolRegistry::ToolRegistry()
    : ToolRegistry(std::vector<Tool>{CalculatorTool{}, TextAnalyzerTool{}, DateTimeTool{}}) {}

ToolRegistry::ToolRegistry(std::vector<Tool> tools) : tools_(std::move(tools)) {
    for (size_t i = 0; i < tools_.size(); ++i) {
        for (size_t j = 0; j < i; ++j) {
            if (std::string(tool_name(tools_[i])) == tool_name(tools_[j])) {
                throw ConfigError(std::string("duplicate tool name: ") + tool_name(tools_[i]));
            }
        }
    }
}

const Tool* ToolRegistry::find(const std::string& name) const {
    std::string key = to_lower(trim(name));
    for (auto& t : tools_) {
        if (key == tool_name(t)) return &t;
    }
    return nullptr;
}

std::optional<std::string> ToolRegistry::run(const std::string& name, const std::string& input) const {
    const Tool* t = find(name);
    if (!t) return std::nullopt;
    return std::visit([&](const auto& tool) { return tool.run(input); }, *t);
}

std::vector<ToolSpec> ToolRegistry::specs() const {
    std::vector<ToolSpec> out;
    for (auto& t : tools_) out.push_back({tool_name(t), tool_description(t)});
    return out;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    for (auto& t : tools_) out.push_back(tool_name(t));
    return out;
}
