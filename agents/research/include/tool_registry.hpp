#pragma once
#include "tools.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

using Tool = std::variant<CalculatorTool, TextAnalyzerTool, DateTimeTool>;

struct ToolSpec {
    std::string name;
    std::string description;
};

const char* tool_name(const Tool& t);
const char* tool_description(const Tool& t);

// Closed set of tools addressed by their stable names.
class ToolRegistry {
public:
    // calculator, text_analyzer, datetime_tool in that order.
    ToolRegistry();
    explicit ToolRegistry(std::vector<Tool> tools);

    const Tool* find(const std::string& name) const;
    // Output of the named tool, or nullopt when no tool has that name.
    std::optional<std::string> run(const std::string& name, const std::string& input) const;

    std::vector<ToolSpec> specs() const;
    std::vector<std::string> names() const;
    size_t size() const { return tools_.size(); }

private:
    std::vector<Tool> tools_;
};
