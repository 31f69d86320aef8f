#pragma once

#include <slack_mcp/core/result.hpp>

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// ToolSchema - public metadata of a tool, as listed by tools/list.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    bool operator==(const ToolSchema& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }
};

// ---------------------------------------------------------------------------
// ITool - contract every registered tool satisfies.
//
// Execute() receives the call's arguments object and returns the result
// value, or Err for an expected failure. It may also throw; the Dispatcher
// turns both into an error envelope. Execute() can be invoked concurrently
// from several worker threads; tools that keep mutable state must
// synchronize it themselves.
// ---------------------------------------------------------------------------
class ITool {
public:
    virtual ~ITool() = default;

    ITool(const ITool&) = delete;
    ITool& operator=(const ITool&) = delete;
    ITool(ITool&&) = delete;
    ITool& operator=(ITool&&) = delete;

    [[nodiscard]] virtual const std::string& Name() const = 0;
    [[nodiscard]] virtual const std::string& Description() const = 0;
    [[nodiscard]] virtual const nlohmann::json& InputSchema() const = 0;

    [[nodiscard]] virtual Result<nlohmann::json, Error> Execute(
        const nlohmann::json& args) const = 0;

protected:
    ITool() = default;
};

// A tool handler takes the arguments object and returns the result value.
using ToolHandler =
    std::function<Result<nlohmann::json, Error>(const nlohmann::json& args)>;

// ---------------------------------------------------------------------------
// FunctionTool - ITool backed by a ToolHandler callable.
// ---------------------------------------------------------------------------
class FunctionTool : public ITool {
public:
    FunctionTool(std::string name, std::string description,
                 nlohmann::json input_schema, ToolHandler handler)
        : name_(std::move(name)),
          description_(std::move(description)),
          input_schema_(std::move(input_schema)),
          handler_(std::move(handler)) {}

    [[nodiscard]] const std::string& Name() const override { return name_; }
    [[nodiscard]] const std::string& Description() const override {
        return description_;
    }
    [[nodiscard]] const nlohmann::json& InputSchema() const override {
        return input_schema_;
    }

    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        const nlohmann::json& args) const override {
        return handler_(args);
    }

private:
    std::string name_;
    std::string description_;
    nlohmann::json input_schema_;
    ToolHandler handler_;
};

} // namespace slack_mcp
