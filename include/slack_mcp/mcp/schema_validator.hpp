#pragma once

#include <slack_mcp/core/result.hpp>

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// IArgumentValidator - checks tools/call arguments against a tool's schema
// before the tool runs. Err carries a client-safe description of the first
// mismatch.
// ---------------------------------------------------------------------------
class IArgumentValidator {
public:
    virtual ~IArgumentValidator() = default;

    [[nodiscard]] virtual Result<void, std::string> Validate(
        const nlohmann::json& schema, const nlohmann::json& args) const = 0;
};

// ---------------------------------------------------------------------------
// JsonSchemaValidator - the subset of JSON Schema that tool schemas use:
//
//   type (single or array), properties, required, additionalProperties
//   (false only), enum, minLength, maxLength, pattern, minimum, maximum,
//   items, minItems, maxItems
//
// Unknown keywords are ignored. Errors name the offending path, e.g.
// "limit: must be <= 1000". Strings longer than kMaxPatternInputLength bytes
// fail any `pattern` without being matched.
// ---------------------------------------------------------------------------
inline constexpr std::size_t kMaxPatternInputLength = 4096;

class JsonSchemaValidator : public IArgumentValidator {
public:
    [[nodiscard]] Result<void, std::string> Validate(
        const nlohmann::json& schema,
        const nlohmann::json& args) const override;
};

} // namespace slack_mcp
