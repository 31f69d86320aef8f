#include <slack_mcp/mcp/schema_validator.hpp>

#include <cmath>
#include <optional>
#include <regex>

namespace slack_mcp {

namespace {

using VoidResult = Result<void, std::string>;

VoidResult Fail(const std::string& path, const std::string& message) {
    return VoidResult::Err((path.empty() ? std::string("arguments") : path) +
                           ": " + message);
}

std::string ChildPath(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string IndexPath(const std::string& parent, size_t index) {
    return (parent.empty() ? std::string("arguments") : parent) + "[" +
           std::to_string(index) + "]";
}

bool MatchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null") return value.is_null();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        // 3.0 is an integer in JSON Schema.
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && std::trunc(d) == d;
        }
        return false;
    }
    return true;  // unknown type names do not constrain
}

VoidResult CheckType(const nlohmann::json& schema, const nlohmann::json& value,
                     const std::string& path) {
    auto it = schema.find("type");
    if (it == schema.end()) return VoidResult::Ok();

    if (it->is_string()) {
        const auto type = it->get<std::string>();
        if (!MatchesType(type, value)) {
            return Fail(path, "expected " + type);
        }
        return VoidResult::Ok();
    }
    if (it->is_array()) {
        std::string expected;
        for (const auto& t : *it) {
            if (!t.is_string()) continue;
            if (MatchesType(t.get<std::string>(), value)) return VoidResult::Ok();
            if (!expected.empty()) expected += " or ";
            expected += t.get<std::string>();
        }
        return Fail(path, "expected " + expected);
    }
    return VoidResult::Ok();
}

// UTF-8 code points, which is what JSON Schema length keywords count.
size_t Utf8Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

// Non-negative integer keyword (minLength, maxItems, ...). Schemas built in
// C++ store small literals as signed integers, parsed ones as unsigned.
std::optional<size_t> SizeKeyword(const nlohmann::json& schema, const char* key) {
    auto it = schema.find(key);
    if (it == schema.end() || !it->is_number_integer()) return std::nullopt;
    const auto n = it->get<long long>();
    if (n < 0) return std::nullopt;
    return static_cast<size_t>(n);
}

VoidResult CheckString(const nlohmann::json& schema, const std::string& value,
                       const std::string& path) {
    const auto length = Utf8Length(value);
    if (auto min = SizeKeyword(schema, "minLength"); min && length < *min) {
        return Fail(path, "must be at least " + std::to_string(*min) +
                              " characters");
    }
    if (auto max = SizeKeyword(schema, "maxLength"); max && length > *max) {
        return Fail(path, "must be at most " + std::to_string(*max) +
                              " characters");
    }
    if (auto it = schema.find("pattern");
        it != schema.end() && it->is_string()) {
        // std::regex recurses per input character; long input exhausts the stack.
        if (value.size() > kMaxPatternInputLength) {
            return Fail(path, "must be at most " +
                                  std::to_string(kMaxPatternInputLength) +
                                  " bytes");
        }
        try {
            std::regex re(it->get<std::string>(), std::regex::ECMAScript);
            if (!std::regex_search(value, re)) {
                return Fail(path, "does not match pattern " +
                                      it->get<std::string>());
            }
        } catch (const std::regex_error&) {
            // A broken pattern in a tool schema is not the caller's fault.
        }
    }
    return VoidResult::Ok();
}

std::string FormatBound(const nlohmann::json& bound) {
    return bound.dump();
}

VoidResult CheckNumber(const nlohmann::json& schema, const nlohmann::json& value,
                       const std::string& path) {
    const double d = value.get<double>();
    if (auto it = schema.find("minimum");
        it != schema.end() && it->is_number() && d < it->get<double>()) {
        return Fail(path, "must be >= " + FormatBound(*it));
    }
    if (auto it = schema.find("maximum");
        it != schema.end() && it->is_number() && d > it->get<double>()) {
        return Fail(path, "must be <= " + FormatBound(*it));
    }
    return VoidResult::Ok();
}

VoidResult ValidateNode(const nlohmann::json& schema,
                        const nlohmann::json& value,
                        const std::string& path);

VoidResult CheckObject(const nlohmann::json& schema,
                       const nlohmann::json& value,
                       const std::string& path) {
    if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
        for (const auto& key : *it) {
            if (!key.is_string()) continue;
            const auto name = key.get<std::string>();
            if (!value.contains(name)) {
                return Fail(ChildPath(path, name), "is required");
            }
        }
    }

    const auto props_it = schema.find("properties");
    const bool has_props = props_it != schema.end() && props_it->is_object();

    for (const auto& item : value.items()) {
        const auto& key = item.key();
        const auto& child = item.value();
        if (has_props) {
            auto prop = props_it->find(key);
            if (prop != props_it->end()) {
                auto r = ValidateNode(*prop, child, ChildPath(path, key));
                if (r.IsErr()) return r;
                continue;
            }
        }
        auto additional = schema.find("additionalProperties");
        if (additional != schema.end() && additional->is_boolean() &&
            !additional->get<bool>()) {
            return Fail(ChildPath(path, key), "is not an allowed property");
        }
    }
    return VoidResult::Ok();
}

VoidResult CheckArray(const nlohmann::json& schema,
                      const nlohmann::json& value,
                      const std::string& path) {
    if (auto min = SizeKeyword(schema, "minItems"); min && value.size() < *min) {
        return Fail(path, "must have at least " + std::to_string(*min) + " items");
    }
    if (auto max = SizeKeyword(schema, "maxItems"); max && value.size() > *max) {
        return Fail(path, "must have at most " + std::to_string(*max) + " items");
    }
    if (auto it = schema.find("items"); it != schema.end() && it->is_object()) {
        for (size_t i = 0; i < value.size(); ++i) {
            auto r = ValidateNode(*it, value[i], IndexPath(path, i));
            if (r.IsErr()) return r;
        }
    }
    return VoidResult::Ok();
}

VoidResult ValidateNode(const nlohmann::json& schema,
                        const nlohmann::json& value,
                        const std::string& path) {
    if (!schema.is_object()) return VoidResult::Ok();

    auto r = CheckType(schema, value, path);
    if (r.IsErr()) return r;

    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        bool found = false;
        for (const auto& allowed : *it) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return Fail(path, "must be one of " + it->dump());
        }
    }

    if (value.is_string()) {
        return CheckString(schema, value.get<std::string>(), path);
    }
    if (value.is_number()) {
        return CheckNumber(schema, value, path);
    }
    if (value.is_object()) {
        return CheckObject(schema, value, path);
    }
    if (value.is_array()) {
        return CheckArray(schema, value, path);
    }
    return VoidResult::Ok();
}

} // anonymous namespace

Result<void, std::string> JsonSchemaValidator::Validate(
    const nlohmann::json& schema, const nlohmann::json& args) const {
    return ValidateNode(schema, args, "");
}

} // namespace slack_mcp
