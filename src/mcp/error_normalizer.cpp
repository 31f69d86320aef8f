#include <slack_mcp/mcp/error_normalizer.hpp>

#include <new>

namespace slack_mcp {

namespace {

// Cut to the size limit without splitting a UTF-8 sequence.
std::string Bounded(std::string message) {
    if (message.size() <= kMaxErrorMessageLength) return message;
    size_t cut = kMaxErrorMessageLength;
    while (cut > 0 &&
           (static_cast<unsigned char>(message[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    message.resize(cut);
    return message;
}

std::string OrUnknown(std::string message) {
    if (message.empty()) return kUnknownErrorMessage;
    return Bounded(std::move(message));
}

// "[json.exception.out_of_range.403] key 'text' not found" -> "key 'text' not found"
std::string WithoutJsonExceptionId(const char* what) {
    if (what == nullptr) return "";
    std::string text(what);
    if (text.rfind("[json.exception.", 0) == 0) {
        auto end = text.find("] ");
        if (end != std::string::npos) return text.substr(end + 2);
    }
    return text;
}

} // anonymous namespace

DispatchFailure DispatchFailure::NotFound(std::string tool_name) {
    return {FailureKind::NotFound, std::move(tool_name), ""};
}

DispatchFailure DispatchFailure::Malformed(std::string tool_name,
                                           std::string detail) {
    return {FailureKind::MalformedRequest, std::move(tool_name),
            std::move(detail)};
}

DispatchFailure DispatchFailure::Execution(std::string tool_name,
                                           std::string message) {
    return {FailureKind::Execution, std::move(tool_name), std::move(message)};
}

DispatchFailure DispatchFailure::TimedOut(std::string tool_name,
                                          long long timeout_ms) {
    auto message = "Tool '" + tool_name + "' timed out after " +
                   std::to_string(timeout_ms) + " ms";
    return {FailureKind::Timeout, std::move(tool_name), std::move(message)};
}

std::string NormalizeFailure(const DispatchFailure& failure) noexcept {
    try {
        switch (failure.kind) {
            case FailureKind::NotFound:
                return Bounded("Tool '" + failure.tool + "' not found");
            case FailureKind::MalformedRequest:
                if (failure.message.empty()) return "Invalid request";
                return Bounded("Invalid request: " + failure.message);
            case FailureKind::Execution:
            case FailureKind::Timeout:
                return OrUnknown(failure.message);
        }
    } catch (const std::bad_alloc&) {
        // fall through to the static message
    }
    return kUnknownErrorMessage;
}

std::string NormalizeException(std::exception_ptr error) noexcept {
    if (!error) return kUnknownErrorMessage;
    try {
        std::rethrow_exception(error);
    } catch (const nlohmann::json::exception& e) {
        // Type errors from reading arguments, e.g. args["limit"].get<int>().
        auto detail = WithoutJsonExceptionId(e.what());
        if (detail.empty()) return "Invalid argument";
        return Bounded("Invalid argument: " + detail);
    } catch (const std::exception& e) {
        const char* what = e.what();
        return OrUnknown(what != nullptr ? std::string(what) : std::string());
    } catch (const std::string& s) {
        return OrUnknown(s);
    } catch (const char* s) {
        return OrUnknown(s != nullptr ? std::string(s) : std::string());
    } catch (const nlohmann::json& value) {
        return NormalizeValue(value);
    } catch (...) {
        // Integers, null pointers and foreign types carry no description.
        return kUnknownErrorMessage;
    }
}

std::string NormalizeValue(const nlohmann::json& value) noexcept {
    try {
        if (value.is_string()) {
            return OrUnknown(value.get<std::string>());
        }
        if (value.is_object()) {
            for (const char* key : {"message", "error"}) {
                auto it = value.find(key);
                if (it != value.end() && it->is_string()) {
                    auto text = it->get<std::string>();
                    if (!text.empty()) return Bounded(std::move(text));
                }
            }
        }
    } catch (const std::exception&) {
        // fall through to the static message
    }
    return kUnknownErrorMessage;
}

std::string NormalizeError(const Error& error) noexcept {
    try {
        return OrUnknown(error.message);
    } catch (const std::exception&) {
        return kUnknownErrorMessage;
    }
}

} // namespace slack_mcp
