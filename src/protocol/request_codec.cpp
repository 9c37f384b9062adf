#include "protocol/request_codec.hpp"

#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace venvbox::protocol {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

ServiceError field_error(const std::string& message) {
    return ServiceError{ErrorCategory::Input, message, "invalid_request"};
}

}  // namespace

core::errors::Result<DecodedRequest> decode_request(const std::string& json_text,
                                                    const policy::RequestGuard& guard) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return ServiceError{ErrorCategory::Input,
                            std::string("Malformed request JSON: ") + e.what(),
                            "malformed_json"};
    }

    if (!document.is_object()) {
        return field_error("Request must be a JSON object.");
    }

    DecodedRequest decoded;

    const auto code = document.find("code");
    if (code == document.end() || !code->is_string()) {
        return field_error("Field 'code' is required and must be a string.");
    }
    decoded.request.code = code->get<std::string>();

    const auto lib = document.find("lib");
    if (lib != document.end() && !lib->is_null()) {
        if (!lib->is_array()) {
            return field_error("Field 'lib' must be an array of strings.");
        }
        std::vector<std::string> specifiers;
        for (const auto& item : *lib) {
            if (!item.is_string()) {
                return field_error("Field 'lib' must be an array of strings.");
            }
            specifiers.push_back(item.get<std::string>());
        }
        auto checked = guard.validate_dependencies(specifiers);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        decoded.request.dependencies = std::move(specifiers);
    }

    const auto name = document.find("name");
    if (name != document.end() && !name->is_null()) {
        if (!name->is_string()) {
            return field_error("Field 'name' must be a string.");
        }
        auto checked = guard.validate_environment_name(name->get<std::string>());
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        decoded.request.environment_name = core::errors::get_value(checked);
    }

    const auto id = document.find("id");
    if (id != document.end() && !id->is_null()) {
        decoded.correlation_id = id->is_string() ? id->get<std::string>() : id->dump();
    }

    return decoded;
}

std::string encode_result(const ExecutionResult& result,
                          const std::optional<std::string>& correlation_id) {
    json payload;
    if (correlation_id.has_value()) {
        payload["id"] = correlation_id.value();
    }
    payload["output"] = result.output;
    payload["error"] = result.error;
    // Child output is arbitrary bytes; replace invalid UTF-8 instead of throwing.
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_service_info(const std::string& version) {
    json payload;
    payload["message"] = "Python Code Execution Service";
    payload["version"] = version;
    payload["endpoint"] = "execute";
    return payload.dump();
}

}  // namespace venvbox::protocol
