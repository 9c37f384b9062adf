#pragma once

#include <optional>
#include <string>
#include "core/errors/service_errors.hpp"
#include "policy/request_guard.hpp"
#include "protocol/execution_contract.hpp"

namespace venvbox::protocol {

// A decoded inbound document. `correlation_id` is the optional "id" member that
// the line-oriented server echoes back.
struct DecodedRequest {
    ExecutionRequest request;
    std::optional<std::string> correlation_id;
};

// Parses {"code": ..., "lib": [...] | null, "name": ... | null, "id": ...}
// and validates name and specifiers before anything reaches the core.
core::errors::Result<DecodedRequest> decode_request(
    const std::string& json_text, const policy::RequestGuard& guard = policy::RequestGuard{});

std::string encode_result(const ExecutionResult& result,
                          const std::optional<std::string>& correlation_id = std::nullopt);

std::string encode_service_info(const std::string& version);

}  // namespace venvbox::protocol
