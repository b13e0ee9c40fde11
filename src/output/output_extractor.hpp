#pragma once

#include <string>

#include "errors/errors.hpp"
#include "nlohmann/json.hpp"

namespace agentrun::output {

// Canonical patch of an output document. Precedence is fixed:
//   1. top-level "patch"
//   2. "result"."patch" when "result" is an object
//   3. "result" when it is a string
//   4. empty
std::string ExtractPatch(const nlohmann::json& output);

// Last log line that parses as a JSON object, else {"logs": <raw text>}.
nlohmann::json ExtractOutputFromLogs(const std::string& logs);

struct AgentVerdict {
    bool success = true;
    agentrun::errors::Error error;
};

// Reads the "success" flag the bootstrap writes into the output document.
AgentVerdict ReadVerdict(const nlohmann::json& output);

}  // namespace agentrun::output
