#include "output/output_extractor.hpp"

#include <vector>

#include "utils/common.hpp"

namespace agentrun::output {
namespace {

std::string StringField(const nlohmann::json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return {};
}

}  // namespace

std::string ExtractPatch(const nlohmann::json& output) {
    if (!output.is_object()) {
        return {};
    }
    auto patch = StringField(output, "patch");
    if (!patch.empty()) {
        return patch;
    }
    if (!output.contains("result")) {
        return {};
    }
    const auto& result = output["result"];
    if (result.is_object()) {
        return StringField(result, "patch");
    }
    if (result.is_string()) {
        return result.get<std::string>();
    }
    return {};
}

nlohmann::json ExtractOutputFromLogs(const std::string& logs) {
    const auto lines = agentrun::utils::SplitLines(logs);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const auto line = agentrun::utils::Trim(*it);
        if (line.size() < 2 || line.front() != '{' || line.back() != '}') {
            continue;
        }
        auto parsed = nlohmann::json::parse(line, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            return parsed;
        }
    }
    return nlohmann::json{{"logs", logs}};
}

AgentVerdict ReadVerdict(const nlohmann::json& output) {
    AgentVerdict verdict{};
    if (!output.is_object() || !output.contains("success") || !output["success"].is_boolean()) {
        return verdict;
    }
    verdict.success = output["success"].get<bool>();
    if (verdict.success) {
        return verdict;
    }
    auto message = StringField(output, "error");
    if (message.empty()) {
        message = "agent reported failure";
    }
    const auto kind = StringField(output, "error_type") == "unsupported_agent"
        ? agentrun::errors::ErrorKind::kUnsupportedAgent
        : agentrun::errors::ErrorKind::kExecution;
    verdict.error = agentrun::errors::MakeError(kind, std::move(message));
    return verdict;
}

}  // namespace agentrun::output
