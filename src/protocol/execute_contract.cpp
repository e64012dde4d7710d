#include "protocol/execute_contract.hpp"

namespace agentcli::protocol {

using nlohmann::json;

json to_json(const ExecuteResult& result) {
    json payload;
    payload["success"] = result.success;
    payload["exitCode"] = result.exit_code;
    payload["sessionId"] = result.session_id;
    payload["duration"] = result.duration_ms;
    payload["data"] = result.data;
    payload["messages"] = to_json(result.messages);
    if (result.usage.has_value()) {
        payload["usage"] = to_json(result.usage.value());
    }
    if (result.error.has_value()) {
        payload["error"] = result.error.value();
    }
    if (result.timed_out) {
        payload["timedOut"] = true;
    }
    if (result.cancelled) {
        payload["cancelled"] = true;
    }
    return payload;
}

}  // namespace agentcli::protocol
