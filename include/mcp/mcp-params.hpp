#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace mcp {

using json = nlohmann::ordered_json;

struct mcp_session_params {
    int32_t call_timeout_ms = 0;    // default per-call deadline, 0 - wait until response or close
    int32_t kill_grace_ms   = 100;  // time given to the peer to exit on its own after stdin is closed

    bool log_frames         = false; // log every frame read and written (debug level)
    bool send_exit_on_close = true;  // best-effort "exit" notification on close

    // stderr lines containing one of these (case-insensitive) are logged as errors
    std::vector<std::string> stderr_error_markers = { "error:", "fatal:" };
};

struct mcp_client_params {
    std::string client_name      = "mcp-client";
    std::string client_version   = "0.1.0";
    std::string protocol_version = "2024-11-05";

    json capabilities = json::object();

    mcp_session_params session;
};

} // namespace mcp
