#include "mcp/mcp-client.hpp"
#include "mcp/mcp-log.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = mcp::json;

namespace {

struct demo_params {
    std::string              server_command;
    std::vector<std::string> server_args;

    std::string tool_name;
    json        tool_args = json::object();

    bool verbose = false;

    mcp::mcp_client_params client;
};

void demo_print_usage(int /*argc*/, char ** argv, const demo_params & params) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options] -- command [args...]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h,        --help              [default] show this help message and exit\n");
    fprintf(stderr, "  -v,        --verbose           [%-7s] debug logging\n",                              params.verbose ? "true" : "false");
    fprintf(stderr, "             --log-frames        [%-7s] log every frame sent and received\n",          params.client.session.log_frames ? "true" : "false");
    fprintf(stderr, "  -to N,     --timeout N         [%-7d] per-call timeout in milliseconds (0 - none)\n", params.client.session.call_timeout_ms);
    fprintf(stderr, "  -kg N,     --kill-grace N      [%-7d] milliseconds the server gets to exit on close\n", params.client.session.kill_grace_ms);
    fprintf(stderr, "  -n NAME,   --name NAME         [%-7s] client name sent on initialize\n",             params.client.client_name.c_str());
    fprintf(stderr, "             --tool NAME         [%-7s] tool to call after listing\n",                 params.tool_name.c_str());
    fprintf(stderr, "             --args JSON         [%-7s] tool arguments\n",                             params.tool_args.dump().c_str());
    fprintf(stderr, "\n");
}

bool parse_int(const std::string & arg, const char * value, int32_t & out) {
    size_t pos = 0;
    try {
        out = std::stoi(value, &pos);
    } catch (const std::logic_error &) {
        pos = 0;
    }
    if (pos == 0 || value[pos] != '\0') {
        fprintf(stderr, "error: invalid value for %s: %s\n", arg.c_str(), value);
        return false;
    }
    return true;
}

bool demo_params_parse(int argc, char ** argv, demo_params & params) {
    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--") {
            i++;
            break;
        }
        if (arg.empty() || arg[0] != '-') {
            // first positional argument is the server command
            break;
        }

        if (arg == "-h" || arg == "--help") {
            demo_print_usage(argc, argv, params);
            exit(0);
        }

        const bool has_value = i + 1 < argc;

        if      (arg == "-v"  || arg == "--verbose")    { params.verbose                        = true; }
        else if (                arg == "--log-frames") { params.client.session.log_frames      = true; }
        else if ((arg == "-to" || arg == "--timeout")    && has_value) { if (!parse_int(arg, argv[++i], params.client.session.call_timeout_ms)) { return false; } }
        else if ((arg == "-kg" || arg == "--kill-grace") && has_value) { if (!parse_int(arg, argv[++i], params.client.session.kill_grace_ms))   { return false; } }
        else if ((arg == "-n"  || arg == "--name")       && has_value) { params.client.client_name             = argv[++i]; }
        else if ((                arg == "--tool")       && has_value) { params.tool_name                      = argv[++i]; }
        else if ((                arg == "--args")       && has_value) {
            try {
                params.tool_args = json::parse(argv[++i]);
            } catch (const json::parse_error & e) {
                fprintf(stderr, "error: invalid --args: %s\n", e.what());
                return false;
            }
        }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    if (i >= argc) {
        fprintf(stderr, "error: missing server command\n");
        return false;
    }

    params.server_command = argv[i++];
    for (; i < argc; i++) {
        params.server_args.push_back(argv[i]);
    }

    return true;
}

void print_separator(const std::string & title) {
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(50, '=') << std::endl;
}

void pretty_print_json(const json & j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace

int main(int argc, char ** argv) {
    demo_params params;
    params.client.client_name = "mcp-demo-client";

    if (!demo_params_parse(argc, argv, params)) {
        demo_print_usage(argc, argv, params);
        return 1;
    }

    if (params.verbose) {
        mcp_log_set_level(MCP_LOG_LEVEL_DEBUG);
    }

    std::cout << "Starting MCP Demo" << std::endl;
    std::cout << "Server command: " << params.server_command << std::endl;

    try {
        print_separator("STARTING SERVER");
        std::unique_ptr<mcp::Client> client = mcp::Client::spawn(params.server_command, params.server_args, params.client);

        print_separator("INITIALIZING");
        const mcp::server_info info = client->initialize();
        pretty_print_json({
            {"protocolVersion", info.protocol_version},
            {"serverInfo", {
                {"name",    info.server.name},
                {"version", info.server.version}
            }},
            {"capabilities", info.capabilities},
            {"instructions", info.instructions ? json(*info.instructions) : json(nullptr)}
        });

        print_separator("PING");
        client->ping();
        std::cout << "pong" << std::endl;

        if (info.capabilities.contains("tools")) {
            print_separator("LISTING TOOLS");
            for (const auto & t : client->list_all_tools()) {
                std::cout << t.name;
                if (t.description) {
                    std::cout << " - " << *t.description;
                }
                std::cout << std::endl;
                pretty_print_json(t.input_schema);
            }
        }

        if (info.capabilities.contains("resources")) {
            print_separator("LISTING RESOURCES");
            for (const auto & r : client->list_all_resources()) {
                std::cout << r.uri << " (" << r.name << ")" << std::endl;
            }
        }

        if (!params.tool_name.empty()) {
            print_separator("CALLING TOOL " + params.tool_name);
            const mcp::call_tool_result result = client->call_tool(params.tool_name, params.tool_args);
            if (result.is_error) {
                std::cout << "tool reported an error" << std::endl;
            }
            pretty_print_json(result.content);
        }

        print_separator("CLOSING");
        client->close();

        print_separator("DEMO COMPLETED SUCCESSFULLY");
    } catch (const mcp::CallError & e) {
        std::cerr << "Error: " << e.what() << std::endl;
        if (!e.data().is_null()) {
            std::cerr << e.data().dump(2) << std::endl;
        }
        return 1;
    } catch (const std::exception & e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
