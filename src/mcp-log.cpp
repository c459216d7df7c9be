#include "mcp/mcp-log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

struct mcp_logger_state {
    mcp_log_callback log_callback = mcp_log_callback_default;
    void * log_callback_user_data = nullptr;
    std::atomic<int> min_level{MCP_LOG_LEVEL_INFO};
    std::mutex mtx;
};

static mcp_logger_state g_logger_state;

void mcp_log_set(mcp_log_callback log_callback, void * user_data) {
    std::lock_guard<std::mutex> lock(g_logger_state.mtx);
    g_logger_state.log_callback = log_callback ? log_callback : mcp_log_callback_default;
    g_logger_state.log_callback_user_data = user_data;
}

void mcp_log_set_level(enum mcp_log_level level) {
    g_logger_state.min_level = level;
}

enum mcp_log_level mcp_log_get_level() {
    return (enum mcp_log_level) g_logger_state.min_level.load();
}

static void mcp_log_internal_v(enum mcp_log_level level, const char * format, va_list args) {
    va_list args_copy;
    va_copy(args_copy, args);

    mcp_log_callback callback;
    void * user_data;
    {
        std::lock_guard<std::mutex> lock(g_logger_state.mtx);
        callback  = g_logger_state.log_callback;
        user_data = g_logger_state.log_callback_user_data;
    }

    char buffer[128];
    int len = vsnprintf(buffer, 128, format, args);
    if (len < 0) {
        va_end(args_copy);
        return;
    }
    if (len < 128) {
        callback(level, buffer, user_data);
    } else {
        char * buffer2 = new char[len + 1];
        vsnprintf(buffer2, len + 1, format, args_copy);
        buffer2[len] = 0;
        callback(level, buffer2, user_data);
        delete[] buffer2;
    }
    va_end(args_copy);
}

void mcp_log_internal(enum mcp_log_level level, const char * format, ...) {
    if (level < g_logger_state.min_level.load()) {
        return;
    }
    va_list args;
    va_start(args, format);
    mcp_log_internal_v(level, format, args);
    va_end(args);
}

void mcp_log_callback_default(enum mcp_log_level level, const char * text, void * user_data) {
    (void) level;
    (void) user_data;
    fputs(text, stderr);
    fflush(stderr);
}
