#pragma once

#ifdef __GNUC__
#ifdef __MINGW32__
#define MCP_ATTRIBUTE_FORMAT(...) __attribute__((format(gnu_printf, __VA_ARGS__)))
#else
#define MCP_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#endif
#else
#define MCP_ATTRIBUTE_FORMAT(...)
#endif

enum mcp_log_level {
    MCP_LOG_LEVEL_DEBUG = 1,
    MCP_LOG_LEVEL_INFO  = 2,
    MCP_LOG_LEVEL_WARN  = 3,
    MCP_LOG_LEVEL_ERROR = 4,
};

typedef void (*mcp_log_callback)(enum mcp_log_level level, const char * text, void * user_data);

// set the log callback, pass nullptr to restore the default (stderr)
void mcp_log_set(mcp_log_callback log_callback, void * user_data);

// messages below this level are dropped before formatting (default: info)
void mcp_log_set_level(enum mcp_log_level level);
enum mcp_log_level mcp_log_get_level();

MCP_ATTRIBUTE_FORMAT(2, 3)
void mcp_log_internal        (enum mcp_log_level level, const char * format, ...);
void mcp_log_callback_default(enum mcp_log_level level, const char * text, void * user_data);

#define MCP_LOG_DEBUG(...) mcp_log_internal(MCP_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define MCP_LOG_INFO(...)  mcp_log_internal(MCP_LOG_LEVEL_INFO , __VA_ARGS__)
#define MCP_LOG_WARN(...)  mcp_log_internal(MCP_LOG_LEVEL_WARN , __VA_ARGS__)
#define MCP_LOG_ERROR(...) mcp_log_internal(MCP_LOG_LEVEL_ERROR, __VA_ARGS__)
