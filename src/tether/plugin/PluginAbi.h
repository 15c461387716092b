/* C interface between the tether runtime and plugin libraries. */
#ifndef TETHER_PLUGIN_ABI_H
#define TETHER_PLUGIN_ABI_H

#ifdef __cplusplus
extern "C" {
#endif

#define TETHER_PLUGIN_ABI_VERSION 1

#if defined(_WIN32)
#define TETHER_PLUGIN_EXPORT __declspec(dllexport)
#else
#define TETHER_PLUGIN_EXPORT __attribute__((visibility("default")))
#endif

/* plog severities */
enum tether_log_level
{
    TETHER_LOG_FATAL = 1,
    TETHER_LOG_ERROR = 2,
    TETHER_LOG_WARNING = 3,
    TETHER_LOG_INFO = 4,
    TETHER_LOG_DEBUG = 5,
    TETHER_LOG_VERBOSE = 6
};

typedef void (*tether_command_fn)(void* user_data, const char* command, const char* arguments);
typedef void (*tether_draw_fn)(void* user_data);

typedef struct tether_host_api_v1
{
    int abi_version;
    void* ctx;

    void (*log)(void* ctx, int level, const char* message);

    /* Returns 0 when the command already exists. */
    int (*add_command)(void* ctx, const char* command, const char* help, tether_command_fn fn, void* user_data);
    int (*remove_command)(void* ctx, const char* command);

    /* Returns a subscription id, 0 when the overlay is unavailable. */
    unsigned long long (*subscribe_draw)(void* ctx, tether_draw_fn fn, void* user_data);
    void (*unsubscribe_draw)(void* ctx, unsigned long long id);

    const char* (*game_version)(void* ctx);
    const char* (*language)(void* ctx);
} tether_host_api_v1;

/* Plugin entry points, resolved by name. load returns 0 on success. */
typedef int (*tether_plugin_load_fn)(const tether_host_api_v1* host);
typedef void (*tether_plugin_unload_fn)(void);

#define TETHER_PLUGIN_LOAD_SYMBOL "tether_plugin_load"
#define TETHER_PLUGIN_UNLOAD_SYMBOL "tether_plugin_unload"

#ifdef __cplusplus
}
#endif

#endif /* TETHER_PLUGIN_ABI_H */
