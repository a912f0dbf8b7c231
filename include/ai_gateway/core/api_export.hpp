#pragma once

/**
 * API Export Macros
 * 
 * 跨平台动态库导出支持
 * 
 * 使用示例:
 * class AI_GATEWAY_API Dispatcher { ... };
 */

#if defined(_WIN32) || defined(__CYGWIN__)
    #ifdef AI_GATEWAY_EXPORTS
        #define AI_GATEWAY_API __declspec(dllexport)
    #else
        #define AI_GATEWAY_API __declspec(dllimport)
    #endif
    #define AI_GATEWAY_LOCAL
#else
    #if __GNUC__ >= 4
        #define AI_GATEWAY_API __attribute__((visibility("default")))
        #define AI_GATEWAY_LOCAL __attribute__((visibility("hidden")))
    #else
        #define AI_GATEWAY_API
        #define AI_GATEWAY_LOCAL
    #endif
#endif
