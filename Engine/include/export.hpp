#pragma once

#if defined(_WIN32)
    #if defined(ARMORY_EXPORT)
        #define ARMORY_API __declspec(dllexport)
    #else
        #define ARMORY_API __declspec(dllimport)
    #endif
#else
    #define ARMORY_API __attribute__((visibility("default")))
#endif
