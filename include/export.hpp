#pragma once

#if defined(_WIN32)
    #if defined(CHROMASEQ_EXPORT)
        #define CHROMASEQ_API __declspec(dllexport)
    #else
        #define CHROMASEQ_API __declspec(dllimport)
    #endif
#else
    #define CHROMASEQ_API __attribute__((visibility("default")))
#endif
