#ifndef GZSPLIT_EXPORT_H
#define GZSPLIT_EXPORT_H

// Define export macros for different platforms
#if defined(_WIN32) || defined(_WIN64)
    #ifdef GZSPLIT_BUILDING_SHARED_LIBRARY
        #define GZSPLIT_API __declspec(dllexport)
    #else
        #define GZSPLIT_API __declspec(dllimport)
    #endif
#else
    #ifdef GZSPLIT_BUILDING_SHARED_LIBRARY
        #define GZSPLIT_API __attribute__((visibility("default")))
    #else
        #define GZSPLIT_API
    #endif
#endif

#endif // GZSPLIT_EXPORT_H
