#pragma once

#ifdef _WIN32
    #define REASM_PLATFORM_WINDOWS
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <windows.h>
#else
    #define REASM_PLATFORM_LINUX
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <sys/types.h>
    #include <unistd.h>
#endif

namespace reasm {

enum class Platform {
    Windows,
    Linux,
    Unknown
};

inline Platform get_platform() {
#ifdef REASM_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(REASM_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name() {
    switch(get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::Linux: return "Linux";
        default: return "Unknown";
    }
}

} // namespace reasm
