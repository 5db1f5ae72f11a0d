#pragma once

// ============================================================================
// Platform, compiler and build configuration
// ============================================================================
// IMSERIES_PLATFORM_* is set by CMake. Headers of third-party libraries
// (toml++, spdlog/fmt) are wrapped in IMS_DISABLE_WARNINGS_PUSH/POP.
// ============================================================================

// Platform identification macros (defined by CMake)
#if defined(IMSERIES_PLATFORM_WINDOWS)
    #define IMS_WINDOWS 1
#elif defined(IMSERIES_PLATFORM_LINUX)
    #define IMS_LINUX 1
#elif defined(IMSERIES_PLATFORM_MACOS)
    #define IMS_MACOS 1
#else
    #error "Unsupported platform! Imseries requires Windows, Linux, or macOS."
#endif

// Compiler detection
#if defined(_MSC_VER)
    #define IMS_COMPILER_MSVC 1
#elif defined(__clang__)
    #define IMS_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define IMS_COMPILER_GCC 1
#else
    #error "Unsupported compiler! C++20 support required."
#endif

// Build configuration
#if defined(NDEBUG)
    #define IMS_RELEASE 1
#else
    #define IMS_DEBUG 1
#endif

// Exported symbols of the Imseries library
#if defined(IMS_WINDOWS)
    #if defined(IMS_BUILD_SHARED)
        #define IMS_API __declspec(dllexport)
    #elif defined(IMS_USE_SHARED)
        #define IMS_API __declspec(dllimport)
    #else
        #define IMS_API
    #endif
#else
    #define IMS_API __attribute__((visibility("default")))
#endif

// Disable specific warnings for third-party headers
#if defined(IMS_COMPILER_MSVC)
    #define IMS_DISABLE_WARNINGS_PUSH __pragma(warning(push, 0))
    #define IMS_DISABLE_WARNINGS_POP  __pragma(warning(pop))
#elif defined(IMS_COMPILER_CLANG) || defined(IMS_COMPILER_GCC)
    #define IMS_DISABLE_WARNINGS_PUSH \
        _Pragma("GCC diagnostic push") \
        _Pragma("GCC diagnostic ignored \"-Wall\"") \
        _Pragma("GCC diagnostic ignored \"-Wextra\"")
    #define IMS_DISABLE_WARNINGS_POP _Pragma("GCC diagnostic pop")
#endif

namespace imseries {

/// Compile-time description of the build, logged at startup
struct BuildInfo {
    const char* platform;
    const char* compiler;
    const char* config;
};

constexpr BuildInfo GetBuildInfo() {
    BuildInfo info{"Unknown", "Unknown", "Release"};
#if defined(IMS_WINDOWS)
    info.platform = "Windows";
#elif defined(IMS_LINUX)
    info.platform = "Linux";
#elif defined(IMS_MACOS)
    info.platform = "macOS";
#endif

#if defined(IMS_COMPILER_MSVC)
    info.compiler = "MSVC";
#elif defined(IMS_COMPILER_CLANG)
    info.compiler = "Clang";
#elif defined(IMS_COMPILER_GCC)
    info.compiler = "GCC";
#endif

#if defined(IMS_DEBUG)
    info.config = "Debug";
#endif
    return info;
}

} // namespace imseries
