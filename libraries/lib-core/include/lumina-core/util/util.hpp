#pragma once

#ifndef lumina_util_hpp
#define lumina_util_hpp

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <functional>

#if (defined(__linux) || defined(__unix) || defined(__posix) || defined(__LINUX__) || defined(__linux__))
    #define LUMINA_PLATFORM_LINUX 1
#elif (defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN32__) || defined(__MINGW32__))
    #define LUMINA_PLATFORM_WINDOWS 1
#elif (defined(MACOSX) || defined(__DARWIN__) || defined(__APPLE__))
    #define LUMINA_PLATFORM_OSX 1
#endif

#if (defined(__clang__))
    #define LUMINA_COMPILER_CLANG 1
#elif (defined(__GNUC__))
    #define LUMINA_COMPILER_GCC 1
#elif (defined _MSC_VER)
    #define LUMINA_COMPILER_VISUAL_STUDIO 1
#endif

namespace lumina
{
    class non_copyable
    {
    protected:
        non_copyable() = default;
        ~non_copyable() = default;
        non_copyable (const non_copyable & r) = delete;
        non_copyable & operator = (const non_copyable & r) = delete;
    };

    template <typename T>
    class singleton : public non_copyable
    {
        singleton(const singleton<T> &);
        singleton & operator = (const singleton<T> &);
    protected:
        static T * single;
        singleton() = default;
        ~singleton() = default;
    public:
        static T * get() { if (!single) single = new T(); return single; };
    };

} // end namespace lumina

#endif // end lumina_util_hpp
