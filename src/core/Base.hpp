#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace Wire3D
{
    // Error codes
    enum class Result : int32_t
    {
        SUCCESS      = 0,
        FAIL         = -1,
        INVALID_ARGS = -2,
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;
} // namespace Wire3D

#include "core/Log.hpp"

#if defined( _MSC_VER )
#    define W3D_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define W3D_DEBUGBREAK() raise( SIGTRAP )
#else
#    define W3D_DEBUGBREAK()
#endif

#ifdef W3D_DEBUG
#    define W3D_ENABLE_ASSERTS
#endif

#ifdef W3D_ENABLE_ASSERTS
#    define W3D_CORE_ASSERT( x, ... )                                                                                                                \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                W3D_CORE_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                              \
                W3D_DEBUGBREAK();                                                                                                                    \
            }                                                                                                                                        \
        }
#else
#    define W3D_CORE_ASSERT( x, ... )
#endif

