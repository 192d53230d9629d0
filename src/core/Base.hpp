#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace Batchline
{
    using bool_t    = bool;
    using float32_t = float;

    // Error codes
    enum class Result : int32_t
    {
        SUCCESS                 = 0,
        FAIL                    = -1,
        NOT_IMPLEMENTED         = -2,
        INVALID_ARGS            = -3,
        TIMEOUT                 = -4,
        OUT_OF_MEMORY           = -10,
        INVALID_OBJECT          = -20,
        BUFFER_OVERFLOW         = -21,
        DEVICE_DISPATCH_FAILURE = -22
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::NOT_IMPLEMENTED:
                return "NOT_IMPLEMENTED";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::TIMEOUT:
                return "TIMEOUT";
            case Result::OUT_OF_MEMORY:
                return "OUT_OF_MEMORY";
            case Result::INVALID_OBJECT:
                return "INVALID_OBJECT";
            case Result::BUFFER_OVERFLOW:
                return "BUFFER_OVERFLOW";
            case Result::DEVICE_DISPATCH_FAILURE:
                return "DEVICE_DISPATCH_FAILURE";
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

    template<typename T, typename... Args>
    constexpr Ref<T> CreateRef( Args&&... args )
    {
        return std::make_shared<T>( std::forward<Args>( args )... );
    }
} // namespace Batchline

#include "core/Log.hpp"

#if defined( _MSC_VER )
#    define BL_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define BL_DEBUGBREAK() raise( SIGTRAP )
#else
#    define BL_DEBUGBREAK()
#endif

#ifdef BL_DEBUG
#    define BL_ENABLE_ASSERTS
#endif

#ifdef BL_ENABLE_ASSERTS
#    define BL_CORE_ASSERT( x, ... )                                                                                                                 \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                BL_CORE_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                               \
                BL_DEBUGBREAK();                                                                                                                     \
            }                                                                                                                                        \
        }
#else
#    define BL_CORE_ASSERT( x, ... )
#endif
