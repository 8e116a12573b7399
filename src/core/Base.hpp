#pragma once

#include "core/Core.h"
#include <memory>

namespace Hypercube
{
    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;
} // namespace Hypercube

#include "core/Log.h"

#if defined( _MSC_VER )
#    define HC_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define HC_DEBUGBREAK() raise( SIGTRAP )
#else
#    define HC_DEBUGBREAK()
#endif

#ifdef HC_DEBUG
#    define HC_ENABLE_ASSERTS
#endif

#ifdef HC_ENABLE_ASSERTS
#    define HC_CORE_ASSERT( x, ... )                                                                                                                 \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                HC_CORE_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                               \
                HC_DEBUGBREAK();                                                                                                                     \
            }                                                                                                                                        \
        }
#else
#    define HC_CORE_ASSERT( x, ... )
#endif
