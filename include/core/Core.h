#pragma once

#include <cstdint>
#include <string_view>

// Shared library export (Windows DLL builds only)
#if defined( _WIN32 ) && defined( HC_SHARED )
#    ifdef HC_BUILD_DLL
#        define HC_API __declspec( dllexport )
#    else
#        define HC_API __declspec( dllimport )
#    endif
#else
#    define HC_API
#endif

namespace Hypercube
{
    using bool_t = bool;

    // Error codes
    enum class Result : int32_t
    {
        SUCCESS       = 0,
        INVALID_ARGS  = -3,
        OUT_OF_MEMORY = -10
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::OUT_OF_MEMORY:
                return "OUT_OF_MEMORY";
            default:
                return "UNKNOWN";
        }
    }
} // namespace Hypercube
