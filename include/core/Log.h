#pragma once

#include "HypercubeTypes.h"
#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace Hypercube
{
    class HC_API Log
    {
    public:
        static void Init();
        static void SetLevel( LogLevel level );

        inline static std::shared_ptr<spdlog::logger>& GetCoreLogger() { return s_coreLogger; }
        inline static std::shared_ptr<spdlog::logger>& GetClientLogger() { return s_clientLogger; }

    private:
        static std::shared_ptr<spdlog::logger> s_coreLogger;
        static std::shared_ptr<spdlog::logger> s_clientLogger;
    };
} // namespace Hypercube

#define HC_CORE_TRACE( ... )    ::Hypercube::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#define HC_CORE_INFO( ... )     ::Hypercube::Log::GetCoreLogger()->info( __VA_ARGS__ )
#define HC_CORE_WARN( ... )     ::Hypercube::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#define HC_CORE_ERROR( ... )    ::Hypercube::Log::GetCoreLogger()->error( __VA_ARGS__ )
#define HC_CORE_CRITICAL( ... ) ::Hypercube::Log::GetCoreLogger()->critical( __VA_ARGS__ )

#define HC_TRACE( ... )    ::Hypercube::Log::GetClientLogger()->trace( __VA_ARGS__ )
#define HC_INFO( ... )     ::Hypercube::Log::GetClientLogger()->info( __VA_ARGS__ )
#define HC_WARN( ... )     ::Hypercube::Log::GetClientLogger()->warn( __VA_ARGS__ )
#define HC_ERROR( ... )    ::Hypercube::Log::GetClientLogger()->error( __VA_ARGS__ )
#define HC_CRITICAL( ... ) ::Hypercube::Log::GetClientLogger()->critical( __VA_ARGS__ )
