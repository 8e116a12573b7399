#include "core/Base.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Hypercube
{

    Ref<spdlog::logger> Log::s_coreLogger   = nullptr;
    Ref<spdlog::logger> Log::s_clientLogger = nullptr;

    namespace
    {
        spdlog::level::level_enum ToSpdlogLevel( LogLevel level )
        {
            switch( level )
            {
                case LogLevel::TRACE:
                    return spdlog::level::trace;
                case LogLevel::INFO:
                    return spdlog::level::info;
                case LogLevel::WARN:
                    return spdlog::level::warn;
                case LogLevel::ERROR:
                    return spdlog::level::err;
                case LogLevel::OFF:
                default:
                    return spdlog::level::off;
            }
        }
    } // namespace

    void Log::Init()
    {
        if( s_coreLogger != nullptr )
        {
            return;
        }

        spdlog::set_pattern( "%^[%T] %n: %v%$" );

        // The host may have registered loggers under these names already (e.g. a second module instance)
        s_coreLogger   = spdlog::get( "CORE" );
        s_clientLogger = spdlog::get( "CLIENT" );
        if( !s_coreLogger )
            s_coreLogger = spdlog::stdout_color_mt( "CORE" );
        if( !s_clientLogger )
            s_clientLogger = spdlog::stdout_color_mt( "CLIENT" );

        s_coreLogger->set_level( spdlog::level::trace );
        s_clientLogger->set_level( spdlog::level::trace );

        HC_CORE_INFO( "Logging system initialized." );
    }

    void Log::SetLevel( LogLevel level )
    {
        Init();
        s_coreLogger->set_level( ToSpdlogLevel( level ) );
        s_clientLogger->set_level( ToSpdlogLevel( level ) );
    }

} // namespace Hypercube
