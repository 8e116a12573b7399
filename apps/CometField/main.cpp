#include <Hypercube.h>
#include <algorithm>
#include <core/Log.h>
#include <cstdlib>
#include <string>
#include <thread>

#include "core/FrameTimer.hpp"

namespace
{
    struct Options
    {
        float    viewport  = 25.0f;
        float    fov       = 60.0f;
        uint32_t comets    = 5;
        uint32_t particles = 0;
        float    seconds   = 60.0f;
        uint64_t seed      = 0;
        bool     replenish = false;
        bool     realtime  = false;
    };

    // --viewport <pct> --fov <deg> --comets <n> --particles <n> --seconds <s> --seed <n> --replenish --realtime
    bool ParseOptions( int argc, char** argv, Options& options )
    {
        for( int i = 1; i < argc; ++i )
        {
            std::string arg  = argv[ i ];
            bool        more = i + 1 < argc;

            if( arg == "--viewport" && more )
                options.viewport = std::strtof( argv[ ++i ], nullptr );
            else if( arg == "--fov" && more )
                options.fov = std::strtof( argv[ ++i ], nullptr );
            else if( arg == "--comets" && more )
                options.comets = static_cast<uint32_t>( std::strtoul( argv[ ++i ], nullptr, 10 ) );
            else if( arg == "--particles" && more )
                options.particles = static_cast<uint32_t>( std::strtoul( argv[ ++i ], nullptr, 10 ) );
            else if( arg == "--seconds" && more )
                options.seconds = std::strtof( argv[ ++i ], nullptr );
            else if( arg == "--seed" && more )
                options.seed = std::strtoull( argv[ ++i ], nullptr, 10 );
            else if( arg == "--replenish" )
                options.replenish = true;
            else if( arg == "--realtime" )
                options.realtime = true;
            else
            {
                HC_ERROR( "Unknown or incomplete option '{0}'", arg );
                return false;
            }
        }
        return true;
    }
} // namespace

int main( int argc, char** argv )
{
    Hypercube::Log::Init();

    Options options;
    if( !ParseOptions( argc, argv, options ) )
        return EXIT_FAILURE;

    Hypercube::SpaceModule     module;
    Hypercube::HypercubeConfig config;
    config.seed = options.seed;
    if( module.Initialize( config ) != Hypercube::Result::SUCCESS )
    {
        HC_ERROR( "Space module failed to initialize" );
        return EXIT_FAILURE;
    }

    Hypercube::SystemConfig systemConfig;
    systemConfig.viewportSizePercent = options.viewport;
    systemConfig.fieldOfViewDegrees  = options.fov;
    systemConfig.autoReplenish       = options.replenish;
    systemConfig.particleCount       = options.particles;

    Hypercube::SystemHandle field    = module.CreateSystem( systemConfig );
    uint32_t                accepted = module.Spawn( field, options.comets );
    HC_INFO( "Starting comet field: {0} comets accepted, running for {1:.0f}s", accepted, options.seconds );

    // Fixed 60 Hz host loop; --realtime paces it against the wall clock
    const float           frameTime = 1.0f / 60.0f;
    const uint32_t        frames    = static_cast<uint32_t>( std::max( options.seconds, 0.0f ) / frameTime );
    Hypercube::FrameTimer timer;
    uint32_t              peak = 0;

    for( uint32_t frame = 0; frame < frames; ++frame )
    {
        timer.Tick();

        // 1. Simulate
        if( !module.Update( field, frameTime ) )
        {
            HC_ERROR( "Comet field {0} is gone", field.value );
            break;
        }

        // 2. Consume the snapshot the way a renderer would
        const Hypercube::FrameSnapshot* snapshot = module.GetVisible( field );
        uint32_t                        visible  = snapshot ? static_cast<uint32_t>( snapshot->GetCount() ) : 0;
        peak = std::max( peak, visible );

        const Hypercube::ParticleSnapshot* dust  = module.GetParticles( field );
        uint32_t                           motes = dust ? static_cast<uint32_t>( dust->GetCount() ) : 0;

        timer.AddSample( timer.Tick() );

        // 3. Once per simulated second
        if( frame % 60 == 59 )
        {
            Hypercube::PoolStats stats;
            if( !module.GetPoolStats( field, stats ) )
                break;
            HC_INFO( "t={0:5.1f}s visible={1:2} pending={2:2} exiting={3:2} pool={4}/{5} dust={6} update={7:.3f}ms", ( frame + 1 ) * frameTime,
                     visible, stats.pending, stats.exiting, stats.allocated, stats.capacity, motes, timer.ConsumeAverageMillis() );
        }

        if( options.realtime )
            std::this_thread::sleep_for( std::chrono::duration<float>( frameTime ) );
    }

    HC_INFO( "Comet field closing (peak {0} visible, {1} still active)", peak, module.GetActiveCount( field ) );
    module.Shutdown();

    return EXIT_SUCCESS;
}
