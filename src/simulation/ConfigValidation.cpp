#include "simulation/ConfigValidation.hpp"

#include "core/Base.hpp"
#include "simulation/Types.hpp"
#include <cmath>

namespace Hypercube
{
    namespace
    {
        bool IsPositive( float value )
        {
            return std::isfinite( value ) && value > 0.0f;
        }
    } // namespace

    uint32_t SanitizeSystemConfig( SystemConfig& config )
    {
        const SystemConfig defaults;
        uint32_t           replaced = 0;

        if( config.maxSimultaneousSpawns == 0 )
        {
            HC_CORE_WARN( "[Config] maxSimultaneousSpawns must be at least 1, using {}", defaults.maxSimultaneousSpawns );
            config.maxSimultaneousSpawns = defaults.maxSimultaneousSpawns;
            replaced++;
        }

        bool delaysUsable = std::isfinite( config.minGroupDelay ) && std::isfinite( config.maxGroupDelay ) && config.minGroupDelay >= 0.0f &&
                            config.maxGroupDelay >= config.minGroupDelay;
        if( !delaysUsable )
        {
            HC_CORE_WARN( "[Config] Group delay range [{}, {}] is unusable, using [{}, {}]", config.minGroupDelay, config.maxGroupDelay,
                          defaults.minGroupDelay, defaults.maxGroupDelay );
            config.minGroupDelay = defaults.minGroupDelay;
            config.maxGroupDelay = defaults.maxGroupDelay;
            replaced++;
        }

        // A zero or NaN rate would leave exiting objects visible forever
        if( !IsPositive( config.fadeRate ) )
        {
            HC_CORE_WARN( "[Config] fadeRate {} is unusable, using {}", config.fadeRate, defaults.fadeRate );
            config.fadeRate = defaults.fadeRate;
            replaced++;
        }

        if( !IsPositive( config.minOpacity ) || config.minOpacity >= 1.0f )
        {
            HC_CORE_WARN( "[Config] minOpacity {} is outside (0, 1), using {}", config.minOpacity, defaults.minOpacity );
            config.minOpacity = defaults.minOpacity;
            replaced++;
        }

        if( !std::isfinite( config.minScale ) || config.minScale < 0.0f )
        {
            HC_CORE_WARN( "[Config] minScale {} is unusable, using {}", config.minScale, defaults.minScale );
            config.minScale = defaults.minScale;
            replaced++;
        }

        if( config.particleCount > Constants::MAX_PARTICLES )
        {
            HC_CORE_WARN( "[Config] particleCount {} exceeds {}, clamping", config.particleCount, Constants::MAX_PARTICLES );
            config.particleCount = Constants::MAX_PARTICLES;
            replaced++;
        }

        if( !IsPositive( config.particleFieldRadius ) )
        {
            HC_CORE_WARN( "[Config] particleFieldRadius {} is unusable, using {}", config.particleFieldRadius, defaults.particleFieldRadius );
            config.particleFieldRadius = defaults.particleFieldRadius;
            replaced++;
        }

        return replaced;
    }
} // namespace Hypercube
