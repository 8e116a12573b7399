#pragma once
#include "HypercubeTypes.h"

namespace Hypercube
{
    /**
     * @brief Replaces every unusable SystemConfig tunable with its default.
     * Covers values that would store non-finite state or keep exiting objects alive forever
     * (non-finite or non-positive fade rate, opacity threshold outside (0, 1), ...). Viewport
     * and field of view are handled by SpaceDefinition.
     * @return Number of fields replaced. Each replacement is logged as a warning.
     */
    uint32_t SanitizeSystemConfig( SystemConfig& config );

    inline SystemConfig MakeUsable( SystemConfig config )
    {
        SanitizeSystemConfig( config );
        return config;
    }
} // namespace Hypercube
