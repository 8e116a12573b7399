#pragma once
#include "simulation/Lifecycle.hpp"
#include "simulation/SpaceDefinition.hpp"
#include "simulation/Types.hpp"
#include <vector>

namespace Hypercube
{
    struct CullResult
    {
        uint32_t exited   = 0; // Active -> Exiting this pass
        uint32_t released = 0; // Exiting -> Free this pass
        uint32_t visible  = 0; // Active + Exiting after the pass
    };

    /**
     * @brief Two-stage retirement: objects leaving the volume bound start Exiting, and
     * Exiting objects are returned to the pool only once they have faded out.
     */
    class Culler
    {
    public:
        Culler( const SpaceDefinition& space, const SystemConfig& config, Lifecycle& lifecycle );

        CullResult Cull( SpaceObjectPool& pool );

        bool IsFaded( const SpaceObject& object ) const;

    private:
        const SpaceDefinition& m_space;
        const SystemConfig&    m_config;
        Lifecycle&             m_lifecycle;

        std::vector<ObjectHandle> m_releaseList;
    };
} // namespace Hypercube
