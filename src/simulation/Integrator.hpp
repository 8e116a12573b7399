#pragma once
#include "simulation/Lifecycle.hpp"
#include "simulation/SpaceDefinition.hpp"
#include "simulation/Types.hpp"

namespace Hypercube
{
    /**
     * @brief Explicit (forward Euler) integration of Active and Exiting objects.
     * dt must already be clamped by the caller's TimeController.
     */
    class Integrator
    {
    public:
        Integrator( const SpaceDefinition& space, const SystemConfig& config, Lifecycle& lifecycle );

        /**
         * @brief Advances every live object of the pool.
         * @return Number of objects that switched to Exiting during this step.
         */
        uint32_t Integrate( SpaceObjectPool& pool, float dt );

        // Single object step; returns true if the object started exiting
        bool Step( SpaceObject& object, float dt );

    private:
        void UpdateVelocity( SpaceObject& object, float dt ) const;
        void UpdateAppearance( SpaceObject& object, float dt ) const;
        bool BeginExit( SpaceObject& object, const char* reason );

    private:
        const SpaceDefinition& m_space;
        const SystemConfig&    m_config;
        Lifecycle&             m_lifecycle;
    };
} // namespace Hypercube
