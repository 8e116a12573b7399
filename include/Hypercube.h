#pragma once
#include "HypercubeTypes.h"

#include <memory>

namespace Hypercube
{

    /**
     * @brief Host-facing entry point of the comet simulation.
     * The rendering layer loads one SpaceModule, creates one or more systems and drives
     * them once per frame. Every per-system call is total: an unknown handle yields
     * false / 0 / nullptr, never an exception.
     */
    class HC_API SpaceModule
    {
    public:
        SpaceModule();
        ~SpaceModule();

        Result Initialize( const HypercubeConfig& config );
        void   Shutdown();

        // Readiness check for the status endpoint. Exposes no simulation state.
        bool IsReady() const;

        SystemHandle CreateSystem( float viewportSizePercent, float fovDegrees );
        SystemHandle CreateSystem( const SystemConfig& config );
        bool         DestroySystem( SystemHandle handle );

        /**
         * @brief Schedules count objects, staggered in small groups.
         * @return Number of objects accepted; less than count when the pool is exhausted.
         */
        uint32_t Spawn( SystemHandle handle, uint32_t count );

        // Advances spawn delays of every system. Returns the number of objects activated.
        uint32_t ProcessPending( float dt );

        bool Update( SystemHandle handle, float dt );

        // nullptr when the handle is unknown or nothing is visible
        const FrameSnapshot* GetVisible( SystemHandle handle ) const;

        // Dust of the system's particle field; nullptr when the field is disabled
        const ParticleSnapshot* GetParticles( SystemHandle handle ) const;

        uint32_t GetActiveCount( SystemHandle handle ) const;
        bool     GetPoolStats( SystemHandle handle, PoolStats& outStats ) const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace Hypercube
