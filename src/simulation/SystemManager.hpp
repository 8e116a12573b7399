#pragma once
#include "HypercubeTypes.h"
#include "core/Base.hpp"
#include "simulation/SimulationInstance.hpp"
#include <map>
#include <random>

namespace Hypercube
{
    /**
     * @brief Table of simulation instances keyed by SystemHandle.
     * Handles are issued from a monotonically increasing index and are never reused, so a
     * stale handle can only miss. Every routed call reports an unknown handle as a failure
     * value and a warning; nothing here throws into the host.
     */
    class SystemManager
    {
    public:
        explicit SystemManager( const HypercubeConfig& config );
        ~SystemManager();

        SystemHandle Create( const SystemConfig& config );
        SystemHandle Create( float viewportSizePercent, float fovDegrees );
        bool         Destroy( SystemHandle handle );

        uint32_t                Spawn( SystemHandle handle, uint32_t count );
        uint32_t                ProcessPending( float dt );
        bool                    Update( SystemHandle handle, float dt );
        const FrameSnapshot*    GetVisible( SystemHandle handle ) const;
        const ParticleSnapshot* GetParticles( SystemHandle handle ) const;
        uint32_t                GetActiveCount( SystemHandle handle ) const;
        bool                    GetPoolStats( SystemHandle handle, PoolStats& outStats ) const;

        SimulationInstance*       Get( SystemHandle handle );
        const SimulationInstance* Get( SystemHandle handle ) const;

        size_t GetSystemCount() const { return m_systems.size(); }

    private:
        SimulationInstance* Lookup( SystemHandle handle, const char* operation ) const;
        uint64_t            NextSeed();

    private:
        HypercubeConfig m_config;

        // Ordered so ProcessPending visits systems in creation order
        std::map<uint64_t, Scope<SimulationInstance>> m_systems;
        uint32_t                                      m_nextIndex = 0;
        std::mt19937_64                               m_seeder;
    };
} // namespace Hypercube
