#pragma once
#include "HypercubeTypes.h"
#include "core/TimeController.hpp"
#include "simulation/Culler.hpp"
#include "simulation/Integrator.hpp"
#include "simulation/Lifecycle.hpp"
#include "simulation/ParticleField.hpp"
#include "simulation/Random.hpp"
#include "simulation/SnapshotExporter.hpp"
#include "simulation/SpaceDefinition.hpp"
#include "simulation/Spawner.hpp"
#include "simulation/Types.hpp"

namespace Hypercube
{
    struct InstanceDesc
    {
        SystemConfig config;
        uint32_t     initialCapacity = 64;
        uint32_t     maxCapacity     = 256;
        float        maxDeltaTime    = 1.0f / 15.0f;
        uint64_t     seed            = 1;
    };

    /**
     * @brief One independent comet field.
     * Owns its pool and its particle field exclusively. A frame runs:
     * spawn -> integrate (comets, then dust) -> cull -> export.
     * Components keep references to members of this object, so it is neither copyable
     * nor movable; SystemManager holds instances through Scope<>.
     */
    class SimulationInstance
    {
    public:
        explicit SimulationInstance( const InstanceDesc& desc );

        SimulationInstance( const SimulationInstance& )            = delete;
        SimulationInstance& operator=( const SimulationInstance& ) = delete;

        uint32_t Spawn( uint32_t count );

        /**
         * @brief Spawn phase driven from outside Update().
         * The next Update() skips its own spawn phase so delays are not counted twice.
         */
        uint32_t ProcessPending( float dt );

        void Update( float dt );

        // nullptr when the current snapshot is empty
        const FrameSnapshot* GetVisible() const;

        // nullptr when the system has no particle field
        const ParticleSnapshot* GetParticles() const;

        uint32_t  GetActiveCount() const;
        PoolStats GetPoolStats() const;

        void SetTransitionListener( Lifecycle::Listener listener ) { m_lifecycle.SetListener( std::move( listener ) ); }

        const SpaceDefinition& GetSpace() const { return m_space; }
        const SpaceObjectPool& GetPool() const { return m_pool; }
        const SystemConfig&    GetConfig() const { return m_config; }
        const Spawner&         GetSpawner() const { return m_spawner; }
        const ParticleField&   GetParticleField() const { return m_particles; }
        TimeController&        GetClock() { return m_clock; }
        const CullResult&      GetLastCullResult() const { return m_lastCull; }
        uint32_t               GetLastActivatedCount() const { return m_lastActivated; }

    private:
        SystemConfig    m_config;
        SpaceDefinition m_space;
        Random          m_random;
        uint32_t        m_nextId = 0;

        Lifecycle        m_lifecycle;
        SpaceObjectPool  m_pool;
        Spawner          m_spawner;
        Integrator       m_integrator;
        Culler           m_culler;
        SnapshotExporter m_exporter;
        ParticleField    m_particles;
        TimeController   m_clock;

        bool       m_pendingProcessed = false;
        uint32_t   m_lastActivated    = 0;
        CullResult m_lastCull;
    };
} // namespace Hypercube
