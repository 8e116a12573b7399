#include "simulation/SimulationInstance.hpp"

#include "core/Base.hpp"
#include "simulation/ConfigValidation.hpp"

namespace Hypercube
{
    namespace
    {
        // Dust draws from its own stream so enabling it leaves the comet sequence unchanged
        constexpr uint64_t PARTICLE_SEED_SALT = 0x9E3779B97F4A7C15ull;
    } // namespace

    SimulationInstance::SimulationInstance( const InstanceDesc& desc )
        : m_config( MakeUsable( desc.config ) )
        , m_space( desc.config.viewportSizePercent, desc.config.fieldOfViewDegrees )
        , m_random( desc.seed )
        , m_pool( desc.initialCapacity, desc.maxCapacity )
        , m_spawner( m_pool, m_space, m_config, m_lifecycle, m_random, m_nextId )
        , m_integrator( m_space, m_config, m_lifecycle )
        , m_culler( m_space, m_config, m_lifecycle )
        , m_particles( m_config.particleCount, m_config.particleFieldRadius, desc.seed ^ PARTICLE_SEED_SALT )
        , m_clock( desc.maxDeltaTime )
    {
        m_exporter.Reserve( desc.maxCapacity );
    }

    uint32_t SimulationInstance::Spawn( uint32_t count )
    {
        return m_spawner.Schedule( count );
    }

    uint32_t SimulationInstance::ProcessPending( float dt )
    {
        float simDt        = m_clock.Clamp( dt ) * m_clock.GetTimeScale();
        m_lastActivated    = m_spawner.ProcessPending( simDt );
        m_pendingProcessed = true;
        return m_lastActivated;
    }

    void SimulationInstance::Update( float dt )
    {
        float simDt = m_clock.Update( dt );

        // 1. Spawn
        if( !m_pendingProcessed )
            m_lastActivated = m_spawner.ProcessPending( simDt );
        m_pendingProcessed = false;

        // 2. Integrate
        m_integrator.Integrate( m_pool, simDt );
        m_particles.Update( simDt );

        // 3. Cull
        m_lastCull = m_culler.Cull( m_pool );

        // 4. Export
        m_exporter.Export( m_pool );
        m_particles.Export();
    }

    const FrameSnapshot* SimulationInstance::GetVisible() const
    {
        const FrameSnapshot& front = m_exporter.GetFront();
        return front.IsEmpty() ? nullptr : &front;
    }

    const ParticleSnapshot* SimulationInstance::GetParticles() const
    {
        const ParticleSnapshot& front = m_particles.GetFront();
        return front.IsEmpty() ? nullptr : &front;
    }

    uint32_t SimulationInstance::GetActiveCount() const
    {
        PoolStats stats = GetPoolStats();
        return stats.active + stats.exiting;
    }

    PoolStats SimulationInstance::GetPoolStats() const
    {
        PoolStats stats;
        stats.capacity  = m_pool.GetCapacity();
        stats.allocated = m_pool.GetAllocatedCount();
        stats.free      = m_pool.GetFreeCount();

        m_pool.ForEach( [ &stats ]( ObjectHandle, const SpaceObject& object ) {
            switch( object.state )
            {
                case ObjectState::PENDING:
                    stats.pending++;
                    break;
                case ObjectState::ACTIVE:
                    stats.active++;
                    break;
                case ObjectState::EXITING:
                    stats.exiting++;
                    break;
                default:
                    break;
            }
        } );

        return stats;
    }
} // namespace Hypercube
