#include "simulation/SystemManager.hpp"

namespace Hypercube
{
    SystemManager::SystemManager( const HypercubeConfig& config )
        : m_config( config )
    {
        if( config.seed != 0 )
        {
            m_seeder.seed( config.seed );
        }
        else
        {
            std::random_device rd;
            m_seeder.seed( ( static_cast<uint64_t>( rd() ) << 32 ) | rd() );
        }
    }

    SystemManager::~SystemManager()
    {
        if( !m_systems.empty() )
        {
            HC_CORE_INFO( "[SystemManager] Releasing {} systems", m_systems.size() );
        }
        m_systems.clear();
    }

    uint64_t SystemManager::NextSeed()
    {
        uint64_t seed = m_seeder();
        return seed != 0 ? seed : 1;
    }

    SystemHandle SystemManager::Create( float viewportSizePercent, float fovDegrees )
    {
        SystemConfig config        = m_config.defaultSystem;
        config.viewportSizePercent = viewportSizePercent;
        config.fieldOfViewDegrees  = fovDegrees;
        return Create( config );
    }

    SystemHandle SystemManager::Create( const SystemConfig& config )
    {
        if( m_nextIndex == UINT32_MAX )
        {
            HC_CORE_ERROR( "[SystemManager] Handle space exhausted" );
            return SystemHandle::Invalid;
        }

        InstanceDesc desc;
        desc.config          = config;
        desc.initialCapacity = m_config.initialPoolCapacity;
        desc.maxCapacity     = m_config.maxPoolCapacity;
        desc.maxDeltaTime    = m_config.maxDeltaTime;
        desc.seed            = NextSeed();

        SystemHandle handle( m_nextIndex++, 1 );
        auto         instance = CreateScope<SimulationInstance>( desc );

        const SpaceDefinition& space = instance->GetSpace();
        HC_CORE_INFO( "[SystemManager] Created system {} (viewport {:.1f}%, fov {:.1f} deg, pool {}/{}, {} particles)", handle.GetIndex(),
                      space.GetViewportSizePercent(), glm::degrees( space.GetFieldOfView() ), desc.initialCapacity, desc.maxCapacity,
                      instance->GetParticleField().GetCount() );

        m_systems.emplace( handle.value, std::move( instance ) );
        return handle;
    }

    bool SystemManager::Destroy( SystemHandle handle )
    {
        auto it = m_systems.find( handle.value );
        if( it == m_systems.end() )
        {
            HC_CORE_WARN( "[SystemManager] Destroy: unknown system handle {}", handle.value );
            return false;
        }

        m_systems.erase( it );
        HC_CORE_INFO( "[SystemManager] Destroyed system {}", handle.GetIndex() );
        return true;
    }

    SimulationInstance* SystemManager::Lookup( SystemHandle handle, const char* operation ) const
    {
        auto it = m_systems.find( handle.value );
        if( it == m_systems.end() )
        {
            HC_CORE_WARN( "[SystemManager] {}: unknown system handle {}", operation, handle.value );
            return nullptr;
        }
        return it->second.get();
    }

    SimulationInstance* SystemManager::Get( SystemHandle handle )
    {
        auto it = m_systems.find( handle.value );
        return it != m_systems.end() ? it->second.get() : nullptr;
    }

    const SimulationInstance* SystemManager::Get( SystemHandle handle ) const
    {
        auto it = m_systems.find( handle.value );
        return it != m_systems.end() ? it->second.get() : nullptr;
    }

    uint32_t SystemManager::Spawn( SystemHandle handle, uint32_t count )
    {
        SimulationInstance* instance = Lookup( handle, "Spawn" );
        if( !instance )
            return 0;

        uint32_t accepted = instance->Spawn( count );
        HC_CORE_INFO( "[SystemManager] System {}: scheduled {} of {} objects with staggered delays", handle.GetIndex(), accepted, count );
        return accepted;
    }

    uint32_t SystemManager::ProcessPending( float dt )
    {
        uint32_t activated = 0;
        for( auto& [ key, instance ]: m_systems )
        {
            activated += instance->ProcessPending( dt );
        }
        return activated;
    }

    bool SystemManager::Update( SystemHandle handle, float dt )
    {
        SimulationInstance* instance = Lookup( handle, "Update" );
        if( !instance )
            return false;

        instance->Update( dt );
        return true;
    }

    const FrameSnapshot* SystemManager::GetVisible( SystemHandle handle ) const
    {
        const SimulationInstance* instance = Lookup( handle, "GetVisible" );
        return instance ? instance->GetVisible() : nullptr;
    }

    const ParticleSnapshot* SystemManager::GetParticles( SystemHandle handle ) const
    {
        const SimulationInstance* instance = Lookup( handle, "GetParticles" );
        return instance ? instance->GetParticles() : nullptr;
    }

    uint32_t SystemManager::GetActiveCount( SystemHandle handle ) const
    {
        const SimulationInstance* instance = Lookup( handle, "GetActiveCount" );
        return instance ? instance->GetActiveCount() : 0;
    }

    bool SystemManager::GetPoolStats( SystemHandle handle, PoolStats& outStats ) const
    {
        const SimulationInstance* instance = Lookup( handle, "GetPoolStats" );
        if( !instance )
            return false;

        outStats = instance->GetPoolStats();
        return true;
    }
} // namespace Hypercube
