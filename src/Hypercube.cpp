#include "Hypercube.h"

#include "core/Base.hpp"
#include "simulation/ConfigValidation.hpp"
#include "simulation/SystemManager.hpp"
#include <cmath>

namespace Hypercube
{
    // Impl
    struct SpaceModule::Impl
    {
        HypercubeConfig      m_config;
        bool                 m_initialized;
        Scope<SystemManager> m_systems;

        Impl()
            : m_initialized( false )
        {
            // Calls made before Initialize() still need somewhere to log
            Log::Init();
        }

        Result ValidateConfig( const HypercubeConfig& config ) const
        {
            if( config.initialPoolCapacity == 0 || config.maxPoolCapacity == 0 )
            {
                HC_CORE_ERROR( "Pool capacities must be non-zero (initial {0}, max {1})", config.initialPoolCapacity, config.maxPoolCapacity );
                return Result::INVALID_ARGS;
            }
            if( config.maxPoolCapacity < config.initialPoolCapacity )
            {
                HC_CORE_ERROR( "Max pool capacity {0} is below the initial capacity {1}", config.maxPoolCapacity, config.initialPoolCapacity );
                return Result::INVALID_ARGS;
            }
            if( !std::isfinite( config.maxDeltaTime ) || config.maxDeltaTime <= 0.0f )
            {
                HC_CORE_ERROR( "Max delta time must be a positive number (got {0})", config.maxDeltaTime );
                return Result::INVALID_ARGS;
            }

            SystemConfig defaults = config.defaultSystem;
            uint32_t     unusable = SanitizeSystemConfig( defaults );
            if( unusable > 0 )
            {
                HC_CORE_ERROR( "Default system config has {0} unusable values", unusable );
                return Result::INVALID_ARGS;
            }

            // Every system reserves snapshot storage for its whole pool up front
            if( config.maxPoolCapacity > Constants::MAX_POOL_CAPACITY )
            {
                HC_CORE_ERROR( "Max pool capacity {0} exceeds the supported {1} objects per system", config.maxPoolCapacity,
                               Constants::MAX_POOL_CAPACITY );
                return Result::OUT_OF_MEMORY;
            }
            return Result::SUCCESS;
        }

        Result Initialize( const HypercubeConfig& config )
        {
            if( m_initialized )
                return Result::SUCCESS;

            // 1. Config
            Result res = ValidateConfig( config );
            if( res != Result::SUCCESS )
                return res;
            m_config = config;

            // 2. Logger, only once the config is accepted
            Log::SetLevel( m_config.logLevel );

            HC_CORE_INFO( "Initializing Hypercube space module..." );

            // 3. Systems
            m_systems     = CreateScope<SystemManager>( m_config );
            m_initialized = true;

            HC_CORE_INFO( "Space module ready (pool {0}/{1}, max dt {2:.4f}s)", m_config.initialPoolCapacity, m_config.maxPoolCapacity,
                          m_config.maxDeltaTime );
            return Result::SUCCESS;
        }

        void Shutdown()
        {
            if( !m_initialized )
                return;

            HC_CORE_INFO( "Shutting down..." );

            m_systems.reset();
            m_initialized = false;
        }

        SystemManager* Systems( const char* operation ) const
        {
            if( !m_initialized )
            {
                HC_CORE_WARN( "{0} called before Initialize()", operation );
                return nullptr;
            }
            return m_systems.get();
        }
    };

    SpaceModule::SpaceModule()
        : m_impl( CreateScope<Impl>() )
    {
    }

    SpaceModule::~SpaceModule()
    {
        m_impl->Shutdown();
    }

    Result SpaceModule::Initialize( const HypercubeConfig& config )
    {
        return m_impl->Initialize( config );
    }

    void SpaceModule::Shutdown()
    {
        m_impl->Shutdown();
    }

    bool SpaceModule::IsReady() const
    {
        return m_impl->m_initialized;
    }

    SystemHandle SpaceModule::CreateSystem( float viewportSizePercent, float fovDegrees )
    {
        SystemManager* systems = m_impl->Systems( "CreateSystem" );
        return systems ? systems->Create( viewportSizePercent, fovDegrees ) : SystemHandle::Invalid;
    }

    SystemHandle SpaceModule::CreateSystem( const SystemConfig& config )
    {
        SystemManager* systems = m_impl->Systems( "CreateSystem" );
        return systems ? systems->Create( config ) : SystemHandle::Invalid;
    }

    bool SpaceModule::DestroySystem( SystemHandle handle )
    {
        SystemManager* systems = m_impl->Systems( "DestroySystem" );
        return systems ? systems->Destroy( handle ) : false;
    }

    uint32_t SpaceModule::Spawn( SystemHandle handle, uint32_t count )
    {
        SystemManager* systems = m_impl->Systems( "Spawn" );
        return systems ? systems->Spawn( handle, count ) : 0;
    }

    uint32_t SpaceModule::ProcessPending( float dt )
    {
        SystemManager* systems = m_impl->Systems( "ProcessPending" );
        return systems ? systems->ProcessPending( dt ) : 0;
    }

    bool SpaceModule::Update( SystemHandle handle, float dt )
    {
        SystemManager* systems = m_impl->Systems( "Update" );
        return systems ? systems->Update( handle, dt ) : false;
    }

    const FrameSnapshot* SpaceModule::GetVisible( SystemHandle handle ) const
    {
        SystemManager* systems = m_impl->Systems( "GetVisible" );
        return systems ? systems->GetVisible( handle ) : nullptr;
    }

    const ParticleSnapshot* SpaceModule::GetParticles( SystemHandle handle ) const
    {
        SystemManager* systems = m_impl->Systems( "GetParticles" );
        return systems ? systems->GetParticles( handle ) : nullptr;
    }

    uint32_t SpaceModule::GetActiveCount( SystemHandle handle ) const
    {
        SystemManager* systems = m_impl->Systems( "GetActiveCount" );
        return systems ? systems->GetActiveCount( handle ) : 0;
    }

    bool SpaceModule::GetPoolStats( SystemHandle handle, PoolStats& outStats ) const
    {
        SystemManager* systems = m_impl->Systems( "GetPoolStats" );
        return systems ? systems->GetPoolStats( handle, outStats ) : false;
    }
} // namespace Hypercube
