#include "simulation/Culler.hpp"

#include "core/Base.hpp"

namespace Hypercube
{
    Culler::Culler( const SpaceDefinition& space, const SystemConfig& config, Lifecycle& lifecycle )
        : m_space( space )
        , m_config( config )
        , m_lifecycle( lifecycle )
    {
    }

    bool Culler::IsFaded( const SpaceObject& object ) const
    {
        return object.opacity < m_config.minOpacity || object.scale < m_config.minScale;
    }

    CullResult Culler::Cull( SpaceObjectPool& pool )
    {
        CullResult result;
        m_releaseList.clear();

        pool.ForEach( [ & ]( ObjectHandle handle, SpaceObject& object ) {
            if( object.state == ObjectState::ACTIVE && !m_space.IsInVolume( object.position ) )
            {
                if( m_lifecycle.Transition( object, ObjectState::EXITING ) )
                {
                    result.exited++;
                    HC_CORE_TRACE( "[Culler] Object {} left the volume bound", object.id );
                }
            }

            if( object.state == ObjectState::EXITING && IsFaded( object ) )
            {
                // Released after the loop so iteration never sees a half-released slot
                if( m_lifecycle.Transition( object, ObjectState::FREE ) )
                    m_releaseList.push_back( handle );
                return;
            }

            if( object.state == ObjectState::ACTIVE || object.state == ObjectState::EXITING )
                result.visible++;
        } );

        for( ObjectHandle handle: m_releaseList )
        {
            if( pool.Release( handle ) )
                result.released++;
        }

        return result;
    }
} // namespace Hypercube
