#include "simulation/Lifecycle.hpp"

#include "core/Base.hpp"

namespace Hypercube
{
    bool Lifecycle::Transition( SpaceObject& object, ObjectState to )
    {
        ObjectState from = object.state;
        if( !IsLegalTransition( from, to ) )
        {
            m_rejected++;
            HC_CORE_ERROR( "[Lifecycle] Illegal transition {} -> {} for object {}", toString( from ), toString( to ), object.id );
            return false;
        }

        object.state = to;
        if( m_listener )
            m_listener( object.id, from, to );

        return true;
    }
} // namespace Hypercube
