#pragma once
#include "simulation/Types.hpp"
#include <functional>

namespace Hypercube
{
    /**
     * @brief Single gate for object state changes.
     * Rejects anything outside Pending -> Active -> Exiting -> Free -> Pending and
     * notifies an optional listener (used by hosts for diagnostics and by tests).
     */
    class Lifecycle
    {
    public:
        using Listener = std::function<void( uint32_t id, ObjectState from, ObjectState to )>;

        void SetListener( Listener listener ) { m_listener = std::move( listener ); }

        bool Transition( SpaceObject& object, ObjectState to );

        uint64_t GetRejectedCount() const { return m_rejected; }

    private:
        Listener m_listener;
        uint64_t m_rejected = 0;
    };
} // namespace Hypercube
