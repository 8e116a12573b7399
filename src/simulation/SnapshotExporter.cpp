#include "simulation/SnapshotExporter.hpp"

namespace Hypercube
{
    void SnapshotExporter::Reserve( uint32_t objectCount )
    {
        const size_t count = objectCount;
        for( auto& snapshot: m_buffers )
        {
            snapshot.ids.reserve( count );
            snapshot.positions.reserve( count * 3 );
            snapshot.scales.reserve( count );
            snapshot.rotations.reserve( count * 4 );
            snapshot.opacities.reserve( count );
            snapshot.colors.reserve( count * 3 );
            snapshot.tailLengths.reserve( count );
            snapshot.glowIntensities.reserve( count );
        }
    }

    void SnapshotExporter::Clear( FrameSnapshot& snapshot )
    {
        snapshot.ids.clear();
        snapshot.positions.clear();
        snapshot.scales.clear();
        snapshot.rotations.clear();
        snapshot.opacities.clear();
        snapshot.colors.clear();
        snapshot.tailLengths.clear();
        snapshot.glowIntensities.clear();
    }

    uint32_t SnapshotExporter::Export( const SpaceObjectPool& pool )
    {
        uint32_t       backIndex = 1 - m_frontIndex;
        FrameSnapshot& back      = m_buffers[ backIndex ];
        Clear( back );

        pool.ForEach( [ &back ]( ObjectHandle, const SpaceObject& object ) {
            if( object.state != ObjectState::ACTIVE && object.state != ObjectState::EXITING )
                return;

            back.ids.push_back( object.id );

            back.positions.push_back( object.position.x );
            back.positions.push_back( object.position.y );
            back.positions.push_back( object.position.z );

            back.scales.push_back( object.scale );

            back.rotations.push_back( object.rotation.x );
            back.rotations.push_back( object.rotation.y );
            back.rotations.push_back( object.rotation.z );
            back.rotations.push_back( object.rotation.w );

            back.opacities.push_back( object.opacity );

            back.colors.push_back( object.color.r );
            back.colors.push_back( object.color.g );
            back.colors.push_back( object.color.b );

            back.tailLengths.push_back( object.tailLength );
            back.glowIntensities.push_back( object.glowIntensity );
        } );

        m_frontIndex = backIndex;
        return static_cast<uint32_t>( back.ids.size() );
    }
} // namespace Hypercube
