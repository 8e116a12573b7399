#include "simulation/Culler.hpp"
#include "simulation/SnapshotExporter.hpp"
#include <gtest/gtest.h>

using namespace Hypercube;

class CullerTests : public ::testing::Test
{
protected:
    SpaceDefinition space;
    SystemConfig    config;
    Lifecycle       lifecycle;
    SpaceObjectPool pool{ 8, 8 };
    Culler          culler{ space, config, lifecycle };

    ObjectHandle Add( ObjectState state, const glm::vec3& position, float opacity = 1.0f, float scale = 1.0f )
    {
        ObjectHandle handle = pool.Allocate();
        SpaceObject* object = pool.Get( handle );
        object->id          = handle.GetIndex();
        object->position    = position;
        object->opacity     = opacity;
        object->scale       = scale;

        // Walk the legal path up to the requested state
        for( ObjectState next: { ObjectState::PENDING, ObjectState::ACTIVE, ObjectState::EXITING } )
        {
            if( object->state == state )
                break;
            lifecycle.Transition( *object, next );
        }
        return handle;
    }
};

// =================================================================================================
// 1. Culling
// =================================================================================================

TEST_F( CullerTests, ObjectsInsideTheVolumeSurvive )
{
    ObjectHandle h = Add( ObjectState::ACTIVE, glm::vec3( 0.0f, 0.0f, 50.0f ) );

    CullResult result = culler.Cull( pool );

    EXPECT_EQ( result.exited, 0u );
    EXPECT_EQ( result.released, 0u );
    EXPECT_EQ( result.visible, 1u );
    EXPECT_EQ( pool.Get( h )->state, ObjectState::ACTIVE );
}

TEST_F( CullerTests, LeavingTheVolumeStartsExitWithoutRelease )
{
    // Behind the observer past the grace depth
    ObjectHandle h = Add( ObjectState::ACTIVE, glm::vec3( 0.0f, 0.0f, -60.0f ) );

    CullResult result = culler.Cull( pool );

    EXPECT_EQ( result.exited, 1u );
    EXPECT_EQ( result.released, 0u );
    EXPECT_EQ( result.visible, 1u );

    // Still visible while it fades
    ASSERT_NE( pool.Get( h ), nullptr );
    EXPECT_EQ( pool.Get( h )->state, ObjectState::EXITING );
}

TEST_F( CullerTests, FadedObjectsReturnToThePool )
{
    ObjectHandle h = Add( ObjectState::EXITING, glm::vec3( 0.0f, 0.0f, -60.0f ), 0.0f );

    CullResult result = culler.Cull( pool );

    EXPECT_EQ( result.released, 1u );
    EXPECT_EQ( result.visible, 0u );
    EXPECT_EQ( pool.Get( h ), nullptr );
    EXPECT_EQ( pool.GetAllocatedCount(), 0u );
}

TEST_F( CullerTests, ShrunkObjectsAreFadedToo )
{
    Add( ObjectState::EXITING, glm::vec3( 0.0f, 0.0f, 50.0f ), 1.0f, 0.0f );

    EXPECT_EQ( culler.Cull( pool ).released, 1u );
}

TEST_F( CullerTests, ExitingAtTheScaleFloorIsReleased )
{
    // The integrator never lets scale drop below its floor, so the floor must count as faded
    ObjectHandle floored = Add( ObjectState::EXITING, glm::vec3( 0.0f, 0.0f, 50.0f ), 1.0f, Constants::MIN_SCALE );
    ObjectHandle visible = Add( ObjectState::EXITING, glm::vec3( 0.0f, 0.0f, 50.0f ), 1.0f, config.minScale * 2.0f );

    CullResult result = culler.Cull( pool );

    EXPECT_LT( Constants::MIN_SCALE, config.minScale );
    EXPECT_EQ( result.released, 1u );
    EXPECT_EQ( pool.Get( floored ), nullptr );
    EXPECT_NE( pool.Get( visible ), nullptr );
}

TEST_F( CullerTests, InvisibleExitCompletesInOnePass )
{
    Add( ObjectState::ACTIVE, glm::vec3( 500.0f, 0.0f, 0.0f ), 0.0f );

    CullResult result = culler.Cull( pool );

    EXPECT_EQ( result.exited, 1u );
    EXPECT_EQ( result.released, 1u );
}

TEST_F( CullerTests, PendingObjectsAreIgnored )
{
    ObjectHandle h = Add( ObjectState::PENDING, glm::vec3( 0.0f, 0.0f, -500.0f ), 0.0f );

    CullResult result = culler.Cull( pool );

    EXPECT_EQ( result.exited, 0u );
    EXPECT_EQ( result.released, 0u );
    EXPECT_EQ( result.visible, 0u );
    EXPECT_EQ( pool.Get( h )->state, ObjectState::PENDING );
}

TEST_F( CullerTests, TransitionsAreObserved )
{
    uint32_t toExiting = 0;
    uint32_t toFree    = 0;
    lifecycle.SetListener( [ & ]( uint32_t, ObjectState, ObjectState to ) {
        if( to == ObjectState::EXITING )
            toExiting++;
        if( to == ObjectState::FREE )
            toFree++;
    } );

    Add( ObjectState::ACTIVE, glm::vec3( 0.0f, 0.0f, -60.0f ), 0.0f );
    toExiting = 0;

    culler.Cull( pool );

    EXPECT_EQ( toExiting, 1u );
    EXPECT_EQ( toFree, 1u );
    EXPECT_EQ( lifecycle.GetRejectedCount(), 0u );
}

// =================================================================================================
// 2. Lifecycle gate
// =================================================================================================

TEST( LifecycleTests, RejectsIllegalTransitions )
{
    Lifecycle   lifecycle;
    SpaceObject object;

    EXPECT_FALSE( lifecycle.Transition( object, ObjectState::ACTIVE ) );
    EXPECT_FALSE( lifecycle.Transition( object, ObjectState::EXITING ) );
    EXPECT_EQ( object.state, ObjectState::FREE );
    EXPECT_EQ( lifecycle.GetRejectedCount(), 2u );

    EXPECT_TRUE( lifecycle.Transition( object, ObjectState::PENDING ) );
    EXPECT_FALSE( lifecycle.Transition( object, ObjectState::FREE ) );
    EXPECT_TRUE( lifecycle.Transition( object, ObjectState::ACTIVE ) );
    EXPECT_FALSE( lifecycle.Transition( object, ObjectState::PENDING ) );
    EXPECT_TRUE( lifecycle.Transition( object, ObjectState::EXITING ) );
    EXPECT_FALSE( lifecycle.Transition( object, ObjectState::ACTIVE ) );
    EXPECT_TRUE( lifecycle.Transition( object, ObjectState::FREE ) );
}

// =================================================================================================
// 3. Snapshot export
// =================================================================================================

class SnapshotExporterTests : public CullerTests
{
protected:
    SnapshotExporter exporter;
};

TEST_F( SnapshotExporterTests, ExportsLiveObjectsOnly )
{
    Add( ObjectState::PENDING, glm::vec3( 0.0f ) );
    Add( ObjectState::ACTIVE, glm::vec3( 1.0f, 2.0f, 3.0f ) );
    Add( ObjectState::EXITING, glm::vec3( 4.0f, 5.0f, 6.0f ) );

    EXPECT_EQ( exporter.Export( pool ), 2u );

    const FrameSnapshot& snapshot = exporter.GetFront();
    EXPECT_EQ( snapshot.GetCount(), 2u );
}

TEST_F( SnapshotExporterTests, ArraysAreIndexAligned )
{
    for( int i = 0; i < 5; ++i )
    {
        ObjectHandle h = Add( ObjectState::ACTIVE, glm::vec3( ( float )i, ( float )i * 2.0f, ( float )i * 3.0f ), 0.5f, 2.0f );
        pool.Get( h )->tailLength    = ( float )i;
        pool.Get( h )->glowIntensity = ( float )i * 10.0f;
        pool.Get( h )->color         = glm::vec3( 0.1f, 0.2f, 0.3f );
    }

    exporter.Export( pool );
    const FrameSnapshot& s = exporter.GetFront();

    size_t n = s.GetCount();
    ASSERT_EQ( n, 5u );
    EXPECT_EQ( s.positions.size(), n * 3 );
    EXPECT_EQ( s.rotations.size(), n * 4 );
    EXPECT_EQ( s.colors.size(), n * 3 );
    EXPECT_EQ( s.scales.size(), n );
    EXPECT_EQ( s.opacities.size(), n );
    EXPECT_EQ( s.tailLengths.size(), n );
    EXPECT_EQ( s.glowIntensities.size(), n );

    for( size_t i = 0; i < n; ++i )
    {
        // Index i describes the same object in every array
        const SpaceObject* object = pool.Get( ObjectHandle( s.ids[ i ], 1 ) );
        ASSERT_NE( object, nullptr );
        EXPECT_FLOAT_EQ( s.positions[ i * 3 + 0 ], object->position.x );
        EXPECT_FLOAT_EQ( s.positions[ i * 3 + 1 ], object->position.y );
        EXPECT_FLOAT_EQ( s.positions[ i * 3 + 2 ], object->position.z );
        EXPECT_FLOAT_EQ( s.rotations[ i * 4 + 3 ], object->rotation.w );
        EXPECT_FLOAT_EQ( s.tailLengths[ i ], object->tailLength );
        EXPECT_FLOAT_EQ( s.glowIntensities[ i ], object->glowIntensity );
        EXPECT_FLOAT_EQ( s.opacities[ i ], 0.5f );
        EXPECT_FLOAT_EQ( s.scales[ i ], 2.0f );
        EXPECT_FLOAT_EQ( s.colors[ i * 3 + 2 ], 0.3f );
    }
}

TEST_F( SnapshotExporterTests, PreviousSnapshotSurvivesOneMoreExport )
{
    ObjectHandle h = Add( ObjectState::ACTIVE, glm::vec3( 1.0f, 0.0f, 0.0f ) );

    exporter.Export( pool );
    const FrameSnapshot* previous = &exporter.GetFront();
    uint32_t             front    = exporter.GetFrontIndex();

    pool.Get( h )->position.x = 9.0f;
    exporter.Export( pool );

    EXPECT_NE( exporter.GetFrontIndex(), front );
    EXPECT_NE( &exporter.GetFront(), previous );

    // Old buffer untouched, new buffer has the update
    EXPECT_FLOAT_EQ( previous->positions[ 0 ], 1.0f );
    EXPECT_FLOAT_EQ( exporter.GetFront().positions[ 0 ], 9.0f );
}

TEST_F( SnapshotExporterTests, EmptyPoolExportsNothing )
{
    EXPECT_EQ( exporter.Export( pool ), 0u );
    EXPECT_TRUE( exporter.GetFront().IsEmpty() );
}
