#include "simulation/Lifecycle.hpp"
#include "simulation/Spawner.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace Hypercube;

class SpawnerTests : public ::testing::Test
{
protected:
    SpaceDefinition space;
    SystemConfig    config;
    Lifecycle       lifecycle;
    Random          random{ 1234 };
    uint32_t        nextId = 0;

    Scope<SpaceObjectPool> pool;
    Scope<Spawner>         spawner;

    void Build( uint32_t initialCapacity, uint32_t maxCapacity )
    {
        pool    = CreateScope<SpaceObjectPool>( initialCapacity, maxCapacity );
        spawner = CreateScope<Spawner>( *pool, space, config, lifecycle, random, nextId );
    }

    void SetUp() override { Build( 16, 64 ); }

    uint32_t CountState( ObjectState state ) const
    {
        uint32_t count = 0;
        pool->ForEach( [ & ]( ObjectHandle, const SpaceObject& object ) {
            if( object.state == state )
                count++;
        } );
        return count;
    }
};

// =================================================================================================
// 1. Scheduling
// =================================================================================================

TEST_F( SpawnerTests, ScheduleReservesPendingSlots )
{
    EXPECT_EQ( spawner->Schedule( 5 ), 5u );

    EXPECT_EQ( CountState( ObjectState::PENDING ), 5u );
    EXPECT_EQ( CountState( ObjectState::ACTIVE ), 0u );
    EXPECT_EQ( spawner->GetPendingCount(), 5u );
    EXPECT_EQ( nextId, 5u );
}

TEST_F( SpawnerTests, ScheduleZeroIsNoOp )
{
    EXPECT_EQ( spawner->Schedule( 0 ), 0u );
    EXPECT_EQ( spawner->GetPendingCount(), 0u );
    EXPECT_EQ( pool->GetAllocatedCount(), 0u );
}

TEST_F( SpawnerTests, FirstGroupActivatesImmediately )
{
    spawner->Schedule( 20 );

    // Zero dt still releases the undelayed first group
    uint32_t activated = spawner->ProcessPending( 0.0f );

    EXPECT_GE( activated, 1u );
    EXPECT_LE( activated, config.maxSimultaneousSpawns );
    EXPECT_EQ( CountState( ObjectState::ACTIVE ), activated );
    EXPECT_EQ( spawner->GetPendingCount(), 20u - activated );
}

TEST_F( SpawnerTests, GroupsAreStaggered )
{
    config.maxSimultaneousSpawns = 2;
    config.minGroupDelay         = 1.0f;
    config.maxGroupDelay         = 1.0f;

    spawner->Schedule( 6 );

    uint32_t total = spawner->ProcessPending( 0.0f );
    EXPECT_LE( total, 2u );

    // Not yet due
    EXPECT_EQ( spawner->ProcessPending( 0.5f ), 0u );

    // Each following group needs exactly one more second
    uint32_t steps = 0;
    while( spawner->GetPendingCount() > 0 && steps < 100 )
    {
        uint32_t activated = spawner->ProcessPending( 0.5f );
        EXPECT_LE( activated, 2u );
        total += activated;
        steps++;
    }

    EXPECT_EQ( total, 6u );
    EXPECT_EQ( CountState( ObjectState::ACTIVE ), 6u );
}

TEST_F( SpawnerTests, NoMoreThanGroupSizePerFrame )
{
    spawner->Schedule( 30 );

    uint32_t total = 0;
    for( int frame = 0; frame < 20000 && spawner->GetPendingCount() > 0; ++frame )
    {
        uint32_t activated = spawner->ProcessPending( 0.016f );
        EXPECT_LE( activated, config.maxSimultaneousSpawns );
        total += activated;
    }

    EXPECT_EQ( total, 30u );
}

TEST_F( SpawnerTests, IdsAreUniqueAndMonotonic )
{
    spawner->Schedule( 10 );
    spawner->Schedule( 10 );

    std::set<uint32_t> ids;
    pool->ForEach( [ & ]( ObjectHandle, const SpaceObject& object ) { ids.insert( object.id ); } );

    EXPECT_EQ( ids.size(), 20u );
    EXPECT_EQ( *ids.begin(), 0u );
    EXPECT_EQ( *ids.rbegin(), 19u );
}

// =================================================================================================
// 2. Exhaustion
// =================================================================================================

TEST_F( SpawnerTests, ExhaustionDropsExcessRequests )
{
    Build( 4, 8 );

    uint32_t accepted = spawner->Schedule( 20 );

    EXPECT_EQ( accepted, 8u );
    EXPECT_EQ( spawner->GetDroppedCount(), 12u );
    EXPECT_EQ( pool->GetAllocatedCount(), 8u );

    // Nothing queued for later
    EXPECT_EQ( spawner->GetPendingCount(), 8u );
    EXPECT_EQ( spawner->Schedule( 1 ), 0u );
}

// =================================================================================================
// 3. Initial state
// =================================================================================================

TEST_F( SpawnerTests, ObjectsEnterThroughTheFarPlane )
{
    for( uint32_t i = 0; i < 200; ++i )
    {
        SpaceObject object;
        object.id = i;
        spawner->InitializeObject( object );

        // Inside the visible volume at spawn time
        EXPECT_TRUE( space.IsInVolume( object.position ) ) << "Object " << i;
        EXPECT_NEAR( object.position.z, space.GetMax().z, 1.0f );

        // Heading inwards
        EXPECT_LT( object.velocity.z, 0.0f );
        EXPECT_GT( object.maxSpeed, 0.0f );

        EXPECT_GE( object.targetSize, Constants::MIN_COMET_SIZE_PERCENT );
        EXPECT_LE( object.targetSize, Constants::MAX_COMET_SIZE_PERCENT );
        EXPECT_FLOAT_EQ( object.maxLifetime, Constants::MAX_COMET_LIFETIME );
        EXPECT_FALSE( object.passedThrough );
        EXPECT_GT( object.baseGlow, 0.0f );
    }
}

TEST_F( SpawnerTests, ActivationRunsThroughLifecycle )
{
    std::vector<std::pair<ObjectState, ObjectState>> transitions;
    lifecycle.SetListener( [ & ]( uint32_t, ObjectState from, ObjectState to ) { transitions.push_back( { from, to } ); } );

    config.maxSimultaneousSpawns = 1;
    spawner->Schedule( 1 );
    spawner->ProcessPending( 0.0f );

    ASSERT_EQ( transitions.size(), 2u );
    EXPECT_EQ( transitions[ 0 ].first, ObjectState::FREE );
    EXPECT_EQ( transitions[ 0 ].second, ObjectState::PENDING );
    EXPECT_EQ( transitions[ 1 ].first, ObjectState::PENDING );
    EXPECT_EQ( transitions[ 1 ].second, ObjectState::ACTIVE );
}

// =================================================================================================
// 4. Replenishment
// =================================================================================================

TEST_F( SpawnerTests, ReplenishmentIsOffByDefault )
{
    EXPECT_FALSE( config.autoReplenish );

    for( int frame = 0; frame < 300; ++frame )
        spawner->ProcessPending( 0.016f );

    EXPECT_EQ( pool->GetAllocatedCount(), 0u );
}

TEST_F( SpawnerTests, ReplenishmentKeepsSparseFieldAlive )
{
    config.autoReplenish = true;

    // Max replenish delay is 2 s; run well past it
    uint32_t activated = 0;
    for( int frame = 0; frame < 300; ++frame )
        activated += spawner->ProcessPending( 0.016f );

    EXPECT_GT( activated, 0u );
    EXPECT_GT( pool->GetAllocatedCount(), 0u );
}
