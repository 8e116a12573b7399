#include "simulation/Spawner.hpp"

#include "core/Base.hpp"
#include <algorithm>
#include <array>
#include <glm/gtc/constants.hpp>

namespace Hypercube
{
    namespace
    {
        // Neon palette: cyan, pink, blue, yellow, purple
        const std::array<glm::vec3, 5> PALETTE = { glm::vec3( 0.0f, 1.0f, 0.8f ), glm::vec3( 1.0f, 0.2f, 0.8f ), glm::vec3( 0.2f, 0.4f, 1.0f ),
                                                   glm::vec3( 1.0f, 0.8f, 0.0f ), glm::vec3( 0.6f, 0.0f, 1.0f ) };
    } // namespace

    Spawner::Spawner( SpaceObjectPool& pool, const SpaceDefinition& space, const SystemConfig& config, Lifecycle& lifecycle, Random& random,
                      uint32_t& nextId )
        : m_pool( pool )
        , m_space( space )
        , m_config( config )
        , m_lifecycle( lifecycle )
        , m_random( random )
        , m_nextId( nextId )
    {
        m_queue.reserve( pool.GetMaxCapacity() );
    }

    uint32_t Spawner::Schedule( uint32_t count, float baseDelay )
    {
        uint32_t maxGroup  = std::max( m_config.maxSimultaneousSpawns, 1u );
        uint32_t remaining = count;
        uint32_t accepted  = 0;
        float    delay     = std::max( baseDelay, 0.0f );

        while( remaining > 0 )
        {
            uint32_t group = std::min( m_random.UInt( 1, maxGroup ), remaining );
            for( uint32_t i = 0; i < group; ++i )
            {
                ObjectHandle handle = m_pool.Allocate();
                if( !handle.IsValid() )
                {
                    uint32_t dropped = remaining - i;
                    m_dropped += dropped;
                    HC_CORE_WARN( "[Spawner] Pool exhausted ({} slots): dropped {} of {} requested objects", m_pool.GetCapacity(), dropped, count );
                    return accepted;
                }

                SpaceObject* object = m_pool.Get( handle );
                object->id          = m_nextId++;
                m_lifecycle.Transition( *object, ObjectState::PENDING );

                m_queue.push_back( { handle, delay } );
                accepted++;
            }

            remaining -= group;
            if( remaining > 0 )
                delay += m_random.Float( m_config.minGroupDelay, m_config.maxGroupDelay );
        }

        HC_CORE_TRACE( "[Spawner] Scheduled {} objects, last group in {:.2f}s", accepted, delay );
        return accepted;
    }

    uint32_t Spawner::ProcessPending( float dt )
    {
        uint32_t activated = 0;

        for( auto& request: m_queue )
        {
            request.delay -= dt;
            if( request.delay > 0.0f )
                continue;

            SpaceObject* object = m_pool.Get( request.slot );
            if( !object || object->state != ObjectState::PENDING )
                continue; // Slot was released while waiting

            InitializeObject( *object );
            if( m_lifecycle.Transition( *object, ObjectState::ACTIVE ) )
            {
                activated++;
                HC_CORE_TRACE( "[Spawner] Activated object {} at ({:.1f}, {:.1f}, {:.1f})", object->id, object->position.x, object->position.y,
                               object->position.z );
            }
        }

        m_queue.erase( std::remove_if( m_queue.begin(), m_queue.end(), []( const SpawnRequest& r ) { return r.delay <= 0.0f; } ), m_queue.end() );

        if( m_config.autoReplenish )
            Replenish();

        return activated;
    }

    void Spawner::Replenish()
    {
        if( m_queue.size() >= Constants::REPLENISH_QUEUE_LOW )
            return;

        uint32_t active = 0;
        m_pool.ForEach( [ &active ]( ObjectHandle, const SpaceObject& object ) {
            if( object.state == ObjectState::ACTIVE )
                active++;
        } );

        if( active >= m_config.minActiveObjects )
            return;

        uint32_t count = m_random.UInt( 1, std::max( m_config.maxSimultaneousSpawns, 1u ) );
        float    delay = m_random.Float( Constants::MIN_REPLENISH_DELAY, Constants::MAX_REPLENISH_DELAY );
        uint32_t added = Schedule( count, delay );
        if( added > 0 )
        {
            HC_CORE_TRACE( "[Spawner] Replenishing {} objects ({} active)", added, active );
        }
    }

    void Spawner::InitializeObject( SpaceObject& object )
    {
        object.position = RandomFarPlanePosition();

        object.targetSize = m_random.Float( Constants::MIN_COMET_SIZE_PERCENT, Constants::MAX_COMET_SIZE_PERCENT );
        object.size       = 0.01f; // Grows towards targetSize
        object.growthRate = m_random.Float( 2.0f, 4.0f );
        object.scale      = Constants::MIN_SCALE;
        object.opacity    = 0.1f;

        const float twoPi = glm::two_pi<float>();
        object.rotation   = glm::quat( glm::vec3( m_random.Float( 0.0f, twoPi ), m_random.Float( 0.0f, twoPi ), m_random.Float( 0.0f, twoPi ) ) );

        float baseSpeed     = m_random.Float( 20.0f, 40.0f );
        object.velocity     = RandomVelocity( object.position, baseSpeed );
        object.maxSpeed     = baseSpeed * 2.5f;
        object.acceleration = m_random.Float( Constants::MIN_ACCELERATION, Constants::MAX_ACCELERATION );

        object.maxTailLength = m_random.Float( 5.0f, 15.0f );
        object.tailBase      = 0.0f;
        object.tailLength    = 0.0f;

        object.color         = PALETTE[ object.id % PALETTE.size() ];
        object.baseGlow      = m_random.Float( 1.0f, 2.2f );
        object.glowIntensity = object.baseGlow;

        object.lifetime      = 0.0f;
        object.maxLifetime   = Constants::MAX_COMET_LIFETIME;
        object.passedThrough = false;
        object.seed          = m_random.Float( 0.0f, twoPi );
    }

    glm::vec3 Spawner::RandomFarPlanePosition()
    {
        glm::vec2 viewport = m_space.GetViewportDimensions();
        float     z        = m_space.GetMax().z + m_random.Float( -1.0f, 1.0f );

        // Keep the entry point inside the visible extent at that depth
        float limit     = m_space.GetHalfExtentAt( m_space.GetViewDepth( glm::vec3( 0.0f, 0.0f, z ) ) ) * 0.95f;
        float maxWidth  = std::min( viewport.x * 1.5f, limit );
        float maxHeight = std::min( viewport.y * 1.5f, limit );

        // 70% enter through the central part of the plane
        if( m_random.Chance( 0.7f ) )
        {
            maxWidth *= 0.7f;
            maxHeight *= 0.7f;
        }

        glm::vec3 observer = m_space.GetObserverPosition();
        return glm::vec3( observer.x + m_random.Float( -maxWidth, maxWidth ), observer.y + m_random.Float( -maxHeight, maxHeight ), z );
    }

    glm::vec3 Spawner::RandomVelocity( const glm::vec3& start, float baseSpeed )
    {
        glm::vec3 target( m_random.Float( -50.0f, 50.0f ), m_random.Float( -50.0f, 50.0f ), m_random.Float( -80.0f, 0.0f ) );
        glm::vec3 direction = target - start;

        // Jitter, weaker along z so comets keep flying inwards
        const float randomness = 0.6f;
        float       length     = glm::length( direction );
        direction.x += ( m_random.Float01() - 0.5f ) * length * randomness;
        direction.y += ( m_random.Float01() - 0.5f ) * length * randomness;
        direction.z += ( m_random.Float01() - 0.5f ) * length * randomness * 0.5f;

        length = glm::length( direction );
        if( length < 1e-4f )
            direction = glm::vec3( 0.0f, 0.0f, -1.0f );
        else
            direction /= length;

        glm::vec3 velocity = direction * baseSpeed;

        // Mostly-sideways comets cross the screen too fast to read
        float lateral = glm::length( glm::vec2( velocity.x, velocity.y ) );
        if( lateral > baseSpeed * 0.75f && lateral > 30.0f )
        {
            float reduction = 30.0f / lateral;
            velocity.x *= reduction;
            velocity.y *= reduction;
            velocity.z *= 1.2f;
            HC_CORE_TRACE( "[Spawner] Reduced lateral speed {:.2f} -> {:.2f}", lateral, lateral * reduction );
        }

        return velocity;
    }
} // namespace Hypercube
