#include "simulation/Integrator.hpp"

#include "core/Base.hpp"
#include <algorithm>
#include <cmath>

namespace Hypercube
{
    namespace
    {
        bool IsFinite( const glm::vec3& v )
        {
            return std::isfinite( v.x ) && std::isfinite( v.y ) && std::isfinite( v.z );
        }
    } // namespace

    Integrator::Integrator( const SpaceDefinition& space, const SystemConfig& config, Lifecycle& lifecycle )
        : m_space( space )
        , m_config( config )
        , m_lifecycle( lifecycle )
    {
    }

    uint32_t Integrator::Integrate( SpaceObjectPool& pool, float dt )
    {
        uint32_t exited = 0;
        pool.ForEach( [ & ]( ObjectHandle, SpaceObject& object ) {
            if( Step( object, dt ) )
                exited++;
        } );
        return exited;
    }

    bool Integrator::Step( SpaceObject& object, float dt )
    {
        if( object.state != ObjectState::ACTIVE && object.state != ObjectState::EXITING )
            return false;

        bool exited = false;

        object.lifetime += dt;
        if( object.state == ObjectState::ACTIVE && object.lifetime > object.maxLifetime )
            exited |= BeginExit( object, "lifetime" );

        glm::vec3 lastPosition = object.position;
        UpdateVelocity( object, dt );
        object.position += object.velocity * dt;

        // Never keep a non-finite state: freeze at the last good position and retire
        if( !IsFinite( object.position ) || !IsFinite( object.velocity ) )
        {
            HC_CORE_WARN( "[Integrator] Non-finite state on object {}, retiring it", object.id );
            object.position = IsFinite( lastPosition ) ? lastPosition : m_space.GetObserverPosition();
            object.velocity = glm::vec3( 0.0f );
            object.opacity  = 0.0f;
            if( object.state == ObjectState::ACTIVE )
                exited |= BeginExit( object, "non-finite" );
        }

        if( object.state == ObjectState::ACTIVE && m_space.IsOutsideSpace( object.position ) )
            exited |= BeginExit( object, "space bound" );

        // Slow tumble
        float     rotSpeed = 0.1f * dt;
        glm::quat delta( glm::vec3( rotSpeed, rotSpeed * 0.7f, rotSpeed * 0.3f ) );
        object.rotation = glm::normalize( object.rotation * delta );

        UpdateAppearance( object, dt );
        return exited;
    }

    void Integrator::UpdateVelocity( SpaceObject& object, float dt ) const
    {
        float currentSpeed = glm::length( object.velocity );
        if( currentSpeed <= 0.0001f )
            return;

        // Approaching comets accelerate up to 1.5x harder within 50 units of the observer
        float     accelerationFactor = 1.0f;
        glm::vec3 toObject           = object.position - m_space.GetObserverPosition();
        if( toObject.z > 0.0f && object.velocity.z < 0.0f )
        {
            float distance = glm::length( toObject );
            if( distance < 50.0f )
                accelerationFactor = 1.0f + ( 1.0f - distance / 50.0f ) * 0.5f;
        }

        float newSpeed  = std::min( currentSpeed + object.acceleration * dt * accelerationFactor, object.maxSpeed );
        object.velocity = ( object.velocity / currentSpeed ) * newSpeed;

        // Lateral speed limit, z is left untouched
        float lateral = glm::length( glm::vec2( object.velocity.x, object.velocity.y ) );
        if( lateral > Constants::MAX_LATERAL_SPEED )
        {
            float ratio = Constants::MAX_LATERAL_SPEED / lateral;
            object.velocity.x *= ratio;
            object.velocity.y *= ratio;
            lateral = Constants::MAX_LATERAL_SPEED;
        }

        // Crossing the screen must take at least MIN_VISIBILITY_TIME
        float screenWidth = m_space.GetViewportDimensions().x * 2.0f;
        if( lateral > 0.0f && screenWidth / lateral < Constants::MIN_VISIBILITY_TIME )
        {
            float ratio = ( screenWidth / Constants::MIN_VISIBILITY_TIME ) / lateral;
            object.velocity.x *= ratio;
            object.velocity.y *= ratio;
        }
    }

    void Integrator::UpdateAppearance( SpaceObject& object, float dt ) const
    {
        if( object.size < object.targetSize )
            object.size = std::min( object.size + object.growthRate * dt, object.targetSize );

        float scaleFactor = m_space.GetScaleFactor( object.position );
        object.scale      = std::max( std::pow( scaleFactor, 1.5f ) * object.size, Constants::MIN_SCALE );

        if( object.state == ObjectState::ACTIVE )
        {
            // Fade in over the first second, then follow distance attenuation
            if( object.lifetime < 1.0f )
                object.opacity = std::max( object.lifetime, 0.0f );
            else
                object.opacity = std::max( m_space.GetTransparencyFactor( object.position ), 0.3f );

            // Past 30% of its life the comet flares once and earns extra time
            if( !object.passedThrough && object.lifetime > object.maxLifetime * 0.3f )
            {
                object.passedThrough = true;
                object.baseGlow *= 1.5f;
                object.maxLifetime = object.lifetime + Constants::MAX_COMET_LIFETIME * ( Constants::LIFETIME_AFTER_PASS / 100.0f );
            }

            object.tailBase = std::min( object.tailBase + Constants::TAIL_GROWTH_RATE * dt, object.maxTailLength );
        }
        else
        {
            object.opacity  = std::max( object.opacity - m_config.fadeRate * dt, 0.0f );
            object.tailBase = std::max( object.tailBase - Constants::TAIL_GROWTH_RATE * 2.0f * dt, 0.0f );
        }

        // Pulsation is recomputed from the base values, so it never drifts
        object.glowIntensity = object.baseGlow * ( 0.8f + 0.2f * std::sin( object.lifetime * 2.0f + object.seed ) );
        object.tailLength    = object.tailBase * ( 0.9f + 0.1f * std::sin( object.lifetime * 3.0f + object.seed ) );
    }

    bool Integrator::BeginExit( SpaceObject& object, const char* reason )
    {
        if( !m_lifecycle.Transition( object, ObjectState::EXITING ) )
            return false;

        HC_CORE_TRACE( "[Integrator] Object {} exiting ({})", object.id, reason );
        return true;
    }
} // namespace Hypercube
