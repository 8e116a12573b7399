#pragma once
#include "HypercubeTypes.h"
#include "simulation/ObjectPool.hpp"
#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace Hypercube
{
    /**
     * @brief Lifecycle of a pool slot.
     * Legal transitions: Pending -> Active -> Exiting -> Free -> Pending.
     */
    enum class ObjectState : uint8_t
    {
        FREE,
        PENDING, // Slot reserved, waiting for its spawn delay
        ACTIVE,  // Integrated and eligible for visibility
        EXITING, // Left the volume bound, fading out
    };

    inline const char* toString( ObjectState state )
    {
        switch( state )
        {
            case ObjectState::FREE:
                return "FREE";
            case ObjectState::PENDING:
                return "PENDING";
            case ObjectState::ACTIVE:
                return "ACTIVE";
            case ObjectState::EXITING:
                return "EXITING";
            default:
                return "UNKNOWN";
        }
    }

    inline bool IsLegalTransition( ObjectState from, ObjectState to )
    {
        switch( from )
        {
            case ObjectState::FREE:
                return to == ObjectState::PENDING;
            case ObjectState::PENDING:
                return to == ObjectState::ACTIVE;
            case ObjectState::ACTIVE:
                return to == ObjectState::EXITING;
            case ObjectState::EXITING:
                return to == ObjectState::FREE;
            default:
                return false;
        }
    }

    /**
     * @brief One comet. Stored by value inside the ObjectPool.
     */
    struct SpaceObject
    {
        uint32_t    id    = 0;
        ObjectState state = ObjectState::FREE;

        // --- Kinematics ---
        glm::vec3 position     = glm::vec3( 0.0f );
        glm::quat rotation     = glm::quat( 1.0f, 0.0f, 0.0f, 0.0f );
        glm::vec3 velocity     = glm::vec3( 0.0f );
        float     acceleration = 0.0f;
        float     maxSpeed     = 0.0f;

        // --- Size / visuals ---
        float     size          = 0.0f; // Percent of the maximum comet size
        float     targetSize    = 0.0f;
        float     growthRate    = 0.0f;
        float     scale         = 0.0f;
        float     opacity       = 0.0f;
        glm::vec3 color         = glm::vec3( 0.0f );
        float     tailBase      = 0.0f; // Grown tail, before pulsation
        float     tailLength    = 0.0f;
        float     maxTailLength = 0.0f;
        float     glowIntensity = 0.0f;
        float     baseGlow      = 0.0f;

        // --- Lifetime ---
        float lifetime      = 0.0f;
        float maxLifetime   = 0.0f;
        bool  passedThrough = false;

        // Phase offset for the pulsation curves, fixed at spawn
        float seed = 0.0f;
    };

    /**
     * @brief Queued activation of one reserved (Pending) slot.
     */
    struct SpawnRequest
    {
        ObjectHandle slot;
        float        delay = 0.0f;
    };

    using SpaceObjectPool = ObjectPool<SpaceObject, ObjectHandle>;

    /**
     * @brief One dust particle. Recycled in place when its lifetime runs out.
     */
    struct Particle
    {
        glm::vec3 position    = glm::vec3( 0.0f );
        glm::vec3 velocity    = glm::vec3( 0.0f );
        glm::vec4 color       = glm::vec4( 0.0f );
        float     size        = 0.0f;
        float     lifetime    = 0.0f; // Remaining, counts down
        float     maxLifetime = 0.0f;
    };

    namespace Constants
    {
        constexpr float MIN_COMET_SIZE_PERCENT = 17.0f;
        constexpr float MAX_COMET_SIZE_PERCENT = 67.0f;
        constexpr float LIFETIME_AFTER_PASS    = 30.0f; // percent of max lifetime granted after the pass
        constexpr float MAX_COMET_LIFETIME     = 60.0f;
        constexpr float MIN_ACCELERATION       = 5.0f;
        constexpr float MAX_ACCELERATION       = 30.0f;
        constexpr float MAX_LATERAL_SPEED      = 40.0f;
        constexpr float MIN_VISIBILITY_TIME    = 0.5f;
        constexpr float TAIL_GROWTH_RATE       = 2.0f;
        constexpr float MIN_SCALE              = 0.01f; // Integration floor, kept below the default minScale

        // Respawn cadence of automatic replenishment
        constexpr float    MIN_REPLENISH_DELAY = 0.5f;
        constexpr float    MAX_REPLENISH_DELAY = 2.0f;
        constexpr uint32_t REPLENISH_QUEUE_LOW = 3;

        // Upper bounds on per-system storage
        constexpr uint32_t MAX_POOL_CAPACITY = 1u << 20;
        constexpr uint32_t MAX_PARTICLES     = 1u << 16;

        // Dust particles
        constexpr float MAX_PARTICLE_DRIFT    = 0.1f;
        constexpr float MIN_PARTICLE_LIFETIME = 2.0f;
        constexpr float MAX_PARTICLE_LIFETIME = 10.0f;
        constexpr float MIN_PARTICLE_SIZE     = 0.05f;
        constexpr float MAX_PARTICLE_SIZE     = 0.2f;
    } // namespace Constants

} // namespace Hypercube
