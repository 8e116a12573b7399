#pragma once
#include "simulation/Lifecycle.hpp"
#include "simulation/Random.hpp"
#include "simulation/SpaceDefinition.hpp"
#include "simulation/Types.hpp"
#include <vector>

namespace Hypercube
{
    /**
     * @brief Admits new comets into the pool.
     * Scheduling reserves slots immediately (objects enter Pending with their final id);
     * activation happens once the request's delay has elapsed. Requests that find the pool
     * exhausted are dropped, never queued for later.
     */
    class Spawner
    {
    public:
        Spawner( SpaceObjectPool& pool, const SpaceDefinition& space, const SystemConfig& config, Lifecycle& lifecycle, Random& random,
                 uint32_t& nextId );

        /**
         * @brief Reserves up to count objects, released in groups of 1..maxSimultaneousSpawns.
         * @param count Number of objects requested.
         * @param baseDelay Delay of the first group; each further group waits an extra random interval.
         * @return Number of objects reserved.
         */
        uint32_t Schedule( uint32_t count, float baseDelay = 0.0f );

        /**
         * @brief Counts down queued delays and activates due objects.
         * @return Number of objects that became Active.
         */
        uint32_t ProcessPending( float dt );

        uint32_t GetPendingCount() const { return static_cast<uint32_t>( m_queue.size() ); }
        uint64_t GetDroppedCount() const { return m_dropped; }

        // Far-plane placement and trajectory; exposed for tests
        void InitializeObject( SpaceObject& object );

    private:
        glm::vec3 RandomFarPlanePosition();
        glm::vec3 RandomVelocity( const glm::vec3& start, float baseSpeed );
        void      Replenish();

    private:
        SpaceObjectPool&       m_pool;
        const SpaceDefinition& m_space;
        const SystemConfig&    m_config;
        Lifecycle&             m_lifecycle;
        Random&                m_random;
        uint32_t&              m_nextId;

        std::vector<SpawnRequest> m_queue;
        uint64_t                  m_dropped = 0;
    };
} // namespace Hypercube
