#pragma once
#include "HypercubeTypes.h"
#include "simulation/Random.hpp"
#include "simulation/Types.hpp"
#include <array>
#include <vector>

namespace Hypercube
{
    /**
     * @brief Fixed-size cloud of dust particles inside a sphere around the origin.
     * The particle count never changes: a particle whose lifetime ran out is re-rolled in
     * its own slot, so the field allocates nothing after construction. Exports are double
     * buffered like the comet snapshots.
     */
    class ParticleField
    {
    public:
        ParticleField( uint32_t count, float radius, uint64_t seed );

        // Drifts every particle and recycles the expired ones. Non-positive dt is a no-op.
        void Update( float dt );

        // Returns the number of exported particles
        uint32_t Export();

        const ParticleSnapshot& GetFront() const { return m_buffers[ m_frontIndex ]; }

        uint32_t GetCount() const { return static_cast<uint32_t>( m_particles.size() ); }
        uint64_t GetRespawnCount() const { return m_respawned; }
        float    GetRadius() const { return m_radius; }

        const std::vector<Particle>& GetParticles() const { return m_particles; }

    private:
        void Respawn( Particle& particle );

    private:
        std::vector<Particle> m_particles;
        float                 m_radius;
        Random                m_random;
        uint64_t              m_respawned = 0;

        std::array<ParticleSnapshot, 2> m_buffers;
        uint32_t                        m_frontIndex = 0;
    };
} // namespace Hypercube
