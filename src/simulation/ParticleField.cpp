#include "simulation/ParticleField.hpp"

#include <cmath>
#include <glm/gtc/constants.hpp>

namespace Hypercube
{
    ParticleField::ParticleField( uint32_t count, float radius, uint64_t seed )
        : m_particles( count )
        , m_radius( radius )
        , m_random( seed )
    {
        for( Particle& particle: m_particles )
            Respawn( particle );
        m_respawned = 0;

        for( auto& snapshot: m_buffers )
        {
            snapshot.positions.reserve( static_cast<size_t>( count ) * 3 );
            snapshot.sizes.reserve( count );
            snapshot.colors.reserve( static_cast<size_t>( count ) * 4 );
        }
    }

    void ParticleField::Respawn( Particle& particle )
    {
        // Spherical coordinates, radius uniform (denser towards the center)
        float theta = m_random.Float( 0.0f, glm::two_pi<float>() );
        float phi   = m_random.Float( 0.0f, glm::pi<float>() );
        float r     = m_random.Float( 0.0f, m_radius );

        particle.position = glm::vec3( r * std::sin( phi ) * std::cos( theta ), r * std::sin( phi ) * std::sin( theta ), r * std::cos( phi ) );

        const float drift = Constants::MAX_PARTICLE_DRIFT;
        particle.velocity = glm::vec3( m_random.Float( -drift, drift ), m_random.Float( -drift, drift ), m_random.Float( -drift, drift ) );

        particle.maxLifetime = m_random.Float( Constants::MIN_PARTICLE_LIFETIME, Constants::MAX_PARTICLE_LIFETIME );
        particle.lifetime    = particle.maxLifetime;
        particle.size        = m_random.Float( Constants::MIN_PARTICLE_SIZE, Constants::MAX_PARTICLE_SIZE );

        // Blue-heavy palette
        particle.color = glm::vec4( m_random.Float01(), m_random.Float01(), m_random.Float( 0.5f, 1.0f ), m_random.Float( 0.5f, 1.0f ) );

        m_respawned++;
    }

    void ParticleField::Update( float dt )
    {
        if( !std::isfinite( dt ) || dt <= 0.0f )
            return;

        for( Particle& particle: m_particles )
        {
            particle.position += particle.velocity * dt;
            particle.lifetime -= dt;

            bool finite = std::isfinite( particle.position.x ) && std::isfinite( particle.position.y ) && std::isfinite( particle.position.z );
            if( particle.lifetime <= 0.0f || !finite )
                Respawn( particle );
        }
    }

    uint32_t ParticleField::Export()
    {
        uint32_t          backIndex = 1 - m_frontIndex;
        ParticleSnapshot& back      = m_buffers[ backIndex ];
        back.positions.clear();
        back.sizes.clear();
        back.colors.clear();

        for( const Particle& particle: m_particles )
        {
            back.positions.push_back( particle.position.x );
            back.positions.push_back( particle.position.y );
            back.positions.push_back( particle.position.z );

            back.sizes.push_back( particle.size );

            float life = particle.maxLifetime > 0.0f ? particle.lifetime / particle.maxLifetime : 0.0f;
            back.colors.push_back( particle.color.r );
            back.colors.push_back( particle.color.g );
            back.colors.push_back( particle.color.b );
            back.colors.push_back( particle.color.a * life );
        }

        m_frontIndex = backIndex;
        return static_cast<uint32_t>( back.sizes.size() );
    }
} // namespace Hypercube
