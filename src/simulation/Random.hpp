#pragma once
#include <cstdint>
#include <random>

namespace Hypercube
{
    /**
     * @brief Per-instance random source. Never shared between instances.
     */
    class Random
    {
    public:
        explicit Random( uint64_t seed )
            : m_engine( seed )
        {
        }

        // Uniform in [min, max)
        float Float( float min, float max )
        {
            if( !( max > min ) )
                return min;
            std::uniform_real_distribution<float> dist( min, max );
            return dist( m_engine );
        }

        float Float01() { return Float( 0.0f, 1.0f ); }

        // Uniform in [min, max]
        uint32_t UInt( uint32_t min, uint32_t max )
        {
            if( max <= min )
                return min;
            std::uniform_int_distribution<uint32_t> dist( min, max );
            return dist( m_engine );
        }

        bool Chance( float probability ) { return Float01() < probability; }

    private:
        std::mt19937_64 m_engine;
    };
} // namespace Hypercube
