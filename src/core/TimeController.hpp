#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Hypercube
{
    /**
     * @brief Converts host frame deltas into simulation time for one instance.
     * Handles clamping of degenerate deltas, time scaling and frame counting.
     */
    class TimeController
    {
    public:
        explicit TimeController( float maxDeltaTime = 1.0f / 15.0f )
            : m_maxDeltaTime( maxDeltaTime )
        {
        }

        /**
         * @brief Speed multiplier for the simulation.
         * 1.0 = Real-time, 2.0 = 2x speed, 0.0 = Paused.
         */
        void  SetTimeScale( float scale ) { m_timeScale = std::isfinite( scale ) ? std::max( scale, 0.0f ) : 1.0f; }
        float GetTimeScale() const { return m_timeScale; }

        float GetMaxDeltaTime() const { return m_maxDeltaTime; }

        /**
         * @brief Total accumulated simulation time (in seconds).
         */
        float GetSimTime() const { return m_simTime; }

        uint32_t GetFrameIndex() const { return m_frameIndex; }

        /**
         * @brief Simulation delta of the current frame: Clamp(realDt) * TimeScale.
         */
        float GetSimDeltaTime() const { return m_simDeltaTime; }

        /**
         * @brief Maps any host delta into [0, maxDeltaTime].
         * NaN and negative values collapse to 0, +Inf and long stalls to maxDeltaTime.
         */
        float Clamp( float realDt ) const
        {
            if( std::isnan( realDt ) || realDt <= 0.0f )
                return 0.0f;
            return std::min( realDt, m_maxDeltaTime );
        }

        /**
         * @brief Advances the clock by one host frame.
         * @param realDt The time elapsed since the previous frame (in seconds).
         * @return The simulation delta to integrate with.
         */
        float Update( float realDt )
        {
            m_simDeltaTime = Clamp( realDt ) * m_timeScale;

            m_simTime += m_simDeltaTime;
            m_frameIndex++;
            return m_simDeltaTime;
        }

        bool IsPaused() const { return m_timeScale == 0.0f; }

    private:
        float    m_maxDeltaTime;
        float    m_timeScale    = 1.0f;
        float    m_simTime      = 0.0f;
        float    m_simDeltaTime = 0.0f;
        uint32_t m_frameIndex   = 0;
    };
} // namespace Hypercube
