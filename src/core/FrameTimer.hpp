#pragma once
#include <chrono>
#include <cstdint>

namespace Hypercube
{

    /**
     * @brief Wall clock helper for host loops.
     * Tick() returns the seconds since the previous Tick(); ConsumeAverageMillis() smooths
     * the measured durations over a window of samples.
     */
    class FrameTimer
    {
    public:
        using Clock = std::chrono::steady_clock;

        FrameTimer() { Reset(); }

        void Reset()
        {
            m_start    = Clock::now();
            m_lastTick = m_start;
            m_sum      = 0.0;
            m_samples  = 0;
        }

        float Tick()
        {
            auto  now  = Clock::now();
            float secs = std::chrono::duration<float>( now - m_lastTick ).count();
            m_lastTick = now;
            return secs;
        }

        // Seconds since Reset()
        float Elapsed() const { return std::chrono::duration<float>( Clock::now() - m_start ).count(); }

        void AddSample( float seconds )
        {
            m_sum += seconds;
            m_samples++;
        }

        // Average of the recorded samples in milliseconds, then starts a new window
        float ConsumeAverageMillis()
        {
            float avg = m_samples > 0 ? static_cast<float>( m_sum / m_samples ) * 1000.0f : 0.0f;
            m_sum     = 0.0;
            m_samples = 0;
            return avg;
        }

    private:
        Clock::time_point m_start;
        Clock::time_point m_lastTick;
        double            m_sum     = 0.0;
        uint32_t          m_samples = 0;
    };
} // namespace Hypercube
