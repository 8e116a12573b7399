#pragma once
#include "HypercubeTypes.h"
#include "simulation/Types.hpp"
#include <array>

namespace Hypercube
{
    /**
     * @brief Packs live objects into flat arrays for the renderer.
     * Double buffered: Export() writes the back buffer and then swaps, so the snapshot handed
     * out by the previous frame is left untouched for one more frame. Buffers are cleared,
     * never shrunk, and reach steady state after the first frames.
     */
    class SnapshotExporter
    {
    public:
        void Reserve( uint32_t objectCount );

        // Returns the number of exported objects
        uint32_t Export( const SpaceObjectPool& pool );

        const FrameSnapshot& GetFront() const { return m_buffers[ m_frontIndex ]; }
        uint32_t             GetFrontIndex() const { return m_frontIndex; }

    private:
        static void Clear( FrameSnapshot& snapshot );

    private:
        std::array<FrameSnapshot, 2> m_buffers;
        uint32_t                     m_frontIndex = 0;
    };
} // namespace Hypercube
