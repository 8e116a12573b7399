#pragma once

#include "core/Core.h"
#include "core/Handle.h"
#include <vector>

namespace Hypercube
{
    DEFINE_HANDLE( SystemHandle );
    DEFINE_HANDLE( ObjectHandle );

    enum class LogLevel
    {
        TRACE,
        INFO,
        WARN,
        ERROR,
        OFF,
    };

    /**
     * @brief Tunables of one simulation instance.
     * Defaults reproduce the HYPERCUBE comet field: a 200^3 space, observer at z = -25,
     * viewport covering 25% of the space and a 60 degree field of view.
     */
    struct SystemConfig
    {
        float viewportSizePercent = 25.0f;
        float fieldOfViewDegrees  = 60.0f;

        // Staggering
        uint32_t maxSimultaneousSpawns = 3;
        float    minGroupDelay         = 0.5f;
        float    maxGroupDelay         = 3.0f;

        // Replenishment keeps a sparse field alive without host intervention
        bool_t   autoReplenish    = false;
        uint32_t minActiveObjects = 5;

        // Exit fading. Unusable values (non-finite, non-positive) fall back to these defaults.
        float fadeRate   = 1.5f; // opacity units per second while exiting
        float minOpacity = 0.02f;
        float minScale   = 0.02f;

        // Dust drifting around the origin; 0 disables the field
        uint32_t particleCount       = 0;
        float    particleFieldRadius = 5.0f;
    };

    struct HypercubeConfig
    {
        uint32_t     initialPoolCapacity = 64;
        uint32_t     maxPoolCapacity     = 256;
        float        maxDeltaTime        = 1.0f / 15.0f;
        uint64_t     seed                = 0; // 0 = non-deterministic
        LogLevel     logLevel            = LogLevel::INFO;
        SystemConfig defaultSystem;
    };

    /**
     * @brief Flat, index-aligned export of every Active/Exiting object of one instance.
     * Index i refers to the same object in every array; positions and colors have stride 3,
     * rotations (x, y, z, w) stride 4. Storage is reused by the exporter: a snapshot stays
     * valid only until the second following Update() on the same instance.
     */
    struct FrameSnapshot
    {
        std::vector<uint32_t> ids;
        std::vector<float>    positions;
        std::vector<float>    scales;
        std::vector<float>    rotations;
        std::vector<float>    opacities;
        std::vector<float>    colors;
        std::vector<float>    tailLengths;
        std::vector<float>    glowIntensities;

        size_t GetCount() const { return ids.size(); }
        bool   IsEmpty() const { return ids.empty(); }
    };

    /**
     * @brief Flat export of a system's particle field.
     * positions stride 3, colors stride 4 (r, g, b, a) with alpha scaled by the remaining
     * lifetime of each particle. Same lifetime rules as FrameSnapshot.
     */
    struct ParticleSnapshot
    {
        std::vector<float> positions;
        std::vector<float> sizes;
        std::vector<float> colors;

        size_t GetCount() const { return sizes.size(); }
        bool   IsEmpty() const { return sizes.empty(); }
    };

    struct PoolStats
    {
        uint32_t capacity  = 0;
        uint32_t allocated = 0;
        uint32_t free      = 0;
        uint32_t pending   = 0;
        uint32_t active    = 0;
        uint32_t exiting   = 0;
    };

} // namespace Hypercube
