#pragma once
#include <glm/glm.hpp>

namespace Hypercube
{
    /**
     * @brief Geometry of the viewing volume.
     * The space is an axis aligned box (default [-100, 100]^3). The observer sits at
     * z = -25 looking down +z; the far plane (z = maxZ) is where comets enter.
     */
    class SpaceDefinition
    {
    public:
        SpaceDefinition();
        SpaceDefinition( float viewportSizePercent, float fovDegrees );

        glm::vec3 GetDimensions() const { return m_max - m_min; }
        glm::vec2 GetViewportDimensions() const;

        const glm::vec3& GetMin() const { return m_min; }
        const glm::vec3& GetMax() const { return m_max; }
        const glm::vec3& GetObserverPosition() const { return m_observer; }

        float GetViewportSizePercent() const { return m_viewportSizePercent; }
        float GetFieldOfView() const { return m_fieldOfView; } // radians

        // --- Volume bound ---

        // Depth of p along the view axis, relative to the observer
        float GetViewDepth( const glm::vec3& p ) const { return p.z - m_observer.z; }
        float GetNearDepth() const { return NEAR_DEPTH; }
        float GetFarDepth() const { return ( m_max.z - m_observer.z ) + FAR_MARGIN; }

        // Half of the visible lateral extent at the given view depth
        float GetHalfExtentAt( float depth ) const;

        /**
         * @brief Frustum-like visibility test.
         * Depth must lie in [near, far]; |x| and |y| relative to the observer must stay within
         * the half extent for that depth.
         */
        bool IsInVolume( const glm::vec3& p ) const;

        /**
         * @brief Hard bound of the space box. Anything beyond can never come back into view.
         */
        bool IsOutsideSpace( const glm::vec3& p ) const;

        // --- Distance based attenuation ---
        float GetScaleFactor( const glm::vec3& p ) const;
        float GetTransparencyFactor( const glm::vec3& p ) const;

    public:
        static constexpr float DEFAULT_VIEWPORT_PERCENT = 25.0f;
        static constexpr float DEFAULT_FOV_DEGREES      = 60.0f;
        static constexpr float MAX_FOV_DEGREES          = 179.0f;

        // Objects stay in view for 30 units after passing the observer
        static constexpr float NEAR_DEPTH = -30.0f;
        static constexpr float FAR_MARGIN = 1.0f;

        static constexpr float ATTENUATION_DISTANCE = 200.0f;

    private:
        glm::vec3 m_min                 = glm::vec3( -100.0f );
        glm::vec3 m_max                 = glm::vec3( 100.0f );
        glm::vec3 m_observer            = glm::vec3( 0.0f, 0.0f, -25.0f );
        float     m_viewportSizePercent = DEFAULT_VIEWPORT_PERCENT;
        float     m_fieldOfView;
        float     m_tanHalfFov;
    };
} // namespace Hypercube
