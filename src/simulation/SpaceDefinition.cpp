#include "simulation/SpaceDefinition.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace Hypercube
{
    SpaceDefinition::SpaceDefinition()
        : SpaceDefinition( DEFAULT_VIEWPORT_PERCENT, DEFAULT_FOV_DEGREES )
    {
    }

    SpaceDefinition::SpaceDefinition( float viewportSizePercent, float fovDegrees )
    {
        // Non-positive (or NaN) inputs keep the defaults
        if( viewportSizePercent > 0.0f && std::isfinite( viewportSizePercent ) )
            m_viewportSizePercent = std::min( viewportSizePercent, 100.0f );

        float fov = DEFAULT_FOV_DEGREES;
        if( fovDegrees > 0.0f && std::isfinite( fovDegrees ) )
            fov = std::min( fovDegrees, MAX_FOV_DEGREES );

        m_fieldOfView = glm::radians( fov );
        m_tanHalfFov  = std::tan( m_fieldOfView * 0.5f );
    }

    glm::vec2 SpaceDefinition::GetViewportDimensions() const
    {
        glm::vec3 dims   = GetDimensions();
        float     factor = m_viewportSizePercent / 100.0f;
        return glm::vec2( dims.x * factor, dims.y * factor );
    }

    float SpaceDefinition::GetHalfExtentAt( float depth ) const
    {
        // Viewport margin is 1.5x the half viewport so edge objects stay visible
        float margin = GetViewportDimensions().x * 0.75f;
        return std::max( depth, 0.0f ) * m_tanHalfFov + margin;
    }

    bool SpaceDefinition::IsInVolume( const glm::vec3& p ) const
    {
        float depth = GetViewDepth( p );
        if( depth < GetNearDepth() || depth > GetFarDepth() )
            return false;

        float     halfExtent = GetHalfExtentAt( depth );
        glm::vec3 lateral    = p - m_observer;
        return std::abs( lateral.x ) <= halfExtent && std::abs( lateral.y ) <= halfExtent;
    }

    bool SpaceDefinition::IsOutsideSpace( const glm::vec3& p ) const
    {
        glm::vec3 dims = GetDimensions();
        return GetViewDepth( p ) < NEAR_DEPTH || std::abs( p.x ) > dims.x || std::abs( p.y ) > dims.y;
    }

    float SpaceDefinition::GetScaleFactor( const glm::vec3& p ) const
    {
        float distance   = glm::length( p - m_observer );
        float normalized = std::min( distance / ATTENUATION_DISTANCE, 1.0f );
        float scale      = 1.0f - normalized * 0.8f;

        // Close objects swell smoothly from 1.1x (10 units) to 1.4x (touching the observer)
        if( distance < 10.0f )
        {
            float closeFactor = 1.1f + ( 1.0f - distance / 10.0f ) * 0.3f;
            return scale * closeFactor;
        }

        return scale;
    }

    float SpaceDefinition::GetTransparencyFactor( const glm::vec3& p ) const
    {
        float distance = glm::length( p - m_observer );

        if( distance < 10.0f )
            return 0.4f + ( distance / 10.0f ) * 0.4f;

        float normalized = std::min( distance / ATTENUATION_DISTANCE, 1.0f );
        if( normalized < 0.75f )
            return 1.0f;

        // Far objects fade out over the last quarter of the attenuation range
        return std::clamp( ( 1.0f - normalized ) * 4.0f, 0.0f, 1.0f );
    }
} // namespace Hypercube
