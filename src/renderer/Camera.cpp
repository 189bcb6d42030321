#include "renderer/Camera.hpp"

namespace Wire3D
{
    Camera::Camera()
    {
        m_viewMatrix = Math::View( m_location.location, m_location.at, m_location.up );

        Resize( 800, 600 );
        SetProjection( 0.05f, 100.0f, Vec2( 0.1f, 0.1f ) );
    }

    Result Camera::SetPose( const Vec3& eye, const Vec3& at, const Vec3& approxUp )
    {
        if( Math::IsDegenerateBasis( eye, at, approxUp ) )
        {
            W3D_CORE_ERROR( "Camera: degenerate pose eye=({}, {}, {}) at=({}, {}, {}) up=({}, {}, {})", eye.x, eye.y, eye.z, at.x, at.y, at.z,
                            approxUp.x, approxUp.y, approxUp.z );
            return Result::INVALID_ARGS;
        }

        m_viewMatrix = Math::View( eye, at, approxUp );

        CameraBasis basis    = Math::ExtractBasis( m_viewMatrix );
        m_location.right     = basis.right;
        m_location.up        = basis.up;
        m_location.direction = basis.direction;
        m_location.location  = eye;
        m_location.at        = at;

        m_viewProjection = m_projectionMatrix * m_viewMatrix;
        return Result::SUCCESS;
    }

    Result Camera::SetProjection( float nearClip, float farClip, const Vec2& size )
    {
        if( !( nearClip > 0.0f ) || !( farClip > nearClip ) || !( size.x > 0.0f ) || !( size.y > 0.0f ) )
        {
            W3D_CORE_ERROR( "Camera: invalid projection near={} far={} size=({}, {})", nearClip, farClip, size.x, size.y );
            return Result::INVALID_ARGS;
        }

        m_projection.nearClip = nearClip;
        m_projection.farClip  = farClip;
        m_projection.size     = size;

        RecalculateProjection();
        return Result::SUCCESS;
    }

    bool Camera::Resize( uint32_t width, uint32_t height )
    {
        if( width == 0 || height == 0 )
            return false;
        if( m_extent.width == width && m_extent.height == height )
            return false;

        m_extent.width  = width;
        m_extent.height = height;

        RecalculateProjection();
        return true;
    }

    void Camera::RecalculateProjection()
    {
        // The shorter screen axis keeps the configured size, the longer one is stretched.
        Vec2 aspect( 1.0f, 1.0f );
        if( m_extent.width > m_extent.height )
            aspect.x = static_cast<float>( m_extent.width ) / static_cast<float>( m_extent.height );
        else if( m_extent.height > m_extent.width )
            aspect.y = static_cast<float>( m_extent.height ) / static_cast<float>( m_extent.width );

        m_halfExtent = m_projection.size * aspect;

        m_projectionMatrix = Math::ProjectionFrustum( -m_halfExtent.x, m_halfExtent.x, -m_halfExtent.y, m_halfExtent.y, m_projection.nearClip,
                                                      m_projection.farClip );
        m_viewProjection   = m_projectionMatrix * m_viewMatrix;
    }

} // namespace Wire3D
