#include "renderer/ProjectedPolygonRasterizer.hpp"

namespace Wire3D
{
    ProjectedPolygonRasterizer::ProjectedPolygonRasterizer( const Camera& camera, Surface& surface )
        : FaceRasterizer( camera, surface )
    {
        m_polygon.reserve( 10 );
    }

    void ProjectedPolygonRasterizer::BeginPrimitive( const Primitive& primitive )
    {
        ( void )primitive;

        const CameraLocation&   location   = m_camera.GetLocation();
        const CameraProjection& projection = m_camera.GetProjection();
        const Vec2&             halfExtent = m_camera.GetProjectionHalfExtent();

        m_right     = location.right;
        m_up        = location.up;
        m_direction = location.direction;

        m_eyeRight     = glm::dot( location.location, m_right );
        m_eyeUp        = glm::dot( location.location, m_up );
        m_eyeDirection = glm::dot( location.location, m_direction );

        m_invNear = 1.0f / projection.nearClip;
        m_invFar  = 1.0f / projection.farClip;

        // Same mapping as the view-projection matrix followed by the viewport transform
        m_xAdd = static_cast<float>( m_surface.GetWidth() ) / 2.0f;
        m_xMul = m_xAdd * projection.nearClip / halfExtent.x;
        m_yAdd = static_cast<float>( m_surface.GetHeight() ) / 2.0f;
        m_yMul = -m_yAdd * projection.nearClip / halfExtent.y;

        m_sentinel = OpaqueBlack( m_surface.GetPixelFormat() );
    }

    bool ProjectedPolygonRasterizer::Project( const Vec3& point, ScreenPoint& out ) const
    {
        float invDepth = 1.0f / ( glm::dot( point, m_direction ) - m_eyeDirection );
        if( !( invDepth < m_invNear ) || !( invDepth > m_invFar ) )
            return false;

        float px = ( glm::dot( point, m_right ) - m_eyeRight ) * invDepth * m_xMul + m_xAdd;
        float py = ( glm::dot( point, m_up ) - m_eyeUp ) * invDepth * m_yMul + m_yAdd;

        // Also rejects NaN
        if( !( px >= 0.0f && px < static_cast<float>( m_surface.GetWidth() ) ) )
            return false;
        if( !( py >= 0.0f && py < static_cast<float>( m_surface.GetHeight() ) ) )
            return false;

        out.x = static_cast<uint32_t>( px );
        out.y = static_cast<uint32_t>( py );
        return m_lines.Contains( out.x, out.y );
    }

    uint32_t ProjectedPolygonRasterizer::RasterizeFace( const Primitive& primitive, const Face& face )
    {
        if( face.vertexCount == 0 )
            return 0;

        m_polygon.clear();
        m_bottomIndex    = 0;
        uint32_t bottomY = UINT32_MAX;

        for( uint32_t i = 0; i < face.vertexCount; ++i )
        {
            W3D_CORE_ASSERT( face[ i ] < primitive.positions.size(), "Position index out of range" );

            ScreenPoint point;
            if( !Project( primitive.positions[ face[ i ] ], point ) )
                return 0;

            if( point.y < bottomY )
            {
                bottomY       = point.y;
                m_bottomIndex = i;
            }
            m_polygon.push_back( point );
        }

        return DrawPolygonBorder( ComputeFaceColor( primitive, face ) );
    }

    uint32_t ProjectedPolygonRasterizer::DrawPolygonBorder( uint32_t color )
    {
        uint32_t written = 0;

        const ScreenPoint& first = m_polygon.front();
        const ScreenPoint& last  = m_polygon.back();
        written += m_lines.DrawLine( first.x, first.y, last.x, last.y, color );

        for( size_t i = 0; i + 1 < m_polygon.size(); ++i )
            written += m_lines.DrawLine( m_polygon[ i ].x, m_polygon[ i ].y, m_polygon[ i + 1 ].x, m_polygon[ i + 1 ].y, color );

        const ScreenPoint& bottom = m_polygon[ m_bottomIndex ];
        m_lines.SetPixel( bottom.x, bottom.y, m_sentinel );
        return written + 1;
    }
} // namespace Wire3D
