#include "renderer/ClipSpaceEdgeRasterizer.hpp"

namespace Wire3D
{
    ClipSpaceEdgeRasterizer::ClipSpaceEdgeRasterizer( const Camera& camera, Surface& surface )
        : FaceRasterizer( camera, surface )
    {
        m_vertices.reserve( 10 );
    }

    void ClipSpaceEdgeRasterizer::BeginPrimitive( const Primitive& primitive )
    {
        ( void )primitive;

        m_viewProjection = m_camera.GetViewProjection();
        m_halfWidth      = static_cast<float>( m_surface.GetWidth() ) / 2.0f;
        m_halfHeight     = static_cast<float>( m_surface.GetHeight() ) / 2.0f;
    }

    ClipSpaceEdgeRasterizer::ClipVertex ClipSpaceEdgeRasterizer::Transform( const Vec3& point ) const
    {
        ClipVertex vertex;

        Vec4 clip = Math::TransformPoint( m_viewProjection, point );
        Vec3 ndc  = Vec3( clip ) / clip.w;

        if( !( ndc.z > 0.0f && ndc.z < 1.0f ) )
            return vertex;

        // [-1, 1] to pixels, Y pointing down
        float px = ( ndc.x + 1.0f ) * m_halfWidth;
        float py = ( 1.0f - ndc.y ) * m_halfHeight;

        if( !( px >= 0.0f && px < static_cast<float>( m_surface.GetWidth() ) ) )
            return vertex;
        if( !( py >= 0.0f && py < static_cast<float>( m_surface.GetHeight() ) ) )
            return vertex;

        vertex.x       = static_cast<uint32_t>( px );
        vertex.y       = static_cast<uint32_t>( py );
        vertex.visible = m_lines.Contains( vertex.x, vertex.y );
        return vertex;
    }

    uint32_t ClipSpaceEdgeRasterizer::RasterizeFace( const Primitive& primitive, const Face& face )
    {
        if( face.vertexCount == 0 )
            return 0;

        m_vertices.clear();
        for( uint32_t i = 0; i < face.vertexCount; ++i )
        {
            W3D_CORE_ASSERT( face[ i ] < primitive.positions.size(), "Position index out of range" );
            m_vertices.push_back( Transform( primitive.positions[ face[ i ] ] ) );
        }

        // A two-vertex face is a single segment, its closing edge would redraw it
        size_t edgeCount = m_vertices.size() == 2 ? 1 : m_vertices.size();

        uint32_t color   = ComputeFaceColor( primitive, face );
        uint32_t written = 0;
        for( size_t i = 0; i < edgeCount; ++i )
        {
            const ClipVertex& a = m_vertices[ i ];
            const ClipVertex& b = m_vertices[ ( i + 1 ) % m_vertices.size() ];
            if( !a.visible || !b.visible )
                continue;

            written += m_lines.DrawLine( a.x, a.y, b.x, b.y, color );
        }
        return written;
    }
} // namespace Wire3D
