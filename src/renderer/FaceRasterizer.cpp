#include "renderer/FaceRasterizer.hpp"

#include "renderer/ClipSpaceEdgeRasterizer.hpp"
#include "renderer/ProjectedPolygonRasterizer.hpp"
#include <algorithm>

namespace Wire3D
{
    std::string_view toString( RasterStrategy strategy )
    {
        switch( strategy )
        {
            case RasterStrategy::PROJECTED_POLYGON:
                return "PROJECTED_POLYGON";
            case RasterStrategy::CLIP_SPACE_EDGES:
                return "CLIP_SPACE_EDGES";
            default:
                return "UNKNOWN";
        }
    }

    uint32_t ComputeLightDivisor( const Vec3& normal )
    {
        float sum = std::clamp( normal.x + normal.y + normal.z, 0.1f, 1.0f );
        return static_cast<uint32_t>( 1.0f / sum );
    }

    uint32_t ShadeColor( uint32_t rgb, uint32_t divisor )
    {
        uint32_t r = ( ( rgb >> 16 ) & 0xFF ) / divisor;
        uint32_t g = ( ( rgb >> 8 ) & 0xFF ) / divisor;
        uint32_t b = ( rgb & 0xFF ) / divisor;
        return ( r << 16 ) | ( g << 8 ) | b;
    }

    uint32_t FaceRasterizer::ComputeFaceColor( const Primitive& primitive, const Face& face ) const
    {
        uint32_t divisor = ComputeLightDivisor( primitive.GetFaceNormal( face.normalIndex ) );
        return PackColor( ShadeColor( primitive.color, divisor ), m_surface.GetPixelFormat() );
    }

    Scope<FaceRasterizer> CreateFaceRasterizer( RasterStrategy strategy, const Camera& camera, Surface& surface )
    {
        switch( strategy )
        {
            case RasterStrategy::CLIP_SPACE_EDGES:
                return CreateScope<ClipSpaceEdgeRasterizer>( camera, surface );
            case RasterStrategy::PROJECTED_POLYGON:
            default:
                return CreateScope<ProjectedPolygonRasterizer>( camera, surface );
        }
    }
} // namespace Wire3D
