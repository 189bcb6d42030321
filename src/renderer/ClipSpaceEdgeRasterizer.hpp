#pragma once
#include "renderer/FaceRasterizer.hpp"

namespace Wire3D
{
    /**
     * @brief Transforms vertices by the view-projection matrix and draws face edges one by one.
     * An edge is drawn only when both endpoints pass the (0, 1) depth test and land inside
     * the surface; there is no screen-rectangle clipping, so a face may be partially drawn.
     * Faces are closed loops, except a two-vertex face which is one segment.
     */
    class ClipSpaceEdgeRasterizer : public FaceRasterizer
    {
    public:
        ClipSpaceEdgeRasterizer( const Camera& camera, Surface& surface );

        RasterStrategy GetStrategy() const override { return RasterStrategy::CLIP_SPACE_EDGES; }

        void     BeginPrimitive( const Primitive& primitive ) override;
        uint32_t RasterizeFace( const Primitive& primitive, const Face& face ) override;

    private:
        struct ClipVertex
        {
            uint32_t x       = 0;
            uint32_t y       = 0;
            bool     visible = false;
        };

        ClipVertex Transform( const Vec3& point ) const;

    private:
        Mat4x4 m_viewProjection = Mat4x4( 1.0f );
        float  m_halfWidth      = 0.0f;
        float  m_halfHeight     = 0.0f;

        std::vector<ClipVertex> m_vertices;
    };
} // namespace Wire3D
