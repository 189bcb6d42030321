#pragma once
#include "renderer/FaceRasterizer.hpp"

namespace Wire3D
{
    struct ScreenPoint
    {
        uint32_t x = 0;
        uint32_t y = 0;
    };

    /**
     * @brief Projects vertices with the camera basis and draws each face as a closed border.
     * A face is dropped entirely if any vertex falls outside the surface or outside the
     * (1/far, 1/near) inverse depth range. The vertex with the smallest screen Y gets a
     * sentinel pixel.
     */
    class ProjectedPolygonRasterizer : public FaceRasterizer
    {
    public:
        ProjectedPolygonRasterizer( const Camera& camera, Surface& surface );

        RasterStrategy GetStrategy() const override { return RasterStrategy::PROJECTED_POLYGON; }

        void     BeginPrimitive( const Primitive& primitive ) override;
        uint32_t RasterizeFace( const Primitive& primitive, const Face& face ) override;

        // Returns false if the point is culled.
        bool Project( const Vec3& point, ScreenPoint& out ) const;

    private:
        uint32_t DrawPolygonBorder( uint32_t color );

    private:
        Vec3  m_right;
        Vec3  m_up;
        Vec3  m_direction;
        float m_eyeRight     = 0.0f;
        float m_eyeUp        = 0.0f;
        float m_eyeDirection = 0.0f;

        float m_invNear = 0.0f;
        float m_invFar  = 0.0f;

        float m_xAdd = 0.0f;
        float m_xMul = 0.0f;
        float m_yAdd = 0.0f;
        float m_yMul = 0.0f;

        uint32_t m_sentinel = 0;

        // Reused between faces
        std::vector<ScreenPoint> m_polygon;
        uint32_t                 m_bottomIndex = 0;
    };
} // namespace Wire3D
