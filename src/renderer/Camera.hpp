#pragma once
#include "core/Base.hpp"
#include "math/Math.hpp"

namespace Wire3D
{
    struct CameraLocation
    {
        Vec3 direction = { 0.0f, 0.0f, -1.0f };
        Vec3 right     = { 1.0f, 0.0f, 0.0f };
        Vec3 up        = { 0.0f, 1.0f, 0.0f };

        Vec3 location = { 0.0f, 0.0f, 1.0f };
        Vec3 at       = { 0.0f, 0.0f, 0.0f };
    };

    struct CameraProjection
    {
        // Near-plane half-extent along the shorter screen axis
        Vec2  size     = { 0.1f, 0.1f };
        float nearClip = 0.05f;
        float farClip  = 100.0f;
    };

    struct Extent
    {
        uint32_t width  = 0;
        uint32_t height = 0;
    };

    /**
     * @brief Look-at camera with a near-plane sized perspective frustum.
     * View, projection and view-projection matrices are cached and kept in sync with
     * the pose, the projection parameters and the target extent.
     */
    class Camera
    {
    public:
        Camera();

        // Rejects eye == at and an up vector parallel to the view direction.
        Result SetPose( const Vec3& eye, const Vec3& at, const Vec3& approxUp );

        // Requires 0 < nearClip < farClip and a positive size.
        Result SetProjection( float nearClip, float farClip, const Vec2& size );

        // Returns true if the matrices were recomputed (extent changed and non-zero).
        bool Resize( uint32_t width, uint32_t height );

        // Getters
        const CameraLocation&   GetLocation() const { return m_location; }
        const CameraProjection& GetProjection() const { return m_projection; }
        const Mat4x4&           GetView() const { return m_viewMatrix; }
        const Mat4x4&           GetProjectionMatrix() const { return m_projectionMatrix; }
        const Mat4x4&           GetViewProjection() const { return m_viewProjection; }
        const Extent&           GetExtent() const { return m_extent; }

        // Near-plane half-extent after aspect correction
        const Vec2& GetProjectionHalfExtent() const { return m_halfExtent; }

    private:
        void RecalculateProjection();

    private:
        CameraLocation   m_location;
        CameraProjection m_projection;

        Mat4x4 m_viewMatrix       = Mat4x4( 1.0f );
        Mat4x4 m_projectionMatrix = Mat4x4( 1.0f );
        Mat4x4 m_viewProjection   = Mat4x4( 1.0f );

        Extent m_extent;
        Vec2   m_halfExtent = { 0.1f, 0.1f };
    };
} // namespace Wire3D
