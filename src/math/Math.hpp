#pragma once
#include "core/Base.hpp"
#include <glm/glm.hpp>

namespace Wire3D
{
    using Vec2   = glm::vec2;
    using Vec3   = glm::vec3;
    using Vec4   = glm::vec4;
    using Mat4x4 = glm::mat4;

    /**
     * @brief Orthonormal camera basis as stored in a view matrix.
     * direction points from the eye towards the target.
     */
    struct CameraBasis
    {
        Vec3 right;
        Vec3 up;
        Vec3 direction;
    };

    namespace Math
    {
        // Squared length below which a vector is treated as zero.
        constexpr float kDegenerateLengthSq = 1e-12f;

        bool CanNormalize( const Vec3& v );

        // Precondition: CanNormalize( v ). Asserted in debug builds.
        Vec3 Normalize( const Vec3& v );

        /**
         * @brief Right-handed look-at matrix.
         * The rotation block holds right in row 0, up in row 1 and -direction in row 2,
         * so the view space looks down -Z.
         */
        Mat4x4 View( const Vec3& eye, const Vec3& at, const Vec3& approxUp );

        /**
         * @brief Asymmetric perspective frustum.
         * Depth lands in (0, 1) after the homogeneous divide for points between near and far.
         */
        Mat4x4 ProjectionFrustum( float left, float right, float bottom, float top, float nearPlane, float farPlane );

        // Homogeneous transform of a point (w = 1). The divide is left to the caller.
        Vec4 TransformPoint( const Mat4x4& m, const Vec3& p );

        CameraBasis ExtractBasis( const Mat4x4& view );

        // True when eye == at or approxUp is (anti)parallel to the viewing direction.
        bool IsDegenerateBasis( const Vec3& eye, const Vec3& at, const Vec3& approxUp );
    } // namespace Math
} // namespace Wire3D
