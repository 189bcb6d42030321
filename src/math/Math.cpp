#include "math/Math.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace Wire3D
{
    namespace Math
    {
        bool CanNormalize( const Vec3& v )
        {
            return glm::dot( v, v ) > kDegenerateLengthSq;
        }

        Vec3 Normalize( const Vec3& v )
        {
            W3D_CORE_ASSERT( CanNormalize( v ), "Normalize called on a zero-length vector" );
            return v / glm::length( v );
        }

        Mat4x4 View( const Vec3& eye, const Vec3& at, const Vec3& approxUp )
        {
            return glm::lookAtRH( eye, at, approxUp );
        }

        Mat4x4 ProjectionFrustum( float left, float right, float bottom, float top, float nearPlane, float farPlane )
        {
            return glm::frustumRH_ZO( left, right, bottom, top, nearPlane, farPlane );
        }

        Vec4 TransformPoint( const Mat4x4& m, const Vec3& p )
        {
            return m * Vec4( p, 1.0f );
        }

        CameraBasis ExtractBasis( const Mat4x4& view )
        {
            // glm is column-major: view[ col ][ row ]
            CameraBasis basis;
            basis.right     = Vec3( view[ 0 ][ 0 ], view[ 1 ][ 0 ], view[ 2 ][ 0 ] );
            basis.up        = Vec3( view[ 0 ][ 1 ], view[ 1 ][ 1 ], view[ 2 ][ 1 ] );
            basis.direction = -Vec3( view[ 0 ][ 2 ], view[ 1 ][ 2 ], view[ 2 ][ 2 ] );
            return basis;
        }

        bool IsDegenerateBasis( const Vec3& eye, const Vec3& at, const Vec3& approxUp )
        {
            Vec3 direction = at - eye;
            if( !CanNormalize( direction ) || !CanNormalize( approxUp ) )
                return true;

            return !CanNormalize( glm::cross( Normalize( direction ), Normalize( approxUp ) ) );
        }
    } // namespace Math
} // namespace Wire3D
