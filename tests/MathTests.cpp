#include "math/Math.hpp"
#include <gtest/gtest.h>

using namespace Wire3D;

namespace
{
    Vec3 Row( const Mat4x4& m, int row )
    {
        return Vec3( m[ 0 ][ row ], m[ 1 ][ row ], m[ 2 ][ row ] );
    }
} // namespace

TEST( Math, ViewRotationRowsAreOrthonormal )
{
    const Vec3 eyes[] = { { 0, 0, 5 }, { 3, 2, 4 }, { -7, 1, 0.5f }, { 0.1f, -4, 2 } };
    for( const Vec3& eye: eyes )
    {
        Mat4x4 view = Math::View( eye, Vec3( 0.0f ), Vec3( 0, 1, 0 ) );
        for( int i = 0; i < 3; ++i )
        {
            for( int j = 0; j < 3; ++j )
            {
                float expected = i == j ? 1.0f : 0.0f;
                EXPECT_NEAR( glm::dot( Row( view, i ), Row( view, j ) ), expected, 1e-4f ) << "rows " << i << "," << j;
            }
        }
    }
}

TEST( Math, ExtractBasisFollowsViewDirection )
{
    Vec3        eye( 3.0f, 2.0f, 4.0f );
    Vec3        at( 0.5f, 0.0f, -1.0f );
    CameraBasis basis = Math::ExtractBasis( Math::View( eye, at, Vec3( 0, 1, 0 ) ) );

    Vec3 expected = glm::normalize( at - eye );
    EXPECT_NEAR( basis.direction.x, expected.x, 1e-5f );
    EXPECT_NEAR( basis.direction.y, expected.y, 1e-5f );
    EXPECT_NEAR( basis.direction.z, expected.z, 1e-5f );

    // Right-handed basis
    Vec3 right = glm::cross( basis.direction, basis.up );
    EXPECT_NEAR( right.x, basis.right.x, 1e-5f );
    EXPECT_NEAR( right.y, basis.right.y, 1e-5f );
    EXPECT_NEAR( right.z, basis.right.z, 1e-5f );
    EXPECT_GT( basis.up.y, 0.0f );
}

TEST( Math, FrustumMapsNearAndFarToUnitDepth )
{
    const float nearPlane = 0.5f;
    const float farPlane  = 50.0f;
    Mat4x4      proj      = Math::ProjectionFrustum( -0.2f, 0.2f, -0.1f, 0.1f, nearPlane, farPlane );

    Vec4 atNear = Math::TransformPoint( proj, Vec3( 0, 0, -nearPlane ) );
    Vec4 atFar  = Math::TransformPoint( proj, Vec3( 0, 0, -farPlane ) );
    Vec4 inside = Math::TransformPoint( proj, Vec3( 0, 0, -5.0f ) );

    EXPECT_NEAR( atNear.z / atNear.w, 0.0f, 1e-5f );
    EXPECT_NEAR( atFar.z / atFar.w, 1.0f, 1e-5f );
    EXPECT_GT( inside.z / inside.w, 0.0f );
    EXPECT_LT( inside.z / inside.w, 1.0f );

    // Right edge of the near plane lands on x = 1
    Vec4 edge = Math::TransformPoint( proj, Vec3( 0.2f, 0, -nearPlane ) );
    EXPECT_NEAR( edge.x / edge.w, 1.0f, 1e-5f );
}

TEST( Math, TransformPointKeepsW )
{
    Vec4 p = Math::TransformPoint( Mat4x4( 1.0f ), Vec3( 1, 2, 3 ) );
    EXPECT_FLOAT_EQ( p.x, 1.0f );
    EXPECT_FLOAT_EQ( p.y, 2.0f );
    EXPECT_FLOAT_EQ( p.z, 3.0f );
    EXPECT_FLOAT_EQ( p.w, 1.0f );
}

TEST( Math, DegenerateBasisDetection )
{
    EXPECT_TRUE( Math::IsDegenerateBasis( Vec3( 1, 1, 1 ), Vec3( 1, 1, 1 ), Vec3( 0, 1, 0 ) ) );
    EXPECT_TRUE( Math::IsDegenerateBasis( Vec3( 0, 5, 0 ), Vec3( 0, 0, 0 ), Vec3( 0, 1, 0 ) ) );
    EXPECT_TRUE( Math::IsDegenerateBasis( Vec3( 0, 0, 5 ), Vec3( 0, 0, 0 ), Vec3( 0, 0, 0 ) ) );
    EXPECT_FALSE( Math::IsDegenerateBasis( Vec3( 0, 0, 5 ), Vec3( 0, 0, 0 ), Vec3( 0, 1, 0 ) ) );
}

TEST( Math, Normalize )
{
    EXPECT_FALSE( Math::CanNormalize( Vec3( 0.0f ) ) );
    ASSERT_TRUE( Math::CanNormalize( Vec3( 3, 0, 4 ) ) );

    Vec3 n = Math::Normalize( Vec3( 3, 0, 4 ) );
    EXPECT_NEAR( glm::length( n ), 1.0f, 1e-6f );
    EXPECT_NEAR( n.x, 0.6f, 1e-6f );
}
