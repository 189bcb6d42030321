#include "renderer/Camera.hpp"
#include <cstring>
#include <gtest/gtest.h>

using namespace Wire3D;

namespace
{
    bool SameMatrix( const Mat4x4& a, const Mat4x4& b )
    {
        return std::memcmp( &a, &b, sizeof( Mat4x4 ) ) == 0;
    }

    void ExpectMatrixNear( const Mat4x4& a, const Mat4x4& b, float tolerance )
    {
        for( int c = 0; c < 4; ++c )
            for( int r = 0; r < 4; ++r )
                EXPECT_NEAR( a[ c ][ r ], b[ c ][ r ], tolerance ) << "element [" << c << "][" << r << "]";
    }
} // namespace

class CameraTest : public ::testing::Test
{
protected:
    Camera camera;
};

TEST_F( CameraTest, DefaultState )
{
    EXPECT_EQ( camera.GetExtent().width, 800u );
    EXPECT_EQ( camera.GetExtent().height, 600u );
    EXPECT_FLOAT_EQ( camera.GetProjection().nearClip, 0.05f );
    EXPECT_FLOAT_EQ( camera.GetProjection().farClip, 100.0f );

    const CameraLocation& location = camera.GetLocation();
    EXPECT_FLOAT_EQ( location.direction.z, -1.0f );
    EXPECT_FLOAT_EQ( location.location.z, 1.0f );
}

TEST_F( CameraTest, AspectCorrectionStretchesLongerAxis )
{
    ASSERT_EQ( camera.SetProjection( 0.05f, 100.0f, Vec2( 0.1f, 0.1f ) ), Result::SUCCESS );
    camera.Resize( 800, 600 );

    EXPECT_NEAR( camera.GetProjectionHalfExtent().x, 0.1f * 800.0f / 600.0f, 1e-6f );
    EXPECT_NEAR( camera.GetProjectionHalfExtent().y, 0.1f, 1e-6f );

    // frustum x scale is near / halfExtent
    EXPECT_NEAR( camera.GetProjectionMatrix()[ 0 ][ 0 ], 0.05f / ( 0.1f * 800.0f / 600.0f ), 1e-5f );
    EXPECT_NEAR( camera.GetProjectionMatrix()[ 1 ][ 1 ], 0.05f / 0.1f, 1e-5f );

    ASSERT_TRUE( camera.Resize( 600, 800 ) );
    EXPECT_NEAR( camera.GetProjectionHalfExtent().x, 0.1f, 1e-6f );
    EXPECT_NEAR( camera.GetProjectionHalfExtent().y, 0.1f * 800.0f / 600.0f, 1e-6f );

    ASSERT_TRUE( camera.Resize( 512, 512 ) );
    EXPECT_NEAR( camera.GetProjectionHalfExtent().x, 0.1f, 1e-6f );
    EXPECT_NEAR( camera.GetProjectionHalfExtent().y, 0.1f, 1e-6f );
}

TEST_F( CameraTest, ResizeIsIdempotent )
{
    EXPECT_TRUE( camera.Resize( 1024, 768 ) );

    Mat4x4 projection     = camera.GetProjectionMatrix();
    Mat4x4 viewProjection = camera.GetViewProjection();

    EXPECT_FALSE( camera.Resize( 1024, 768 ) );
    EXPECT_TRUE( SameMatrix( projection, camera.GetProjectionMatrix() ) );
    EXPECT_TRUE( SameMatrix( viewProjection, camera.GetViewProjection() ) );
}

TEST_F( CameraTest, ResizeIgnoresEmptyExtent )
{
    EXPECT_FALSE( camera.Resize( 0, 600 ) );
    EXPECT_FALSE( camera.Resize( 800, 0 ) );
    EXPECT_EQ( camera.GetExtent().width, 800u );
    EXPECT_EQ( camera.GetExtent().height, 600u );
}

TEST_F( CameraTest, SetPoseUpdatesBasisAndMatrices )
{
    Vec3 eye( 3.0f, 2.0f, 4.0f );
    ASSERT_EQ( camera.SetPose( eye, Vec3( 0.0f ), Vec3( 0, 1, 0 ) ), Result::SUCCESS );

    const CameraLocation& location = camera.GetLocation();
    EXPECT_FLOAT_EQ( location.location.x, 3.0f );
    EXPECT_FLOAT_EQ( location.at.x, 0.0f );

    Vec3 expected = glm::normalize( -eye );
    EXPECT_NEAR( location.direction.x, expected.x, 1e-5f );
    EXPECT_NEAR( location.direction.y, expected.y, 1e-5f );
    EXPECT_NEAR( location.direction.z, expected.z, 1e-5f );

    EXPECT_NEAR( glm::dot( location.right, location.up ), 0.0f, 1e-4f );
    EXPECT_NEAR( glm::dot( location.right, location.direction ), 0.0f, 1e-4f );
    EXPECT_NEAR( glm::dot( location.up, location.direction ), 0.0f, 1e-4f );
    EXPECT_NEAR( glm::length( location.right ), 1.0f, 1e-4f );
    EXPECT_NEAR( glm::length( location.up ), 1.0f, 1e-4f );

    ExpectMatrixNear( camera.GetViewProjection(), camera.GetProjectionMatrix() * camera.GetView(), 1e-5f );

    // The eye sits at the view-space origin
    Vec4 eyeView = Math::TransformPoint( camera.GetView(), eye );
    EXPECT_NEAR( eyeView.x, 0.0f, 1e-5f );
    EXPECT_NEAR( eyeView.y, 0.0f, 1e-5f );
    EXPECT_NEAR( eyeView.z, 0.0f, 1e-5f );
}

TEST_F( CameraTest, DegeneratePoseIsRejected )
{
    ASSERT_EQ( camera.SetPose( Vec3( 0, 0, 5 ), Vec3( 0.0f ), Vec3( 0, 1, 0 ) ), Result::SUCCESS );
    Mat4x4 view = camera.GetView();

    EXPECT_EQ( camera.SetPose( Vec3( 0, 5, 0 ), Vec3( 0.0f ), Vec3( 0, 1, 0 ) ), Result::INVALID_ARGS );
    EXPECT_EQ( camera.SetPose( Vec3( 2, 2, 2 ), Vec3( 2, 2, 2 ), Vec3( 0, 1, 0 ) ), Result::INVALID_ARGS );

    EXPECT_TRUE( SameMatrix( view, camera.GetView() ) );
    EXPECT_FLOAT_EQ( camera.GetLocation().location.z, 5.0f );
}

TEST_F( CameraTest, InvalidProjectionIsRejected )
{
    EXPECT_EQ( camera.SetProjection( 0.0f, 10.0f, Vec2( 0.1f ) ), Result::INVALID_ARGS );
    EXPECT_EQ( camera.SetProjection( -1.0f, 10.0f, Vec2( 0.1f ) ), Result::INVALID_ARGS );
    EXPECT_EQ( camera.SetProjection( 5.0f, 5.0f, Vec2( 0.1f ) ), Result::INVALID_ARGS );
    EXPECT_EQ( camera.SetProjection( 1.0f, 10.0f, Vec2( 0.0f, 0.1f ) ), Result::INVALID_ARGS );

    EXPECT_FLOAT_EQ( camera.GetProjection().nearClip, 0.05f );
    EXPECT_FLOAT_EQ( camera.GetProjection().farClip, 100.0f );
}

TEST_F( CameraTest, SetProjectionRecomputesViewProjection )
{
    ASSERT_EQ( camera.SetPose( Vec3( 1, 2, 6 ), Vec3( 0.0f ), Vec3( 0, 1, 0 ) ), Result::SUCCESS );
    ASSERT_EQ( camera.SetProjection( 1.0f, 20.0f, Vec2( 0.5f, 0.5f ) ), Result::SUCCESS );

    ExpectMatrixNear( camera.GetViewProjection(), camera.GetProjectionMatrix() * camera.GetView(), 1e-5f );

    // The target point sits on the view axis and inside the depth range
    Vec4 clip = Math::TransformPoint( camera.GetViewProjection(), Vec3( 0.0f ) );
    EXPECT_NEAR( clip.x / clip.w, 0.0f, 1e-5f );
    EXPECT_NEAR( clip.y / clip.w, 0.0f, 1e-5f );
    EXPECT_GT( clip.z / clip.w, 0.0f );
    EXPECT_LT( clip.z / clip.w, 1.0f );
}
