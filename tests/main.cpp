#include "core/Log.hpp"
#include <gtest/gtest.h>

int main( int argc, char** argv )
{
    ::testing::InitGoogleTest( &argc, argv );

    Wire3D::Log::Init();

    return RUN_ALL_TESTS();
}
