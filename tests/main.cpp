#include "core/Log.h"
#include <gtest/gtest.h>

int main( int argc, char** argv )
{
    ::testing::InitGoogleTest( &argc, argv );

    Hypercube::Log::Init();
    Hypercube::Log::SetLevel( Hypercube::LogLevel::WARN );

    return RUN_ALL_TESTS();
}
