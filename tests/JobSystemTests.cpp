#include "core/jobs/JobSystem.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <vector>

using namespace Batchline;

class JobSystemTest : public ::testing::Test
{
protected:
    std::unique_ptr<JobSystem> jobs;

    void SetUp() override { jobs = std::make_unique<JobSystem>(); }

    void TearDown() override { jobs->Shutdown(); }
};

TEST_F( JobSystemTest, KickSingleJob )
{
    JobSystem::Config config;
    ASSERT_EQ( jobs->Initialize( config ), Result::SUCCESS );

    std::atomic<bool> done = false;

    jobs->Kick( [ &done ]() {
        std::this_thread::sleep_for( std::chrono::milliseconds( 10 ) );
        done = true;
    } );

    jobs->Wait();
    EXPECT_TRUE( done );
}

TEST_F( JobSystemTest, DispatchParallel )
{
    JobSystem::Config config;
    config.workerCount = 4;
    ASSERT_EQ( jobs->Initialize( config ), Result::SUCCESS );
    EXPECT_EQ( jobs->GetWorkerCount(), 4u );

    const int        count   = 1000;
    std::atomic<int> counter = 0;
    std::vector<int> results( count, 0 );

    jobs->Dispatch( count, [ & ]( uint32_t index ) {
        counter.fetch_add( 1 );
        results[ index ] = static_cast<int>( index ) * 2;
    } );

    jobs->Wait();

    EXPECT_EQ( counter, count );
    for( int i = 0; i < count; ++i )
    {
        EXPECT_EQ( results[ i ], i * 2 );
    }
}

TEST_F( JobSystemTest, WaitWithoutJobsReturns )
{
    JobSystem::Config config;
    jobs->Initialize( config );

    jobs->Wait();
    jobs->Dispatch( 0, []( uint32_t ) {} );
    jobs->Wait();
    SUCCEED();
}

TEST_F( JobSystemTest, ReinitializeIsIgnored )
{
    JobSystem::Config config;
    config.workerCount = 2;
    ASSERT_EQ( jobs->Initialize( config ), Result::SUCCESS );

    config.workerCount = 6;
    EXPECT_EQ( jobs->Initialize( config ), Result::SUCCESS );
    EXPECT_EQ( jobs->GetWorkerCount(), 2u );
}

TEST_F( JobSystemTest, ShutdownStopsRunning )
{
    JobSystem::Config config;
    jobs->Initialize( config );
    EXPECT_TRUE( jobs->IsRunning() );

    jobs->Shutdown();
    EXPECT_FALSE( jobs->IsRunning() );
    EXPECT_EQ( jobs->GetWorkerCount(), 0u );

    // Second shutdown is a no-op
    jobs->Shutdown();
}

TEST_F( JobSystemTest, ForceSingleThreaded )
{
    JobSystem::Config config;
    config.forceSingleThreaded = true;

    jobs->Initialize( config );

    EXPECT_TRUE( jobs->IsSingleThreaded() );
    EXPECT_EQ( jobs->GetWorkerCount(), 0u );

    std::thread::id mainThreadId = std::this_thread::get_id();
    std::thread::id jobThreadId;
    bool            executed = false;

    // Kick runs inline
    jobs->Kick( [ & ]() {
        jobThreadId = std::this_thread::get_id();
        executed    = true;
    } );

    EXPECT_TRUE( executed ) << "Job should have executed immediately";
    EXPECT_EQ( jobThreadId, mainThreadId ) << "Job should execute on the calling thread";

    uint32_t sum = 0;
    jobs->Dispatch( 10, [ & ]( uint32_t i ) { sum += i; } );
    EXPECT_EQ( sum, 45u );
}
