#include "core/jobs/JobSystem.hpp"

namespace Batchline
{

    JobSystem::JobSystem()
    {
    }

    JobSystem::~JobSystem()
    {
        Shutdown();
    }

    Result JobSystem::Initialize( const Config& config )
    {
        if( m_running )
        {
            BL_CORE_WARN( "JobSystem is already initialized." );
            return Result::SUCCESS;
        }

        m_running        = true;
        m_singleThreaded = config.forceSingleThreaded;

        if( m_singleThreaded )
        {
            BL_CORE_WARN( "JobSystem initialized in FORCE SINGLE THREADED mode." );
            return Result::SUCCESS;
        }

        uint32_t workerCount;
        if( config.workerCount > 0 )
        {
            workerCount = static_cast<uint32_t>( config.workerCount );
        }
        else
        {
            // Leave one core to the thread that records frames
            unsigned int hardware = std::thread::hardware_concurrency();
            workerCount           = ( hardware > 1 ) ? hardware - 1 : 1;
        }

        BL_CORE_INFO( "Initializing JobSystem with {} worker threads.", workerCount );

        m_workers.reserve( workerCount );
        for( uint32_t i = 0; i < workerCount; ++i )
        {
            m_workers.emplace_back( &JobSystem::WorkerLoop, this );
        }

        return Result::SUCCESS;
    }

    void JobSystem::Shutdown()
    {
        if( !m_running )
            return;

        {
            std::lock_guard<std::mutex> lock( m_queueMutex );
            m_running = false;
        }
        m_queueCv.notify_all();

        for( std::thread& worker: m_workers )
        {
            if( worker.joinable() )
                worker.join();
        }

        m_workers.clear();
        m_jobQueue.clear();
        m_busyJobs = 0;
    }

    void JobSystem::Kick( Job job )
    {
        if( m_singleThreaded || m_workers.empty() )
        {
            job();
            return;
        }

        m_busyJobs.fetch_add( 1 );
        {
            std::lock_guard<std::mutex> lock( m_queueMutex );
            m_jobQueue.push_back( std::move( job ) );
        }
        m_queueCv.notify_one();
    }

    void JobSystem::Dispatch( uint32_t jobCount, const std::function<void( uint32_t )>& job )
    {
        if( jobCount == 0 )
            return;

        if( m_singleThreaded || m_workers.empty() )
        {
            for( uint32_t i = 0; i < jobCount; ++i )
            {
                job( i );
            }
            return;
        }

        m_busyJobs.fetch_add( static_cast<int>( jobCount ) );
        {
            std::lock_guard<std::mutex> lock( m_queueMutex );
            for( uint32_t i = 0; i < jobCount; ++i )
            {
                m_jobQueue.push_back( [ job, i ]() { job( i ); } );
            }
        }
        m_queueCv.notify_all();
    }

    void JobSystem::Wait()
    {
        if( m_singleThreaded || m_workers.empty() )
            return;

        while( TryRunOne() )
        {
        }

        std::unique_lock<std::mutex> lock( m_waitMutex );
        m_waitCv.wait( lock, [ this ]() { return m_busyJobs.load() == 0; } );
    }

    bool JobSystem::TryRunOne()
    {
        Job job;
        {
            std::lock_guard<std::mutex> lock( m_queueMutex );
            if( m_jobQueue.empty() )
                return false;
            job = std::move( m_jobQueue.front() );
            m_jobQueue.pop_front();
        }

        job();
        FinishJob();
        return true;
    }

    void JobSystem::FinishJob()
    {
        int remaining = m_busyJobs.fetch_sub( 1 ) - 1;
        if( remaining == 0 )
        {
            std::lock_guard<std::mutex> lock( m_waitMutex );
            m_waitCv.notify_all();
        }
    }

    void JobSystem::WorkerLoop()
    {
        while( true )
        {
            Job job;
            {
                std::unique_lock<std::mutex> lock( m_queueMutex );
                m_queueCv.wait( lock, [ this ]() { return !m_jobQueue.empty() || !m_running; } );

                if( !m_running && m_jobQueue.empty() )
                    break;

                job = std::move( m_jobQueue.front() );
                m_jobQueue.pop_front();
            }

            job();
            FinishJob();
        }
    }

} // namespace Batchline
