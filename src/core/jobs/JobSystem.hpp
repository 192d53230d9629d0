#pragma once
#include "core/Base.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace Batchline
{
    /**
     * @brief Small worker pool used for host-side data parallel passes (reference culling, bulk encoding).
     */
    class JobSystem
    {
    public:
        using Job = std::function<void()>;

        struct Config
        {
            int  workerCount         = -1; // -1 = auto
            bool forceSingleThreaded = false;
        };

        JobSystem();
        ~JobSystem();

        Result Initialize( const Config& config );
        void   Shutdown();

        /**
         * @brief Queues a job for any available worker.
         */
        void Kick( Job job );

        /**
         * @brief Runs job( i ) for every i in [0, jobCount) across the workers.
         */
        void Dispatch( uint32_t jobCount, const std::function<void( uint32_t )>& job );

        /**
         * @brief Blocks until every queued job has finished.
         * The calling thread drains the queue while it waits.
         */
        void Wait();

        uint32_t GetWorkerCount() const { return static_cast<uint32_t>( m_workers.size() ); }
        bool     IsSingleThreaded() const { return m_singleThreaded; }
        bool     IsRunning() const { return m_running; }

    private:
        void WorkerLoop();
        bool TryRunOne();
        void FinishJob();

    private:
        std::vector<std::thread> m_workers;
        bool                     m_running        = false;
        bool                     m_singleThreaded = false;

        std::deque<Job>         m_jobQueue;
        std::mutex              m_queueMutex;
        std::condition_variable m_queueCv;

        // Jobs queued or running. Wait() returns once this reaches 0.
        std::atomic<int>        m_busyJobs{ 0 };
        std::condition_variable m_waitCv;
        std::mutex              m_waitMutex;
    };
} // namespace Batchline
