module;

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

module Core:Tasks.Impl;

import :Tasks;
import :Logging;

namespace Core::Tasks
{
    LocalTask::~LocalTask()
    {
        if (m_VTable) std::destroy_at(m_VTable);
    }

    LocalTask::LocalTask(LocalTask&& other) noexcept
    {
        if (other.m_VTable)
        {
            other.m_VTable->MoveTo(m_Storage);
            m_VTable = reinterpret_cast<Concept*>(m_Storage);
            std::destroy_at(other.m_VTable);
            other.m_VTable = nullptr;
        }
    }

    LocalTask& LocalTask::operator=(LocalTask&& other) noexcept
    {
        if (this != &other)
        {
            if (m_VTable) std::destroy_at(m_VTable);
            m_VTable = nullptr;

            if (other.m_VTable)
            {
                other.m_VTable->MoveTo(m_Storage);
                m_VTable = reinterpret_cast<Concept*>(m_Storage);
                std::destroy_at(other.m_VTable);
                other.m_VTable = nullptr;
            }
        }
        return *this;
    }

    void LocalTask::operator()()
    {
        if (m_VTable) m_VTable->Execute();
    }

    namespace
    {
        // Single FIFO guarded by one mutex. Outstanding counts queued plus
        // executing tasks so WaitForAll() can block until both reach zero.
        struct WorkerPool
        {
            std::vector<std::thread> Workers;
            std::deque<LocalTask> Queue;

            std::mutex Mutex;
            std::condition_variable WorkAvailable;
            std::condition_variable AllDone;

            size_t Outstanding = 0;
            bool Running = false;
        };

        std::unique_ptr<WorkerPool> s_Pool;

        // Blocks until a task is available; nullopt once the pool stops and the queue is empty.
        std::optional<LocalTask> NextTask(WorkerPool& pool, bool block)
        {
            std::unique_lock lock(pool.Mutex);
            if (block)
                pool.WorkAvailable.wait(lock, [&pool] { return !pool.Queue.empty() || !pool.Running; });

            if (pool.Queue.empty())
                return std::nullopt;

            LocalTask task = std::move(pool.Queue.front());
            pool.Queue.pop_front();
            return task;
        }

        void Complete(WorkerPool& pool)
        {
            std::lock_guard lock(pool.Mutex);
            if (--pool.Outstanding == 0)
                pool.AllDone.notify_all();
        }
    }

    void Scheduler::Initialize(unsigned threadCount)
    {
        if (s_Pool) return;

        if (threadCount == 0)
        {
            threadCount = std::thread::hardware_concurrency();
            if (threadCount > 2) threadCount--; // Leave a core for the render loop
            if (threadCount == 0) threadCount = 1;
        }

        s_Pool = std::make_unique<WorkerPool>();
        s_Pool->Running = true;

        Log::Info("Scheduler: starting {} worker threads.", threadCount);
        for (unsigned i = 0; i < threadCount; ++i)
            s_Pool->Workers.emplace_back([i] { WorkerEntry(i); });
    }

    void Scheduler::Shutdown()
    {
        if (!s_Pool) return;

        {
            std::lock_guard lock(s_Pool->Mutex);
            s_Pool->Running = false;
        }
        s_Pool->WorkAvailable.notify_all();

        // Workers finish what is queued before they exit.
        for (std::thread& worker : s_Pool->Workers)
            if (worker.joinable()) worker.join();

        s_Pool.reset();
    }

    bool Scheduler::IsRunning()
    {
        if (!s_Pool) return false;
        std::lock_guard lock(s_Pool->Mutex);
        return s_Pool->Running;
    }

    unsigned Scheduler::GetWorkerCount()
    {
        return s_Pool ? static_cast<unsigned>(s_Pool->Workers.size()) : 0u;
    }

    void Scheduler::DispatchInternal(LocalTask&& task)
    {
        if (!s_Pool) return;

        {
            std::lock_guard lock(s_Pool->Mutex);
            s_Pool->Queue.push_back(std::move(task));
            ++s_Pool->Outstanding;
        }
        s_Pool->WorkAvailable.notify_one();
    }

    void Scheduler::WaitForAll()
    {
        if (!s_Pool) return;

        // The caller helps drain the queue, then waits for tasks still on workers.
        while (std::optional<LocalTask> task = NextTask(*s_Pool, false))
        {
            (*task)();
            Complete(*s_Pool);
        }

        std::unique_lock lock(s_Pool->Mutex);
        s_Pool->AllDone.wait(lock, [] { return s_Pool->Outstanding == 0; });
    }

    void Scheduler::WorkerEntry(unsigned)
    {
        WorkerPool& pool = *s_Pool;
        while (std::optional<LocalTask> task = NextTask(pool, true))
        {
            (*task)();
            Complete(pool);
        }
    }
}
