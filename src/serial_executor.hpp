#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

namespace nodesync
{
    // One worker thread draining a FIFO of tasks.
    //
    // stop() refuses new work, discards tasks that have not started yet and
    // waits for the running one to return. A stopped executor can be started
    // again.
    class SerialExecutor
    {
    public:
        using Task = std::function<void()>;

        SerialExecutor() = default;
        SerialExecutor(const SerialExecutor &) = delete;
        SerialExecutor &operator=(const SerialExecutor &) = delete;

        ~SerialExecutor() { stop(); }

        void start()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_running)
            {
                return;
            }
            m_running = true;
            m_worker = std::thread([this]
                                   { run_(); });
        }

        // Returns false if the executor is not running; the task is dropped.
        bool post(Task task)
        {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                if (!m_running)
                {
                    return false;
                }
                m_queue.push_back(std::move(task));
            }
            m_cv.notify_one();
            return true;
        }

        // Returns the number of queued tasks that were discarded.
        std::size_t stop()
        {
            std::size_t discarded = 0;
            std::thread worker;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                if (!m_running)
                {
                    return 0;
                }
                m_running = false;
                discarded = m_queue.size();
                m_queue.clear();
                worker = std::move(m_worker);
            }
            m_cv.notify_all();
            if (worker.joinable())
            {
                worker.join();
            }
            return discarded;
        }

        bool running() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_running;
        }

        std::size_t pending() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_queue.size();
        }

    private:
        void run_()
        {
            while (true)
            {
                Task task;
                {
                    std::unique_lock<std::mutex> lk(m_mu);
                    m_cv.wait(lk, [this]
                              { return !m_running || !m_queue.empty(); });
                    if (!m_running)
                    {
                        return;
                    }
                    task = std::move(m_queue.front());
                    m_queue.pop_front();
                }
                task();
            }
        }

        mutable std::mutex m_mu;
        std::condition_variable m_cv;
        std::deque<Task> m_queue;
        std::thread m_worker;
        bool m_running = false;
    };
}
