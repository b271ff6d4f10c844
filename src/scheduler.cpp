/**
 * @file scheduler.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * boost::asio based implementation of Scheduler_T
 */
#include "scheduler.hpp"
#include "log_macros.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace camscout
{

struct AsioScheduler::Impl
{
    explicit Impl(log_callback_t log_callback) :
        m_log_callback(log_callback),
        m_work(m_ioService)
    {
        m_thread = std::thread([this]() { this->run(); });
    }

    ~Impl()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto& entry : m_timers)
            {
                boost::system::error_code ignored;
                entry.second->cancel(ignored);
            }
            m_timers.clear();
        }
        m_work.reset();
        m_ioService.stop();
        if (m_thread.joinable())
        {
            m_thread.join();
        }
    }

    void run()
    {
        for (;;)
        {
            try
            {
                m_ioService.run();
                return;
            }
            catch (std::exception& e)
            {
                ERR("Scheduled task failed: " << e.what());
            }
        }
    }

    log_callback_t m_log_callback;
    boost::asio::io_service m_ioService;
    std::optional<boost::asio::io_service::work> m_work;
    std::thread m_thread;
    std::mutex m_mutex;
    timer_id_t m_nextId { 1 };
    std::map<timer_id_t, std::shared_ptr<boost::asio::steady_timer>> m_timers;
};


AsioScheduler::AsioScheduler(log_callback_t log_callback) :
    pimpl { new Impl(log_callback) }
{
}

AsioScheduler::~AsioScheduler() = default;

Clock::time_point AsioScheduler::now() const
{
    return Clock::now();
}

Scheduler_T::timer_id_t AsioScheduler::schedule_after(std::chrono::milliseconds delay, task_t task)
{
    auto timer = std::make_shared<boost::asio::steady_timer>(pimpl->m_ioService);
    timer_id_t id;
    {
        std::lock_guard<std::mutex> lock(pimpl->m_mutex);
        id = pimpl->m_nextId++;
        pimpl->m_timers[id] = timer;
    }
    timer->expires_after(delay);
    auto* impl = pimpl.get();
    timer->async_wait([impl, id, timer, task](const boost::system::error_code& error)
        {
            {
                std::lock_guard<std::mutex> lock(impl->m_mutex);
                auto erased = impl->m_timers.erase(id);
                if (error || erased == 0)
                {
                    return;
                }
            }
            task();
        });
    return id;
}

bool AsioScheduler::cancel(timer_id_t id)
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    auto it = pimpl->m_timers.find(id);
    if (it == pimpl->m_timers.end())
    {
        return false;
    }
    boost::system::error_code ignored;
    it->second->cancel(ignored);
    pimpl->m_timers.erase(it);
    return true;
}

boost::asio::io_service& AsioScheduler::io_service()
{
    return pimpl->m_ioService;
}

} //end namespace camscout
