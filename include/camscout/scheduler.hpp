/**
 * @file scheduler.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Timer abstraction shared by the cache sweep, the reconnection backoff and
 * the health check. Swapping the implementation lets time be driven by tests.
 * @{
 */
#ifndef CAMSCOUT_SCHEDULER_HPP
#define CAMSCOUT_SCHEDULER_HPP

#include "CommonTypes.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace camscout
{

class Scheduler_T
{
public:
    typedef uint64_t timer_id_t;
    typedef std::function<void()> task_t;

    static constexpr timer_id_t INVALID_TIMER { 0 };

public:
    virtual ~Scheduler_T() = default;

    /// Current wall clock time as seen by this scheduler.
    virtual Clock::time_point now() const = 0;

    /// @brief Run task once after delay has elapsed.
    /// @return An id that can be passed to cancel(). Never INVALID_TIMER.
    virtual timer_id_t schedule_after(std::chrono::milliseconds delay, task_t task) = 0;

    /// @brief Prevent a scheduled task from running.
    /// @return false if the task already ran, was already cancelled or is unknown.
    virtual bool cancel(timer_id_t id) = 0;

}; //end class Scheduler_T


/// @brief Scheduler backed by boost::asio steady timers running on a private worker thread.
class AsioScheduler : public Scheduler_T
{
public:
    explicit AsioScheduler(log_callback_t log_callback = nullptr);
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    Clock::time_point now() const override;
    timer_id_t schedule_after(std::chrono::milliseconds delay, task_t task) override;
    bool cancel(timer_id_t id) override;

    /// The io_service timers run on, available for other asynchronous work.
    boost::asio::io_service& io_service();

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};

} //end namespace camscout

#endif // CAMSCOUT_SCHEDULER_HPP

/** @} */
