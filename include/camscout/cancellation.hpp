/**
 * @file cancellation.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Cooperative cancellation shared between a task and whoever started it.
 * A task that outlives its deadline checks its token before touching shared
 * state, so its late results are dropped instead of applied.
 * @{
 */
#ifndef CAMSCOUT_CANCELLATION_HPP
#define CAMSCOUT_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace camscout
{

class CancellationToken
{
public:
    /// A token that can never be cancelled.
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    bool is_cancelled() const { return m_flag->load(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : m_flag(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> m_flag;
};

class CancellationSource
{
public:
    CancellationSource() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(m_flag); }
    void cancel() { m_flag->store(true); }
    bool is_cancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace camscout

#endif // CAMSCOUT_CANCELLATION_HPP

/** @} */
