// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QPointer>
#include <QtCore/QRunnable>
#include <QtCore/QThreadPool>
#include <QtCore/Qt>

#include <type_traits>
#include <utility>

namespace Utils::Async {

namespace detail {

// Work runs on a pool thread; `done` is queued back to the thread of `context`
// and skipped if the context died meanwhile. Work is expected to report
// failures through its return value rather than by throwing.
template <typename Result, typename WorkFn, typename DoneFn>
class AsyncRunnable final : public QRunnable
{
public:
    AsyncRunnable(QPointer<QObject> context, WorkFn work, DoneFn done)
        : m_context(std::move(context))
        , m_work(std::move(work))
        , m_done(std::move(done))
    {
    }

    void run() override
    {
        if constexpr (std::is_void_v<Result>) {
            m_work();
            deliver([done = std::move(m_done)]() mutable { done(); });
        } else {
            Result result = m_work();
            deliver([done = std::move(m_done), result = std::move(result)]() mutable {
                done(std::move(result));
            });
        }
    }

private:
    template <typename Fn>
    void deliver(Fn&& fn)
    {
        if (!m_context)
            return;

        QPointer<QObject> guard = m_context;
        QMetaObject::invokeMethod(guard, [guard, fn = std::forward<Fn>(fn)]() mutable {
            if (guard)
                fn();
        }, Qt::QueuedConnection);
    }

    QPointer<QObject> m_context;
    WorkFn m_work;
    DoneFn m_done;
};

} // namespace detail

template <typename Result, typename Work, typename Done>
bool run(QObject* context, Work&& work, Done&& done, QThreadPool* pool = QThreadPool::globalInstance())
{
    using WorkFn = std::decay_t<Work>;
    using DoneFn = std::decay_t<Done>;

    if (!context || !pool)
        return false;

    auto task = new detail::AsyncRunnable<Result, WorkFn, DoneFn>(
        QPointer<QObject>(context),
        WorkFn(std::forward<Work>(work)),
        DoneFn(std::forward<Done>(done)));
    task->setAutoDelete(true);
    pool->start(task);
    return true;
}

} // namespace Utils::Async
