// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/async/KeyedMutex.hpp"

#include <QtCore/QMutexLocker>

namespace Utils::Async {

KeyedMutex::Locker::Locker(QString key, std::shared_ptr<QRecursiveMutex> mutex)
    : m_key(std::move(key))
    , m_mutex(std::move(mutex))
{
    m_mutex->lock();
}

KeyedMutex::Locker::Locker(Locker&& other) noexcept
    : m_key(std::move(other.m_key))
    , m_mutex(std::move(other.m_mutex))
{
}

KeyedMutex::Locker::~Locker()
{
    if (m_mutex)
        m_mutex->unlock();
}

KeyedMutex::Locker KeyedMutex::lock(const QString& key)
{
    return Locker(key, mutexFor(key));
}

std::shared_ptr<QRecursiveMutex> KeyedMutex::mutexFor(const QString& key)
{
    QMutexLocker guard(&m_guard);

    if (auto existing = m_mutexes.value(key).lock())
        return existing;

    // Drop entries nobody holds any more before adding a new one.
    for (auto it = m_mutexes.begin(); it != m_mutexes.end();) {
        if (it.value().expired())
            it = m_mutexes.erase(it);
        else
            ++it;
    }

    auto created = std::make_shared<QRecursiveMutex>();
    m_mutexes.insert(key, created);
    return created;
}

int KeyedMutex::activeKeyCount() const
{
    QMutexLocker guard(&m_guard);
    int count = 0;
    for (auto it = m_mutexes.cbegin(); it != m_mutexes.cend(); ++it) {
        if (!it.value().expired())
            ++count;
    }
    return count;
}

} // namespace Utils::Async
