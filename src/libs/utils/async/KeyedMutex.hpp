// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QRecursiveMutex>
#include <QtCore/QString>

#include <memory>

namespace Utils::Async {

// One recursive mutex per key, created on demand. Work on the same key is
// serialized; work on different keys runs freely. Recursive so a holder may
// call into another component that locks the same key.
class AICS_UTILS_EXPORT KeyedMutex final
{
public:
	class Locker final
	{
	public:
		Locker(Locker&& other) noexcept;
		Locker(const Locker&) = delete;
		Locker& operator=(const Locker&) = delete;
		Locker& operator=(Locker&&) = delete;
		~Locker();

		const QString& key() const noexcept { return m_key; }

	private:
		friend class KeyedMutex;
		Locker(QString key, std::shared_ptr<QRecursiveMutex> mutex);

		QString m_key;
		std::shared_ptr<QRecursiveMutex> m_mutex;
	};

	KeyedMutex() = default;
	KeyedMutex(const KeyedMutex&) = delete;
	KeyedMutex& operator=(const KeyedMutex&) = delete;

	[[nodiscard]] Locker lock(const QString& key);

	// Number of keys that currently have a live mutex.
	int activeKeyCount() const;

private:
	std::shared_ptr<QRecursiveMutex> mutexFor(const QString& key);

	mutable QMutex m_guard;
	QHash<QString, std::weak_ptr<QRecursiveMutex>> m_mutexes;
};

} // namespace Utils::Async
