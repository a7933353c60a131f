// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/HostRequest.hpp"
#include "extensionsystem/HostServices.hpp"
#include "extensionsystem/PluginError.hpp"
#include "extensionsystem/PluginTypes.hpp"

#include <QtCore/QString>

namespace aics {

// Who is asking: the plugin id and the permissions its manifest grants.
struct HostCaller {
	QString pluginId;
	PluginPermissions permissions;
};

// The single gate between plugin code and privileged host operations.
//
// dispatch() checks, in order:
//   1. the caller holds every permission the request needs (MissingPermission),
//   2. the request is well formed (InvalidRequest),
//   3. a backend is configured for it (ServiceUnavailable),
// and only then hands the request to the backend.
class AICS_EXTENSIONSYSTEM_EXPORT HostApi final
{
public:
	explicit HostApi(HostServices services);

	static PluginPermissions requiredPermissions(const HostRequest& request);

	// Empty when the request is well formed.
	static QString validate(const HostRequest& request);

	HostResult dispatch(const HostCaller& caller, const HostRequest& request) const;

	const HostServices& services() const noexcept { return m_services; }

private:
	HostResult execute(const HostCaller& caller, const HostRequest& request) const;

	HostServices m_services;
};

} // namespace aics
