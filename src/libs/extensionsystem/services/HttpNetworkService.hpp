// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/HostServices.hpp"

namespace aics {

// Performs one HTTP exchange per request with a QNetworkAccessManager owned
// by the calling thread. HTTP error statuses are returned in the reply;
// transport failures and timeouts are CommandFailed.
class AICS_EXTENSIONSYSTEM_EXPORT HttpNetworkService final : public INetworkService
{
public:
	PluginError send(const NetworkRequest& request, HttpReply& out) override;
};

} // namespace aics
