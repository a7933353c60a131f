// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/HostServices.hpp"

#include "extensionsystem/services/HttpNetworkService.hpp"
#include "extensionsystem/services/InMemoryClipboardService.hpp"
#include "extensionsystem/services/NotificationCenter.hpp"
#include "extensionsystem/services/ProcessTerminalService.hpp"
#include "extensionsystem/services/WorkspaceFileService.hpp"

namespace aics {

HostServices HostServices::createDefaults(const QString& workspaceRoot)
{
    HostServices services;
    services.files = std::make_shared<WorkspaceFileService>(workspaceRoot);
    services.terminal = std::make_shared<ProcessTerminalService>(workspaceRoot);
    services.network = std::make_shared<HttpNetworkService>();
    services.clipboard = std::make_shared<InMemoryClipboardService>();
    services.notifications = std::make_shared<NotificationCenter>();
    return services;
}

} // namespace aics
