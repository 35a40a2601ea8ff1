#ifndef ENDPOINTS_H
#define ENDPOINTS_H

/**
 * @file endpoints.h
 * @brief Backend endpoint paths, relative to the configured base URL
 */

namespace BridgeSync {
namespace Endpoints {

// Offline sync
constexpr const char *Push = "/api/v1/offline-sync/push";
constexpr const char *Pull = "/api/v1/offline-sync/pull";
constexpr const char *ResolveConflicts = "/api/v1/offline-sync/resolve-conflicts";
constexpr const char *SyncState = "/api/v1/offline-sync/state";
constexpr const char *Reset = "/api/v1/offline-sync/reset";
constexpr const char *Health = "/api/v1/offline-sync/health";

// Event log
constexpr const char *CheckUpdates = "/api/v1/webhooks/check-updates";
constexpr const char *SmartPull = "/api/v2/sync/pull";
constexpr const char *SmartSyncState = "/api/v2/sync/state";
constexpr const char *SmartSyncReset = "/api/v2/sync/reset";
constexpr const char *Acknowledge = "/api/v1/odoo-sync/ack";
constexpr const char *SyncStatistics = "/api/v1/odoo-sync/sync-state/stats";

// Generic record access (search_read, fields_get)
constexpr const char *CallKw = "/api/v1/odoo/call_kw";

} // namespace Endpoints
} // namespace BridgeSync

#endif // ENDPOINTS_H
