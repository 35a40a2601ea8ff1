#ifndef SYNCSETTINGS_H
#define SYNCSETTINGS_H

#include <QString>
#include <QStringList>

namespace BridgeSync {

/**
 * @brief Client configuration stored as an INI file
 *
 * Sections:
 *   [server]  baseUrl, token, timeoutMs
 *   [device]  userId, deviceId, appType
 *   [sync]    models, batchSize, smartPullLimit, checkIntervalMs,
 *             stateDirectory, maxParallelResolutions, conflictPolicy
 *   [backoff] baseDelayMs, maxAttempts, jitterRatio
 *
 * Missing keys fall back to the defaults below.
 */
class SyncSettings
{
public:
    explicit SyncSettings(const QString &configPath = QString());

    QString configFilePath() const { return m_configPath; }
    void setConfigFilePath(const QString &path) { m_configPath = path; }

    // ========== Server ==========

    QString baseUrl() const { return m_baseUrl; }
    void setBaseUrl(const QString &url) { m_baseUrl = url; }

    QString token() const { return m_token; }
    void setToken(const QString &token) { m_token = token; }

    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int ms) { m_timeoutMs = ms; }

    // ========== Device ==========

    QString userId() const { return m_userId; }
    void setUserId(const QString &id) { m_userId = id; }

    QString deviceId() const { return m_deviceId; }
    void setDeviceId(const QString &id) { m_deviceId = id; }

    QString appType() const { return m_appType; }
    void setAppType(const QString &type) { m_appType = type; }

    // ========== Sync ==========

    QStringList models() const { return m_models; }
    void setModels(const QStringList &models) { m_models = models; }

    int batchSize() const { return m_batchSize; }
    void setBatchSize(int size) { m_batchSize = size; }

    int smartPullLimit() const { return m_smartPullLimit; }
    void setSmartPullLimit(int limit) { m_smartPullLimit = limit; }

    int checkIntervalMs() const { return m_checkIntervalMs; }
    void setCheckIntervalMs(int ms) { m_checkIntervalMs = ms; }

    /**
     * @brief Directory for persisted sync state (default: app data location)
     */
    QString stateDirectory() const;
    void setStateDirectory(const QString &path) { m_stateDirectory = path; }

    int maxParallelResolutions() const { return m_maxParallelResolutions; }
    void setMaxParallelResolutions(int count) { m_maxParallelResolutions = count; }

    /**
     * @brief "manual", "keep_local" or "keep_remote"
     */
    QString conflictPolicy() const { return m_conflictPolicy; }
    void setConflictPolicy(const QString &policy) { m_conflictPolicy = policy; }

    // ========== Backoff ==========

    int backoffBaseDelayMs() const { return m_backoffBaseDelayMs; }
    void setBackoffBaseDelayMs(int ms) { m_backoffBaseDelayMs = ms; }

    int backoffMaxAttempts() const { return m_backoffMaxAttempts; }
    void setBackoffMaxAttempts(int attempts) { m_backoffMaxAttempts = attempts; }

    double backoffJitterRatio() const { return m_backoffJitterRatio; }
    void setBackoffJitterRatio(double ratio) { m_backoffJitterRatio = ratio; }

    // ========== Persistence ==========

    /**
     * @brief Load from the config file
     * @return false if the file does not exist or cannot be read
     */
    bool load();

    bool save() const;

    /**
     * @brief Problems that prevent a sync (missing URL, ids, bad values)
     */
    QStringList validate() const;

    static QString defaultConfigPath();

    // Default values
    static const int DEFAULT_TIMEOUT_MS;
    static const int DEFAULT_BATCH_SIZE;
    static const int DEFAULT_SMART_PULL_LIMIT;
    static const int DEFAULT_CHECK_INTERVAL_MS;
    static const int DEFAULT_MAX_PARALLEL_RESOLUTIONS;
    static const QString DEFAULT_APP_TYPE;
    static const QString DEFAULT_CONFLICT_POLICY;

private:
    QString m_configPath;

    QString m_baseUrl;
    QString m_token;
    int m_timeoutMs;

    QString m_userId;
    QString m_deviceId;
    QString m_appType;

    QStringList m_models;
    int m_batchSize;
    int m_smartPullLimit;
    int m_checkIntervalMs;
    QString m_stateDirectory;
    int m_maxParallelResolutions;
    QString m_conflictPolicy;

    int m_backoffBaseDelayMs;
    int m_backoffMaxAttempts;
    double m_backoffJitterRatio = 0.0;
};

} // namespace BridgeSync

#endif // SYNCSETTINGS_H
