#include "syncsettings.h"
#include "sync/backoffpolicy.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QUrl>

namespace BridgeSync {

const int SyncSettings::DEFAULT_TIMEOUT_MS = 30000;
const int SyncSettings::DEFAULT_BATCH_SIZE = 100;
const int SyncSettings::DEFAULT_SMART_PULL_LIMIT = 100;
const int SyncSettings::DEFAULT_CHECK_INTERVAL_MS = 60000;
const int SyncSettings::DEFAULT_MAX_PARALLEL_RESOLUTIONS = 4;
const QString SyncSettings::DEFAULT_APP_TYPE = "default";
const QString SyncSettings::DEFAULT_CONFLICT_POLICY = "manual";

SyncSettings::SyncSettings(const QString &configPath)
    : m_configPath(configPath)
    , m_timeoutMs(DEFAULT_TIMEOUT_MS)
    , m_appType(DEFAULT_APP_TYPE)
    , m_batchSize(DEFAULT_BATCH_SIZE)
    , m_smartPullLimit(DEFAULT_SMART_PULL_LIMIT)
    , m_checkIntervalMs(DEFAULT_CHECK_INTERVAL_MS)
    , m_maxParallelResolutions(DEFAULT_MAX_PARALLEL_RESOLUTIONS)
    , m_conflictPolicy(DEFAULT_CONFLICT_POLICY)
    , m_backoffBaseDelayMs(BackoffPolicy::DEFAULT_BASE_DELAY_MS)
    , m_backoffMaxAttempts(BackoffPolicy::DEFAULT_MAX_ATTEMPTS)
{
}

QString SyncSettings::defaultConfigPath()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(base).filePath("bridgesync.conf");
}

QString SyncSettings::stateDirectory() const
{
    if (!m_stateDirectory.isEmpty()) {
        return m_stateDirectory;
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

bool SyncSettings::load()
{
    if (m_configPath.isEmpty() || !QFile::exists(m_configPath)) {
        return false;
    }

    QSettings settings(m_configPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return false;
    }

    // Server
    m_baseUrl = settings.value("server/baseUrl", QString()).toString();
    m_token = settings.value("server/token", QString()).toString();
    m_timeoutMs = settings.value("server/timeoutMs", DEFAULT_TIMEOUT_MS).toInt();

    // Device
    m_userId = settings.value("device/userId", QString()).toString();
    m_deviceId = settings.value("device/deviceId", QString()).toString();
    m_appType = settings.value("device/appType", DEFAULT_APP_TYPE).toString();

    // Sync
    m_models = settings.value("sync/models", QStringList()).toStringList();
    m_models.removeAll(QString());
    m_batchSize = settings.value("sync/batchSize", DEFAULT_BATCH_SIZE).toInt();
    m_smartPullLimit = settings.value("sync/smartPullLimit", DEFAULT_SMART_PULL_LIMIT).toInt();
    m_checkIntervalMs = settings.value("sync/checkIntervalMs", DEFAULT_CHECK_INTERVAL_MS).toInt();
    m_stateDirectory = settings.value("sync/stateDirectory", QString()).toString();
    m_maxParallelResolutions = settings.value("sync/maxParallelResolutions",
                                              DEFAULT_MAX_PARALLEL_RESOLUTIONS).toInt();
    m_conflictPolicy = settings.value("sync/conflictPolicy", DEFAULT_CONFLICT_POLICY).toString();

    // Backoff
    m_backoffBaseDelayMs = settings.value("backoff/baseDelayMs",
                                          BackoffPolicy::DEFAULT_BASE_DELAY_MS).toInt();
    m_backoffMaxAttempts = settings.value("backoff/maxAttempts",
                                          BackoffPolicy::DEFAULT_MAX_ATTEMPTS).toInt();
    m_backoffJitterRatio = settings.value("backoff/jitterRatio", 0.0).toDouble();

    return true;
}

bool SyncSettings::save() const
{
    if (m_configPath.isEmpty()) {
        return false;
    }

    if (!QDir().mkpath(QFileInfo(m_configPath).absolutePath())) {
        return false;
    }

    QSettings settings(m_configPath, QSettings::IniFormat);

    settings.setValue("server/baseUrl", m_baseUrl);
    if (!m_token.isEmpty()) {
        settings.setValue("server/token", m_token);
    }
    settings.setValue("server/timeoutMs", m_timeoutMs);

    settings.setValue("device/userId", m_userId);
    settings.setValue("device/deviceId", m_deviceId);
    settings.setValue("device/appType", m_appType);

    settings.setValue("sync/models", m_models);
    settings.setValue("sync/batchSize", m_batchSize);
    settings.setValue("sync/smartPullLimit", m_smartPullLimit);
    settings.setValue("sync/checkIntervalMs", m_checkIntervalMs);
    if (!m_stateDirectory.isEmpty()) {
        settings.setValue("sync/stateDirectory", m_stateDirectory);
    }
    settings.setValue("sync/maxParallelResolutions", m_maxParallelResolutions);
    settings.setValue("sync/conflictPolicy", m_conflictPolicy);

    settings.setValue("backoff/baseDelayMs", m_backoffBaseDelayMs);
    settings.setValue("backoff/maxAttempts", m_backoffMaxAttempts);
    settings.setValue("backoff/jitterRatio", m_backoffJitterRatio);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

QStringList SyncSettings::validate() const
{
    QStringList problems;

    const QUrl url(m_baseUrl, QUrl::StrictMode);
    if (m_baseUrl.isEmpty()) {
        problems << "server/baseUrl is not set";
    } else if (!url.isValid() || (url.scheme() != "http" && url.scheme() != "https")) {
        problems << QString("server/baseUrl is not an http(s) URL: %1").arg(m_baseUrl);
    }
    if (m_userId.isEmpty()) {
        problems << "device/userId is not set";
    }
    if (m_deviceId.isEmpty()) {
        problems << "device/deviceId is not set";
    }
    if (m_timeoutMs <= 0) {
        problems << "server/timeoutMs must be positive";
    }
    if (m_checkIntervalMs <= 0) {
        problems << "sync/checkIntervalMs must be positive";
    }
    if (m_maxParallelResolutions <= 0) {
        problems << "sync/maxParallelResolutions must be positive";
    }
    if (m_conflictPolicy != "manual" && m_conflictPolicy != "keep_local"
        && m_conflictPolicy != "keep_remote") {
        problems << QString("sync/conflictPolicy is unknown: %1").arg(m_conflictPolicy);
    }
    if (m_backoffBaseDelayMs <= 0 || m_backoffMaxAttempts <= 0) {
        problems << "backoff/baseDelayMs and backoff/maxAttempts must be positive";
    }
    if (m_backoffJitterRatio < 0.0 || m_backoffJitterRatio > 1.0) {
        problems << "backoff/jitterRatio must be between 0 and 1";
    }

    return problems;
}

} // namespace BridgeSync
