#include "jsonfilestore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QDebug>

namespace BridgeSync {

JsonFileStore::JsonFileStore(const QString &baseDir)
    : m_baseDir(baseDir)
{
}

QString JsonFileStore::filePath(const QString &key) const
{
    return QDir(m_baseDir).filePath(key + ".json");
}

bool JsonFileStore::isValidKey(const QString &key)
{
    if (key.isEmpty() || key.startsWith('/')) {
        return false;
    }
    const QStringList parts = key.split('/');
    for (const QString &part : parts) {
        if (part.isEmpty() || part == "." || part == "..") {
            return false;
        }
    }
    return true;
}

bool JsonFileStore::contains(const QString &key) const
{
    return isValidKey(key) && QFile::exists(filePath(key));
}

QJsonObject JsonFileStore::read(const QString &key, QString *error) const
{
    if (!isValidKey(key)) {
        if (error) {
            *error = QString("Invalid key: %1").arg(key);
        }
        return QJsonObject();
    }

    QFile file(filePath(key));
    if (!file.exists()) {
        return QJsonObject();
    }

    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QString("Failed to open %1: %2").arg(file.fileName(), file.errorString());
        }
        return QJsonObject();
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QString("Failed to parse %1: %2")
                .arg(file.fileName(), parseError.errorString());
        }
        return QJsonObject();
    }

    return doc.object();
}

bool JsonFileStore::write(const QString &key, const QJsonObject &value, QString *error)
{
    if (!isValidKey(key)) {
        if (error) {
            *error = QString("Invalid key: %1").arg(key);
        }
        return false;
    }

    const QString path = filePath(key);
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        if (error) {
            *error = QString("Failed to create directory for %1").arg(path);
        }
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = QString("Failed to open %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    file.write(QJsonDocument(value).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error) {
            *error = QString("Failed to write %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    return true;
}

bool JsonFileStore::remove(const QString &key)
{
    if (!isValidKey(key)) {
        return false;
    }
    QFile file(filePath(key));
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        qWarning() << "[JsonFileStore] Failed to remove" << file.fileName() << file.errorString();
        return false;
    }
    return true;
}

} // namespace BridgeSync
