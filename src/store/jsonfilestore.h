#ifndef JSONFILESTORE_H
#define JSONFILESTORE_H

#include "keyvaluestore.h"

namespace BridgeSync {

/**
 * @brief KeyValueStore keeping one JSON file per key
 *
 * Key "alice/phone-1/state" maps to <baseDir>/alice/phone-1/state.json.
 * Files are written through QSaveFile.
 */
class JsonFileStore : public KeyValueStore
{
public:
    explicit JsonFileStore(const QString &baseDir);

    QString baseDir() const { return m_baseDir; }
    QString filePath(const QString &key) const;

    bool contains(const QString &key) const override;
    QJsonObject read(const QString &key, QString *error = nullptr) const override;
    bool write(const QString &key, const QJsonObject &value, QString *error = nullptr) override;
    bool remove(const QString &key) override;

private:
    static bool isValidKey(const QString &key);

    QString m_baseDir;
};

} // namespace BridgeSync

#endif // JSONFILESTORE_H
