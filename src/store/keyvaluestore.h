#ifndef KEYVALUESTORE_H
#define KEYVALUESTORE_H

#include <QString>
#include <QStringList>
#include <QJsonObject>

namespace BridgeSync {

/**
 * @brief Abstract durable storage for JSON documents
 *
 * Keys are slash-separated paths ("user/device/state"). Implementations
 * must make write() atomic: a reader sees either the previous or the new
 * document, never a partial one.
 */
class KeyValueStore
{
public:
    virtual ~KeyValueStore() = default;

    virtual bool contains(const QString &key) const = 0;

    /**
     * @brief Read a document
     * @param error Set when the document exists but cannot be read
     * @return The document, or an empty object if missing or unreadable
     */
    virtual QJsonObject read(const QString &key, QString *error = nullptr) const = 0;

    virtual bool write(const QString &key, const QJsonObject &value, QString *error = nullptr) = 0;

    virtual bool remove(const QString &key) = 0;
};

} // namespace BridgeSync

#endif // KEYVALUESTORE_H
