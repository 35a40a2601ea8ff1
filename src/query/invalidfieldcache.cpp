#include "invalidfieldcache.h"

#include <QDebug>

namespace BridgeSync {

namespace {
QStringList sorted(const QSet<QString> &set)
{
    QStringList list = set.values();
    list.sort();
    return list;
}
}

QStringList SharedInvalidFieldCache::invalidFields(const QString &entityType) const
{
    QReadLocker locker(&m_lock);
    return sorted(m_fields.value(entityType));
}

void SharedInvalidFieldCache::addInvalidField(const QString &entityType, const QString &field)
{
    if (field.isEmpty()) {
        return;
    }
    QWriteLocker locker(&m_lock);
    m_fields[entityType].insert(field);
}

void SharedInvalidFieldCache::clear(const QString &entityType)
{
    QWriteLocker locker(&m_lock);
    m_fields.remove(entityType);
    qDebug() << "[InvalidFieldCache] Cleared" << entityType;
}

void SharedInvalidFieldCache::clearAll()
{
    QWriteLocker locker(&m_lock);
    m_fields.clear();
    qDebug() << "[InvalidFieldCache] Cleared all entity types";
}

QMap<QString, QStringList> SharedInvalidFieldCache::snapshot() const
{
    QReadLocker locker(&m_lock);
    QMap<QString, QStringList> copy;
    for (auto it = m_fields.constBegin(); it != m_fields.constEnd(); ++it) {
        copy.insert(it.key(), sorted(it.value()));
    }
    return copy;
}

} // namespace BridgeSync
