#ifndef INVALIDFIELDMATCHER_H
#define INVALIDFIELDMATCHER_H

#include <QString>
#include <QRegularExpression>

namespace BridgeSync {

/**
 * @brief Recognizes "invalid field" errors and extracts the field name
 *
 * The backend reports unknown fields in free text; the exact wording
 * differs between backend versions, so the parser is replaceable.
 */
class InvalidFieldMatcher
{
public:
    virtual ~InvalidFieldMatcher() = default;

    virtual bool isInvalidFieldError(const QString &message) const = 0;

    /**
     * @return The offending field name, or an empty string if it cannot be parsed
     */
    virtual QString extractFieldName(const QString &message) const = 0;
};

/**
 * @brief Matcher for "Invalid field 'name' on model 'x'" style messages
 */
class RegexInvalidFieldMatcher : public InvalidFieldMatcher
{
public:
    static const char *DEFAULT_PATTERN;

    /**
     * @param pattern Regular expression whose first capture group is the field name
     */
    explicit RegexInvalidFieldMatcher(const QString &pattern = QString::fromLatin1(DEFAULT_PATTERN));

    bool isInvalidFieldError(const QString &message) const override;
    QString extractFieldName(const QString &message) const override;

private:
    QRegularExpression m_pattern;
};

} // namespace BridgeSync

#endif // INVALIDFIELDMATCHER_H
