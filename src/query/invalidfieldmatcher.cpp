#include "invalidfieldmatcher.h"

namespace BridgeSync {

const char *RegexInvalidFieldMatcher::DEFAULT_PATTERN = "Invalid field ['\"]([^'\"]+)['\"]";

RegexInvalidFieldMatcher::RegexInvalidFieldMatcher(const QString &pattern)
    : m_pattern(pattern)
{
}

bool RegexInvalidFieldMatcher::isInvalidFieldError(const QString &message) const
{
    return message.contains("Invalid field");
}

QString RegexInvalidFieldMatcher::extractFieldName(const QString &message) const
{
    const QRegularExpressionMatch match = m_pattern.match(message);
    if (!match.hasMatch() || m_pattern.captureCount() < 1) {
        return QString();
    }
    return match.captured(1).trimmed();
}

} // namespace BridgeSync
