#include "SyncMessage.hpp"

#include <QJsonDocument>

namespace SyncMessage {

QString encode(const QJsonObject& message) {
    return QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact));
}

QJsonObject decode(const QString& text, bool* ok) {
    if (ok) *ok = false;
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) return {};
    const QJsonObject o = doc.object();
    if (!o.value("type").isString()) return {};
    if (ok) *ok = true;
    return o;
}

QJsonObject make(const QString& type) {
    QJsonObject o;
    o["type"] = type;
    return o;
}

QJsonObject makeError(const QString& message, const QString& reason) {
    QJsonObject o = make(Error);
    o["message"] = message;
    if (!reason.isEmpty()) o["reason"] = reason;
    return o;
}

bool isValidCode(const QString& code) {
    if (code.size() != 6) return false;
    for (QChar c : code)
        if (c < QLatin1Char('0') || c > QLatin1Char('9')) return false;
    return true;
}

} // namespace SyncMessage
