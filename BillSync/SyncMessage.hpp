#pragma once
#include <QJsonObject>
#include <QString>

// Frames exchanged over the relay: compact JSON text with a "type" field.
namespace SyncMessage {

inline const QString SessionCreated = QStringLiteral("session_created");
inline const QString PeerJoined = QStringLiteral("peer_joined");
inline const QString Key = QStringLiteral("key");
inline const QString Data = QStringLiteral("data");
inline const QString SyncComplete = QStringLiteral("sync_complete");
inline const QString Error = QStringLiteral("error");
inline const QString PeerDisconnected = QStringLiteral("peer_disconnected");

// reason carried by an "error" frame when the receiver declines the import
inline const QString ReasonCancelled = QStringLiteral("cancelled");

QString encode(const QJsonObject& message);

// *ok is false for anything that is not a JSON object with a string "type".
QJsonObject decode(const QString& text, bool* ok = nullptr);

QJsonObject make(const QString& type);
QJsonObject makeError(const QString& message, const QString& reason = {});

// Exactly six ASCII digits.
bool isValidCode(const QString& code);

} // namespace SyncMessage
