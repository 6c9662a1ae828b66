#pragma once
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <optional>

// <base>#/view-bill?shareId=..&keyId=..&fragmentKey=..&p=..
// Everything after '#' stays in the browser/client; the fragment key in
// particular never reaches a server.
struct ShareLink {
    QString shareId;
    QString keyId;
    QByteArray fragmentKey;             // raw 32-byte key
    QByteArray encryptedParticipantId;  // sealed under the bill's content key

    QString toString(const QUrl& base) const;

    // std::nullopt (with *error set) when a parameter is missing, an id is
    // not a canonical UUID, or the fragment key does not decode to a
    // symmetric key.
    static std::optional<ShareLink> parse(const QString& link, QString* error = nullptr);

    // Lower-case UUID without braces, the form the server issues.
    static bool isWellFormedId(const QString& id);
};
