#include "ShareLink.hpp"
#include "CryptoEngine.hpp"

#include <QUrlQuery>
#include <QUuid>

namespace {

const QString kRoute = QStringLiteral("/view-bill");

bool fail(QString* error, const QString& why) {
    if (error) *error = why;
    return false;
}

} // namespace

QString ShareLink::toString(const QUrl& base) const {
    QUrlQuery q;
    q.addQueryItem("shareId", shareId);
    q.addQueryItem("keyId", keyId);
    q.addQueryItem("fragmentKey",
                   CryptoEngine::toBase64Url(CryptoEngine::exportSymmetricKey(fragmentKey).toUtf8()));
    q.addQueryItem("p", CryptoEngine::toBase64Url(encryptedParticipantId));

    QUrl url(base);
    url.setFragment(kRoute + "?" + q.toString(QUrl::FullyEncoded), QUrl::StrictMode);
    return url.toString(QUrl::FullyEncoded);
}

bool ShareLink::isWellFormedId(const QString& id) {
    const QUuid uuid = QUuid::fromString(id);
    return !uuid.isNull() && uuid.toString(QUuid::WithoutBraces) == id;
}

std::optional<ShareLink> ShareLink::parse(const QString& link, QString* error) {
    const int hash = link.indexOf('#');
    if (hash < 0) {
        fail(error, QStringLiteral("Link has no fragment."));
        return std::nullopt;
    }
    const QString fragment = link.mid(hash + 1);
    const int qmark = fragment.indexOf('?');
    if (qmark < 0 || fragment.left(qmark) != kRoute) {
        fail(error, QStringLiteral("Link does not point at a shared bill."));
        return std::nullopt;
    }

    const QUrlQuery q(fragment.mid(qmark + 1));
    ShareLink out;
    out.shareId = q.queryItemValue("shareId", QUrl::FullyDecoded);
    out.keyId = q.queryItemValue("keyId", QUrl::FullyDecoded);
    const QString fragmentKey = q.queryItemValue("fragmentKey", QUrl::FullyDecoded);
    const QString participant = q.queryItemValue("p", QUrl::FullyDecoded);

    if (out.shareId.isEmpty() || out.keyId.isEmpty() || fragmentKey.isEmpty() || participant.isEmpty()) {
        fail(error, QStringLiteral("Link is missing required parameters."));
        return std::nullopt;
    }
    if (!isWellFormedId(out.shareId) || !isWellFormedId(out.keyId)) {
        fail(error, QStringLiteral("Link carries a malformed id."));
        return std::nullopt;
    }

    out.fragmentKey = CryptoEngine::importSymmetricKey(
        QString::fromUtf8(CryptoEngine::fromBase64Url(fragmentKey)));
    if (out.fragmentKey.isEmpty()) {
        fail(error, QStringLiteral("Link carries a malformed key."));
        return std::nullopt;
    }

    out.encryptedParticipantId = CryptoEngine::fromBase64Url(participant);
    if (out.encryptedParticipantId.isEmpty()) {
        fail(error, QStringLiteral("Link carries a malformed participant."));
        return std::nullopt;
    }
    return out;
}
