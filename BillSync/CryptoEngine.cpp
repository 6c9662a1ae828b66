#include "CryptoEngine.hpp"
#include "Logging.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <sodium.h>
#include <stdexcept>

namespace {

QJsonObject parseKeyObject(const QString& portable) {
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(portable.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) return {};
    return doc.object();
}

QString compact(const QJsonObject& o) {
    return QString::fromUtf8(QJsonDocument(o).toJson(QJsonDocument::Compact));
}

} // namespace

CryptoEngine::CryptoEngine() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
}

QString CryptoEngine::toBase64Url(const QByteArray& data) {
    const size_t maxlen = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    QByteArray out;
    out.resize(int(maxlen));
    sodium_bin2base64(out.data(), out.size(),
                      reinterpret_cast<const unsigned char*>(data.constData()), data.size(),
                      sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    return QString::fromUtf8(out.constData());
}

QByteArray CryptoEngine::fromBase64Url(const QString& s) {
    QByteArray in = s.toUtf8();
    QByteArray out;
    out.resize(in.size());
    size_t bin_len = 0;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(out.data()), out.size(),
                          in.constData(), in.size(),
                          nullptr, &bin_len, nullptr,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) {
        return {};
    }
    out.resize(int(bin_len));
    return out;
}

QByteArray CryptoEngine::generateSymmetricKey() const {
    QByteArray key;
    key.resize(crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
    crypto_aead_xchacha20poly1305_ietf_keygen(reinterpret_cast<unsigned char*>(key.data()));
    return key;
}

SigningKeyPair CryptoEngine::generateSigningKeyPair() const {
    unsigned char pk[crypto_sign_PUBLICKEYBYTES];
    unsigned char sk[crypto_sign_SECRETKEYBYTES];
    crypto_sign_keypair(pk, sk);

    SigningKeyPair pair;
    pair.publicKey = QByteArray(reinterpret_cast<const char*>(pk), sizeof(pk));
    pair.secretKey = QByteArray(reinterpret_cast<const char*>(sk), sizeof(sk));
    sodium_memzero(sk, sizeof(sk));
    return pair;
}

QByteArray CryptoEngine::signDetached(const QByteArray& message, const QByteArray& secretKey) const {
    if (secretKey.size() != crypto_sign_SECRETKEYBYTES) return {};

    unsigned char sig[crypto_sign_BYTES];
    crypto_sign_detached(sig, nullptr,
                         reinterpret_cast<const unsigned char*>(message.constData()),
                         message.size(),
                         reinterpret_cast<const unsigned char*>(secretKey.constData()));
    return QByteArray(reinterpret_cast<const char*>(sig), sizeof(sig));
}

bool CryptoEngine::verifyDetached(const QByteArray& message, const QByteArray& signature,
                                  const QByteArray& publicKey) const {
    if (signature.size() != crypto_sign_BYTES) return false;
    if (publicKey.size() != crypto_sign_PUBLICKEYBYTES) return false;

    return crypto_sign_verify_detached(
               reinterpret_cast<const unsigned char*>(signature.constData()),
               reinterpret_cast<const unsigned char*>(message.constData()),
               message.size(),
               reinterpret_cast<const unsigned char*>(publicKey.constData())) == 0;
}

QByteArray CryptoEngine::aeadEncrypt(const QByteArray& key32, const QByteArray& plaintext, const QByteArray& aad) const {
    if (key32.size() != 32) return {};

    unsigned char nonce[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    QByteArray out;
    out.resize(sizeof(nonce) + plaintext.size() + crypto_aead_xchacha20poly1305_ietf_ABYTES);

    unsigned long long clen = 0;
    crypto_aead_xchacha20poly1305_ietf_encrypt(
        reinterpret_cast<unsigned char*>(out.data()) + sizeof(nonce), &clen,
        reinterpret_cast<const unsigned char*>(plaintext.constData()), plaintext.size(),
        reinterpret_cast<const unsigned char*>(aad.constData()), aad.size(),
        nullptr, nonce,
        reinterpret_cast<const unsigned char*>(key32.constData())
        );

    memcpy(out.data(), nonce, sizeof(nonce));
    out.resize(sizeof(nonce) + int(clen));
    return out;
}

QByteArray CryptoEngine::aeadDecrypt(const QByteArray& key32, const QByteArray& nonceAndCiphertext,
                                     const QByteArray& aad, bool* ok) const {
    if (ok) *ok = false;
    if (key32.size() != 32) return {};
    if (nonceAndCiphertext.size() < crypto_aead_xchacha20poly1305_ietf_NPUBBYTES +
                                        crypto_aead_xchacha20poly1305_ietf_ABYTES) return {};

    const unsigned char* nonce =
        reinterpret_cast<const unsigned char*>(nonceAndCiphertext.constData());
    const unsigned char* c =
        reinterpret_cast<const unsigned char*>(nonceAndCiphertext.constData() + crypto_aead_xchacha20poly1305_ietf_NPUBBYTES);
    const int cLen = nonceAndCiphertext.size() - crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;

    QByteArray out;
    out.resize(cLen);

    unsigned long long plen = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
            reinterpret_cast<unsigned char*>(out.data()), &plen,
            nullptr,
            c, cLen,
            reinterpret_cast<const unsigned char*>(aad.constData()), aad.size(),
            nonce,
            reinterpret_cast<const unsigned char*>(key32.constData())
            ) != 0) {
        return {};
    }
    out.resize(int(plen));
    if (ok) *ok = true;
    return out;
}

QByteArray CryptoEngine::sealCompressed(const QByteArray& key32, const QByteArray& plaintext) const {
    return aeadEncrypt(key32, qCompress(plaintext));
}

QByteArray CryptoEngine::openCompressed(const QByteArray& key32, const QByteArray& sealed, bool* ok) const {
    bool opened = false;
    const QByteArray compressed = aeadDecrypt(key32, sealed, {}, &opened);
    if (ok) *ok = false;
    if (!opened) return {};

    // qUncompress returns empty for corrupt input; a valid stream of empty
    // data is still at least the 4-byte length header plus zlib framing.
    QByteArray plain = qUncompress(compressed);
    if (plain.isEmpty() && compressed.size() > 4 && compressed.left(4) != QByteArray(4, '\0')) {
        qCWarning(lcCrypto) << "payload authenticated but failed to decompress";
        return {};
    }
    if (ok) *ok = true;
    return plain;
}

QString CryptoEngine::exportSymmetricKey(const QByteArray& key32) {
    QJsonObject o;
    o["kty"] = "oct";
    o["alg"] = "XC20P";
    o["k"] = toBase64Url(key32);
    return compact(o);
}

QByteArray CryptoEngine::importSymmetricKey(const QString& portable) {
    const QJsonObject o = parseKeyObject(portable);
    if (o.value("kty").toString() != "oct" || o.value("alg").toString() != "XC20P") return {};
    const QByteArray key = fromBase64Url(o.value("k").toString());
    if (key.size() != crypto_aead_xchacha20poly1305_ietf_KEYBYTES) return {};
    return key;
}

QString CryptoEngine::exportPublicKey(const QByteArray& publicKey) {
    QJsonObject o;
    o["kty"] = "OKP";
    o["crv"] = "Ed25519";
    o["x"] = toBase64Url(publicKey);
    return compact(o);
}

QByteArray CryptoEngine::importPublicKey(const QString& portable) {
    const QJsonObject o = parseKeyObject(portable);
    if (o.value("kty").toString() != "OKP" || o.value("crv").toString() != "Ed25519") return {};
    const QByteArray pk = fromBase64Url(o.value("x").toString());
    if (pk.size() != crypto_sign_PUBLICKEYBYTES) return {};
    return pk;
}

QString CryptoEngine::exportSigningKeyPair(const SigningKeyPair& pair) {
    unsigned char seed[crypto_sign_SEEDBYTES];
    crypto_sign_ed25519_sk_to_seed(seed, reinterpret_cast<const unsigned char*>(pair.secretKey.constData()));

    QJsonObject o;
    o["kty"] = "OKP";
    o["crv"] = "Ed25519";
    o["x"] = toBase64Url(pair.publicKey);
    o["d"] = toBase64Url(QByteArray(reinterpret_cast<const char*>(seed), sizeof(seed)));
    sodium_memzero(seed, sizeof(seed));
    return compact(o);
}

SigningKeyPair CryptoEngine::importSigningKeyPair(const QString& portable) {
    const QJsonObject o = parseKeyObject(portable);
    if (o.value("kty").toString() != "OKP" || o.value("crv").toString() != "Ed25519") return {};

    const QByteArray seed = fromBase64Url(o.value("d").toString());
    if (seed.size() != crypto_sign_SEEDBYTES) return {};

    unsigned char pk[crypto_sign_PUBLICKEYBYTES];
    unsigned char sk[crypto_sign_SECRETKEYBYTES];
    if (crypto_sign_seed_keypair(pk, sk, reinterpret_cast<const unsigned char*>(seed.constData())) != 0)
        return {};

    SigningKeyPair pair;
    pair.publicKey = QByteArray(reinterpret_cast<const char*>(pk), sizeof(pk));
    pair.secretKey = QByteArray(reinterpret_cast<const char*>(sk), sizeof(sk));
    sodium_memzero(sk, sizeof(sk));

    // The embedded public half must match the seed.
    if (fromBase64Url(o.value("x").toString()) != pair.publicKey) return {};
    return pair;
}

QString CryptoEngine::randomDigits(int length) const {
    QString out;
    out.reserve(length);
    out.append(QChar('1' + int(randombytes_uniform(9))));
    for (int i = 1; i < length; ++i)
        out.append(QChar('0' + int(randombytes_uniform(10))));
    return out;
}
