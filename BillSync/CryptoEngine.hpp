#pragma once
#include <QByteArray>
#include <QString>

struct SigningKeyPair {
    QByteArray publicKey; // 32
    QByteArray secretKey; // 64

    bool isValid() const { return publicKey.size() == 32 && secretKey.size() == 64; }
};

class CryptoEngine {
public:
    CryptoEngine();

    // base64url helpers (no padding)
    static QString toBase64Url(const QByteArray& data);
    static QByteArray fromBase64Url(const QString& s);

    // Fresh 32-byte XChaCha20-Poly1305 key.
    QByteArray generateSymmetricKey() const;

    // Fresh Ed25519 keypair.
    SigningKeyPair generateSigningKeyPair() const;

    QByteArray signDetached(const QByteArray& message, const QByteArray& secretKey) const;

    // false for a bad signature, wrong key or malformed input; never throws.
    bool verifyDetached(const QByteArray& message, const QByteArray& signature,
                        const QByteArray& publicKey) const;

    // AEAD (XChaCha20-Poly1305). Output = nonce(24) || ciphertext
    QByteArray aeadEncrypt(const QByteArray& key32, const QByteArray& plaintext,
                           const QByteArray& aad = {}) const;

    // *ok is false when the key is malformed or authentication fails.
    QByteArray aeadDecrypt(const QByteArray& key32, const QByteArray& nonceAndCiphertext,
                           const QByteArray& aad = {}, bool* ok = nullptr) const;

    // zlib + AEAD, used for every bill and dataset payload.
    QByteArray sealCompressed(const QByteArray& key32, const QByteArray& plaintext) const;
    QByteArray openCompressed(const QByteArray& key32, const QByteArray& sealed, bool* ok = nullptr) const;

    // Portable key forms. Import returns an empty key (or invalid pair) on
    // malformed input.
    static QString exportSymmetricKey(const QByteArray& key32);
    static QByteArray importSymmetricKey(const QString& portable);
    static QString exportPublicKey(const QByteArray& publicKey);
    static QByteArray importPublicKey(const QString& portable);
    static QString exportSigningKeyPair(const SigningKeyPair& pair);
    static SigningKeyPair importSigningKeyPair(const QString& portable);

    // Uniformly random decimal string of the given length, no leading zero.
    QString randomDigits(int length) const;
};
