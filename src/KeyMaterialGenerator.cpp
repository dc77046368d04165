// KeyMaterialGenerator.cpp
//
// Key generation:
//
//   words   MnemonicPhrase::generate()        (libsodium randombytes)
//   seed    MnemonicPhrase::toSeed()          (PBKDF2-HMAC-SHA512)
//   key     HdKeyDerivation::derivePrivateKey() at the Sui path
//   public  HdKeyDerivation::publicKeyFor()   (32 bytes or compressed SEC1)
//
// Address hashing uses libsodium's BLAKE2b (crypto_generichash) with a
// 32-byte digest and no key, which is exactly BLAKE2b-256.
//
// IMPORTANT: never log key material. Only curve names, aliases and
// addresses may appear in log lines.

#include "KeyMaterialGenerator.h"

#include <QCoreApplication>
#include <QDebug>

#include "HdKeyDerivation.h"
#include "MnemonicPhrase.h"

#include <sodium.h>

static QString tr(const char *s)
{
    return QCoreApplication::translate("KeyMaterialGenerator", s);
}

// libsodium requires sodium_init() once per process.
static bool sodiumInitOnce(ConfigError *err)
{
    static bool inited = false;
    if (inited) return true;

    if (sodium_init() < 0) {
        return failWith(err, ErrorCode::EntropyUnavailable,
                        tr("libsodium initialization failed (no secure random source)"));
    }
    inited = true;
    return true;
}

// =====================================================
// Public API
// =====================================================
namespace KeyMaterialGenerator {

quint8 schemeFlag(KeyCurve curve)
{
    switch (curve) {
        case KeyCurve::Ed25519:   return 0x00;
        case KeyCurve::Secp256k1: return 0x01;
        case KeyCurve::Secp256r1: return 0x02;
        case KeyCurve::Unknown:   break;
    }
    return 0xFF;
}

int publicKeySize(KeyCurve curve)
{
    switch (curve) {
        case KeyCurve::Ed25519:   return 32;
        case KeyCurve::Secp256k1: return 33;
        case KeyCurve::Secp256r1: return 33;
        case KeyCurve::Unknown:   break;
    }
    return 0;
}

QString deriveAddress(KeyCurve curve, const QByteArray &publicKey)
{
    if (publicKeySize(curve) == 0 || publicKey.size() != publicKeySize(curve))
        return QString();

    if (!sodiumInitOnce(nullptr))
        return QString();

    QByteArray input;
    input.reserve(1 + publicKey.size());
    input.append(char(schemeFlag(curve)));
    input.append(publicKey);

    unsigned char digest[32];
    crypto_generichash(digest, sizeof digest,
                       reinterpret_cast<const unsigned char*>(input.constData()),
                       static_cast<unsigned long long>(input.size()),
                       nullptr, 0);

    return QStringLiteral("0x")
         + QString::fromLatin1(QByteArray(reinterpret_cast<const char*>(digest), sizeof digest).toHex());
}

QString encodePublicKey(KeyCurve curve, const QByteArray &publicKey)
{
    QByteArray blob;
    blob.append(char(schemeFlag(curve)));
    blob.append(publicKey);
    return QString::fromLatin1(blob.toBase64());
}

bool decodePublicKey(const QString &encoded, KeyCurve *curve, QByteArray *publicKey,
                     ConfigError *err)
{
    const auto decoded = QByteArray::fromBase64Encoding(
        encoded.trimmed().toLatin1(), QByteArray::AbortOnBase64DecodingErrors);

    if (decoded.decodingStatus != QByteArray::Base64DecodingStatus::Ok || decoded.decoded.isEmpty())
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("public_key is not valid base64"));

    const QByteArray &blob = decoded.decoded;

    KeyCurve c = KeyCurve::Unknown;
    switch (static_cast<quint8>(blob[0])) {
        case 0x00: c = KeyCurve::Ed25519;   break;
        case 0x01: c = KeyCurve::Secp256k1; break;
        case 0x02: c = KeyCurve::Secp256r1; break;
        default:
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("public_key has unknown scheme flag 0x%1")
                                .arg(uint(static_cast<quint8>(blob[0])), 2, 16, QLatin1Char('0')));
    }

    const QByteArray raw = blob.mid(1);
    if (raw.size() != publicKeySize(c))
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("public_key has %1 bytes, %2 expects %3")
                            .arg(raw.size()).arg(curveToString(c)).arg(publicKeySize(c)));

    if (curve) *curve = c;
    if (publicKey) *publicKey = raw;
    if (err) err->clear();
    return true;
}

bool recover(KeyCurve curve, const QString &recoveryPhrase, const QString &derivationPath,
             KeyMaterial *out, ConfigError *err)
{
    if (!out) return false;
    if (curve == KeyCurve::Unknown)
        return failWith(err, ErrorCode::UnsupportedCurve, tr("Unsupported curve"));
    if (!sodiumInitOnce(err)) return false;

    const QString path = derivationPath.trimmed().isEmpty()
        ? HdKeyDerivation::defaultPath(curve) : derivationPath.trimmed();

    QVector<quint32> steps;
    if (!HdKeyDerivation::checkSuiPath(curve, path, &steps, err))
        return false;
    if (!MnemonicPhrase::validate(recoveryPhrase, err))
        return false;

    QByteArray seed = MnemonicPhrase::toSeed(recoveryPhrase);
    if (seed.isEmpty())
        return failWith(err, ErrorCode::EntropyUnavailable, tr("PBKDF2 seed derivation failed"));

    QByteArray priv;
    const bool derived = HdKeyDerivation::derivePrivateKey(curve, seed, steps, &priv, err);
    sodium_memzero(seed.data(), size_t(seed.size()));
    if (!derived) {
        qWarning() << "Key derivation failed for" << curveToString(curve);
        return false;
    }

    QByteArray pub;
    const bool havePublic = HdKeyDerivation::publicKeyFor(curve, priv, &pub, err);
    sodium_memzero(priv.data(), size_t(priv.size()));
    if (!havePublic) return false;

    KeyMaterial km;
    km.curve = curve;
    km.publicKey = pub;
    km.address = deriveAddress(curve, pub);
    km.recoveryPhrase = MnemonicPhrase::normalized(recoveryPhrase);
    km.derivationPath = path;

    if (km.address.isEmpty())
        return failWith(err, ErrorCode::EntropyUnavailable,
                        tr("Could not derive address (libsodium unavailable)"));

    *out = km;
    if (err) err->clear();
    return true;
}

bool generate(KeyCurve curve, const KeyGenOptions &options, KeyMaterial *out, ConfigError *err)
{
    if (!out) return false;
    if (curve == KeyCurve::Unknown)
        return failWith(err, ErrorCode::UnsupportedCurve, tr("Unsupported curve"));

    // Path problems are reported before any entropy is drawn.
    const QString path = options.derivationPath.trimmed().isEmpty()
        ? HdKeyDerivation::defaultPath(curve) : options.derivationPath.trimmed();
    if (!HdKeyDerivation::checkSuiPath(curve, path, nullptr, err))
        return false;

    QString phrase;
    if (!MnemonicPhrase::generate(options.wordCount, &phrase, err))
        return false;

    if (!recover(curve, phrase, path, out, err))
        return false;

    qDebug().noquote() << "Generated" << curveToString(curve) << "key at" << path
                       << "for address" << out->address;
    return true;
}

bool generate(KeyCurve curve, KeyMaterial *out, ConfigError *err)
{
    return generate(curve, KeyGenOptions(), out, err);
}

bool generate(const QString &curveTag, KeyMaterial *out, ConfigError *err)
{
    const KeyCurve c = curveFromString(curveTag);
    if (c == KeyCurve::Unknown)
        return failWith(err, ErrorCode::UnsupportedCurve,
                        tr("Unsupported curve '%1' (expected ed25519, secp256k1 or secp256r1)")
                            .arg(curveTag));
    return generate(c, out, err);
}

} // namespace KeyMaterialGenerator
