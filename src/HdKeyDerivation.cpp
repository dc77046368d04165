// HdKeyDerivation.cpp
//
// Child key derivation:
//
//   I   = HMAC-SHA512(chain, data)
//   data = 0x00 || k || ser32(i)      hardened
//        = serP(K)   || ser32(i)      normal (EC curves only)
//
//   Ed25519:  k_i = IL
//   EC:       k_i = (IL + k) mod n; if IL >= n or k_i == 0 the step is
//             retried with data = 0x01 || IR || ser32(i) (SLIP-0010)
//
// Scalar arithmetic and point multiplication use OpenSSL BIGNUM / EC_POINT,
// Ed25519 public keys come from libsodium's crypto_sign_seed_keypair().

#include "HdKeyDerivation.h"

#include <QCoreApplication>
#include <QRegularExpression>
#include <QStringList>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>

#include <sodium.h>

static QString tr(const char *s)
{
    return QCoreApplication::translate("HdKeyDerivation", s);
}

static bool hmacSha512(const QByteArray &key, const QByteArray &data, QByteArray *out)
{
    out->resize(64);
    unsigned int len = 64;
    const unsigned char *r = HMAC(EVP_sha512(), key.constData(), key.size(),
                                  reinterpret_cast<const unsigned char*>(data.constData()),
                                  size_t(data.size()),
                                  reinterpret_cast<unsigned char*>(out->data()), &len);
    return r != nullptr && len == 64;
}

static QByteArray ser32(quint32 i)
{
    QByteArray b(4, '\0');
    b[0] = char((i >> 24) & 0xFF);
    b[1] = char((i >> 16) & 0xFF);
    b[2] = char((i >> 8) & 0xFF);
    b[3] = char(i & 0xFF);
    return b;
}

static int curveNid(KeyCurve curve)
{
    return curve == KeyCurve::Secp256k1 ? NID_secp256k1 : NID_X9_62_prime256v1;
}

static QByteArray masterKeyName(KeyCurve curve)
{
    switch (curve) {
        case KeyCurve::Ed25519:   return QByteArray("ed25519 seed");
        case KeyCurve::Secp256k1: return QByteArray("Bitcoin seed");
        case KeyCurve::Secp256r1: return QByteArray("Nist256p1 seed");
        case KeyCurve::Unknown:   break;
    }
    return QByteArray();
}

// =====================================================
// EC helpers (OpenSSL)
// =====================================================
static bool ecCompressedPoint(int nid, const QByteArray &scalar, QByteArray *pub33)
{
    EC_GROUP *group = EC_GROUP_new_by_curve_name(nid);
    BN_CTX *ctx = BN_CTX_new();
    BIGNUM *k = BN_bin2bn(reinterpret_cast<const unsigned char*>(scalar.constData()),
                          scalar.size(), nullptr);
    EC_POINT *point = group ? EC_POINT_new(group) : nullptr;

    unsigned char buf[33];
    const bool ok = group && ctx && k && point
        && !BN_is_zero(k)
        && BN_cmp(k, EC_GROUP_get0_order(group)) < 0
        && EC_POINT_mul(group, point, k, nullptr, nullptr, ctx) == 1
        && EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED, buf, sizeof buf, ctx) == sizeof buf;

    EC_POINT_free(point);
    BN_clear_free(k);
    BN_CTX_free(ctx);
    EC_GROUP_free(group);

    if (!ok) return false;
    *pub33 = QByteArray(reinterpret_cast<const char*>(buf), sizeof buf);
    return true;
}

enum class ScalarSum { Ok, Invalid, Failed };

// *child = (tweak + parent) mod n. Invalid when tweak >= n or the sum is zero.
static ScalarSum ecAddScalars(int nid, const QByteArray &tweak, const QByteArray &parent, QByteArray *child)
{
    EC_GROUP *group = EC_GROUP_new_by_curve_name(nid);
    BN_CTX *ctx = BN_CTX_new();
    BIGNUM *il = BN_bin2bn(reinterpret_cast<const unsigned char*>(tweak.constData()), tweak.size(), nullptr);
    BIGNUM *kp = BN_bin2bn(reinterpret_cast<const unsigned char*>(parent.constData()), parent.size(), nullptr);
    BIGNUM *sum = BN_new();

    ScalarSum result = ScalarSum::Failed;
    QByteArray out(32, '\0');

    if (group && ctx && il && kp && sum) {
        const BIGNUM *n = EC_GROUP_get0_order(group);
        if (BN_cmp(il, n) >= 0) {
            result = ScalarSum::Invalid;
        } else if (BN_mod_add(sum, il, kp, n, ctx) == 1) {
            if (BN_is_zero(sum))
                result = ScalarSum::Invalid;
            else if (BN_bn2binpad(sum, reinterpret_cast<unsigned char*>(out.data()), out.size()) == 32)
                result = ScalarSum::Ok;
        }
    }

    BN_clear_free(sum);
    BN_clear_free(kp);
    BN_clear_free(il);
    BN_CTX_free(ctx);
    EC_GROUP_free(group);

    if (result == ScalarSum::Ok) *child = out;
    sodium_memzero(out.data(), size_t(out.size()));
    return result;
}

static bool ecScalarValid(int nid, const QByteArray &scalar)
{
    QByteArray unused;
    return ecCompressedPoint(nid, scalar, &unused);
}

// =====================================================
// Public API
// =====================================================
namespace HdKeyDerivation {

QString defaultPath(KeyCurve curve)
{
    switch (curve) {
        case KeyCurve::Ed25519:   return QStringLiteral("m/44'/784'/0'/0'/0'");
        case KeyCurve::Secp256k1: return QStringLiteral("m/54'/784'/0'/0/0");
        case KeyCurve::Secp256r1: return QStringLiteral("m/74'/784'/0'/0/0");
        case KeyCurve::Unknown:   break;
    }
    return QString();
}

bool parsePath(const QString &path, QVector<quint32> *indices, ConfigError *err)
{
    const QStringList parts = path.trimmed().split('/');
    if (parts.size() < 2 || parts.first() != "m")
        return failWith(err, ErrorCode::InvalidKeyParameters,
                        tr("Derivation path '%1' must start with 'm/'").arg(path));

    static const QRegularExpression stepRe(QStringLiteral("^(\\d{1,10})('?)$"));

    QVector<quint32> out;
    for (int i = 1; i < parts.size(); ++i) {
        const auto m = stepRe.match(parts[i]);
        bool ok = false;
        const qulonglong n = m.hasMatch() ? m.captured(1).toULongLong(&ok) : 0;
        if (!m.hasMatch() || !ok || n >= kHardened)
            return failWith(err, ErrorCode::InvalidKeyParameters,
                            tr("Derivation path '%1' has an invalid step '%2'").arg(path, parts[i]));
        out << (quint32(n) | (m.captured(2).isEmpty() ? 0u : kHardened));
    }

    *indices = out;
    if (err) err->clear();
    return true;
}

bool checkSuiPath(KeyCurve curve, const QString &path, QVector<quint32> *indices, ConfigError *err)
{
    QVector<quint32> steps;
    if (!parsePath(path, &steps, err))
        return false;

    quint32 purpose = 0;
    switch (curve) {
        case KeyCurve::Ed25519:   purpose = 44; break;
        case KeyCurve::Secp256k1: purpose = 54; break;
        case KeyCurve::Secp256r1: purpose = 74; break;
        case KeyCurve::Unknown:
            return failWith(err, ErrorCode::UnsupportedCurve, tr("Unsupported curve"));
    }

    const bool allHardened = (curve == KeyCurve::Ed25519);
    bool ok = steps.size() == 5
        && steps[0] == (purpose | kHardened)
        && steps[1] == (784u | kHardened)
        && (steps[2] & kHardened);
    for (int i = 3; ok && i < 5; ++i)
        ok = bool(steps[i] & kHardened) == allHardened;

    if (!ok)
        return failWith(err, ErrorCode::InvalidKeyParameters,
                        tr("Derivation path '%1' does not fit %2 keys (expected the form %3)")
                            .arg(path, curveToString(curve),
                                 allHardened ? QString("m/%1'/784'/a'/c'/i'").arg(purpose)
                                             : QString("m/%1'/784'/a'/c/i").arg(purpose)));

    if (indices) *indices = steps;
    if (err) err->clear();
    return true;
}

bool derivePrivateKey(KeyCurve curve, const QByteArray &seed, const QVector<quint32> &path,
                      QByteArray *privateKey, ConfigError *err)
{
    const QByteArray name = masterKeyName(curve);
    if (name.isEmpty())
        return failWith(err, ErrorCode::UnsupportedCurve, tr("Unsupported curve"));

    const bool ec = (curve != KeyCurve::Ed25519);
    const int nid = curveNid(curve);

    QByteArray digest;
    if (!hmacSha512(name, seed, &digest))
        return failWith(err, ErrorCode::EntropyUnavailable, tr("HMAC-SHA512 failed"));
    // Invalid EC master keys are re-hashed (SLIP-0010).
    for (int rounds = 0; ec && !ecScalarValid(nid, digest.left(32)); ++rounds) {
        if (rounds == 64)
            return failWith(err, ErrorCode::EntropyUnavailable, tr("No valid EC master key"));
        QByteArray next;
        if (!hmacSha512(name, digest, &next))
            return failWith(err, ErrorCode::EntropyUnavailable, tr("HMAC-SHA512 failed"));
        digest = next;
    }

    QByteArray key = digest.left(32);
    QByteArray chain = digest.mid(32);

    for (quint32 index : path) {
        const bool hardened = index & kHardened;
        if (!ec && !hardened) {
            sodium_memzero(key.data(), size_t(key.size()));
            return failWith(err, ErrorCode::InvalidKeyParameters,
                            tr("Ed25519 derivation supports hardened steps only"));
        }

        QByteArray data;
        if (hardened) {
            data.append('\0');
            data.append(key);
        } else {
            QByteArray pub;
            if (!ecCompressedPoint(nid, key, &pub)) {
                sodium_memzero(key.data(), size_t(key.size()));
                return failWith(err, ErrorCode::EntropyUnavailable, tr("EC point multiplication failed"));
            }
            data.append(pub);
        }
        data.append(ser32(index));

        if (!hmacSha512(chain, data, &digest)) {
            sodium_memzero(key.data(), size_t(key.size()));
            return failWith(err, ErrorCode::EntropyUnavailable, tr("HMAC-SHA512 failed"));
        }
        sodium_memzero(data.data(), size_t(data.size()));

        QByteArray child;
        if (!ec) {
            child = digest.left(32);
        } else {
            ScalarSum sum;
            while ((sum = ecAddScalars(nid, digest.left(32), key, &child)) == ScalarSum::Invalid) {
                QByteArray retry;
                retry.append('\x01');
                retry.append(digest.mid(32));
                retry.append(ser32(index));
                if (!hmacSha512(chain, retry, &digest)) {
                    sodium_memzero(key.data(), size_t(key.size()));
                    return failWith(err, ErrorCode::EntropyUnavailable, tr("HMAC-SHA512 failed"));
                }
            }
            if (sum == ScalarSum::Failed) {
                sodium_memzero(key.data(), size_t(key.size()));
                return failWith(err, ErrorCode::EntropyUnavailable, tr("EC scalar addition failed"));
            }
        }

        sodium_memzero(key.data(), size_t(key.size()));
        key = child;
        chain = digest.mid(32);
        sodium_memzero(child.data(), size_t(child.size()));
    }

    sodium_memzero(digest.data(), size_t(digest.size()));
    *privateKey = key;
    sodium_memzero(key.data(), size_t(key.size()));
    if (err) err->clear();
    return true;
}

bool publicKeyFor(KeyCurve curve, const QByteArray &privateKey, QByteArray *publicKey,
                  ConfigError *err)
{
    if (privateKey.size() != 32)
        return failWith(err, ErrorCode::InvalidKeyParameters, tr("Private key must be 32 bytes"));

    switch (curve) {
        case KeyCurve::Ed25519: {
            if (sodium_init() < 0)
                return failWith(err, ErrorCode::EntropyUnavailable,
                                tr("libsodium initialization failed (no secure random source)"));
            unsigned char pk[crypto_sign_PUBLICKEYBYTES];
            unsigned char sk[crypto_sign_SECRETKEYBYTES];
            crypto_sign_seed_keypair(pk, sk,
                                     reinterpret_cast<const unsigned char*>(privateKey.constData()));
            sodium_memzero(sk, sizeof sk);
            *publicKey = QByteArray(reinterpret_cast<const char*>(pk), sizeof pk);
            break;
        }
        case KeyCurve::Secp256k1:
        case KeyCurve::Secp256r1:
            if (!ecCompressedPoint(curveNid(curve), privateKey, publicKey))
                return failWith(err, ErrorCode::InvalidKeyParameters,
                                tr("Private key is not a valid %1 scalar").arg(curveToString(curve)));
            break;
        case KeyCurve::Unknown:
            return failWith(err, ErrorCode::UnsupportedCurve, tr("Unsupported curve"));
    }

    if (err) err->clear();
    return true;
}

} // namespace HdKeyDerivation
