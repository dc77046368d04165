#pragma once
//
// KeyMaterialGenerator.h
//
// PURPOSE
// -------
// Creates fresh key material for a new Identity and derives the values the
// configuration files store for it:
//
//   - raw public key bytes
//   - the scheme flag + public key, base64 encoded   ("public_key" field)
//   - the on-chain address                          ("address" field)
//
// Every key is derived from a BIP39 recovery phrase along a Sui derivation
// path. The phrase and path are handed back once in KeyMaterial so the
// operator can restore the key in a wallet; the private key itself is wiped
// before generate() returns. Nothing in chaincfg persists phrases or
// private keys.
//
// ARCHITECTURAL POSITION
// ----------------------
//   [ MutationEngine::addIdentity / DocumentController::newDocument ]
//           ↓
//   [ KeyMaterialGenerator ]   <-- this header
//           ↓
//   [ MnemonicPhrase ] -> [ HdKeyDerivation ]
//           ↓
//   [ libsodium (Ed25519, BLAKE2b, randombytes) | OpenSSL (PBKDF2, HMAC, EC) ]
//
// ADDRESS SCHEME
// --------------
// Addresses follow the Sui scheme so they match what the SDK and keytool print:
//
//   address = "0x" + hex( BLAKE2b-256( flag || publicKey ) )
//
//   flag: Ed25519 = 0x00, Secp256k1 = 0x01, Secp256r1 = 0x02
//   publicKey: 32 bytes (Ed25519) or 33-byte SEC1 compressed point (EC curves)
//
// ERRORS
// ------
//   UnsupportedCurve    curve tag is not one of the three above
//   EntropyUnavailable    libsodium cannot initialize or an OpenSSL primitive fails
//   InvalidKeyParameters  bad word count, recovery phrase or derivation path
//

#include <QByteArray>
#include <QString>

#include "ConfigError.h"
#include "ConfigModel.h"

struct KeyMaterial {
    QByteArray publicKey;                 // raw, no flag
    KeyCurve   curve = KeyCurve::Ed25519;
    QString    address;

    // Recovery material. Shown to the operator, never written to a document.
    QString    recoveryPhrase;
    QString    derivationPath;
};

struct KeyGenOptions {
    int     wordCount = 12;        // 12, 15, 18, 21 or 24
    QString derivationPath;        // empty: HdKeyDerivation::defaultPath(curve)
};

namespace KeyMaterialGenerator {

    // Fresh recovery phrase from the secure random source, then the key at
    // the curve's default path. Two calls never share entropy.
    bool generate(KeyCurve curve, KeyMaterial *out, ConfigError *err = nullptr);

    bool generate(KeyCurve curve, const KeyGenOptions &options, KeyMaterial *out,
                  ConfigError *err = nullptr);

    // Re-derives the key for an existing phrase. Empty path: curve default.
    bool recover(KeyCurve curve, const QString &recoveryPhrase, const QString &derivationPath,
                 KeyMaterial *out, ConfigError *err = nullptr);

    // Same, from a curve tag ("ed25519", "secp256k1", "secp256r1").
    bool generate(const QString &curveTag, KeyMaterial *out, ConfigError *err = nullptr);

    // Scheme flag byte for the curve (0x00 / 0x01 / 0x02). Unknown -> 0xFF.
    quint8 schemeFlag(KeyCurve curve);

    // Expected raw public key length: 32 (Ed25519) or 33 (compressed EC). 0 if unknown.
    int publicKeySize(KeyCurve curve);

    // "0x" + 64 lowercase hex chars, or empty if the key does not fit the curve.
    QString deriveAddress(KeyCurve curve, const QByteArray &publicKey);

    // base64( flag || publicKey )
    QString encodePublicKey(KeyCurve curve, const QByteArray &publicKey);

    // Inverse of encodePublicKey(). Fails with MalformedDocument on bad base64,
    // unknown flag or a length that does not match the flag's curve.
    bool decodePublicKey(const QString &encoded, KeyCurve *curve, QByteArray *publicKey,
                         ConfigError *err = nullptr);

} // namespace KeyMaterialGenerator
