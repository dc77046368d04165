#pragma once
//
// HdKeyDerivation.h
//
// PURPOSE
// -------
// Derives an identity's private key from a BIP39 seed along a derivation
// path, the way Sui wallets do:
//
//   Ed25519    SLIP-0010 ("ed25519 seed"), hardened steps only
//              m/44'/784'/{account}'/{change}'/{index}'
//   Secp256k1  BIP32 ("Bitcoin seed")
//              m/54'/784'/{account}'/{change}/{index}
//   Secp256r1  SLIP-0010 ("Nist256p1 seed")
//              m/74'/784'/{account}'/{change}/{index}
//
// Private keys only live in caller buffers that the caller wipes.
//

#include <QByteArray>
#include <QString>
#include <QVector>

#include "ConfigError.h"
#include "ConfigModel.h"

namespace HdKeyDerivation {

    constexpr quint32 kHardened = 0x80000000u;

    // First address of the curve's Sui path, e.g. "m/44'/784'/0'/0'/0'".
    QString defaultPath(KeyCurve curve);

    // "m/44'/784'/0'/0'/0'" -> indices with kHardened set on primed steps.
    bool parsePath(const QString &path, QVector<quint32> *indices, ConfigError *err = nullptr);

    // parsePath() plus the Sui layout for the curve (purpose, coin type 784,
    // five steps, hardening pattern). Fails with InvalidKeyParameters.
    bool checkSuiPath(KeyCurve curve, const QString &path, QVector<quint32> *indices,
                      ConfigError *err = nullptr);

    // 32-byte private key (Ed25519 seed or EC scalar) at `path`.
    bool derivePrivateKey(KeyCurve curve, const QByteArray &seed, const QVector<quint32> &path,
                          QByteArray *privateKey, ConfigError *err = nullptr);

    // Raw public key for a derived private key: 32 bytes (Ed25519) or a
    // 33-byte compressed SEC1 point.
    bool publicKeyFor(KeyCurve curve, const QByteArray &privateKey, QByteArray *publicKey,
                      ConfigError *err = nullptr);

} // namespace HdKeyDerivation
