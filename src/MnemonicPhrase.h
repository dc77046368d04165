#pragma once
//
// MnemonicPhrase.h
//
// PURPOSE
// -------
// BIP39 recovery phrases for generated identities.
//
//   entropy (128..256 bits, libsodium randombytes)
//       -> words: entropy || first ENT/32 bits of SHA-256(entropy), 11 bits per word
//       -> seed:  PBKDF2-HMAC-SHA512(phrase, "mnemonic" + passphrase, 2048 rounds, 64 bytes)
//
// The seed feeds HdKeyDerivation. Phrases are returned to the caller once
// and are never written to the configuration files or to the logs.
//

#include <QByteArray>
#include <QString>

#include "ConfigError.h"

namespace MnemonicPhrase {

    constexpr int kWordlistSize = 2048;
    extern const char *const kWordlist[kWordlistSize];

    constexpr int kDefaultWordCount = 12;

    // 12, 15, 18, 21 or 24.
    bool isValidWordCount(int words);

    // Random phrase. Fails with InvalidKeyParameters for a bad word count and with
    // EntropyUnavailable when libsodium cannot start.
    bool generate(int words, QString *phrase, ConfigError *err = nullptr);

    // Phrase for known entropy (16, 20, 24, 28 or 32 bytes).
    bool fromEntropy(const QByteArray &entropy, QString *phrase, ConfigError *err = nullptr);

    // Word count, dictionary and checksum check. Case and spacing are ignored.
    bool validate(const QString &phrase, ConfigError *err = nullptr);

    // Lower case, single spaces.
    QString normalized(const QString &phrase);

    // 64-byte BIP39 seed; empty on PBKDF2 failure.
    QByteArray toSeed(const QString &phrase, const QString &passphrase = QString());

} // namespace MnemonicPhrase
