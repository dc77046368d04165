#include "MnemonicPhrase.h"

#include <QCoreApplication>
#include <QStringList>
#include <QVector>

#include <openssl/evp.h>

#include <sodium.h>

#include <algorithm>
#include <cstring>

static QString tr(const char *s)
{
    return QCoreApplication::translate("MnemonicPhrase", s);
}

static QByteArray sha256(const QByteArray &data)
{
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_Digest(data.constData(), size_t(data.size()), md, &mdLen, EVP_sha256(), nullptr) != 1)
        return QByteArray();
    return QByteArray(reinterpret_cast<const char*>(md), int(mdLen));
}

static int wordIndex(const QString &word)
{
    const QByteArray w = word.toLatin1();
    const char *const *begin = MnemonicPhrase::kWordlist;
    const char *const *end = begin + MnemonicPhrase::kWordlistSize;
    const char *const *it = std::lower_bound(begin, end, w.constData(),
        [](const char *a, const char *b) { return std::strcmp(a, b) < 0; });
    if (it == end || std::strcmp(*it, w.constData()) != 0)
        return -1;
    return int(it - begin);
}

namespace MnemonicPhrase {

bool isValidWordCount(int words)
{
    return words >= 12 && words <= 24 && words % 3 == 0;
}

QString normalized(const QString &phrase)
{
    return phrase.simplified().toLower();
}

bool fromEntropy(const QByteArray &entropy, QString *phrase, ConfigError *err)
{
    const int len = entropy.size();
    if (len < 16 || len > 32 || len % 4 != 0)
        return failWith(err, ErrorCode::InvalidKeyParameters,
                        tr("Mnemonic entropy must be 16 to 32 bytes in steps of 4, got %1").arg(len));

    const QByteArray hash = sha256(entropy);
    if (hash.isEmpty())
        return failWith(err, ErrorCode::EntropyUnavailable, tr("SHA-256 is unavailable"));

    // ENT/32 checksum bits never exceed one byte.
    QByteArray bits = entropy;
    bits.append(hash[0]);

    const int words = (len * 8 + len / 4) / 11;
    QStringList out;
    int bitPos = 0;
    for (int i = 0; i < words; ++i) {
        int index = 0;
        for (int j = 0; j < 11; ++j, ++bitPos) {
            const quint8 byte = quint8(bits[bitPos / 8]);
            index = (index << 1) | ((byte >> (7 - bitPos % 8)) & 1);
        }
        out << QString::fromLatin1(kWordlist[index]);
    }

    *phrase = out.join(' ');
    if (err) err->clear();
    return true;
}

bool generate(int words, QString *phrase, ConfigError *err)
{
    if (!isValidWordCount(words))
        return failWith(err, ErrorCode::InvalidKeyParameters,
                        tr("Word count must be 12, 15, 18, 21 or 24, got %1").arg(words));

    if (sodium_init() < 0)
        return failWith(err, ErrorCode::EntropyUnavailable,
                        tr("libsodium initialization failed (no secure random source)"));

    QByteArray entropy(words * 4 / 3, '\0');
    randombytes_buf(entropy.data(), size_t(entropy.size()));

    const bool ok = fromEntropy(entropy, phrase, err);
    sodium_memzero(entropy.data(), size_t(entropy.size()));
    return ok;
}

bool validate(const QString &phrase, ConfigError *err)
{
    const QStringList words = normalized(phrase).split(' ', Qt::SkipEmptyParts);
    if (!isValidWordCount(words.size()))
        return failWith(err, ErrorCode::InvalidKeyParameters,
                        tr("A recovery phrase has 12, 15, 18, 21 or 24 words, got %1").arg(words.size()));

    QVector<int> indices;
    for (const QString &w : words) {
        const int idx = wordIndex(w);
        if (idx < 0)
            return failWith(err, ErrorCode::InvalidKeyParameters,
                            tr("'%1' is not a recovery phrase word").arg(w));
        indices << idx;
    }

    const int totalBits = words.size() * 11;
    const int checksumBits = words.size() / 3;
    QByteArray bits((totalBits + 7) / 8, '\0');
    int bitPos = 0;
    for (int idx : indices) {
        for (int j = 10; j >= 0; --j, ++bitPos) {
            if (idx & (1 << j))
                bits[bitPos / 8] = char(quint8(bits[bitPos / 8]) | (1 << (7 - bitPos % 8)));
        }
    }

    const QByteArray entropy = bits.left((totalBits - checksumBits) / 8);
    QString expected;
    if (!fromEntropy(entropy, &expected, err))
        return false;
    if (expected != words.join(' '))
        return failWith(err, ErrorCode::InvalidKeyParameters, tr("Recovery phrase checksum does not match"));

    if (err) err->clear();
    return true;
}

QByteArray toSeed(const QString &phrase, const QString &passphrase)
{
    const QByteArray password = normalized(phrase).toUtf8();
    const QByteArray salt = QByteArray("mnemonic") + passphrase.toUtf8();

    QByteArray out(64, '\0');
    const int ok = PKCS5_PBKDF2_HMAC(
        password.constData(), password.size(),
        reinterpret_cast<const unsigned char*>(salt.constData()), salt.size(),
        2048,
        EVP_sha512(),
        out.size(),
        reinterpret_cast<unsigned char*>(out.data()));

    if (ok != 1) return QByteArray();
    return out;
}

} // namespace MnemonicPhrase
