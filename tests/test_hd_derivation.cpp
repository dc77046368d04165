#include <gtest/gtest.h>

#include <QStringList>

#include "HdKeyDerivation.h"
#include "MnemonicPhrase.h"

static QByteArray hex(const char *s)
{
    return QByteArray::fromHex(QByteArray(s));
}

static QVector<quint32> path(const QString &p)
{
    QVector<quint32> steps;
    ConfigError err;
    EXPECT_TRUE(HdKeyDerivation::parsePath(p, &steps, &err)) << err.message.toStdString();
    return steps;
}

static QByteArray derive(KeyCurve curve, const QByteArray &seed, const QString &p)
{
    QByteArray key;
    ConfigError err;
    EXPECT_TRUE(HdKeyDerivation::derivePrivateKey(curve, seed, path(p), &key, &err))
        << err.message.toStdString();
    return key;
}

TEST(MnemonicPhrase, KnownEntropyGivesKnownWords)
{
    QString phrase;
    ASSERT_TRUE(MnemonicPhrase::fromEntropy(QByteArray(16, '\0'), &phrase));
    EXPECT_EQ(phrase, QString("abandon abandon abandon abandon abandon abandon abandon abandon "
                              "abandon abandon abandon about"));

    ASSERT_TRUE(MnemonicPhrase::fromEntropy(QByteArray(16, '\x7f'), &phrase));
    EXPECT_EQ(phrase, QString("legal winner thank year wave sausage worth useful legal winner thank yellow"));

    ASSERT_TRUE(MnemonicPhrase::fromEntropy(QByteArray(32, '\0'), &phrase));
    const QStringList words = phrase.split(' ');
    ASSERT_EQ(words.size(), 24);
    EXPECT_EQ(words.last(), QString("art"));

    ConfigError err;
    EXPECT_FALSE(MnemonicPhrase::fromEntropy(QByteArray(17, '\0'), &phrase, &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidKeyParameters);
}

TEST(MnemonicPhrase, SeedMatchesPbkdf2Reference)
{
    const QString phrase = "abandon abandon abandon abandon abandon abandon abandon abandon "
                           "abandon abandon abandon about";
    EXPECT_EQ(MnemonicPhrase::toSeed(phrase, "TREZOR"),
              hex("c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e53495531f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04"));
    EXPECT_EQ(MnemonicPhrase::toSeed(phrase).size(), 64);
}

TEST(MnemonicPhrase, ValidateChecksWordsCountAndChecksum)
{
    ConfigError err;
    EXPECT_TRUE(MnemonicPhrase::validate("  Legal winner thank year wave sausage worth useful legal winner thank YELLOW ", &err));

    // Last word carries the checksum
    EXPECT_FALSE(MnemonicPhrase::validate("legal winner thank year wave sausage worth useful legal winner thank year", &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidKeyParameters);

    EXPECT_FALSE(MnemonicPhrase::validate("legal winner thank", &err));
    EXPECT_FALSE(MnemonicPhrase::validate("legal winner thank year wave sausage worth useful legal winner thank qwerty", &err));
    EXPECT_TRUE(err.message.contains("qwerty"));
}

TEST(MnemonicPhrase, GeneratedPhrasesHaveTheRequestedLength)
{
    for (int words : { 12, 15, 18, 21, 24 }) {
        QString phrase;
        ASSERT_TRUE(MnemonicPhrase::generate(words, &phrase));
        EXPECT_EQ(phrase.split(' ').size(), words);
        EXPECT_TRUE(MnemonicPhrase::validate(phrase));
    }

    QString a, b;
    ASSERT_TRUE(MnemonicPhrase::generate(12, &a));
    ASSERT_TRUE(MnemonicPhrase::generate(12, &b));
    EXPECT_NE(a, b);

    ConfigError err;
    EXPECT_FALSE(MnemonicPhrase::generate(13, &a, &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidKeyParameters);
}

TEST(HdKeyDerivation, Ed25519ReferenceVector)
{
    const QByteArray seed = hex("000102030405060708090a0b0c0d0e0f");
    EXPECT_EQ(derive(KeyCurve::Ed25519, seed, "m"),
              hex("2b4be7f19ee27bbf30c667b642d5f4aa69fd169872f8fc3059c08ebae2eb19e7"));
    EXPECT_EQ(derive(KeyCurve::Ed25519, seed, "m/0'"),
              hex("68e0fe46dfb67e368c75379acec591dad19df3cde26e63b93a8e704f1dade7a3"));

    QByteArray pub;
    ASSERT_TRUE(HdKeyDerivation::publicKeyFor(KeyCurve::Ed25519, derive(KeyCurve::Ed25519, seed, "m"), &pub));
    EXPECT_EQ(pub, hex("a4b2856bfec510abab89753fac1ac0e1112364e7d250545963f135f2a33188ed"));
}

TEST(HdKeyDerivation, Secp256k1ReferenceVector)
{
    const QByteArray seed = hex("000102030405060708090a0b0c0d0e0f");
    const QByteArray master = derive(KeyCurve::Secp256k1, seed, "m");
    EXPECT_EQ(master, hex("e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35"));
    EXPECT_EQ(derive(KeyCurve::Secp256k1, seed, "m/0'"),
              hex("edb2e14f9ee77d26dd93b4ecede8d16ed408ce149b6cd80b0715a2d911a0afea"));
    // Non-hardened step goes through the parent public key
    EXPECT_EQ(derive(KeyCurve::Secp256k1, seed, "m/0'/1"),
              hex("3c6cb8d0f6a264c91ea8b5030fadaa8e538b020f0a387421a12de9319dc93368"));

    QByteArray pub;
    ASSERT_TRUE(HdKeyDerivation::publicKeyFor(KeyCurve::Secp256k1, master, &pub));
    EXPECT_EQ(pub, hex("0339a36013301597daef41fbe593a02cc513d0b55527ec2df1050e2e8ff49c85c2"));
}

TEST(HdKeyDerivation, Secp256r1DerivesValidDistinctKeys)
{
    const QByteArray seed = hex("000102030405060708090a0b0c0d0e0f");
    const QByteArray a = derive(KeyCurve::Secp256r1, seed, "m/74'/784'/0'/0/0");
    const QByteArray b = derive(KeyCurve::Secp256r1, seed, "m/74'/784'/0'/0/1");
    EXPECT_EQ(a.size(), 32);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, derive(KeyCurve::Secp256r1, seed, "m/74'/784'/0'/0/0"));

    // Same seed and steps, different curve constant
    EXPECT_NE(derive(KeyCurve::Secp256r1, seed, "m/0'"), derive(KeyCurve::Secp256k1, seed, "m/0'"));

    QByteArray pub;
    ASSERT_TRUE(HdKeyDerivation::publicKeyFor(KeyCurve::Secp256r1, a, &pub));
    EXPECT_EQ(pub.size(), 33);
}

TEST(HdKeyDerivation, Ed25519RejectsNormalSteps)
{
    QByteArray key;
    ConfigError err;
    EXPECT_FALSE(HdKeyDerivation::derivePrivateKey(KeyCurve::Ed25519, QByteArray(64, '\x01'),
                                                   path("m/44'/784'/0'/0/0"), &key, &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidKeyParameters);
}

TEST(HdKeyDerivation, PathParsingAndSuiLayout)
{
    const QVector<quint32> steps = path("m/44'/784'/0'/0'/7'");
    ASSERT_EQ(steps.size(), 5);
    EXPECT_EQ(steps[0], 44u | HdKeyDerivation::kHardened);
    EXPECT_EQ(steps[4], 7u | HdKeyDerivation::kHardened);

    for (KeyCurve curve : { KeyCurve::Ed25519, KeyCurve::Secp256k1, KeyCurve::Secp256r1 })
        EXPECT_TRUE(HdKeyDerivation::checkSuiPath(curve, HdKeyDerivation::defaultPath(curve), nullptr));

    ConfigError err;
    QVector<quint32> out;
    EXPECT_FALSE(HdKeyDerivation::parsePath("44'/784'", &out, &err));
    EXPECT_FALSE(HdKeyDerivation::parsePath("m/44x", &out, &err));
    EXPECT_FALSE(HdKeyDerivation::parsePath("m/2147483648", &out, &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidKeyParameters);

    // Wrong purpose for the curve, wrong coin type, wrong hardening, wrong depth
    EXPECT_FALSE(HdKeyDerivation::checkSuiPath(KeyCurve::Ed25519, "m/54'/784'/0'/0/0", nullptr, &err));
    EXPECT_FALSE(HdKeyDerivation::checkSuiPath(KeyCurve::Secp256k1, "m/54'/60'/0'/0/0", nullptr, &err));
    EXPECT_FALSE(HdKeyDerivation::checkSuiPath(KeyCurve::Secp256k1, "m/54'/784'/0'/0'/0'", nullptr, &err));
    EXPECT_FALSE(HdKeyDerivation::checkSuiPath(KeyCurve::Secp256r1, "m/74'/784'/0'/0", nullptr, &err));
    EXPECT_TRUE(err.message.contains("m/74'/784'/a'/c/i"));
}
