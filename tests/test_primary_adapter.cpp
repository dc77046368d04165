#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "ConfigFormatAdapter.h"
#include "PrimaryConfigAdapter.h"
#include "TestSupport.h"

using namespace TestSupport;

static QByteArray minimalJson(const QString &groupsBody, const QString &head = QString())
{
    return QString("{ %1 \"groups\": [ %2 ] }").arg(head, groupsBody).toUtf8();
}

static QString groupJson(const QString &name, const QString &identityBody,
                         const QString &profileBody = "{ \"name\": \"devnet\", \"rpc_url\": \"https://fullnode.devnet.sui.io:443\" }")
{
    return QString("{ \"name\": \"%1\", \"profiles\": [ %2 ], \"identities\": [ %3 ] }")
        .arg(name, profileBody, identityBody);
}

static QString identityJson(const QString &alias, char fill, const QString &more = QString())
{
    return QString("{ \"alias\": \"%1\", \"public_key\": \"%2\" %3 }")
        .arg(alias, fixedKeyBase64(fill), more);
}

class PrimaryAdapterTest : public ::testing::TestWithParam<DocumentFormat> {};

TEST_P(PrimaryAdapterTest, SerializeThenParseIsAFixedPoint)
{
    const PrimaryConfigAdapter adapter(GetParam());
    const ConfigDocument original = samplePrimary(GetParam());

    QByteArray bytes;
    ConfigError err;
    ASSERT_TRUE(adapter.serialize(original, &bytes, &err)) << err.message.toStdString();

    ConfigDocument first;
    ASSERT_TRUE(adapter.parse(bytes, &first, &err)) << err.message.toStdString();
    EXPECT_TRUE(first == original);

    QByteArray again;
    ASSERT_TRUE(adapter.serialize(first, &again, &err));
    ConfigDocument second;
    ASSERT_TRUE(adapter.parse(again, &second, &err));
    EXPECT_TRUE(second == first);
    EXPECT_EQ(again, bytes);
}

TEST_P(PrimaryAdapterTest, KeepsUnknownKeysAtEveryLevel)
{
    const PrimaryConfigAdapter adapter(GetParam());

    QByteArray bytes;
    ASSERT_TRUE(adapter.serialize(samplePrimary(GetParam()), &bytes));

    ConfigDocument doc;
    ASSERT_TRUE(adapter.parse(bytes, &doc));

    EXPECT_EQ(doc.primary.extra.value("editor_note").toString(), QString("kept"));
    EXPECT_EQ(doc.primary.groups[0].extra.value("color").toString(), QString("blue"));
    EXPECT_EQ(doc.primary.groups[0].profiles[0].extra.value("faucet").toString(),
              QString("https://faucet.devnet.sui.io"));
    EXPECT_EQ(doc.primary.groups[0].identities[0].extra.value("label").toString(),
              QString("primary wallet"));
}

INSTANTIATE_TEST_SUITE_P(Encodings, PrimaryAdapterTest,
                         ::testing::Values(DocumentFormat::PrimaryJson, DocumentFormat::PrimaryToml));

TEST(PrimaryConfigAdapter, JsonAndTomlAgreeOnTheModel)
{
    const ConfigDocument original = samplePrimary();

    QByteArray tomlBytes;
    ASSERT_TRUE(PrimaryConfigAdapter(DocumentFormat::PrimaryToml).serialize(original, &tomlBytes));

    ConfigDocument fromToml;
    ASSERT_TRUE(PrimaryConfigAdapter(DocumentFormat::PrimaryToml).parse(tomlBytes, &fromToml));

    EXPECT_EQ(fromToml.format, DocumentFormat::PrimaryToml);
    EXPECT_TRUE(fromToml.primary == original.primary);
}

TEST(PrimaryConfigAdapter, WritesSnakeCaseKeysAndDerivedFields)
{
    QByteArray bytes;
    ASSERT_TRUE(PrimaryConfigAdapter().serialize(samplePrimary(), &bytes));

    const QJsonObject root = QJsonDocument::fromJson(bytes).object();
    EXPECT_EQ(root.value("version").toString(), QString("1.0.0"));

    const QJsonObject alpha = root.value("groups").toArray().at(0).toObject();
    const QJsonObject devnet = alpha.value("profiles").toArray().at(0).toObject();
    EXPECT_EQ(devnet.value("rpc_url").toString(), QString("https://fullnode.devnet.sui.io:443"));
    EXPECT_EQ(devnet.value("graphql_url").toString(), QString("https://graphql.devnet.sui.io/graphql"));
    EXPECT_FALSE(devnet.contains("grpc_url"));

    const QJsonObject main = alpha.value("identities").toArray().at(0).toObject();
    EXPECT_EQ(main.value("public_key").toString(), fixedKeyBase64('\x01'));
    EXPECT_EQ(main.value("curve").toString(), QString("ed25519"));
    EXPECT_EQ(main.value("address").toString(),
              KeyMaterialGenerator::deriveAddress(KeyCurve::Ed25519, QByteArray(32, '\x01')));
    EXPECT_TRUE(main.value("active").toBool());
}

TEST(PrimaryConfigAdapter, VersionMarkerIsOptionalButChecked)
{
    ConfigDocument doc;
    ConfigError err;
    const QString g = groupJson("alpha", identityJson("main", '\x01'));

    ASSERT_TRUE(PrimaryConfigAdapter().parse(minimalJson(g), &doc, &err)) << err.message.toStdString();
    EXPECT_TRUE(doc.primary.version.isEmpty());

    EXPECT_FALSE(PrimaryConfigAdapter().parse(minimalJson(g, "\"version\": \"9.0.0\","), &doc, &err));
    EXPECT_EQ(err.code, ErrorCode::UnsupportedVersion);

    EXPECT_FALSE(PrimaryConfigAdapter().parse(minimalJson(g, "\"version\": 1,"), &doc, &err));
    EXPECT_EQ(err.code, ErrorCode::MalformedDocument);
}

TEST(PrimaryConfigAdapter, LoadNormalizesActiveFlags)
{
    const QString g1 = groupJson("alpha", identityJson("main", '\x01', ", \"active\": true") + ", "
                                          + identityJson("backup", '\x02', ", \"active\": true"));
    const QString g2 = groupJson("beta", identityJson("ops", '\x03'));

    ConfigDocument doc;
    ConfigError err;
    ASSERT_TRUE(PrimaryConfigAdapter().parse(minimalJson(g1 + ", " + g2), &doc, &err))
        << err.message.toStdString();

    EXPECT_TRUE(doc.primary.groups[0].active);
    EXPECT_FALSE(doc.primary.groups[1].active);
    EXPECT_TRUE(doc.primary.groups[0].identities[0].active);
    EXPECT_FALSE(doc.primary.groups[0].identities[1].active);
    EXPECT_TRUE(doc.primary.groups[1].profiles[0].active);
}

TEST(PrimaryConfigAdapter, RejectsMalformedDocuments)
{
    const PrimaryConfigAdapter adapter;
    ConfigDocument doc;
    ConfigError err;

    const auto rejects = [&](const QByteArray &bytes) {
        err.clear();
        const bool ok = adapter.parse(bytes, &doc, &err);
        return !ok && err.code == ErrorCode::MalformedDocument;
    };

    EXPECT_TRUE(rejects("{ \"groups\": [ "));
    EXPECT_TRUE(rejects("[ 1, 2 ]"));
    EXPECT_TRUE(rejects("{ \"version\": \"1.0.0\" }"));
    EXPECT_TRUE(rejects("{ \"groups\": {} }"));

    // Missing identities array
    EXPECT_TRUE(rejects(minimalJson("{ \"name\": \"alpha\", \"profiles\": [] }")));

    // Duplicate group names
    const QString g = groupJson("alpha", identityJson("main", '\x01'));
    EXPECT_TRUE(rejects(minimalJson(g + ", " + g)));
    EXPECT_TRUE(err.message.contains("groups[1]"));

    // Duplicate aliases inside one group
    EXPECT_TRUE(rejects(minimalJson(groupJson("alpha", identityJson("main", '\x01') + ", "
                                                       + identityJson("main", '\x02')))));

    // Repeated keys inside one JSON object
    const QString g2 = groupJson("beta", identityJson("ops", '\x02'));
    EXPECT_TRUE(rejects(QString("{ \"groups\": [ %1 ], \"groups\": [ %2 ] }").arg(g, g2).toUtf8()));
    EXPECT_TRUE(err.message.contains("'groups'"));
    EXPECT_TRUE(rejects(minimalJson(groupJson("alpha", identityJson("main", '\x01'),
        "{ \"name\": \"devnet\", \"rpc_url\": \"https://a.example\", \"rpc_url\": \"https://b.example\" }"))));
    EXPECT_TRUE(err.message.contains("'rpc_url'"));

    // Equal keys in sibling objects are fine
    ConfigDocument siblings;
    EXPECT_TRUE(adapter.parse(minimalJson(g + ", " + g2), &siblings, &err)) << err.message.toStdString();

    // Wrong value types
    EXPECT_TRUE(rejects(minimalJson(groupJson("alpha", identityJson("main", '\x01', ", \"active\": \"yes\"")))));
    EXPECT_TRUE(rejects(minimalJson(groupJson("alpha", identityJson("main", '\x01'),
                                              "{ \"name\": \"devnet\", \"rpc_url\": 42 }"))));

    // Key material problems
    EXPECT_TRUE(rejects(minimalJson(groupJson("alpha", "{ \"alias\": \"main\", \"public_key\": \"@@@\" }"))));
    EXPECT_TRUE(rejects(minimalJson(groupJson("alpha", identityJson("main", '\x01', ", \"curve\": \"secp256k1\"")))));
    EXPECT_TRUE(rejects(minimalJson(groupJson("alpha", identityJson("main", '\x01', ", \"curve\": \"rsa\"")))));
    EXPECT_TRUE(rejects(minimalJson(groupJson("alpha", identityJson("main", '\x01',
        ", \"address\": \"0x0000000000000000000000000000000000000000000000000000000000000000\"")))));
    EXPECT_TRUE(err.message.contains("groups[0].identities[0]"));
}

TEST(PrimaryConfigAdapter, StoredAddressIsCaseInsensitive)
{
    const QString upper = KeyMaterialGenerator::deriveAddress(KeyCurve::Ed25519, QByteArray(32, '\x01'))
                              .toUpper().replace("0X", "0x");
    const QString g = groupJson("alpha", identityJson("main", '\x01', QString(", \"address\": \"%1\"").arg(upper)));

    ConfigDocument doc;
    ConfigError err;
    ASSERT_TRUE(PrimaryConfigAdapter().parse(minimalJson(g), &doc, &err)) << err.message.toStdString();
    EXPECT_EQ(doc.primary.groups[0].identities[0].address, upper.toLower());
}

TEST(PrimaryConfigAdapter, RefusesClientDocuments)
{
    QByteArray bytes;
    ConfigError err;
    EXPECT_FALSE(PrimaryConfigAdapter().serialize(sampleClient(), &bytes, &err));
    EXPECT_EQ(err.code, ErrorCode::UnsupportedCommand);
}

TEST(ConfigFormatAdapter, FormatDetection)
{
    DocumentFormat f = DocumentFormat::PrimaryJson;
    EXPECT_TRUE(ConfigFormatAdapter::formatForExtension("/x/cfg.TOML", &f));
    EXPECT_EQ(f, DocumentFormat::PrimaryToml);
    EXPECT_TRUE(ConfigFormatAdapter::formatForExtension("client.yml", &f));
    EXPECT_EQ(f, DocumentFormat::ClientYaml);
    EXPECT_FALSE(ConfigFormatAdapter::formatForExtension("config", &f));

    EXPECT_EQ(ConfigFormatAdapter::formatForPath("a.json", "envs: []"), DocumentFormat::PrimaryJson);
    EXPECT_EQ(ConfigFormatAdapter::formatForPath("config", "  {\"groups\": []}"), DocumentFormat::PrimaryJson);
    EXPECT_EQ(ConfigFormatAdapter::formatForPath("config", "# c\nversion = \"1.0.0\"\n"), DocumentFormat::PrimaryToml);
    EXPECT_EQ(ConfigFormatAdapter::formatForPath("config", "[[groups]]\nname = \"a\"\n"), DocumentFormat::PrimaryToml);
    EXPECT_EQ(ConfigFormatAdapter::formatForPath("config", "envs:\n  - alias: devnet\n"), DocumentFormat::ClientYaml);

    EXPECT_EQ(ConfigFormatAdapter::forFormat(DocumentFormat::PrimaryToml)->format(), DocumentFormat::PrimaryToml);
    EXPECT_EQ(ConfigFormatAdapter::forFormat(DocumentFormat::ClientYaml)->format(), DocumentFormat::ClientYaml);
}
