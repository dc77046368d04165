#include <gtest/gtest.h>

#include <yaml-cpp/yaml.h>

#include "ClientConfigAdapter.h"
#include "TestSupport.h"

using namespace TestSupport;

static const char *kClientYaml =
    "envs:\n"
    "  - alias: devnet\n"
    "    rpc: \"https://fullnode.devnet.sui.io:443\"\n"
    "    ws: ~\n"
    "  - alias: testnet\n"
    "    rpc: \"https://fullnode.testnet.sui.io:443\"\n"
    "    active: true\n"
    "keystore:\n"
    "  - alias: main\n"
    "    public_key: \"%1\"\n"
    "active_address: \"0xabc\"\n";

static QByteArray clientYaml()
{
    return QString(kClientYaml).arg(fixedKeyBase64('\x01')).toUtf8();
}

TEST(ClientConfigAdapter, ParsesEnvironmentsAndKeys)
{
    ConfigDocument doc;
    ConfigError err;
    ASSERT_TRUE(ClientConfigAdapter().parse(clientYaml(), &doc, &err)) << err.message.toStdString();

    EXPECT_EQ(doc.format, DocumentFormat::ClientYaml);
    ASSERT_EQ(doc.client.environments.size(), 2);
    EXPECT_EQ(doc.client.environments[0].name, QString("devnet"));
    EXPECT_EQ(doc.client.environments[0].rpcUrl, QString("https://fullnode.devnet.sui.io:443"));
    EXPECT_FALSE(doc.client.environments[0].active);
    EXPECT_TRUE(doc.client.environments[1].active);

    ASSERT_TRUE(doc.client.environments[0].extra.contains("ws"));
    EXPECT_FALSE(doc.client.environments[0].extra.value("ws").isValid());

    ASSERT_EQ(doc.client.keys.size(), 1);
    const Identity &main = doc.client.keys[0];
    EXPECT_EQ(main.curve, KeyCurve::Ed25519);
    EXPECT_EQ(main.publicKey, QByteArray(32, '\x01'));
    EXPECT_EQ(main.address, KeyMaterialGenerator::deriveAddress(KeyCurve::Ed25519, main.publicKey));
    EXPECT_TRUE(main.active);

    EXPECT_EQ(doc.client.extra.value("active_address").toString(), QString("0xabc"));
}

TEST(ClientConfigAdapter, SerializeThenParseIsAFixedPoint)
{
    const ClientConfigAdapter adapter;
    const ConfigDocument original = sampleClient();

    QByteArray bytes;
    ConfigError err;
    ASSERT_TRUE(adapter.serialize(original, &bytes, &err)) << err.message.toStdString();
    EXPECT_TRUE(bytes.endsWith('\n'));

    ConfigDocument first;
    ASSERT_TRUE(adapter.parse(bytes, &first, &err)) << err.message.toStdString();
    EXPECT_TRUE(first == original);

    QByteArray again;
    ASSERT_TRUE(adapter.serialize(first, &again, &err));
    EXPECT_EQ(again, bytes);
}

TEST(ClientConfigAdapter, WritesClientKeysOnly)
{
    QByteArray bytes;
    ASSERT_TRUE(ClientConfigAdapter().serialize(sampleClient(), &bytes));

    const YAML::Node root = YAML::Load(bytes.toStdString());
    ASSERT_TRUE(root["envs"].IsSequence());
    EXPECT_EQ(root["envs"][0]["alias"].as<std::string>(), "devnet");
    EXPECT_EQ(root["envs"][0]["rpc"].as<std::string>(), "https://fullnode.devnet.sui.io:443");
    EXPECT_TRUE(root["envs"][0]["active"].as<bool>());
    EXPECT_EQ(root["envs"][0]["ws"].as<std::string>(), "wss://fullnode.devnet.sui.io");

    ASSERT_TRUE(root["keystore"].IsSequence());
    EXPECT_EQ(root["keystore"].size(), 3u);
    EXPECT_EQ(root["keystore"][0]["public_key"].as<std::string>(), fixedKeyBase64('\x01').toStdString());
    EXPECT_FALSE(root["keystore"][0]["address"]);
    EXPECT_FALSE(root["keystore"][0]["curve"]);
}

TEST(ClientConfigAdapter, KeystoreMayBeAbsentOrEmpty)
{
    const char *absent = "envs:\n  - alias: devnet\n    rpc: \"http://127.0.0.1:9000\"\n";
    const char *nullKeys = "envs:\n  - alias: devnet\n    rpc: \"http://127.0.0.1:9000\"\nkeystore:\n";
    const char *emptyKeys = "envs:\n  - alias: devnet\n    rpc: \"http://127.0.0.1:9000\"\nkeystore: []\n";

    for (const char *text : { absent, nullKeys, emptyKeys }) {
        ConfigDocument doc;
        ConfigError err;
        ASSERT_TRUE(ClientConfigAdapter().parse(text, &doc, &err)) << err.message.toStdString();
        EXPECT_TRUE(doc.client.keys.isEmpty());
        EXPECT_TRUE(doc.client.environments[0].active);
    }
}

TEST(ClientConfigAdapter, RejectsMalformedDocuments)
{
    const ClientConfigAdapter adapter;
    ConfigDocument doc;
    ConfigError err;

    const auto rejects = [&](const QByteArray &bytes) {
        err.clear();
        return !adapter.parse(bytes, &doc, &err) && err.code == ErrorCode::MalformedDocument;
    };

    EXPECT_TRUE(rejects(""));
    EXPECT_TRUE(rejects("- just\n- a list\n"));
    EXPECT_TRUE(rejects("keystore: []\n"));
    EXPECT_TRUE(rejects("envs: devnet\n"));
    EXPECT_TRUE(rejects("envs: [ {alias: devnet} ]\n"));
    EXPECT_TRUE(rejects("envs: [ {rpc: \"http://127.0.0.1:9000\"} ]\n"));
    EXPECT_TRUE(rejects("envs: [ {alias: devnet, rpc: \"http://a.example\", active: maybe} ]\n"));
    EXPECT_TRUE(rejects("envs: [ {alias: devnet, rpc: \"http://a.example\"}, {alias: devnet, rpc: \"http://b.example\"} ]\n"));
    EXPECT_TRUE(rejects("envs: [ {alias: devnet, rpc: \"http://a.example\"} ]\nkeystore: [ {alias: main, public_key: \"@@\"} ]\n"));
    EXPECT_TRUE(rejects("envs: [\n"));
}

TEST(ClientConfigAdapter, RefusesPrimaryDocuments)
{
    QByteArray bytes;
    ConfigError err;
    EXPECT_FALSE(ClientConfigAdapter().serialize(samplePrimary(), &bytes, &err));
    EXPECT_EQ(err.code, ErrorCode::UnsupportedCommand);
}
