#pragma once
//
// TestSupport.h
//
// Shared fixtures for the chaincfg unit tests:
// - a QCoreApplication for code that needs an application instance
// - deterministic key material (fixed bytes, no RNG)
// - sample documents in each schema
//

#include <QCoreApplication>
#include <QString>

#include "ConfigModel.h"
#include "KeyMaterialGenerator.h"

namespace TestSupport {

inline QCoreApplication *app()
{
    static int argc = 1;
    static char name[] = "chaincfg-tests";
    static char *argv[] = { name, nullptr };
    static QCoreApplication *instance = nullptr;
    if (!QCoreApplication::instance()) {
        instance = new QCoreApplication(argc, argv);
        QCoreApplication::setOrganizationName("chaincfg-tests");
        QCoreApplication::setApplicationName("chaincfg-tests");
    }
    return instance;
}

// Ed25519 key whose 32 bytes all equal `fill`.
inline Identity fixedIdentity(const QString &alias, char fill, bool active = false)
{
    Identity id;
    id.alias = alias;
    id.curve = KeyCurve::Ed25519;
    id.publicKey = QByteArray(32, fill);
    id.address = KeyMaterialGenerator::deriveAddress(id.curve, id.publicKey);
    id.active = active;
    return id;
}

inline QString fixedKeyBase64(char fill)
{
    return KeyMaterialGenerator::encodePublicKey(KeyCurve::Ed25519, QByteArray(32, fill));
}

inline Profile profile(const QString &name, const QString &rpc, bool active = false)
{
    Profile p;
    p.name = name;
    p.rpcUrl = rpc;
    p.active = active;
    return p;
}

// Two groups, three profiles, three identities, one unknown key per level.
inline ConfigDocument samplePrimary(DocumentFormat format = DocumentFormat::PrimaryJson)
{
    ConfigDocument doc;
    doc.format = format;
    doc.primary.version = "1.0.0";
    doc.primary.extra.insert("editor_note", "kept");

    Group alpha;
    alpha.name = "alpha";
    alpha.active = true;
    alpha.extra.insert("color", "blue");

    Profile devnet = profile("devnet", "https://fullnode.devnet.sui.io:443", true);
    devnet.graphqlUrl = "https://graphql.devnet.sui.io/graphql";
    devnet.extra.insert("faucet", "https://faucet.devnet.sui.io");
    alpha.profiles << devnet << profile("testnet", "https://fullnode.testnet.sui.io:443");

    Identity main = fixedIdentity("main", '\x01', true);
    main.extra.insert("label", "primary wallet");
    alpha.identities << main << fixedIdentity("backup", '\x02');

    Group beta;
    beta.name = "beta";
    Profile local = profile("localnet", "http://127.0.0.1:9000", true);
    local.grpcUrl = "grpc://127.0.0.1:9001";
    beta.profiles << local;
    beta.identities << fixedIdentity("ops", '\x03', true);

    doc.primary.groups << alpha << beta;
    return doc;
}

inline ConfigDocument sampleClient()
{
    ConfigDocument doc;
    doc.format = DocumentFormat::ClientYaml;
    doc.client.extra.insert("active_address", "0xabc");

    Profile devnet = profile("devnet", "https://fullnode.devnet.sui.io:443", true);
    devnet.extra.insert("ws", "wss://fullnode.devnet.sui.io");
    doc.client.environments << devnet
                            << profile("testnet", "https://fullnode.testnet.sui.io:443")
                            << profile("localnet", "http://127.0.0.1:9000");

    doc.client.keys << fixedIdentity("main", '\x01', true)
                    << fixedIdentity("backup", '\x02')
                    << fixedIdentity("ops", '\x03');
    return doc;
}

} // namespace TestSupport
