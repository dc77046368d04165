#include <gtest/gtest.h>

#include "ActiveSelection.h"
#include "ConfigError.h"
#include "ConfigModel.h"
#include "TestSupport.h"

using namespace TestSupport;

TEST(ConfigError, FailWithFillsErrorAndReturnsFalse)
{
    ConfigError err;
    EXPECT_FALSE(failWith(&err, ErrorCode::NotFound, "missing", "/tmp/x.json"));
    EXPECT_TRUE(err.isError());
    EXPECT_EQ(err.code, ErrorCode::NotFound);
    EXPECT_EQ(err.toString(), QString("missing (/tmp/x.json)"));

    err.clear();
    EXPECT_FALSE(err.isError());
    EXPECT_TRUE(err.message.isEmpty());

    EXPECT_FALSE(failWith(nullptr, ErrorCode::Io, "ignored"));
}

TEST(ConfigError, CategoriesGroupCodes)
{
    EXPECT_EQ(errorCategory(ErrorCode::DuplicateName), ErrorCategory::Validation);
    EXPECT_EQ(errorCategory(ErrorCode::EntropyUnavailable), ErrorCategory::KeyGeneration);
    EXPECT_EQ(errorCategory(ErrorCode::UnsupportedVersion), ErrorCategory::Load);
    EXPECT_EQ(errorCategory(ErrorCode::NoPathSet), ErrorCategory::Save);
    EXPECT_EQ(errorCategory(ErrorCode::NoCommandStaged), ErrorCategory::Session);
    EXPECT_EQ(errorCategory(ErrorCode::NoDocument), ErrorCategory::Controller);
    EXPECT_EQ(errorCategory(ErrorCode::ExtensionMismatch), ErrorCategory::Save);

    // A broken post-condition is not a user mistake
    EXPECT_EQ(errorCategory(ErrorCode::InternalInvariant), ErrorCategory::Internal);
    EXPECT_NE(errorCategory(ErrorCode::InternalInvariant), errorCategory(ErrorCode::UnsupportedCommand));
    EXPECT_EQ(errorCodeName(ErrorCode::InternalInvariant), QString("InternalInvariant"));
    EXPECT_EQ(errorCategoryName(ErrorCategory::Internal), QString("internal"));

    EXPECT_EQ(errorCategoryName(ErrorCategory::Validation), QString("validation"));
    EXPECT_EQ(errorCodeName(ErrorCode::WouldEmptyRequiredCollection), QString("WouldEmptyRequiredCollection"));
}

TEST(ConfigModel, CurveAndFormatTags)
{
    EXPECT_EQ(curveFromString("Ed25519"), KeyCurve::Ed25519);
    EXPECT_EQ(curveFromString(" secp256k1 "), KeyCurve::Secp256k1);
    EXPECT_EQ(curveFromString("secp256r1"), KeyCurve::Secp256r1);
    EXPECT_EQ(curveFromString("rsa"), KeyCurve::Unknown);
    EXPECT_EQ(curveToString(KeyCurve::Secp256r1), QString("secp256r1"));

    DocumentFormat f = DocumentFormat::PrimaryJson;
    EXPECT_TRUE(formatFromString("yml", &f));
    EXPECT_EQ(f, DocumentFormat::ClientYaml);
    EXPECT_TRUE(formatFromString("TOML", &f));
    EXPECT_EQ(f, DocumentFormat::PrimaryToml);
    EXPECT_FALSE(formatFromString("ini", &f));
    EXPECT_FALSE(isPrimaryFormat(DocumentFormat::ClientYaml));
}

TEST(ConfigModel, GroupLookups)
{
    const ConfigDocument doc = samplePrimary();

    EXPECT_EQ(doc.primary.groupNames(), QStringList({ "alpha", "beta" }));
    EXPECT_EQ(doc.primary.groupIndex("beta"), 1);
    EXPECT_EQ(doc.primary.groupIndex("gamma"), -1);
    ASSERT_NE(doc.primary.activeGroup(), nullptr);
    EXPECT_EQ(doc.primary.activeGroup()->name, QString("alpha"));

    const Group &alpha = doc.primary.groups[0];
    EXPECT_EQ(alpha.profileNames(), QStringList({ "devnet", "testnet" }));
    EXPECT_EQ(alpha.aliases(), QStringList({ "main", "backup" }));
    EXPECT_EQ(alpha.identityIndex("backup"), 1);
    ASSERT_NE(alpha.activeProfile(), nullptr);
    EXPECT_EQ(alpha.activeProfile()->name, QString("devnet"));
    ASSERT_NE(alpha.activeIdentity(), nullptr);
    EXPECT_EQ(alpha.activeIdentity()->alias, QString("main"));

    EXPECT_EQ(doc.activeScope(), QString("alpha"));
}

TEST(ConfigModel, ScopeResolutionPerSchema)
{
    ConfigDocument primary = samplePrimary();
    ConfigError err;

    ASSERT_NE(primary.profilesIn("beta", &err), nullptr);
    EXPECT_EQ(primary.profilesIn("beta")->size(), 1);
    EXPECT_EQ(primary.identitiesIn("gamma", &err), nullptr);
    EXPECT_EQ(err.code, ErrorCode::NotFound);

    ASSERT_NE(primary.findProfile("alpha", "testnet"), nullptr);
    EXPECT_EQ(primary.findIdentity("alpha", "ops", &err), nullptr);
    EXPECT_EQ(err.code, ErrorCode::NotFound);

    ConfigDocument client = sampleClient();
    ASSERT_NE(client.profilesIn(QString()), nullptr);
    EXPECT_EQ(client.profilesIn(QString())->size(), 3);
    EXPECT_EQ(client.identitiesIn("alpha", &err), nullptr);
    EXPECT_EQ(err.code, ErrorCode::NotFound);
    EXPECT_EQ(client.activeScope(), QString());
}

TEST(ConfigModel, EqualityIgnoresFilePath)
{
    ConfigDocument a = samplePrimary();
    ConfigDocument b = samplePrimary();
    b.filePath = "/somewhere/else.json";
    EXPECT_TRUE(a == b);

    b.primary.groups[1].profiles[0].rpcUrl = "http://127.0.0.1:9100";
    EXPECT_TRUE(a != b);

    ConfigDocument c = samplePrimary();
    c.format = DocumentFormat::PrimaryToml;
    EXPECT_TRUE(a != c);
}

TEST(ActiveSelection, SetActiveIsExclusive)
{
    QVector<Profile> items;
    items << profile("aaa", "https://a.example", true)
          << profile("bbb", "https://b.example")
          << profile("ccc", "https://c.example");

    ActiveSelection::setActive(items, 2);
    EXPECT_EQ(ActiveSelection::activeCount(items), 1);
    EXPECT_EQ(ActiveSelection::activeIndex(items), 2);
    EXPECT_FALSE(items[0].active);
}

TEST(ActiveSelection, NormalizePromotesFirstOrKeepsFirstActive)
{
    QVector<Profile> none;
    none << profile("aaa", "https://a.example") << profile("bbb", "https://b.example");
    EXPECT_TRUE(ActiveSelection::normalize(none));
    EXPECT_EQ(ActiveSelection::activeIndex(none), 0);

    QVector<Profile> many;
    many << profile("aaa", "https://a.example")
         << profile("bbb", "https://b.example", true)
         << profile("ccc", "https://c.example", true);
    EXPECT_TRUE(ActiveSelection::normalize(many));
    EXPECT_EQ(ActiveSelection::activeIndex(many), 1);
    EXPECT_EQ(ActiveSelection::activeCount(many), 1);

    EXPECT_FALSE(ActiveSelection::normalize(many));

    QVector<Profile> empty;
    EXPECT_FALSE(ActiveSelection::normalize(empty));
    EXPECT_TRUE(ActiveSelection::holds(empty));
}

TEST(ActiveSelection, DocumentNormalizeCoversEveryCollection)
{
    ConfigDocument doc = samplePrimary();
    for (auto &g : doc.primary.groups) {
        g.active = false;
        for (auto &p : g.profiles) p.active = true;
        for (auto &id : g.identities) id.active = false;
    }
    EXPECT_FALSE(ActiveSelection::holds(doc));

    EXPECT_TRUE(ActiveSelection::normalize(doc));
    EXPECT_TRUE(ActiveSelection::holds(doc));
    EXPECT_TRUE(doc.primary.groups[0].active);
    EXPECT_TRUE(doc.primary.groups[0].profiles[0].active);
    EXPECT_FALSE(doc.primary.groups[0].profiles[1].active);
    EXPECT_TRUE(doc.primary.groups[1].identities[0].active);

    ConfigDocument client = sampleClient();
    client.client.keys.clear();
    EXPECT_TRUE(ActiveSelection::holds(client));
}
