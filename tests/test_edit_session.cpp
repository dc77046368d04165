#include <gtest/gtest.h>

#include "EditSession.h"
#include "TestSupport.h"

using namespace TestSupport;

TEST(EditSession, CommitAppliesStagedCommandAndCloses)
{
    ConfigDocument doc = samplePrimary();
    EditSession s;
    ConfigError err;

    ASSERT_TRUE(s.begin(doc, &err));
    EXPECT_TRUE(s.isOpen());
    EXPECT_TRUE(EditSession::isOpenOn(&doc));

    ASSERT_TRUE(s.stage(MutationCommand::addGroup("gamma"), &err));
    EXPECT_TRUE(s.hasStagedCommand());

    const MutationResult r = s.commit();
    ASSERT_TRUE(r.ok) << r.error.message.toStdString();
    EXPECT_EQ(doc.primary.groupIndex("gamma"), 2);
    EXPECT_FALSE(s.isOpen());
    EXPECT_FALSE(EditSession::isOpenOn(&doc));
}

TEST(EditSession, RestagingReplacesTheCommand)
{
    ConfigDocument doc = samplePrimary();
    EditSession s;
    ASSERT_TRUE(s.begin(doc));
    ASSERT_TRUE(s.stage(MutationCommand::addGroup("gamma")));
    ASSERT_TRUE(s.stage(MutationCommand::addGroup("delta")));

    ASSERT_TRUE(s.commit().ok);
    EXPECT_EQ(doc.primary.groupIndex("gamma"), -1);
    EXPECT_EQ(doc.primary.groupIndex("delta"), 2);
}

TEST(EditSession, DiscardLeavesDocumentUntouched)
{
    ConfigDocument doc = samplePrimary();
    const ConfigDocument before = doc;

    EditSession s;
    ASSERT_TRUE(s.begin(doc));
    ASSERT_TRUE(s.stage(MutationCommand::deleteGroup("beta")));
    s.discard();

    EXPECT_FALSE(s.isOpen());
    EXPECT_TRUE(doc == before);

    ConfigError err;
    EXPECT_FALSE(s.stage(MutationCommand::addGroup("gamma"), &err));
    EXPECT_EQ(err.code, ErrorCode::SessionClosed);
    EXPECT_EQ(s.commit().error.code, ErrorCode::SessionClosed);
}

TEST(EditSession, CommitWithoutCommandKeepsSessionOpen)
{
    ConfigDocument doc = samplePrimary();
    EditSession s;
    ASSERT_TRUE(s.begin(doc));

    const MutationResult r = s.commit();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, ErrorCode::NoCommandStaged);
    EXPECT_TRUE(s.isOpen());

    ASSERT_TRUE(s.stage(MutationCommand::setGroupActive("beta")));
    EXPECT_TRUE(s.commit().ok);
}

TEST(EditSession, OneOpenSessionPerDocument)
{
    ConfigDocument doc = samplePrimary();
    ConfigDocument other = samplePrimary();

    EditSession first;
    EditSession second;
    ConfigError err;

    ASSERT_TRUE(first.begin(doc));
    EXPECT_FALSE(second.begin(doc, &err));
    EXPECT_EQ(err.code, ErrorCode::SessionAlreadyOpen);

    EXPECT_FALSE(first.begin(other, &err));
    EXPECT_EQ(err.code, ErrorCode::SessionAlreadyOpen);

    EXPECT_TRUE(second.begin(other, &err));

    first.discard();
    second.discard();
    EXPECT_TRUE(second.begin(doc));
}

TEST(EditSession, DestructorDiscards)
{
    ConfigDocument doc = samplePrimary();
    const ConfigDocument before = doc;
    {
        EditSession s;
        ASSERT_TRUE(s.begin(doc));
        ASSERT_TRUE(s.stage(MutationCommand::deleteGroup("beta")));
    }
    EXPECT_FALSE(EditSession::isOpenOn(&doc));
    EXPECT_TRUE(doc == before);
}

TEST(EditSession, FailedCommandClosesSessionAndKeepsDocument)
{
    ConfigDocument doc = samplePrimary();
    const ConfigDocument before = doc;

    EditSession s;
    ASSERT_TRUE(s.begin(doc));
    ASSERT_TRUE(s.stage(MutationCommand::deleteProfile("beta", "localnet")));

    const MutationResult r = s.commit();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, ErrorCode::WouldEmptyRequiredCollection);
    EXPECT_FALSE(s.isOpen());
    EXPECT_TRUE(doc == before);
}

TEST(EditSession, HookSeesEveryEngineResult)
{
    ConfigDocument doc = samplePrimary();
    QVector<MutationResult> seen;

    EditSession s;
    s.setCommitHook([&seen](const MutationResult &r) { seen << r; });

    ASSERT_TRUE(s.begin(doc));
    EXPECT_EQ(s.commit().error.code, ErrorCode::NoCommandStaged);
    EXPECT_TRUE(seen.isEmpty());

    ASSERT_TRUE(s.stage(MutationCommand::addGroup("x")));
    s.commit();

    ASSERT_TRUE(s.begin(doc));
    ASSERT_TRUE(s.stage(MutationCommand::addGroup("gamma")));
    s.commit();

    ASSERT_EQ(seen.size(), 2);
    EXPECT_FALSE(seen[0].ok);
    EXPECT_EQ(seen[0].error.code, ErrorCode::InvalidName);
    EXPECT_TRUE(seen[1].ok);
    EXPECT_EQ(seen[1].change.subject, QString("gamma"));
}
