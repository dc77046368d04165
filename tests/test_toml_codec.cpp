#include <gtest/gtest.h>

#include <QDate>
#include <QDateTime>
#include <QVariantList>

#include "TomlCodec.h"

static QVariantMap parseOk(const char *text)
{
    QVariantMap out;
    QString err;
    EXPECT_TRUE(TomlCodec::parse(QByteArray(text), &out, &err)) << err.toStdString();
    return out;
}

static QString parseError(const char *text)
{
    QVariantMap out;
    QString err;
    EXPECT_FALSE(TomlCodec::parse(QByteArray(text), &out, &err));
    return err;
}

TEST(TomlCodec, ScalarTypesMapToVariants)
{
    const QVariantMap m = parseOk(
        "name = \"alpha\"\n"
        "count = 1_000\n"
        "ratio = 0.5\n"
        "on = true\n"
        "escaped = \"a\\tb\\u00e9\"\n");

    EXPECT_EQ(m.value("name").userType(), int(QMetaType::QString));
    EXPECT_EQ(m.value("count").userType(), int(QMetaType::LongLong));
    EXPECT_EQ(m.value("count").toLongLong(), 1000);
    EXPECT_EQ(m.value("ratio").userType(), int(QMetaType::Double));
    EXPECT_EQ(m.value("on").userType(), int(QMetaType::Bool));
    EXPECT_EQ(m.value("escaped").toString(), QString::fromUtf8("a\tb\xc3\xa9"));
}

TEST(TomlCodec, DatesAndTimesMapToQtTypes)
{
    const QVariantMap m = parseOk(
        "day = 1979-05-27\n"
        "stamp = 1979-05-27T07:32:00+02:00\n"
        "local = 1979-05-27T07:32:00\n"
        "clock = 07:32:00\n");

    EXPECT_EQ(m.value("day").toDate(), QDate(1979, 5, 27));

    const QDateTime stamp = m.value("stamp").toDateTime();
    EXPECT_EQ(stamp.offsetFromUtc(), 7200);
    EXPECT_EQ(stamp.toUTC().time().hour(), 5);

    EXPECT_EQ(m.value("local").toDateTime().timeSpec(), Qt::LocalTime);
    EXPECT_EQ(m.value("clock").toTime(), QTime(7, 32, 0));
}

TEST(TomlCodec, TablesAndArraysOfTablesMapToNestedVariants)
{
    const QVariantMap m = parseOk(
        "tags = [ \"a\", \"b\" ]\n"
        "\n"
        "[[groups]]\n"
        "name = \"alpha\"\n"
        "\n"
        "[[groups.profiles]]\n"
        "name = \"devnet\"\n"
        "\n"
        "[[groups]]\n"
        "name = \"beta\"\n"
        "\n"
        "[server.limits]\n"
        "max = 3\n");

    EXPECT_EQ(m.value("tags").toList().size(), 2);

    const QVariantList groups = m.value("groups").toList();
    ASSERT_EQ(groups.size(), 2);
    EXPECT_EQ(groups[0].toMap().value("name").toString(), QString("alpha"));
    EXPECT_EQ(groups[0].toMap().value("profiles").toList().size(), 1);
    EXPECT_FALSE(groups[1].toMap().contains("profiles"));

    EXPECT_EQ(m.value("server").toMap().value("limits").toMap().value("max").toLongLong(), 3);
}

TEST(TomlCodec, ParseErrorsCarryTheLine)
{
    EXPECT_TRUE(parseError("a = 1\na = 2\n").startsWith("line 2:"));
    EXPECT_TRUE(parseError("[t]\nx = 1\n[t]\ny = 2\n").startsWith("line "));
    EXPECT_FALSE(parseError("x = 1 2\n").isEmpty());
}

TEST(TomlCodec, SerializeSkipsNullsAndReadsBack)
{
    QVariantMap profile;
    profile.insert("name", "devnet");
    profile.insert("active", true);

    QVariantMap group;
    group.insert("name", "alpha");
    group.insert("profiles", QVariantList{ profile });

    QVariantMap meta;
    meta.insert("owner", "ops team");

    QVariantMap root;
    root.insert("version", "1.0.0");
    root.insert("groups", QVariantList{ group });
    root.insert("meta", meta);
    root.insert("ratio", 2.0);
    root.insert("count", qlonglong(7));
    root.insert("seen", QDate(2024, 1, 2));
    root.insert("skipped", QVariant());

    const QString text = QString::fromUtf8(TomlCodec::serialize(root));

    EXPECT_FALSE(text.contains("skipped"));
    EXPECT_TRUE(text.contains("[[groups]]"));
    EXPECT_TRUE(text.contains("[[groups.profiles]]"));
    EXPECT_LT(text.indexOf("version"), text.indexOf("[[groups]]"));

    QVariantMap back;
    QString err;
    ASSERT_TRUE(TomlCodec::parse(text.toUtf8(), &back, &err)) << err.toStdString();
    EXPECT_EQ(back.value("meta").toMap().value("owner").toString(), QString("ops team"));
    EXPECT_EQ(back.value("ratio").userType(), int(QMetaType::Double));
    EXPECT_EQ(back.value("count").toLongLong(), 7);
    EXPECT_EQ(back.value("seen").toDate(), QDate(2024, 1, 2));
    EXPECT_TRUE(back.value("groups").toList()[0].toMap().value("profiles").toList()[0]
                    .toMap().value("active").toBool());
}
