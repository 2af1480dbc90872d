#include <QtTest>

#include <QList>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
import theboys.backend.versionmodel;
#endif

class VersionModelTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void parse_readsNumericTriple()
    {
        const Version version = VersionModel::parse(QStringLiteral("v1.2.3"));
        QVERIFY(version.numeric);
        QCOMPARE(version.major, 1);
        QCOMPARE(version.minor, 2);
        QCOMPARE(version.patch, 3);
        QVERIFY(!version.hasQualifier());
        QCOMPARE(version.toString(), QStringLiteral("1.2.3"));
    }

    void parse_fillsMissingComponents()
    {
        const Version version = VersionModel::parse(QStringLiteral("2.1"));
        QVERIFY(version.numeric);
        QCOMPARE(version.patch, 0);
        QCOMPARE(version.toString(), QStringLiteral("2.1.0"));
    }

    void parse_splitsQualifierAndCommitHash()
    {
        const Version plus = VersionModel::parse(QStringLiteral("1.2.3-dev+abc123"));
        QCOMPARE(plus.suffix, QStringLiteral("dev+abc123"));
        QCOMPARE(plus.commitHash, QStringLiteral("abc123"));
        QCOMPARE(plus.channel, VersionChannel::Dev);

        const Version dotted = VersionModel::parse(QStringLiteral("v3.2.10-dev.1a2b3c4"));
        QCOMPARE(dotted.commitHash, QStringLiteral("1a2b3c4"));
        QCOMPARE(dotted.toString(), QStringLiteral("3.2.10-dev.1a2b3c4"));
    }

    void parse_keepsUnversionedTextAsQualifier()
    {
        const Version dev = VersionModel::parse(QStringLiteral("dev"));
        QVERIFY(!dev.numeric);
        QCOMPARE(dev.major, 0);
        QCOMPARE(dev.suffix, QStringLiteral("dev"));
        QVERIFY(VersionModel::isDevBuild(dev));

        const Version vendor = VersionModel::parse(QStringLiteral("version"));
        QVERIFY(!vendor.numeric);
        QCOMPARE(vendor.suffix, QStringLiteral("version"));
    }

    void isDevBuild_data()
    {
        QTest::addColumn<QString>("text");
        QTest::addColumn<bool>("dev");

        QTest::newRow("dev qualifier") << QStringLiteral("1.2.3-dev") << true;
        QTest::newRow("dev with hash") << QStringLiteral("1.2.3-dev+abc123") << true;
        QTest::newRow("bare upper") << QStringLiteral("DEV") << true;
        QTest::newRow("empty") << QString() << false;
        QTest::newRow("release") << QStringLiteral("1.2.3") << false;
        QTest::newRow("beta") << QStringLiteral("1.2.3-beta") << false;
        QTest::newRow("rc") << QStringLiteral("1.2.3-rc1") << false;
    }

    void isDevBuild()
    {
        QFETCH(QString, text);
        QFETCH(bool, dev);
        QCOMPARE(VersionModel::isDevBuild(text), dev);
    }

    void compare_ordersByTripleThenQualifier()
    {
        const auto order = [](const char *a, const char *b) {
            return VersionModel::compare(VersionModel::parse(QString::fromLatin1(a)),
                                         VersionModel::parse(QString::fromLatin1(b)));
        };
        QCOMPARE(order("1.3.0", "1.2.9"), VersionOrder::Greater);
        QCOMPARE(order("1.10.0", "1.9.0"), VersionOrder::Greater);
        QCOMPARE(order("1.2.3", "1.2.3-rc1"), VersionOrder::Greater);
        QCOMPARE(order("1.2.3-beta", "1.2.3-rc1"), VersionOrder::Less);
        QCOMPARE(order("v1.2.3", "1.2.3"), VersionOrder::Equal);
    }

    void compare_isTotalOrder()
    {
        const QStringList texts = {
            QStringLiteral("1.2.3"),
            QStringLiteral("1.2.3-dev"),
            QStringLiteral("1.2.3-dev+abc123"),
            QStringLiteral("1.2.3-dev+fff000"),
            QStringLiteral("1.2.3-rc1"),
            QStringLiteral("1.3.0"),
            QStringLiteral("0.9"),
            QStringLiteral("dev"),
            QStringLiteral("2"),
        };
        QList<Version> versions;
        for (const QString& text : texts) {
            versions.append(VersionModel::parse(text));
        }

        const auto flip = [](VersionOrder order) {
            if (order == VersionOrder::Less) {
                return VersionOrder::Greater;
            }
            if (order == VersionOrder::Greater) {
                return VersionOrder::Less;
            }
            return VersionOrder::Equal;
        };

        for (const Version& a : versions) {
            QCOMPARE(VersionModel::compare(a, a), VersionOrder::Equal);
            QVERIFY(!VersionModel::isNewer(a, a));
            for (const Version& b : versions) {
                QCOMPARE(VersionModel::compare(b, a), flip(VersionModel::compare(a, b)));
                for (const Version& c : versions) {
                    if (VersionModel::compare(a, b) == VersionOrder::Less
                        && VersionModel::compare(b, c) == VersionOrder::Less) {
                        QCOMPARE(VersionModel::compare(a, c), VersionOrder::Less);
                    }
                }
            }
        }
    }

    void compare_commitHashTieBreakIsDeterministic()
    {
        const Version a = VersionModel::parse(QStringLiteral("1.2.3-dev+abc123"));
        const Version b = VersionModel::parse(QStringLiteral("1.2.3-dev+fff000"));
        QCOMPARE(VersionModel::compare(a, b), VersionOrder::Less);
        QCOMPARE(VersionModel::compare(a, b), VersionModel::compare(a, b));
        QVERIFY(!(a == b));
    }

    void isNewer_detectsUpgrade()
    {
        const Version current = VersionModel::parse(QStringLiteral("1.2.0"));
        QVERIFY(VersionModel::isNewer(current, VersionModel::parse(QStringLiteral("1.3.0"))));
        QVERIFY(!VersionModel::isNewer(current, VersionModel::parse(QStringLiteral("1.1.9"))));
        QVERIFY(!VersionModel::isNewer(VersionModel::parse(QStringLiteral("1.3.0")),
                                       VersionModel::parse(QStringLiteral("1.3.0"))));
    }
};

QTEST_GUILESS_MAIN(VersionModelTest)
#include "VersionModelTest.moc"
