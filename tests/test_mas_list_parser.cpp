#include <QtTest/QtTest>

#include "common/errors.hpp"
#include "reconcile/mas_list_parser.hpp"

class MasListParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testSingleWordName();
    void testNames_data();
    void testNames();
    void testVersionIsCaptured();
    void testMissingVersionFails();
    void testMissingIdFails();
    void testEmptyNameFails();
    void testFullListing();
    void testMalformedLineFailsWholeListing();
};

void MasListParserTests::testSingleWordName()
{
    const auto app = hostform::parseMasListLine("937984704   Amphetamine  (5.3.2)");
    QCOMPARE(QString::fromStdString(app.id), QStringLiteral("937984704"));
    QCOMPARE(QString::fromStdString(app.name), QStringLiteral("Amphetamine"));
}

void MasListParserTests::testNames_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<QString>("id");
    QTest::addColumn<QString>("name");

    QTest::newRow("padded name")
        << QStringLiteral("946798523  Sleep Control Centre            (2.27)")
        << QStringLiteral("946798523") << QStringLiteral("Sleep Control Centre");
    QTest::newRow("parentheses in name")
        << QStringLiteral("1352211125  Tide Alert (NOAA) - Tide Chart  (3.2)")
        << QStringLiteral("1352211125") << QStringLiteral("Tide Alert (NOAA) - Tide Chart");
    QTest::newRow("trademark glyph")
        << QStringLiteral("  1491074310  Tetris®                         (7.3.3)  ")
        << QStringLiteral("1491074310") << QStringLiteral("Tetris®");
    QTest::newRow("symbol glyph")
        << QStringLiteral("   381471023  Flashlight Ⓞ                    (2.3.5) ")
        << QStringLiteral("381471023") << QStringLiteral("Flashlight Ⓞ");
    QTest::newRow("numeric version")
        << QStringLiteral("   890378044  Toy Blast                       (21004) ")
        << QStringLiteral("890378044") << QStringLiteral("Toy Blast");
}

void MasListParserTests::testNames()
{
    QFETCH(QString, line);
    QFETCH(QString, id);
    QFETCH(QString, name);

    const auto app = hostform::parseMasListLine(line.toStdString());
    QCOMPARE(QString::fromStdString(app.id), id);
    QCOMPARE(QString::fromStdString(app.name), name);
}

void MasListParserTests::testVersionIsCaptured()
{
    const auto app = hostform::parseMasListLine("1352211125  Tide Alert (NOAA) - Tide Chart  (3.2)");
    QCOMPARE(QString::fromStdString(app.version), QStringLiteral("3.2"));
}

void MasListParserTests::testMissingVersionFails()
{
    try {
        hostform::parseMasListLine("937984704   Amphetamine");
        QFAIL("expected a parse failure");
    } catch (const hostform::ReconcileError &ex) {
        QCOMPARE(ex.kind(), hostform::ErrorKind::ParseFailed);
    }
}

void MasListParserTests::testMissingIdFails()
{
    QVERIFY_THROWS_EXCEPTION(hostform::ReconcileError,
                             hostform::parseMasListLine("Amphetamine  (5.3.2)"));
}

void MasListParserTests::testEmptyNameFails()
{
    QVERIFY_THROWS_EXCEPTION(hostform::ReconcileError,
                             hostform::parseMasListLine("937984704  (5.3.2)"));
}

void MasListParserTests::testFullListing()
{
    const std::string output =
        "937984704   Amphetamine  (5.3.2)\n"
        "1352211125  Tide Alert (NOAA) - Tide Chart  (3.2)\n"
        "\n";

    const auto apps = hostform::parseMasList(output);
    QCOMPARE(apps.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(apps.at(1).id), QStringLiteral("1352211125"));
}

void MasListParserTests::testMalformedLineFailsWholeListing()
{
    const std::string output =
        "937984704   Amphetamine  (5.3.2)\n"
        "No installed apps found\n";

    QVERIFY_THROWS_EXCEPTION(hostform::ReconcileError, hostform::parseMasList(output));
}

QTEST_MAIN(MasListParserTests)
#include "test_mas_list_parser.moc"
