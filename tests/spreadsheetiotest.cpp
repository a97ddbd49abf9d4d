// spreadsheetiotest.cpp
// Component Catalogue - tests for spreadsheet import/export
// Copyright (c) 2026 Component Catalogue Project

#include "spreadsheetio.h"

#include <QFile>
#include <QTemporaryDir>
#include <QTest>

class SpreadsheetIOTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void rowWithoutNameIsSkipped();
    void headersMatchAliasesIgnoringCase();
    void firstMatchingColumnWins();
    void missingNameColumnRejectsFile();
    void emptyFileIsRejected();
    void unterminatedQuoteIsRejected();
    void numbersAreCoerced_data();
    void numbersAreCoerced();
    void negativeAmountsSkipRow();
    void blankLinesAreNotCounted();
    void missingColumnsGetDefaults();
    void quotedCellsAreUnescaped();
    void byteOrderMarkIsStripped();
    void tabDelimiterForTsv();
    void exportWritesFixedHeader();
    void exportThenImportKeepsValues_data();
    void exportThenImportKeepsValues();
    void exportToUnwritablePathFails();
    void importMissingFileFails();
    void previewListsColumnsAndRows();
    void templateReadsBackAsSampleComponent();
    void templateToUnwritablePathFails();
};

void SpreadsheetIOTest::rowWithoutNameIsSkipped()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        "Name,Category,Quantity\n"
        "Bolt,,10\n"
        ",Hardware,\n"));

    QVERIFY2(result.ok, qPrintable(result.errorString));
    QCOMPARE(result.components.size(), 1);
    QCOMPARE(result.components.first().name, QStringLiteral("Bolt"));
    QCOMPARE(result.components.first().quantity, 10);
    QCOMPARE(result.skippedRows, 1);
}

void SpreadsheetIOTest::headersMatchAliasesIgnoringCase()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        " Component NAME ,QTY,price,Vendor,Storage,Colour\n"
        "Bead,40,0.05,Craft Co,Box 2,Red\n"));

    QVERIFY(result.ok);
    QCOMPARE(result.components.size(), 1);

    const Component &c = result.components.first();
    QCOMPARE(c.name, QStringLiteral("Bead"));
    QCOMPARE(c.quantity, 40);
    QCOMPARE(c.costPerUnit, 0.05);
    QCOMPARE(c.supplier, QStringLiteral("Craft Co"));
    QCOMPARE(c.location, QStringLiteral("Box 2"));
    QCOMPARE(result.ignoredColumns, QStringList({QStringLiteral("Colour")}));

    QCOMPARE(SpreadsheetIO::fieldForHeader(QStringLiteral("Cost per Unit")),
             static_cast<int>(ComponentField::CostPerUnit));
    QCOMPARE(SpreadsheetIO::fieldForHeader(QStringLiteral("colour")), -1);
}

void SpreadsheetIOTest::firstMatchingColumnWins()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        "Name,Price,Cost\n"
        "Bead,1.5,9\n"));

    QVERIFY(result.ok);
    QCOMPARE(result.components.first().costPerUnit, 1.5);
    QCOMPARE(result.columns.size(), 2);
    QCOMPARE(result.columns.at(1).header, QStringLiteral("Price"));
    QCOMPARE(result.ignoredColumns, QStringList({QStringLiteral("Cost")}));
}

void SpreadsheetIOTest::missingNameColumnRejectsFile()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        "Category,Quantity\n"
        "Hardware,3\n"));

    QVERIFY(!result.ok);
    QVERIFY(!result.errorString.isEmpty());
    QVERIFY(result.components.isEmpty());
}

void SpreadsheetIOTest::emptyFileIsRejected()
{
    QVERIFY(!SpreadsheetIO::parse(QString()).ok);
    QVERIFY(!SpreadsheetIO::parse(QStringLiteral("\n\n  \n")).ok);
}

void SpreadsheetIOTest::unterminatedQuoteIsRejected()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        "Name,Notes\n"
        "Bolt,\"never closed\n"));

    QVERIFY(!result.ok);
    QVERIFY(!result.errorString.isEmpty());
}

void SpreadsheetIOTest::numbersAreCoerced_data()
{
    QTest::addColumn<QString>("quantity");
    QTest::addColumn<QString>("cost");
    QTest::addColumn<int>("expectedQuantity");
    QTest::addColumn<double>("expectedCost");

    QTest::newRow("plain")        << QStringLiteral("12")   << QStringLiteral("2.5") << 12 << 2.5;
    QTest::newRow("empty")        << QString()              << QString()             << 0  << 0.0;
    QTest::newRow("text")         << QStringLiteral("lots") << QStringLiteral("n/a") << 0  << 0.0;
    QTest::newRow("fractional")   << QStringLiteral("3.7")  << QStringLiteral("1")   << 3  << 1.0;
}

void SpreadsheetIOTest::numbersAreCoerced()
{
    QFETCH(QString, quantity);
    QFETCH(QString, cost);
    QFETCH(int, expectedQuantity);
    QFETCH(double, expectedCost);

    const ImportResult result = SpreadsheetIO::parse(
        QStringLiteral("Name,Quantity,Cost per Unit\nBolt,%1,%2\n").arg(quantity, cost));

    QVERIFY(result.ok);
    QCOMPARE(result.components.size(), 1);
    QCOMPARE(result.components.first().quantity, expectedQuantity);
    QCOMPARE(result.components.first().costPerUnit, expectedCost);
}

void SpreadsheetIOTest::negativeAmountsSkipRow()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        "Name,Quantity,Cost per Unit\n"
        "Bolt,-2,1\n"
        "Nut,2,-1\n"
        "Washer,2,1\n"));

    QVERIFY(result.ok);
    QCOMPARE(result.components.size(), 1);
    QCOMPARE(result.components.first().name, QStringLiteral("Washer"));
    QCOMPARE(result.skippedRows, 2);
}

void SpreadsheetIOTest::blankLinesAreNotCounted()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        "\n"
        "Name,Quantity\n"
        "\n"
        "Bolt,1\n"
        ",\n"
        "Nut,2\n"
        "\n"));

    QVERIFY(result.ok);
    QCOMPARE(result.components.size(), 2);
    QCOMPARE(result.skippedRows, 0);
}

void SpreadsheetIOTest::missingColumnsGetDefaults()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral("Name\nBolt\n"),
                                                     QLatin1Char(','), QStringLiteral("grams"));

    QVERIFY(result.ok);
    const Component &c = result.components.first();
    QCOMPARE(c.quantity, 0);
    QCOMPARE(c.costPerUnit, 0.0);
    QCOMPARE(c.unit, QStringLiteral("grams"));
    QVERIFY(c.category.isEmpty());
    QVERIFY(c.notes.isEmpty());
    QVERIFY(!c.isValid());
}

void SpreadsheetIOTest::quotedCellsAreUnescaped()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        "Name,Description,Notes\r\n"
        "\"Bolt, M4\",\"He said \"\"tight\"\"\",\"first\nsecond\"\r\n"));

    QVERIFY(result.ok);
    QCOMPARE(result.components.size(), 1);

    const Component &c = result.components.first();
    QCOMPARE(c.name, QStringLiteral("Bolt, M4"));
    QCOMPARE(c.description, QStringLiteral("He said \"tight\""));
    QCOMPARE(c.notes, QStringLiteral("first\nsecond"));
}

void SpreadsheetIOTest::byteOrderMarkIsStripped()
{
    const QString text = QString(QChar(0xFEFF)) + QStringLiteral("Name,Quantity\nBolt,3\n");
    const ImportResult result = SpreadsheetIO::parse(text);

    QVERIFY(result.ok);
    QCOMPARE(result.components.size(), 1);
    QVERIFY(result.ignoredColumns.isEmpty());
    QCOMPARE(result.columns.first().header, QStringLiteral("Name"));
}

void SpreadsheetIOTest::tabDelimiterForTsv()
{
    QCOMPARE(SpreadsheetIO::delimiterForPath(QStringLiteral("/tmp/parts.tsv")), QChar(u'\t'));
    QCOMPARE(SpreadsheetIO::delimiterForPath(QStringLiteral("/tmp/parts.TAB")), QChar(u'\t'));
    QCOMPARE(SpreadsheetIO::delimiterForPath(QStringLiteral("/tmp/parts.csv")), QChar(u','));

    const ImportResult result = SpreadsheetIO::parse(
        QStringLiteral("Name\tNotes\nBolt\tcomma, inside\n"), QLatin1Char('\t'));
    QVERIFY(result.ok);
    QCOMPARE(result.components.first().notes, QStringLiteral("comma, inside"));
}

void SpreadsheetIOTest::exportWritesFixedHeader()
{
    QCOMPARE(SpreadsheetIO::format({}),
             QStringLiteral("Name,Category,Description,Quantity,Unit,Cost per Unit,"
                            "Supplier,Location,Notes\r\n"));

    Component c;
    c.name = QStringLiteral("Bolt, M4");
    c.quantity = 3;
    c.costPerUnit = 0.25;
    const QStringList lines = SpreadsheetIO::format({c}).split(QStringLiteral("\r\n"));
    QCOMPARE(lines.at(1), QStringLiteral("\"Bolt, M4\",,,3,pieces,0.25,,,"));
}

void SpreadsheetIOTest::exportThenImportKeepsValues_data()
{
    QTest::addColumn<QString>("fileName");

    QTest::newRow("csv") << QStringLiteral("catalogue.csv");
    QTest::newRow("tsv") << QStringLiteral("catalogue.tsv");
}

void SpreadsheetIOTest::exportThenImportKeepsValues()
{
    QFETCH(QString, fileName);

    QVector<Component> original;

    Component bolt;
    bolt.id = 7;
    bolt.name = QStringLiteral("Bolt M4");
    bolt.category = QStringLiteral("Hardware");
    bolt.description = QStringLiteral("Zinc plated, 20 mm");
    bolt.quantity = 120;
    bolt.unit = QStringLiteral("pieces");
    bolt.costPerUnit = 0.1;
    bolt.supplier = QStringLiteral("Fasteners \"R\" Us");
    bolt.location = QStringLiteral("Drawer\t3");
    bolt.notes = QStringLiteral("Reorder at 20\nCheck thread pitch");
    original << bolt;

    Component felt;
    felt.id = 9;
    felt.name = QStringLiteral("Filz grün");
    felt.quantity = 0;
    felt.unit = QStringLiteral("sheets");
    felt.costPerUnit = 12.345;
    original << felt;

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(fileName);

    QString error;
    QVERIFY2(SpreadsheetIO::exportFile(original, path, &error), qPrintable(error));

    const ImportResult result = SpreadsheetIO::importFile(path);
    QVERIFY2(result.ok, qPrintable(result.errorString));
    QCOMPARE(result.skippedRows, 0);
    QVERIFY(result.ignoredColumns.isEmpty());
    QCOMPARE(result.components.size(), original.size());

    for (int i = 0; i < original.size(); ++i) {
        QVERIFY2(result.components.at(i).hasSameValues(original.at(i)),
                 qPrintable(original.at(i).name));
        QVERIFY(!result.components.at(i).isValid());
    }
}

void SpreadsheetIOTest::exportToUnwritablePathFails()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("missing/subdir/out.csv"));

    QString error;
    QVERIFY(!SpreadsheetIO::exportFile({}, path, &error));
    QVERIFY(!error.isEmpty());
    QVERIFY(!QFile::exists(path));
}

void SpreadsheetIOTest::importMissingFileFails()
{
    QTemporaryDir dir;
    const ImportResult result = SpreadsheetIO::importFile(dir.filePath(QStringLiteral("absent.csv")));

    QVERIFY(!result.ok);
    QVERIFY(!result.errorString.isEmpty());
}

void SpreadsheetIOTest::previewListsColumnsAndRows()
{
    const ImportResult result = SpreadsheetIO::parse(QStringLiteral(
        "Name,Qty,Colour\n"
        "Bolt,3,Red\n"
        ",4,Blue\n"
        "\n"));

    QVERIFY(result.ok);
    QCOMPARE(result.rowsRead, 2);
    QCOMPARE(result.skippedRows, 1);
    QCOMPARE(result.components.size(), 1);

    QCOMPARE(result.columns.size(), 2);
    QCOMPARE(result.columns.at(0).field, ComponentField::Name);
    QCOMPARE(result.columns.at(1).header, QStringLiteral("Qty"));
    QCOMPARE(result.columns.at(1).field, ComponentField::Quantity);

    const QString preview = SpreadsheetIO::describe(result);
    QVERIFY(preview.contains(QStringLiteral("Qty -> Quantity")));
    QVERIFY(preview.contains(QStringLiteral("Colour")));
    QVERIFY(preview.contains(QStringLiteral("2 rows read")));
    QVERIFY(preview.contains(QStringLiteral("1 row will be skipped")));
    QVERIFY(preview.contains(QStringLiteral("1 component will be imported")));

    const ImportResult rejected = SpreadsheetIO::parse(QStringLiteral("Colour\nRed\n"));
    QVERIFY(!rejected.ok);
    QCOMPARE(SpreadsheetIO::describe(rejected), rejected.errorString);
}

void SpreadsheetIOTest::templateReadsBackAsSampleComponent()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("template.csv"));

    QString error;
    QVERIFY2(SpreadsheetIO::writeTemplate(path, &error), qPrintable(error));

    const ImportResult result = SpreadsheetIO::importFile(path);
    QVERIFY2(result.ok, qPrintable(result.errorString));
    QCOMPARE(result.columns.size(), static_cast<int>(ComponentField::COUNT));
    QVERIFY(result.ignoredColumns.isEmpty());
    QCOMPARE(result.rowsRead, 1);
    QCOMPARE(result.components.size(), 1);
    QVERIFY(result.components.first().hasSameValues(SpreadsheetIO::sampleComponent()));
}

void SpreadsheetIOTest::templateToUnwritablePathFails()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QString error;
    QVERIFY(!SpreadsheetIO::writeTemplate(dir.filePath(QStringLiteral("no/dir/template.csv")), &error));
    QVERIFY(!error.isEmpty());
}

QTEST_GUILESS_MAIN(SpreadsheetIOTest)

#include "spreadsheetiotest.moc"
