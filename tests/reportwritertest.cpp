// reportwritertest.cpp
// Component Catalogue - tests for the paginated report
// Copyright (c) 2026 Component Catalogue Project

#include "reportwriter.h"

#include <QFile>
#include <QTemporaryDir>
#include <QTest>

namespace
{
QVector<Component> makeComponents(int count)
{
    QVector<Component> result;
    for (int i = 0; i < count; ++i) {
        Component c;
        c.id = i + 1;
        c.name = QStringLiteral("Component %1").arg(i + 1, 3, 10, QLatin1Char('0'));
        c.category = (i % 3 == 0) ? QStringLiteral("Hardware")
                   : (i % 3 == 1) ? QStringLiteral("Textile")
                                  : QString();
        c.description = QStringLiteral("A fairly long description that will not fit its column "
                                       "and has to be elided by the report writer");
        c.quantity = i;
        c.costPerUnit = 0.5;
        c.supplier = QStringLiteral("Supplier");
        c.location = QStringLiteral("Shelf %1").arg(i % 7);
        result << c;
    }
    return result;
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QByteArray();
    return file.readAll();
}
}

class ReportWriterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void writesPdfFile();
    void manyComponentsSpanSeveralPages();
    void emptyListGivesOnePage();
    void portraitFitsMoreRowsPerPage();
    void unwritablePathFails();
    void nullDeviceFails();
    void totalsSumQuantityAndValue();
    void categoryTotalsAreSortedAndNamed();

private:
    QTemporaryDir m_dir;
};

void ReportWriterTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
}

void ReportWriterTest::writesPdfFile()
{
    const QString path = m_dir.filePath(QStringLiteral("small.pdf"));

    ReportWriter writer;
    QVERIFY2(writer.writePdf(makeComponents(3), path), qPrintable(writer.errorString()));
    QCOMPARE(writer.pageCount(), 1);
    QVERIFY(writer.errorString().isEmpty());

    const QByteArray data = readFile(path);
    QVERIFY(data.startsWith("%PDF"));
}

void ReportWriterTest::manyComponentsSpanSeveralPages()
{
    const QString path = m_dir.filePath(QStringLiteral("large.pdf"));

    ReportWriter writer;
    QVERIFY2(writer.writePdf(makeComponents(200), path), qPrintable(writer.errorString()));
    QVERIFY(writer.pageCount() > 1);
    QVERIFY(readFile(path).startsWith("%PDF"));
}

void ReportWriterTest::emptyListGivesOnePage()
{
    const QString path = m_dir.filePath(QStringLiteral("empty.pdf"));

    ReportWriter writer;
    QVERIFY(writer.writePdf({}, path));
    QCOMPARE(writer.pageCount(), 1);
    QVERIFY(QFile::exists(path));
}

void ReportWriterTest::portraitFitsMoreRowsPerPage()
{
    ReportOptions landscape;
    landscape.orientation = QPageLayout::Landscape;
    landscape.includeCategorySummary = false;

    ReportOptions portrait = landscape;
    portrait.orientation = QPageLayout::Portrait;

    const QVector<Component> components = makeComponents(150);

    ReportWriter wide(landscape);
    QVERIFY(wide.writePdf(components, m_dir.filePath(QStringLiteral("landscape.pdf"))));

    ReportWriter tall(portrait);
    QVERIFY(tall.writePdf(components, m_dir.filePath(QStringLiteral("portrait.pdf"))));

    QVERIFY(tall.pageCount() < wide.pageCount());
}

void ReportWriterTest::unwritablePathFails()
{
    const QString path = m_dir.filePath(QStringLiteral("no/such/directory/report.pdf"));

    ReportWriter writer;
    QVERIFY(!writer.writePdf(makeComponents(5), path));
    QVERIFY(!writer.errorString().isEmpty());
    QVERIFY(!QFile::exists(path));
}

void ReportWriterTest::nullDeviceFails()
{
    ReportWriter writer;
    QVERIFY(!writer.render(makeComponents(1), nullptr));
    QVERIFY(!writer.errorString().isEmpty());
    QCOMPARE(writer.pageCount(), 0);
}

void ReportWriterTest::totalsSumQuantityAndValue()
{
    const ReportTotals totals = ReportWriter::totals(makeComponents(4));   // quantities 0..3
    QCOMPARE(totals.components, 4);
    QCOMPARE(totals.items, qint64(6));
    QCOMPARE(totals.value, 3.0);

    const ReportTotals none = ReportWriter::totals({});
    QCOMPARE(none.components, 0);
    QCOMPARE(none.value, 0.0);
}

void ReportWriterTest::categoryTotalsAreSortedAndNamed()
{
    // i % 3: 0 Hardware, 1 Textile, 2 uncategorized
    const QVector<ReportTotals> totals = ReportWriter::categoryTotals(makeComponents(6));
    QCOMPARE(totals.size(), 3);

    QCOMPARE(totals.at(0).category, QStringLiteral("Hardware"));
    QCOMPARE(totals.at(0).components, 2);
    QCOMPARE(totals.at(0).items, qint64(0 + 3));

    QCOMPARE(totals.at(1).category, QStringLiteral("Textile"));
    QCOMPARE(totals.at(1).items, qint64(1 + 4));

    QCOMPARE(totals.at(2).category, QStringLiteral("Uncategorized"));
    QCOMPARE(totals.at(2).items, qint64(2 + 5));
    QCOMPARE(totals.at(2).value, 3.5);
}

QTEST_MAIN(ReportWriterTest)

#include "reportwritertest.moc"
