// reportwriter.cpp
// Component Catalogue - paginated catalogue report (PDF or printer)
// Copyright (c) 2026 Component Catalogue Project

#include "reportwriter.h"
#include "cataloguecore_debug.h"

#include <KLocalizedString>

#include <QBuffer>
#include <QDateTime>
#include <QFontMetricsF>
#include <QLocale>
#include <QMap>
#include <QPagedPaintDevice>
#include <QPainter>
#include <QPdfWriter>
#include <QSaveFile>

#include <algorithm>

namespace
{
// One horizontal band of the report body
struct ReportLine {
    enum Kind {
        ComponentHeader,
        ComponentRow,
        SummaryTitle,
        SummaryHeader,
        SummaryRow,
        EmptyNotice
    };
    Kind kind;
    int  index;   // row in the component or category list
};

struct Column {
    QString       title;
    qreal         fraction;   // share of the page width
    Qt::Alignment alignment;
};

// Fractions add up to 1.0
QVector<Column> componentColumns()
{
    return {
        {i18n("Name"),        0.14, Qt::AlignLeft},
        {i18n("Category"),    0.10, Qt::AlignLeft},
        {i18n("Description"), 0.16, Qt::AlignLeft},
        {i18n("Qty"),         0.06, Qt::AlignRight},
        {i18n("Unit"),        0.06, Qt::AlignLeft},
        {i18n("Cost/Unit"),   0.08, Qt::AlignRight},
        {i18n("Total"),       0.08, Qt::AlignRight},
        {i18n("Supplier"),    0.10, Qt::AlignLeft},
        {i18n("Location"),    0.09, Qt::AlignLeft},
        {i18n("Notes"),       0.13, Qt::AlignLeft},
    };
}

QVector<Column> summaryColumns()
{
    return {
        {i18n("Category"),    0.40, Qt::AlignLeft},
        {i18n("Components"),  0.20, Qt::AlignRight},
        {i18n("Items"),       0.20, Qt::AlignRight},
        {i18n("Total Value"), 0.20, Qt::AlignRight},
    };
}

QStringList componentCells(const Component &c, const QLocale &locale)
{
    return {
        c.name,
        c.category,
        c.description,
        locale.toString(c.quantity),
        c.unit,
        locale.toCurrencyString(c.costPerUnit),
        locale.toCurrencyString(c.totalValue()),
        c.supplier,
        c.location,
        c.notes,
    };
}

QStringList summaryCells(const ReportTotals &t, const QLocale &locale)
{
    return {
        t.category,
        locale.toString(t.components),
        locale.toString(t.items),
        locale.toCurrencyString(t.value),
    };
}

// Font sizes are in points, so they scale with the device resolution.
QFont makeFont(int pointSize, bool bold)
{
    QFont font;
    font.setPointSize(pointSize);
    font.setBold(bold);
    return font;
}

// Line height for a font on a device, never smaller than the nominal
// point size (some headless platforms report empty metrics).
qreal lineHeight(const QFont &font, QPaintDevice *device)
{
    const qreal measured = QFontMetricsF(font, device).height();
    const qreal nominal = device->logicalDpiY() * font.pointSizeF() / 72.0;
    return std::max(measured, nominal);
}

void drawRow(QPainter &painter, const QVector<Column> &columns, const QStringList &cells,
             qreal top, qreal width, qreal height, const QBrush &background)
{
    const QFontMetricsF fm(painter.font(), painter.device());
    const qreal padding = height * 0.2;

    qreal left = 0.0;
    for (int i = 0; i < columns.size(); ++i) {
        const QRectF cellRect(left, top, width * columns.at(i).fraction, height);
        painter.fillRect(cellRect, background);
        painter.drawRect(cellRect);

        const QRectF textRect = cellRect.adjusted(padding, 0, -padding, 0);
        const QString text = fm.elidedText(cells.value(i).simplified(), Qt::ElideRight,
                                           textRect.width());
        painter.drawText(textRect, columns.at(i).alignment | Qt::AlignVCenter, text);
        left += cellRect.width();
    }
}
}

ReportWriter::ReportWriter(const ReportOptions &options)
    : m_options(options)
{
}

int ReportWriter::pageCount() const
{
    return m_pageCount;
}

QString ReportWriter::errorString() const
{
    return m_errorString;
}

// ═════════════════════════════════════════════════════════════
// Totals
// ═════════════════════════════════════════════════════════════

ReportTotals ReportWriter::totals(const QVector<Component> &components)
{
    ReportTotals t;
    for (const Component &c : components) {
        ++t.components;
        t.items += c.quantity;
        t.value += c.totalValue();
    }
    return t;
}

QVector<ReportTotals> ReportWriter::categoryTotals(const QVector<Component> &components)
{
    const QString uncategorized = i18n("Uncategorized");

    QMap<QString, ReportTotals> byCategory;
    for (const Component &c : components) {
        const QString category = c.category.trimmed().isEmpty() ? uncategorized : c.category;
        ReportTotals &t = byCategory[category];
        t.category = category;
        ++t.components;
        t.items += c.quantity;
        t.value += c.totalValue();
    }
    return QVector<ReportTotals>(byCategory.cbegin(), byCategory.cend());
}

// ═════════════════════════════════════════════════════════════
// Output
// ═════════════════════════════════════════════════════════════

bool ReportWriter::writePdf(const QVector<Component> &components, const QString &path)
{
    m_errorString.clear();

    // Render into memory first so a failure never leaves a partial file
    QBuffer buffer;
    if (!buffer.open(QIODevice::WriteOnly)) {
        m_errorString = i18n("Cannot prepare the report: %1", buffer.errorString());
        qCWarning(CATALOGUE_CORE_LOG) << m_errorString;
        return false;
    }
    {
        QPdfWriter writer(&buffer);
        writer.setTitle(m_options.title);
        writer.setCreator(QStringLiteral("Component Catalogue"));
        writer.setResolution(300);

        const QPageLayout layout(QPageSize(m_options.pageSize), m_options.orientation,
                                 QMarginsF(12, 12, 12, 12), QPageLayout::Millimeter);
        if (!writer.setPageLayout(layout)) {
            m_errorString = i18n("The page layout of the report is invalid.");
            qCWarning(CATALOGUE_CORE_LOG) << m_errorString;
            return false;
        }

        if (!render(components, &writer))
            return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        m_errorString = i18n("Cannot write %1: %2", path, file.errorString());
        qCWarning(CATALOGUE_CORE_LOG) << m_errorString;
        return false;
    }

    if (file.write(buffer.data()) != buffer.size()) {
        m_errorString = i18n("Cannot write %1: %2", path, file.errorString());
        file.cancelWriting();
        qCWarning(CATALOGUE_CORE_LOG) << m_errorString;
        return false;
    }

    if (!file.commit()) {
        m_errorString = i18n("Cannot write %1: %2", path, file.errorString());
        qCWarning(CATALOGUE_CORE_LOG) << m_errorString;
        return false;
    }

    qCDebug(CATALOGUE_CORE_LOG) << "Wrote report" << path << "with" << m_pageCount << "page(s)";
    return true;
}

bool ReportWriter::render(const QVector<Component> &components, QPagedPaintDevice *device)
{
    m_errorString.clear();
    m_pageCount = 0;

    QPainter painter;
    if (!device || !painter.begin(device)) {
        m_errorString = i18n("Cannot start rendering the report.");
        qCWarning(CATALOGUE_CORE_LOG) << m_errorString;
        return false;
    }

    const QLocale locale;
    const qreal pageWidth  = device->width();
    const qreal pageHeight = device->height();

    const QFont titleFont  = makeFont(16, true);
    const QFont textFont   = makeFont(8, false);
    const QFont headerFont = makeFont(8, true);
    const QFont headingFont = makeFont(11, true);

    const qreal rowHeight    = lineHeight(textFont, device) * 1.5;
    const qreal titleHeight  = lineHeight(titleFont, device) * 1.8;
    const qreal footerHeight = rowHeight * 1.5;
    const qreal introHeight  = rowHeight * 5;   // date + three totals + gap

    const QVector<Column> tableColumns = componentColumns();
    const QVector<Column> totalsColumns = summaryColumns();
    const QVector<ReportTotals> perCategory = categoryTotals(components);
    const ReportTotals grandTotal = totals(components);

    // ── Body lines ──
    QVector<ReportLine> lines;
    if (components.isEmpty()) {
        lines.append({ReportLine::EmptyNotice, 0});
    } else {
        for (int i = 0; i < components.size(); ++i)
            lines.append({ReportLine::ComponentRow, i});
        if (m_options.includeCategorySummary) {
            lines.append({ReportLine::SummaryTitle, 0});
            for (int i = 0; i < perCategory.size(); ++i)
                lines.append({ReportLine::SummaryRow, i});
        }
    }

    auto heightOf = [rowHeight](ReportLine::Kind kind) {
        return kind == ReportLine::SummaryTitle ? rowHeight * 2.5 : rowHeight;
    };

    // ── Pagination ──
    QVector<QVector<ReportLine>> pages(1);
    const qreal bodyBottom = pageHeight - footerHeight;
    qreal y = titleHeight + introHeight;

    for (const ReportLine &line : lines) {
        QVector<ReportLine> *page = &pages.last();

        // Tables repeat their header at the top of every page they touch
        auto headerFor = [&page](const ReportLine &l) -> int {
            const ReportLine::Kind last = page->isEmpty() ? ReportLine::EmptyNotice
                                                          : page->last().kind;
            if (l.kind == ReportLine::ComponentRow
                && last != ReportLine::ComponentRow && last != ReportLine::ComponentHeader)
                return ReportLine::ComponentHeader;
            if (l.kind == ReportLine::SummaryRow
                && last != ReportLine::SummaryRow && last != ReportLine::SummaryHeader)
                return ReportLine::SummaryHeader;
            return -1;
        };

        qreal needed = heightOf(line.kind);
        if (headerFor(line) >= 0)
            needed += rowHeight;
        if (line.kind == ReportLine::SummaryTitle)
            needed += rowHeight * 2;   // keep the title with its header and first row

        if (y + needed > bodyBottom && !page->isEmpty()) {
            pages.append(QVector<ReportLine>());
            page = &pages.last();
            y = titleHeight;
        }

        const int header = headerFor(line);
        if (header >= 0) {
            page->append({static_cast<ReportLine::Kind>(header), 0});
            y += rowHeight;
        }
        page->append(line);
        y += heightOf(line.kind);
    }

    m_pageCount = pages.size();

    // ── Drawing ──
    const QBrush headerBrush(QColor(200, 200, 200));
    const QBrush evenBrush(Qt::white);
    const QBrush oddBrush(QColor(240, 240, 240));
    const QPen gridPen(QColor(120, 120, 120), 0);

    for (int p = 0; p < pages.size(); ++p) {
        if (p > 0 && !device->newPage()) {
            m_errorString = i18n("Cannot start page %1 of the report.", p + 1);
            qCWarning(CATALOGUE_CORE_LOG) << m_errorString;
            painter.end();
            m_pageCount = 0;
            return false;
        }

        painter.setPen(Qt::black);
        painter.setFont(titleFont);
        painter.drawText(QRectF(0, 0, pageWidth, titleHeight),
                         Qt::AlignHCenter | Qt::AlignTop, m_options.title);

        qreal top = titleHeight;
        if (p == 0) {
            painter.setFont(textFont);
            const QStringList intro = {
                i18n("Generated on %1",
                     locale.toString(QDateTime::currentDateTime(), QLocale::LongFormat)),
                i18n("Total components: %1", locale.toString(grandTotal.components)),
                i18n("Total items: %1", locale.toString(grandTotal.items)),
                i18n("Total estimated value: %1", locale.toCurrencyString(grandTotal.value)),
            };
            for (const QString &text : intro) {
                painter.drawText(QRectF(0, top, pageWidth, rowHeight),
                                 Qt::AlignLeft | Qt::AlignVCenter, text);
                top += rowHeight;
            }
            top += rowHeight;
        }

        for (const ReportLine &line : pages.at(p)) {
            painter.setPen(gridPen);
            switch (line.kind) {
            case ReportLine::ComponentHeader: {
                QStringList titles;
                for (const Column &column : tableColumns)
                    titles << column.title;
                painter.setFont(headerFont);
                drawRow(painter, tableColumns, titles, top, pageWidth, rowHeight, headerBrush);
                break;
            }
            case ReportLine::ComponentRow:
                painter.setFont(textFont);
                drawRow(painter, tableColumns, componentCells(components.at(line.index), locale),
                        top, pageWidth, rowHeight, line.index % 2 ? oddBrush : evenBrush);
                break;
            case ReportLine::SummaryTitle:
                painter.setPen(Qt::black);
                painter.setFont(headingFont);
                painter.drawText(QRectF(0, top, pageWidth, heightOf(line.kind)),
                                 Qt::AlignLeft | Qt::AlignBottom, i18n("Summary by Category"));
                break;
            case ReportLine::SummaryHeader: {
                QStringList titles;
                for (const Column &column : totalsColumns)
                    titles << column.title;
                painter.setFont(headerFont);
                drawRow(painter, totalsColumns, titles, top, pageWidth, rowHeight, headerBrush);
                break;
            }
            case ReportLine::SummaryRow:
                painter.setFont(textFont);
                drawRow(painter, totalsColumns, summaryCells(perCategory.at(line.index), locale),
                        top, pageWidth, rowHeight, line.index % 2 ? oddBrush : evenBrush);
                break;
            case ReportLine::EmptyNotice:
                painter.setPen(Qt::black);
                painter.setFont(textFont);
                painter.drawText(QRectF(0, top, pageWidth, rowHeight),
                                 Qt::AlignLeft | Qt::AlignVCenter,
                                 i18n("No components found in the catalogue."));
                break;
            }
            top += heightOf(line.kind);
        }

        painter.setPen(Qt::black);
        painter.setFont(textFont);
        painter.drawText(QRectF(0, pageHeight - footerHeight, pageWidth, footerHeight),
                         Qt::AlignHCenter | Qt::AlignBottom,
                         i18n("Page %1 of %2", p + 1, pages.size()));
    }

    if (!painter.end()) {
        m_errorString = i18n("Cannot finish rendering the report.");
        qCWarning(CATALOGUE_CORE_LOG) << m_errorString;
        m_pageCount = 0;
        return false;
    }
    return true;
}
