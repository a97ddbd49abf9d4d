// reportwriter.h
// Component Catalogue - paginated catalogue report (PDF or printer)
// Copyright (c) 2026 Component Catalogue Project

#ifndef REPORTWRITER_H
#define REPORTWRITER_H

#include "component.h"

#include <QPageLayout>
#include <QPageSize>
#include <QString>
#include <QVector>

class QPagedPaintDevice;

struct ReportOptions {
    QString                  title = QStringLiteral("Crafting Components Catalogue");
    bool                     includeCategorySummary = true;
    QPageLayout::Orientation orientation = QPageLayout::Landscape;
    QPageSize::PageSizeId    pageSize = QPageSize::A4;
};

/// Totals over a set of components.
struct ReportTotals {
    QString category;        // empty for the grand total
    int     components = 0;
    qint64  items = 0;
    double  value = 0.0;
};

/**
 * @brief Renders a component list as a paginated table.
 *
 * Every page carries the title and a "Page N of M" footer; the first page
 * also shows the generation date and catalogue totals.  The table header is
 * repeated on each page, and an optional per-category summary follows the
 * table.  Cell text that does not fit is elided.
 */
class ReportWriter
{
public:
    explicit ReportWriter(const ReportOptions &options = ReportOptions());

    /// Render to a PDF file.  The file is only replaced once the whole
    /// document has been produced.
    bool writePdf(const QVector<Component> &components, const QString &path);

    /// Render onto any paged device (QPdfWriter, QPrinter).  The device's
    /// page layout is used as-is.
    bool render(const QVector<Component> &components, QPagedPaintDevice *device);

    /// Pages produced by the last successful render.
    int pageCount() const;

    QString errorString() const;

    static ReportTotals totals(const QVector<Component> &components);

    /// Per-category totals, sorted by category; empty category is reported
    /// as "Uncategorized".
    static QVector<ReportTotals> categoryTotals(const QVector<Component> &components);

private:
    ReportOptions m_options;
    int           m_pageCount = 0;
    QString       m_errorString;
};

#endif // REPORTWRITER_H
