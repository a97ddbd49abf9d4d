// spreadsheetio.h
// Component Catalogue - delimited spreadsheet import/export

#ifndef SPREADSHEETIO_H
#define SPREADSHEETIO_H

#include "component.h"

#include <QList>
#include <QString>
#include <QStringList>
#include <QVector>

/// One header cell of an imported file and the field it was read into.
struct ColumnMapping {
    QString        header;
    ComponentField field;
};

/**
 * @brief Result of reading a spreadsheet file.
 *
 * ok == false means the whole file was rejected (unreadable, empty,
 * malformed quoting, or no Name column) and errorString says why.
 * Rows rejected individually (empty name, negative amounts) are only
 * counted in skippedRows.
 */
struct ImportResult {
    bool               ok = false;
    QString            errorString;
    QVector<Component> components;
    int                rowsRead = 0;      // non-blank data rows, skipped ones included
    int                skippedRows = 0;
    QVector<ColumnMapping> columns;      // recognised headers, in file order
    QStringList        ignoredColumns;   // headers that matched no field
};

/**
 * @brief Stateless converter between delimited text files and components.
 *
 * Files are UTF-8 with RFC 4180 quoting.  Tab is the delimiter for
 * .tsv/.tab files, comma for everything else.  Export always writes the
 * header row and the fixed column order of ComponentField.
 */
class SpreadsheetIO
{
public:
    /// Read and parse @p path.
    static ImportResult importFile(const QString &path,
                                   const QString &defaultUnit = Component::defaultUnit());

    /// Parse already-loaded file contents.
    static ImportResult parse(const QString &text,
                              QChar delimiter = QLatin1Char(','),
                              const QString &defaultUnit = Component::defaultUnit());

    /// Write @p components to @p path, replacing the file atomically.
    /// Returns false and fills @p errorString if the file cannot be written.
    static bool exportFile(const QVector<Component> &components,
                           const QString &path,
                           QString *errorString = nullptr);

    /// Write an import template: the header row and one sample component.
    static bool writeTemplate(const QString &path, QString *errorString = nullptr);

    /// The component written as the template's sample row.
    static Component sampleComponent();

    /// Multi-line preview of a parsed file for the import confirmation:
    /// recognised and ignored columns, rows read and rows skipped.
    static QString describe(const ImportResult &result);

    /// Render @p components as delimited text (header row included).
    static QString format(const QVector<Component> &components,
                          QChar delimiter = QLatin1Char(','));

    /// Delimiter implied by the file extension.
    static QChar delimiterForPath(const QString &path);

    /// Map a header cell to a field (case-insensitive, aliases accepted).
    /// Returns -1 for unrecognised headers.
    static int fieldForHeader(const QString &header);

    /// Split delimited text into rows of cells.  Quoted cells may contain
    /// delimiters, doubled quotes and line breaks.  Sets @p ok to false on
    /// an unterminated quoted cell.
    static QList<QStringList> splitRows(const QString &text, QChar delimiter, bool *ok = nullptr);

private:
    static QString quoteCell(const QString &cell, QChar delimiter);
};

#endif // SPREADSHEETIO_H
