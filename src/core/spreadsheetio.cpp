// spreadsheetio.cpp
// Component Catalogue - delimited spreadsheet import/export

#include "spreadsheetio.h"
#include "cataloguecore_debug.h"

#include <KLocalizedString>

#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QLocale>
#include <QSaveFile>
#include <QTextStream>

#include <climits>
#include <cmath>

static const QChar QUOTE = QLatin1Char('"');
static const QLatin1String LINE_END("\r\n");

namespace
{
// Header spellings accepted on import, all lower-case
const QHash<QString, ComponentField> &headerAliases()
{
    static const QHash<QString, ComponentField> aliases = {
        {QStringLiteral("name"),           ComponentField::Name},
        {QStringLiteral("component name"), ComponentField::Name},
        {QStringLiteral("item name"),      ComponentField::Name},
        {QStringLiteral("category"),       ComponentField::Category},
        {QStringLiteral("type"),           ComponentField::Category},
        {QStringLiteral("group"),          ComponentField::Category},
        {QStringLiteral("description"),    ComponentField::Description},
        {QStringLiteral("desc"),           ComponentField::Description},
        {QStringLiteral("details"),        ComponentField::Description},
        {QStringLiteral("quantity"),       ComponentField::Quantity},
        {QStringLiteral("qty"),            ComponentField::Quantity},
        {QStringLiteral("amount"),         ComponentField::Quantity},
        {QStringLiteral("count"),          ComponentField::Quantity},
        {QStringLiteral("unit"),           ComponentField::Unit},
        {QStringLiteral("units"),          ComponentField::Unit},
        {QStringLiteral("measurement"),    ComponentField::Unit},
        {QStringLiteral("cost per unit"),  ComponentField::CostPerUnit},
        {QStringLiteral("cost/unit"),      ComponentField::CostPerUnit},
        {QStringLiteral("unit cost"),      ComponentField::CostPerUnit},
        {QStringLiteral("price"),          ComponentField::CostPerUnit},
        {QStringLiteral("cost"),           ComponentField::CostPerUnit},
        {QStringLiteral("supplier"),       ComponentField::Supplier},
        {QStringLiteral("vendor"),         ComponentField::Supplier},
        {QStringLiteral("source"),         ComponentField::Supplier},
        {QStringLiteral("location"),       ComponentField::Location},
        {QStringLiteral("storage"),        ComponentField::Location},
        {QStringLiteral("place"),          ComponentField::Location},
        {QStringLiteral("notes"),          ComponentField::Notes},
        {QStringLiteral("comments"),       ComponentField::Notes},
        {QStringLiteral("remarks"),        ComponentField::Notes},
    };
    return aliases;
}

bool isBlankRow(const QStringList &row)
{
    for (const QString &cell : row) {
        if (!cell.trimmed().isEmpty())
            return false;
    }
    return true;
}

// Numbers are written in the C locale; the system locale is accepted as a
// fallback for files saved by a localised spreadsheet program.
double parseNumber(const QString &text)
{
    if (text.isEmpty())
        return 0.0;

    bool ok = false;
    double value = QLocale::c().toDouble(text, &ok);
    if (!ok)
        value = QLocale().toDouble(text, &ok);
    if (!ok || !std::isfinite(value))
        return 0.0;
    return value;
}

int parseQuantity(const QString &text)
{
    const double value = parseNumber(text);
    if (value >= static_cast<double>(INT_MAX))
        return INT_MAX;
    if (value <= static_cast<double>(INT_MIN))
        return INT_MIN;
    return static_cast<int>(value);   // fractional quantities are truncated
}
}

// ═════════════════════════════════════════════════════════════
// Import
// ═════════════════════════════════════════════════════════════

ImportResult SpreadsheetIO::importFile(const QString &path, const QString &defaultUnit)
{
    ImportResult result;

    if (!QFileInfo::exists(path)) {
        result.errorString = i18n("File not found: %1", path);
        return result;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        result.errorString = i18n("Cannot open %1: %2", path, file.errorString());
        qCWarning(CATALOGUE_CORE_LOG) << result.errorString;
        return result;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);
    const QString text = in.readAll();
    if (in.status() != QTextStream::Ok) {
        result.errorString = i18n("Cannot read %1: %2", path, file.errorString());
        qCWarning(CATALOGUE_CORE_LOG) << result.errorString;
        return result;
    }

    result = parse(text, delimiterForPath(path), defaultUnit);
    if (result.ok) {
        qCDebug(CATALOGUE_CORE_LOG) << "Read" << result.components.size() << "components from"
                                    << path << "skipped" << result.skippedRows;
    } else {
        qCWarning(CATALOGUE_CORE_LOG) << path << result.errorString;
    }
    return result;
}

ImportResult SpreadsheetIO::parse(const QString &text, QChar delimiter, const QString &defaultUnit)
{
    ImportResult result;

    bool wellFormed = true;
    const QList<QStringList> rows = splitRows(text, delimiter, &wellFormed);
    if (!wellFormed) {
        result.errorString = i18n("The file is malformed: a quoted cell is never closed.");
        return result;
    }

    // First non-blank row is the header
    int headerRow = 0;
    while (headerRow < rows.size() && isBlankRow(rows.at(headerRow)))
        ++headerRow;
    if (headerRow >= rows.size()) {
        result.errorString = i18n("The file is empty.");
        return result;
    }

    const int fieldCount = static_cast<int>(ComponentField::COUNT);
    QVector<int> columnOf(fieldCount, -1);

    const QStringList &headers = rows.at(headerRow);
    for (int col = 0; col < headers.size(); ++col) {
        QString title = headers.at(col);
        title.remove(QChar(0xFEFF));
        title = title.trimmed();

        const int field = fieldForHeader(title);
        if (field < 0) {
            if (!title.isEmpty())
                result.ignoredColumns.append(title);
            continue;
        }
        // First matching column wins, later ones are ignored
        if (columnOf[field] < 0) {
            columnOf[field] = col;
            result.columns.append({title, static_cast<ComponentField>(field)});
        } else {
            result.ignoredColumns.append(title);
        }
    }

    if (columnOf[static_cast<int>(ComponentField::Name)] < 0) {
        result.errorString = i18n("The file has no Name column.");
        return result;
    }

    for (int r = headerRow + 1; r < rows.size(); ++r) {
        const QStringList &row = rows.at(r);
        if (isBlankRow(row))
            continue;
        ++result.rowsRead;

        auto cell = [&row, &columnOf](ComponentField field) -> QString {
            const int col = columnOf[static_cast<int>(field)];
            if (col < 0 || col >= row.size())
                return QString();
            return row.at(col).trimmed();
        };

        Component c;
        c.name        = cell(ComponentField::Name);
        c.category    = cell(ComponentField::Category);
        c.description = cell(ComponentField::Description);
        c.quantity    = parseQuantity(cell(ComponentField::Quantity));
        c.unit        = cell(ComponentField::Unit);
        c.costPerUnit = parseNumber(cell(ComponentField::CostPerUnit));
        c.supplier    = cell(ComponentField::Supplier);
        c.location    = cell(ComponentField::Location);
        c.notes       = cell(ComponentField::Notes);
        c = c.normalized(defaultUnit);

        QString reason;
        if (!c.validate(&reason)) {
            qCDebug(CATALOGUE_CORE_LOG) << "Skipping spreadsheet row" << r + 1 << reason;
            ++result.skippedRows;
            continue;
        }
        result.components.append(c);
    }

    result.ok = true;
    return result;
}

int SpreadsheetIO::fieldForHeader(const QString &header)
{
    QString key = header;
    key.remove(QChar(0xFEFF));
    key = key.simplified().toLower();

    const auto &aliases = headerAliases();
    const auto it = aliases.constFind(key);
    if (it == aliases.constEnd())
        return -1;
    return static_cast<int>(it.value());
}

QList<QStringList> SpreadsheetIO::splitRows(const QString &text, QChar delimiter, bool *ok)
{
    QList<QStringList> rows;
    QStringList row;
    QString cell;
    bool inQuotes    = false;
    bool atCellStart = true;

    const int length = text.size();
    for (int i = 0; i < length; ++i) {
        const QChar ch = text.at(i);

        if (inQuotes) {
            if (ch == QUOTE) {
                if (i + 1 < length && text.at(i + 1) == QUOTE) {
                    cell += QUOTE;   // doubled quote
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                cell += ch;
            }
            continue;
        }

        // Quotes are only special at the start of a cell
        if (ch == QUOTE && atCellStart) {
            inQuotes = true;
            atCellStart = false;
            continue;
        }

        if (ch == delimiter) {
            row.append(cell);
            cell.clear();
            atCellStart = true;
            continue;
        }

        if (ch == QLatin1Char('\r') || ch == QLatin1Char('\n')) {
            if (ch == QLatin1Char('\r') && i + 1 < length && text.at(i + 1) == QLatin1Char('\n'))
                ++i;
            row.append(cell);
            rows.append(row);
            cell.clear();
            row.clear();
            atCellStart = true;
            continue;
        }

        cell += ch;
        atCellStart = false;
    }

    if (ok)
        *ok = !inQuotes;

    // Last row without a trailing line break
    if (!atCellStart || !row.isEmpty()) {
        row.append(cell);
        rows.append(row);
    }
    return rows;
}

// ═════════════════════════════════════════════════════════════
// Export
// ═════════════════════════════════════════════════════════════

bool SpreadsheetIO::exportFile(const QVector<Component> &components,
                               const QString &path,
                               QString *errorString)
{
    auto reportError = [errorString](const QString &message) {
        qCWarning(CATALOGUE_CORE_LOG) << message;
        if (errorString)
            *errorString = message;
        return false;
    };

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return reportError(i18n("Cannot write %1: %2", path, file.errorString()));

    QTextStream out(&file);
    out.setEncoding(QStringConverter::Utf8);
    out.setGenerateByteOrderMark(true);
    out << format(components, delimiterForPath(path));
    out.flush();

    if (out.status() != QTextStream::Ok) {
        file.cancelWriting();
        return reportError(i18n("Cannot write %1: %2", path, file.errorString()));
    }

    if (!file.commit())
        return reportError(i18n("Cannot write %1: %2", path, file.errorString()));

    qCDebug(CATALOGUE_CORE_LOG) << "Exported" << components.size() << "components to" << path;
    if (errorString)
        errorString->clear();
    return true;
}

QString SpreadsheetIO::format(const QVector<Component> &components, QChar delimiter)
{
    const int fieldCount = static_cast<int>(ComponentField::COUNT);

    QString text;
    QStringList cells;

    for (int f = 0; f < fieldCount; ++f)
        cells << quoteCell(Component::fieldTitle(static_cast<ComponentField>(f)), delimiter);
    text += cells.join(delimiter) + LINE_END;

    for (const Component &c : components) {
        cells.clear();
        for (int f = 0; f < fieldCount; ++f)
            cells << quoteCell(c.fieldText(static_cast<ComponentField>(f)), delimiter);
        text += cells.join(delimiter) + LINE_END;
    }
    return text;
}

bool SpreadsheetIO::writeTemplate(const QString &path, QString *errorString)
{
    return exportFile({sampleComponent()}, path, errorString);
}

Component SpreadsheetIO::sampleComponent()
{
    Component c;
    c.name        = i18n("Resistor 10k");
    c.category    = i18n("Electronics");
    c.description = i18n("Carbon film resistor, 0.25 W");
    c.quantity    = 100;
    c.unit        = Component::defaultUnit();
    c.costPerUnit = 0.05;
    c.supplier    = i18n("Example Supplier");
    c.location    = i18n("Drawer A1");
    c.notes       = i18n("Sample row, replace it with your own components");
    return c;
}

QString SpreadsheetIO::describe(const ImportResult &result)
{
    if (!result.ok)
        return result.errorString;

    QStringList lines;
    lines << i18n("Recognised columns:");
    for (const ColumnMapping &column : result.columns) {
        lines << i18nc("spreadsheet header -> catalogue field", "  %1 -> %2",
                       column.header, Component::fieldTitle(column.field));
    }

    if (!result.ignoredColumns.isEmpty())
        lines << i18n("Ignored columns: %1", result.ignoredColumns.join(QStringLiteral(", ")));

    lines << QString();
    lines << i18np("%1 row read.", "%1 rows read.", result.rowsRead);
    if (result.skippedRows > 0)
        lines << i18np("%1 row will be skipped (empty name or negative amount).",
                       "%1 rows will be skipped (empty name or negative amount).",
                       result.skippedRows);
    lines << i18np("%1 component will be imported.", "%1 components will be imported.",
                   result.components.size());
    return lines.join(QLatin1Char('\n'));
}

QChar SpreadsheetIO::delimiterForPath(const QString &path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix == QLatin1String("tsv") || suffix == QLatin1String("tab"))
        return QLatin1Char('\t');
    return QLatin1Char(',');
}

QString SpreadsheetIO::quoteCell(const QString &cell, QChar delimiter)
{
    const bool needsQuotes = cell.contains(delimiter)
        || cell.contains(QUOTE)
        || cell.contains(QLatin1Char('\n'))
        || cell.contains(QLatin1Char('\r'));
    if (!needsQuotes)
        return cell;

    QString quoted = cell;
    quoted.replace(QUOTE, QStringLiteral("\"\""));
    return QUOTE + quoted + QUOTE;
}
