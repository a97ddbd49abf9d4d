// componentrepository.cpp
// Component Catalogue - SQLite persistence for the components table
// Copyright (c) 2026 Component Catalogue Project

#include "componentrepository.h"
#include "cataloguepaths.h"
#include "cataloguecore_debug.h"

#include <KLocalizedString>

#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

namespace
{
const QString SQL_DRIVER = QStringLiteral("QSQLITE");

const QString CREATE_TABLE_SQL = QStringLiteral(
    "CREATE TABLE IF NOT EXISTS components ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  name TEXT NOT NULL,"
    "  category TEXT,"
    "  description TEXT,"
    "  quantity INTEGER NOT NULL DEFAULT 0 CHECK (quantity >= 0),"
    "  unit TEXT DEFAULT 'pieces',"
    "  cost_per_unit REAL NOT NULL DEFAULT 0.0 CHECK (cost_per_unit >= 0),"
    "  supplier TEXT,"
    "  location TEXT,"
    "  notes TEXT,"
    "  created_date TEXT,"
    "  modified_date TEXT"
    ")");

const QString CREATE_INDEX_SQL = QStringLiteral(
    "CREATE INDEX IF NOT EXISTS idx_components_category ON components (category)");

const QString SELECT_SQL = QStringLiteral(
    "SELECT id, name, category, description, quantity, unit, cost_per_unit,"
    " supplier, location, notes, created_date, modified_date FROM components");

const QString INSERT_SQL = QStringLiteral(
    "INSERT INTO components (name, category, description, quantity, unit,"
    " cost_per_unit, supplier, location, notes, created_date, modified_date)"
    " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

const QString UPDATE_SQL = QStringLiteral(
    "UPDATE components SET name = ?, category = ?, description = ?,"
    " quantity = ?, unit = ?, cost_per_unit = ?, supplier = ?, location = ?,"
    " notes = ?, modified_date = ? WHERE id = ?");

int s_connectionCounter = 0;

/**
 * @brief RAII helper that opens the named connection for one operation
 * and closes it afterwards.  Queries must be declared after the scope so
 * they are destroyed before the connection closes.
 */
class ConnectionScope
{
public:
    explicit ConnectionScope(const QString &connectionName)
        : m_db(QSqlDatabase::database(connectionName, false))
    {
        m_open = m_db.isValid() && m_db.open();
        if (!m_open)
            qCWarning(CATALOGUE_CORE_LOG) << "Cannot open connection" << connectionName
                                          << m_db.lastError().text();
    }

    ~ConnectionScope()
    {
        if (m_db.isOpen())
            m_db.close();
    }

    ConnectionScope(const ConnectionScope &) = delete;
    ConnectionScope &operator=(const ConnectionScope &) = delete;

    bool isOpen() const { return m_open; }
    QSqlDatabase &database() { return m_db; }

    QString errorText() const
    {
        if (!m_db.isValid())
            return i18n("The database has not been initialized.");
        return m_db.lastError().text();
    }

private:
    QSqlDatabase m_db;
    bool         m_open = false;
};

QString timestampNow()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

void setOk(bool *ok, bool value)
{
    if (ok)
        *ok = value;
}

void bindFields(QSqlQuery &query, const Component &component)
{
    query.addBindValue(component.name);
    query.addBindValue(component.category);
    query.addBindValue(component.description);
    query.addBindValue(component.quantity);
    query.addBindValue(component.unit);
    query.addBindValue(component.costPerUnit);
    query.addBindValue(component.supplier);
    query.addBindValue(component.location);
    query.addBindValue(component.notes);
}

bool insertRow(QSqlQuery &query, const Component &component, const QString &timestamp)
{
    if (!query.prepare(INSERT_SQL))
        return false;
    bindFields(query, component);
    query.addBindValue(timestamp);
    query.addBindValue(timestamp);
    return query.exec();
}

bool updateRow(QSqlQuery &query, qint64 id, const Component &component, const QString &timestamp)
{
    if (!query.prepare(UPDATE_SQL))
        return false;
    bindFields(query, component);
    query.addBindValue(timestamp);
    query.addBindValue(id);
    return query.exec();
}

// Column order matches SELECT_SQL
Component componentFromQuery(const QSqlQuery &query)
{
    Component c;
    c.id          = query.value(0).toLongLong();
    c.name        = query.value(1).toString();
    c.category    = query.value(2).toString();
    c.description = query.value(3).toString();
    c.quantity    = query.value(4).toInt();
    c.unit        = query.value(5).toString();
    c.costPerUnit = query.value(6).toDouble();
    c.supplier    = query.value(7).toString();
    c.location    = query.value(8).toString();
    c.notes       = query.value(9).toString();
    c.created     = QDateTime::fromString(query.value(10).toString(), Qt::ISODateWithMs);
    c.modified    = QDateTime::fromString(query.value(11).toString(), Qt::ISODateWithMs);
    return c;
}
}

// ═════════════════════════════════════════════════════════════
// Construction / Destruction
// ═════════════════════════════════════════════════════════════

ComponentRepository::ComponentRepository(const QString &databasePath)
    : m_databasePath(databasePath)
    , m_connectionName(QStringLiteral("component-catalogue-%1").arg(++s_connectionCounter))
{
}

ComponentRepository::~ComponentRepository()
{
    // All QSqlDatabase handles are scoped to single operations, so the
    // connection is no longer in use here.
    if (QSqlDatabase::contains(m_connectionName))
        QSqlDatabase::removeDatabase(m_connectionName);
}

bool ComponentRepository::initialize()
{
    m_lastError.clear();

    if (!QSqlDatabase::isDriverAvailable(SQL_DRIVER))
        return fail(i18n("The SQLite driver for Qt (%1) is not available.", SQL_DRIVER));

    if (!CataloguePaths::ensureParentDirectory(m_databasePath))
        return fail(i18n("Cannot create the directory for the database %1.", m_databasePath));

    if (!QSqlDatabase::contains(m_connectionName)) {
        QSqlDatabase db = QSqlDatabase::addDatabase(SQL_DRIVER, m_connectionName);
        db.setDatabaseName(m_databasePath);
    }

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen())
        return fail(i18n("Cannot open the database %1: %2", m_databasePath, scope.errorText()));

    QSqlQuery query(scope.database());
    if (!query.exec(CREATE_TABLE_SQL) || !query.exec(CREATE_INDEX_SQL))
        return fail(i18n("Cannot create the components table: %1", query.lastError().text()));

    qCDebug(CATALOGUE_CORE_LOG) << "Opened catalogue database" << m_databasePath;
    return true;
}

QString ComponentRepository::databasePath() const
{
    return m_databasePath;
}

QString ComponentRepository::lastError() const
{
    return m_lastError;
}

bool ComponentRepository::fail(const QString &message) const
{
    m_lastError = message;
    qCWarning(CATALOGUE_CORE_LOG) << message;
    return false;
}

// ═════════════════════════════════════════════════════════════
// Mutations
// ═════════════════════════════════════════════════════════════

qint64 ComponentRepository::create(const Component &input)
{
    m_lastError.clear();

    const Component component = input.normalized();
    QString message;
    if (!component.validate(&message)) {
        fail(message);
        return -1;
    }

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen()) {
        fail(i18n("Cannot open the database: %1", scope.errorText()));
        return -1;
    }

    QSqlQuery query(scope.database());
    if (!insertRow(query, component, timestampNow())) {
        fail(i18n("Failed to add component: %1", query.lastError().text()));
        return -1;
    }

    const qint64 id = query.lastInsertId().toLongLong();
    qCDebug(CATALOGUE_CORE_LOG) << "Created component" << id << component.name;
    return id;
}

ComponentRepository::Status ComponentRepository::update(qint64 id, const Component &input)
{
    m_lastError.clear();

    const Component component = input.normalized();
    QString message;
    if (!component.validate(&message)) {
        fail(message);
        return Status::Invalid;
    }

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen()) {
        fail(i18n("Cannot open the database: %1", scope.errorText()));
        return Status::StorageError;
    }

    QSqlQuery query(scope.database());
    if (!updateRow(query, id, component, timestampNow())) {
        fail(i18n("Failed to update component: %1", query.lastError().text()));
        return Status::StorageError;
    }

    if (query.numRowsAffected() == 0) {
        fail(i18n("Component %1 was not found.", id));
        return Status::NotFound;
    }

    qCDebug(CATALOGUE_CORE_LOG) << "Updated component" << id;
    return Status::Ok;
}

ComponentRepository::Status ComponentRepository::remove(qint64 id)
{
    m_lastError.clear();

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen()) {
        fail(i18n("Cannot open the database: %1", scope.errorText()));
        return Status::StorageError;
    }

    QSqlQuery query(scope.database());
    const bool prepared = query.prepare(QStringLiteral("DELETE FROM components WHERE id = ?"));
    query.addBindValue(id);
    if (!prepared || !query.exec()) {
        fail(i18n("Failed to delete component: %1", query.lastError().text()));
        return Status::StorageError;
    }

    if (query.numRowsAffected() == 0) {
        fail(i18n("Component %1 was not found.", id));
        return Status::NotFound;
    }

    qCDebug(CATALOGUE_CORE_LOG) << "Deleted component" << id;
    return Status::Ok;
}

// ═════════════════════════════════════════════════════════════
// Queries
// ═════════════════════════════════════════════════════════════

Component ComponentRepository::component(qint64 id, bool *ok) const
{
    m_lastError.clear();
    setOk(ok, false);

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen()) {
        fail(i18n("Cannot open the database: %1", scope.errorText()));
        return Component{};
    }

    QSqlQuery query(scope.database());
    query.setForwardOnly(true);
    const bool prepared = query.prepare(SELECT_SQL + QStringLiteral(" WHERE id = ?"));
    query.addBindValue(id);
    if (!prepared || !query.exec()) {
        fail(i18n("Failed to read component: %1", query.lastError().text()));
        return Component{};
    }

    setOk(ok, true);
    if (!query.next())
        return Component{};
    return componentFromQuery(query);
}

QVector<Component> ComponentRepository::list(const QString &category, bool *ok) const
{
    m_lastError.clear();
    setOk(ok, false);

    QVector<Component> result;

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen()) {
        fail(i18n("Cannot open the database: %1", scope.errorText()));
        return result;
    }

    QString sql = SELECT_SQL;
    if (!category.isEmpty())
        sql += QStringLiteral(" WHERE category = ?");
    sql += QStringLiteral(" ORDER BY name COLLATE NOCASE, id");

    QSqlQuery query(scope.database());
    query.setForwardOnly(true);
    const bool prepared = query.prepare(sql);
    if (!category.isEmpty())
        query.addBindValue(category);

    if (!prepared || !query.exec()) {
        fail(i18n("Failed to read components: %1", query.lastError().text()));
        return result;
    }

    while (query.next())
        result.append(componentFromQuery(query));

    setOk(ok, true);
    return result;
}

QVector<Component> ComponentRepository::search(const QString &text,
                                               const QString &category,
                                               bool *ok) const
{
    bool listed = false;
    const QVector<Component> candidates = list(category, &listed);
    setOk(ok, listed);
    if (!listed)
        return {};

    // SQLite's LIKE only folds ASCII case, so the match is done here with
    // the same rule the table filter uses.
    const QString needle = text.trimmed();
    QVector<Component> result;
    for (const Component &c : candidates) {
        if (c.matchesText(needle))
            result.append(c);
    }
    return result;
}

QStringList ComponentRepository::categories(bool *ok) const
{
    m_lastError.clear();
    setOk(ok, false);

    QStringList result;

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen()) {
        fail(i18n("Cannot open the database: %1", scope.errorText()));
        return result;
    }

    QSqlQuery query(scope.database());
    query.setForwardOnly(true);
    if (!query.exec(QStringLiteral(
            "SELECT DISTINCT category FROM components"
            " WHERE category IS NOT NULL AND category <> ''"
            " ORDER BY category COLLATE NOCASE"))) {
        fail(i18n("Failed to read categories: %1", query.lastError().text()));
        return result;
    }

    while (query.next())
        result.append(query.value(0).toString());

    setOk(ok, true);
    return result;
}

int ComponentRepository::count() const
{
    m_lastError.clear();

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen()) {
        fail(i18n("Cannot open the database: %1", scope.errorText()));
        return -1;
    }

    QSqlQuery query(scope.database());
    if (!query.exec(QStringLiteral("SELECT COUNT(*) FROM components")) || !query.next()) {
        fail(i18n("Failed to count components: %1", query.lastError().text()));
        return -1;
    }
    return query.value(0).toInt();
}

// ═════════════════════════════════════════════════════════════
// Batch import
// ═════════════════════════════════════════════════════════════

ImportSummary ComponentRepository::importComponents(const QVector<Component> &input,
                                                    DuplicatePolicy policy)
{
    m_lastError.clear();
    ImportSummary summary;

    QVector<Component> components;
    components.reserve(input.size());
    for (const Component &c : input)
        components.append(c.normalized());

    // Validate everything up front: an invalid record aborts the whole batch
    for (const Component &c : components) {
        QString message;
        if (!c.validate(&message)) {
            fail(message);
            return summary;
        }
    }

    ConnectionScope scope(m_connectionName);
    if (!scope.isOpen()) {
        fail(i18n("Cannot open the database: %1", scope.errorText()));
        return summary;
    }

    QSqlDatabase &db = scope.database();
    if (!db.transaction()) {
        fail(i18n("Cannot start the import: %1", db.lastError().text()));
        return summary;
    }

    const QString now = timestampNow();
    bool failed = false;
    QString errorText;

    {
        QSqlQuery lookup(db);
        QSqlQuery write(db);

        for (const Component &c : components) {
            qint64 existingId = -1;

            if (policy != DuplicatePolicy::Append) {
                const bool prepared = lookup.prepare(QStringLiteral(
                    "SELECT id FROM components WHERE name = ? COLLATE NOCASE ORDER BY id LIMIT 1"));
                lookup.addBindValue(c.name);
                if (!prepared || !lookup.exec()) {
                    failed = true;
                    errorText = lookup.lastError().text();
                    break;
                }
                if (lookup.next())
                    existingId = lookup.value(0).toLongLong();
                lookup.finish();
            }

            if (existingId >= 0 && policy == DuplicatePolicy::SkipExisting) {
                ++summary.skipped;
                continue;
            }

            if (existingId >= 0 && policy == DuplicatePolicy::UpdateExisting) {
                if (!updateRow(write, existingId, c, now)) {
                    failed = true;
                    errorText = write.lastError().text();
                    break;
                }
                ++summary.updated;
                continue;
            }

            if (!insertRow(write, c, now)) {
                failed = true;
                errorText = write.lastError().text();
                break;
            }
            ++summary.inserted;
        }
    }

    if (failed) {
        db.rollback();
        fail(i18n("Import aborted, nothing was stored: %1", errorText));
        return ImportSummary{};
    }

    if (!db.commit()) {
        const QString commitError = db.lastError().text();
        db.rollback();
        fail(i18n("Import aborted, nothing was stored: %1", commitError));
        return ImportSummary{};
    }

    summary.ok = true;
    qCDebug(CATALOGUE_CORE_LOG) << "Imported" << summary.inserted << "new,"
                                << summary.updated << "updated,"
                                << summary.skipped << "skipped";
    return summary;
}
