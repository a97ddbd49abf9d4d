// componentrepository.h
// Component Catalogue - SQLite persistence for the components table
//
// Thin repository over a named Qt SQL connection.  The connection is
// registered once by initialize() and opened/closed around every
// operation, so no file handle outlives the call that needed it.
//
// Copyright (c) 2026 Component Catalogue Project

#ifndef COMPONENTREPOSITORY_H
#define COMPONENTREPOSITORY_H

#include "component.h"

#include <QString>
#include <QStringList>
#include <QVector>

/// Outcome of a batch import into the store.
struct ImportSummary {
    bool ok       = false;
    int  inserted = 0;
    int  updated  = 0;
    int  skipped  = 0;   // duplicates left alone by DuplicatePolicy::SkipExisting
};

/**
 * @brief Create/read/update/delete/search over the components table.
 *
 * Every failing call stores a user-facing message retrievable through
 * lastError().  Validation happens before any write: a component with an
 * empty name or a negative quantity/cost never reaches the database.
 */
class ComponentRepository
{
public:
    enum class Status {
        Ok,
        NotFound,
        Invalid,        // validation failed, nothing written
        StorageError    // driver/SQL failure, prior state unchanged
    };

    /// How importComponents() treats a record whose name already exists
    /// (case-insensitive).
    enum class DuplicatePolicy {
        Append,
        SkipExisting,
        UpdateExisting
    };

    explicit ComponentRepository(const QString &databasePath);
    ~ComponentRepository();

    ComponentRepository(const ComponentRepository &) = delete;
    ComponentRepository &operator=(const ComponentRepository &) = delete;

    /// Register the connection, create the parent directory and the schema.
    /// Must succeed before any other call; returns false on failure.
    bool initialize();

    QString databasePath() const;

    /// Message describing the last failure (empty if the last call succeeded).
    QString lastError() const;

    // Text fields are stored trimmed and an empty unit as the default unit
    // (Component::normalized), the same form a spreadsheet import produces.

    /// Insert a new component.  Returns the new id, or -1 on failure.
    qint64 create(const Component &component);

    /// Overwrite every non-identifier field of component @p id.
    Status update(qint64 id, const Component &component);

    /// Delete component @p id.
    Status remove(qint64 id);

    /// Fetch a single component.  Returns an invalid Component if absent.
    Component component(qint64 id, bool *ok = nullptr) const;

    /// All components (optionally of one category), ordered by name.
    QVector<Component> list(const QString &category = QString(),
                            bool *ok = nullptr) const;

    /// Case-insensitive substring search on name, category and description,
    /// optionally restricted to one category.  Empty text lists everything.
    QVector<Component> search(const QString &text,
                              const QString &category = QString(),
                              bool *ok = nullptr) const;

    /// Distinct non-empty categories, sorted.
    QStringList categories(bool *ok = nullptr) const;

    /// Number of stored components, or -1 on failure.
    int count() const;

    /// Store a batch of components in a single transaction.
    /// Nothing is written if any component is invalid or any write fails.
    ImportSummary importComponents(const QVector<Component> &components,
                                   DuplicatePolicy policy = DuplicatePolicy::Append);

private:
    /// Record a failure message; always returns false.
    bool fail(const QString &message) const;

    QString         m_databasePath;
    QString         m_connectionName;
    mutable QString m_lastError;
};

#endif // COMPONENTREPOSITORY_H
