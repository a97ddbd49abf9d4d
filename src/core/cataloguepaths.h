// cataloguepaths.h
// Component Catalogue - database file location
// Copyright (c) 2026 Component Catalogue Project

#ifndef CATALOGUEPATHS_H
#define CATALOGUEPATHS_H

#include <QString>

/**
 * @brief Resolves where the catalogue database lives.
 *
 * Priority order:
 *   1. $CATALOGUE_DATABASE              (env override)
 *   2. the path stored in the settings  (may be empty)
 *   3. <AppDataLocation>/catalogue.db   (XDG default)
 */
class CataloguePaths
{
public:
    /// Name of the environment variable that overrides the database path.
    static QString environmentVariable();

    /// Resolve the database file to use for the configured path.
    static QString databasePath(const QString &configuredPath = QString());

    /// Default database file under the XDG data directory.
    static QString defaultDatabasePath();

    /// Create the parent directory of @p filePath if it does not exist.
    /// Returns false if the directory cannot be created.
    static bool ensureParentDirectory(const QString &filePath);
};

#endif // CATALOGUEPATHS_H
