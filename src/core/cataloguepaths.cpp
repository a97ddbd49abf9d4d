// cataloguepaths.cpp
// Component Catalogue - database file location
// Copyright (c) 2026 Component Catalogue Project

#include "cataloguepaths.h"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

QString CataloguePaths::environmentVariable()
{
    return QStringLiteral("CATALOGUE_DATABASE");
}

QString CataloguePaths::databasePath(const QString &configuredPath)
{
    // Check environment override
    const QString envPath = QString::fromLocal8Bit(
        qgetenv(environmentVariable().toLatin1().constData()));
    if (!envPath.isEmpty())
        return QDir::cleanPath(envPath);

    if (!configuredPath.trimmed().isEmpty())
        return QDir::cleanPath(configuredPath.trimmed());

    return defaultDatabasePath();
}

QString CataloguePaths::defaultDatabasePath()
{
    const QString dataDir = QStandardPaths::writableLocation(
        QStandardPaths::AppDataLocation);
    return dataDir + QStringLiteral("/catalogue.db");
}

bool CataloguePaths::ensureParentDirectory(const QString &filePath)
{
    const QFileInfo fi(filePath);
    const QString dir = fi.absolutePath();
    if (QFileInfo::exists(dir))
        return QFileInfo(dir).isDir();
    return QDir().mkpath(dir);
}
