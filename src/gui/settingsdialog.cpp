// settingsdialog.cpp
// Component Catalogue - Settings Dialog implementation
// Copyright (c) 2026 Component Catalogue Project

#include "settingsdialog.h"
#include "catalogue_debug.h"
#include "cataloguepaths.h"
#include "cataloguesettings.h"

#include <KLocalizedString>
#include <KUrlRequester>

#include <QCheckBox>
#include <QComboBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QUrl>
#include <QVBoxLayout>

QString SettingsDialog::dialogName()
{
    return QStringLiteral("CatalogueSettings");
}

SettingsDialog::SettingsDialog(QWidget *parent)
    : KConfigDialog(parent, dialogName(), CatalogueSettings::self())
    , m_databaseUrl(nullptr)
{
    setFaceType(KPageDialog::List);

    addPage(createGeneralPage(), i18n("General"),
            QStringLiteral("configure"), i18n("Database and Defaults"));
    addPage(createImportPage(), i18n("Import"),
            QStringLiteral("document-import"), i18n("Spreadsheet Import"));
    addPage(createReportPage(), i18n("Report"),
            QStringLiteral("document-print"), i18n("Printed Report"));

    updateWidgets();
}

SettingsDialog::~SettingsDialog() = default;

// ═════════════════════════════════════════════════════════════
// Pages
// ═════════════════════════════════════════════════════════════

QWidget *SettingsDialog::createGeneralPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QFormLayout(page);

    m_databaseUrl = new KUrlRequester(page);
    m_databaseUrl->setObjectName(QStringLiteral("databaseUrl"));
    m_databaseUrl->setMode(KFile::File | KFile::LocalOnly);
    m_databaseUrl->setNameFilters({i18n("SQLite databases (*.db *.sqlite)"),
                                   i18n("All files (*)")});
    m_databaseUrl->setPlaceholderText(CataloguePaths::defaultDatabasePath());
    layout->addRow(i18n("Database file:"), m_databaseUrl);

    // Environment override takes precedence over this setting
    if (qEnvironmentVariableIsSet(CataloguePaths::environmentVariable().toLatin1().constData())) {
        auto *note = new QLabel(
            i18n("The %1 environment variable is set and overrides this path.",
                 CataloguePaths::environmentVariable()), page);
        note->setWordWrap(true);
        layout->addRow(QString(), note);
    }

    auto *unitEdit = new QLineEdit(page);
    unitEdit->setObjectName(QStringLiteral("kcfg_DefaultUnit"));
    layout->addRow(i18n("Default unit:"), unitEdit);

    connect(m_databaseUrl, &KUrlRequester::textChanged,
            this, &SettingsDialog::updateButtons);

    return page;
}

QWidget *SettingsDialog::createImportPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QFormLayout(page);

    // Item order follows the DuplicatePolicy choices
    auto *policyCombo = new QComboBox(page);
    policyCombo->setObjectName(QStringLiteral("kcfg_DuplicatePolicy"));
    policyCombo->addItem(i18n("Add as new components"));
    policyCombo->addItem(i18n("Skip components that already exist"));
    policyCombo->addItem(i18n("Update components that already exist"));
    layout->addRow(i18n("Existing names:"), policyCombo);

    auto *hint = new QLabel(i18n("Components are matched by name, ignoring case."), page);
    hint->setWordWrap(true);
    layout->addRow(QString(), hint);

    return page;
}

QWidget *SettingsDialog::createReportPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QFormLayout(page);

    auto *titleEdit = new QLineEdit(page);
    titleEdit->setObjectName(QStringLiteral("kcfg_ReportTitle"));
    layout->addRow(i18n("Title:"), titleEdit);

    auto *summaryCheck = new QCheckBox(i18n("Include summary by category"), page);
    summaryCheck->setObjectName(QStringLiteral("kcfg_IncludeCategorySummary"));
    layout->addRow(QString(), summaryCheck);

    auto *landscapeCheck = new QCheckBox(i18n("Landscape pages"), page);
    landscapeCheck->setObjectName(QStringLiteral("kcfg_LandscapeReport"));
    layout->addRow(QString(), landscapeCheck);

    return page;
}

// ═════════════════════════════════════════════════════════════
// Manual sync for the database path
// ═════════════════════════════════════════════════════════════

QString SettingsDialog::selectedDatabasePath() const
{
    const QUrl url = m_databaseUrl->url();
    return url.isLocalFile() ? url.toLocalFile() : m_databaseUrl->text().trimmed();
}

void SettingsDialog::updateSettings()
{
    const QString oldPath = CatalogueSettings::databasePath();
    const QString newPath = selectedDatabasePath();
    if (oldPath == newPath)
        return;

    CatalogueSettings::setDatabasePath(newPath);
    if (!CatalogueSettings::self()->save()) {
        qCWarning(CATALOGUE_LOG) << "Failed to save settings";
        return;
    }

    qCDebug(CATALOGUE_LOG) << "Database path changed to" << newPath;
    Q_EMIT databasePathChanged();
}

void SettingsDialog::updateWidgets()
{
    const QString path = CatalogueSettings::databasePath();
    m_databaseUrl->setUrl(path.isEmpty() ? QUrl() : QUrl::fromLocalFile(path));
}

bool SettingsDialog::hasChanged()
{
    return selectedDatabasePath() != CatalogueSettings::databasePath();
}

// The default database path is empty: the standard location is used
void SettingsDialog::updateWidgetsDefault()
{
    m_databaseUrl->setUrl(QUrl());
}

bool SettingsDialog::isDefault()
{
    return selectedDatabasePath().isEmpty();
}
