// settingsdialog.h
// Component Catalogue - Settings Dialog (KConfigDialog over CatalogueSettings)
//
// Three pages:
//   General - database file, default unit
//   Import  - duplicate handling
//   Report  - title, category summary, page orientation
//
// Widgets named kcfg_<Entry> are managed by KConfigDialogManager.  The
// database path is a KUrlRequester and is synced by hand through the
// updateSettings()/updateWidgets()/updateWidgetsDefault()/hasChanged()/
// isDefault() overrides.
//
// Copyright (c) 2026 Component Catalogue Project

#ifndef SETTINGSDIALOG_H
#define SETTINGSDIALOG_H

#include <KConfigDialog>

class KUrlRequester;

/**
 * @brief Preferences dialog backed by KConfigXT.
 *
 * Only one instance exists at a time;
 * KConfigDialog manages this internally via the dialog name.
 */
class SettingsDialog : public KConfigDialog
{
    Q_OBJECT

public:
    static QString dialogName();

    explicit SettingsDialog(QWidget *parent);
    ~SettingsDialog() override;

Q_SIGNALS:
    void databasePathChanged();

protected Q_SLOTS:
    void updateSettings() override;
    void updateWidgets() override;
    void updateWidgetsDefault() override;
    bool hasChanged() override;

protected:
    bool isDefault() override;

private:
    // ── Page builders ──
    QWidget *createGeneralPage();
    QWidget *createImportPage();
    QWidget *createReportPage();

    QString selectedDatabasePath() const;

    KUrlRequester *m_databaseUrl;
};

#endif // SETTINGSDIALOG_H
