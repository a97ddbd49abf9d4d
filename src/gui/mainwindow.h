// mainwindow.h
// Component Catalogue - Main Window
//
// Layout:
//   - ComponentForm on the left (add / edit a single component)
//   - ComponentView on the right (search, category filter, table)
//   - Status bar with the outcome of the last operation
//
// All storage goes through one ComponentRepository.  After every mutation
// the table and both category lists are reloaded from it.
//
// Copyright (c) 2026 Component Catalogue Project

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "component.h"
#include "componentrepository.h"

#include <KXmlGuiWindow>

#include <QLabel>
#include <QVector>

#include <memory>

class ComponentForm;
class ComponentView;
struct ReportOptions;

/**
 * @brief Main application window.
 *
 *   ┌──────────────────────────────────────────────────────────┐
 *   │ Toolbar: New | Edit | Delete | Import | Export | PDF | Print │
 *   ├───────────────┬──────────────────────────────────────────┤
 *   │               │ Search: [........]  Category: [All ▼]    │
 *   │ Component     │ ┌──────────────────────────────────────┐ │
 *   │ Details form  │ │ table                                 │ │
 *   │               │ └──────────────────────────────────────┘ │
 *   │ Add|Update|Clr│                          Edit | Delete   │
 *   ├───────────────┴──────────────────────────────────────────┤
 *   │ Status                                                   │
 *   └──────────────────────────────────────────────────────────┘
 */
class MainWindow : public KXmlGuiWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

public Q_SLOTS:
    /// Reload the table and category lists from the repository.
    void refresh();

    /// Open the Settings dialog (KConfigDialog).
    void showSettingsDialog();

private Q_SLOTS:
    // ── Form / table requests ──
    void addComponent(const Component &component);
    void updateComponent(qint64 id, const Component &component);
    void editComponent(qint64 id);
    void deleteComponents(const QVector<qint64> &ids);
    void newComponent();

    // ── File actions ──
    void importSpreadsheet();
    void createImportTemplate();
    void exportSpreadsheet();
    void exportPdf();
    void printReport();

    // ── Settings ──
    void onDatabasePathChanged();
    void onSettingsChanged();

    /// Show a transient message in the status bar
    void showStatus(const QString &message);

private:
    // ── Setup methods ──
    void setupPanels();
    void setupStatusBar();
    void setupActions();

    /// (Re)open the repository at the configured path.  On failure the
    /// previous repository, if any, stays in use.
    bool openRepository();

    /// Blocking error notification for storage and file failures.
    void showError(const QString &title, const QString &message);

    ReportOptions reportOptions() const;
    ComponentRepository::DuplicatePolicy duplicatePolicy() const;

    /// Directory for file dialogs (last used, else home).
    QString dialogDirectory() const;
    void rememberDirectory(const QString &filePath);

    // ── Panels ──
    ComponentForm *m_form;             ///< Entry form
    ComponentView *m_view;             ///< Filterable table

    // ── Status bar widgets ──
    QLabel *m_statusLabel;             ///< Catalogue totals
    QLabel *m_databaseLabel;           ///< Path of the open database

    // ── Actions enabled by the table selection ──
    QAction *m_editAction;
    QAction *m_deleteAction;

    // ── Storage ──
    std::unique_ptr<ComponentRepository> m_repository;
};

#endif // MAINWINDOW_H
