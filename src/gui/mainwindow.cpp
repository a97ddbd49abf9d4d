// mainwindow.cpp
// Component Catalogue - Main Window Implementation
// Copyright (c) 2026 Component Catalogue Project

#include "mainwindow.h"
#include "catalogue_debug.h"
#include "cataloguepaths.h"
#include "cataloguesettings.h"
#include "componentform.h"
#include "componentview.h"
#include "reportwriter.h"
#include "settingsdialog.h"
#include "spreadsheetio.h"

#include <KActionCollection>
#include <KLocalizedString>
#include <KStandardAction>

#include <QAction>
#include <QApplication>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QIcon>
#include <QLocale>
#include <QMessageBox>
#include <QPrintDialog>
#include <QPrinter>
#include <QSplitter>
#include <QStatusBar>

// ═════════════════════════════════════════════════════════════
// Construction / Destruction
// ═════════════════════════════════════════════════════════════

MainWindow::MainWindow(QWidget *parent)
    : KXmlGuiWindow(parent)
    , m_form(nullptr)
    , m_view(nullptr)
    , m_statusLabel(nullptr)
    , m_databaseLabel(nullptr)
    , m_editAction(nullptr)
    , m_deleteAction(nullptr)
{
    setWindowTitle(i18n("Component Catalogue"));

    // ── Build UI ──
    setupPanels();
    setupStatusBar();
    setupActions();

    // Assemble main layout: form | table
    auto *centralWidget = new QWidget(this);
    auto *splitter = new QSplitter(Qt::Horizontal, centralWidget);

    splitter->addWidget(m_form);
    splitter->addWidget(m_view);

    // Form keeps its width, table gets the rest
    splitter->setStretchFactor(0, 0);
    splitter->setStretchFactor(1, 1);
    splitter->setSizes({340, 860});

    auto *centralLayout = new QHBoxLayout(centralWidget);
    centralLayout->setContentsMargins(0, 0, 0, 0);
    centralLayout->addWidget(splitter);

    setCentralWidget(centralWidget);

    // ── Storage ──
    openRepository();
    refresh();

    // KXmlGuiWindow standard setup (menus, toolbar, accelerators)
    setupGUI(Default, QStringLiteral("component-catalogueui.rc"));

    resize(1200, 700);
}

MainWindow::~MainWindow() = default;

// ═════════════════════════════════════════════════════════════
// Panel setup
// ═════════════════════════════════════════════════════════════

void MainWindow::setupPanels()
{
    m_form = new ComponentForm(this);
    m_form->setDefaultUnit(CatalogueSettings::defaultUnit());
    m_form->clear();

    m_view = new ComponentView(this);

    connect(m_form, &ComponentForm::addRequested,
            this, &MainWindow::addComponent);
    connect(m_form, &ComponentForm::updateRequested,
            this, &MainWindow::updateComponent);

    connect(m_view, &ComponentView::editRequested,
            this, &MainWindow::editComponent);
    connect(m_view, &ComponentView::deleteRequested,
            this, &MainWindow::deleteComponents);
    connect(m_view, &ComponentView::statusMessage,
            this, &MainWindow::showStatus);
}

// ═════════════════════════════════════════════════════════════
// Status bar setup
// ═════════════════════════════════════════════════════════════

void MainWindow::setupStatusBar()
{
    m_statusLabel = new QLabel(i18n("Ready"), this);
    m_databaseLabel = new QLabel(this);
    m_databaseLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);

    statusBar()->addPermanentWidget(m_statusLabel);
    statusBar()->addPermanentWidget(m_databaseLabel);
}

void MainWindow::showStatus(const QString &message)
{
    statusBar()->showMessage(message, 5000);
}

// ═════════════════════════════════════════════════════════════
// Actions
// ═════════════════════════════════════════════════════════════

void MainWindow::setupActions()
{
    KActionCollection *ac = actionCollection();

    // ── File ──
    QAction *importAction = ac->addAction(QStringLiteral("import_spreadsheet"));
    importAction->setText(i18n("&Import Spreadsheet..."));
    importAction->setIcon(QIcon::fromTheme(QStringLiteral("document-import")));
    importAction->setToolTip(i18n("Add components from a CSV or TSV spreadsheet"));
    KActionCollection::setDefaultShortcut(importAction, QKeySequence(Qt::CTRL | Qt::Key_I));
    connect(importAction, &QAction::triggered, this, &MainWindow::importSpreadsheet);

    QAction *templateAction = ac->addAction(QStringLiteral("create_import_template"));
    templateAction->setText(i18n("Create Import &Template..."));
    templateAction->setIcon(QIcon::fromTheme(QStringLiteral("document-new-from-template")));
    templateAction->setToolTip(i18n("Save an empty spreadsheet with the expected columns"));
    connect(templateAction, &QAction::triggered, this, &MainWindow::createImportTemplate);

    QAction *exportAction = ac->addAction(QStringLiteral("export_spreadsheet"));
    exportAction->setText(i18n("&Export Spreadsheet..."));
    exportAction->setIcon(QIcon::fromTheme(QStringLiteral("document-export")));
    exportAction->setToolTip(i18n("Write the whole catalogue to a spreadsheet"));
    KActionCollection::setDefaultShortcut(exportAction,
                                          QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_E));
    connect(exportAction, &QAction::triggered, this, &MainWindow::exportSpreadsheet);

    QAction *pdfAction = ac->addAction(QStringLiteral("export_pdf"));
    pdfAction->setText(i18n("Export PDF &Report..."));
    pdfAction->setIcon(QIcon::fromTheme(QStringLiteral("application-pdf")));
    pdfAction->setToolTip(i18n("Save the listed components as a PDF report"));
    KActionCollection::setDefaultShortcut(pdfAction,
                                          QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_P));
    connect(pdfAction, &QAction::triggered, this, &MainWindow::exportPdf);

    KStandardAction::print(this, &MainWindow::printReport, ac);
    KStandardAction::quit(qApp, &QCoreApplication::quit, ac);

    // ── Component ──
    QAction *newAction = KStandardAction::openNew(this, &MainWindow::newComponent, ac);
    newAction->setText(i18n("&New Component"));

    m_editAction = ac->addAction(QStringLiteral("edit_component"));
    m_editAction->setText(i18n("&Edit Component"));
    m_editAction->setIcon(QIcon::fromTheme(QStringLiteral("document-edit")));
    m_editAction->setEnabled(false);
    KActionCollection::setDefaultShortcut(m_editAction, QKeySequence(Qt::CTRL | Qt::Key_E));
    connect(m_editAction, &QAction::triggered, this, [this]() {
        const Component c = m_view->currentComponent();
        if (c.isValid())
            editComponent(c.id);
    });

    m_deleteAction = ac->addAction(QStringLiteral("delete_component"));
    m_deleteAction->setText(i18n("&Delete Component"));
    m_deleteAction->setIcon(QIcon::fromTheme(QStringLiteral("edit-delete")));
    m_deleteAction->setEnabled(false);
    KActionCollection::setDefaultShortcut(m_deleteAction, QKeySequence(Qt::Key_Delete));
    connect(m_deleteAction, &QAction::triggered, this, [this]() {
        deleteComponents(m_view->selectedIds());
    });

    connect(m_view, &ComponentView::selectionChanged, this, [this](bool hasSelection) {
        m_editAction->setEnabled(hasSelection && m_view->selectedIds().size() == 1);
        m_deleteAction->setEnabled(hasSelection);
    });

    KStandardAction::redisplay(this, &MainWindow::refresh, ac);

    // Standard preferences action - opens Settings dialog from menu bar
    KStandardAction::preferences(this, &MainWindow::showSettingsDialog, ac);
}

// ═════════════════════════════════════════════════════════════
// Storage
// ═════════════════════════════════════════════════════════════

bool MainWindow::openRepository()
{
    const QString path = CataloguePaths::databasePath(CatalogueSettings::databasePath());

    auto repository = std::make_unique<ComponentRepository>(path);
    if (!repository->initialize()) {
        showError(i18n("Database Error"),
                  i18n("Cannot open the catalogue database %1:\n%2",
                       path, repository->lastError()));
        // Keep working with the previous database, if there was one
        if (m_repository)
            return false;
    }

    m_repository = std::move(repository);
    m_databaseLabel->setText(QDir::toNativeSeparators(m_repository->databasePath()));
    qCDebug(CATALOGUE_LOG) << "Using database" << m_repository->databasePath();
    return true;
}

void MainWindow::refresh()
{
    bool ok = false;
    const QVector<Component> components = m_repository->list(QString(), &ok);
    if (!ok) {
        showError(i18n("Database Error"),
                  i18n("Cannot load components:\n%1", m_repository->lastError()));
        return;
    }

    const QStringList categories = m_repository->categories(&ok);
    if (!ok) {
        showError(i18n("Database Error"),
                  i18n("Cannot load categories:\n%1", m_repository->lastError()));
        return;
    }

    m_view->setComponents(components);
    m_view->setCategories(categories);
    m_form->setCategories(categories);

    const ReportTotals totals = ReportWriter::totals(components);
    m_statusLabel->setText(i18np("%1 component, total value %2",
                                 "%1 components, total value %2",
                                 totals.components,
                                 QLocale().toCurrencyString(totals.value)));
}

void MainWindow::showError(const QString &title, const QString &message)
{
    qCWarning(CATALOGUE_LOG) << title << message;
    QMessageBox::critical(this, title, message);
}

// ═════════════════════════════════════════════════════════════
// Slots: form and table requests
// ═════════════════════════════════════════════════════════════

void MainWindow::addComponent(const Component &component)
{
    const qint64 id = m_repository->create(component);
    if (id < 0) {
        showError(i18n("Add Failed"),
                  i18n("Cannot add \"%1\":\n%2", component.name, m_repository->lastError()));
        return;
    }

    m_form->clear();
    refresh();
    m_view->selectComponent(id);
    showStatus(i18n("Added \"%1\"", component.name));
}

void MainWindow::updateComponent(qint64 id, const Component &component)
{
    switch (m_repository->update(id, component)) {
    case ComponentRepository::Status::Ok:
        m_form->clear();
        refresh();
        m_view->selectComponent(id);
        showStatus(i18n("Updated \"%1\"", component.name));
        break;
    case ComponentRepository::Status::NotFound:
        m_form->clear();
        refresh();
        showError(i18n("Update Failed"),
                  i18n("\"%1\" no longer exists in the catalogue.", component.name));
        break;
    case ComponentRepository::Status::Invalid:
        m_form->showError(m_repository->lastError());
        break;
    case ComponentRepository::Status::StorageError:
        showError(i18n("Update Failed"),
                  i18n("Cannot update \"%1\":\n%2", component.name, m_repository->lastError()));
        break;
    }
}

void MainWindow::editComponent(qint64 id)
{
    bool ok = false;
    const Component c = m_repository->component(id, &ok);
    if (!ok) {
        showError(i18n("Database Error"),
                  i18n("Cannot load the component:\n%1", m_repository->lastError()));
        return;
    }
    if (!c.isValid()) {
        showStatus(i18n("The component no longer exists"));
        refresh();
        return;
    }
    m_form->editComponent(c);
}

void MainWindow::deleteComponents(const QVector<qint64> &ids)
{
    if (ids.isEmpty())
        return;

    QString question;
    if (ids.size() == 1) {
        const Component c = m_view->currentComponent();
        question = i18n("Delete \"%1\" from the catalogue?", c.isValid() ? c.name : QString());
    } else {
        question = i18np("Delete %1 component from the catalogue?",
                         "Delete %1 components from the catalogue?", ids.size());
    }

    const int answer = QMessageBox::question(this, i18n("Delete Component"), question,
                                             QMessageBox::Yes | QMessageBox::No,
                                             QMessageBox::No);
    if (answer != QMessageBox::Yes)
        return;

    int removed = 0;
    for (qint64 id : ids) {
        const ComponentRepository::Status status = m_repository->remove(id);
        if (status == ComponentRepository::Status::Ok) {
            ++removed;
            if (m_form->editingId() == id)
                m_form->clear();
        } else if (status == ComponentRepository::Status::StorageError) {
            showError(i18n("Delete Failed"),
                      i18n("Cannot delete the component:\n%1", m_repository->lastError()));
            break;
        }
        // NotFound: already gone, nothing to do
    }

    refresh();
    showStatus(i18np("Deleted %1 component", "Deleted %1 components", removed));
}

void MainWindow::newComponent()
{
    m_form->clear();
    m_form->setFocus();
}

// ═════════════════════════════════════════════════════════════
// Slots: spreadsheet import / export
// ═════════════════════════════════════════════════════════════

void MainWindow::importSpreadsheet()
{
    const QString path = QFileDialog::getOpenFileName(
        this, i18n("Import Spreadsheet"), dialogDirectory(),
        i18n("Spreadsheets (*.csv *.tsv *.tab *.txt);;All files (*)"));
    if (path.isEmpty())
        return;
    rememberDirectory(path);

    const ImportResult result = SpreadsheetIO::importFile(path, CatalogueSettings::defaultUnit());
    if (!result.ok) {
        showError(i18n("Import Failed"), result.errorString);
        return;
    }

    if (result.components.isEmpty()) {
        QMessageBox::information(this, i18n("Import"),
            i18n("No valid components found in %1.\n\n%2",
                 QFileInfo(path).fileName(), SpreadsheetIO::describe(result)));
        return;
    }

    // Preview what will be stored and let the user back out
    const int answer = QMessageBox::question(
        this, i18n("Import Preview"),
        i18n("%1\n\nImport these components into the catalogue?",
             SpreadsheetIO::describe(result)),
        QMessageBox::Yes | QMessageBox::No, QMessageBox::Yes);
    if (answer != QMessageBox::Yes) {
        showStatus(i18n("Import cancelled"));
        return;
    }

    const ImportSummary summary =
        m_repository->importComponents(result.components, duplicatePolicy());
    if (!summary.ok) {
        showError(i18n("Import Failed"),
                  i18n("Nothing was imported:\n%1", m_repository->lastError()));
        return;
    }

    refresh();

    QStringList details;
    details << i18np("Imported %1 component.", "Imported %1 components.", summary.inserted);
    if (summary.updated > 0)
        details << i18np("Updated %1 existing component.",
                         "Updated %1 existing components.", summary.updated);
    if (summary.skipped > 0)
        details << i18np("Skipped %1 component that already exists.",
                         "Skipped %1 components that already exist.", summary.skipped);
    if (result.skippedRows > 0)
        details << i18np("Skipped %1 invalid row.", "Skipped %1 invalid rows.",
                         result.skippedRows);
    if (!result.ignoredColumns.isEmpty())
        details << i18n("Ignored columns: %1",
                        result.ignoredColumns.join(QStringLiteral(", ")));

    showStatus(details.first());
    if (details.size() > 1)
        QMessageBox::information(this, i18n("Import"), details.join(QLatin1Char('\n')));
}

void MainWindow::createImportTemplate()
{
    QString path = QFileDialog::getSaveFileName(
        this, i18n("Create Import Template"),
        QDir(dialogDirectory()).filePath(QStringLiteral("catalogue_template.csv")),
        i18n("Comma-separated values (*.csv);;Tab-separated values (*.tsv)"));
    if (path.isEmpty())
        return;
    if (QFileInfo(path).suffix().isEmpty())
        path += QStringLiteral(".csv");
    rememberDirectory(path);

    QString error;
    if (!SpreadsheetIO::writeTemplate(path, &error)) {
        showError(i18n("Template Failed"), error);
        return;
    }

    QMessageBox::information(this, i18n("Template Created"),
        i18n("Import template saved to %1.\n\n"
             "Fill in your components, then use Import Spreadsheet to load it.",
             QDir::toNativeSeparators(path)));
}

void MainWindow::exportSpreadsheet()
{
    bool ok = false;
    const QVector<Component> components = m_repository->list(QString(), &ok);
    if (!ok) {
        showError(i18n("Export Failed"),
                  i18n("Cannot load components:\n%1", m_repository->lastError()));
        return;
    }

    QString path = QFileDialog::getSaveFileName(
        this, i18n("Export Spreadsheet"),
        QDir(dialogDirectory()).filePath(QStringLiteral("components.csv")),
        i18n("Comma-separated values (*.csv);;Tab-separated values (*.tsv)"));
    if (path.isEmpty())
        return;
    if (QFileInfo(path).suffix().isEmpty())
        path += QStringLiteral(".csv");
    rememberDirectory(path);

    QString error;
    if (!SpreadsheetIO::exportFile(components, path, &error)) {
        showError(i18n("Export Failed"), error);
        return;
    }
    showStatus(i18np("Exported %1 component to %2", "Exported %1 components to %2",
                     components.size(), QFileInfo(path).fileName()));
}

// ═════════════════════════════════════════════════════════════
// Slots: report
// ═════════════════════════════════════════════════════════════

void MainWindow::exportPdf()
{
    QString path = QFileDialog::getSaveFileName(
        this, i18n("Export PDF Report"),
        QDir(dialogDirectory()).filePath(QStringLiteral("component_catalogue.pdf")),
        i18n("PDF documents (*.pdf)"));
    if (path.isEmpty())
        return;
    if (QFileInfo(path).suffix().isEmpty())
        path += QStringLiteral(".pdf");
    rememberDirectory(path);

    // The report covers what the table currently shows
    const QVector<Component> components = m_view->visibleComponents();

    ReportWriter writer(reportOptions());
    if (!writer.writePdf(components, path)) {
        showError(i18n("Report Failed"), writer.errorString());
        return;
    }
    showStatus(i18np("Saved report (%1 page) to %2", "Saved report (%1 pages) to %2",
                     writer.pageCount(), QFileInfo(path).fileName()));
}

void MainWindow::printReport()
{
    const ReportOptions options = reportOptions();

    QPrinter printer(QPrinter::HighResolution);
    printer.setDocName(options.title);
    printer.setPageOrientation(options.orientation);

    QPrintDialog dialog(&printer, this);
    dialog.setWindowTitle(i18n("Print Catalogue"));
    if (dialog.exec() != QDialog::Accepted)
        return;

    ReportWriter writer(options);
    if (!writer.render(m_view->visibleComponents(), &printer)) {
        showError(i18n("Print Failed"), writer.errorString());
        return;
    }
    showStatus(i18np("Printed %1 page", "Printed %1 pages", writer.pageCount()));
}

ReportOptions MainWindow::reportOptions() const
{
    ReportOptions options;
    const QString title = CatalogueSettings::reportTitle().trimmed();
    if (!title.isEmpty())
        options.title = title;
    options.includeCategorySummary = CatalogueSettings::includeCategorySummary();
    options.orientation = CatalogueSettings::landscapeReport() ? QPageLayout::Landscape
                                                               : QPageLayout::Portrait;
    return options;
}

// ═════════════════════════════════════════════════════════════
// Settings
// ═════════════════════════════════════════════════════════════

void MainWindow::showSettingsDialog()
{
    // KConfigDialog manages singleton instances by name.
    // If the dialog already exists, it just raises it.
    if (KConfigDialog::showDialog(SettingsDialog::dialogName())) {
        return;
    }

    auto *dialog = new SettingsDialog(this);

    connect(dialog, &SettingsDialog::databasePathChanged,
            this, &MainWindow::onDatabasePathChanged);
    connect(dialog, &KConfigDialog::settingsChanged,
            this, &MainWindow::onSettingsChanged);

    dialog->show();
}

void MainWindow::onDatabasePathChanged()
{
    m_form->clear();
    if (openRepository())
        showStatus(i18n("Opened %1", m_repository->databasePath()));
    refresh();
}

void MainWindow::onSettingsChanged()
{
    m_form->setDefaultUnit(CatalogueSettings::defaultUnit());
}

ComponentRepository::DuplicatePolicy MainWindow::duplicatePolicy() const
{
    switch (CatalogueSettings::duplicatePolicy()) {
    case CatalogueSettings::EnumDuplicatePolicy::SkipExisting:
        return ComponentRepository::DuplicatePolicy::SkipExisting;
    case CatalogueSettings::EnumDuplicatePolicy::UpdateExisting:
        return ComponentRepository::DuplicatePolicy::UpdateExisting;
    default:
        return ComponentRepository::DuplicatePolicy::Append;
    }
}

QString MainWindow::dialogDirectory() const
{
    const QString dir = CatalogueSettings::lastDirectory();
    if (!dir.isEmpty() && QFileInfo(dir).isDir())
        return dir;
    return QDir::homePath();
}

void MainWindow::rememberDirectory(const QString &filePath)
{
    CatalogueSettings::setLastDirectory(QFileInfo(filePath).absolutePath());
    if (!CatalogueSettings::self()->save())
        qCWarning(CATALOGUE_LOG) << "Failed to save the last used directory";
}
