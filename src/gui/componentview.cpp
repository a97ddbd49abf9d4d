#include "componentview.h"
#include "componentfilterproxymodel.h"
#include "componentmodel.h"

#include <KLocalizedString>

#include <QComboBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QIcon>
#include <QItemSelectionModel>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QPushButton>
#include <QSet>
#include <QTableView>
#include <QVBoxLayout>

// Columns hidden by default
static const QSet<int> HIDDEN_COLUMNS = {
    static_cast<int>(ComponentColumn::ID),
    static_cast<int>(ComponentColumn::Modified),
};

ComponentView::ComponentView(QWidget *parent)
    : QWidget(parent)
    , m_model(new ComponentModel(this))
    , m_proxyModel(new ComponentFilterProxyModel(this))
    , m_tableView(new QTableView(this))
    , m_filterEdit(new QLineEdit(this))
    , m_categoryCombo(new QComboBox(this))
    , m_countLabel(new QLabel(this))
    , m_editButton(new QPushButton(QIcon::fromTheme(QStringLiteral("document-edit")),
                                   i18n("Edit"), this))
    , m_deleteButton(new QPushButton(QIcon::fromTheme(QStringLiteral("edit-delete")),
                                     i18n("Delete"), this))
{
    m_tableView->setObjectName(QStringLiteral("tableView"));
    m_filterEdit->setObjectName(QStringLiteral("filterEdit"));
    m_categoryCombo->setObjectName(QStringLiteral("categoryCombo"));
    m_countLabel->setObjectName(QStringLiteral("countLabel"));
    m_editButton->setObjectName(QStringLiteral("editButton"));
    m_deleteButton->setObjectName(QStringLiteral("deleteButton"));

    // --- Filter bar ---
    m_filterEdit->setPlaceholderText(i18n("Search by name, category, or description..."));
    m_filterEdit->setClearButtonEnabled(true);

    m_categoryCombo->setMinimumWidth(140);
    m_categoryCombo->addItem(i18n("All Categories"), QString());

    QHBoxLayout *filterLayout = new QHBoxLayout();
    filterLayout->addWidget(new QLabel(i18n("Search:"), this));
    filterLayout->addWidget(m_filterEdit, 1);
    filterLayout->addWidget(new QLabel(i18n("Category:"), this));
    filterLayout->addWidget(m_categoryCombo);
    filterLayout->addWidget(m_countLabel);

    // --- Proxy model for filtering and sorting ---
    m_proxyModel->setSourceModel(m_model);

    // --- Table view ---
    m_tableView->setModel(m_proxyModel);
    m_tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tableView->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_tableView->setAlternatingRowColors(true);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tableView->verticalHeader()->hide();
    m_tableView->horizontalHeader()->setSectionResizeMode(QHeaderView::Interactive);
    m_tableView->horizontalHeader()->setStretchLastSection(true);
    m_tableView->setSortingEnabled(true);
    m_tableView->sortByColumn(static_cast<int>(ComponentColumn::Name), Qt::AscendingOrder);

    // Enable right-click context menu on table rows
    m_tableView->setContextMenuPolicy(Qt::CustomContextMenu);

    // --- Row buttons ---
    m_editButton->setEnabled(false);
    m_deleteButton->setEnabled(false);

    QHBoxLayout *buttonLayout = new QHBoxLayout();
    buttonLayout->addStretch(1);
    buttonLayout->addWidget(m_editButton);
    buttonLayout->addWidget(m_deleteButton);

    // --- Main layout ---
    QVBoxLayout *mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(4, 4, 4, 4);
    mainLayout->addLayout(filterLayout);
    mainLayout->addWidget(m_tableView, 1);
    mainLayout->addLayout(buttonLayout);
    setLayout(mainLayout);

    setupColumns();
    updateCountLabel();

    // --- Connections ---
    connect(m_filterEdit, &QLineEdit::textChanged,
            this, &ComponentView::onFilterChanged);
    connect(m_categoryCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &ComponentView::onCategoryChanged);
    connect(m_tableView->selectionModel(), &QItemSelectionModel::selectionChanged,
            this, &ComponentView::onSelectionChanged);
    connect(m_tableView, &QTableView::doubleClicked,
            this, &ComponentView::onActivated);
    connect(m_editButton, &QPushButton::clicked,
            this, &ComponentView::requestEdit);
    connect(m_deleteButton, &QPushButton::clicked,
            this, &ComponentView::requestDelete);

    // Context menu on right-click
    connect(m_tableView, &QTableView::customContextMenuRequested,
            this, &ComponentView::showContextMenu);
}

void ComponentView::setComponents(const QVector<Component> &components)
{
    const QVector<qint64> previousSelection = selectedIds();

    m_model->setComponents(components);

    // Restore the selection for rows that still exist
    for (qint64 id : previousSelection) {
        const int sourceRow = m_model->rowForId(id);
        if (sourceRow < 0)
            continue;
        const QModelIndex proxyIdx = m_proxyModel->mapFromSource(m_model->index(sourceRow, 0));
        if (proxyIdx.isValid())
            m_tableView->selectionModel()->select(
                proxyIdx, QItemSelectionModel::Select | QItemSelectionModel::Rows);
    }

    updateCountLabel();
    onSelectionChanged();
}

void ComponentView::setCategories(const QStringList &categories)
{
    const QString current = m_categoryCombo->currentData().toString();

    // Rebuilding the items must not reset the filter on the way
    m_categoryCombo->blockSignals(true);
    m_categoryCombo->clear();
    m_categoryCombo->addItem(i18n("All Categories"), QString());
    for (const QString &category : categories)
        m_categoryCombo->addItem(category, category);

    const int index = current.isEmpty() ? 0 : m_categoryCombo->findData(current);
    m_categoryCombo->setCurrentIndex(index < 0 ? 0 : index);
    m_categoryCombo->blockSignals(false);

    // The selected category may have disappeared
    onCategoryChanged(m_categoryCombo->currentIndex());
}

int ComponentView::componentCount() const
{
    return m_model->rowCount();
}

int ComponentView::visibleCount() const
{
    return m_proxyModel->rowCount();
}

QVector<Component> ComponentView::visibleComponents() const
{
    return m_proxyModel->visibleComponents();
}

QVector<qint64> ComponentView::selectedIds() const
{
    QVector<qint64> ids;
    const QModelIndexList rows = m_tableView->selectionModel()->selectedRows();
    for (const QModelIndex &idx : rows)
        ids.append(idx.data(ComponentModel::IdRole).toLongLong());
    return ids;
}

Component ComponentView::currentComponent() const
{
    const QModelIndexList rows = m_tableView->selectionModel()->selectedRows();
    if (rows.isEmpty())
        return Component{};
    return m_model->componentAt(m_proxyModel->mapToSource(rows.first()).row());
}

void ComponentView::selectComponent(qint64 id)
{
    const int sourceRow = m_model->rowForId(id);
    if (sourceRow < 0)
        return;

    const QModelIndex proxyIdx = m_proxyModel->mapFromSource(m_model->index(sourceRow, 0));
    if (!proxyIdx.isValid())
        return;   // filtered out

    m_tableView->selectionModel()->select(
        proxyIdx, QItemSelectionModel::ClearAndSelect | QItemSelectionModel::Rows);
    m_tableView->scrollTo(proxyIdx);
}

void ComponentView::setupColumns()
{
    // Hide internal/technical columns by default
    for (int col = 0; col < m_model->columnCount(); ++col) {
        m_tableView->setColumnHidden(col, HIDDEN_COLUMNS.contains(col));
    }

    // Set sensible default widths for visible columns
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::Name),        160);
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::Category),    110);
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::Description), 200);
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::Quantity),     70);
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::Unit),         70);
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::CostPerUnit),  80);
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::TotalValue),   90);
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::Supplier),    120);
    m_tableView->setColumnWidth(static_cast<int>(ComponentColumn::Location),    100);
}

void ComponentView::updateCountLabel()
{
    // Show filtered count when any filtering is active
    m_countLabel->setText(m_proxyModel->isFiltering()
        ? i18n("%1 / %2 components", visibleCount(), componentCount())
        : i18np("%1 component", "%1 components", componentCount()));
}

void ComponentView::onFilterChanged(const QString &text)
{
    m_proxyModel->setSearchText(text);
    updateCountLabel();
}

void ComponentView::onCategoryChanged(int index)
{
    m_proxyModel->setCategory(m_categoryCombo->itemData(index).toString());
    updateCountLabel();
}

void ComponentView::onSelectionChanged()
{
    const int selected = m_tableView->selectionModel()->selectedRows().size();
    m_editButton->setEnabled(selected == 1);
    m_deleteButton->setEnabled(selected > 0);
    emit selectionChanged(selected > 0);
}

void ComponentView::onActivated(const QModelIndex &proxyIdx)
{
    if (!proxyIdx.isValid())
        return;
    emit editRequested(proxyIdx.data(ComponentModel::IdRole).toLongLong());
}

void ComponentView::requestEdit()
{
    const Component c = currentComponent();
    if (!c.isValid()) {
        emit statusMessage(i18n("Select a component to edit"));
        return;
    }
    emit editRequested(c.id);
}

void ComponentView::requestDelete()
{
    const QVector<qint64> ids = selectedIds();
    if (ids.isEmpty()) {
        emit statusMessage(i18n("Select a component to delete"));
        return;
    }
    emit deleteRequested(ids);
}

// ===========================================================================
//  Context menu (right-click on a table row)
// ===========================================================================

void ComponentView::showContextMenu(const QPoint &pos)
{
    QModelIndex proxyIdx = m_tableView->indexAt(pos);
    if (!proxyIdx.isValid())
        return;

    // A right-click outside the selection retargets it to the clicked row
    if (!m_tableView->selectionModel()->isRowSelected(proxyIdx.row(), QModelIndex())) {
        m_tableView->selectionModel()->select(
            proxyIdx, QItemSelectionModel::ClearAndSelect | QItemSelectionModel::Rows);
    }

    const int selected = m_tableView->selectionModel()->selectedRows().size();

    QMenu menu(this);

    QAction *editAct = menu.addAction(QIcon::fromTheme(QStringLiteral("document-edit")),
                                      i18n("Edit"));
    editAct->setEnabled(selected == 1);
    connect(editAct, &QAction::triggered, this, &ComponentView::requestEdit);

    menu.addSeparator();

    QAction *deleteAct = menu.addAction(QIcon::fromTheme(QStringLiteral("edit-delete")),
                                        selected > 1
                                            ? i18n("Delete %1 Components", selected)
                                            : i18n("Delete"));
    connect(deleteAct, &QAction::triggered, this, &ComponentView::requestDelete);

    menu.exec(m_tableView->viewport()->mapToGlobal(pos));
}
