#include "componentmodel.h"

#include <KLocalizedString>

#include <QColor>
#include <QLocale>

ComponentModel::ComponentModel(QObject *parent)
    : QAbstractTableModel(parent)
{
    m_headers = {
        i18n("ID"), i18n("Name"), i18n("Category"), i18n("Description"),
        i18n("Quantity"), i18n("Unit"), i18n("Cost/Unit"), i18n("Total Value"),
        i18n("Supplier"), i18n("Location"), i18n("Notes"), i18n("Modified")
    };
}

ComponentModel::~ComponentModel() = default;

void ComponentModel::setComponents(const QVector<Component> &components)
{
    beginResetModel();
    m_components = components;
    endResetModel();
}

int ComponentModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return m_components.size();
}

int ComponentModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return static_cast<int>(ComponentColumn::COUNT);
}

QVariant ComponentModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_components.size())
        return QVariant();

    const Component &c = m_components.at(index.row());
    const auto column = static_cast<ComponentColumn>(index.column());

    if (role == Qt::DisplayRole) {
        const QLocale locale;
        switch (column) {
        case ComponentColumn::ID:          return c.id;
        case ComponentColumn::Name:        return c.name;
        case ComponentColumn::Category:    return c.category;
        case ComponentColumn::Description: return c.description;
        case ComponentColumn::Quantity:    return locale.toString(c.quantity);
        case ComponentColumn::Unit:        return c.unit;
        case ComponentColumn::CostPerUnit: return locale.toCurrencyString(c.costPerUnit);
        case ComponentColumn::TotalValue:  return locale.toCurrencyString(c.totalValue());
        case ComponentColumn::Supplier:    return c.supplier;
        case ComponentColumn::Location:    return c.location;
        case ComponentColumn::Notes:       return c.notes;
        case ComponentColumn::Modified:
            return c.modified.isValid()
                ? locale.toString(c.modified.toLocalTime(), QLocale::ShortFormat)
                : QString();
        default:                           return QVariant();
        }
    }

    if (role == Qt::TextAlignmentRole) {
        switch (column) {
        case ComponentColumn::ID:
        case ComponentColumn::Quantity:
        case ComponentColumn::CostPerUnit:
        case ComponentColumn::TotalValue:
            return QVariant(Qt::AlignRight | Qt::AlignVCenter);
        default:
            return QVariant();
        }
    }

    if (role == Qt::ToolTipRole) {
        if (column == ComponentColumn::Description && !c.description.isEmpty())
            return c.description;
        if (column == ComponentColumn::Notes && !c.notes.isEmpty())
            return c.notes;
    }

    // Highlight components that are out of stock
    if (role == Qt::BackgroundRole) {
        if (c.quantity == 0)
            return QColor(255, 235, 235); // pale red
    }

    // Provide raw values for correct sorting
    if (role == SortRole) {
        switch (column) {
        case ComponentColumn::ID:          return c.id;
        case ComponentColumn::Quantity:    return c.quantity;
        case ComponentColumn::CostPerUnit: return c.costPerUnit;
        case ComponentColumn::TotalValue:  return c.totalValue();
        case ComponentColumn::Modified:    return c.modified;
        default:                           return data(index, Qt::DisplayRole);
        }
    }

    if (role == IdRole)
        return c.id;

    return QVariant();
}

QVariant ComponentModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (role != Qt::DisplayRole) return QVariant();
    if (orientation == Qt::Horizontal && section >= 0 && section < m_headers.size())
        return m_headers.at(section);
    if (orientation == Qt::Vertical)
        return section + 1;
    return QVariant();
}

Component ComponentModel::componentAt(int row) const
{
    if (row < 0 || row >= m_components.size())
        return Component{};
    return m_components.at(row);
}

int ComponentModel::rowForId(qint64 id) const
{
    for (int row = 0; row < m_components.size(); ++row) {
        if (m_components.at(row).id == id)
            return row;
    }
    return -1;
}
