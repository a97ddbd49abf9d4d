#include "componentfilterproxymodel.h"
#include "componentmodel.h"

ComponentFilterProxyModel::ComponentFilterProxyModel(QObject *parent)
    : QSortFilterProxyModel(parent)
{
    setSortRole(ComponentModel::SortRole);
    setSortCaseSensitivity(Qt::CaseInsensitive);
    setSortLocaleAware(true);
}

void ComponentFilterProxyModel::setSearchText(const QString &text)
{
    if (m_searchText != text) {
        m_searchText = text;
        invalidateFilter();
    }
}

void ComponentFilterProxyModel::setCategory(const QString &category)
{
    if (m_category != category) {
        m_category = category;
        invalidateFilter();
    }
}

bool ComponentFilterProxyModel::isFiltering() const
{
    return !m_searchText.trimmed().isEmpty() || !m_category.isEmpty();
}

QVector<Component> ComponentFilterProxyModel::visibleComponents() const
{
    QVector<Component> result;
    auto *model = qobject_cast<ComponentModel *>(sourceModel());
    if (!model)
        return result;

    result.reserve(rowCount());
    for (int row = 0; row < rowCount(); ++row) {
        const QModelIndex sourceIdx = mapToSource(index(row, 0));
        result.append(model->componentAt(sourceIdx.row()));
    }
    return result;
}

bool ComponentFilterProxyModel::filterAcceptsRow(int sourceRow,
                                                 const QModelIndex &sourceParent) const
{
    Q_UNUSED(sourceParent)

    auto *model = qobject_cast<ComponentModel *>(sourceModel());
    if (!model)
        return true;

    const Component c = model->componentAt(sourceRow);

    if (!m_category.isEmpty() && c.category != m_category)
        return false;

    return c.matchesText(m_searchText.trimmed());
}
