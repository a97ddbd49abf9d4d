#pragma once

#include "component.h"

#include <QSortFilterProxyModel>
#include <QVector>

// ---------------------------------------------------------------------------
// Filters a ComponentModel by free text and category.  The text rule is the
// one the repository search uses (Component::matchesText), so the table
// shows exactly what a search would return.
// ---------------------------------------------------------------------------
class ComponentFilterProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit ComponentFilterProxyModel(QObject *parent = nullptr);

    void setSearchText(const QString &text);
    QString searchText() const { return m_searchText; }

    // Exact category, as stored; empty shows every category
    void setCategory(const QString &category);
    QString category() const { return m_category; }

    bool isFiltering() const;

    // Components of the visible rows, in view order
    QVector<Component> visibleComponents() const;

protected:
    bool filterAcceptsRow(int sourceRow,
                          const QModelIndex &sourceParent) const override;

private:
    QString m_searchText;
    QString m_category;
};
