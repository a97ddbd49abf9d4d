#pragma once

#include "component.h"

#include <QAbstractTableModel>
#include <QStringList>
#include <QVector>

// Table columns, in display order
enum class ComponentColumn : int {
    ID          = 0,
    Name        = 1,
    Category    = 2,
    Description = 3,
    Quantity    = 4,
    Unit        = 5,
    CostPerUnit = 6,
    TotalValue  = 7,
    Supplier    = 8,
    Location    = 9,
    Notes       = 10,
    Modified    = 11,
    COUNT       = 12
};

class ComponentModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    // Raw value for sorting (numbers and timestamps)
    static constexpr int SortRole = Qt::UserRole;
    // Component id of the row, for any column
    static constexpr int IdRole   = Qt::UserRole + 1;

    explicit ComponentModel(QObject *parent = nullptr);
    ~ComponentModel() override;

    // Replace the whole record set (after every fetch from the repository)
    void setComponents(const QVector<Component> &components);
    const QVector<Component> &components() const { return m_components; }

    // QAbstractTableModel interface
    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;

    // Return the full Component for a given row
    Component componentAt(int row) const;

    // Row holding component @p id, or -1
    int rowForId(qint64 id) const;

private:
    QVector<Component>  m_components;
    QStringList         m_headers;
};
