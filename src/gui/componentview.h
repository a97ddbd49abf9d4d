#pragma once

#include "component.h"

#include <QStringList>
#include <QVector>
#include <QWidget>

class QComboBox;
class QTableView;
class QLineEdit;
class QLabel;
class QPushButton;
class ComponentModel;
class ComponentFilterProxyModel;

class ComponentView : public QWidget
{
    Q_OBJECT

public:
    explicit ComponentView(QWidget *parent = nullptr);

    // Replace the displayed record set (selection is kept where possible)
    void setComponents(const QVector<Component> &components);

    // Fill the category filter; the current choice survives if still present
    void setCategories(const QStringList &categories);

    // Return the number of components loaded / passing the filter
    int componentCount() const;
    int visibleCount() const;

    // Components passing the current filter, in view order
    QVector<Component> visibleComponents() const;

    // Ids of the selected rows, in view order
    QVector<qint64> selectedIds() const;

    // Current row's component (invalid if nothing is selected)
    Component currentComponent() const;

    void selectComponent(qint64 id);

signals:
    void statusMessage(const QString &message);
    void editRequested(qint64 id);
    void deleteRequested(const QVector<qint64> &ids);
    void selectionChanged(bool hasSelection);

private slots:
    void onFilterChanged(const QString &text);
    void onCategoryChanged(int index);
    void onSelectionChanged();
    void onActivated(const QModelIndex &proxyIdx);
    void requestEdit();
    void requestDelete();

    // Context menu
    void showContextMenu(const QPoint &pos);

private:
    void setupColumns();
    void updateCountLabel();

    ComponentModel            *m_model;
    ComponentFilterProxyModel *m_proxyModel;
    QTableView                *m_tableView;
    QLineEdit                 *m_filterEdit;
    QComboBox                 *m_categoryCombo;
    QLabel                    *m_countLabel;
    QPushButton               *m_editButton;
    QPushButton               *m_deleteButton;
};
