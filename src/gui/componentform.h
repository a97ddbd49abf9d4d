// componentform.h
// Component Catalogue - entry form for adding and editing components
//
// Two states:
//   idle    - empty form, "Add" enabled
//   editing - form loaded from an existing component, "Update" enabled
// "Clear" (or a finished add/update/delete) returns to idle.
//
// Copyright (c) 2026 Component Catalogue Project

#ifndef COMPONENTFORM_H
#define COMPONENTFORM_H

#include "component.h"

#include <QWidget>

class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class QSpinBox;

class ComponentForm : public QWidget
{
    Q_OBJECT

public:
    explicit ComponentForm(QWidget *parent = nullptr);

    /// Load @p component and switch to the editing state.
    void editComponent(const Component &component);

    /// Reset every field and return to the idle state.
    void clear();

    /// Current field values (id is the edited component's, or -1).
    Component component() const;

    bool isEditing() const { return m_editingId >= 0; }
    qint64 editingId() const { return m_editingId; }

    /// Existing categories offered in the category drop-down.
    void setCategories(const QStringList &categories);

    /// Unit put into the form on clear().
    void setDefaultUnit(const QString &unit);

    /// Show an error inline (validation or a failed write).
    void showError(const QString &message);

Q_SIGNALS:
    void addRequested(const Component &component);
    void updateRequested(qint64 id, const Component &component);

private Q_SLOTS:
    void onAddClicked();
    void onUpdateClicked();

private:
    void updateButtons();

    /// Validate the form; on failure the message is shown inline.
    bool validateInput(Component *out);

    // ── Fields ──
    QLineEdit      *m_nameEdit;
    QComboBox      *m_categoryCombo;
    QPlainTextEdit *m_descriptionEdit;
    QSpinBox       *m_quantitySpin;
    QLineEdit      *m_unitEdit;
    QDoubleSpinBox *m_costSpin;
    QLineEdit      *m_supplierEdit;
    QLineEdit      *m_locationEdit;
    QPlainTextEdit *m_notesEdit;

    // ── Buttons ──
    QPushButton *m_addButton;
    QPushButton *m_updateButton;
    QPushButton *m_clearButton;

    QLabel *m_errorLabel;

    qint64  m_editingId = -1;
    double  m_loadedCost = 0.0;
    bool    m_costEdited = false;
    QString m_defaultUnit = Component::defaultUnit();
};

#endif // COMPONENTFORM_H
