// componentform.cpp
// Component Catalogue - entry form for adding and editing components
// Copyright (c) 2026 Component Catalogue Project

#include "componentform.h"

#include <KLocalizedString>

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QIcon>
#include <QLabel>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSpinBox>
#include <QVBoxLayout>

#include <climits>

ComponentForm::ComponentForm(QWidget *parent)
    : QWidget(parent)
    , m_nameEdit(new QLineEdit(this))
    , m_categoryCombo(new QComboBox(this))
    , m_descriptionEdit(new QPlainTextEdit(this))
    , m_quantitySpin(new QSpinBox(this))
    , m_unitEdit(new QLineEdit(this))
    , m_costSpin(new QDoubleSpinBox(this))
    , m_supplierEdit(new QLineEdit(this))
    , m_locationEdit(new QLineEdit(this))
    , m_notesEdit(new QPlainTextEdit(this))
    , m_addButton(new QPushButton(QIcon::fromTheme(QStringLiteral("list-add")),
                                  i18n("Add Component"), this))
    , m_updateButton(new QPushButton(QIcon::fromTheme(QStringLiteral("document-save")),
                                     i18n("Update Component"), this))
    , m_clearButton(new QPushButton(QIcon::fromTheme(QStringLiteral("edit-clear")),
                                    i18n("Clear Form"), this))
    , m_errorLabel(new QLabel(this))
{
    m_nameEdit->setPlaceholderText(i18n("Required"));

    m_categoryCombo->setEditable(true);
    m_categoryCombo->setInsertPolicy(QComboBox::NoInsert);

    m_descriptionEdit->setMaximumHeight(80);
    m_notesEdit->setMaximumHeight(80);
    m_descriptionEdit->setTabChangesFocus(true);
    m_notesEdit->setTabChangesFocus(true);

    m_quantitySpin->setRange(0, INT_MAX);

    m_costSpin->setRange(0.0, 1e12);
    m_costSpin->setDecimals(4);

    m_nameEdit->setObjectName(QStringLiteral("nameEdit"));
    m_quantitySpin->setObjectName(QStringLiteral("quantitySpin"));
    m_costSpin->setObjectName(QStringLiteral("costSpin"));
    m_addButton->setObjectName(QStringLiteral("addButton"));
    m_updateButton->setObjectName(QStringLiteral("updateButton"));
    m_clearButton->setObjectName(QStringLiteral("clearButton"));
    m_errorLabel->setObjectName(QStringLiteral("errorLabel"));

    m_unitEdit->setText(m_defaultUnit);

    m_errorLabel->setWordWrap(true);
    m_errorLabel->setStyleSheet(QStringLiteral("color: #c0392b; font-weight: bold;"));
    m_errorLabel->hide();

    // ── Fields ──
    auto *group = new QGroupBox(i18n("Component Details"), this);
    auto *formLayout = new QFormLayout(group);
    formLayout->addRow(i18n("Name:"),          m_nameEdit);
    formLayout->addRow(i18n("Category:"),      m_categoryCombo);
    formLayout->addRow(i18n("Description:"),   m_descriptionEdit);
    formLayout->addRow(i18n("Quantity:"),      m_quantitySpin);
    formLayout->addRow(i18n("Unit:"),          m_unitEdit);
    formLayout->addRow(i18n("Cost per Unit:"), m_costSpin);
    formLayout->addRow(i18n("Supplier:"),      m_supplierEdit);
    formLayout->addRow(i18n("Location:"),      m_locationEdit);
    formLayout->addRow(i18n("Notes:"),         m_notesEdit);

    // ── Buttons ──
    auto *buttonLayout = new QHBoxLayout();
    buttonLayout->addWidget(m_addButton);
    buttonLayout->addWidget(m_updateButton);
    buttonLayout->addWidget(m_clearButton);

    auto *mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(4, 4, 4, 4);
    mainLayout->addWidget(m_errorLabel);
    mainLayout->addWidget(group);
    mainLayout->addLayout(buttonLayout);
    mainLayout->addStretch(1);

    connect(m_addButton, &QPushButton::clicked, this, &ComponentForm::onAddClicked);
    connect(m_updateButton, &QPushButton::clicked, this, &ComponentForm::onUpdateClicked);
    connect(m_clearButton, &QPushButton::clicked, this, &ComponentForm::clear);

    // Any cost the user enters replaces the one loaded for editing
    connect(m_costSpin, &QDoubleSpinBox::valueChanged, this, [this]() {
        m_costEdited = true;
    });

    // Return in the name field submits the form
    connect(m_nameEdit, &QLineEdit::returnPressed, this, [this]() {
        if (isEditing())
            onUpdateClicked();
        else
            onAddClicked();
    });

    updateButtons();
}

// ═════════════════════════════════════════════════════════════
// State
// ═════════════════════════════════════════════════════════════

void ComponentForm::editComponent(const Component &component)
{
    m_editingId = component.id;

    m_nameEdit->setText(component.name);
    m_categoryCombo->setCurrentText(component.category);
    m_descriptionEdit->setPlainText(component.description);
    m_quantitySpin->setValue(component.quantity);
    m_unitEdit->setText(component.unit.isEmpty() ? m_defaultUnit : component.unit);
    m_costSpin->setValue(component.costPerUnit);
    m_loadedCost = component.costPerUnit;
    m_costEdited = false;
    m_supplierEdit->setText(component.supplier);
    m_locationEdit->setText(component.location);
    m_notesEdit->setPlainText(component.notes);

    m_errorLabel->hide();
    updateButtons();
    m_nameEdit->setFocus();
}

void ComponentForm::clear()
{
    m_editingId = -1;

    m_nameEdit->clear();
    m_categoryCombo->setCurrentIndex(-1);
    m_categoryCombo->clearEditText();
    m_descriptionEdit->clear();
    m_quantitySpin->setValue(0);
    m_unitEdit->setText(m_defaultUnit);
    m_costSpin->setValue(0.0);
    m_loadedCost = 0.0;
    m_costEdited = false;
    m_supplierEdit->clear();
    m_locationEdit->clear();
    m_notesEdit->clear();

    m_errorLabel->hide();
    updateButtons();
}

Component ComponentForm::component() const
{
    Component c;
    c.id          = m_editingId;
    c.name        = m_nameEdit->text().trimmed();
    c.category    = m_categoryCombo->currentText().trimmed();
    c.description = m_descriptionEdit->toPlainText().trimmed();
    c.quantity    = m_quantitySpin->value();
    c.unit        = m_unitEdit->text().trimmed();
    // The spin box shows a rounded cost; an untouched one keeps the stored value
    c.costPerUnit = (isEditing() && !m_costEdited) ? m_loadedCost : m_costSpin->value();
    c.supplier    = m_supplierEdit->text().trimmed();
    c.location    = m_locationEdit->text().trimmed();
    c.notes       = m_notesEdit->toPlainText().trimmed();
    if (c.unit.isEmpty())
        c.unit = m_defaultUnit;
    return c;
}

void ComponentForm::setCategories(const QStringList &categories)
{
    // Keep whatever the user typed while the list is rebuilt
    const QString text = m_categoryCombo->currentText();
    m_categoryCombo->clear();
    m_categoryCombo->addItems(categories);
    m_categoryCombo->setCurrentText(text);
}

void ComponentForm::setDefaultUnit(const QString &unit)
{
    const QString newUnit = unit.trimmed().isEmpty() ? Component::defaultUnit() : unit.trimmed();
    if (!isEditing() && m_unitEdit->text() == m_defaultUnit)
        m_unitEdit->setText(newUnit);
    m_defaultUnit = newUnit;
}

void ComponentForm::showError(const QString &message)
{
    m_errorLabel->setText(message);
    m_errorLabel->show();
}

void ComponentForm::updateButtons()
{
    m_addButton->setEnabled(!isEditing());
    m_updateButton->setEnabled(isEditing());
}

// ═════════════════════════════════════════════════════════════
// Submit
// ═════════════════════════════════════════════════════════════

bool ComponentForm::validateInput(Component *out)
{
    const Component c = component();
    QString message;
    if (!c.validate(&message)) {
        showError(message);
        m_nameEdit->setFocus();
        return false;
    }
    m_errorLabel->hide();
    *out = c;
    return true;
}

void ComponentForm::onAddClicked()
{
    Component c;
    if (!validateInput(&c))
        return;
    c.id = -1;
    Q_EMIT addRequested(c);
}

void ComponentForm::onUpdateClicked()
{
    if (!isEditing())
        return;

    Component c;
    if (!validateInput(&c))
        return;
    Q_EMIT updateRequested(m_editingId, c);
}
