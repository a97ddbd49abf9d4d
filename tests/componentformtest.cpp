// componentformtest.cpp
// Component Catalogue - tests for the add/edit entry form
// Copyright (c) 2026 Component Catalogue Project

#include "componentform.h"

#include <QDoubleSpinBox>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSignalSpy>
#include <QSpinBox>
#include <QTest>

namespace
{
Component storedComponent()
{
    Component c;
    c.id = 42;
    c.name = QStringLiteral("Relay 12V");
    c.category = QStringLiteral("Electronics");
    c.quantity = 3;
    c.unit = QStringLiteral("pieces");
    c.costPerUnit = 1.23456;
    c.supplier = QStringLiteral("Relay World");
    return c;
}
}

class ComponentFormTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void idleFormOffersAddOnly();
    void editingOffersUpdateOnly();
    void clearReturnsToIdle();
    void emptyNameBlocksSubmit();
    void addEmitsEnteredValues();
    void updateEmitsEditedId();
    void untouchedCostKeepsStoredPrecision();
    void editedCostReplacesStoredValue();
    void largeCostIsAccepted();

private:
    template<typename T>
    static T *child(ComponentForm &form, const char *name)
    {
        T *widget = form.findChild<T *>(QLatin1String(name));
        if (!widget)
            qFatal("missing form widget %s", name);
        return widget;
    }
};

void ComponentFormTest::idleFormOffersAddOnly()
{
    ComponentForm form;
    QVERIFY(!form.isEditing());
    QVERIFY(child<QPushButton>(form, "addButton")->isEnabled());
    QVERIFY(!child<QPushButton>(form, "updateButton")->isEnabled());
    QVERIFY(child<QPushButton>(form, "clearButton")->isEnabled());
    QVERIFY(child<QLabel>(form, "errorLabel")->isHidden());
    QCOMPARE(form.component().unit, Component::defaultUnit());
}

void ComponentFormTest::editingOffersUpdateOnly()
{
    ComponentForm form;
    form.editComponent(storedComponent());

    QVERIFY(form.isEditing());
    QCOMPARE(form.editingId(), qint64(42));
    QVERIFY(!child<QPushButton>(form, "addButton")->isEnabled());
    QVERIFY(child<QPushButton>(form, "updateButton")->isEnabled());
    QCOMPARE(child<QLineEdit>(form, "nameEdit")->text(), QStringLiteral("Relay 12V"));
    QCOMPARE(child<QSpinBox>(form, "quantitySpin")->value(), 3);
}

void ComponentFormTest::clearReturnsToIdle()
{
    ComponentForm form;
    form.setDefaultUnit(QStringLiteral("boxes"));
    form.editComponent(storedComponent());

    child<QPushButton>(form, "clearButton")->click();

    QVERIFY(!form.isEditing());
    QCOMPARE(form.editingId(), qint64(-1));
    QVERIFY(child<QPushButton>(form, "addButton")->isEnabled());
    QVERIFY(!child<QPushButton>(form, "updateButton")->isEnabled());
    QVERIFY(child<QLineEdit>(form, "nameEdit")->text().isEmpty());
    QCOMPARE(form.component().unit, QStringLiteral("boxes"));
    QCOMPARE(form.component().costPerUnit, 0.0);
}

void ComponentFormTest::emptyNameBlocksSubmit()
{
    ComponentForm form;
    QSignalSpy addSpy(&form, &ComponentForm::addRequested);
    QSignalSpy updateSpy(&form, &ComponentForm::updateRequested);

    child<QLineEdit>(form, "nameEdit")->setText(QStringLiteral("   "));
    child<QPushButton>(form, "addButton")->click();

    QCOMPARE(addSpy.count(), 0);
    auto *errorLabel = child<QLabel>(form, "errorLabel");
    QVERIFY(!errorLabel->isHidden());
    QVERIFY(!errorLabel->text().isEmpty());

    // Same rule while editing
    form.editComponent(storedComponent());
    QVERIFY(errorLabel->isHidden());
    child<QLineEdit>(form, "nameEdit")->clear();
    child<QPushButton>(form, "updateButton")->click();

    QCOMPARE(updateSpy.count(), 0);
    QVERIFY(!errorLabel->isHidden());
    QVERIFY(form.isEditing());
}

void ComponentFormTest::addEmitsEnteredValues()
{
    ComponentForm form;
    QSignalSpy addSpy(&form, &ComponentForm::addRequested);

    child<QLineEdit>(form, "nameEdit")->setText(QStringLiteral("  Washer M4 "));
    child<QSpinBox>(form, "quantitySpin")->setValue(250);
    child<QDoubleSpinBox>(form, "costSpin")->setValue(0.02);
    child<QPushButton>(form, "addButton")->click();

    QCOMPARE(addSpy.count(), 1);
    const Component added = addSpy.at(0).at(0).value<Component>();
    QCOMPARE(added.id, qint64(-1));
    QCOMPARE(added.name, QStringLiteral("Washer M4"));
    QCOMPARE(added.quantity, 250);
    QCOMPARE(added.costPerUnit, 0.02);
    QCOMPARE(added.unit, Component::defaultUnit());
    QVERIFY(child<QLabel>(form, "errorLabel")->isHidden());
}

void ComponentFormTest::updateEmitsEditedId()
{
    ComponentForm form;
    QSignalSpy addSpy(&form, &ComponentForm::addRequested);
    QSignalSpy updateSpy(&form, &ComponentForm::updateRequested);

    form.editComponent(storedComponent());
    child<QSpinBox>(form, "quantitySpin")->setValue(7);
    QTest::keyClick(child<QLineEdit>(form, "nameEdit"), Qt::Key_Return);

    QCOMPARE(addSpy.count(), 0);
    QCOMPARE(updateSpy.count(), 1);
    QCOMPARE(updateSpy.at(0).at(0).toLongLong(), qint64(42));
    const Component updated = updateSpy.at(0).at(1).value<Component>();
    QCOMPARE(updated.name, QStringLiteral("Relay 12V"));
    QCOMPARE(updated.quantity, 7);
    QCOMPARE(updated.supplier, QStringLiteral("Relay World"));
}

void ComponentFormTest::untouchedCostKeepsStoredPrecision()
{
    Component stored = storedComponent();
    stored.costPerUnit = 0.123456789;

    ComponentForm form;
    form.editComponent(stored);
    QCOMPARE(form.component().costPerUnit, 0.123456789);

    // Loading another component resets what counts as untouched
    stored.costPerUnit = 12.3456789;
    form.editComponent(stored);
    QCOMPARE(form.component().costPerUnit, 12.3456789);
}

void ComponentFormTest::editedCostReplacesStoredValue()
{
    ComponentForm form;
    form.editComponent(storedComponent());

    child<QDoubleSpinBox>(form, "costSpin")->setValue(2.5);
    QCOMPARE(form.component().costPerUnit, 2.5);

    form.clear();
    child<QDoubleSpinBox>(form, "costSpin")->setValue(0.0125);
    QCOMPARE(form.component().costPerUnit, 0.0125);
}

void ComponentFormTest::largeCostIsAccepted()
{
    ComponentForm form;
    auto *costSpin = child<QDoubleSpinBox>(form, "costSpin");
    costSpin->setValue(2500000.0);
    QCOMPARE(costSpin->value(), 2500000.0);
    QCOMPARE(form.component().costPerUnit, 2500000.0);
}

QTEST_MAIN(ComponentFormTest)

#include "componentformtest.moc"
