// component.cpp
// Component Catalogue - catalogue record type
// Copyright (c) 2026 Component Catalogue Project

#include "component.h"

#include <KLocalizedString>

#include <QLocale>

bool Component::validate(QString *errorMessage) const
{
    QString message;
    if (name.trimmed().isEmpty())
        message = i18n("Component name is required.");
    else if (quantity < 0)
        message = i18n("Quantity of \"%1\" cannot be negative.", name.trimmed());
    else if (costPerUnit < 0.0)
        message = i18n("Cost per unit of \"%1\" cannot be negative.", name.trimmed());

    if (errorMessage)
        *errorMessage = message;
    return message.isEmpty();
}

Component Component::normalized(const QString &fallbackUnit) const
{
    Component c = *this;
    c.name        = name.trimmed();
    c.category    = category.trimmed();
    c.description = description.trimmed();
    c.unit        = unit.trimmed();
    c.supplier    = supplier.trimmed();
    c.location    = location.trimmed();
    c.notes       = notes.trimmed();
    if (c.unit.isEmpty())
        c.unit = fallbackUnit.trimmed().isEmpty() ? defaultUnit() : fallbackUnit.trimmed();
    return c;
}

bool Component::matchesText(const QString &text) const
{
    if (text.isEmpty())
        return true;
    return name.contains(text, Qt::CaseInsensitive)
        || category.contains(text, Qt::CaseInsensitive)
        || description.contains(text, Qt::CaseInsensitive);
}

bool Component::hasSameValues(const Component &other) const
{
    return name == other.name
        && category == other.category
        && description == other.description
        && quantity == other.quantity
        && unit == other.unit
        && costPerUnit == other.costPerUnit
        && supplier == other.supplier
        && location == other.location
        && notes == other.notes;
}

QString Component::fieldText(ComponentField field) const
{
    switch (field) {
    case ComponentField::Name:        return name;
    case ComponentField::Category:    return category;
    case ComponentField::Description: return description;
    case ComponentField::Quantity:    return QString::number(quantity);
    case ComponentField::Unit:        return unit;
    // Shortest representation that reads back to the same double
    case ComponentField::CostPerUnit:
        return QLocale::c().toString(costPerUnit, 'g', QLocale::FloatingPointShortest);
    case ComponentField::Supplier:    return supplier;
    case ComponentField::Location:    return location;
    case ComponentField::Notes:       return notes;
    default:                          return QString();
    }
}

QString Component::fieldTitle(ComponentField field)
{
    switch (field) {
    case ComponentField::Name:        return QStringLiteral("Name");
    case ComponentField::Category:    return QStringLiteral("Category");
    case ComponentField::Description: return QStringLiteral("Description");
    case ComponentField::Quantity:    return QStringLiteral("Quantity");
    case ComponentField::Unit:        return QStringLiteral("Unit");
    case ComponentField::CostPerUnit: return QStringLiteral("Cost per Unit");
    case ComponentField::Supplier:    return QStringLiteral("Supplier");
    case ComponentField::Location:    return QStringLiteral("Location");
    case ComponentField::Notes:       return QStringLiteral("Notes");
    default:                          return QString();
    }
}
