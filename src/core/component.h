// component.h
// Component Catalogue - catalogue record type
// Copyright (c) 2026 Component Catalogue Project

#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QVector>

// Editable fields, in the fixed spreadsheet column order
enum class ComponentField : int {
    Name        = 0,
    Category    = 1,
    Description = 2,
    Quantity    = 3,
    Unit        = 4,
    CostPerUnit = 5,
    Supplier    = 6,
    Location    = 7,
    Notes       = 8,
    COUNT       = 9
};

// Represents one row of the components table
struct Component {
    qint64  id = -1;          // assigned by the store, -1 until persisted
    QString name;
    QString category;
    QString description;
    int     quantity = 0;
    QString unit = defaultUnit();
    double  costPerUnit = 0.0;
    QString supplier;
    QString location;
    QString notes;
    QDateTime created;
    QDateTime modified;

    static QString defaultUnit() { return QStringLiteral("pieces"); }

    bool isValid() const { return id >= 0; }

    double totalValue() const { return quantity * costPerUnit; }

    /// Check the persistence invariants (non-empty name, no negative amounts).
    /// On failure a user-facing message is stored in @p errorMessage.
    bool validate(QString *errorMessage = nullptr) const;

    /// Copy with surrounding whitespace trimmed from every text field and an
    /// empty unit replaced by @p fallbackUnit.  Stored and imported records
    /// both take this form.
    Component normalized(const QString &fallbackUnit = defaultUnit()) const;

    /// Case-insensitive substring match on name, category and description.
    /// An empty @p text matches every component.
    bool matchesText(const QString &text) const;

    /// Compare every editable field; id and timestamps are ignored.
    bool hasSameValues(const Component &other) const;

    /// Field value as display text (numbers in C locale).
    QString fieldText(ComponentField field) const;

    /// Header title used for spreadsheets ("Name", "Cost per Unit", ...)
    static QString fieldTitle(ComponentField field);
};

Q_DECLARE_METATYPE(Component)
