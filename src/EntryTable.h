#pragma once

#include <QVector>

#include "EntryIdentifier.h"
#include "EntryRow.h"

class EntryTable
{
public:
    const EntryRowList &rows() const;
    int rowCount() const;
    bool isEmpty() const;
    const EntryRow &rowAt(int row) const;

    int cursor() const;
    void setCursor(int row);
    void cursorUp();
    void cursorDown();
    const EntryRow *currentRow() const;

    void toggle(int row);
    void select(int row);
    void deselect(int row);
    void toggleCurrent();
    void selectAll();
    void deselectAll();
    void reverseSelection();
    void selectRangeUp();
    void selectRangeDown();
    void deselectRangeUp();
    void deselectRangeDown();

    bool hasExplicitSelection() const;
    QVector<int> selectedRows() const;
    QVector<EntryIdentifier> selectedIdentifiers() const;

    int indexOf(const EntryIdentifier &id) const;
    bool moveCursorTo(const EntryIdentifier &id);
    void setIdentifier(int row, const EntryIdentifier &id);
    void sortRows();
    void sync(const QVector<EntryIdentifier> &newIds);

private:
    bool isValidRow(int row) const;
    void setSelected(int row, bool selected);
    void extendRange(int step, bool selected);

    EntryRowList m_rows;
    int m_cursor = 0;
};
