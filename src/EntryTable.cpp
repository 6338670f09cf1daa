/************************************************************************\

    Passdeck - Password store browser
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "EntryTable.h"

#include <algorithm>
#include <utility>

#include "EntryReconciler.h"

namespace {
struct EntryTableConstants {
    static constexpr int notFound = -1;
    static constexpr int stepUp = -1;
    static constexpr int stepDown = 1;
};
} // namespace

const EntryRowList &EntryTable::rows() const
{
    return m_rows;
}

int EntryTable::rowCount() const
{
    return m_rows.size();
}

bool EntryTable::isEmpty() const
{
    return m_rows.isEmpty();
}

const EntryRow &EntryTable::rowAt(int row) const
{
    return m_rows.at(row);
}

int EntryTable::cursor() const
{
    return m_cursor;
}

/**
 * @brief Moves the cursor, clamping it to the current row range.
 * @param row Requested row index.
 */
void EntryTable::setCursor(int row)
{
    m_cursor = EntryReconciler::clampCursor(row, m_rows.size());
}

void EntryTable::cursorUp()
{
    setCursor(m_cursor + EntryTableConstants::stepUp);
}

void EntryTable::cursorDown()
{
    setCursor(m_cursor + EntryTableConstants::stepDown);
}

/**
 * @brief Returns the row under the cursor.
 * @return Pointer to the cursor row, or nullptr when the table is empty.
 */
const EntryRow *EntryTable::currentRow() const
{
    if (m_rows.isEmpty()) {
        return nullptr;
    }
    return &m_rows.at(m_cursor);
}

void EntryTable::toggle(int row)
{
    if (!isValidRow(row)) {
        return;
    }
    m_rows[row].selected = !m_rows.at(row).selected;
}

void EntryTable::select(int row)
{
    setSelected(row, true);
}

void EntryTable::deselect(int row)
{
    setSelected(row, false);
}

void EntryTable::toggleCurrent()
{
    toggle(m_cursor);
}

void EntryTable::selectAll()
{
    for (EntryRow &row : m_rows) {
        row.selected = true;
    }
}

void EntryTable::deselectAll()
{
    for (EntryRow &row : m_rows) {
        row.selected = false;
    }
}

void EntryTable::reverseSelection()
{
    for (EntryRow &row : m_rows) {
        row.selected = !row.selected;
    }
}

void EntryTable::selectRangeUp()
{
    extendRange(EntryTableConstants::stepUp, true);
}

void EntryTable::selectRangeDown()
{
    extendRange(EntryTableConstants::stepDown, true);
}

void EntryTable::deselectRangeUp()
{
    extendRange(EntryTableConstants::stepUp, false);
}

void EntryTable::deselectRangeDown()
{
    extendRange(EntryTableConstants::stepDown, false);
}

bool EntryTable::hasExplicitSelection() const
{
    return std::any_of(m_rows.cbegin(), m_rows.cend(), [](const EntryRow &row) {
        return row.selected;
    });
}

/**
 * @brief Returns the indices of the rows an operation should act on.
 *
 * When nothing is selected explicitly the cursor row stands in for the
 * selection, so the result is only empty for an empty table.
 *
 * @return Ascending row indices.
 */
QVector<int> EntryTable::selectedRows() const
{
    QVector<int> rows;
    for (int i = 0; i < m_rows.size(); ++i) {
        if (m_rows.at(i).selected) {
            rows.append(i);
        }
    }
    if (rows.isEmpty() && !m_rows.isEmpty()) {
        rows.append(m_cursor);
    }
    return rows;
}

QVector<EntryIdentifier> EntryTable::selectedIdentifiers() const
{
    const QVector<int> rows = selectedRows();
    QVector<EntryIdentifier> ids;
    ids.reserve(rows.size());
    for (int row : rows) {
        ids.append(m_rows.at(row).identifier);
    }
    return ids;
}

int EntryTable::indexOf(const EntryIdentifier &id) const
{
    for (int i = 0; i < m_rows.size(); ++i) {
        if (m_rows.at(i).identifier == id) {
            return i;
        }
    }
    return EntryTableConstants::notFound;
}

/**
 * @brief Moves the cursor onto the row holding an identifier.
 * @param id Identifier to look for.
 * @return True if the row exists, false otherwise (cursor unchanged).
 */
bool EntryTable::moveCursorTo(const EntryIdentifier &id)
{
    const int row = indexOf(id);
    if (row == EntryTableConstants::notFound) {
        return false;
    }
    m_cursor = row;
    return true;
}

void EntryTable::setIdentifier(int row, const EntryIdentifier &id)
{
    if (!isValidRow(row)) {
        return;
    }
    m_rows[row].identifier = id;
}

/**
 * @brief Restores identifier order after in-place identifier updates.
 *
 * The cursor follows the row it pointed at and ordinals are recomputed.
 */
void EntryTable::sortRows()
{
    if (m_rows.isEmpty()) {
        return;
    }
    const EntryIdentifier current = m_rows.at(m_cursor).identifier;
    std::stable_sort(m_rows.begin(), m_rows.end(), [](const EntryRow &left, const EntryRow &right) {
        return left.identifier < right.identifier;
    });
    moveCursorTo(current);
    EntryReconciler::enumerate(m_rows);
}

/**
 * @brief Reconciles the rows against a fresh, sorted store listing.
 * @param newIds Identifiers currently present in the store, sorted.
 */
void EntryTable::sync(const QVector<EntryIdentifier> &newIds)
{
    sortRows();
    EntryReconciler::ReconcileResult result = EntryReconciler::reconcile(m_rows, m_cursor, newIds);
    m_rows = std::move(result.rows);
    m_cursor = result.cursor;
}

bool EntryTable::isValidRow(int row) const
{
    return row >= 0 && row < m_rows.size();
}

void EntryTable::setSelected(int row, bool selected)
{
    if (!isValidRow(row)) {
        return;
    }
    m_rows[row].selected = selected;
}

void EntryTable::extendRange(int step, bool selected)
{
    if (m_rows.isEmpty()) {
        return;
    }
    setSelected(m_cursor, selected);
    setCursor(m_cursor + step);
    setSelected(m_cursor, selected);
}
