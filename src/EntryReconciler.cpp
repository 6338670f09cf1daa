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

#include "EntryReconciler.h"

#include <algorithm>

namespace EntryReconciler {

namespace {

EntryRow freshRow(const EntryIdentifier &id)
{
    EntryRow row;
    row.identifier = id;
    return row;
}

} // namespace

/**
 * @brief Merges the current rows with a fresh store listing.
 *
 * Both sequences must be sorted ascending. Rows whose identifier is still
 * listed keep their selection flag, rows that vanished are dropped and new
 * identifiers become unselected rows. The cursor is shifted by the number of
 * insertions minus removals that happened at or before it, so it keeps
 * pointing at the same entry when its neighbours change.
 *
 * @param oldRows Current rows, sorted by identifier.
 * @param cursor Current cursor index into oldRows.
 * @param newIds Fresh listing, sorted by identifier.
 * @return New rows (enumerated) and the adjusted cursor.
 */
ReconcileResult reconcile(const EntryRowList &oldRows, int cursor, const QVector<EntryIdentifier> &newIds)
{
    ReconcileResult result;
    result.rows.reserve(newIds.size());

    int i = 0;
    int j = 0;
    int cursorDelta = 0;

    while (i < newIds.size() && j < oldRows.size()) {
        const EntryIdentifier &nextId = newIds.at(i);
        const EntryRow &oldRow = oldRows.at(j);

        if (nextId < oldRow.identifier) {
            result.rows.append(freshRow(nextId));
            i += 1;
            if (j <= cursor) {
                cursorDelta += 1;
            }
        } else if (nextId > oldRow.identifier) {
            if (j <= cursor) {
                cursorDelta -= 1;
            }
            j += 1;
        } else {
            EntryRow kept = freshRow(nextId);
            kept.selected = oldRow.selected;
            result.rows.append(kept);
            i += 1;
            j += 1;
        }
    }

    // Anything left sorts after every remaining old row.
    while (i < newIds.size()) {
        result.rows.append(freshRow(newIds.at(i)));
        i += 1;
    }

    result.cursor = clampCursor(cursor + cursorDelta, result.rows.size());
    enumerate(result.rows);
    return result;
}

/**
 * @brief Recomputes the 1-based ordinal of every row from its position.
 * @param rows Rows to enumerate in place.
 */
void enumerate(EntryRowList &rows)
{
    for (int i = 0; i < rows.size(); ++i) {
        rows[i].ordinal = i + 1;
    }
}

int clampCursor(int cursor, int rowCount)
{
    if (rowCount <= 0) {
        return 0;
    }
    return std::clamp(cursor, 0, rowCount - 1);
}

} // namespace EntryReconciler
