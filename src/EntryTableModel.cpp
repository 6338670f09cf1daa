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

#include "EntryTableModel.h"

#include "Logger.h"
#include "StoreAdapter.h"
#include "StoreSettings.h"

namespace {

struct EntryTableModelConstants {
    static constexpr int emptyCount = 0;
    static constexpr int firstRow = 0;
};

constexpr char selectedMarker[] = "■";

} // namespace

/**
 * @brief Constructs the table model and wires the periodic resync timer.
 * @param store Store the table mirrors.
 * @param settings Settings providing the resync interval and clip time.
 * @param parent Parent QObject for ownership.
 */
EntryTableModel::EntryTableModel(StoreAdapter &store, const StoreSettings &settings, QObject *parent)
    : QAbstractTableModel(parent)
    , m_store(store)
    , m_coordinator(m_table, store, settings.clipTimeSeconds())
{
    m_refreshTimer.setInterval(settings.refreshIntervalMs());
    m_refreshTimer.setSingleShot(false);
    connect(&m_refreshTimer, &QTimer::timeout, this, &EntryTableModel::sync);
}

/**
 * @brief Returns the number of rows for the model.
 * @param parent Parent index (unused for table model).
 * @return Number of rows.
 */
int EntryTableModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_table.rowCount();
}

int EntryTableModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return ColumnCount;
}

/**
 * @brief Returns data for a given model index and role.
 * @param index Model index to read.
 * @param role Data role identifier.
 * @return Role-specific data for the index.
 */
QVariant EntryTableModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_table.rowCount()) {
        return {};
    }

    const EntryRow &row = m_table.rowAt(index.row());

    switch (role) {
    case Qt::DisplayRole:
        switch (index.column()) {
        case SelectionColumn:
            return row.selected ? QString::fromUtf8(selectedMarker) : QString();
        case ProfileColumn:
            return row.identifier.profile;
        case CategoryColumn:
            return row.identifier.category;
        case NameColumn:
            return row.identifier.name;
        default:
            return {};
        }
    case ProfileRole:
        return row.identifier.profile;
    case CategoryRole:
        return row.identifier.category;
    case NameRole:
        return row.identifier.name;
    case PathRole:
        return EntryPathUtils::toDisplayString(row.identifier);
    case SelectedRole:
        return row.selected;
    case OrdinalRole:
        return row.ordinal;
    case CurrentRole:
        return index.row() == m_table.cursor();
    default:
        return {};
    }
}

QVariant EntryTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (role != Qt::DisplayRole) {
        return {};
    }
    if (orientation == Qt::Vertical) {
        if (section < 0 || section >= m_table.rowCount()) {
            return {};
        }
        return m_table.rowAt(section).ordinal;
    }
    switch (section) {
    case SelectionColumn:
        return QString();
    case ProfileColumn:
        return tr("Profile");
    case CategoryColumn:
        return tr("Category");
    case NameColumn:
        return tr("Name");
    default:
        return {};
    }
}

/**
 * @brief Returns the role names exposed to views.
 * @return Mapping from role ids to role names.
 */
QHash<int, QByteArray> EntryTableModel::roleNames() const
{
    QHash<int, QByteArray> names = QAbstractTableModel::roleNames();
    names.insert(ProfileRole, "profile");
    names.insert(CategoryRole, "category");
    names.insert(NameRole, "name");
    names.insert(PathRole, "path");
    names.insert(SelectedRole, "selected");
    names.insert(OrdinalRole, "ordinal");
    names.insert(CurrentRole, "current");
    return names;
}

const EntryTable &EntryTableModel::table() const
{
    return m_table;
}

int EntryTableModel::cursorRow() const
{
    return m_table.cursor();
}

void EntryTableModel::setCursorRow(int row)
{
    const int previous = m_table.cursor();
    m_table.setCursor(row);
    applySelectionChange(previous);
}

int EntryTableModel::selectedCount() const
{
    int count = EntryTableModelConstants::emptyCount;
    for (const EntryRow &row : m_table.rows()) {
        if (row.selected) {
            count += 1;
        }
    }
    return count;
}

EntryTableModel::PendingAction EntryTableModel::pendingAction() const
{
    return m_pendingAction;
}

bool EntryTableModel::autoRefresh() const
{
    return m_refreshTimer.isActive();
}

/**
 * @brief Reconciles the rows with the store.
 *
 * The model is only reset when the listing differs from the current rows, so
 * an idle periodic resync leaves attached views untouched.
 */
void EntryTableModel::sync()
{
    const QVector<EntryIdentifier> entries = m_store.listEntries();
    if (entries == identifiers()) {
        emit synced();
        return;
    }
    const int previousCursor = m_table.cursor();
    beginResetModel();
    m_table.sync(entries);
    endResetModel();
    Logger::core()->debug("Table resynced, {} rows, cursor {} -> {}",
                          m_table.rowCount(), previousCursor, m_table.cursor());
    if (previousCursor != m_table.cursor()) {
        emit cursorRowChanged();
    }
    emit selectionChanged();
    emit synced();
}

void EntryTableModel::startAutoRefresh()
{
    if (m_refreshTimer.isActive()) {
        return;
    }
    m_refreshTimer.start();
    emit autoRefreshChanged();
}

void EntryTableModel::stopAutoRefresh()
{
    if (!m_refreshTimer.isActive()) {
        return;
    }
    m_refreshTimer.stop();
    emit autoRefreshChanged();
}

void EntryTableModel::cursorUp()
{
    const int previous = m_table.cursor();
    m_table.cursorUp();
    applySelectionChange(previous);
}

void EntryTableModel::cursorDown()
{
    const int previous = m_table.cursor();
    m_table.cursorDown();
    applySelectionChange(previous);
}

void EntryTableModel::toggleCurrent()
{
    const int previous = m_table.cursor();
    m_table.toggleCurrent();
    applySelectionChange(previous);
}

void EntryTableModel::selectAll()
{
    const int previous = m_table.cursor();
    m_table.selectAll();
    applySelectionChange(previous);
}

void EntryTableModel::deselectAll()
{
    const int previous = m_table.cursor();
    m_table.deselectAll();
    applySelectionChange(previous);
}

void EntryTableModel::reverseSelection()
{
    const int previous = m_table.cursor();
    m_table.reverseSelection();
    applySelectionChange(previous);
}

void EntryTableModel::selectRangeUp()
{
    const int previous = m_table.cursor();
    m_table.selectRangeUp();
    applySelectionChange(previous);
}

void EntryTableModel::selectRangeDown()
{
    const int previous = m_table.cursor();
    m_table.selectRangeDown();
    applySelectionChange(previous);
}

void EntryTableModel::deselectRangeUp()
{
    const int previous = m_table.cursor();
    m_table.deselectRangeUp();
    applySelectionChange(previous);
}

void EntryTableModel::deselectRangeDown()
{
    const int previous = m_table.cursor();
    m_table.deselectRangeDown();
    applySelectionChange(previous);
}

/**
 * @brief Returns the display paths an operation would act on.
 * @return Paths of the selected rows, or of the cursor row when none is selected.
 */
QStringList EntryTableModel::selectedPaths() const
{
    QStringList paths;
    for (const EntryIdentifier &id : m_table.selectedIdentifiers()) {
        paths.append(EntryPathUtils::toDisplayString(id));
    }
    return paths;
}

QStringList EntryTableModel::allPaths() const
{
    QStringList paths;
    paths.reserve(m_table.rowCount());
    for (const EntryRow &row : m_table.rows()) {
        paths.append(EntryPathUtils::toDisplayString(row.identifier));
    }
    return paths;
}

bool EntryTableModel::requestDelete()
{
    return beginPending(DeleteAction, selectedPaths());
}

bool EntryTableModel::requestMove()
{
    return beginPending(MoveAction, selectedPaths());
}

bool EntryTableModel::requestRename()
{
    const EntryRow *current = m_table.currentRow();
    if (!current) {
        return false;
    }
    if (m_pendingAction != NoAction) {
        return false;
    }
    // Set before the request is emitted, a view may resolve it from its slot.
    m_pendingTarget = current->identifier;
    if (!beginPending(RenameAction, {EntryPathUtils::toDisplayString(m_pendingTarget)})) {
        m_pendingTarget = EntryIdentifier();
        return false;
    }
    return true;
}

bool EntryTableModel::requestFind()
{
    return beginPending(FindAction, allPaths());
}

/**
 * @brief Completes a delete request once the confirmation dialog closes.
 * @param accepted True when the user confirmed the deletion.
 * @return Result map of the operation, or a cancelled result.
 */
QVariantMap EntryTableModel::resolveDelete(bool accepted)
{
    if (!takePending(DeleteAction) || !accepted) {
        return cancelledResult();
    }
    QVariantMap result;
    runStructuralChange([this, &result]() { result = m_coordinator.deleteSelected(); });
    return notify(result);
}

/**
 * @brief Completes a move request once the destination dialog closes.
 * @param accepted True when the user confirmed the move.
 * @param destination Store-relative destination folder.
 * @param keepCategory True to keep each entry's category below the destination.
 * @return Result map of the operation, or a cancelled result.
 */
QVariantMap EntryTableModel::resolveMove(bool accepted, const QString &destination, bool keepCategory)
{
    if (!takePending(MoveAction) || !accepted) {
        return cancelledResult();
    }
    QVariantMap result;
    runStructuralChange([this, &result, &destination, keepCategory]() {
        result = m_coordinator.moveSelected(destination, keepCategory);
    });
    return notify(result);
}

QVariantMap EntryTableModel::resolveRename(bool accepted, const QString &newName)
{
    const EntryIdentifier target = m_pendingTarget;
    m_pendingTarget = EntryIdentifier();
    if (!takePending(RenameAction) || !accepted) {
        return cancelledResult();
    }

    // The periodic resync may have shifted the row while the dialog was open.
    const int row = m_table.indexOf(target);
    if (row < EntryTableModelConstants::firstRow) {
        QVariantMap result;
        result.insert("ok", false);
        result.insert("failed", EntryTableModelConstants::emptyCount);
        result.insert("conflict", false);
        result.insert("title", tr("Rename fail!"));
        result.insert("message", tr("Source not found"));
        result.insert("error", tr("Source not found"));
        result.insert("severity", QStringLiteral("error"));
        return notify(result);
    }

    QVariantMap result;
    runStructuralChange([this, &result, row, &newName]() { result = m_coordinator.renameEntry(row, newName); });
    return notify(result);
}

bool EntryTableModel::resolveFind(bool accepted, const QString &path)
{
    if (!takePending(FindAction) || !accepted) {
        return false;
    }
    const int previous = m_table.cursor();
    const bool found = m_coordinator.findAndSelect(path);
    applySelectionChange(previous);
    return found;
}

void EntryTableModel::cancelPending()
{
    if (m_pendingAction == NoAction) {
        return;
    }
    m_pendingAction = NoAction;
    m_pendingTarget = EntryIdentifier();
    emit pendingActionChanged();
}

QVariantMap EntryTableModel::insertEntry(const QString &profile,
                                         const QString &category,
                                         const QString &name,
                                         const QString &secret,
                                         const QString &secondary)
{
    QVariantMap result;
    runStructuralChange([&]() { result = m_coordinator.insertEntry(profile, category, name, secret, secondary); });
    return notify(result);
}

QVariantMap EntryTableModel::copyPassword()
{
    return notify(m_coordinator.copyCurrentField(BulkOperationCoordinator::SecretLine));
}

QVariantMap EntryTableModel::copyUsername()
{
    return notify(m_coordinator.copyCurrentField(BulkOperationCoordinator::SecondaryLine));
}

/**
 * @brief Runs the external editor on the cursor entry.
 *
 * The periodic resync is paused while the editor owns the terminal and the
 * table is resynced once it exits.
 */
void EntryTableModel::editCurrent()
{
    if (m_table.isEmpty()) {
        return;
    }
    const bool resume = m_refreshTimer.isActive();
    m_refreshTimer.stop();
    runStructuralChange([this]() { m_coordinator.editCurrent(); });
    if (resume) {
        m_refreshTimer.start();
    }
}

QVector<EntryIdentifier> EntryTableModel::identifiers() const
{
    QVector<EntryIdentifier> ids;
    ids.reserve(m_table.rowCount());
    for (const EntryRow &row : m_table.rows()) {
        ids.append(row.identifier);
    }
    return ids;
}

/**
 * @brief Records a pending dialog-driven action.
 *
 * Only one action can wait for a dialog at a time and nothing happens to the
 * store until the matching resolve call.
 */
bool EntryTableModel::beginPending(PendingAction action, const QStringList &paths)
{
    if (m_pendingAction != NoAction || m_table.isEmpty()) {
        return false;
    }
    m_pendingAction = action;
    emit pendingActionChanged();
    emit confirmationRequested(action, paths);
    return true;
}

bool EntryTableModel::takePending(PendingAction action)
{
    if (m_pendingAction != action) {
        return false;
    }
    m_pendingAction = NoAction;
    emit pendingActionChanged();
    return true;
}

QVariantMap EntryTableModel::cancelledResult() const
{
    QVariantMap result;
    result.insert("ok", false);
    result.insert("cancelled", true);
    result.insert("failed", EntryTableModelConstants::emptyCount);
    result.insert("conflict", false);
    return result;
}

QVariantMap EntryTableModel::notify(const QVariantMap &result)
{
    emit notificationRaised(result.value("title").toString(),
                            result.value("message").toString(),
                            result.value("severity").toString());
    return result;
}

void EntryTableModel::applySelectionChange(int previousCursor)
{
    if (m_table.isEmpty()) {
        return;
    }
    const QModelIndex first = index(EntryTableModelConstants::firstRow, SelectionColumn);
    const QModelIndex last = index(m_table.rowCount() - 1, ColumnCount - 1);
    emit dataChanged(first, last, {Qt::DisplayRole, SelectedRole, CurrentRole});
    if (previousCursor != m_table.cursor()) {
        emit cursorRowChanged();
    }
    emit selectionChanged();
}

template <typename Operation>
void EntryTableModel::runStructuralChange(Operation operation)
{
    const int previousCursor = m_table.cursor();
    beginResetModel();
    operation();
    endResetModel();
    if (previousCursor != m_table.cursor()) {
        emit cursorRowChanged();
    }
    emit selectionChanged();
}
