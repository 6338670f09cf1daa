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

#include "BulkOperationCoordinator.h"

#include "EntryIdentifier.h"
#include "EntryTable.h"
#include "InputValidators.h"
#include "Logger.h"
#include "StoreAdapter.h"

namespace {

struct CoordinatorConstants {
    static constexpr int emptyCount = 0;
    static constexpr int singleStep = 1;
};

constexpr char severityInformation[] = "information";
constexpr char severityWarning[] = "warning";
constexpr char severityError[] = "error";

QVariantMap makeResult(bool ok, const QString &title, const QString &message, const char *severity)
{
    QVariantMap result;
    result.insert("ok", ok);
    result.insert("failed", CoordinatorConstants::emptyCount);
    result.insert("conflict", false);
    result.insert("title", title);
    result.insert("message", message);
    result.insert("severity", QString::fromLatin1(severity));
    if (!ok) {
        result.insert("error", message);
    }
    return result;
}

} // namespace

BulkOperationCoordinator::BulkOperationCoordinator(EntryTable &table, StoreAdapter &store, int clipTimeSeconds)
    : m_table(table)
    , m_store(store)
    , m_clipTimeSeconds(clipTimeSeconds)
{
}

/**
 * @brief Reconciles the table with the current store contents.
 */
void BulkOperationCoordinator::refresh()
{
    const int previousCursor = m_table.cursor();
    const QVector<EntryIdentifier> entries = m_store.listEntries();
    m_table.sync(entries);
    Logger::core()->debug("Resynced {} entries, cursor {} -> {}", entries.size(), previousCursor, m_table.cursor());
}

/**
 * @brief Removes the selected entries, or the cursor entry when nothing is selected.
 *
 * Every entry is attempted even when an earlier one fails. Empty folders are
 * pruned and the table is resynced whatever the outcome.
 *
 * @return Result map including ok, failed, and message fields.
 */
QVariantMap BulkOperationCoordinator::deleteSelected()
{
    if (m_table.isEmpty()) {
        return makeResult(false, tr("Removal failure"), tr("Nothing to delete"), severityError);
    }

    const QVector<EntryIdentifier> targets = m_table.selectedIdentifiers();
    int failed = CoordinatorConstants::emptyCount;
    QString firstError;
    for (const EntryIdentifier &id : targets) {
        QString error;
        if (!m_store.remove(id, &error)) {
            failed += CoordinatorConstants::singleStep;
            if (firstError.isEmpty()) {
                firstError = error;
            }
            Logger::core()->warn("Failed to remove {}: {}",
                                 qUtf8Printable(EntryPathUtils::format(id)), qUtf8Printable(error));
        }
    }

    m_store.pruneEmptyDirectories();
    refresh();
    Logger::core()->info("Removed {} of {} entries", targets.size() - failed, targets.size());

    if (failed > CoordinatorConstants::emptyCount) {
        QVariantMap result = makeResult(false,
                                        tr("Removal failure"),
                                        tr("Failed to remove %n password(s).", nullptr, failed),
                                        severityWarning);
        result.insert("failed", failed);
        result.insert("error", firstError.isEmpty() ? result.value("message").toString() : firstError);
        return result;
    }
    return makeResult(true, tr("Success!"), tr("Removal succeeded."), severityInformation);
}

/**
 * @brief Moves the selected entries below a destination folder.
 *
 * The whole batch is checked for conflicts first and nothing is touched when
 * any target is occupied. The check and the moves are not atomic, so a store
 * modified in between still shows up as per-item failures.
 *
 * @param destination Store-relative destination folder.
 * @param keepCategory True to recreate each entry's category below the destination.
 * @return Result map including ok, failed, conflict, and message fields.
 */
QVariantMap BulkOperationCoordinator::moveSelected(const QString &destination, bool keepCategory)
{
    if (m_table.isEmpty()) {
        return makeResult(false, tr("Failed to move passwords"), tr("Nothing to move"), severityError);
    }
    const QString destinationError = InputValidators::validateDirPath(destination);
    if (!destinationError.isEmpty()) {
        return makeResult(false, tr("Failed to move passwords"), destinationError, severityError);
    }

    const QVector<int> rows = m_table.selectedRows();
    const QVector<EntryIdentifier> targets = m_table.selectedIdentifiers();
    if (m_store.hasConflict(targets, destination, keepCategory)) {
        Logger::core()->warn("Move to '{}' aborted, conflicts detected", qUtf8Printable(destination));
        QVariantMap result = makeResult(false,
                                        tr("Failed to move passwords"),
                                        tr("Conflicts detected, resolve them before moving."),
                                        severityError);
        result.insert("conflict", true);
        return result;
    }

    int failed = CoordinatorConstants::emptyCount;
    QString firstError;
    for (int row : rows) {
        const EntryIdentifier id = m_table.rowAt(row).identifier;
        const QString targetDir = keepCategory
            ? EntryPathUtils::joinSegments({destination, id.category})
            : EntryPathUtils::joinSegments({destination});
        QString error;
        if (!m_store.move(id, targetDir, &error)) {
            failed += CoordinatorConstants::singleStep;
            if (firstError.isEmpty()) {
                firstError = error;
            }
            Logger::core()->warn("Failed to move {} to '{}': {}",
                                 qUtf8Printable(EntryPathUtils::format(id)),
                                 qUtf8Printable(targetDir),
                                 qUtf8Printable(error));
            continue;
        }
        m_table.setIdentifier(row, EntryPathUtils::parse(EntryPathUtils::joinSegments({targetDir, id.name})));
    }

    m_store.pruneEmptyDirectories();
    refresh();
    Logger::core()->info("Moved {} of {} entries to '{}'", rows.size() - failed, rows.size(), qUtf8Printable(destination));

    if (failed > CoordinatorConstants::emptyCount) {
        QVariantMap result = makeResult(false,
                                        tr("Partial Failure"),
                                        tr("Failed to move %n password(s).", nullptr, failed),
                                        severityWarning);
        result.insert("failed", failed);
        result.insert("error", firstError.isEmpty() ? result.value("message").toString() : firstError);
        return result;
    }
    return makeResult(true, tr("Success!"), tr("Move succeeded."), severityInformation);
}

/**
 * @brief Renames one entry and keeps the cursor on it.
 *
 * Reconciliation sees a rename as a removal plus an insertion, so the cursor
 * is put back on the renamed entry explicitly.
 *
 * @param row Row of the entry to rename.
 * @param newName New entry name.
 * @return Result map including ok and message fields.
 */
QVariantMap BulkOperationCoordinator::renameEntry(int row, const QString &newName)
{
    if (row < 0 || row >= m_table.rowCount()) {
        return makeResult(false, tr("Rename fail!"), tr("Nothing to rename"), severityError);
    }
    const QString nameError = InputValidators::validateEntryName(newName);
    if (!nameError.isEmpty()) {
        return makeResult(false, tr("Rename fail!"), nameError, severityError);
    }

    const EntryIdentifier source = m_table.rowAt(row).identifier;
    EntryIdentifier target = source;
    target.name = newName.trimmed();

    QString error;
    if (!m_store.rename(source, target.name, &error)) {
        Logger::core()->warn("Failed to rename {}: {}",
                             qUtf8Printable(EntryPathUtils::format(source)), qUtf8Printable(error));
        return makeResult(false, tr("Rename fail!"), error.isEmpty() ? tr("Rename failed") : error, severityError);
    }

    m_store.pruneEmptyDirectories();
    refresh();
    m_table.moveCursorTo(target);
    Logger::core()->info("Renamed {} to {}",
                         qUtf8Printable(EntryPathUtils::format(source)),
                         qUtf8Printable(EntryPathUtils::format(target)));
    return makeResult(true, tr("Success!"), tr("Rename succeeded."), severityInformation);
}

/**
 * @brief Creates a new entry and moves the cursor onto it.
 * @param profile Profile of the new entry, may be empty.
 * @param category Category of the new entry, may be empty or nested.
 * @param name Entry name.
 * @param secret First line of the entry.
 * @param secondary Optional second line (username).
 * @return Result map including ok and message fields.
 */
QVariantMap BulkOperationCoordinator::insertEntry(const QString &profile,
                                                  const QString &category,
                                                  const QString &name,
                                                  const QString &secret,
                                                  const QString &secondary)
{
    const QString nameError = InputValidators::validateEntryName(name);
    if (!nameError.isEmpty()) {
        return makeResult(false, tr("Insertion failure"), nameError, severityError);
    }
    if (secret.isEmpty()) {
        return makeResult(false, tr("Insertion failure"), tr("The password field cannot be empty"), severityError);
    }

    const EntryIdentifier id = EntryPathUtils::parse(EntryPathUtils::joinSegments({profile, category, name.trimmed()}));
    if (m_store.exists(id)) {
        QVariantMap result = makeResult(false, tr("Insertion failure"), tr("Entry already exists"), severityError);
        result.insert("conflict", true);
        return result;
    }

    QString error;
    if (!m_store.insert(id, secret, secondary, &error)) {
        Logger::core()->warn("Failed to insert {}: {}", qUtf8Printable(EntryPathUtils::format(id)), qUtf8Printable(error));
        QVariantMap result = makeResult(false, tr("Insertion failure"), tr("Password insertion failed."), severityError);
        if (!error.isEmpty()) {
            result.insert("error", error);
        }
        return result;
    }

    refresh();
    m_table.moveCursorTo(id);
    Logger::core()->info("Inserted {}", qUtf8Printable(EntryPathUtils::format(id)));
    return makeResult(true, tr("Success!"), tr("Password insertion succeeded."), severityInformation);
}

/**
 * @brief Moves the cursor onto the row matching a store path.
 * @param path Store-relative entry path.
 * @return True if a row matched, false otherwise.
 */
bool BulkOperationCoordinator::findAndSelect(const QString &path)
{
    return m_table.moveCursorTo(EntryPathUtils::parse(path));
}

QVariantMap BulkOperationCoordinator::copyCurrentField(FieldLine line)
{
    const EntryRow *current = m_table.currentRow();
    if (!current) {
        return makeResult(false, tr("Copy failed!"), tr("Nothing to copy"), severityError);
    }

    const bool secretField = line == SecretLine;
    QString error;
    if (!m_store.copyField(current->identifier, line, &error)) {
        const QString message = secretField
            ? tr("Ensure the password field exists.")
            : tr("Ensure the user field exists.");
        QVariantMap result = makeResult(false, tr("Copy failed!"), message, severityError);
        if (!error.isEmpty()) {
            result.insert("error", error);
        }
        return result;
    }

    const QString message = secretField
        ? tr("Password will be cleared in %1 seconds.").arg(m_clipTimeSeconds)
        : tr("Username will be cleared in %1 seconds.").arg(m_clipTimeSeconds);
    return makeResult(true, secretField ? tr("Password copied!") : tr("Username copied!"), message, severityInformation);
}

void BulkOperationCoordinator::editCurrent()
{
    const EntryRow *current = m_table.currentRow();
    if (!current) {
        return;
    }
    m_store.edit(current->identifier);
    refresh();
}
