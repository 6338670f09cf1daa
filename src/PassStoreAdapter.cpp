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

#include "PassStoreAdapter.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QProcessEnvironment>

#include <algorithm>

#include "InputValidators.h"
#include "Logger.h"

namespace {

struct PassStoreConstants {
    static constexpr int minimumFieldLine = 1;
    static constexpr int successExitCode = 0;
    static constexpr int waitForever = -1;
};

constexpr char storeDirEnv[] = "PASSWORD_STORE_DIR";

/**
 * @brief Checks whether a file or folder name is hidden.
 * @param name File or folder name without path.
 * @return True if the name starts with the hidden marker.
 */
bool isHidden(const QString &name)
{
    return name.startsWith(QLatin1Char('.'));
}

void setError(QString *error, const char *message)
{
    if (error) {
        *error = QCoreApplication::translate("PassStoreAdapter", message);
    }
}

} // namespace

PassStoreAdapter::PassStoreAdapter(const StoreSettings &settings)
    : m_settings(settings)
{
}

QString PassStoreAdapter::storePath() const
{
    return m_settings.storePath();
}

/**
 * @brief Lists every entry of the store.
 *
 * Only files with the entry suffix are reported. Hidden files are skipped and
 * hidden folders are not descended into.
 *
 * @return Identifiers sorted ascending.
 */
QVector<EntryIdentifier> PassStoreAdapter::listEntries() const
{
    QVector<EntryIdentifier> entries;
    const QDir root(m_settings.storePath());
    if (!root.exists()) {
        Logger::core()->warn("Password store {} does not exist", qUtf8Printable(root.path()));
        return entries;
    }
    collectEntries(root, QString(), entries);
    std::sort(entries.begin(), entries.end());
    return entries;
}

bool PassStoreAdapter::exists(const EntryIdentifier &id) const
{
    return QFileInfo::exists(filePath(id));
}

/**
 * @brief Checks whether moving candidates to a destination would overwrite entries.
 * @param candidates Entries about to be moved.
 * @param destination Store-relative destination folder.
 * @param keepCategory True when each entry keeps its category below the destination.
 * @return True if at least one target file already exists.
 */
bool PassStoreAdapter::hasConflict(const QVector<EntryIdentifier> &candidates,
                                   const QString &destination,
                                   bool keepCategory) const
{
    for (const EntryIdentifier &candidate : candidates) {
        const QString targetDir = keepCategory
            ? EntryPathUtils::joinSegments({destination, candidate.category})
            : EntryPathUtils::joinSegments({destination});
        const QString target = EntryPathUtils::joinSegments({targetDir, candidate.name});
        const EntryIdentifier targetId = EntryPathUtils::parse(target);
        if (exists(targetId)) {
            return true;
        }
    }
    return false;
}

bool PassStoreAdapter::move(const EntryIdentifier &id, const QString &destinationDir, QString *error)
{
    const QString source = filePath(id);
    if (!QFileInfo::exists(source)) {
        setError(error, "Source not found");
        return false;
    }
    const QString targetDir = directoryPath(destinationDir);
    if (!QDir().mkpath(targetDir)) {
        setError(error, "Cannot create target folder");
        return false;
    }
    const QString target = QDir(targetDir).filePath(id.name + QLatin1String(EntryPathUtils::entrySuffix));
    if (QFileInfo::exists(target)) {
        setError(error, "Target already exists");
        return false;
    }
    if (!QFile::rename(source, target)) {
        setError(error, "Move failed");
        return false;
    }
    return true;
}

bool PassStoreAdapter::remove(const EntryIdentifier &id, QString *error)
{
    const QString path = filePath(id);
    if (!QFileInfo::exists(path)) {
        setError(error, "Source not found");
        return false;
    }
    if (!QFile::remove(path)) {
        setError(error, "Failed to delete");
        return false;
    }
    return true;
}

/**
 * @brief Renames an entry within its profile and category.
 * @param id Entry to rename.
 * @param newName New entry name, a single path segment.
 * @param error Optional output error message.
 * @return True if the rename succeeds, false otherwise.
 */
bool PassStoreAdapter::rename(const EntryIdentifier &id, const QString &newName, QString *error)
{
    const QString nameError = InputValidators::validateEntryName(newName);
    if (!nameError.isEmpty()) {
        if (error) {
            *error = nameError;
        }
        return false;
    }

    const QString source = filePath(id);
    if (!QFileInfo::exists(source)) {
        setError(error, "Source not found");
        return false;
    }

    EntryIdentifier target = id;
    target.name = newName.trimmed();
    if (target == id) {
        setError(error, "Name unchanged");
        return false;
    }
    const QString targetPath = filePath(target);
    if (QFileInfo::exists(targetPath)) {
        setError(error, "Target already exists");
        return false;
    }
    if (!QDir().mkpath(QFileInfo(targetPath).absolutePath())) {
        setError(error, "Cannot create target folder");
        return false;
    }
    if (!QFile::rename(source, targetPath)) {
        setError(error, "Rename failed");
        return false;
    }
    return true;
}

/**
 * @brief Creates a new entry through the external command.
 *
 * The secret is the first line of the entry and the secondary field, when
 * given, the second one.
 */
bool PassStoreAdapter::insert(const EntryIdentifier &id, const QString &secret, const QString &secondary, QString *error)
{
    if (exists(id)) {
        setError(error, "Entry already exists");
        return false;
    }

    QByteArray input = secret.toUtf8() + '\n';
    if (!secondary.isEmpty()) {
        input += secondary.toUtf8() + '\n';
    }
    return runPass({QStringLiteral("insert"), QStringLiteral("--multiline"), EntryPathUtils::format(id)}, input, error);
}

bool PassStoreAdapter::copyField(const EntryIdentifier &id, int line, QString *error)
{
    if (line < PassStoreConstants::minimumFieldLine) {
        setError(error, "Invalid field");
        return false;
    }
    const QString option = QStringLiteral("-c%1").arg(line);
    return runPass({QStringLiteral("show"), option, EntryPathUtils::format(id)}, QByteArray(), error);
}

void PassStoreAdapter::pruneEmptyDirectories()
{
    const QString root = m_settings.storePath();
    if (!QDir(root).exists()) {
        return;
    }
    pruneFolder(root, true);
}

/**
 * @brief Hands the terminal to the external editor and waits for it to exit.
 * @param id Entry to edit.
 */
void PassStoreAdapter::edit(const EntryIdentifier &id)
{
    QProcess process;
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QLatin1String(storeDirEnv), m_settings.storePath());
    process.setProcessEnvironment(environment);
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.setInputChannelMode(QProcess::ForwardedInputChannel);
    process.start(m_settings.passExecutable(), {QStringLiteral("edit"), EntryPathUtils::format(id)});
    if (!process.waitForStarted()) {
        Logger::core()->error("Cannot start {}: {}",
                              qUtf8Printable(m_settings.passExecutable()),
                              qUtf8Printable(process.errorString()));
        return;
    }
    process.waitForFinished(PassStoreConstants::waitForever);
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != PassStoreConstants::successExitCode) {
        Logger::core()->warn("Editing {} exited with code {}",
                             qUtf8Printable(EntryPathUtils::format(id)), process.exitCode());
    }
}

QString PassStoreAdapter::filePath(const EntryIdentifier &id) const
{
    return EntryPathUtils::storeFilePath(m_settings.storePath(), id);
}

QString PassStoreAdapter::directoryPath(const QString &relativeDir) const
{
    const QString cleaned = EntryPathUtils::joinSegments({relativeDir});
    if (cleaned.isEmpty()) {
        return m_settings.storePath();
    }
    return QDir(m_settings.storePath()).filePath(cleaned);
}

void PassStoreAdapter::collectEntries(const QDir &dir, const QString &relativeDir, QVector<EntryIdentifier> &entries) const
{
    const QLatin1String suffix(EntryPathUtils::entrySuffix);
    const QFileInfoList children = dir.entryInfoList(QDir::Dirs | QDir::Files | QDir::NoDotAndDotDot, QDir::NoSort);
    for (const QFileInfo &child : children) {
        const QString name = child.fileName();
        if (isHidden(name)) {
            continue;
        }
        if (child.isDir()) {
            if (child.isSymLink()) {
                continue;
            }
            collectEntries(QDir(child.absoluteFilePath()), EntryPathUtils::joinSegments({relativeDir, name}), entries);
            continue;
        }
        if (!name.endsWith(suffix) || name.size() == suffix.size()) {
            continue;
        }
        const QString entryName = name.left(name.size() - suffix.size());
        entries.append(EntryPathUtils::parse(EntryPathUtils::joinSegments({relativeDir, entryName})));
    }
}

/**
 * @brief Removes empty folders below a path, deepest first.
 * @param path Folder to prune.
 * @param isRoot True for the store root, which is never removed.
 * @return True if the folder was removed.
 */
bool PassStoreAdapter::pruneFolder(const QString &path, bool isRoot)
{
    const QDir dir(path);
    const QFileInfoList children = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::NoSort);
    for (const QFileInfo &child : children) {
        if (isHidden(child.fileName()) || child.isSymLink()) {
            continue;
        }
        pruneFolder(child.absoluteFilePath(), false);
    }
    if (isRoot) {
        return false;
    }
    const QStringList remaining = dir.entryList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
    if (!remaining.isEmpty()) {
        return false;
    }
    if (!QDir().rmdir(path)) {
        Logger::core()->debug("Could not remove empty folder {}", qUtf8Printable(path));
        return false;
    }
    return true;
}

bool PassStoreAdapter::runPass(const QStringList &arguments, const QByteArray &input, QString *error) const
{
    QProcess process;
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QLatin1String(storeDirEnv), m_settings.storePath());
    process.setProcessEnvironment(environment);
    process.setStandardOutputFile(QProcess::nullDevice());
    process.start(m_settings.passExecutable(), arguments);
    if (!process.waitForStarted()) {
        Logger::core()->error("Cannot start {}: {}",
                              qUtf8Printable(m_settings.passExecutable()),
                              qUtf8Printable(process.errorString()));
        setError(error, "Cannot start the pass command");
        return false;
    }
    if (!input.isEmpty()) {
        process.write(input);
    }
    process.closeWriteChannel();
    process.waitForFinished(PassStoreConstants::waitForever);

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != PassStoreConstants::successExitCode) {
        const QString stderrText = QString::fromLocal8Bit(process.readAllStandardError()).trimmed();
        Logger::core()->warn("{} {} exited with code {}: {}",
                             qUtf8Printable(m_settings.passExecutable()),
                             qUtf8Printable(arguments.first()),
                             process.exitCode(),
                             qUtf8Printable(stderrText));
        setError(error, "The pass command failed");
        return false;
    }
    return true;
}
