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

#include "CommandLineRunner.h"

#include <QTextStream>

#include <cstdio>

#include "EntryIdentifier.h"
#include "EntryTableModel.h"
#include "Logger.h"
#include "PassStoreAdapter.h"
#include "StoreSettings.h"

namespace {

struct CommandLineConstants {
    static constexpr int defaultFieldLine = 1;
    static constexpr int minimumMoveArguments = 2;
};

QTextStream &standardOutput()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &standardError()
{
    static QTextStream stream(stderr);
    return stream;
}

} // namespace

CommandLineRunner::CommandLineRunner(QCoreApplication &app)
    : m_app(app)
    , m_storeOption(QStringList{QStringLiteral("s"), QStringLiteral("store")},
                    tr("Password store folder."), tr("folder"))
    , m_verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                      tr("Enable debug logging."))
    , m_keepCategoriesOption(QStringList{QStringLiteral("k"), QStringLiteral("keep-categories")},
                             tr("Keep categories below the move destination."))
    , m_secondaryOption(QStringLiteral("secondary"), tr("Second line of a new entry (username)."), tr("text"))
    , m_lineOption(QStringLiteral("line"), tr("Line to copy to the clipboard (1 password, 2 username)."), tr("line"),
                   QString::number(CommandLineConstants::defaultFieldLine))
{
    m_parser.setApplicationDescription(tr("Browse and reorganize a pass password store."));
    m_parser.addHelpOption();
    m_parser.addVersionOption();
    m_parser.addOption(m_storeOption);
    m_parser.addOption(m_verboseOption);
    m_parser.addOption(m_keepCategoriesOption);
    m_parser.addOption(m_secondaryOption);
    m_parser.addOption(m_lineOption);
    m_parser.addPositionalArgument(QStringLiteral("command"),
                                   tr("list, find, rm, mv, rename, insert, edit, copy or watch."));
    m_parser.addPositionalArgument(QStringLiteral("arguments"), tr("Command arguments."), tr("[arguments...]"));
}

/**
 * @brief Parses the command line, sets up the store and runs the command.
 * @return Process exit code.
 */
int CommandLineRunner::run()
{
    m_parser.process(m_app);

    StoreSettings settings = StoreSettings::load();
    if (m_parser.isSet(m_storeOption)) {
        settings.setStorePath(m_parser.value(m_storeOption));
    }
    const spdlog::level::level_enum level = m_parser.isSet(m_verboseOption)
        ? spdlog::level::debug
        : Logger::levelFromName(settings.logLevel());
    Logger::init(settings.logDirectory().toStdString(), level);

    const QStringList positional = m_parser.positionalArguments();
    if (positional.isEmpty()) {
        return usageError(tr("Missing command."));
    }
    if (!settings.storeExists()) {
        standardError() << tr("Password store not found: %1").arg(settings.storePath()) << Qt::endl;
        return Failure;
    }

    PassStoreAdapter store(settings);
    return dispatch(store, settings);
}

/**
 * @brief Runs one command line against an already opened store.
 *
 * Unlike run(), parse errors are reported as usage errors instead of
 * exiting the process, and logging is left as configured by the caller.
 *
 * @param arguments Full argument list, program name first.
 * @param store Store the command operates on.
 * @param settings Settings providing clip time and resync interval.
 * @return Process exit code.
 */
int CommandLineRunner::execute(const QStringList &arguments, StoreAdapter &store, const StoreSettings &settings)
{
    if (!m_parser.parse(arguments)) {
        return usageError(m_parser.errorText());
    }
    return dispatch(store, settings);
}

int CommandLineRunner::dispatch(StoreAdapter &store, const StoreSettings &settings)
{
    const QStringList positional = m_parser.positionalArguments();
    if (positional.isEmpty()) {
        return usageError(tr("Missing command."));
    }
    EntryTableModel model(store, settings);
    model.sync();

    return runCommand(positional.first(), positional.mid(1), model);
}

int CommandLineRunner::runCommand(const QString &command, const QStringList &arguments, EntryTableModel &model)
{
    if (command == QLatin1String("list")) {
        printTable(model);
        return Success;
    }
    if (command == QLatin1String("watch")) {
        return runWatch(model);
    }
    if (command == QLatin1String("find")) {
        if (arguments.size() != 1) {
            return usageError(tr("find expects one entry path."));
        }
        if (!focusPath(model, arguments.first())) {
            standardError() << tr("Entry not found: %1").arg(arguments.first()) << Qt::endl;
            return Failure;
        }
        standardOutput() << model.table().currentRow()->ordinal << ' '
                         << EntryPathUtils::toDisplayString(model.table().currentRow()->identifier) << Qt::endl;
        return Success;
    }
    if (command == QLatin1String("rm")) {
        if (arguments.isEmpty()) {
            return usageError(tr("rm expects at least one entry path."));
        }
        if (!selectPaths(model, arguments) || !model.requestDelete()) {
            return Failure;
        }
        return report(model.resolveDelete(true));
    }
    if (command == QLatin1String("mv")) {
        if (arguments.size() < CommandLineConstants::minimumMoveArguments) {
            return usageError(tr("mv expects a destination and at least one entry path."));
        }
        if (!selectPaths(model, arguments.mid(1)) || !model.requestMove()) {
            return Failure;
        }
        return report(model.resolveMove(true, arguments.first(), m_parser.isSet(m_keepCategoriesOption)));
    }
    if (command == QLatin1String("rename")) {
        if (arguments.size() != 2) {
            return usageError(tr("rename expects an entry path and a new name."));
        }
        if (!focusPath(model, arguments.first()) || !model.requestRename()) {
            standardError() << tr("Entry not found: %1").arg(arguments.first()) << Qt::endl;
            return Failure;
        }
        return report(model.resolveRename(true, arguments.at(1)));
    }
    if (command == QLatin1String("insert")) {
        if (arguments.size() != 1) {
            return usageError(tr("insert expects one entry path."));
        }
        QTextStream input(stdin);
        const QString secret = input.readLine();
        const EntryIdentifier id = EntryPathUtils::parse(arguments.first());
        return report(model.insertEntry(id.profile, id.category, id.name, secret, m_parser.value(m_secondaryOption)));
    }
    if (command == QLatin1String("edit")) {
        if (arguments.size() != 1) {
            return usageError(tr("edit expects one entry path."));
        }
        if (!focusPath(model, arguments.first())) {
            standardError() << tr("Entry not found: %1").arg(arguments.first()) << Qt::endl;
            return Failure;
        }
        model.editCurrent();
        return Success;
    }
    if (command == QLatin1String("copy")) {
        if (arguments.size() != 1) {
            return usageError(tr("copy expects one entry path."));
        }
        if (!focusPath(model, arguments.first())) {
            standardError() << tr("Entry not found: %1").arg(arguments.first()) << Qt::endl;
            return Failure;
        }
        bool ok = false;
        const int line = m_parser.value(m_lineOption).toInt(&ok);
        if (!ok || (line != BulkOperationCoordinator::SecretLine && line != BulkOperationCoordinator::SecondaryLine)) {
            return usageError(tr("--line must be 1 or 2."));
        }
        return report(line == BulkOperationCoordinator::SecretLine ? model.copyPassword() : model.copyUsername());
    }
    return usageError(tr("Unknown command: %1").arg(command));
}

/**
 * @brief Keeps the periodic resync running and prints the table whenever it changes.
 * @return Exit code of the event loop.
 */
int CommandLineRunner::runWatch(EntryTableModel &model)
{
    printTable(model);
    QObject::connect(&model, &QAbstractItemModel::modelReset, &model, [this, &model]() {
        standardOutput() << Qt::endl;
        printTable(model);
    });
    model.startAutoRefresh();
    return m_app.exec();
}

int CommandLineRunner::usageError(const QString &message) const
{
    standardError() << message << Qt::endl << Qt::endl << m_parser.helpText();
    standardError().flush();
    return UsageError;
}

int CommandLineRunner::report(const QVariantMap &result) const
{
    if (result.value("cancelled").toBool()) {
        return Failure;
    }
    const bool ok = result.value("ok").toBool();
    QTextStream &stream = ok ? standardOutput() : standardError();
    stream << result.value("title").toString() << ' ' << result.value("message").toString() << Qt::endl;
    return ok ? Success : Failure;
}

/**
 * @brief Selects the rows matching a list of entry paths.
 * @return True if every path matched a row, false otherwise.
 */
bool CommandLineRunner::selectPaths(EntryTableModel &model, const QStringList &paths) const
{
    model.deselectAll();
    for (const QString &path : paths) {
        if (!focusPath(model, path)) {
            standardError() << tr("Entry not found: %1").arg(path) << Qt::endl;
            return false;
        }
        if (!model.table().currentRow()->selected) {
            model.toggleCurrent();
        }
    }
    return true;
}

bool CommandLineRunner::focusPath(EntryTableModel &model, const QString &path) const
{
    if (!model.requestFind()) {
        return false;
    }
    return model.resolveFind(true, path);
}

void CommandLineRunner::printTable(const EntryTableModel &model) const
{
    QTextStream &stream = standardOutput();
    for (const EntryRow &row : model.table().rows()) {
        stream << qSetFieldWidth(4) << Qt::right << row.ordinal << qSetFieldWidth(0) << Qt::left << ' '
               << (row.selected ? QString::fromUtf8("■") : QStringLiteral(" ")) << ' '
               << EntryPathUtils::toDisplayString(row.identifier) << Qt::endl;
    }
    stream.flush();
}
