#pragma once

#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>
#include <QVariantMap>

class EntryTableModel;
class StoreAdapter;
class StoreSettings;

class CommandLineRunner
{
    Q_DECLARE_TR_FUNCTIONS(CommandLineRunner)

public:
    enum ExitCode {
        Success = 0,
        Failure = 1,
        UsageError = 2
    };

    explicit CommandLineRunner(QCoreApplication &app);

    int run();
    int execute(const QStringList &arguments, StoreAdapter &store, const StoreSettings &settings);

private:
    int dispatch(StoreAdapter &store, const StoreSettings &settings);
    int runCommand(const QString &command, const QStringList &arguments, EntryTableModel &model);
    int runWatch(EntryTableModel &model);
    int usageError(const QString &message) const;
    int report(const QVariantMap &result) const;
    bool selectPaths(EntryTableModel &model, const QStringList &paths) const;
    bool focusPath(EntryTableModel &model, const QString &path) const;
    void printTable(const EntryTableModel &model) const;

    QCoreApplication &m_app;
    QCommandLineParser m_parser;
    QCommandLineOption m_storeOption;
    QCommandLineOption m_verboseOption;
    QCommandLineOption m_keepCategoriesOption;
    QCommandLineOption m_secondaryOption;
    QCommandLineOption m_lineOption;
};
