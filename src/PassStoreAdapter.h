#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "StoreAdapter.h"
#include "StoreSettings.h"

class QDir;

class PassStoreAdapter : public StoreAdapter
{
public:
    explicit PassStoreAdapter(const StoreSettings &settings);

    QString storePath() const;

    QVector<EntryIdentifier> listEntries() const override;
    bool exists(const EntryIdentifier &id) const override;
    bool hasConflict(const QVector<EntryIdentifier> &candidates,
                     const QString &destination,
                     bool keepCategory) const override;

    bool move(const EntryIdentifier &id, const QString &destinationDir, QString *error) override;
    bool remove(const EntryIdentifier &id, QString *error) override;
    bool rename(const EntryIdentifier &id, const QString &newName, QString *error) override;
    bool insert(const EntryIdentifier &id, const QString &secret, const QString &secondary, QString *error) override;
    bool copyField(const EntryIdentifier &id, int line, QString *error) override;

    void pruneEmptyDirectories() override;
    void edit(const EntryIdentifier &id) override;

private:
    QString filePath(const EntryIdentifier &id) const;
    QString directoryPath(const QString &relativeDir) const;
    void collectEntries(const QDir &dir, const QString &relativeDir, QVector<EntryIdentifier> &entries) const;
    bool pruneFolder(const QString &path, bool isRoot);
    bool runPass(const QStringList &arguments, const QByteArray &input, QString *error) const;

    StoreSettings m_settings;
};
