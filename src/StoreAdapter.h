#pragma once

#include <QString>
#include <QVector>

#include "EntryIdentifier.h"

class StoreAdapter
{
public:
    virtual ~StoreAdapter() = default;

    // Sorted by identifier, hidden files and folders excluded.
    virtual QVector<EntryIdentifier> listEntries() const = 0;
    virtual bool exists(const EntryIdentifier &id) const = 0;
    virtual bool hasConflict(const QVector<EntryIdentifier> &candidates,
                             const QString &destination,
                             bool keepCategory) const = 0;

    virtual bool move(const EntryIdentifier &id, const QString &destinationDir, QString *error) = 0;
    virtual bool remove(const EntryIdentifier &id, QString *error) = 0;
    virtual bool rename(const EntryIdentifier &id, const QString &newName, QString *error) = 0;
    virtual bool insert(const EntryIdentifier &id, const QString &secret, const QString &secondary, QString *error) = 0;
    virtual bool copyField(const EntryIdentifier &id, int line, QString *error) = 0;

    // Best effort, failures are ignored.
    virtual void pruneEmptyDirectories() = 0;
    // Blocks until the external program exits.
    virtual void edit(const EntryIdentifier &id) = 0;
};
