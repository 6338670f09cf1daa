#pragma once

#include <QCoreApplication>
#include <QString>
#include <QVariantMap>

class EntryTable;
class StoreAdapter;

class BulkOperationCoordinator
{
    Q_DECLARE_TR_FUNCTIONS(BulkOperationCoordinator)

public:
    enum FieldLine {
        SecretLine = 1,
        SecondaryLine = 2
    };

    BulkOperationCoordinator(EntryTable &table, StoreAdapter &store, int clipTimeSeconds);

    void refresh();

    QVariantMap deleteSelected();
    QVariantMap moveSelected(const QString &destination, bool keepCategory);
    QVariantMap renameEntry(int row, const QString &newName);
    QVariantMap insertEntry(const QString &profile,
                            const QString &category,
                            const QString &name,
                            const QString &secret,
                            const QString &secondary);
    bool findAndSelect(const QString &path);
    QVariantMap copyCurrentField(FieldLine line);
    void editCurrent();

private:
    EntryTable &m_table;
    StoreAdapter &m_store;
    int m_clipTimeSeconds = 0;
};
