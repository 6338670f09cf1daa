#pragma once

#include <QAbstractTableModel>
#include <QStringList>
#include <QTimer>
#include <QVariantMap>
#include <QVector>

#include "BulkOperationCoordinator.h"
#include "EntryIdentifier.h"
#include "EntryTable.h"

class StoreAdapter;
class StoreSettings;

class EntryTableModel : public QAbstractTableModel
{
    Q_OBJECT

    Q_PROPERTY(int cursorRow READ cursorRow WRITE setCursorRow NOTIFY cursorRowChanged)
    Q_PROPERTY(int selectedCount READ selectedCount NOTIFY selectionChanged)
    Q_PROPERTY(PendingAction pendingAction READ pendingAction NOTIFY pendingActionChanged)
    Q_PROPERTY(bool autoRefresh READ autoRefresh NOTIFY autoRefreshChanged)

public:
    enum Column {
        SelectionColumn = 0,
        ProfileColumn,
        CategoryColumn,
        NameColumn,
        ColumnCount
    };
    Q_ENUM(Column)

    enum Role {
        ProfileRole = Qt::UserRole + 1,
        CategoryRole,
        NameRole,
        PathRole,
        SelectedRole,
        OrdinalRole,
        CurrentRole
    };
    Q_ENUM(Role)

    enum PendingAction {
        NoAction = 0,
        DeleteAction,
        MoveAction,
        RenameAction,
        FindAction
    };
    Q_ENUM(PendingAction)

    EntryTableModel(StoreAdapter &store, const StoreSettings &settings, QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    const EntryTable &table() const;
    int cursorRow() const;
    void setCursorRow(int row);
    int selectedCount() const;
    PendingAction pendingAction() const;
    bool autoRefresh() const;

    Q_INVOKABLE void sync();
    Q_INVOKABLE void startAutoRefresh();
    Q_INVOKABLE void stopAutoRefresh();

    Q_INVOKABLE void cursorUp();
    Q_INVOKABLE void cursorDown();
    Q_INVOKABLE void toggleCurrent();
    Q_INVOKABLE void selectAll();
    Q_INVOKABLE void deselectAll();
    Q_INVOKABLE void reverseSelection();
    Q_INVOKABLE void selectRangeUp();
    Q_INVOKABLE void selectRangeDown();
    Q_INVOKABLE void deselectRangeUp();
    Q_INVOKABLE void deselectRangeDown();
    Q_INVOKABLE QStringList selectedPaths() const;
    Q_INVOKABLE QStringList allPaths() const;

    Q_INVOKABLE bool requestDelete();
    Q_INVOKABLE bool requestMove();
    Q_INVOKABLE bool requestRename();
    Q_INVOKABLE bool requestFind();
    Q_INVOKABLE QVariantMap resolveDelete(bool accepted);
    Q_INVOKABLE QVariantMap resolveMove(bool accepted, const QString &destination, bool keepCategory);
    Q_INVOKABLE QVariantMap resolveRename(bool accepted, const QString &newName);
    Q_INVOKABLE bool resolveFind(bool accepted, const QString &path);
    Q_INVOKABLE void cancelPending();

    Q_INVOKABLE QVariantMap insertEntry(const QString &profile,
                                        const QString &category,
                                        const QString &name,
                                        const QString &secret,
                                        const QString &secondary);
    Q_INVOKABLE QVariantMap copyPassword();
    Q_INVOKABLE QVariantMap copyUsername();
    Q_INVOKABLE void editCurrent();

signals:
    void cursorRowChanged();
    void selectionChanged();
    void pendingActionChanged();
    void autoRefreshChanged();
    void synced();
    void confirmationRequested(EntryTableModel::PendingAction action, const QStringList &paths);
    void notificationRaised(const QString &title, const QString &message, const QString &severity);

private:
    QVector<EntryIdentifier> identifiers() const;
    bool beginPending(PendingAction action, const QStringList &paths);
    bool takePending(PendingAction action);
    QVariantMap cancelledResult() const;
    QVariantMap notify(const QVariantMap &result);
    void applySelectionChange(int previousCursor);

    template <typename Operation>
    void runStructuralChange(Operation operation);

    StoreAdapter &m_store;
    EntryTable m_table;
    BulkOperationCoordinator m_coordinator;
    QTimer m_refreshTimer;
    PendingAction m_pendingAction = NoAction;
    EntryIdentifier m_pendingTarget;
};
