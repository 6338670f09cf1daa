#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QElapsedTimer>

#include "EntryTableModel.h"
#include "FakeStoreAdapter.h"
#include "StoreSettings.h"

namespace {

StoreSettings fastSettings()
{
    StoreSettings settings;
    settings.setRefreshIntervalMs(10);
    return settings;
}

bool waitUntil(const std::function<bool()> &condition, int timeoutMs = 2000)
{
    QElapsedTimer timer;
    timer.start();
    while (!condition()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }
    return true;
}

} // namespace

class EntryTableModelTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        QObject::connect(&model, &QAbstractItemModel::modelReset, [this]() { resets += 1; });
        QObject::connect(&model, &EntryTableModel::confirmationRequested,
                         [this](EntryTableModel::PendingAction action, const QStringList &paths) {
                             requestedAction = action;
                             requestedPaths = paths;
                         });
        QObject::connect(&model, &EntryTableModel::notificationRaised,
                         [this](const QString &title, const QString &, const QString &severity) {
                             lastTitle = title;
                             lastSeverity = severity;
                         });
        model.sync();
        resets = 0;
    }

    FakeStoreAdapter store{{"personal/mail", "work/mail", "work/vpn"}};
    StoreSettings settings = fastSettings();
    EntryTableModel model{store, settings};

    int resets = 0;
    EntryTableModel::PendingAction requestedAction = EntryTableModel::NoAction;
    QStringList requestedPaths;
    QString lastTitle;
    QString lastSeverity;
};

TEST_F(EntryTableModelTest, ExposesRowsAndColumns) {
    EXPECT_EQ(model.rowCount(), 3);
    EXPECT_EQ(model.columnCount(), EntryTableModel::ColumnCount);
    EXPECT_EQ(model.data(model.index(1, EntryTableModel::ProfileColumn)).toString(), "work");
    EXPECT_EQ(model.data(model.index(1, EntryTableModel::NameColumn)).toString(), "mail");
    EXPECT_EQ(model.data(model.index(2, 0), EntryTableModel::OrdinalRole).toInt(), 3);
    EXPECT_EQ(model.headerData(0, Qt::Vertical).toInt(), 1);
    EXPECT_TRUE(model.data(model.index(0, 0), EntryTableModel::CurrentRole).toBool());
}

TEST_F(EntryTableModelTest, SelectionMarkerFollowsToggle) {
    model.toggleCurrent();
    EXPECT_FALSE(model.data(model.index(0, EntryTableModel::SelectionColumn)).toString().isEmpty());
    EXPECT_EQ(model.selectedCount(), 1);
    model.reverseSelection();
    EXPECT_EQ(model.selectedCount(), 2);
    EXPECT_TRUE(model.data(model.index(0, EntryTableModel::SelectionColumn)).toString().isEmpty());
}

TEST_F(EntryTableModelTest, UnchangedStoreDoesNotReset) {
    model.sync();
    EXPECT_EQ(resets, 0);
    store.add("a/new");
    model.sync();
    EXPECT_EQ(resets, 1);
    EXPECT_EQ(model.rowCount(), 4);
}

TEST_F(EntryTableModelTest, DeleteWaitsForConfirmation) {
    ASSERT_TRUE(model.requestDelete());
    EXPECT_EQ(requestedAction, EntryTableModel::DeleteAction);
    EXPECT_EQ(requestedPaths, QStringList({"personal/mail"}));
    EXPECT_EQ(model.pendingAction(), EntryTableModel::DeleteAction);
    EXPECT_EQ(store.removeCalls, 0);

    EXPECT_FALSE(model.requestMove());

    const QVariantMap result = model.resolveDelete(true);
    EXPECT_TRUE(result.value("ok").toBool());
    EXPECT_EQ(store.removeCalls, 1);
    EXPECT_EQ(model.rowCount(), 2);
    EXPECT_EQ(model.pendingAction(), EntryTableModel::NoAction);
    EXPECT_EQ(lastSeverity, "information");

    const QVariantMap again = model.resolveDelete(true);
    EXPECT_TRUE(again.value("cancelled").toBool());
    EXPECT_EQ(store.removeCalls, 1);
}

TEST_F(EntryTableModelTest, DeclinedDeleteChangesNothing) {
    ASSERT_TRUE(model.requestDelete());
    const QVariantMap result = model.resolveDelete(false);
    EXPECT_TRUE(result.value("cancelled").toBool());
    EXPECT_EQ(store.removeCalls, 0);
    EXPECT_EQ(model.rowCount(), 3);
    EXPECT_EQ(resets, 0);
}

TEST_F(EntryTableModelTest, MismatchedResolveIsIgnored) {
    ASSERT_TRUE(model.requestMove());
    const QVariantMap result = model.resolveDelete(true);
    EXPECT_TRUE(result.value("cancelled").toBool());
    EXPECT_EQ(model.pendingAction(), EntryTableModel::MoveAction);

    model.cancelPending();
    EXPECT_EQ(model.pendingAction(), EntryTableModel::NoAction);
    const QVariantMap late = model.resolveMove(true, "archive", false);
    EXPECT_TRUE(late.value("cancelled").toBool());
    EXPECT_EQ(store.moveCalls, 0);
}

TEST_F(EntryTableModelTest, MoveConflictIsNotified) {
    model.setCursorRow(0);
    ASSERT_TRUE(model.requestMove());
    const QVariantMap result = model.resolveMove(true, "work", false);
    EXPECT_TRUE(result.value("conflict").toBool());
    EXPECT_EQ(lastSeverity, "error");
    EXPECT_EQ(store.moveCalls, 0);
}

TEST_F(EntryTableModelTest, RenameTracksEntryAcrossResync) {
    model.setCursorRow(2);
    ASSERT_TRUE(model.requestRename());
    EXPECT_EQ(requestedPaths, QStringList({"work/vpn"}));

    store.add("a/first");
    model.sync();
    EXPECT_EQ(model.cursorRow(), 3);

    const QVariantMap result = model.resolveRename(true, "tunnel");
    EXPECT_TRUE(result.value("ok").toBool());
    EXPECT_TRUE(store.paths().contains("work/tunnel"));
    EXPECT_TRUE(store.paths().contains("work/mail"));
    EXPECT_EQ(model.data(model.index(model.cursorRow(), 0), EntryTableModel::PathRole).toString(), "work/tunnel");
}

TEST_F(EntryTableModelTest, RenameOfVanishedEntryFails) {
    model.setCursorRow(2);
    ASSERT_TRUE(model.requestRename());
    store.drop("work/vpn");
    model.sync();

    const QVariantMap result = model.resolveRename(true, "tunnel");
    EXPECT_FALSE(result.value("ok").toBool());
    EXPECT_FALSE(store.paths().contains("work/tunnel"));
}

TEST_F(EntryTableModelTest, FindMovesCursor) {
    ASSERT_TRUE(model.requestFind());
    EXPECT_EQ(requestedPaths.size(), 3);
    EXPECT_TRUE(model.resolveFind(true, "work/vpn"));
    EXPECT_EQ(model.cursorRow(), 2);
}

TEST_F(EntryTableModelTest, EmptyTableRefusesRequests) {
    FakeStoreAdapter emptyStore;
    EntryTableModel emptyModel(emptyStore, settings);
    emptyModel.sync();
    EXPECT_FALSE(emptyModel.requestDelete());
    EXPECT_FALSE(emptyModel.requestRename());
    EXPECT_EQ(emptyModel.pendingAction(), EntryTableModel::NoAction);
}

TEST_F(EntryTableModelTest, PeriodicResyncPicksUpExternalChanges) {
    model.setCursorRow(1);
    model.startAutoRefresh();
    EXPECT_TRUE(model.autoRefresh());

    store.add("a/first");
    EXPECT_TRUE(waitUntil([this]() { return model.rowCount() == 4; }));
    EXPECT_EQ(model.cursorRow(), 2);

    model.stopAutoRefresh();
    EXPECT_FALSE(model.autoRefresh());
}

TEST_F(EntryTableModelTest, EditPausesPeriodicResync) {
    model.startAutoRefresh();
    bool activeDuringEdit = true;
    store.onEdit = [this, &activeDuringEdit]() {
        activeDuringEdit = model.autoRefresh();
        store.add("work/new");
    };

    model.editCurrent();

    EXPECT_FALSE(activeDuringEdit);
    EXPECT_TRUE(model.autoRefresh());
    EXPECT_EQ(store.lastEdited, "personal/mail");
    EXPECT_EQ(model.rowCount(), 4);
    model.stopAutoRefresh();
}

TEST_F(EntryTableModelTest, CopyRaisesNotification) {
    const QVariantMap result = model.copyPassword();
    EXPECT_TRUE(result.value("ok").toBool());
    EXPECT_EQ(lastTitle, "Password copied!");
    EXPECT_EQ(store.lastCopiedLine, 1);
}

TEST_F(EntryTableModelTest, RenameResolvedFromConfirmationSlot) {
    model.setCursorRow(1);
    QVariantMap result;
    QObject::connect(&model, &EntryTableModel::confirmationRequested,
                     [this, &result](EntryTableModel::PendingAction action, const QStringList &) {
                         if (action == EntryTableModel::RenameAction) {
                             result = model.resolveRename(true, "zmail");
                         }
                     });

    ASSERT_TRUE(model.requestRename());

    EXPECT_TRUE(result.value("ok").toBool());
    EXPECT_TRUE(store.paths().contains("work/zmail"));
    EXPECT_EQ(model.pendingAction(), EntryTableModel::NoAction);
    const QVariantMap again = model.resolveRename(true, "other");
    EXPECT_TRUE(again.value("cancelled").toBool());
}

TEST_F(EntryTableModelTest, RenameRequestWhilePendingKeepsFirstTarget) {
    model.setCursorRow(2);
    ASSERT_TRUE(model.requestRename());
    model.setCursorRow(0);
    EXPECT_FALSE(model.requestRename());

    const QVariantMap result = model.resolveRename(true, "tunnel");
    EXPECT_TRUE(result.value("ok").toBool());
    EXPECT_TRUE(store.paths().contains("work/tunnel"));
    EXPECT_TRUE(store.paths().contains("personal/mail"));
}

TEST_F(EntryTableModelTest, CursorMoveRefreshesEveryColumn) {
    QModelIndex topLeft;
    QModelIndex bottomRight;
    QVector<int> roles;
    QObject::connect(&model, &QAbstractItemModel::dataChanged,
                     [&](const QModelIndex &first, const QModelIndex &last, const QVector<int> &changed) {
                         topLeft = first;
                         bottomRight = last;
                         roles = changed;
                     });

    model.cursorDown();

    EXPECT_EQ(topLeft.column(), 0);
    EXPECT_EQ(bottomRight.column(), EntryTableModel::ColumnCount - 1);
    EXPECT_EQ(bottomRight.row(), model.rowCount() - 1);
    EXPECT_TRUE(roles.contains(EntryTableModel::CurrentRole));
}
