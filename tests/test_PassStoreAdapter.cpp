#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "EntryIdentifier.h"
#include "PassStoreAdapter.h"
#include "StoreSettings.h"

namespace {

void touch(const QString &path)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("x");
}

} // namespace

class PassStoreAdapterTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(storeDir.isValid());
        touch(storePath("work/mail.gpg"));
        touch(storePath("work/vpn.gpg"));
        touch(storePath("personal/shop/amazon.gpg"));
        touch(storePath("toplevel.gpg"));
        touch(storePath("work/notes.txt"));
        touch(storePath(".gpg-id"));
        touch(storePath(".git/config.gpg"));
        touch(storePath("work/.hidden.gpg"));
        settings.setStorePath(storeDir.path());
    }

    QString storePath(const QString &relative) const
    {
        return QDir(storeDir.path()).filePath(relative);
    }

    // Writes a stand-in for the pass command that records its arguments and stdin.
    QString writePassScript(int exitCode)
    {
        const QString path = QDir(scriptDir.path()).filePath("pass");
        QFile script(path);
        EXPECT_TRUE(script.open(QIODevice::WriteOnly));
        script.write("#!/bin/sh\n");
        script.write("echo \"$@\" > \"$PASSWORD_STORE_DIR/../args\"\n");
        script.write("cat > \"$PASSWORD_STORE_DIR/../stdin\"\n");
        script.write(QByteArray("exit ") + QByteArray::number(exitCode) + "\n");
        script.close();
        script.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
        return path;
    }

    QString readScratch(const QString &name) const
    {
        QFile file(QDir(storeDir.path()).filePath("../" + name));
        if (!file.open(QIODevice::ReadOnly)) {
            return {};
        }
        return QString::fromUtf8(file.readAll());
    }

    QTemporaryDir storeParent;
    QTemporaryDir storeDir{storeParent.path() + "/store"};
    QTemporaryDir scriptDir;
    StoreSettings settings;
};

TEST_F(PassStoreAdapterTest, ListsVisibleEntriesSorted) {
    PassStoreAdapter adapter(settings);
    const QStringList paths = EntryPathUtils::formatAll(adapter.listEntries());
    EXPECT_EQ(paths, QStringList({"toplevel", "personal/shop/amazon", "work/mail", "work/vpn"}));
}

TEST_F(PassStoreAdapterTest, MissingStoreListsNothing) {
    settings.setStorePath(storePath("missing"));
    PassStoreAdapter adapter(settings);
    EXPECT_TRUE(adapter.listEntries().isEmpty());
}

TEST_F(PassStoreAdapterTest, ExistsAndConflicts) {
    PassStoreAdapter adapter(settings);
    EXPECT_TRUE(adapter.exists(EntryPathUtils::parse("work/mail")));
    EXPECT_FALSE(adapter.exists(EntryPathUtils::parse("work/notes")));

    const QVector<EntryIdentifier> mail = {EntryPathUtils::parse("personal/mail")};
    EXPECT_TRUE(adapter.hasConflict(mail, "work", false));
    EXPECT_FALSE(adapter.hasConflict(mail, "archive", false));

    const QVector<EntryIdentifier> amazon = {EntryPathUtils::parse("personal/shop/amazon")};
    EXPECT_FALSE(adapter.hasConflict(amazon, "personal", false));
    EXPECT_TRUE(adapter.hasConflict(amazon, "personal", true));
}

TEST_F(PassStoreAdapterTest, MoveCreatesDestination) {
    PassStoreAdapter adapter(settings);
    QString error;
    ASSERT_TRUE(adapter.move(EntryPathUtils::parse("work/vpn"), "archive/2024", &error)) << qPrintable(error);
    EXPECT_TRUE(QFileInfo::exists(storePath("archive/2024/vpn.gpg")));
    EXPECT_FALSE(QFileInfo::exists(storePath("work/vpn.gpg")));
}

TEST_F(PassStoreAdapterTest, MoveRefusesToOverwrite) {
    touch(storePath("archive/mail.gpg"));
    PassStoreAdapter adapter(settings);
    QString error;
    EXPECT_FALSE(adapter.move(EntryPathUtils::parse("work/mail"), "archive", &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_TRUE(QFileInfo::exists(storePath("work/mail.gpg")));
}

TEST_F(PassStoreAdapterTest, RemoveMissingEntryFails) {
    PassStoreAdapter adapter(settings);
    QString error;
    EXPECT_TRUE(adapter.remove(EntryPathUtils::parse("work/mail"), &error));
    EXPECT_FALSE(adapter.remove(EntryPathUtils::parse("work/mail"), &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(PassStoreAdapterTest, RenameStaysInFolder) {
    PassStoreAdapter adapter(settings);
    QString error;
    EXPECT_TRUE(adapter.rename(EntryPathUtils::parse("personal/shop/amazon"), "ebay", &error));
    EXPECT_TRUE(QFileInfo::exists(storePath("personal/shop/ebay.gpg")));
    EXPECT_FALSE(adapter.rename(EntryPathUtils::parse("work/mail"), "vpn", &error));
    EXPECT_FALSE(adapter.rename(EntryPathUtils::parse("work/mail"), "mail", &error));
    EXPECT_FALSE(adapter.rename(EntryPathUtils::parse("work/mail"), "x/y", &error));
    EXPECT_TRUE(QFileInfo::exists(storePath("work/mail.gpg")));
}

TEST_F(PassStoreAdapterTest, PruneKeepsRootAndNonEmptyFolders) {
    QDir().mkpath(storePath("empty/nested/deeper"));
    QDir().mkpath(storePath(".git/objects"));
    PassStoreAdapter adapter(settings);
    ASSERT_TRUE(adapter.remove(EntryPathUtils::parse("personal/shop/amazon"), nullptr));

    adapter.pruneEmptyDirectories();

    EXPECT_FALSE(QFileInfo::exists(storePath("empty")));
    EXPECT_FALSE(QFileInfo::exists(storePath("personal")));
    EXPECT_TRUE(QFileInfo::exists(storePath("work")));
    EXPECT_TRUE(QFileInfo::exists(storePath(".git/objects")));
    EXPECT_TRUE(QFileInfo::exists(storeDir.path()));
}

TEST_F(PassStoreAdapterTest, InsertPipesFieldsToPass) {
    settings.setPassExecutable(writePassScript(0));
    PassStoreAdapter adapter(settings);
    QString error;
    ASSERT_TRUE(adapter.insert(EntryPathUtils::parse("work/git"), "s3cret", "me", &error)) << qPrintable(error);
    EXPECT_EQ(readScratch("args").trimmed(), "insert --multiline work/git");
    EXPECT_EQ(readScratch("stdin"), "s3cret\nme\n");
}

TEST_F(PassStoreAdapterTest, InsertExistingEntryFails) {
    settings.setPassExecutable(writePassScript(0));
    PassStoreAdapter adapter(settings);
    QString error;
    EXPECT_FALSE(adapter.insert(EntryPathUtils::parse("work/mail"), "pw", QString(), &error));
    EXPECT_TRUE(readScratch("args").isEmpty());
}

TEST_F(PassStoreAdapterTest, CopyFieldUsesLineOption) {
    settings.setPassExecutable(writePassScript(0));
    PassStoreAdapter adapter(settings);
    QString error;
    ASSERT_TRUE(adapter.copyField(EntryPathUtils::parse("work/vpn"), 2, &error));
    EXPECT_EQ(readScratch("args").trimmed(), "show -c2 work/vpn");
    EXPECT_FALSE(adapter.copyField(EntryPathUtils::parse("work/vpn"), 0, &error));
}

TEST_F(PassStoreAdapterTest, FailingPassReportsError) {
    settings.setPassExecutable(writePassScript(1));
    PassStoreAdapter adapter(settings);
    QString error;
    EXPECT_FALSE(adapter.copyField(EntryPathUtils::parse("work/vpn"), 1, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(PassStoreAdapterTest, MissingPassExecutableReportsError) {
    settings.setPassExecutable(storePath("no-such-pass"));
    PassStoreAdapter adapter(settings);
    QString error;
    EXPECT_FALSE(adapter.copyField(EntryPathUtils::parse("work/vpn"), 1, &error));
    EXPECT_FALSE(error.isEmpty());
}
