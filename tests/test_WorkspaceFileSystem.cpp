/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "../src/util/WorkspaceFileSystem.h"
#include "../src/rpc/RpcTypes.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include <memory>

namespace {

class WorkspaceFileSystemTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(workspace.isValid());
        ASSERT_TRUE(outside.isValid());
        fs = std::make_unique<WorkspaceFileSystem>(workspace.path());
    }

    QString inside(const QString &relative) const { return workspace.filePath(relative); }

    void writeRaw(const QString &path, const QByteArray &data)
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(data);
    }

    QTemporaryDir workspace;
    QTemporaryDir outside;
    std::unique_ptr<WorkspaceFileSystem> fs;
};

TEST_F(WorkspaceFileSystemTest, ContainmentIsPathAware)
{
    EXPECT_TRUE(fs->contains(inside(QStringLiteral("src/main.cpp"))));
    EXPECT_TRUE(fs->contains(workspace.path()));
    EXPECT_FALSE(fs->contains(workspace.path() + QStringLiteral("-other/file.txt")));
    EXPECT_FALSE(fs->contains(inside(QStringLiteral("../escape.txt"))));
    EXPECT_FALSE(fs->contains(QStringLiteral("relative/path.txt")));
    EXPECT_TRUE(fs->contains(inside(QStringLiteral("a/../b//c.txt"))));
}

TEST_F(WorkspaceFileSystemTest, ReadsWholeFile)
{
    writeRaw(inside(QStringLiteral("notes.txt")), "one\ntwo\nthree\n");

    QString content;
    WorkspaceFileSystem::Error error;
    ASSERT_TRUE(fs->readTextFile(inside(QStringLiteral("notes.txt")), 0, 0, &content, &error));
    EXPECT_EQ(content, QStringLiteral("one\ntwo\nthree\n"));
}

TEST_F(WorkspaceFileSystemTest, ReadsLineWindow)
{
    writeRaw(inside(QStringLiteral("notes.txt")), "one\ntwo\nthree\nfour\n");

    QString content;
    WorkspaceFileSystem::Error error;
    ASSERT_TRUE(fs->readTextFile(inside(QStringLiteral("notes.txt")), 2, 2, &content, &error));
    EXPECT_EQ(content, QStringLiteral("two\nthree"));

    ASSERT_TRUE(fs->readTextFile(inside(QStringLiteral("notes.txt")), 4, 0, &content, &error));
    EXPECT_EQ(content, QStringLiteral("four\n"));

    ASSERT_TRUE(fs->readTextFile(inside(QStringLiteral("notes.txt")), 40, 5, &content, &error));
    EXPECT_TRUE(content.isEmpty());
}

TEST_F(WorkspaceFileSystemTest, MissingFileIsNotFound)
{
    QString content;
    WorkspaceFileSystem::Error error;
    EXPECT_FALSE(fs->readTextFile(inside(QStringLiteral("missing.txt")), 0, 0, &content, &error));
    EXPECT_EQ(error.code, RpcErrorCode::NotFound);
    EXPECT_TRUE(error.message.startsWith(QStringLiteral("File not found")));
}

TEST_F(WorkspaceFileSystemTest, RejectsPathsOutsideWorkspace)
{
    const QString secret = outside.filePath(QStringLiteral("secret.txt"));
    writeRaw(secret, "secret");

    QString content;
    WorkspaceFileSystem::Error error;
    EXPECT_FALSE(fs->readTextFile(secret, 0, 0, &content, &error));
    EXPECT_EQ(error.code, RpcErrorCode::OutsideWorkspace);
    EXPECT_TRUE(content.isEmpty());

    EXPECT_FALSE(fs->writeTextFile(outside.filePath(QStringLiteral("dropped.txt")), QStringLiteral("x"), &error));
    EXPECT_EQ(error.code, RpcErrorCode::OutsideWorkspace);
    EXPECT_FALSE(QFile::exists(outside.filePath(QStringLiteral("dropped.txt"))));
}

TEST_F(WorkspaceFileSystemTest, RejectsRelativeAndEmptyPaths)
{
    QString content;
    WorkspaceFileSystem::Error error;
    EXPECT_FALSE(fs->readTextFile(QStringLiteral("notes.txt"), 0, 0, &content, &error));
    EXPECT_EQ(error.code, RpcErrorCode::InvalidParams);

    EXPECT_FALSE(fs->readTextFile(QString(), 0, 0, &content, &error));
    EXPECT_EQ(error.code, RpcErrorCode::InvalidParams);
}

TEST_F(WorkspaceFileSystemTest, SymlinkLeadingOutsideIsRejected)
{
    const QString secret = outside.filePath(QStringLiteral("secret.txt"));
    writeRaw(secret, "secret");
    const QString link = inside(QStringLiteral("link.txt"));
    ASSERT_TRUE(QFile::link(secret, link));

    QString content;
    WorkspaceFileSystem::Error error;
    EXPECT_FALSE(fs->readTextFile(link, 0, 0, &content, &error));
    EXPECT_EQ(error.code, RpcErrorCode::OutsideWorkspace);
}

TEST_F(WorkspaceFileSystemTest, WriteThroughSymlinkedDirectoryIsRejected)
{
    const QString link = inside(QStringLiteral("link"));
    ASSERT_TRUE(QFile::link(outside.path(), link));

    WorkspaceFileSystem::Error error;
    EXPECT_FALSE(fs->writeTextFile(link + QStringLiteral("/new.txt"), QStringLiteral("escaped"), &error));
    EXPECT_EQ(error.code, RpcErrorCode::OutsideWorkspace);
    EXPECT_FALSE(QFile::exists(outside.filePath(QStringLiteral("new.txt"))));

    // Missing directories below the link must not be created outside either
    EXPECT_FALSE(fs->writeTextFile(link + QStringLiteral("/a/b/new.txt"), QStringLiteral("escaped"), &error));
    EXPECT_EQ(error.code, RpcErrorCode::OutsideWorkspace);
    EXPECT_FALSE(QDir(outside.filePath(QStringLiteral("a"))).exists());
}

TEST_F(WorkspaceFileSystemTest, WriteThroughDanglingSymlinkIsRejected)
{
    const QString target = outside.filePath(QStringLiteral("created.txt"));
    const QString link = inside(QStringLiteral("dangling.txt"));
    ASSERT_TRUE(QFile::link(target, link));

    WorkspaceFileSystem::Error error;
    EXPECT_FALSE(fs->writeTextFile(link, QStringLiteral("escaped"), &error));
    EXPECT_EQ(error.code, RpcErrorCode::OutsideWorkspace);
    EXPECT_FALSE(QFile::exists(target));
}

TEST_F(WorkspaceFileSystemTest, WriteThroughSymlinkInsideRootIsAllowed)
{
    ASSERT_TRUE(QDir(workspace.path()).mkpath(QStringLiteral("real")));
    const QString link = inside(QStringLiteral("alias"));
    ASSERT_TRUE(QFile::link(inside(QStringLiteral("real")), link));

    WorkspaceFileSystem::Error error;
    ASSERT_TRUE(fs->writeTextFile(link + QStringLiteral("/sub/file.txt"), QStringLiteral("ok"), &error));
    EXPECT_TRUE(QFile::exists(inside(QStringLiteral("real/sub/file.txt"))));
}

TEST_F(WorkspaceFileSystemTest, WriteCreatesParentsAndOverwrites)
{
    const QString path = inside(QStringLiteral("deep/nested/out.txt"));

    WorkspaceFileSystem::Error error;
    ASSERT_TRUE(fs->writeTextFile(path, QStringLiteral("first version"), &error));
    ASSERT_TRUE(fs->writeTextFile(path, QStringLiteral("ünïcode"), &error));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(QString::fromUtf8(file.readAll()), QStringLiteral("ünïcode"));
}

}
