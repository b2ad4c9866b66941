/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#include "WorkspaceFileSystem.h"
#include "../rpc/RpcTypes.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

namespace {

bool isWithin(const QString &path, const QString &root)
{
    if (root == QLatin1String("/")) {
        return path.startsWith(QLatin1Char('/'));
    }
    return path == root || path.startsWith(root + QLatin1Char('/'));
}

void setError(WorkspaceFileSystem::Error *error, int code, const QString &message)
{
    if (error) {
        error->code = code;
        error->message = message;
    }
}

}

WorkspaceFileSystem::WorkspaceFileSystem(const QString &root)
    : m_root(QDir::cleanPath(QDir(root).absolutePath()))
{
}

bool WorkspaceFileSystem::contains(const QString &path) const
{
    if (!QDir::isAbsolutePath(path)) {
        return false;
    }

    const QString cleaned = QDir::cleanPath(path);
    if (!isWithin(cleaned, m_root)) {
        return false;
    }

    const QString canonicalRoot = QFileInfo(m_root).canonicalFilePath();
    if (canonicalRoot.isEmpty()) {
        return true;
    }

    // A symlink inside the root may still point outside of it. For a path
    // that does not exist yet, the deepest existing ancestor decides where
    // the write would land.
    QString existing = cleaned;
    QFileInfo info(existing);
    while (!info.exists()) {
        if (info.isSymLink()) {
            // Dangling link: opening it for writing would create its target
            return false;
        }
        const QString parent = QFileInfo(existing).path();
        if (parent == existing) {
            return false;
        }
        existing = parent;
        info = QFileInfo(existing);
    }

    return isWithin(info.canonicalFilePath(), canonicalRoot);
}

bool WorkspaceFileSystem::validate(const QString &path, Error *error) const
{
    if (path.isEmpty()) {
        setError(error, RpcErrorCode::InvalidParams, QStringLiteral("Missing required parameter: path"));
        return false;
    }
    if (!QDir::isAbsolutePath(path)) {
        setError(error, RpcErrorCode::InvalidParams, QStringLiteral("Path must be absolute: %1").arg(path));
        return false;
    }
    if (!contains(path)) {
        qWarning() << "[WorkspaceFileSystem] Rejected path outside workspace:" << path << "root:" << m_root;
        setError(error, RpcErrorCode::OutsideWorkspace, QStringLiteral("Path is outside the allowed workspace: %1").arg(path));
        return false;
    }
    return true;
}

bool WorkspaceFileSystem::readTextFile(const QString &path, int line, int limit, QString *content, Error *error) const
{
    if (!validate(path, error)) {
        return false;
    }

    QFile file(QDir::cleanPath(path));
    if (!file.exists()) {
        setError(error, RpcErrorCode::NotFound, QStringLiteral("File not found: %1").arg(path));
        return false;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setError(error, RpcErrorCode::NotFound, QStringLiteral("Cannot open file: %1").arg(file.errorString()));
        return false;
    }

    const QString text = QString::fromUtf8(file.readAll());
    file.close();

    if (line <= 1 && limit <= 0) {
        if (content) {
            *content = text;
        }
        return true;
    }

    // Apply line offset and limit
    const QStringList lines = text.split(QLatin1Char('\n'));
    const int first = qMax(1, line) - 1;
    const int count = limit > 0 ? limit : -1;

    if (content) {
        *content = lines.mid(first, count).join(QLatin1Char('\n'));
    }
    return true;
}

bool WorkspaceFileSystem::writeTextFile(const QString &path, const QString &content, Error *error) const
{
    if (!validate(path, error)) {
        return false;
    }

    const QString cleaned = QDir::cleanPath(path);

    // Ensure parent directory exists
    const QDir parentDir = QFileInfo(cleaned).absoluteDir();
    if (!parentDir.exists() && !parentDir.mkpath(QStringLiteral("."))) {
        setError(error, RpcErrorCode::InternalError,
                 QStringLiteral("Cannot create parent directory: %1").arg(parentDir.absolutePath()));
        return false;
    }

    QFile file(cleaned);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(error, RpcErrorCode::InternalError,
                 QStringLiteral("Cannot open file for writing: %1").arg(file.errorString()));
        return false;
    }

    const QByteArray data = content.toUtf8();
    if (file.write(data) != data.size()) {
        setError(error, RpcErrorCode::InternalError, QStringLiteral("Failed to write file: %1").arg(file.errorString()));
        return false;
    }

    qDebug() << "[WorkspaceFileSystem] Wrote" << data.size() << "bytes to" << cleaned;
    return true;
}
