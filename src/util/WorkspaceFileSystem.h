/*
    SPDX-License-Identifier: MIT
    SPDX-FileCopyrightText: 2025 ACP Bridge contributors
*/

#pragma once

#include <QString>

/**
 * WorkspaceFileSystem - text file access confined to one directory tree.
 *
 * Paths must be absolute and resolve inside the root after cleaning ("..",
 * duplicate separators) and, for existing files, after resolving symlinks.
 * "/work/project-other" is not inside "/work/project".
 */
class WorkspaceFileSystem
{
public:
    struct Error {
        int code = 0;  // RpcErrorCode value
        QString message;
    };

    explicit WorkspaceFileSystem(const QString &root);

    QString root() const { return m_root; }
    bool contains(const QString &path) const;

    // line is 1-based; limit <= 0 reads to the end
    bool readTextFile(const QString &path, int line, int limit, QString *content, Error *error) const;

    // Creates missing parent directories
    bool writeTextFile(const QString &path, const QString &content, Error *error) const;

private:
    bool validate(const QString &path, Error *error) const;

    QString m_root;
};
