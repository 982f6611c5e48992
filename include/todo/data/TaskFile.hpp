#pragma once

#include <QString>
#include <QStringList>

namespace todo {
namespace data {

// Line-oriented access to the backing todo file.
class TaskFile
{
public:
    explicit TaskFile(QString filePath);

    const QString &filePath() const;

    // Reads every line, creating the file (and its directory) when it does
    // not exist yet. Line terminators are stripped. A line that is not valid
    // UTF-8 fails the read and is reported through invalidLineNumber (1-based)
    // and invalidLine.
    bool readLines(QStringList *lines,
                   QString *errorString,
                   int *invalidLineNumber = nullptr,
                   QString *invalidLine = nullptr) const;

    // Replaces the file contents with one '\n'-terminated entry per line.
    // The new contents are written next to the file and renamed over it.
    bool writeLines(const QStringList &lines, QString *errorString) const;

private:
    bool ensureDirectory(QString *errorString) const;

    QString m_filePath;
};

} // namespace data
} // namespace todo
