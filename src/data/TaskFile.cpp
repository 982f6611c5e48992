#include "todo/data/TaskFile.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextCodec>
#include <QTextStream>

#include "todo/core/Logging.hpp"

namespace todo {
namespace data {

namespace {
void setError(QString *errorString, const QString &message)
{
    if (errorString) {
        *errorString = message;
    }
}
} // namespace

TaskFile::TaskFile(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &TaskFile::filePath() const
{
    return m_filePath;
}

bool TaskFile::readLines(QStringList *lines,
                         QString *errorString,
                         int *invalidLineNumber,
                         QString *invalidLine) const
{
    if (m_filePath.isEmpty()) {
        setError(errorString, QStringLiteral("no file path configured"));
        return false;
    }
    if (!ensureDirectory(errorString)) {
        return false;
    }

    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(core::lcData) << "creating" << m_filePath;
    }
    if (!file.open(QIODevice::ReadWrite | QIODevice::Text)) {
        setError(errorString, QStringLiteral("cannot open %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    QTextCodec *codec = QTextCodec::codecForName("UTF-8");
    QStringList result;
    while (!file.atEnd()) {
        QByteArray raw = file.readLine();
        if (raw.isEmpty() && file.error() != QFileDevice::NoError) {
            setError(errorString, QStringLiteral("cannot read %1: %2").arg(m_filePath, file.errorString()));
            return false;
        }
        if (raw.endsWith('\n')) {
            raw.chop(1);
        }

        QTextCodec::ConverterState state(QTextCodec::IgnoreHeader);
        const QString line = codec->toUnicode(raw.constData(), raw.size(), &state);
        if (state.invalidChars > 0 || state.remainingChars > 0) {
            setError(errorString, QStringLiteral("%1 is not valid UTF-8").arg(m_filePath));
            if (invalidLineNumber) {
                *invalidLineNumber = result.size() + 1;
            }
            if (invalidLine) {
                *invalidLine = line;
            }
            return false;
        }
        result << line;
    }

    if (lines) {
        *lines = std::move(result);
    }
    return true;
}

bool TaskFile::writeLines(const QStringList &lines, QString *errorString) const
{
    if (m_filePath.isEmpty()) {
        setError(errorString, QStringLiteral("no file path configured"));
        return false;
    }
    if (!ensureDirectory(errorString)) {
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        setError(errorString, QStringLiteral("cannot write %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    for (const QString &line : lines) {
        stream << line << '\n';
    }
    stream.flush();

    if (stream.status() != QTextStream::Ok || !file.commit()) {
        setError(errorString, QStringLiteral("cannot write %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    qCDebug(core::lcData) << "wrote" << lines.size() << "lines to" << m_filePath;
    return true;
}

bool TaskFile::ensureDirectory(QString *errorString) const
{
    QDir dir = QFileInfo(m_filePath).dir();
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(QStringLiteral("."))) {
        setError(errorString, QStringLiteral("cannot create directory %1").arg(dir.path()));
        return false;
    }
    return true;
}

} // namespace data
} // namespace todo
