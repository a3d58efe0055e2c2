#include "FileArtifactStore.hpp"
#include <QDir>
#include <QSaveFile>
#include <boost/log/trivial.hpp>

namespace srt {

FileArtifactStore::FileArtifactStore(const QString& outputDir)
    : outputDir_(outputDir)
{
}

bool FileArtifactStore::write(const QString& name, const QString& content,
                              QString* path, QString* error)
{
    if (name.isEmpty() || name.contains('/') || name.contains(QStringLiteral(".."))) {
        *error = QStringLiteral("invalid artifact name '%1'").arg(name);
        return false;
    }

    QDir dir(outputDir_);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        *error = QStringLiteral("cannot create directory %1").arg(outputDir_);
        return false;
    }

    const QString target = dir.absoluteFilePath(name);
    QSaveFile file(target);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        *error = QStringLiteral("cannot write %1: %2").arg(target, file.errorString());
        return false;
    }
    file.write(content.toUtf8());
    if (!file.commit()) {
        *error = QStringLiteral("cannot write %1: %2").arg(target, file.errorString());
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[ArtifactStore] Wrote " << target.toStdString();
    *path = target;
    return true;
}

} // namespace srt
