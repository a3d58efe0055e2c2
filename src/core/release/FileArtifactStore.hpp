#pragma once

#include "IArtifactStore.hpp"

namespace srt {

/// Writes artifacts atomically into one directory, creating it on demand.
class FileArtifactStore : public IArtifactStore {
public:
    explicit FileArtifactStore(const QString& outputDir);

    bool write(const QString& name, const QString& content,
               QString* path, QString* error) override;

    const QString& outputDir() const { return outputDir_; }

private:
    QString outputDir_;
};

} // namespace srt
