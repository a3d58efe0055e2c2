#pragma once

#include <QString>

namespace srt {

/// Destination for generated documents.
class IArtifactStore {
public:
    virtual ~IArtifactStore() = default;

    /// Writes `content` under `name`; fills `path` with where it landed.
    virtual bool write(const QString& name, const QString& content,
                       QString* path, QString* error) = 0;
};

} // namespace srt
