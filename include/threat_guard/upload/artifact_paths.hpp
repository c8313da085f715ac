#pragma once

#include "../common/types.hpp"
#include "../events/security_event_sink.hpp"
#include <memory>
#include <string>

namespace threat_guard {
namespace upload {

// Storage collaborator that owns persisted upload artifacts.
class ArtifactStorage {
public:
    virtual ~ArtifactStorage() = default;
    virtual bool remove(const std::string& relative_path) = 0;
};

// Artifacts stored as files below a root directory.
class DirectoryArtifactStorage : public ArtifactStorage {
public:
    explicit DirectoryArtifactStorage(std::string root);

    bool store(const std::string& relative_path, const common::Bytes& bytes);
    bool remove(const std::string& relative_path) override;

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

class ArtifactPaths {
public:
    // {callerId}_{epochMs}_{32 hex chars}.jpg
    static std::string makeStorageName(const std::string& caller_id, common::Instant now = common::systemNow());
    static std::string makeStoragePath(const std::string& caller_id, common::Instant now = common::systemNow());

    static bool isSafeArtifactPath(const std::string& path);

    static std::string percentDecode(const std::string& text, bool& ok);
};

enum class RemovalResult {
    REMOVED,
    SKIPPED,
    UNSAFE_PATH,
    FAILED
};

std::string to_string(RemovalResult result);

// Deletes the previous artifact of an accepted upload. Unsafe paths are
// reported as path traversal attempts and never reach storage; storage
// failures are logged only.
RemovalResult removePreviousArtifact(ArtifactStorage& storage,
                                     const std::string& previous_path,
                                     const std::string& caller_id,
                                     events::SecurityEventSink* sink = nullptr);

}}
