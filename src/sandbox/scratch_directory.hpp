#pragma once

#include <filesystem>
#include <string>

namespace scriptbox::sandbox {

// Private per-run directory tree, removed when the object goes away:
//   <root>/run-<random>/driver   driver.py and script.py, read-only in the jail
//   <root>/run-<random>/work     the script's writable working directory
//   <root>/run-<random>/...      capture files, never visible to the script
class ScratchDirectory {
public:
    // Throws SandboxUnavailable if the tree cannot be created.
    explicit ScratchDirectory(const std::filesystem::path& root);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& Root() const { return root_; }
    std::filesystem::path DriverDir() const { return root_ / "driver"; }
    std::filesystem::path WorkDir() const { return root_ / "work"; }

    // Writes a file under Root(). Throws SandboxUnavailable on failure.
    void WriteFile(const std::filesystem::path& relative, const std::string& content) const;

private:
    std::filesystem::path root_;
};

}  // namespace scriptbox::sandbox
