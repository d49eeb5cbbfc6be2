/**
 * File Transfer Subsystem
 *
 * Moves files and directory trees in and out of a running environment
 * through the runtime's tar copy protocol. There is no shared filesystem
 * with the host; every path is scoped to the workspace root.
 */
#pragma once
#include <string>
#include <vector>
#include "docker/container_runtime.hpp"

namespace sandkit::runtime {

class FileTransfer {
public:
    FileTransfer(docker::ContainerRuntime& runtime,
                 std::string container_id,
                 std::string workspace_root);

    // Create or overwrite filename, creating missing parent directories.
    // Throws InvalidPath, EngineFault.
    void write_file(const std::string& content, const std::string& filename);

    // Symbolic links are followed while they stay inside the workspace.
    // Throws FileNotFound if filename is missing or not a regular file,
    // InvalidPath if a link leads out of the workspace.
    std::string read_file(const std::string& filename);

    // Throws FileNotFound if filename does not exist or is a directory
    void delete_file(const std::string& filename);

    // Recursive create; existing directories are kept
    void write_dir(const std::string& directory);

    // Recursive delete. Throws FileNotFound if directory does not exist.
    void delete_dir(const std::string& directory);

    // Create absolute directories (workspace, scratch) from the filesystem root
    void create_directories(const std::vector<std::string>& absolute_paths);

    const std::string& workspace_root() const { return workspace_root_; }

private:
    docker::ContainerRuntime& runtime_;
    std::string container_id_;
    std::string workspace_root_;

    // Strict delete through a shell inside the environment
    void remove(const std::string& flag, const std::string& path, const std::string& original);
};

} // namespace sandkit::runtime
