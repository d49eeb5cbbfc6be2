#include "runtime/file_transfer.hpp"
#include "runtime/engine_errors.hpp"
#include "runtime/exec_session.hpp"
#include "runtime/workspace_path.hpp"
#include "docker/archive.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"
#include <spdlog/spdlog.h>

namespace sandkit::runtime {

namespace {

// Exit 3 = target missing (or of the wrong kind)
const char* REMOVE_SCRIPT = R"SH(case "$1" in
  -f) { [ -f "$2" ] || [ -L "$2" ]; } || exit 3; rm -f -- "$2" ;;
  -d) [ -d "$2" ] || exit 3; rm -rf -- "$2" ;;
  *) exit 2 ;;
esac)SH";

constexpr int REMOVE_MISSING_EXIT = 3;

// Workspace-owned directories are writable by whatever user the image runs as
constexpr unsigned SHARED_DIR_MODE = 0777;

constexpr int MAX_SYMLINK_HOPS = 8;

} // namespace

FileTransfer::FileTransfer(docker::ContainerRuntime& runtime,
                           std::string container_id,
                           std::string workspace_root)
    : runtime_(runtime),
      container_id_(std::move(container_id)),
      workspace_root_(std::move(workspace_root)) {}

void FileTransfer::write_file(const std::string& content, const std::string& filename) {
    auto path = resolve_workspace_path(workspace_root_, filename);

    translate_engine_errors("write " + filename, [&] {
        docker::TarWriter tar;
        tar.add_parents(path.relative);
        tar.add_file(path.relative, content);
        runtime_.put_archive(container_id_, workspace_root_, tar.finish());
    });
    spdlog::debug("Wrote {} bytes to {} in {}", content.size(), path.absolute,
                  util::short_id(container_id_));
}

std::string FileTransfer::read_file(const std::string& filename) {
    auto path = resolve_workspace_path(workspace_root_, filename);

    for (int hops = 0; hops <= MAX_SYMLINK_HOPS; ++hops) {
        std::string data = translate_engine_errors("read " + filename, [&] {
            try {
                return runtime_.get_archive(container_id_, path.absolute);
            } catch (const docker::ApiError& e) {
                if (e.not_found()) {
                    throw FileNotFound(filename);
                }
                throw;
            }
        });

        auto entries = translate_engine_errors("read " + filename, [&] {
            return docker::read_tar(data);
        });
        if (entries.empty()) {
            throw FileNotFound(filename);
        }

        auto& entry = entries.front();
        if (entry.type == docker::EntryType::FILE) {
            return std::move(entry.content);
        }
        if (entry.type != docker::EntryType::SYMLINK) {
            throw FileNotFound(filename, "not a regular file");
        }

        // The archive holds the link itself; resolve its target against the
        // link's directory and keep it inside the workspace
        std::string target = entry.link_target;
        if (target.empty() || target[0] != '/') {
            size_t slash = path.relative.rfind('/');
            std::string dir = slash == std::string::npos ? "" : path.relative.substr(0, slash + 1);
            target = dir + target;
        }
        try {
            path = resolve_workspace_path(workspace_root_, target);
        } catch (const InvalidPath&) {
            throw InvalidPath(filename, "symbolic link points outside the workspace root");
        }
        spdlog::debug("Following symlink {} -> {}", filename, path.absolute);
    }
    throw FileNotFound(filename, "too many levels of symbolic links");
}

void FileTransfer::delete_file(const std::string& filename) {
    auto path = resolve_workspace_path(workspace_root_, filename);
    remove("-f", path.absolute, filename);
}

void FileTransfer::write_dir(const std::string& directory) {
    auto path = resolve_workspace_path(workspace_root_, directory);

    translate_engine_errors("create directory " + directory, [&] {
        docker::TarWriter tar;
        tar.add_parents(path.relative);
        tar.add_directory(path.relative);
        runtime_.put_archive(container_id_, workspace_root_, tar.finish());
    });
    spdlog::debug("Created directory {} in {}", path.absolute, util::short_id(container_id_));
}

void FileTransfer::delete_dir(const std::string& directory) {
    auto path = resolve_workspace_path(workspace_root_, directory);
    remove("-d", path.absolute, directory);
}

void FileTransfer::create_directories(const std::vector<std::string>& absolute_paths) {
    translate_engine_errors("create workspace", [&] {
        docker::TarWriter tar;
        for (const auto& abs : absolute_paths) {
            std::string rel;
            if (!normalize_relative(abs, rel) || rel.empty()) {
                throw InvalidConfig("not a creatable directory: " + abs);
            }
            tar.add_parents(rel, SHARED_DIR_MODE);
            tar.add_directory(rel, SHARED_DIR_MODE);
        }
        runtime_.put_archive(container_id_, "/", tar.finish());
    });
}

void FileTransfer::remove(const std::string& flag, const std::string& path, const std::string& original) {
    docker::ExecSpec spec;
    spec.command = {"sh", "-c", REMOVE_SCRIPT, "sandkit-rm", flag, path};
    spec.working_dir = workspace_root_;

    auto outcome = translate_engine_errors("delete " + original, [&] {
        return run_exec(runtime_, container_id_, spec, ExecOptions{});
    });

    if (outcome.exit_code == REMOVE_MISSING_EXIT) {
        throw FileNotFound(original, flag == "-d" ? "no such directory" : "no such file");
    }
    if (outcome.exit_code != 0) {
        throw EngineFault("delete " + original + " failed (exit " + std::to_string(outcome.exit_code) +
                          "): " + util::tail(util::trim(outcome.stderr_data), 512));
    }
    spdlog::debug("Deleted {} in {}", path, util::short_id(container_id_));
}

} // namespace sandkit::runtime
