#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "core/config/request_id.hpp"
#include "core/config/service_config.hpp"

namespace venvbox::testing {

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& prefix) {
        root_ = std::filesystem::current_path() /
                (".tmp_" + prefix + "_" + core::config::generate_request_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::permissions(root_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

inline void write_executable(const std::filesystem::path& path, const std::string& content) {
    write_file(path, content);
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::replace);
}

// Stands in for bin/python: runs the `-c` argument with /bin/sh, so tests can
// drive the runner without a Python installation.
inline const char* fake_interpreter_script() {
    return "#!/bin/sh\n"
           "if [ \"$1\" = \"-c\" ]; then exec /bin/sh -c \"$2\"; fi\n"
           "echo \"unsupported invocation: $*\" >&2\n"
           "exit 2\n";
}

inline void make_fake_environment(const std::filesystem::path& root) {
    write_executable(root / "bin" / "python", fake_interpreter_script());
}

struct FakeUvOptions {
    bool fail_create = false;
    bool fail_install = false;
    int create_sleep_s = 0;
    int install_sleep_s = 0;
};

// A `uv` replacement. `venv ROOT` lays down a fake interpreter, `pip install -r
// MANIFEST --python ROOT` copies the manifest to ROOT/installed.txt and records
// SSL_CERT_FILE in ROOT/cert.txt. Every call is appended to `log`.
inline std::filesystem::path write_fake_uv(const std::filesystem::path& dir,
                                           const std::filesystem::path& log,
                                           const FakeUvOptions& options = {}) {
    std::ostringstream script;
    script << "#!/bin/sh\n"
           << "LOG='" << log.string() << "'\n"
           << "case \"$1\" in\n"
           << "  venv)\n"
           << "    echo \"venv $2\" >> \"$LOG\"\n";
    if (options.create_sleep_s > 0) {
        script << "    sleep " << options.create_sleep_s << "\n";
    }
    if (options.fail_create) {
        script << "    mkdir -p \"$2/bin\"\n"
               << "    echo \"error: No interpreter found for Python 9.9\" >&2\n"
               << "    exit 2\n";
    }
    script << "    mkdir -p \"$2/bin\"\n"
           << "    printf '#!/bin/sh\\nif [ \"$1\" = \"-c\" ]; then exec /bin/sh -c \"$2\"; fi\\nexit 2\\n'"
           << " > \"$2/bin/python\"\n"
           << "    chmod +x \"$2/bin/python\"\n"
           << "    ;;\n"
           << "  pip)\n"
           << "    echo \"install $6\" >> \"$LOG\"\n";
    if (options.install_sleep_s > 0) {
        script << "    sleep " << options.install_sleep_s << "\n";
    }
    if (options.fail_install) {
        script << "    echo \"error: No solution found when resolving dependencies: "
                  "nosuchpkg==0.0.1 was not found\" >&2\n"
               << "    exit 1\n";
    }
    script << "    cp \"$4\" \"$6/installed.txt\"\n"
           << "    echo \"${SSL_CERT_FILE:-none}\" > \"$6/cert.txt\"\n"
           << "    ;;\n"
           << "  *)\n"
           << "    echo \"unexpected invocation: $*\" >&2\n"
           << "    exit 64\n"
           << "    ;;\n"
           << "esac\n";

    const auto path = dir / "fake_uv";
    write_executable(path, script.str());
    return path;
}

inline core::config::ServiceConfig test_config(const std::filesystem::path& root) {
    core::config::ServiceConfig config = core::config::default_service_config();
    config.cache_root = root / "cache";
    config.temp_root = root / "runs";
    config.create_timeout_ms = 5000;
    config.install_timeout_ms = 5000;
    config.execution_timeout_ms = 5000;
    config.certificate_candidates.clear();
    return config;
}

inline std::optional<std::filesystem::path> find_on_path(const std::string& program) {
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }
    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const auto candidate = std::filesystem::path(dir) / program;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

inline std::size_t count_lines_starting_with(const std::filesystem::path& log,
                                             const std::string& prefix) {
    std::size_t count = 0;
    for (const auto& line : read_lines(log)) {
        if (line.rfind(prefix, 0) == 0) {
            ++count;
        }
    }
    return count;
}

}  // namespace venvbox::testing
