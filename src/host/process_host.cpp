#include "vconf/process_host.hpp"
#include "vconf/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace vconf {

namespace {

std::string find_on_path(const std::string& program) {
    if (program.find('/') != std::string::npos) return program;
    auto path = get_env("PATH").value_or("/usr/local/bin:/usr/bin:/bin");
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = join_path(dir, program);
        if (access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return "";
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& extra_env) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && extra_env.count(entry.substr(0, eq))) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : extra_env) {
        env.push_back(key + "=" + value);
    }
    return env;
}

// Removes its temporary files when the instance goes away
class ProcessHarnessInstance : public HarnessInstance {
public:
    ProcessHarnessInstance(std::vector<std::string> command, std::string artifact_path,
                           std::string manifest_path)
        : command_(std::move(command)),
          artifact_path_(std::move(artifact_path)),
          manifest_path_(std::move(manifest_path)) {}

    ~ProcessHarnessInstance() override {
        remove_file(artifact_path_);
        remove_file(manifest_path_);
    }

    Result<void> run() override {
        auto argv = expand_placeholders(command_, {{"artifact", artifact_path_}});
        spdlog::debug("running host command: {}", argv.front());

        auto result = run_process(argv, {{MANIFEST_ENV, manifest_path_}});
        if (!result.ok) {
            return Result<void>::err(Error(ErrorCode::HOST_UNAVAILABLE, result.error));
        }
        if (result.exit_code != 0) {
            return Result<void>::err(Error(ErrorCode::HOST_FAILED,
                                           "host command exited with status " +
                                           std::to_string(result.exit_code)));
        }
        return Result<void>::ok();
    }

private:
    std::vector<std::string> command_;
    std::string artifact_path_;
    std::string manifest_path_;
};

} // namespace

std::vector<std::string> expand_placeholders(const std::vector<std::string>& command,
                                             const std::map<std::string, std::string>& values) {
    std::vector<std::string> expanded;
    expanded.reserve(command.size());
    for (std::string arg : command) {
        for (const auto& [key, value] : values) {
            std::string token = "{" + key + "}";
            size_t pos = 0;
            while ((pos = arg.find(token, pos)) != std::string::npos) {
                arg.replace(pos, token.size(), value);
                pos += value.size();
            }
        }
        expanded.push_back(std::move(arg));
    }
    return expanded;
}

ProcessResult run_process(const std::vector<std::string>& argv_strings,
                          const std::map<std::string, std::string>& extra_env) {
    ProcessResult result;

    if (argv_strings.empty()) {
        result.error = "empty command";
        return result;
    }

    std::string binary = find_on_path(argv_strings.front());
    if (binary.empty()) {
        result.error = "command not found: " + argv_strings.front();
        return result;
    }

    auto env_strings = build_environment(extra_env);

    std::vector<char*> argv;
    for (const auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        execve(binary.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    int status;
    if (waitpid(pid, &status, 0) == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

Result<std::unique_ptr<HarnessInstance>> ProcessHost::load_harness(
    const std::vector<uint8_t>& artifact, const std::string& manifest) {
    using R = Result<std::unique_ptr<HarnessInstance>>;

    if (command_.empty()) {
        return R::err(Error(ErrorCode::HOST_UNAVAILABLE, "no host command configured"));
    }

    std::string artifact_path = make_temp_path("vconf-harness", ".wasm");
    auto written = write_binary_file(artifact_path, artifact);
    if (written.isErr()) return R::err(written.error());

    std::string manifest_path = make_temp_path("vconf-manifest", ".toml");
    written = write_binary_file(manifest_path, std::vector<uint8_t>(manifest.begin(), manifest.end()));
    if (written.isErr()) {
        remove_file(artifact_path);
        return R::err(written.error());
    }

    return R::ok(std::make_unique<ProcessHarnessInstance>(command_, artifact_path, manifest_path));
}

} // namespace vconf
