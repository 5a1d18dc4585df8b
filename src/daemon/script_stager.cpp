#include "daemon/script_stager.hpp"
#include "daemon/child_process.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>

namespace fs = std::filesystem;

ScriptStager::ScriptStager(std::string staging_dir) : dir_(std::move(staging_dir)) {}

std::string ScriptStager::default_dir() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "relaycraft_scripts").string();
}

ScriptStager::StageResult ScriptStager::stage(const std::vector<std::string>& scripts,
                                              const std::string& injector,
                                              const std::string& python,
                                              const std::function<bool()>& cancelled) {
    StageResult result;
    if (scripts.empty()) {
        result.success = true;
        return result;
    }

    std::error_code ec;
    fs::remove_all(dir_, ec);
    fs::create_directories(dir_, ec);
    if (ec) {
        result.error = "Failed to create script staging dir " + dir_ + ": " + ec.message();
        return result;
    }

    bool can_inject = !injector.empty() && !python.empty() && fs::exists(injector);

    for (const auto& script : scripts) {
        if (cancelled && cancelled()) {
            result.cancelled = true;
            result.error = "Script staging cancelled";
            return result;
        }

        fs::path source(script);
        if (!fs::is_regular_file(source, ec)) {
            result.error = "Script not found: " + script;
            return result;
        }

        fs::path target = fs::path(dir_) / source.filename();

        if (can_inject) {
            std::string err;
            auto status = run_and_wait(python, {injector, source.string(), target.string()}, err);
            if (status && status->success() && fs::exists(target)) {
                result.staged.push_back(target.string());
                continue;
            }
            spdlog::warn("Failed to preprocess {}: {}", source.filename().string(),
                         status ? status->describe() : err);
        }

        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            result.error = "Failed to stage " + script + ": " + ec.message();
            return result;
        }
        result.staged.push_back(target.string());
    }

    result.success = true;
    return result;
}

void ScriptStager::cleanup() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        spdlog::warn("Failed to remove script staging dir {}: {}", dir_, ec.message());
    }
}
