#include "core/paths.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

std::string project_root_from_cwd() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) return "";
    return project_root_for(cwd.string());
}

} // namespace

std::string project_root_for(const std::string& cwd) {
    fs::path dir(cwd);
    if (dir.filename().empty()) dir = dir.parent_path();  // trailing slash
    if (dir.filename() == "src-tauri" && dir.has_parent_path()) {
        return dir.parent_path().string();
    }
    return dir.string();
}

PathContext PathContext::from_config(const AppConfig& config) {
    PathContext ctx;
    ctx.dev_mode = config.dev_mode;
    ctx.exe_dir = Config::exe_dir();
    if (ctx.dev_mode) {
        ctx.project_root = project_root_from_cwd();
    }
    ctx.resource_dir = config.resource_dir.empty() ? ctx.exe_dir : config.resource_dir;
    return ctx;
}

std::string engine_binary_name() {
#ifdef _WIN32
    return "engine.exe";
#else
    return "engine";
#endif
}

std::vector<std::string> engine_candidates(const PathContext& ctx) {
    const std::string name = engine_binary_name();
    std::vector<std::string> out;

    // bin/ next to the executable has the highest priority in both layouts
    if (!ctx.exe_dir.empty()) {
        out.push_back((fs::path(ctx.exe_dir) / "bin" / name).string());
    }

    if (ctx.dev_mode) {
        if (!ctx.project_root.empty()) {
            fs::path root(ctx.project_root);
            out.push_back((root / "src-tauri" / "binaries" / name).string());
        }
        return out;
    }

    if (!ctx.exe_dir.empty()) {
        out.push_back((fs::path(ctx.exe_dir) / ".core" / name).string());
    }
    if (!ctx.resource_dir.empty()) {
        fs::path res(ctx.resource_dir);
        out.push_back((res / name).string());
        out.push_back((res / ".core" / name).string());
    }
    if (!ctx.exe_dir.empty()) {
        out.push_back((fs::path(ctx.exe_dir) / name).string());
    }
    return out;
}

EnginePathResult resolve_engine_path(const PathContext& ctx) {
    EnginePathResult result;
    for (const auto& candidate : engine_candidates(ctx)) {
        spdlog::debug("[PathCheck] Checking engine candidate: {}", candidate);
        if (is_file(candidate)) {
            result.found = true;
            result.path = candidate;
            return result;
        }
    }
    result.error = "Engine executable not found (" + engine_binary_name() +
                   "). Please reinstall the application or check permissions.";
    return result;
}

EnginePathResult resolve_engine_path(const PathContext& ctx, const std::string& override_path) {
    if (override_path.empty()) {
        return resolve_engine_path(ctx);
    }

    EnginePathResult result;
    if (is_file(override_path)) {
        result.found = true;
        result.path = override_path;
    } else {
        result.error = "Engine not found: " + override_path;
    }
    return result;
}

std::string resolve_python_path(const PathContext& ctx, const std::string& engine_path) {
    if (ctx.dev_mode || engine_path.empty()) {
        return "python";
    }

    fs::path engine_dir = fs::path(engine_path).parent_path();
    const std::vector<fs::path> candidates = {
#ifdef _WIN32
        engine_dir / "python.exe",
#else
        engine_dir / "python3",
        engine_dir / "python3.12",
        engine_dir / "_internal" / "py_runtime" / "Python",
#endif
    };

    for (const auto& path : candidates) {
        if (is_file(path)) {
            spdlog::debug("[PathCheck] Found bundled Python: {}", path.string());
            return path.string();
        }
    }

    // The engine binary may embed its own runtime
    spdlog::info("[PathCheck] Falling back to system 'python'");
    return "python";
}

std::string find_addon(const PathContext& ctx, const std::string& file_name) {
    std::vector<fs::path> candidates;
    if (ctx.dev_mode) {
        if (!ctx.project_root.empty()) {
            candidates.push_back(fs::path(ctx.project_root) / "engine-core" / "addons" / file_name);
        }
    } else if (!ctx.resource_dir.empty()) {
        fs::path res(ctx.resource_dir);
        candidates.push_back(res / "resources" / "addons" / file_name);
        candidates.push_back(res / "addons" / file_name);
        candidates.push_back(res / file_name);
    }

    for (const auto& path : candidates) {
        if (is_file(path)) return path.string();
    }
    return "";
}
