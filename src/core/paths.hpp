#pragma once

#include <string>
#include <vector>

struct AppConfig;

/// Where to look for the engine and its addons
struct PathContext {
    bool dev_mode = false;
    std::string exe_dir;       // directory of the running binary
    std::string project_root;  // dev mode only: source checkout
    std::string resource_dir;  // installed mode: bundled resources

    /// Build from settings and the process environment
    static PathContext from_config(const AppConfig& config);
};

struct EnginePathResult {
    bool found = false;
    std::string path;
    std::string error;
};

/// Source checkout root for a dev run started from `cwd`; a cwd inside
/// src-tauri/ maps to its parent
std::string project_root_for(const std::string& cwd);

/// "engine.exe" on Windows, "engine" elsewhere
std::string engine_binary_name();

/// Ordered candidate locations for the engine executable
std::vector<std::string> engine_candidates(const PathContext& ctx);

/// First existing engine candidate, or a definite error
EnginePathResult resolve_engine_path(const PathContext& ctx);

/// Same, but an explicit override is authoritative: it is returned when it
/// exists and is an error when it does not.
EnginePathResult resolve_engine_path(const PathContext& ctx, const std::string& override_path);

/// Bundled interpreter next to the engine, else "python" from PATH
std::string resolve_python_path(const PathContext& ctx, const std::string& engine_path);

/// Locate an addon file (entry.py, anchor.py, injector.py); empty if absent
std::string find_addon(const PathContext& ctx, const std::string& file_name);
