#pragma once

#include <functional>
#include <string>
#include <vector>

/// Copies enabled user scripts into a per-run directory before the engine
/// loads them, running the log-tagging injector over each one when an
/// interpreter and injector are available.
class ScriptStager {
public:
    explicit ScriptStager(std::string staging_dir = default_dir());

    /// <tmp>/relaycraft_scripts
    static std::string default_dir();

    struct StageResult {
        bool success = false;
        bool cancelled = false;
        std::string error;
        std::vector<std::string> staged;  // same order as the input
    };

    /// Wipe the staging dir and stage every script under its own file name.
    /// `injector` / `python` may be empty: the script is copied verbatim.
    /// `cancelled` is polled between scripts; staging stops once it is true.
    StageResult stage(const std::vector<std::string>& scripts,
                      const std::string& injector,
                      const std::string& python,
                      const std::function<bool()>& cancelled = nullptr);

    /// Remove the staging dir; failures are logged only
    void cleanup();

    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
};
