#pragma once

class ChildProcess;

/// Kill the child together with every process it started. Does not reap;
/// follow with ChildProcess::wait(). One implementation per platform is
/// selected by the build (process_tree_posix.cpp on Linux/macOS).
void terminate_process_tree(ChildProcess& child);
