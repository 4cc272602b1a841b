// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"

#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <vector>

extern char** environ;

namespace proflog {

using Environment_map = std::map<std::string, std::string>;


inline Environment_map current_environment()
{
    Environment_map env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const char* eq = std::strchr(*entry, '=');
        if (!eq || eq == *entry) {
            continue;
        }
        // first definition wins, as with getenv()
        env.emplace(std::string(*entry, static_cast<size_t>(eq - *entry)), std::string(eq + 1));
    }
    return env;
}


// Environment for an instrumented child: the scratch directory goes first on
// PYTHONPATH, so that the interpreter imports the payload, and is also named
// directly for the payload itself.
inline Environment_map child_environment(const std::string& scratch_dir, Environment_map base)
{
    auto it = base.find("PYTHONPATH");
    if (it == base.end() || it->second.empty()) {
        // An empty PYTHONPATH entry would add the working directory.
        base["PYTHONPATH"] = scratch_dir;
    }
    else {
        it->second = scratch_dir + ":" + it->second;
    }
    base[stacktrace_dir_variable] = scratch_dir;
    return base;
}


inline std::vector<std::string> environment_block(const Environment_map& env)
{
    std::vector<std::string> block;
    block.reserve(env.size());
    for (const auto& kv : env) {
        block.push_back(kv.first + "=" + kv.second);
    }
    return block;
}


// PATH used to resolve a bare program name: the child's own PATH when the
// request carries an environment, else ours, else the POSIX default.
inline std::string search_path(const Environment_map* env)
{
    if (env) {
        auto it = env->find("PATH");
        if (it != env->end()) {
            return it->second;
        }
    }
    else if (const char* path = std::getenv("PATH")) {
        return path;
    }
    return "/usr/bin:/bin";
}


// Every path the child will hand to execve(), in order.
inline std::vector<std::string> exec_candidates(const std::string& program, const std::string& path)
{
    std::vector<std::string> candidates;
    if (program.find('/') != std::string::npos) {
        candidates.push_back(program);
        return candidates;
    }

    size_t begin = 0;
    while (true) {
        const size_t end = path.find(':', begin);
        std::string dir = path.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
        if (dir.empty()) {
            dir = ".";
        }
        if (dir.back() != '/') {
            dir += '/';
        }
        candidates.push_back(dir + program);
        if (end == std::string::npos) {
            break;
        }
        begin = end + 1;
    }
    return candidates;
}

} // namespace proflog
