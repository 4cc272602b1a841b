// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "exception.h"
#include "logging.h"
#include "payload.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace proflog {


namespace detail {

inline bool write_new_file(const std::string& path, std::string_view content, int* error_out)
{
    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    } while (fd == -1 && errno == EINTR);
    if (fd == -1) {
        *error_out = errno;
        return false;
    }

    const char* bytes = content.data();
    size_t size = content.size();
    while (size > 0) {
        const ssize_t written = ::write(fd, bytes, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            *error_out = errno;
            ::close(fd);
            return false;
        }
        bytes += written;
        size -= static_cast<size_t>(written);
    }

    if (::close(fd) == -1 && errno != EINTR) {
        *error_out = errno;
        return false;
    }
    return true;
}

} // namespace detail


// A uniquely named directory shared with the child for the lifetime of a run.
// It holds the instrumentation payload and the per-process sample files, and
// is removed, with whatever the child left in it, when the workspace is
// removed or destroyed.
class Scratch_workspace
{
public:
    Scratch_workspace() = default;

    Scratch_workspace(Scratch_workspace&& other) noexcept
        : m_path(std::exchange(other.m_path, std::string()))
    {}

    Scratch_workspace& operator=(Scratch_workspace&& other) noexcept
    {
        if (this != &other) {
            remove();
            m_path = std::exchange(other.m_path, std::string());
        }
        return *this;
    }

    Scratch_workspace(const Scratch_workspace&) = delete;
    Scratch_workspace& operator=(const Scratch_workspace&) = delete;

    ~Scratch_workspace() { remove(); }

    // $TMPDIR, or /tmp.
    static std::string temp_root()
    {
        const char* tmpdir = std::getenv("TMPDIR");
        if (!tmpdir || *tmpdir == '\0') {
            return "/tmp";
        }
        std::string root(tmpdir);
        while (root.size() > 1 && root.back() == '/') {
            root.pop_back();
        }
        return root;
    }

    // Creates <root>/<prefix>-<n> for the first n that is not taken, and
    // writes the payload into it.
    static Scratch_workspace create(
        const std::string& prefix = scratch_prefix,
        std::string_view payload = python_payload,
        const std::string& root = temp_root())
    {
        Scratch_workspace workspace;

        for (int n = 1; n <= max_scratch_attempts; ++n) {
            std::string candidate = root + "/" + prefix + "-" + std::to_string(n);
            if (::mkdir(candidate.c_str(), 0700) == 0) {
                workspace.m_path = std::move(candidate);
                break;
            }
            const int mkdir_errno = errno;
            if (mkdir_errno != EEXIST) {
                throw workspace_error("could not create scratch directory", candidate, mkdir_errno);
            }
        }
        if (workspace.m_path.empty()) {
            throw workspace_error("no free scratch directory name under", root, EEXIST);
        }

        // from here on, a failure removes the directory again
        int error = 0;
        const std::string payload_path = workspace.payload_path();
        if (!detail::write_new_file(payload_path, payload, &error)) {
            throw workspace_error("could not write", payload_path, error);
        }

        ls_debug() << "scratch workspace " << workspace.m_path;
        return workspace;
    }

    const std::string& path() const { return m_path; }
    bool active() const { return !m_path.empty(); }

    std::string payload_path() const { return m_path + "/" + payload_file_name; }

    // Removes the directory tree. Only the first call does anything; a failure
    // is reported as a warning and not retried.
    bool remove()
    {
        if (m_path.empty()) {
            return true;
        }
        const std::string path = std::exchange(m_path, std::string());

        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec) {
            ls_warning() << "failed to clean up scratch directory " << path << ": " << ec.message();
            return false;
        }
        return true;
    }

private:
    std::string m_path;
};

} // namespace proflog
