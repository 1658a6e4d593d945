/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#include "tool/drama.h"

#include <iostream>

#include <stdio.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

constexpr size_t PIPE_BUF_SIZE = 4096;

inline bool
exited_cleanly(int status) {
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

DRAMATool::DRAMATool(std::string drama_dir)
    :drama_dir_(drama_dir),
    binary_(DRAMA_BINARY)
{
    for (std::string_view d : DRAMA_DEPENDENCIES) dependencies_.emplace_back(d);
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

AcquireStatus
DRAMATool::check_dependencies() const {
    for (const std::string& dep : dependencies_) {
        if (!find_in_path(dep)) {
            std::cerr << "Dependency \"" << dep << "\" is not installed.\n";
            return AcquireStatus::MISSING_DEPENDENCY;
        }
    }
    return AcquireStatus::OK;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

AcquireStatus
DRAMATool::run_make(std::string_view target) const {
    if (verbose_) {
        std::cerr << "Building target \"" << target << "\" in " << drama_dir_ << "\n";
    }
    std::string cmd = "cd " + shell_quote(drama_dir_) + " && make " + shell_quote(target);
    // Flush so that make's output does not interleave with ours.
    std::cout.flush();
    if (!exited_cleanly( system(cmd.c_str()) )) {
        std::cerr << "Failed to build target \"" << target << "\" in " << drama_dir_ << ".\n";
        return AcquireStatus::BUILD_FAILED;
    }
    if (verbose_) {
        std::cerr << "Successfully built target \"" << target << "\"\n";
    }
    return AcquireStatus::OK;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

AcquireStatus
DRAMATool::execute(const std::vector<std::string>& params, std::string& out) const {
    std::string cmd = "cd " + shell_quote(drama_dir_) + " && " + shell_quote(binary_);
    for (const std::string& p : params) {
        cmd += " " + shell_quote(p);
    }
    if (verbose_) {
        std::cerr << "Executing: " << cmd << "\n";
    }

    FILE* pipe = popen(cmd.c_str(), "r");
    if (pipe == nullptr) {
        std::cerr << "Could not start " << binary_ << ".\n";
        return AcquireStatus::EXEC_FAILED;
    }
    std::string data;
    char buf[PIPE_BUF_SIZE];
    size_t n;
    while ((n = fread(buf, 1, PIPE_BUF_SIZE, pipe)) > 0) {
        data.append(buf, n);
    }
    int status = pclose(pipe);
    if (!exited_cleanly(status)) {
        std::cerr << "Error running " << binary_ << " in " << drama_dir_ << ".\n";
        return AcquireStatus::EXEC_FAILED;
    }
    out = std::move(data);
    return AcquireStatus::OK;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

AcquireStatus
DRAMATool::run_pipeline(std::string& report, const std::vector<std::string>& params, std::string_view target) const {
    AcquireStatus s;
    if ((s=check_dependencies()) != AcquireStatus::OK) return s;
    if ((s=run_make(target)) != AcquireStatus::OK)     return s;
    if ((s=execute(params, report)) != AcquireStatus::OK) return s;
    if (report.empty()) {
        std::cerr << binary_ << " produced no output.\n";
        return AcquireStatus::EMPTY_OUTPUT;
    }
    return AcquireStatus::OK;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

bool
find_in_path(std::string_view program) {
    if (program.empty()) {
        return false;
    }
    if (program.find('/') != std::string_view::npos) {
        return access(std::string(program).c_str(), X_OK) == 0;
    }
    const char* path = getenv("PATH");
    if (path == nullptr) {
        return false;
    }
    std::string_view dirs(path);
    while (true) {
        size_t colon = dirs.find(':');
        std::string_view d = dirs.substr(0, colon);
        // An empty entry means the current directory.
        std::string full = (d.empty() ? std::string(".") : std::string(d)) + "/" + std::string(program);
        if (access(full.c_str(), X_OK) == 0) {
            return true;
        }
        if (colon == std::string_view::npos) {
            break;
        }
        dirs.remove_prefix(colon+1);
    }
    return false;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

std::string
shell_quote(std::string_view s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else           out += c;
    }
    out += "'";
    return out;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
