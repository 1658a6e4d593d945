/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#ifndef TOOL_DRAMA_h
#define TOOL_DRAMA_h

#include "defs.h"

#include <string>
#include <string_view>
#include <vector>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * Drives an (unmodified) checkout of the DRAMA reverse-engineering tool:
 * checks that it can be built, builds it with `make`, runs it, and captures
 * its report. Every step returns `AcquireStatus::OK` or the reason it
 * failed; messages go to `std::cerr`.
 * */
class DRAMATool {
public:
    const std::string drama_dir_;

    std::vector<std::string> dependencies_;
    std::string binary_;

    bool verbose_ =false;
public:
    DRAMATool(std::string drama_dir);
    /*
     * Every entry of `dependencies_` must resolve to an executable on `PATH`.
     * */
    AcquireStatus check_dependencies(void) const;
    AcquireStatus run_make(std::string_view target=DRAMA_MAKE_TARGET) const;
    /*
     * Runs `binary_` with `params` inside `drama_dir_` and stores its stdout
     * in `out`. A non-zero exit status is `EXEC_FAILED`.
     * */
    AcquireStatus execute(const std::vector<std::string>& params, std::string& out) const;
    /*
     * `check_dependencies`, `run_make`, then `execute`. An empty report is
     * `EMPTY_OUTPUT`.
     * */
    AcquireStatus run_pipeline(std::string& report,
                                const std::vector<std::string>& params={},
                                std::string_view target=DRAMA_MAKE_TARGET) const;
};

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

bool        find_in_path(std::string_view program);
std::string shell_quote(std::string_view);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

#endif  // TOOL_DRAMA_h
