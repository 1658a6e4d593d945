/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#ifndef TOOL_REPORT_h
#define TOOL_REPORT_h

#include "defs.h"

#include <string>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * Reads a saved tool report into `out`. The file may be plain text or
 * gzip-compressed (zlib detects which). Returns `FILE_ERROR` if the file
 * cannot be opened or read; `out` is unchanged in that case.
 * */
AcquireStatus read_report_file(const std::string& path, std::string& out);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

#endif  // TOOL_REPORT_h
