/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#include "tool/report.h"

#include <iostream>

#include <zlib.h>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

constexpr unsigned REPORT_CHUNK = 8192;

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

AcquireStatus
read_report_file(const std::string& path, std::string& out) {
    gzFile in = gzopen(path.c_str(), "rb");
    if (in == nullptr) {
        std::cerr << "Could not open report file \"" << path << "\".\n";
        return AcquireStatus::FILE_ERROR;
    }
    std::string data;
    char buf[REPORT_CHUNK];
    int n;
    while ((n = gzread(in, buf, REPORT_CHUNK)) > 0) {
        data.append(buf, static_cast<size_t>(n));
    }
    if (n < 0) {
        int errnum;
        std::cerr << "Could not read report file \"" << path << "\": " << gzerror(in, &errnum) << "\n";
        gzclose(in);
        return AcquireStatus::FILE_ERROR;
    }
    gzclose(in);
    out = std::move(data);
    return AcquireStatus::OK;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
