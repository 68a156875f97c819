/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Helper class
 */

#ifndef R_K_UTIL_H
#define R_K_UTIL_H

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace RebaseKit {

struct Util {
    static void ltrim(std::string &s);
    static void rtrim(std::string &s);
    static void trim(std::string &s);
    static std::string toLower(std::string s);
    static std::string join(const std::vector<std::string> &parts, const std::string &separator);
    static std::vector<std::string> split(const std::string &s, char delimiter);
    static bool startsWith(const std::string &s, const std::string &prefix);
    static bool endsWith(const std::string &s, const std::string &suffix);
    static std::filesystem::path userDataDir();
};

// Signal number noted by a signal handler, to be logged outside of it
struct PendingSignal {
    static void record(int signal);
    static int take();
};

struct CString {
    ~CString() { free(ptr); }
    operator char*() { return ptr; }
    char *ptr = nullptr;
};

} // namespace RebaseKit

#endif // R_K_UTIL_H
