/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Provide logging facilities by including this header file
 */

#ifndef R_K_LOG_H
#define R_K_LOG_H

#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <syslog.h>

enum class RKLogLevel {
    None=0, Error, Info, Debug
};
struct RKLogOutput {
    bool console = true;
    bool syslog = true;
};

// Output is produced from the execution worker threads as well, so every
// message is written while holding the log mutex.
class RKLog {
public:
    RKLogLevel level = RKLogLevel::Error;
    RKLogOutput output{};

    template<typename... T> void error(const T&... args) {
        if (level >= RKLogLevel::Error) {
            print_to_output(LOG_ERR, args...);
        }
        print_to_syslog(LOG_ERR, args...);
    }
    template<typename... T> void warning(const T&... args) {
        if (level >= RKLogLevel::Error) {
            print_to_output(LOG_WARNING, args...);
        }
        print_to_syslog(LOG_WARNING, args...);
    }
    template<typename... T> void info(const T&... args) {
        if (level >= RKLogLevel::Info) {
            print_to_output(LOG_INFO, args...);
        }
        print_to_syslog(LOG_INFO, args...);
    }
    template<typename... T> void debug(const T&... args) {
        if (level >= RKLogLevel::Debug) {
            print_to_output(LOG_DEBUG, args...);
            print_to_syslog(LOG_DEBUG, args...);
        }
    }

    template<typename... T> void log(const T&... args) {
        print_to_output(LOG_INFO, args...);
        print_to_syslog(LOG_INFO, args...);
    }

    void setLogOutput(std::string outputs) {
        RKLogOutput requested{false, false};
        std::string field;
        std::stringstream ss(outputs);
        while (getline(ss, field, ',')) {
            if (field == "console") {
                requested.console = true;
                continue;
            }
            if (field == "syslog") {
                requested.syslog = true;
                continue;
            }
            throw std::invalid_argument{"Invalid log output."};
        }
        std::lock_guard<std::mutex> guard{mutex};
        output = requested;
    }

private:
    std::mutex mutex;

    template<typename... T> void print_to_output(int loglevel, const T&... args) {
        if (output.console) {
            std::stringstream ss;
            ((ss << args),...);
            std::string s = ss.str();
            std::lock_guard<std::mutex> guard{mutex};
            if (loglevel <= LOG_WARNING) {
                std::cerr << s << std::endl;
            } else {
                std::cout << s << std::endl;
            }
        }
    }
    template<typename... T> void print_to_syslog(int loglevel, const T&... args) {
        if (output.syslog) {
            std::stringstream ss;
            ((ss << args),...);
            std::string s = ss.str();
            std::lock_guard<std::mutex> guard{mutex};
            syslog(loglevel, "%s", s.c_str());
        }
    }
};

inline RKLog rklog{};

#endif // R_K_LOG_H
