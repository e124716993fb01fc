/**
 *    Copyright (C) 2025 EloqData Inc.
 *
 *    This program is free software: you can redistribute it and/or  modify
 *    it under either of the following two licenses:
 *    1. GNU Affero General Public License, version 3, as published by the Free
 *    Software Foundation.
 *    2. GNU General Public License as published by the Free Software
 *    Foundation; version 2 of the License.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU Affero General Public License or GNU General Public License for more
 *    details.
 *
 *    You should have received a copy of the GNU Affero General Public License
 *    and GNU General Public License V2 along with this program.  If not, see
 *    <http://www.gnu.org/licenses/>.
 *
 */
#pragma once
#include <glog/logging.h>
#include <limits.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <string>
#include <system_error>

// Defined by each executable, it names the log files.
DECLARE_string(log_file_name_prefix);

namespace EloqDM
{
// [2025-01-31T12:00:00.000123 I 1234] [model.cpp:42]
inline void CustomPrefix(std::ostream &s,
                         const google::LogMessageInfo &l,
                         void *)
{
    s << "[" << std::setw(4) << 1900 + l.time.year() << '-' << std::setw(2)
      << 1 + l.time.month() << '-' << std::setw(2) << l.time.day() << 'T'
      << std::setw(2) << l.time.hour() << ':' << std::setw(2) << l.time.min()
      << ':' << std::setw(2) << l.time.sec() << '.' << std::setfill('0')
      << std::setw(6) << l.time.usec() << " " << l.severity[0] << " "
      << l.thread_id << "] "
      << "[" << l.filename << ':' << l.line_number << "]";
}

// <binary dir>/../logs
inline std::string DefaultLogDir()
{
    char bin_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", bin_path, PATH_MAX);
    if (len <= 0)
    {
        return "logs";
    }
    std::filesystem::path full_path(std::string(bin_path, len));
    return full_path.parent_path().parent_path().string() + "/logs";
}

/**
 * @brief Set up glog for an executable built on the library.
 *
 * With GLOG_logtostderr and no GLOG_log_dir everything goes to stderr.
 * Otherwise INFO, WARNING and ERROR go to files under GLOG_log_dir named
 * after --log_file_name_prefix, which the GLOG_log_file_name_prefix
 * environment variable overrides.
 */
inline void InitGoogleLogging(char **argv)
{
    if (FLAGS_logtostderr && FLAGS_log_dir.empty())
    {
        FLAGS_alsologtostderr = false;
        FLAGS_logtostdout = false;
        google::InitGoogleLogging(argv[0], &CustomPrefix);
        return;
    }

    if (FLAGS_log_dir.empty())
    {
        FLAGS_log_dir = DefaultLogDir();
    }
    std::error_code ec;
    std::filesystem::create_directories(FLAGS_log_dir, ec);
    if (ec)
    {
        // Without a log dir glog can only write to stderr.
        FLAGS_logtostderr = true;
        google::InitGoogleLogging(argv[0], &CustomPrefix);
        LOG(WARNING) << "cannot create log dir " << FLAGS_log_dir << ": "
                     << ec.message() << ", logging to stderr";
        return;
    }

    FLAGS_logtostdout = false;
    FLAGS_logtostderr = false;
    FLAGS_minloglevel = 0;
    // Only FATAL is copied to stderr.
    FLAGS_stderrthreshold = google::GLOG_FATAL;
    FLAGS_logbuflevel = -1;
    FLAGS_log_file_header = false;

    const char *env_prefix = std::getenv("GLOG_log_file_name_prefix");
    if (env_prefix != nullptr)
    {
        FLAGS_log_file_name_prefix = env_prefix;
    }
    std::string log_file_prefix =
        FLAGS_log_dir + "/" + FLAGS_log_file_name_prefix + ".";

    google::SetLogDestination(google::INFO,
                              (log_file_prefix + "INFO.").c_str());
    google::SetLogDestination(google::WARNING,
                              (log_file_prefix + "WARNING.").c_str());
    google::SetLogDestination(google::ERROR,
                              (log_file_prefix + "ERROR.").c_str());
    google::SetLogSymlink(google::INFO, FLAGS_log_file_name_prefix.c_str());
    google::SetLogSymlink(google::WARNING, FLAGS_log_file_name_prefix.c_str());
    google::SetLogSymlink(google::ERROR, FLAGS_log_file_name_prefix.c_str());

    google::InitGoogleLogging(argv[0], &CustomPrefix);
}

}  // namespace EloqDM
