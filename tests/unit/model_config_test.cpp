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
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <unistd.h>

#include <catch2/catch_all.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include "INIReader.h"
#include "model_config.h"

using namespace EloqDM;

namespace
{
std::string WriteConfig(const std::string &content)
{
    std::string path =
        "/tmp/eloqdm_config_test_" + std::to_string(getpid()) + ".ini";
    std::ofstream out(path);
    out << content;
    return path;
}
}  // namespace

TEST_CASE("config-defaults")
{
    LOG(INFO) << "running: config-defaults: ";

    ClientConfig config;
    REQUIRE(config.region_ == "us-east-1");
    REQUIRE(config.endpoint_.empty());

    RetryPolicy policy = config.BatchRetryPolicy();
    REQUIRE(policy.max_attempts_ == 5);
    REQUIRE(policy.base_delay_ == std::chrono::milliseconds(10));
    REQUIRE(policy.max_delay_ == std::chrono::milliseconds(60000));
}

TEST_CASE("config-from-ini")
{
    LOG(INFO) << "running: config-from-ini: ";

    std::string path = WriteConfig(
        "[dynamodb]\n"
        "region = ap-southeast-1\n"
        "endpoint = http://localhost:8000\n"
        "aws_access_key_id = key\n"
        "aws_secret_key = secret\n"
        "request_timeout_ms = 500\n"
        "max_batch_retry_attempts = 8\n"
        "batch_retry_base_delay_ms = 50\n");
    INIReader reader(path);
    REQUIRE(reader.ParseError() == 0);

    ClientConfig config(reader);
    REQUIRE(config.region_ == "ap-southeast-1");
    REQUIRE(config.endpoint_ == "http://localhost:8000");
    REQUIRE(config.aws_access_key_id_ == "key");
    REQUIRE(config.aws_secret_key_ == "secret");
    REQUIRE(config.connect_timeout_ms_ == 1000);
    REQUIRE(config.request_timeout_ms_ == 500);

    RetryPolicy policy = config.BatchRetryPolicy();
    REQUIRE(policy.max_attempts_ == 8);
    REQUIRE(policy.DelayFor(2) == std::chrono::milliseconds(100));

    std::remove(path.c_str());
}

TEST_CASE("config-flags-override-ini")
{
    LOG(INFO) << "running: config-flags-override-ini: ";

    gflags::FlagSaver saver;
    std::string path = WriteConfig(
        "[dynamodb]\n"
        "region = ap-southeast-1\n"
        "max_batch_retry_attempts = -3\n");
    INIReader reader(path);
    REQUIRE(reader.ParseError() == 0);

    gflags::SetCommandLineOption("dynamodb_region", "eu-west-1");
    ClientConfig config(reader);
    REQUIRE(config.region_ == "eu-west-1");
    // Negative retry ceilings mean no resubmission at all.
    REQUIRE(config.max_batch_retry_attempts_ == 0);

    ClientConfig from_flags = ClientConfig::FromFlags();
    REQUIRE(from_flags.region_ == "eu-west-1");
    REQUIRE(from_flags.max_batch_retry_attempts_ == 5);

    std::remove(path.c_str());
}
