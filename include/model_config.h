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

#include <cstdint>
#include <string>

#include "INIReader.h"
#include "retry_policy.h"

namespace EloqDM
{
/**
 * @brief Store connection and batch retry settings.
 *
 * Read from the [dynamodb] section of an ini file. A command line flag
 * (--dynamodb_region, --dynamodb_endpoint, ...) that was set explicitly wins
 * over the file.
 */
struct ClientConfig
{
    ClientConfig() = default;
    explicit ClientConfig(const INIReader &config);

    // Flags only, for callers without a config file.
    static ClientConfig FromFlags();

    RetryPolicy BatchRetryPolicy() const;

    std::string region_{"us-east-1"};
    // Empty means the regional AWS endpoint.
    std::string endpoint_;
    std::string aws_access_key_id_;
    std::string aws_secret_key_;
    int64_t connect_timeout_ms_{1000};
    int64_t request_timeout_ms_{3000};
    int max_batch_retry_attempts_{5};
    int64_t batch_retry_base_delay_ms_{10};
    int64_t batch_retry_max_delay_ms_{60000};
};

}  // namespace EloqDM
