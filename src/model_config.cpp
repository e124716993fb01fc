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
#include "model_config.h"

#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_string(dynamodb_region, "us-east-1", "DynamoDB region");
DEFINE_string(dynamodb_endpoint,
              "",
              "DynamoDB endpoint, e.g. http://localhost:8000 for DynamoDB "
              "Local. Empty for the regional AWS endpoint");
DEFINE_string(dynamodb_aws_access_key_id, "", "AWS access key id");
DEFINE_string(dynamodb_aws_secret_key, "", "AWS secret key");
DEFINE_int64(dynamodb_connect_timeout_ms, 1000, "DynamoDB connect timeout");
DEFINE_int64(dynamodb_request_timeout_ms, 3000, "DynamoDB request timeout");
DEFINE_int32(dynamodb_max_batch_retry_attempts,
             5,
             "Max resubmissions of unprocessed batch items");
DEFINE_int64(dynamodb_batch_retry_base_delay_ms,
             10,
             "Delay before the first resubmission of unprocessed batch items");
DEFINE_int64(dynamodb_batch_retry_max_delay_ms,
             60000,
             "Upper bound of the batch resubmission delay");

namespace EloqDM
{
namespace
{
const char *const kSection = "dynamodb";

bool CheckCommandLineFlagIsDefault(const char *name)
{
    gflags::CommandLineFlagInfo flag_info;
    if (!gflags::GetCommandLineFlagInfo(name, &flag_info))
    {
        LOG(ERROR) << "undeclared command line flag " << name;
        return true;
    }
    // True if the flag was not set on the cmdline or by SetCommandLineOption.
    return flag_info.is_default;
}

std::string GetString(const INIReader &config,
                      const char *flag_name,
                      const char *key,
                      const std::string &flag_value)
{
    return !CheckCommandLineFlagIsDefault(flag_name)
               ? flag_value
               : config.GetString(kSection, key, flag_value);
}

int64_t GetInteger(const INIReader &config,
                   const char *flag_name,
                   const char *key,
                   int64_t flag_value)
{
    return !CheckCommandLineFlagIsDefault(flag_name)
               ? flag_value
               : config.GetInteger(kSection, key, flag_value);
}
}  // namespace

ClientConfig::ClientConfig(const INIReader &config)
{
    region_ =
        GetString(config, "dynamodb_region", "region", FLAGS_dynamodb_region);
    endpoint_ = GetString(
        config, "dynamodb_endpoint", "endpoint", FLAGS_dynamodb_endpoint);
    aws_access_key_id_ = GetString(config,
                                   "dynamodb_aws_access_key_id",
                                   "aws_access_key_id",
                                   FLAGS_dynamodb_aws_access_key_id);
    aws_secret_key_ = GetString(config,
                                "dynamodb_aws_secret_key",
                                "aws_secret_key",
                                FLAGS_dynamodb_aws_secret_key);
    connect_timeout_ms_ = GetInteger(config,
                                     "dynamodb_connect_timeout_ms",
                                     "connect_timeout_ms",
                                     FLAGS_dynamodb_connect_timeout_ms);
    request_timeout_ms_ = GetInteger(config,
                                     "dynamodb_request_timeout_ms",
                                     "request_timeout_ms",
                                     FLAGS_dynamodb_request_timeout_ms);
    max_batch_retry_attempts_ =
        static_cast<int>(GetInteger(config,
                                    "dynamodb_max_batch_retry_attempts",
                                    "max_batch_retry_attempts",
                                    FLAGS_dynamodb_max_batch_retry_attempts));
    batch_retry_base_delay_ms_ =
        GetInteger(config,
                   "dynamodb_batch_retry_base_delay_ms",
                   "batch_retry_base_delay_ms",
                   FLAGS_dynamodb_batch_retry_base_delay_ms);
    batch_retry_max_delay_ms_ =
        GetInteger(config,
                   "dynamodb_batch_retry_max_delay_ms",
                   "batch_retry_max_delay_ms",
                   FLAGS_dynamodb_batch_retry_max_delay_ms);

    if (max_batch_retry_attempts_ < 0)
    {
        LOG(WARNING) << "max_batch_retry_attempts " << max_batch_retry_attempts_
                     << " is negative, batches are not resubmitted";
        max_batch_retry_attempts_ = 0;
    }
}

ClientConfig ClientConfig::FromFlags()
{
    ClientConfig config;
    config.region_ = FLAGS_dynamodb_region;
    config.endpoint_ = FLAGS_dynamodb_endpoint;
    config.aws_access_key_id_ = FLAGS_dynamodb_aws_access_key_id;
    config.aws_secret_key_ = FLAGS_dynamodb_aws_secret_key;
    config.connect_timeout_ms_ = FLAGS_dynamodb_connect_timeout_ms;
    config.request_timeout_ms_ = FLAGS_dynamodb_request_timeout_ms;
    config.max_batch_retry_attempts_ =
        FLAGS_dynamodb_max_batch_retry_attempts < 0
            ? 0
            : FLAGS_dynamodb_max_batch_retry_attempts;
    config.batch_retry_base_delay_ms_ = FLAGS_dynamodb_batch_retry_base_delay_ms;
    config.batch_retry_max_delay_ms_ = FLAGS_dynamodb_batch_retry_max_delay_ms;
    return config;
}

RetryPolicy ClientConfig::BatchRetryPolicy() const
{
    RetryPolicy policy;
    policy.max_attempts_ = max_batch_retry_attempts_;
    policy.base_delay_ = std::chrono::milliseconds(batch_retry_base_delay_ms_);
    policy.max_delay_ = std::chrono::milliseconds(batch_retry_max_delay_ms_);
    return policy;
}

}  // namespace EloqDM
