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
#include "retry_policy.h"

#include <glog/logging.h>

#include <thread>

namespace EloqDM
{
std::chrono::milliseconds RetryPolicy::DelayFor(int retry) const
{
    std::chrono::milliseconds delay = base_delay_;
    for (int i = 1; i < retry; ++i)
    {
        delay *= 2;
        if (delay > max_delay_)
        {
            return max_delay_;
        }
    }
    return delay;
}

bool RetryPolicy::ShouldRetry(int retry) const
{
    if (retry > max_attempts_)
    {
        LOG(WARNING) << "batch retry count exceeds the limit of "
                     << max_attempts_;
        return false;
    }
    if (retry >= 10)
    {
        LOG(INFO) << "retry unprocessed batch items, times " << retry;
    }
    return true;
}

void RetryPolicy::Sleep(std::chrono::milliseconds delay) const
{
    if (sleeper_ != nullptr)
    {
        sleeper_(delay);
        return;
    }
    std::this_thread::sleep_for(delay);
}

}  // namespace EloqDM
