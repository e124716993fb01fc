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

#include <chrono>
#include <functional>

namespace EloqDM
{
/**
 * @brief Backoff for resubmitting the unprocessed part of a batch request.
 * The delay before retry n (starting at 1) is base_delay * 2^(n-1) capped at
 * max_delay. The batch gives up after max_attempts retries.
 */
struct RetryPolicy
{
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // Delay before the given retry, retry >= 1.
    std::chrono::milliseconds DelayFor(int retry) const;

    // False when the ceiling is reached and the batch must give up.
    bool ShouldRetry(int retry) const;

    void Sleep(std::chrono::milliseconds delay) const;

    int max_attempts_{5};
    std::chrono::milliseconds base_delay_{10};
    std::chrono::milliseconds max_delay_{60000};
    // Tests replace it to record the delays without waiting.
    Sleeper sleeper_{nullptr};
};

}  // namespace EloqDM
