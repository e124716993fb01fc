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
#include <optional>

#include "condition.h"
#include "item.h"
#include "model_errors.h"
#include "update_action.h"

namespace EloqDM
{
enum class WriteKind : uint8_t
{
    Put = 0,
    Update,
    Delete
};

/**
 * @brief Optimistic concurrency for one write of one item.
 *
 * For models with a version attribute the guard computes the version the
 * write stores and the condition that makes the write fail when another
 * writer got there first:
 *   - new item (no stored version): stores 1, no condition;
 *   - Update: version = stored, stores stored + 1;
 *   - Put over an existing item: attribute_exists(version) AND
 *     version = stored, stores stored + 1;
 *   - Delete: version = stored.
 * Models without a version attribute get an inert guard.
 */
class VersionGuard
{
public:
    VersionGuard(const Item &item, WriteKind kind);

    bool IsVersioned() const
    {
        return attr_ != nullptr;
    }

    // True when the write carries a version condition.
    bool IsGuarded() const
    {
        return condition_.has_value();
    }

    const std::optional<Condition> &GuardCondition() const
    {
        return condition_;
    }

    std::optional<int64_t> ExpectedVersion() const
    {
        return expected_;
    }

    // Version stored by a successful Put or Update.
    int64_t NextVersion() const
    {
        return next_;
    }

    // Caller condition AND version condition.
    std::optional<Condition> Combine(
        const std::optional<Condition> &condition) const;

    // Put: overwrite the version of the encoded document.
    void ApplyTo(AttributeMap &document) const;

    // Update: append the SET of the new version.
    void ApplyTo(UpdateActions &actions) const;

    // Record the stored version on the item once the write succeeded.
    void Commit(Item &item) const;

    /**
     * @brief Error to raise for a failed conditional write: VersionConflict
     * for guarded writes, ConditionalCheckFailed otherwise.
     */
    [[noreturn]] void ThrowConditionFailed(
        const std::string &operation,
        const Aws::DynamoDB::DynamoDBError &error,
        std::optional<AttributeMap> old_item) const;

private:
    const Attribute *attr_{nullptr};
    WriteKind kind_;
    std::optional<int64_t> expected_;
    int64_t next_{1};
    std::optional<Condition> condition_;
};

}  // namespace EloqDM
