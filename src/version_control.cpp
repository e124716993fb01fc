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
#include "version_control.h"

#include <glog/logging.h>

namespace EloqDM
{
VersionGuard::VersionGuard(const Item &item, WriteKind kind)
    : attr_(item.GetSchema().VersionAttribute()), kind_(kind)
{
    if (attr_ == nullptr)
    {
        return;
    }

    expected_ = item.Version();
    if (!expected_.has_value())
    {
        // First write of the item.
        next_ = 1;
        return;
    }

    int64_t stored = *expected_;
    next_ = stored + 1;
    switch (kind_)
    {
    case WriteKind::Put:
        condition_ = And(Exists(*attr_), Eq(*attr_, Value(stored)));
        break;
    case WriteKind::Update:
    case WriteKind::Delete:
        condition_ = Eq(*attr_, Value(stored));
        break;
    }
}

std::optional<Condition> VersionGuard::Combine(
    const std::optional<Condition> &condition) const
{
    return AndMaybe(condition, condition_);
}

void VersionGuard::ApplyTo(AttributeMap &document) const
{
    if (attr_ == nullptr)
    {
        return;
    }
    Aws::DynamoDB::Model::AttributeValue av;
    av.SetN(std::to_string(next_));
    document[attr_->Name()] = std::move(av);
}

void VersionGuard::ApplyTo(UpdateActions &actions) const
{
    if (attr_ == nullptr)
    {
        return;
    }
    actions.push_back(Set(*attr_, Value(next_)));
}

void VersionGuard::Commit(Item &item) const
{
    if (attr_ == nullptr || kind_ == WriteKind::Delete)
    {
        return;
    }
    item.Set(attr_->Name(), Value(next_));
}

void VersionGuard::ThrowConditionFailed(
    const std::string &operation,
    const Aws::DynamoDB::DynamoDBError &error,
    std::optional<AttributeMap> old_item) const
{
    if (IsGuarded())
    {
        LOG(WARNING) << operation << " lost the race on version "
                     << *expected_ << ": " << error.GetMessage();
        throw VersionConflict(
            operation, error, std::move(old_item), *expected_);
    }
    throw ConditionalCheckFailed(operation, error, std::move(old_item));
}

}  // namespace EloqDM
