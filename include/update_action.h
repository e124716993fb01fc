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

#include <vector>

#include "attribute.h"
#include "attribute_value.h"

namespace EloqDM
{
// Clause an action is rendered into, in emission order.
enum class UpdateOp : uint8_t
{
    Set = 0,
    Remove,
    Add,
    Delete
};

struct UpdateAction
{
    UpdateOp op_;
    const Attribute *attr_;
    Value value_;
};

using UpdateActions = std::vector<UpdateAction>;

// A null value or an empty set turns into a Remove.
UpdateAction Set(const Attribute &attr, Value value);
UpdateAction Remove(const Attribute &attr);
// Number and set attributes only.
UpdateAction Add(const Attribute &attr, Value value);
// Set attributes only, removes the given elements.
UpdateAction Delete(const Attribute &attr, Value elements);

}  // namespace EloqDM
