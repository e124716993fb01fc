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
#include "update_action.h"

#include "model_errors.h"

namespace EloqDM
{
namespace
{
void CheckNotKey(const Attribute &attr, const char *action)
{
    if (attr.IsKey())
    {
        throw BuildError(std::string(action) + " on key attribute '" +
                         attr.Name() + "' is not allowed");
    }
}
}  // namespace

UpdateAction Set(const Attribute &attr, Value value)
{
    if (value.IsNull() || (value.IsSet() && value.Size() == 0))
    {
        return Remove(attr);
    }
    CheckNotKey(attr, "SET");
    return UpdateAction{UpdateOp::Set, &attr, std::move(value)};
}

UpdateAction Remove(const Attribute &attr)
{
    CheckNotKey(attr, "REMOVE");
    return UpdateAction{UpdateOp::Remove, &attr, Value()};
}

UpdateAction Add(const Attribute &attr, Value value)
{
    CheckNotKey(attr, "ADD");
    WireType wt = attr.GetWireType();
    if (wt != WireType::Number && !attr.IsSetType())
    {
        throw BuildError("ADD requires a number or set attribute, '" +
                         attr.Name() + "' is " + WireTypeName(wt));
    }
    if (value.IsNull() || (value.IsSet() && value.Size() == 0))
    {
        throw BuildError("ADD on attribute '" + attr.Name() +
                         "' needs a non empty operand");
    }
    return UpdateAction{UpdateOp::Add, &attr, std::move(value)};
}

UpdateAction Delete(const Attribute &attr, Value elements)
{
    CheckNotKey(attr, "DELETE");
    if (!attr.IsSetType())
    {
        throw BuildError("DELETE requires a set attribute, '" + attr.Name() +
                         "' is " + WireTypeName(attr.GetWireType()));
    }
    if (elements.IsNull() || elements.Size() == 0)
    {
        throw BuildError("DELETE on attribute '" + attr.Name() +
                         "' needs a non empty set operand");
    }
    return UpdateAction{UpdateOp::Delete, &attr, std::move(elements)};
}

}  // namespace EloqDM
