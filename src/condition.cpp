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
#include "condition.h"

#include "model_errors.h"

namespace EloqDM
{
const char *ConditionOpName(ConditionOp op)
{
    switch (op)
    {
    case ConditionOp::Equals:
        return "=";
    case ConditionOp::NotEquals:
        return "<>";
    case ConditionOp::LessThan:
        return "<";
    case ConditionOp::LessOrEqual:
        return "<=";
    case ConditionOp::GreaterThan:
        return ">";
    case ConditionOp::GreaterOrEqual:
        return ">=";
    case ConditionOp::Between:
        return "BETWEEN";
    case ConditionOp::In:
        return "IN";
    case ConditionOp::Exists:
        return "attribute_exists";
    case ConditionOp::NotExists:
        return "attribute_not_exists";
    case ConditionOp::BeginsWith:
        return "begins_with";
    case ConditionOp::Contains:
        return "contains";
    case ConditionOp::And:
        return "AND";
    case ConditionOp::Or:
        return "OR";
    case ConditionOp::Not:
        return "NOT";
    }
    return "?";
}

Condition Condition::Leaf(ConditionOp op,
                          const Attribute &attr,
                          std::vector<Value> operands)
{
    for (const Value &v : operands)
    {
        if (v.IsNull())
        {
            throw BuildError(std::string(ConditionOpName(op)) +
                             " on attribute '" + attr.Name() +
                             "' with a null operand");
        }
    }
    auto node = std::make_shared<Node>();
    node->op_ = op;
    node->attr_ = &attr;
    node->operands_ = std::move(operands);
    return Condition(std::move(node));
}

Condition Condition::Logical(ConditionOp op, std::vector<Condition> children)
{
    auto node = std::make_shared<Node>();
    node->op_ = op;
    node->children_ = std::move(children);
    return Condition(std::move(node));
}

Condition Eq(const Attribute &attr, Value value)
{
    return Condition::Leaf(ConditionOp::Equals, attr, {std::move(value)});
}

Condition Ne(const Attribute &attr, Value value)
{
    return Condition::Leaf(ConditionOp::NotEquals, attr, {std::move(value)});
}

Condition Lt(const Attribute &attr, Value value)
{
    return Condition::Leaf(ConditionOp::LessThan, attr, {std::move(value)});
}

Condition Le(const Attribute &attr, Value value)
{
    return Condition::Leaf(ConditionOp::LessOrEqual, attr, {std::move(value)});
}

Condition Gt(const Attribute &attr, Value value)
{
    return Condition::Leaf(ConditionOp::GreaterThan, attr, {std::move(value)});
}

Condition Ge(const Attribute &attr, Value value)
{
    return Condition::Leaf(
        ConditionOp::GreaterOrEqual, attr, {std::move(value)});
}

Condition Between(const Attribute &attr, Value lower, Value upper)
{
    return Condition::Leaf(
        ConditionOp::Between, attr, {std::move(lower), std::move(upper)});
}

Condition In(const Attribute &attr, std::vector<Value> candidates)
{
    if (candidates.empty())
    {
        throw BuildError("IN on attribute '" + attr.Name() +
                         "' needs at least one candidate");
    }
    return Condition::Leaf(ConditionOp::In, attr, std::move(candidates));
}

Condition Exists(const Attribute &attr)
{
    return Condition::Leaf(ConditionOp::Exists, attr, {});
}

Condition NotExists(const Attribute &attr)
{
    return Condition::Leaf(ConditionOp::NotExists, attr, {});
}

Condition BeginsWith(const Attribute &attr, Value prefix)
{
    if (!attr.SupportsContainment())
    {
        throw BuildError("begins_with is not supported on attribute '" +
                         attr.Name() + "' of type " +
                         WireTypeName(attr.GetWireType()));
    }
    return Condition::Leaf(ConditionOp::BeginsWith, attr, {std::move(prefix)});
}

Condition Contains(const Attribute &attr, Value element)
{
    if (!attr.SupportsContainment())
    {
        throw BuildError("contains is not supported on attribute '" +
                         attr.Name() + "' of type " +
                         WireTypeName(attr.GetWireType()));
    }
    return Condition::Leaf(ConditionOp::Contains, attr, {std::move(element)});
}

Condition And(Condition lhs, Condition rhs)
{
    return Condition::Logical(ConditionOp::And,
                              {std::move(lhs), std::move(rhs)});
}

Condition Or(Condition lhs, Condition rhs)
{
    return Condition::Logical(ConditionOp::Or, {std::move(lhs), std::move(rhs)});
}

Condition Not(Condition operand)
{
    return Condition::Logical(ConditionOp::Not, {std::move(operand)});
}

}  // namespace EloqDM
