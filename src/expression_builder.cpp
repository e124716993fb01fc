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
#include "expression_builder.h"

#include <aws/core/utils/json/JsonSerializer.h>
#include <glog/logging.h>

#include <unordered_set>

namespace EloqDM
{
using Aws::DynamoDB::Model::AttributeValue;

std::string ExpressionBuilder::NameToken(const std::string &name)
{
    auto it = name_tokens_.find(name);
    if (it != name_tokens_.end())
    {
        return it->second;
    }
    std::string token = "#a" + std::to_string(name_tokens_.size());
    name_tokens_.emplace(name, token);
    names_[token] = name;
    return token;
}

std::string ExpressionBuilder::ValueToken(const AttributeValue &value)
{
    std::string key(value.Jsonize().View().WriteCompact());
    auto it = value_tokens_.find(key);
    if (it != value_tokens_.end())
    {
        return it->second;
    }
    std::string token = ":v" + std::to_string(value_tokens_.size());
    value_tokens_.emplace(std::move(key), token);
    values_[token] = value;
    return token;
}

std::string ExpressionBuilder::OperandToken(const Attribute &attr,
                                            const Value &value)
{
    std::optional<AttributeValue> av = attr.Serialize(value);
    if (!av.has_value())
    {
        throw BuildError("attribute '" + attr.Name() +
                         "' cannot be compared with an empty value");
    }
    return ValueToken(*av);
}

std::string ExpressionBuilder::CompileCondition(const Condition &condition)
{
    std::string out;
    CompileInto(condition, out);
    return out;
}

void ExpressionBuilder::CompileInto(const Condition &condition,
                                    std::string &out)
{
    ConditionOp op = condition.Op();
    if (condition.IsLogical())
    {
        const std::vector<Condition> &children = condition.Children();
        out.push_back('(');
        if (op == ConditionOp::Not)
        {
            out.append("NOT ");
            CompileInto(children.at(0), out);
        }
        else
        {
            for (size_t i = 0; i < children.size(); ++i)
            {
                if (i > 0)
                {
                    out.push_back(' ');
                    out.append(ConditionOpName(op));
                    out.push_back(' ');
                }
                CompileInto(children[i], out);
            }
        }
        out.push_back(')');
        return;
    }

    const Attribute &attr = *condition.GetAttribute();
    const std::vector<Value> &operands = condition.Operands();
    std::string path = NameToken(attr.Name());
    switch (op)
    {
    case ConditionOp::Equals:
    case ConditionOp::NotEquals:
    case ConditionOp::LessThan:
    case ConditionOp::LessOrEqual:
    case ConditionOp::GreaterThan:
    case ConditionOp::GreaterOrEqual:
        out.append(path)
            .append(" ")
            .append(ConditionOpName(op))
            .append(" ")
            .append(OperandToken(attr, operands.at(0)));
        break;
    case ConditionOp::Between:
        out.append(path)
            .append(" BETWEEN ")
            .append(OperandToken(attr, operands.at(0)))
            .append(" AND ")
            .append(OperandToken(attr, operands.at(1)));
        break;
    case ConditionOp::In:
    {
        out.append(path).append(" IN (");
        for (size_t i = 0; i < operands.size(); ++i)
        {
            if (i > 0)
            {
                out.append(", ");
            }
            out.append(OperandToken(attr, operands[i]));
        }
        out.push_back(')');
        break;
    }
    case ConditionOp::Exists:
    case ConditionOp::NotExists:
        out.append(ConditionOpName(op)).append(" (").append(path).append(")");
        break;
    case ConditionOp::BeginsWith:
    case ConditionOp::Contains:
        out.append(ConditionOpName(op))
            .append(" (")
            .append(path)
            .append(", ")
            .append(ValueToken(attr.SerializeElement(operands.at(0))))
            .append(")");
        break;
    default:
        throw BuildError(std::string("unexpected condition operator ") +
                         ConditionOpName(op));
    }
}

std::string ExpressionBuilder::CompileUpdate(const UpdateActions &actions)
{
    if (actions.empty())
    {
        throw BuildError("update needs at least one action");
    }

    std::unordered_set<std::string> seen;
    for (const UpdateAction &action : actions)
    {
        if (!seen.insert(action.attr_->Name()).second)
        {
            throw BuildError("attribute '" + action.attr_->Name() +
                             "' appears more than once in the update");
        }
    }

    static const std::pair<UpdateOp, const char *> clauses[] = {
        {UpdateOp::Set, "SET"},
        {UpdateOp::Remove, "REMOVE"},
        {UpdateOp::Add, "ADD"},
        {UpdateOp::Delete, "DELETE"}};

    std::string out;
    for (const auto &[clause_op, keyword] : clauses)
    {
        bool first = true;
        for (const UpdateAction &action : actions)
        {
            if (action.op_ != clause_op)
            {
                continue;
            }
            if (first)
            {
                if (!out.empty())
                {
                    out.push_back(' ');
                }
                out.append(keyword).push_back(' ');
                first = false;
            }
            else
            {
                out.append(", ");
            }

            const Attribute &attr = *action.attr_;
            out.append(NameToken(attr.Name()));
            switch (clause_op)
            {
            case UpdateOp::Set:
                out.append(" = ").append(OperandToken(attr, action.value_));
                break;
            case UpdateOp::Remove:
                break;
            case UpdateOp::Add:
            case UpdateOp::Delete:
                out.append(" ").append(OperandToken(attr, action.value_));
                break;
            }
        }
    }
    DLOG(INFO) << "update expression: " << out;
    return out;
}

std::string ExpressionBuilder::CompileProjection(
    const std::vector<std::string> &names)
{
    if (names.empty())
    {
        throw BuildError("projection needs at least one attribute");
    }
    std::string out;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
        {
            out.append(", ");
        }
        out.append(NameToken(names[i]));
    }
    return out;
}

}  // namespace EloqDM
