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
#include "attribute_value.h"

#include <sstream>

namespace EloqDM
{
size_t Value::Size() const
{
    switch (GetType())
    {
    case Type::StringSet:
        return Get<StringSet>().size();
    case Type::NumberSet:
        return Get<NumberSet>().size();
    case Type::BinarySet:
        return Get<BinarySet>().size();
    case Type::List:
        return Get<ValueList>().size();
    case Type::Map:
        return Get<ValueMap>().size();
    default:
        return 0;
    }
}

const char *Value::TypeName(Type type)
{
    switch (type)
    {
    case Type::Null:
        return "null";
    case Type::String:
        return "string";
    case Type::Number:
        return "number";
    case Type::Binary:
        return "binary";
    case Type::Bool:
        return "bool";
    case Type::StringSet:
        return "string set";
    case Type::NumberSet:
        return "number set";
    case Type::BinarySet:
        return "binary set";
    case Type::List:
        return "list";
    case Type::Map:
        return "map";
    case Type::Timestamp:
        return "timestamp";
    }
    return "unknown";
}

std::string Value::DebugString() const
{
    std::ostringstream os;
    switch (GetType())
    {
    case Type::Null:
        os << "null";
        break;
    case Type::String:
        os << '"' << Get<std::string>() << '"';
        break;
    case Type::Number:
        os << Get<Number>().ToString();
        break;
    case Type::Binary:
        os << "<" << Get<Binary>().bytes_.size() << " bytes>";
        break;
    case Type::Bool:
        os << (Get<bool>() ? "true" : "false");
        break;
    case Type::StringSet:
    {
        os << '{';
        const char *sep = "";
        for (const std::string &s : Get<StringSet>())
        {
            os << sep << '"' << s << '"';
            sep = ", ";
        }
        os << '}';
        break;
    }
    case Type::NumberSet:
    {
        os << '{';
        const char *sep = "";
        for (const Number &n : Get<NumberSet>())
        {
            os << sep << n.ToString();
            sep = ", ";
        }
        os << '}';
        break;
    }
    case Type::BinarySet:
        os << "{<" << Get<BinarySet>().size() << " binaries>}";
        break;
    case Type::List:
    {
        os << '[';
        const char *sep = "";
        for (const Value &v : Get<ValueList>())
        {
            os << sep << v.DebugString();
            sep = ", ";
        }
        os << ']';
        break;
    }
    case Type::Map:
    {
        os << '{';
        const char *sep = "";
        for (const auto &[k, v] : Get<ValueMap>())
        {
            os << sep << k << ": " << v.DebugString();
            sep = ", ";
        }
        os << '}';
        break;
    }
    case Type::Timestamp:
        os << Get<Timestamp>().time_since_epoch().count() << "us";
        break;
    }
    return os.str();
}

}  // namespace EloqDM
