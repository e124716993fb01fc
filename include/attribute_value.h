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
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "number.h"

namespace EloqDM
{
/**
 * @brief Raw bytes. Kept apart from std::string so that a String and a Binary
 * value never get mixed up.
 */
struct Binary
{
    Binary() = default;
    explicit Binary(std::string bytes) : bytes_(std::move(bytes))
    {
    }
    Binary(const unsigned char *data, size_t len)
        : bytes_(reinterpret_cast<const char *>(data), len)
    {
    }

    bool operator==(const Binary &rhs) const
    {
        return bytes_ == rhs.bytes_;
    }
    bool operator!=(const Binary &rhs) const
    {
        return bytes_ != rhs.bytes_;
    }
    bool operator<(const Binary &rhs) const
    {
        return bytes_ < rhs.bytes_;
    }

    std::string bytes_;
};

using Timestamp =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

inline Timestamp NowTimestamp()
{
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

class Value;
using StringSet = std::set<std::string>;
using NumberSet = std::set<Number>;
using BinarySet = std::set<Binary>;
using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

/**
 * @brief Native value of one attribute of an item.
 */
class Value
{
public:
    enum class Type : uint8_t
    {
        Null = 0,
        String,
        Number,
        Binary,
        Bool,
        StringSet,
        NumberSet,
        BinarySet,
        List,
        Map,
        Timestamp
    };

    Value() = default;
    Value(std::nullptr_t)
    {
    }
    Value(std::string s) : val_(std::move(s))
    {
    }
    Value(const char *s) : val_(std::string(s))
    {
    }
    Value(Number n) : val_(n)
    {
    }
    Value(int n) : val_(Number(n))
    {
    }
    Value(int64_t n) : val_(Number(n))
    {
    }
    Value(double n) : val_(Number(n))
    {
    }
    Value(Binary b) : val_(std::move(b))
    {
    }
    Value(bool b) : val_(b)
    {
    }
    Value(StringSet ss) : val_(std::move(ss))
    {
    }
    Value(NumberSet ns) : val_(std::move(ns))
    {
    }
    Value(BinarySet bs) : val_(std::move(bs))
    {
    }
    Value(ValueList l) : val_(std::move(l))
    {
    }
    Value(ValueMap m) : val_(std::move(m))
    {
    }
    Value(Timestamp ts) : val_(ts)
    {
    }

    Type GetType() const
    {
        return static_cast<Type>(val_.index());
    }

    bool IsNull() const
    {
        return GetType() == Type::Null;
    }

    bool IsSet() const
    {
        Type t = GetType();
        return t == Type::StringSet || t == Type::NumberSet ||
               t == Type::BinarySet;
    }

    // Number of elements of a set, list or map, 0 for anything else.
    size_t Size() const;

    template <typename T>
    bool Is() const
    {
        return std::holds_alternative<T>(val_);
    }

    template <typename T>
    const T &Get() const
    {
        return std::get<T>(val_);
    }

    template <typename T>
    T &Get()
    {
        return std::get<T>(val_);
    }

    template <typename T>
    const T *GetIf() const
    {
        return std::get_if<T>(&val_);
    }

    const char *TypeName() const
    {
        return TypeName(GetType());
    }

    static const char *TypeName(Type type);

    bool operator==(const Value &rhs) const
    {
        return val_ == rhs.val_;
    }
    bool operator!=(const Value &rhs) const
    {
        return !(val_ == rhs.val_);
    }

    // Human readable rendering used in logs and error messages.
    std::string DebugString() const;

private:
    std::variant<std::monostate,
                 std::string,
                 Number,
                 Binary,
                 bool,
                 StringSet,
                 NumberSet,
                 BinarySet,
                 ValueList,
                 ValueMap,
                 Timestamp>
        val_;
};

}  // namespace EloqDM
