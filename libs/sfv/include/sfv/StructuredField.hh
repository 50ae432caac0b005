// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef SFV_STRUCTURED_FIELD_HH
#define SFV_STRUCTURED_FIELD_HH

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gatekeeper::sfv
{
  struct Token
  {
    std::string value;

    bool operator==(const Token &) const = default;
  };

  struct ByteSequence
  {
    std::string bytes;

    bool operator==(const ByteSequence &) const = default;
  };

  struct Date
  {
    std::int64_t seconds{0};

    bool operator==(const Date &) const = default;
  };

  // UTF-8 text, transported as a percent-encoded display string.
  struct DisplayString
  {
    std::string value;

    bool operator==(const DisplayString &) const = default;
  };

  // Decimal with three fractional digits, stored as an exact number of thousandths.
  struct Decimal
  {
    static constexpr std::int64_t scale = 1000;

    std::int64_t thousandths{0};

    double to_double() const
    {
      return static_cast<double>(thousandths) / scale;
    }

    bool operator==(const Decimal &) const = default;
  };

  using BareItem = std::variant<bool, std::int64_t, Decimal, std::string, Token, ByteSequence, Date, DisplayString>;

  template<typename V>
  class OrderedMap
  {
  public:
    using value_type = std::pair<std::string, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    OrderedMap() = default;
    OrderedMap(std::initializer_list<value_type> init)
    {
      for (const auto &entry: init)
        {
          insert_or_assign(entry.first, entry.second);
        }
    }

    // A duplicate key keeps its original position and takes the new value.
    void insert_or_assign(std::string key, V value)
    {
      auto it = std::ranges::find_if(entries, [&key](const value_type &e) { return e.first == key; });
      if (it != entries.end())
        {
          it->second = std::move(value);
          return;
        }
      entries.emplace_back(std::move(key), std::move(value));
    }

    const V *find(std::string_view key) const
    {
      auto it = std::ranges::find_if(entries, [key](const value_type &e) { return e.first == key; });
      return it != entries.end() ? &it->second : nullptr;
    }

    bool contains(std::string_view key) const
    {
      return find(key) != nullptr;
    }

    const_iterator begin() const
    {
      return entries.begin();
    }

    const_iterator end() const
    {
      return entries.end();
    }

    std::size_t size() const
    {
      return entries.size();
    }

    bool empty() const
    {
      return entries.empty();
    }

    bool operator==(const OrderedMap &) const = default;

  private:
    std::vector<value_type> entries;
  };

  using Parameters = OrderedMap<BareItem>;

  struct Item;
  using InnerList = std::vector<Item>;

  // An item is either a bare value or an inner list. Parameters belong to the
  // value or, for an inner list, to the list as a whole.
  using Value = std::variant<bool, std::int64_t, Decimal, std::string, Token, ByteSequence, Date, DisplayString, InnerList>;

  struct Item
  {
    Value value;
    Parameters parameters;

    Item() = default;
    Item(Value value, Parameters parameters = {})
      : value(std::move(value))
      , parameters(std::move(parameters))
    {
    }

    bool is_inner_list() const
    {
      return std::holds_alternative<InnerList>(value);
    }

    template<typename T>
    const T *get_if() const
    {
      return std::get_if<T>(&value);
    }

    bool operator==(const Item &) const = default;
  };

  using List = std::vector<Item>;
  using Dictionary = OrderedMap<Item>;

  enum class FieldType
  {
    Item,
    List,
    Dictionary
  };

  inline Value to_value(const BareItem &bare)
  {
    return std::visit([](const auto &v) -> Value { return v; }, bare);
  }
} // namespace gatekeeper::sfv

#endif // SFV_STRUCTURED_FIELD_HH
