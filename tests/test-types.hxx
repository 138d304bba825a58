// MIT License
//
// Copyright (c) 2021-2022. Seungwoo Kang
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
// project home: https://github.com/perfkitpp

#pragma once
#include <cstdio>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "codecore/codecore.hxx"
#include "codecore/json/json_codec_core.hxx"

namespace codecore_test {
using codecore::json::json_t;

enum class colour {
    red,
    green,
    blue,
};

struct calendar_date {
    int year  = 1970;
    int month = 1;
    int day   = 1;

    bool operator==(calendar_date const& o) const
    {
        return std::tie(year, month, day) == std::tie(o.year, o.month, o.day);
    }

    std::string to_string() const
    {
        char buf[16];
        std::snprintf(buf, sizeof buf, "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    static calendar_date parse(std::string const& str)
    {
        calendar_date date;
        if (std::sscanf(str.c_str(), "%d-%d-%d", &date.year, &date.month, &date.day) != 3)
            throw codecore::error::structure_mismatch{"not a date: '{}'", str};

        return date;
    }
};

struct common_data {
    bool flag         = false;
    int8_t byte       = 0;
    char letter       = 'a';
    int16_t small     = 0;
    int32_t number    = 0;
    int64_t big       = 0;
    float ratio       = 0;
    double precise    = 0;
    uint32_t unsigned_number = 0;
    uint64_t huge     = 0;
    colour tint       = colour::red;

    std::string text;
    std::vector<int> numbers;
    std::vector<bool> switches;
    std::vector<std::string> words;
    std::set<int> unique_numbers;
    std::map<std::string, double> scores;
    std::map<int, std::string> names;
    std::optional<int> maybe;
    std::optional<std::string> maybe_text;

    auto tie() const
    {
        return std::tie(flag, byte, letter, small, number, big, ratio, precise, unsigned_number, huge, tint,
                        text, numbers, switches, words, unique_numbers, scores, names, maybe, maybe_text);
    }

    bool operator==(common_data const& o) const { return tie() == o.tie(); }

    common_data& fill()
    {
        flag            = true;
        byte            = -12;
        letter          = 'z';
        small           = 31000;
        number          = -2000000000;
        big             = 9000000000000LL;
        ratio           = 0.5f;
        precise         = 3.25;
        unsigned_number = 4000000000u;
        huge            = ~uint64_t{};
        tint            = colour::blue;
        text            = "hello, world";
        numbers         = {1, 2, 3};
        switches        = {true, false, true};
        words           = {"a", "", "c"};
        unique_numbers  = {5, 3, 1};
        scores          = {{"alice", 1.5}, {"bob", -2.}};
        names           = {{1, "one"}, {2, "two"}};
        maybe           = 42;
        maybe_text      = "present";
        return *this;
    }
};

CODECORE_DEFINE_OBJECT(
        common_data, (),
        (flag), (byte), (letter), (small), (number), (big), (ratio), (precise),
        (unsigned_number), (huge), (tint), (text), (numbers), (switches), (words),
        (unique_numbers), (scores), (names), (maybe), (maybe_text));

//! Singly linked chain
struct node {
    int value = 0;
    std::shared_ptr<node> next;

    static std::shared_ptr<node> chain(int depth)
    {
        std::shared_ptr<node> head;
        for (int i = depth; i > 0; --i) {
            auto n   = std::make_shared<node>();
            n->value = i;
            n->next  = std::move(head);
            head     = std::move(n);
        }

        return head;
    }

    bool operator==(node const& o) const
    {
        if (value != o.value) return false;
        if ((next == nullptr) != (o.next == nullptr)) return false;
        return next == nullptr || *next == *o.next;
    }
};

CODECORE_DEFINE_OBJECT(node, (), (value), (next));

struct team;

struct person {
    std::string name;
    std::shared_ptr<team> group;
};

struct team {
    std::string title;
    std::vector<person> members;
};

CODECORE_DEFINE_OBJECT(person, (), (name), (group));
CODECORE_DEFINE_OBJECT(team, (), (title), (members));

struct shape {
    virtual ~shape() = default;
    std::string label;
};

struct circle : shape {
    double radius = 0;
};

struct rectangle : shape {
    double width  = 0;
    double height = 0;
};

CODECORE_DEFINE_OBJECT(shape, (), (label));
CODECORE_DEFINE_OBJECT(circle, (.extend(codecore::type_tag_v<shape>)), (radius));
CODECORE_DEFINE_OBJECT(rectangle, (.extend(codecore::type_tag_v<shape>)), (width), (height));

struct animal {
    virtual ~animal() = default;
    virtual std::string sound() const = 0;

    std::string name;
};

struct dog : animal {
    std::string sound() const override { return "woof"; }
    int tricks = 0;
};

CODECORE_DEFINE_OBJECT(animal, (), (name));
CODECORE_DEFINE_OBJECT(dog, (.extend(codecore::type_tag_v<animal>)), (tricks));

struct badge final {
    virtual ~badge() = default;
    int level = 0;
};

CODECORE_DEFINE_OBJECT(badge, (), (level));

struct record {
    int id = 0;
    std::string name;
    std::vector<double> values;
    std::optional<std::string> note;

    bool operator==(record const& o) const
    {
        return std::tie(id, name, values, note) == std::tie(o.id, o.name, o.values, o.note);
    }
};

CODECORE_DEFINE_OBJECT(record, (), (id), (name), (values), (note));
}  // namespace codecore_test
