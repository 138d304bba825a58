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

#include <catch2/catch.hpp>

#include "test-types.hxx"

using namespace codecore_test;
using codecore::json::json_codec_core;

namespace codecore_test {
//! Field set which must be built by hand; nothing of it is reflected.
class profile
{
   public:
    std::optional<colour> favourite;
    std::optional<calendar_date> birthday;
    bool active = false;
    std::optional<std::string> nickname;
    double age = 0;

    bool operator==(profile const& o) const
    {
        return std::tie(favourite, birthday, active, nickname, age)
               == std::tie(o.favourite, o.birthday, o.active, o.nickname, o.age);
    }
};

struct wide {
    int a = 0, b = 0, c = 0, d = 0, e = 0, f = 0, g = 0;
    std::string h;
};

char const* colour_name(colour c)
{
    switch (c) {
        case colour::red: return "red";
        case colour::green: return "green";
        case colour::blue: return "blue";
    }

    return "";
}

colour colour_from_name(std::string const& str)
{
    for (auto c : {colour::red, colour::green, colour::blue})
        if (str == colour_name(c)) { return c; }

    throw codecore::error::structure_mismatch{"unknown colour '{}'", str};
}
}  // namespace codecore_test

TEST_CASE("hand built object codec", "[builder]")
{
    json_codec_core core;
    core.register_string_proxy_codec<colour>(&colour_name, &colour_from_name);
    core.register_string_proxy_codec<calendar_date>(
            [](calendar_date const& d) { return d.to_string(); },
            [](std::string const& s) { return calendar_date::parse(s); });

    core.register_codec<profile>()
            .null_field("favourite", &profile::favourite)
            .null_field("birthday", &profile::birthday)
            .field("active", &profile::active)
            .null_field("nickname", &profile::nickname)
            .field("age", &profile::age)
            .map([](std::optional<colour> favourite, std::optional<calendar_date> birthday, bool active,
                    std::optional<std::string> nickname, double age) {
                profile p;
                p.favourite = favourite;
                p.birthday  = birthday;
                p.active    = active;
                p.nickname  = std::move(nickname);
                p.age       = age;
                return p;
            });

    SECTION("absent values")
    {
        profile value;
        auto encoded = core.encode(value);

        REQUIRE(encoded.dump() == R"({"favourite":null,"birthday":null,"active":false,"nickname":null,"age":0.0})");
        REQUIRE(core.decode<profile>(encoded) == value);
    }

    SECTION("present values")
    {
        profile value;
        value.favourite = colour::green;
        value.birthday  = calendar_date{1999, 12, 31};
        value.active    = true;
        value.nickname  = "nick";
        value.age       = 24.5;

        auto encoded = core.encode(value);
        INFO(encoded.dump());

        REQUIRE(encoded.at("favourite") == json_t("green"));
        REQUIRE(encoded.at("birthday") == json_t("1999-12-31"));
        REQUIRE(core.decode<profile>(encoded) == value);
        REQUIRE(core.from_string<profile>(core.to_string(value, 2)) == value);
    }

    SECTION("within derived codecs")
    {
        std::map<std::string, profile> profiles{{"a", profile{}}};
        REQUIRE(core.decode<decltype(profiles)>(core.encode(profiles)) == profiles);
    }

    SECTION("bad field value")
    {
        auto encoded         = core.encode(profile{});
        encoded["favourite"] = "purple";

        REQUIRE_THROWS_AS(core.decode<profile>(encoded), codecore::error::structure_mismatch);
    }
}

TEST_CASE("explicit field codecs", "[builder]")
{
    json_codec_core core;

    auto upper = core.define_object<calendar_date>()
                         .field("y", &calendar_date::year)
                         .field("m", [](calendar_date const& d) { return d.month; })
                         .field("d", &calendar_date::day, core.get_codec<int>())
                         .map([](int y, int m, int d) { return calendar_date{y, m, d}; });

    json_t encoded;
    upper->encode(calendar_date{2000, 2, 29}, encoded);

    REQUIRE(encoded.dump() == R"({"y":2000,"m":2,"d":29})");
    REQUIRE(upper->decode(encoded) == calendar_date{2000, 2, 29});

    SECTION("nullable field with given codec")
    {
        auto codec = core.define_object<record>()
                             .field("id", &record::id)
                             .null_field("note", &record::note, core.get_codec<std::optional<std::string>>())
                             .map([](int id, std::optional<std::string> note) {
                                 return record{id, {}, {}, std::move(note)};
                             });

        json_t node;
        codec->encode(record{1}, node);
        REQUIRE(node.dump() == R"({"id":1,"note":null})");
        REQUIRE(codec->decode(node).note == std::nullopt);
    }
}

TEST_CASE("builder beyond typed arity", "[builder]")
{
    json_codec_core core;

    auto codec = core.define_object<wide>()
                         .field("a", &wide::a)
                         .field("b", &wide::b)
                         .field("c", &wide::c)
                         .field("d", &wide::d)
                         .field("e", &wide::e)
                         .field("f", &wide::f)
                         .field("g", &wide::g)
                         .field("h", &wide::h)
                         .map([](codecore::argument_list& args) {
                             REQUIRE(args.size() == 8);

                             wide w;
                             w.a = args.take<int>(0);
                             w.b = args.take<int>(1);
                             w.c = args.take<int>(2);
                             w.d = args.take<int>(3);
                             w.e = args.take<int>(4);
                             w.f = args.take<int>(5);
                             w.g = args.take<int>(6);
                             w.h = args.take<std::string>(7);
                             return w;
                         });

    wide value;
    value.a = 1;
    value.d = 4;
    value.g = 7;
    value.h = "eight";

    json_t encoded;
    codec->encode(value, encoded);
    REQUIRE(encoded.dump() == R"({"a":1,"b":0,"c":0,"d":4,"e":0,"f":0,"g":7,"h":"eight"})");

    auto decoded = codec->decode(encoded);
    REQUIRE(decoded.a == 1);
    REQUIRE(decoded.g == 7);
    REQUIRE(decoded.h == "eight");

    SECTION("argument type mismatch")
    {
        codecore::argument_list args{1};
        args[0] = std::string{"text"};

        REQUIRE_THROWS_AS(args.take<int>(0), codecore::error::codec_exception);
        REQUIRE(args.take<std::string>(0) == "text");
    }
}
