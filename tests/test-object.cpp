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
struct tagged_base {
    std::string tag;
    int weight = 0;
};

struct tagged : tagged_base {
    std::string tag;
};

CODECORE_DEFINE_OBJECT(tagged_base, (), (tag), (weight));
CODECORE_DEFINE_OBJECT(tagged, (.extend(codecore::type_tag_v<tagged_base>)), (tag));

struct aliased {
    int first  = 0;
    int second = 0;
};

CODECORE_DEFINE_OBJECT(aliased, (), (first, "1st"), (second));

class sealed
{
   public:
    sealed() = default;
    explicit sealed(int secret) : _secret(secret) {}

    int secret() const { return _secret; }

   private:
    int _secret = 0;
    std::string _label = "sealed";

   public:
    CODECORE_DEFINE_OBJECT_inline(sealed, (), (_secret), (_label));
};
}  // namespace codecore_test

TEST_CASE("reflective object layout", "[object]")
{
    json_codec_core core;

    SECTION("fields in declaration order")
    {
        record value{1, "one", {1.5, 2.5}, std::nullopt};
        auto encoded = core.encode(value);

        REQUIRE(encoded.dump() == R"({"id":1,"name":"one","values":[1.5,2.5],"note":null})");
        REQUIRE(core.decode<record>(encoded) == value);
        REQUIRE(core.decode<record>(codecore::type_id::of<record>(), encoded) == value);
    }

    SECTION("alias")
    {
        auto encoded = core.encode(aliased{1, 2});
        REQUIRE(encoded.dump() == R"({"1st":1,"second":2})");
        REQUIRE(core.decode<aliased>(encoded).first == 1);
    }

    SECTION("private members")
    {
        auto encoded = core.encode(sealed{42});
        REQUIRE(encoded.dump() == R"({"_secret":42,"_label":"sealed"})");
        REQUIRE(core.decode<sealed>(encoded).secret() == 42);
    }
}

TEST_CASE("inherited field names", "[object]")
{
    tagged value;
    value.tag              = "derived";
    value.tagged_base::tag = "base";
    value.weight           = 10;

    SECTION("default marker")
    {
        json_codec_core core;
        auto encoded = core.encode(value);

        REQUIRE(encoded.dump() == R"({"tag":"derived","*tag":"base","weight":10})");

        auto decoded = core.decode<tagged>(encoded);
        REQUIRE(decoded.tag == "derived");
        REQUIRE(decoded.tagged_base::tag == "base");
        REQUIRE(decoded.weight == 10);
    }

    SECTION("configured marker")
    {
        json_codec_core core;
        core.config.field_name_marker = '_';

        auto encoded = core.encode(value);
        REQUIRE(encoded.contains("_tag"));
        REQUIRE(not encoded.contains("*tag"));
    }

    SECTION("base alone")
    {
        json_codec_core core;
        auto encoded = core.encode(static_cast<tagged_base const&>(value));
        REQUIRE(encoded.dump() == R"({"tag":"base","weight":10})");
    }
}

TEST_CASE("reflective and builder codecs agree", "[object]")
{
    json_codec_core reflective;
    json_codec_core built;

    auto codec = built.define_object<record>()
                         .field("id", &record::id)
                         .field("name", &record::name)
                         .field("values", &record::values)
                         .null_field("note", &record::note)
                         .map([](int id, std::string name, std::vector<double> values, std::optional<std::string> note) {
                             return record{id, std::move(name), std::move(values), std::move(note)};
                         });

    for (auto& value : {record{}, record{3, "three", {3.}, std::string{"odd"}}}) {
        json_t by_builder;
        codec->encode(value, by_builder);

        REQUIRE(reflective.encode(value).dump() == by_builder.dump());
        REQUIRE(codec->decode(by_builder) == value);
        REQUIRE(reflective.decode<record>(by_builder) == value);
    }

    // define_object() does not register its result.
    REQUIRE(built.encode(record{}).dump() == reflective.encode(record{}).dump());
}

TEST_CASE("field tolerance", "[object][config]")
{
    json_codec_core core;

    auto full = json_t::parse(R"({"id":1,"name":"n","values":[],"note":"x"})");

    SECTION("unknown fields")
    {
        auto extended = full;
        extended["extra"] = true;

        REQUIRE(core.decode<record>(extended).note == "x");

        core.config.allow_unknown_field = false;
        REQUIRE_THROWS_AS(core.decode<record>(extended), codecore::error::structure_mismatch);
        REQUIRE_NOTHROW(core.decode<record>(full));
    }

    SECTION("missing fields")
    {
        auto partial = full;
        partial.erase("note");

        REQUIRE_THROWS_AS(core.decode<record>(partial), codecore::error::structure_mismatch);

        core.config.allow_missing_field = true;
        REQUIRE(core.decode<record>(partial).note == std::nullopt);

        // A missing value which cannot be absent is still an error.
        partial.erase("id");
        REQUIRE_THROWS_AS(core.decode<record>(partial), codecore::error::structure_mismatch);
    }

    SECTION("map entry field names")
    {
        core.config.map_key_field   = "k";
        core.config.map_value_field = "v";

        std::map<int, std::string> value{{1, "one"}};
        auto encoded = core.encode(value);

        REQUIRE(encoded.dump() == R"([{"k":1,"v":"one"}])");
        REQUIRE(core.decode<decltype(value)>(encoded) == value);
        REQUIRE_THROWS_AS(core.decode<decltype(value)>(json_t::parse(R"([{"k":1}])")),
                          codecore::error::structure_mismatch);
    }
}
