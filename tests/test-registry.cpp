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

#include <atomic>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "test-types.hxx"

using namespace codecore_test;
using codecore::json::json_codec_core;

namespace codecore_test {
struct opaque {
    int x = 0;
};

struct holder {
    std::string title;
    opaque content;
};

CODECORE_DEFINE_OBJECT(holder, (), (title), (content));

struct no_default {
    explicit no_default(int seed) : seed(seed) {}
    int seed;
};

CODECORE_DEFINE_OBJECT(no_default, (), (seed));

struct loop_inner;

struct loop_outer {
    std::shared_ptr<loop_inner> child;
    opaque part;
};

struct loop_inner {
    std::shared_ptr<loop_outer> back;
};

CODECORE_DEFINE_OBJECT(loop_outer, (), (child), (part));
CODECORE_DEFINE_OBJECT(loop_inner, (), (back));
}  // namespace codecore_test

TEST_CASE("recursive types", "[registry]")
{
    json_codec_core core;

    SECTION("self recursion")
    {
        for (int depth = 0; depth <= 3; ++depth) {
            auto head = node::chain(depth);
            auto encoded = core.encode(head);
            INFO(encoded.dump());

            auto decoded = core.decode<std::shared_ptr<node>>(encoded);
            if (depth == 0) {
                REQUIRE(encoded.is_null());
                REQUIRE(decoded == nullptr);
            } else {
                REQUIRE(decoded != nullptr);
                REQUIRE(*decoded == *head);
            }
        }
    }

    SECTION("mutual recursion")
    {
        team group;
        group.title = "core";
        group.members.push_back(person{"alice", nullptr});
        group.members.push_back(person{"bob", std::make_shared<team>(team{"nested", {person{"carol", nullptr}}})});

        auto encoded = core.encode(group);
        INFO(encoded.dump());

        REQUIRE(encoded.at("members")[1].at("group").at("members")[0].at("name") == json_t("carol"));

        auto decoded = core.decode<team>(encoded);
        REQUIRE(decoded.members.size() == 2);
        REQUIRE(decoded.members[0].group == nullptr);
        REQUIRE(decoded.members[1].group->title == "nested");
        REQUIRE(core.encode(decoded) == encoded);
    }
}

TEST_CASE("codec identity", "[registry]")
{
    json_codec_core core;

    SECTION("repeated lookup")
    {
        auto first = core.get_codec<record>();
        REQUIRE(core.get_codec<record>() == first);
        REQUIRE(core.get_codec<std::shared_ptr<node>>() == core.get_codec<std::shared_ptr<node>>());
    }

    SECTION("concurrent first lookup")
    {
        constexpr int num_threads = 8;

        std::atomic_int ready{0};
        std::vector<codecore::if_codec_base const*> resolved(num_threads);
        std::vector<std::thread> threads;

        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([&, i] {
                ++ready;
                while (ready.load() < num_threads) { std::this_thread::yield(); }

                auto codec  = core.get_codec<team>();
                resolved[i] = codec->resolved();

                json_t enc;
                codec->encode(team{"t", {person{"p", nullptr}}}, enc);
            });
        }

        for (auto& th : threads) { th.join(); }

        for (auto ptr : resolved) {
            REQUIRE(ptr != nullptr);
            REQUIRE(ptr == resolved.front());
        }

        REQUIRE(core.get_codec<team>()->resolved() == resolved.front());
    }

    SECTION("concurrent lookup of mutually recursive types")
    {
        for (int round = 0; round < 50; ++round) {
            json_codec_core fresh;
            std::atomic_int ready{0};
            codecore::if_codec_base const* team_codec   = nullptr;
            codecore::if_codec_base const* person_codec = nullptr;
            json_t team_node, person_node;

            auto wait_start = [&] {
                ++ready;
                while (ready.load() < 2) { std::this_thread::yield(); }
            };

            std::thread by_team{[&] {
                wait_start();
                auto codec = fresh.get_codec<team>();
                team_codec = codec->resolved();
                codec->encode(team{"t", {person{"p", std::make_shared<team>()}}}, team_node);
            }};

            std::thread by_person{[&] {
                wait_start();
                auto codec   = fresh.get_codec<person>();
                person_codec = codec->resolved();
                codec->encode(person{"q", std::make_shared<team>(team{"u", {person{}}})}, person_node);
            }};

            by_team.join();
            by_person.join();

            REQUIRE(team_codec != nullptr);
            REQUIRE(person_codec != nullptr);
            REQUIRE(fresh.get_codec<team>()->resolved() == team_codec);
            REQUIRE(fresh.get_codec<person>()->resolved() == person_codec);

            REQUIRE(team_node.at("members")[0].at("name") == json_t("p"));
            REQUIRE(person_node.at("group").at("title") == json_t("u"));
            REQUIRE(fresh.decode<person>(person_node).group->members.size() == 1);
        }
    }
}

TEST_CASE("failed construction", "[registry][error]")
{
    json_codec_core core;
    holder value{"box", opaque{3}};

    REQUIRE_THROWS_AS(core.get_codec<holder>(), codecore::error::construction_failure);

    // Nothing of the failed attempt remains cached; it fails the same way again.
    REQUIRE_THROWS_AS(core.encode(value), codecore::error::construction_failure);

    core.register_codec<opaque>()
            .field("x", &opaque::x)
            .map([](int x) { return opaque{x}; });

    auto encoded = core.encode(value);
    REQUIRE(encoded == json_t::parse(R"({"title":"box","content":{"x":3}})"));
    REQUIRE(core.decode<holder>(encoded).content.x == 3);
}

TEST_CASE("failed construction of recursive types", "[registry][error]")
{
    json_codec_core core;

    // child resolves loop_inner and a pointer back to loop_outer before part fails.
    REQUIRE_THROWS_AS(core.get_codec<loop_outer>(), codecore::error::construction_failure);
    REQUIRE_THROWS_AS(core.get_codec<loop_inner>(), codecore::error::construction_failure);

    core.register_codec<opaque>()
            .field("x", &opaque::x)
            .map([](int x) { return opaque{x}; });

    loop_outer value;
    value.part.x            = 1;
    value.child             = std::make_shared<loop_inner>();
    value.child->back       = std::make_shared<loop_outer>();
    value.child->back->part = opaque{2};

    auto encoded = core.encode(value);
    INFO(encoded.dump());

    REQUIRE(encoded.at("child").at("back").at("part").at("x") == json_t(2));
    REQUIRE(encoded.at("child").at("back").at("child").is_null());

    auto decoded = core.decode<loop_outer>(encoded);
    REQUIRE(decoded.part.x == 1);
    REQUIRE(decoded.child->back->part.x == 2);
    REQUIRE(decoded.child->back->child == nullptr);

    loop_inner alone;
    alone.back = std::make_shared<loop_outer>();
    REQUIRE(core.encode(alone).at("back").at("part").at("x") == json_t(0));
}

TEST_CASE("registration", "[registry]")
{
    json_codec_core core;

    SECTION("last write wins")
    {
        core.register_string_proxy_codec<calendar_date>(
                [](calendar_date const&) { return std::string{"first"}; },
                [](std::string const&) { return calendar_date{}; });
        core.register_string_proxy_codec<calendar_date>(
                [](calendar_date const& d) { return d.to_string(); },
                [](std::string const& s) { return calendar_date::parse(s); });

        REQUIRE(core.encode(calendar_date{}) == json_t("1970-01-01"));
    }

    SECTION("registered codec overrides derivation")
    {
        core.register_codec<record>()
                .field("key", &record::id)
                .map([](int id) { return record{id}; });

        auto encoded = core.encode(record{7, "ignored"});
        REQUIRE(encoded == json_t::parse(R"({"key":7})"));
        REQUIRE(core.decode<record>(encoded).id == 7);

        // Containers derived afterwards pick the registered codec up.
        REQUIRE(core.encode(std::vector<record>{record{1}})[0] == json_t::parse(R"({"key":1})"));
    }

    SECTION("type constructor")
    {
        auto encoded = json_t::parse(R"({"seed":5})");
        REQUIRE(core.encode(no_default{2}) == json_t::parse(R"({"seed":2})"));
        REQUIRE_THROWS_AS(core.decode<no_default>(encoded), codecore::error::instantiation_failure);

        core.register_type_constructor<no_default>([] { return no_default{-1}; });
        REQUIRE(core.decode<no_default>(encoded).seed == 5);
    }
}

TEST_CASE("lazy registry", "[registry]")
{
    using record_codec_ref = codecore::codec_ref<record, json_t>;
    using record_codec_ptr = codecore::codec_ptr<record, json_t>;

    json_codec_core core;
    codecore::lazy_registry<codecore::if_codec_base> registry;

    auto record_codec = core.get_codec<record>();

    REQUIRE(registry.find("x") == nullptr);
    REQUIRE_FALSE(registry.assign("x", record_codec));
    REQUIRE(registry.find("x") == record_codec);

    SECTION("existing entries are not rebuilt")
    {
        auto found = registry.resolve<record_codec_ref>("x", []() -> record_codec_ptr {
            FAIL("entry built twice");
            return nullptr;
        });

        REQUIRE(found == record_codec);
    }

    SECTION("failed build leaves no entry")
    {
        REQUIRE_THROWS_AS(
                registry.resolve<record_codec_ref>("y", []() -> record_codec_ptr {
                    throw codecore::error::construction_failure{"cannot build"};
                }),
                codecore::error::construction_failure);

        REQUIRE(registry.find("y") == nullptr);

        auto found = registry.resolve<record_codec_ref>("y", [&] { return record_codec; });
        REQUIRE(found == record_codec);
    }

    SECTION("assignment replaces")
    {
        auto other = core.define_object<record>()
                             .field("id", &record::id)
                             .map([](int id) { return record{id}; });

        REQUIRE(registry.assign("x", other));
        REQUIRE(registry.find("x") == other);
    }
}
