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

#include "codecore/json/json_codec_core.hxx"

#include <limits>

namespace codecore::json {
namespace {
using error::structure_mismatch;

void verify(bool condition, char const* expected, json_t const& enc)
{
    if (not condition)
        throw structure_mismatch{"expected {}, but node is {}", expected, enc.type_name()};
}

template <typename Fn_>
decltype(auto) guarded(Fn_&& fn)
{
    try {
        return fn();
    } catch (nlohmann::json::exception const& e) {
        std::throw_with_nested(error::codec_exception{"json: {}", e.what()});
    }
}

class json_null_codec : public null_codec<json_t>
{
   public:
    bool is_null(json_t const& enc) const override { return enc.is_null(); }
    json_t& encode_null(json_t& enc) const override { return enc = nullptr; }

    json_t const& null_node() const override
    {
        static json_t const node{};
        return node;
    }
};

class json_bool_codec : public primitive_codec<bool, json_t>
{
   public:
    using primitive_codec::encode_prim;

    json_t& encode_prim(bool val, json_t& enc) const override { return enc = val; }

    bool decode_prim(json_t const& enc) const override
    {
        verify(enc.is_boolean(), "boolean", enc);
        return enc.get<bool>();
    }
};

class json_char_codec : public primitive_codec<char, json_t>
{
   public:
    using primitive_codec::encode_prim;

    json_t encode_prim(char val) const override { return std::string(1, val); }

    char decode_prim(json_t const& enc) const override
    {
        verify(enc.is_string(), "single character string", enc);

        auto& str = enc.get_ref<std::string const&>();
        if (str.size() != 1)
            throw structure_mismatch{"expected single character, got '{}'", str};

        return str[0];
    }
};

template <typename Int_>
class json_integer_codec : public primitive_codec<Int_, json_t>
{
    using limits = std::numeric_limits<Int_>;

   public:
    using primitive_codec<Int_, json_t>::encode_prim;

    json_t encode_prim(Int_ val) const override { return val; }

    Int_ decode_prim(json_t const& enc) const override
    {
        verify(enc.is_number_integer(), "integer", enc);

        if (enc.is_number_unsigned()) {
            auto value = enc.get<uint64_t>();
            if (value > static_cast<uint64_t>(limits::max()))
                throw structure_mismatch{"{} exceeds range of '{}'", value, type_name<Int_>()};

            return static_cast<Int_>(value);
        }

        auto value = enc.get<int64_t>();
        if (value < limits::min() || value > limits::max())
            throw structure_mismatch{"{} exceeds range of '{}'", value, type_name<Int_>()};

        return static_cast<Int_>(value);
    }
};

template <typename Float_>
class json_float_codec : public primitive_codec<Float_, json_t>
{
   public:
    using primitive_codec<Float_, json_t>::encode_prim;

    json_t encode_prim(Float_ val) const override { return val; }

    Float_ decode_prim(json_t const& enc) const override
    {
        verify(enc.is_number(), "number", enc);
        return static_cast<Float_>(enc.get<double>());
    }
};

class json_string_codec : public codec<std::string, json_t>
{
   public:
    json_t& encode(std::string const& val, json_t& enc) const override
    {
        return enc = val;
    }

    std::string decode(json_t const& enc) const override
    {
        verify(enc.is_string(), "string", enc);
        return enc.get_ref<std::string const&>();
    }
};
}  // namespace

json_codec_core::json_codec_core(json_config settings)
        : _json_config(std::move(settings))
{
}

null_codec<json_t> const& json_codec_core::null_marker() const
{
    static json_null_codec const instance;
    return instance;
}

primitive_codec<bool, json_t> const& json_codec_core::bool_codec() const
{
    static json_bool_codec const instance;
    return instance;
}

primitive_codec<int8_t, json_t> const& json_codec_core::byte_codec() const
{
    static json_integer_codec<int8_t> const instance;
    return instance;
}

primitive_codec<char, json_t> const& json_codec_core::char_codec() const
{
    static json_char_codec const instance;
    return instance;
}

primitive_codec<int16_t, json_t> const& json_codec_core::short_codec() const
{
    static json_integer_codec<int16_t> const instance;
    return instance;
}

primitive_codec<int32_t, json_t> const& json_codec_core::int_codec() const
{
    static json_integer_codec<int32_t> const instance;
    return instance;
}

primitive_codec<int64_t, json_t> const& json_codec_core::long_codec() const
{
    static json_integer_codec<int64_t> const instance;
    return instance;
}

primitive_codec<float, json_t> const& json_codec_core::float_codec() const
{
    static json_float_codec<float> const instance;
    return instance;
}

primitive_codec<double, json_t> const& json_codec_core::double_codec() const
{
    static json_float_codec<double> const instance;
    return instance;
}

codec<std::string, json_t> const& json_codec_core::string_codec() const
{
    static json_string_codec const instance;
    return instance;
}

json_t& json_codec_core::make_sequence(json_t& enc) const
{
    return enc = json_t::array();
}

json_t& json_codec_core::add_entry(json_t& seq) const
{
    if (not seq.is_array())
        seq = json_t::array();

    return guarded([&]() -> json_t& {
        seq.push_back(nullptr);
        return seq.back();
    });
}

void json_codec_core::for_each_entry(json_t const& seq, entry_visitor const& visit) const
{
    verify(seq.is_array(), "array", seq);

    for (auto& entry : seq)
        visit(entry);
}

size_t json_codec_core::entry_count(json_t const& seq) const
{
    return seq.is_array() ? seq.size() : ~size_t{};
}

json_t& json_codec_core::make_object(json_t& enc) const
{
    if (not enc.is_object())
        enc = json_t::object();

    return enc;
}

json_t& json_codec_core::add_field(json_t& obj, std::string_view name) const
{
    make_object(obj);
    return guarded([&]() -> json_t& { return obj[std::string{name}]; });
}

json_t const* json_codec_core::find_field(json_t const& obj, std::string_view name) const
{
    verify(obj.is_object(), "object", obj);

    auto iter = obj.find(std::string{name});
    return iter != obj.end() ? &*iter : nullptr;
}

void json_codec_core::for_each_field(json_t const& obj, field_visitor const& visit) const
{
    verify(obj.is_object(), "object", obj);

    for (auto& [key, value] : obj.items())
        visit(key, value);
}

json_t& json_codec_core::set_type_tag(json_t& enc, std::string_view name) const
{
    enc = json_t::object();
    enc[_json_config.type_key] = std::string{name};
    return enc[_json_config.value_key];
}

auto json_codec_core::read_type_tag(json_t const& enc) const -> std::optional<type_tag_view>
{
    if (not enc.is_object() || enc.size() != 2)
        return std::nullopt;

    auto type  = enc.find(_json_config.type_key);
    auto value = enc.find(_json_config.value_key);

    if (type == enc.end() || value == enc.end())
        return std::nullopt;

    verify(type->is_string(), "type name string", *type);
    return type_tag_view{type->get_ref<std::string const&>(), &*value};
}

json_t json_codec_core::parse(std::string_view text)
{
    return guarded([&] { return json_t::parse(text.begin(), text.end()); });
}

std::string json_codec_core::dump(json_t const& node, int indent)
{
    return guarded([&] { return node.dump(indent); });
}
}  // namespace codecore::json
