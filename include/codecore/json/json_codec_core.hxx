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
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../codec_core.hxx"

namespace codecore::json {
using json_t = nlohmann::ordered_json;

/**
 * Any object holding exactly these two members, with a string under type_key,
 * is read as a tagged node. Pick keys no two-field object of your own uses.
 */
struct json_config {
    //! Member names of a tagged node: {"@type": name, "@value": encoded}
    std::string type_key  = "@type";
    std::string value_key = "@value";
};

/**
 * Codec core over JSON trees. Objects keep the order their fields were written.
 */
class json_codec_core : public codec_core<json_t>
{
    json_config _json_config;

   public:
    explicit json_codec_core(json_config settings = {});

    json_config const& json_settings() const noexcept { return _json_config; }

   public:
    null_codec<json_t> const& null_marker() const override;

    primitive_codec<bool, json_t> const& bool_codec() const override;
    primitive_codec<int8_t, json_t> const& byte_codec() const override;
    primitive_codec<char, json_t> const& char_codec() const override;
    primitive_codec<int16_t, json_t> const& short_codec() const override;
    primitive_codec<int32_t, json_t> const& int_codec() const override;
    primitive_codec<int64_t, json_t> const& long_codec() const override;
    primitive_codec<float, json_t> const& float_codec() const override;
    primitive_codec<double, json_t> const& double_codec() const override;
    codec<std::string, json_t> const& string_codec() const override;

    json_t& make_sequence(json_t& enc) const override;
    json_t& add_entry(json_t& seq) const override;
    void for_each_entry(json_t const& seq, entry_visitor const& visit) const override;
    size_t entry_count(json_t const& seq) const override;

    json_t& make_object(json_t& enc) const override;
    json_t& add_field(json_t& obj, std::string_view name) const override;
    json_t const* find_field(json_t const& obj, std::string_view name) const override;
    void for_each_field(json_t const& obj, field_visitor const& visit) const override;

    json_t& set_type_tag(json_t& enc, std::string_view name) const override;
    std::optional<type_tag_view> read_type_tag(json_t const& enc) const override;

   public:
    //! Parses text into a tree. Parse errors are nested into codec_exception.
    static json_t parse(std::string_view text);

    //! Serializes a tree. Strings that are not valid UTF-8 fail with codec_exception.
    static std::string dump(json_t const& node, int indent = -1);

    template <typename Ty_>
    std::string to_string(Ty_ const& val, int indent = -1)
    {
        return dump(encode(val), indent);
    }

    template <typename Ty_>
    Ty_ from_string(std::string_view text)
    {
        return decode<Ty_>(parse(text));
    }
};
}  // namespace codecore::json
