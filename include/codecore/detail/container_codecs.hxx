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
#include <string>
#include <vector>

#include "../codec.hxx"
#include "../codec_core_fwd.hxx"
#include "traits.hxx"

namespace codecore::detail {
/**
 * Sequence of elements, each encoded by the element codec into its own entry.
 */
template <typename Ty_, typename Enc_>
class collection_codec : public codec<Ty_, Enc_>
{
    using elem_type = typename Ty_::value_type;

    codec_core<Enc_>* _core;
    codec_ptr<elem_type, Enc_> _elem;

   public:
    collection_codec(codec_core<Enc_>* core, codec_ptr<elem_type, Enc_> elem)
            : _core(core), _elem(std::move(elem)) {}

    Enc_& encode(Ty_ const& val, Enc_& enc) const override
    {
        _core->make_sequence(enc);

        for (auto& elem : val)
            _elem->encode(elem, _core->add_entry(enc));

        return enc;
    }

    Ty_ decode(Enc_ const& enc) const override
    {
        Ty_ val;

        if constexpr (has_reserve_v<Ty_>)
            if (auto n = _core->entry_count(enc); n != ~size_t{})
                val.reserve(n);

        _core->for_each_entry(enc, [&](Enc_ const& entry) {
            if constexpr (has_emplace_back_v<Ty_>)
                val.emplace_back(_elem->decode(entry));
            else
                val.emplace(_elem->decode(entry));
        });

        return val;
    }
};

/**
 * Vector of primitives. Elements are written in bare form without going
 * through the registry.
 */
template <typename Prim_, typename Enc_>
class primitive_array_codec : public codec<std::vector<Prim_>, Enc_>
{
    using kind_type = primitive_kind_t<Prim_>;

    codec_core<Enc_>* _core;
    primitive_codec<kind_type, Enc_> const* _kind;

   public:
    explicit primitive_array_codec(codec_core<Enc_>* core)
            : _core(core), _kind(&core->template primitive<kind_type>()) {}

    Enc_& encode(std::vector<Prim_> const& val, Enc_& enc) const override
    {
        _core->make_sequence(enc);

        for (Prim_ elem : val)
            _kind->encode_prim(static_cast<kind_type>(elem), _core->add_entry(enc));

        return enc;
    }

    std::vector<Prim_> decode(Enc_ const& enc) const override
    {
        std::vector<Prim_> val;
        if (auto n = _core->entry_count(enc); n != ~size_t{})
            val.reserve(n);

        _core->for_each_entry(enc, [&](Enc_ const& entry) {
            val.push_back(static_cast<Prim_>(_kind->decode_prim(entry)));
        });

        return val;
    }
};

//! Maps keyed by string are written as fields of a carrier object.
template <typename Ty_, typename Enc_>
class string_map_codec : public codec<Ty_, Enc_>
{
    using mapped_type = typename Ty_::mapped_type;

    codec_core<Enc_>* _core;
    codec_ptr<mapped_type, Enc_> _value;

   public:
    string_map_codec(codec_core<Enc_>* core, codec_ptr<mapped_type, Enc_> value)
            : _core(core), _value(std::move(value)) {}

    Enc_& encode(Ty_ const& val, Enc_& enc) const override
    {
        _core->make_object(enc);

        for (auto& [key, value] : val)
            _value->encode(value, _core->add_field(enc, key));

        return enc;
    }

    Ty_ decode(Enc_ const& enc) const override
    {
        Ty_ val;
        _core->for_each_field(enc, [&](std::string_view key, Enc_ const& node) {
            val.emplace(std::string{key}, _value->decode(node));
        });

        return val;
    }
};

/**
 * Maps with any other key type are written as a sequence of entries, each an
 * object holding a key field and a value field.
 */
template <typename Ty_, typename Enc_>
class map_codec : public codec<Ty_, Enc_>
{
    using key_type    = typename Ty_::key_type;
    using mapped_type = typename Ty_::mapped_type;

    codec_core<Enc_>* _core;
    codec_ptr<key_type, Enc_> _key;
    codec_ptr<mapped_type, Enc_> _value;

   public:
    map_codec(codec_core<Enc_>* core, codec_ptr<key_type, Enc_> key, codec_ptr<mapped_type, Enc_> value)
            : _core(core), _key(std::move(key)), _value(std::move(value)) {}

    Enc_& encode(Ty_ const& val, Enc_& enc) const override
    {
        auto& config = _core->config;
        _core->make_sequence(enc);

        for (auto& [key, value] : val) {
            auto& entry = _core->make_object(_core->add_entry(enc));
            _key->encode(key, _core->add_field(entry, config.map_key_field));
            _value->encode(value, _core->add_field(entry, config.map_value_field));
        }

        return enc;
    }

    Ty_ decode(Enc_ const& enc) const override
    {
        auto& config = _core->config;
        Ty_ val;

        _core->for_each_entry(enc, [&](Enc_ const& entry) {
            auto key   = _core->find_field(entry, config.map_key_field);
            auto value = _core->find_field(entry, config.map_value_field);

            if (key == nullptr || value == nullptr)
                throw error::structure_mismatch{"map entry of '{}' lacks key or value", type_name<Ty_>()};

            val.emplace(_key->decode(*key), _value->decode(*value));
        });

        return val;
    }
};
}  // namespace codecore::detail
