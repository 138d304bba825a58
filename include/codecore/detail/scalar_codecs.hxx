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

#include "../codec.hxx"
#include "../codec_core_fwd.hxx"
#include "traits.hxx"

namespace codecore::detail {
/**
 * Carries an arithmetic type through the primitive kind of the same width.
 */
template <typename Ty_, typename Enc_>
class integral_codec : public primitive_codec<Ty_, Enc_>
{
    using kind_type = primitive_kind_t<Ty_>;
    primitive_codec<kind_type, Enc_> const* _kind;

   public:
    explicit integral_codec(codec_core<Enc_>* core)
            : _kind(&core->template primitive<kind_type>()) {}

    Enc_& encode_prim(Ty_ val, Enc_& enc) const override
    {
        return _kind->encode_prim(static_cast<kind_type>(val), enc);
    }

    Enc_ encode_prim(Ty_ val) const override
    {
        return _kind->encode_prim(static_cast<kind_type>(val));
    }

    Ty_ decode_prim(Enc_ const& enc) const override
    {
        return static_cast<Ty_>(_kind->decode_prim(enc));
    }
};

//! Enumerations are carried as their underlying integer.
template <typename Ty_, typename Enc_>
class enum_codec : public codec<Ty_, Enc_>
{
    using underlying_type = std::underlying_type_t<Ty_>;
    using kind_type       = primitive_kind_t<underlying_type>;
    primitive_codec<kind_type, Enc_> const* _kind;

   public:
    explicit enum_codec(codec_core<Enc_>* core)
            : _kind(&core->template primitive<kind_type>()) {}

    Enc_& encode(Ty_ const& val, Enc_& enc) const override
    {
        return _kind->encode_prim(static_cast<kind_type>(static_cast<underlying_type>(val)), enc);
    }

    Ty_ decode(Enc_ const& enc) const override
    {
        return static_cast<Ty_>(static_cast<underlying_type>(_kind->decode_prim(enc)));
    }
};

/**
 * Carries a value type through its string form.
 */
template <typename Ty_, typename Enc_, typename ToStr_, typename FromStr_>
class string_proxy_codec : public codec<Ty_, Enc_>
{
    codec_core<Enc_>* _core;
    ToStr_ _to_string;
    FromStr_ _from_string;

   public:
    string_proxy_codec(codec_core<Enc_>* core, ToStr_ to_string, FromStr_ from_string)
            : _core(core), _to_string(std::move(to_string)), _from_string(std::move(from_string)) {}

    Enc_& encode(Ty_ const& val, Enc_& enc) const override
    {
        return _core->string_codec().encode(std::string{_to_string(val)}, enc);
    }

    Ty_ decode(Enc_ const& enc) const override
    {
        return _from_string(_core->string_codec().decode(enc));
    }
};
}  // namespace codecore::detail
