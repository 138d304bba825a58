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
#include <memory>
#include <typeinfo>

#include "errors.hxx"
#include "type_id.hxx"

namespace codecore {
/**
 * Type erased base of every codec. Registry entries are stored as this.
 */
class if_codec_base
{
   public:
    virtual ~if_codec_base() = default;

    //! Type of the value this codec encodes
    virtual std::type_info const& type_info() const noexcept = 0;

    //! Codec that calls are finally delivered to. Itself unless this is a forward reference.
    virtual if_codec_base const* resolved() const { return this; }
};

/**
 * Encodes values of Ty_ into carrier nodes of Enc_, and back.
 *
 * A codec never receives an absent value; null handling is done by wrapping
 * codecs. Codecs are immutable once constructed and shared by every caller.
 */
template <typename Ty_, typename Enc_>
class codec : public if_codec_base
{
   public:
    using value_type   = Ty_;
    using encoded_type = Enc_;

   public:
    std::type_info const& type_info() const noexcept override { return typeid(Ty_); }

    /**
     * Writes value into given carrier node.
     *
     * @return Node which represents encoded value. Usually enc itself.
     */
    virtual Enc_& encode(Ty_ const& val, Enc_& enc) const = 0;

    virtual Ty_ decode(Enc_ const& enc) const
    {
        throw error::operation_not_implemented{"decode() of '{}'", type_name<Ty_>()};
    }

    //! Decode with the declared or dynamic type of the value
    virtual Ty_ decode(type_id const& dyn_type, Enc_ const& enc) const
    {
        return decode(enc);
    }
};

template <typename Ty_, typename Enc_>
using codec_ptr = std::shared_ptr<codec<Ty_, Enc_> const>;

/**
 * Codec of primitive kinds.
 *
 * Either the bare form, which writes into an existing node, or the boxed form,
 * which creates a standalone node, must be overridden. The bare form defaults to
 * assigning the boxed form.
 */
template <typename Prim_, typename Enc_>
class primitive_codec : public codec<Prim_, Enc_>
{
   public:
    Enc_& encode(Prim_ const& val, Enc_& enc) const final { return encode_prim(val, enc); }
    Prim_ decode(Enc_ const& enc) const final { return decode_prim(enc); }
    Prim_ decode(type_id const&, Enc_ const& enc) const final { return decode_prim(enc); }

   public:
    virtual Enc_& encode_prim(Prim_ val, Enc_& enc) const
    {
        return enc = encode_prim(val);
    }

    virtual Enc_ encode_prim(Prim_ val) const
    {
        throw error::operation_not_implemented{"encode_prim() of '{}'", type_name<Prim_>()};
    }

    virtual Prim_ decode_prim(Enc_ const& enc) const = 0;
};

/**
 * Writes and detects the carrier specific sentinel of absence.
 */
template <typename Enc_>
class null_codec
{
   public:
    virtual ~null_codec() = default;

    virtual bool is_null(Enc_ const& enc) const = 0;
    virtual Enc_& encode_null(Enc_& enc) const = 0;

    //! A node which represents absence. Used in place of missing fields.
    virtual Enc_ const& null_node() const = 0;

    void decode_null(Enc_ const& enc) const
    {
        if (not is_null(enc))
            throw error::structure_mismatch{"expected null marker"};
    }
};
}  // namespace codecore
