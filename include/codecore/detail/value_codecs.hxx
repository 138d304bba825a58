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

#include "../codec.hxx"
#include "../codec_core_fwd.hxx"
#include "traits.hxx"

namespace codecore::detail {
/**
 * Writes the null marker for absent values, otherwise delegates to the base codec.
 */
template <typename Ty_, typename Enc_>
class null_safe_codec : public codec<Ty_, Enc_>
{
    static_assert(is_nullable_v<Ty_>, "null safety applies to nullable types only");
    using traits = nullable_traits<Ty_>;

    codec_core<Enc_>* _core;
    codec_ptr<Ty_, Enc_> _base;

   public:
    null_safe_codec(codec_core<Enc_>* core, codec_ptr<Ty_, Enc_> base)
            : _core(core), _base(std::move(base)) {}

    Enc_& encode(Ty_ const& val, Enc_& enc) const override
    {
        if (traits::is_null(val))
            return _core->null_marker().encode_null(enc);

        return _base->encode(val, enc);
    }

    Ty_ decode(Enc_ const& enc) const override
    {
        if (_core->null_marker().is_null(enc))
            return traits::null();

        return _base->decode(enc);
    }

    Ty_ decode(type_id const& dyn_type, Enc_ const& enc) const override
    {
        if (_core->null_marker().is_null(enc))
            return traits::null();

        return _base->decode(dyn_type, enc);
    }
};

template <typename Ty_, typename Enc_>
class optional_value_codec : public codec<std::optional<Ty_>, Enc_>
{
    codec_ptr<Ty_, Enc_> _value;

   public:
    explicit optional_value_codec(codec_ptr<Ty_, Enc_> value) : _value(std::move(value)) {}

    Enc_& encode(std::optional<Ty_> const& val, Enc_& enc) const override
    {
        return _value->encode(*val, enc);
    }

    std::optional<Ty_> decode(Enc_ const& enc) const override
    {
        return std::optional<Ty_>{_value->decode(enc)};
    }

    std::optional<Ty_> decode(type_id const& dyn_type, Enc_ const& enc) const override
    {
        return std::optional<Ty_>{_value->decode(dyn_type, enc)};
    }
};

template <typename Ptr_, typename Ty_>
Ptr_ make_pointer(Ty_&& value)
{
    using element_type = typename nullable_traits<Ptr_>::element_type;

    if constexpr (is_template_instance_of<Ptr_, std::shared_ptr>::value)
        return std::make_shared<element_type>(std::forward<Ty_>(value));
    else
        return std::make_unique<element_type>(std::forward<Ty_>(value));
}

//! Encodes the pointee of a non-null smart pointer
template <typename Ptr_, typename Enc_>
class pointer_codec : public codec<Ptr_, Enc_>
{
    using element_type = typename nullable_traits<Ptr_>::element_type;
    codec_ptr<element_type, Enc_> _value;

   public:
    explicit pointer_codec(codec_ptr<element_type, Enc_> value) : _value(std::move(value)) {}

    Enc_& encode(Ptr_ const& val, Enc_& enc) const override
    {
        return _value->encode(*val, enc);
    }

    Ptr_ decode(Enc_ const& enc) const override
    {
        return make_pointer<Ptr_>(_value->decode(enc));
    }

    Ptr_ decode(type_id const& dyn_type, Enc_ const& enc) const override
    {
        return make_pointer<Ptr_>(_value->decode(dyn_type, enc));
    }
};

/**
 * Tags pointers whose runtime type differs from the declared element type.
 *
 * The base codec handles values of exactly the declared type, and is empty if
 * the declared type is abstract. On decode, an absent tag selects the declared
 * type, or the type proxy registered for it.
 */
template <typename Ptr_, typename Enc_>
class dynamic_codec : public codec<Ptr_, Enc_>
{
    using element_type = typename nullable_traits<Ptr_>::element_type;
    static_assert(is_dynamic_v<element_type>);

    codec_core<Enc_>* _core;
    codec_ptr<Ptr_, Enc_> _base;

   public:
    dynamic_codec(codec_core<Enc_>* core, codec_ptr<Ptr_, Enc_> base)
            : _core(core), _base(std::move(base)) {}

    Enc_& encode(Ptr_ const& val, Enc_& enc) const override
    {
        auto& runtime_type = typeid(*val);
        if (runtime_type == typeid(element_type))
            return _base->encode(val, enc);

        auto subtype = _core->template find_subtype<element_type>(runtime_type);
        if (subtype == nullptr) {
            throw error::unknown_type_name{
                    "runtime type '{}' is not registered as subtype of '{}'",
                    demangle(runtime_type.name()), type_name<element_type>()};
        }

        subtype->encode(*val, _core->set_type_tag(enc, subtype->name()));
        return enc;
    }

    Ptr_ decode(Enc_ const& enc) const override
    {
        if (auto tag = _core->read_type_tag(enc))
            return _decode_as(tag->name, *tag->value);

        auto declared = _core->remap_type(type_name<element_type>());
        return _decode_as(declared, enc);
    }

    Ptr_ decode(type_id const&, Enc_ const& enc) const override
    {
        return decode(enc);
    }

   private:
    Ptr_ _decode_as(std::string_view name, Enc_ const& enc) const
    {
        if (name == type_name<element_type>()) {
            if (_base == nullptr)
                throw error::instantiation_failure{"cannot instantiate abstract type '{}'", name};

            return _base->decode(enc);
        }

        auto subtype = _core->template find_subtype<element_type>(name);
        if (subtype == nullptr) {
            throw error::unknown_type_name{
                    "cannot resolve type name '{}' as subtype of '{}'",
                    name, type_name<element_type>()};
        }

        return Ptr_{subtype->decode(type_id{name}, enc)};
    }
};
}  // namespace codecore::detail
