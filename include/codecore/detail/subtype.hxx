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
#include <string>

#include "../codec.hxx"
#include "../codec_core_fwd.hxx"

namespace codecore::detail {
class if_subtype_base
{
   public:
    virtual ~if_subtype_base() = default;

    //! Identity written to the type tag
    virtual std::string const& name() const = 0;
};

/**
 * Encoding of values whose declared type is Base_, and whose runtime type is
 * one registered subtype of it.
 */
template <typename Base_, typename Enc_>
class subtype_entry : public if_subtype_base
{
   public:
    virtual Enc_& encode(Base_ const& val, Enc_& enc) const = 0;
    virtual std::unique_ptr<Base_> decode(type_id const& dyn_type, Enc_ const& enc) const = 0;
};

template <typename Base_, typename Derived_, typename Enc_>
class derived_subtype : public subtype_entry<Base_, Enc_>
{
    codec_core<Enc_>* _core;

   public:
    explicit derived_subtype(codec_core<Enc_>* core) : _core(core) {}

    std::string const& name() const override { return type_name<Derived_>(); }

    Enc_& encode(Base_ const& val, Enc_& enc) const override
    {
        return _core->template get_codec<Derived_>()->encode(dynamic_cast<Derived_ const&>(val), enc);
    }

    std::unique_ptr<Base_> decode(type_id const& dyn_type, Enc_ const& enc) const override
    {
        return std::make_unique<Derived_>(_core->template get_codec<Derived_>()->decode(dyn_type, enc));
    }
};
}  // namespace codecore::detail
