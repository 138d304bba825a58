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
#include <deque>
#include <set>
#include <string>
#include <string_view>

#include "../detail/traits.hxx"
#include "object_codec.hxx"

namespace codecore {
namespace detail {
//! Stand-in factory used to detect whether a type is described
struct description_shape {
    template <typename... Args_>
    description_shape& property(Args_&&...);

    template <typename Ty_>
    description_shape& extend(type_tag<Ty_>);
};
}  // namespace detail

//! Overload of last resort. Described types provide their own through ADL.
template <typename Ty_, typename Factory_>
void describe_object(type_tag<Ty_>, Factory_&) = delete;

template <typename Ty_, class = void>
constexpr bool has_object_description_v = false;

template <typename Ty_>
constexpr bool has_object_description_v<
        Ty_, std::void_t<decltype(describe_object(type_tag_v<Ty_>, std::declval<detail::description_shape&>()))>>
        = true;

/**
 * Decode accumulator of the reflective path: a bare instance whose fields are
 * assigned one by one.
 */
template <typename Class_>
struct instance_accumulator {
    Class_ value;
    Class_ construct() { return std::move(value); }
};

namespace detail {
template <typename Class_, typename Mem_, typename Enc_>
class member_field : public field_meta<Class_, Enc_, instance_accumulator<Class_>>
{
    using super = field_meta<Class_, Enc_, instance_accumulator<Class_>>;

    Mem_ Class_::*_mem;
    codec_ptr<Mem_, Enc_> _codec;

   public:
    member_field(std::string name, Mem_ Class_::*mem, codec_ptr<Mem_, Enc_> codec)
            : super(std::move(name)), _mem(mem), _codec(std::move(codec)) {}

    void encode_field(Class_ const& val, Enc_& enc) const override
    {
        _codec->encode(val.*_mem, enc);
    }

    void decode_field(instance_accumulator<Class_>& acc, Enc_ const& enc) const override
    {
        acc.value.*_mem = _codec->decode(enc);
    }
};

//! Arithmetic fields skip the registry and use the bare primitive form.
template <typename Class_, typename Mem_, typename Enc_>
class primitive_member_field : public field_meta<Class_, Enc_, instance_accumulator<Class_>>
{
    using super     = field_meta<Class_, Enc_, instance_accumulator<Class_>>;
    using kind_type = primitive_kind_t<Mem_>;

    Mem_ Class_::*_mem;
    primitive_codec<kind_type, Enc_> const* _kind;

   public:
    primitive_member_field(std::string name, Mem_ Class_::*mem, primitive_codec<kind_type, Enc_> const* kind)
            : super(std::move(name)), _mem(mem), _kind(kind) {}

    void encode_field(Class_ const& val, Enc_& enc) const override
    {
        _kind->encode_prim(static_cast<kind_type>(val.*_mem), enc);
    }

    void decode_field(instance_accumulator<Class_>& acc, Enc_ const& enc) const override
    {
        acc.value.*_mem = static_cast<Mem_>(_kind->decode_prim(enc));
    }
};
}  // namespace detail

/**
 * Builds the object codec of a described type.
 *
 * Fields the type declares itself come first. Bases named through extend() are
 * visited afterwards, one inheritance level deeper each, and a base field whose
 * name is already taken is renamed by codec_core::field_name().
 */
template <typename Class_, typename Enc_>
class object_factory
{
   public:
    using accumulator_type = instance_accumulator<Class_>;
    using meta_type        = object_meta<Class_, Enc_, accumulator_type>;

   private:
    using describe_fn = void (*)(object_factory&);

    codec_core<Enc_>* _core;
    meta_type _meta;
    std::set<std::string, std::less<>> _names;
    std::deque<std::pair<int, describe_fn>> _bases;
    int _depth = 0;

   public:
    explicit object_factory(codec_core<Enc_>* core) noexcept : _core(core) {}

    /**
     * Declares a data member as field.
     *
     * @param alias if not empty, written in place of name
     */
    template <typename Owner_, typename Mem_>
    object_factory& property(Mem_ Owner_::*mem, std::string_view name, std::string_view alias = {})
    {
        static_assert(not std::is_function_v<Mem_>, "only data members can be fields");
        static_assert(std::is_base_of_v<Owner_, Class_>, "member does not belong to this class");

        auto field_name = _core->field_name(alias.empty() ? name : alias, _depth, _names);
        _names.insert(field_name);

        Mem_ Class_::*slot = mem;

        if constexpr (detail::is_primitive_v<Mem_>) {
            using kind_type = detail::primitive_kind_t<Mem_>;
            _meta.fields.push_back(
                    std::make_unique<detail::primitive_member_field<Class_, Mem_, Enc_>>(
                            std::move(field_name), slot, &_core->template primitive<kind_type>()));
        } else {
            _meta.fields.push_back(
                    std::make_unique<detail::member_field<Class_, Mem_, Enc_>>(
                            std::move(field_name), slot, _core->template get_codec<Mem_>()));
        }

        return *this;
    }

    template <typename Base_>
    object_factory& extend(type_tag<Base_>)
    {
        static_assert(std::is_base_of_v<Base_, Class_>, "not a base class");
        _bases.emplace_back(_depth + 1, [](object_factory& self) { describe_object(type_tag_v<Base_>, self); });
        return *this;
    }

    codec_ptr<Class_, Enc_> create() &&
    {
        describe_object(type_tag_v<Class_>, *this);

        while (not _bases.empty()) {
            auto [depth, describe] = _bases.front();
            _bases.pop_front();

            _depth = depth;
            describe(*this);
        }

        _meta.start_decode = [core = _core](type_id const&) {
            return accumulator_type{core->template get_type_constructor<Class_>()->construct()};
        };

        return std::make_shared<object_codec<Class_, Enc_, accumulator_type>>(_core, std::move(_meta));
    }
};
}  // namespace codecore
