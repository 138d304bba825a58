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
#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "../detail/traits.hxx"
#include "object_codec.hxx"

namespace codecore {
//! Fields of a builder beyond this count are collected by an untyped stage.
constexpr size_t builder_typed_arity = 6;

/**
 * Decoded field values handed to the construction function of an untyped
 * builder stage, in declaration order.
 */
class argument_list
{
    std::vector<std::any> _args;

   public:
    explicit argument_list(size_t count) : _args(count) {}

    size_t size() const noexcept { return _args.size(); }
    std::any& operator[](size_t index) { return _args[index]; }

    //! Moves the argument at index out as Arg_
    template <typename Arg_>
    Arg_ take(size_t index)
    {
        auto& arg = _args.at(index);
        if (arg.type() != typeid(Arg_)) {
            throw error::codec_exception{"argument {} is '{}', not '{}'",
                                         index, demangle(arg.type().name()), type_name<Arg_>()};
        }

        return std::any_cast<Arg_>(std::move(arg));
    }
};

namespace detail {
template <typename Ty_, typename Enc_>
using field_encoder = std::function<Enc_&(Ty_ const&, Enc_&)>;

template <typename Ty_, typename Enc_, typename Arg_>
struct builder_field {
    std::string name;
    field_encoder<Ty_, Enc_> encode;
    codec_ptr<Arg_, Enc_> codec;
};

template <typename Ty_, typename Enc_>
struct untyped_builder_field {
    std::string name;
    field_encoder<Ty_, Enc_> encode;
    std::function<std::any(Enc_ const&)> decode;
};

template <typename Ty_, typename Enc_, typename Arg_, typename Getter_>
builder_field<Ty_, Enc_, Arg_> make_builder_field(std::string name, Getter_ getter, codec_ptr<Arg_, Enc_> codec)
{
    auto encode = [getter = std::move(getter), codec](Ty_ const& val, Enc_& enc) -> Enc_& {
        return codec->encode(std::invoke(getter, val), enc);
    };

    return {std::move(name), std::move(encode), std::move(codec)};
}

template <typename Ty_, typename Enc_, typename Arg_>
untyped_builder_field<Ty_, Enc_> to_untyped(builder_field<Ty_, Enc_, Arg_> field)
{
    static_assert(std::is_copy_constructible_v<Arg_>,
                  "fields beyond the typed arity must be copy constructible");

    auto decode = [codec = field.codec](Enc_ const& enc) { return std::any{codec->decode(enc)}; };
    return {std::move(field.name), std::move(field.encode), std::move(decode)};
}

template <typename Ty_, typename... Args_>
struct typed_accumulator {
    std::tuple<std::optional<Args_>...> args;
    std::function<Ty_(Args_...)> const* ctor = nullptr;

    Ty_ construct() { return _construct(std::index_sequence_for<Args_...>{}); }

   private:
    template <size_t... Index_>
    Ty_ _construct(std::index_sequence<Index_...>)
    {
        return (*ctor)(std::move(*std::get<Index_>(args))...);
    }
};

template <typename Ty_>
struct untyped_accumulator {
    argument_list args;
    std::function<Ty_(argument_list&)> const* ctor = nullptr;

    Ty_ construct() { return (*ctor)(args); }
};

template <typename Ty_, typename Enc_, typename Acc_, size_t Index_, typename Arg_>
class positional_field : public field_meta<Ty_, Enc_, Acc_>
{
    using accumulator = Acc_;
    using super       = field_meta<Ty_, Enc_, Acc_>;

    builder_field<Ty_, Enc_, Arg_> _desc;

   public:
    explicit positional_field(builder_field<Ty_, Enc_, Arg_> desc)
            : super(desc.name), _desc(std::move(desc)) {}

    void encode_field(Ty_ const& val, Enc_& enc) const override { _desc.encode(val, enc); }

    void decode_field(accumulator& acc, Enc_ const& enc) const override
    {
        std::get<Index_>(acc.args).emplace(_desc.codec->decode(enc));
    }
};

template <typename Ty_, typename Enc_>
class indexed_field : public field_meta<Ty_, Enc_, untyped_accumulator<Ty_>>
{
    using super = field_meta<Ty_, Enc_, untyped_accumulator<Ty_>>;

    size_t _index;
    untyped_builder_field<Ty_, Enc_> _desc;

   public:
    indexed_field(size_t index, untyped_builder_field<Ty_, Enc_> desc)
            : super(desc.name), _index(index), _desc(std::move(desc)) {}

    void encode_field(Ty_ const& val, Enc_& enc) const override { _desc.encode(val, enc); }

    void decode_field(untyped_accumulator<Ty_>& acc, Enc_ const& enc) const override
    {
        acc.args[_index] = _desc.decode(enc);
    }
};

template <typename Ty_, typename Enc_>
using codec_registrar = std::function<void(codec_ptr<Ty_, Enc_> const&)>;
}  // namespace detail

/**
 * Untyped terminal stage of the field builder.
 *
 * Collects any number of fields. The construction function receives the
 * decoded values as an argument_list.
 */
template <typename Ty_, typename Enc_>
class object_codec_untyped_stage
{
    using field_type = detail::untyped_builder_field<Ty_, Enc_>;

    codec_core<Enc_>* _core;
    detail::codec_registrar<Ty_, Enc_> _on_created;
    std::vector<field_type> _fields;

   public:
    object_codec_untyped_stage(codec_core<Enc_>* core,
                               detail::codec_registrar<Ty_, Enc_> on_created,
                               std::vector<field_type> fields)
            : _core(core), _on_created(std::move(on_created)), _fields(std::move(fields)) {}

    template <typename Getter_, typename Codec_>
    object_codec_untyped_stage field(std::string name, Getter_ getter, std::shared_ptr<Codec_> codec) const
    {
        using arg_type = typename Codec_::value_type;
        codec_ptr<arg_type, Enc_> arg_codec = std::move(codec);

        auto next = *this;
        next._fields.push_back(detail::to_untyped(
                detail::make_builder_field<Ty_>(std::move(name), std::move(getter), std::move(arg_codec))));
        return next;
    }

    template <typename Getter_>
    object_codec_untyped_stage field(std::string name, Getter_ getter) const
    {
        using arg_type = remove_cvr_t<std::invoke_result_t<Getter_&, Ty_ const&>>;
        return field(std::move(name), std::move(getter), _core->template get_codec<arg_type>());
    }

    template <typename Getter_, typename Codec_>
    object_codec_untyped_stage null_field(std::string name, Getter_ getter, std::shared_ptr<Codec_> codec) const
    {
        using arg_type = typename Codec_::value_type;
        return field(std::move(name), std::move(getter), _core->template make_null_safe<arg_type>(std::move(codec)));
    }

    template <typename Getter_>
    object_codec_untyped_stage null_field(std::string name, Getter_ getter) const
    {
        using arg_type = remove_cvr_t<std::invoke_result_t<Getter_&, Ty_ const&>>;
        static_assert(detail::is_nullable_v<arg_type>, "null_field() requires a nullable field type");
        return field(std::move(name), std::move(getter));
    }

    codec_ptr<Ty_, Enc_> map(std::function<Ty_(argument_list&)> ctor) const
    {
        using accumulator = detail::untyped_accumulator<Ty_>;

        object_meta<Ty_, Enc_, accumulator> meta;
        for (size_t index = 0; index < _fields.size(); ++index)
            meta.fields.push_back(std::make_unique<detail::indexed_field<Ty_, Enc_>>(index, _fields[index]));

        auto fn = std::make_shared<std::function<Ty_(argument_list&)> const>(std::move(ctor));
        meta.start_decode = [fn, count = _fields.size()](type_id const&) {
            return accumulator{argument_list{count}, fn.get()};
        };

        codec_ptr<Ty_, Enc_> result = std::make_shared<object_codec<Ty_, Enc_, accumulator>>(_core, std::move(meta));
        if (_on_created) { _on_created(result); }

        return result;
    }
};

/**
 * Typed stage of the field builder, holding one field per element of Args_.
 *
 * Each field() call returns a new stage one arity higher; map() binds a
 * construction function taking the decoded fields in declaration order.
 */
template <typename Ty_, typename Enc_, typename... Args_>
class object_codec_stage
{
    template <typename, typename, typename...>
    friend class object_codec_stage;

    using fields_type = std::tuple<detail::builder_field<Ty_, Enc_, Args_>...>;

    codec_core<Enc_>* _core;
    detail::codec_registrar<Ty_, Enc_> _on_created;
    fields_type _fields;

   public:
    object_codec_stage(codec_core<Enc_>* core,
                       detail::codec_registrar<Ty_, Enc_> on_created,
                       fields_type fields = {})
            : _core(core), _on_created(std::move(on_created)), _fields(std::move(fields)) {}

    template <typename Getter_, typename Codec_>
    auto field(std::string name, Getter_ getter, std::shared_ptr<Codec_> codec) const
    {
        using arg_type = typename Codec_::value_type;
        codec_ptr<arg_type, Enc_> arg_codec = std::move(codec);

        auto desc = detail::make_builder_field<Ty_>(std::move(name), std::move(getter), std::move(arg_codec));

        if constexpr (sizeof...(Args_) < builder_typed_arity) {
            return object_codec_stage<Ty_, Enc_, Args_..., arg_type>{
                    _core, _on_created, std::tuple_cat(_fields, std::make_tuple(std::move(desc)))};
        } else {
            auto fields = _untyped_fields(std::index_sequence_for<Args_...>{});
            fields.push_back(detail::to_untyped(std::move(desc)));

            return object_codec_untyped_stage<Ty_, Enc_>{_core, _on_created, std::move(fields)};
        }
    }

    //! Field whose codec is resolved by the getter's result type
    template <typename Getter_>
    auto field(std::string name, Getter_ getter) const
    {
        using arg_type = remove_cvr_t<std::invoke_result_t<Getter_&, Ty_ const&>>;
        return field(std::move(name), std::move(getter), _core->template get_codec<arg_type>());
    }

    //! Field whose absence is written as the null marker
    template <typename Getter_, typename Codec_>
    auto null_field(std::string name, Getter_ getter, std::shared_ptr<Codec_> codec) const
    {
        using arg_type = typename Codec_::value_type;
        return field(std::move(name), std::move(getter), _core->template make_null_safe<arg_type>(std::move(codec)));
    }

    template <typename Getter_>
    auto null_field(std::string name, Getter_ getter) const
    {
        using arg_type = remove_cvr_t<std::invoke_result_t<Getter_&, Ty_ const&>>;
        static_assert(detail::is_nullable_v<arg_type>, "null_field() requires a nullable field type");

        // Codecs of nullable types are resolved null-safe already.
        return field(std::move(name), std::move(getter));
    }

    template <typename Ctor_>
    codec_ptr<Ty_, Enc_> map(Ctor_&& ctor) const
    {
        static_assert(sizeof...(Args_) > 0, "declare at least one field before map()");
        using accumulator = detail::typed_accumulator<Ty_, Args_...>;

        object_meta<Ty_, Enc_, accumulator> meta;
        _append_fields<accumulator>(meta, std::index_sequence_for<Args_...>{});

        auto fn = std::make_shared<std::function<Ty_(Args_...)> const>(std::forward<Ctor_>(ctor));
        meta.start_decode = [fn](type_id const&) { return accumulator{{}, fn.get()}; };

        codec_ptr<Ty_, Enc_> result = std::make_shared<object_codec<Ty_, Enc_, accumulator>>(_core, std::move(meta));
        if (_on_created) { _on_created(result); }

        return result;
    }

   private:
    template <typename Acc_, size_t... Index_>
    void _append_fields(object_meta<Ty_, Enc_, Acc_>& meta, std::index_sequence<Index_...>) const
    {
        (meta.fields.push_back(
                 std::make_unique<detail::positional_field<Ty_, Enc_, Acc_, Index_, Args_>>(
                         std::get<Index_>(_fields))),
         ...);
    }

    template <size_t... Index_>
    auto _untyped_fields(std::index_sequence<Index_...>) const
    {
        std::vector<detail::untyped_builder_field<Ty_, Enc_>> fields;
        (fields.push_back(detail::to_untyped(std::get<Index_>(_fields))), ...);
        return fields;
    }
};
}  // namespace codecore
