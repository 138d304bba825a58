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
#include "../codec_core.hxx"
#include "../object/codec_builder.hxx"
#include "../object/object_factory.hxx"
#include "container_codecs.hxx"
#include "scalar_codecs.hxx"
#include "value_codecs.hxx"

namespace codecore {
template <typename Enc_>
template <typename Ty_>
auto codec_core<Enc_>::register_codec() -> object_codec_stage<Ty_, Enc_>
{
    return object_codec_stage<Ty_, Enc_>{
            this, [this](codec_ptr<Ty_> const& created) { register_codec<Ty_>(created); }};
}

template <typename Enc_>
template <typename Ty_>
auto codec_core<Enc_>::define_object() -> object_codec_stage<Ty_, Enc_>
{
    return object_codec_stage<Ty_, Enc_>{this, nullptr};
}

template <typename Enc_>
template <typename Ty_, typename ToStr_, typename FromStr_>
void codec_core<Enc_>::register_string_proxy_codec(ToStr_&& to_string, FromStr_&& from_string)
{
    using codec_type = detail::string_proxy_codec<Ty_, Enc_, std::decay_t<ToStr_>, std::decay_t<FromStr_>>;
    register_codec<Ty_>(std::make_shared<codec_type>(
            this, std::forward<ToStr_>(to_string), std::forward<FromStr_>(from_string)));
}

template <typename Enc_>
template <typename Base_, typename Derived_>
void codec_core<Enc_>::register_subtype()
{
    static_assert(std::is_base_of_v<Base_, Derived_>, "not a subtype");
    static_assert(std::is_polymorphic_v<Base_>, "dynamic dispatch requires a polymorphic base");
    static_assert(not std::is_abstract_v<Derived_>, "subtypes must be instantiable");

    auto entry = std::make_shared<detail::derived_subtype<Base_, Derived_, Enc_>>(this);

    std::lock_guard _{_table_lock};
    auto& table = _subtypes[type_name<Base_>()];
    table.by_name[type_name<Derived_>()] = entry;
    table.by_type[typeid(Derived_)]      = entry;

    CODECORE_DEBUG("'{}' registered as subtype of '{}'", type_name<Derived_>(), type_name<Base_>());
}

template <typename Enc_>
template <typename Base_>
auto codec_core<Enc_>::find_subtype(std::type_info const& type) const -> subtype_ptr<Base_>
{
    std::lock_guard _{_table_lock};
    auto table = _subtypes.find(type_name<Base_>());
    if (table == _subtypes.end())
        return nullptr;

    auto iter = table->second.by_type.find(type);
    if (iter == table->second.by_type.end())
        return nullptr;

    return std::static_pointer_cast<detail::subtype_entry<Base_, Enc_> const>(iter->second);
}

template <typename Enc_>
template <typename Base_>
auto codec_core<Enc_>::find_subtype(std::string_view name) const -> subtype_ptr<Base_>
{
    std::lock_guard _{_table_lock};
    auto table = _subtypes.find(type_name<Base_>());
    if (table == _subtypes.end())
        return nullptr;

    auto iter = table->second.by_name.find(name);
    if (iter == table->second.by_name.end())
        return nullptr;

    return std::static_pointer_cast<detail::subtype_entry<Base_, Enc_> const>(iter->second);
}

template <typename Enc_>
template <typename Ty_>
auto codec_core<Enc_>::get_codec() -> codec_ptr<Ty_>
{
    static_assert(std::is_same_v<Ty_, remove_cvr_t<Ty_>>, "codecs are resolved for plain value types");
    static_assert(not std::is_abstract_v<Ty_>, "abstract types are encoded through smart pointers");

    return resolve<Ty_>(type_name<Ty_>(), [this] { return _build_codec<Ty_>(); });
}

template <typename Enc_>
template <typename Ty_, typename Build_>
auto codec_core<Enc_>::resolve(std::string_view name, Build_&& build) -> codec_ptr<Ty_>
{
    auto found = _codecs.template resolve<codec_ref<Ty_, Enc_>>(name, std::forward<Build_>(build));
    auto typed = std::dynamic_pointer_cast<codec<Ty_, Enc_> const>(std::move(found));

    if (typed == nullptr)
        throw error::codec_exception{"codec registered as '{}' does not encode '{}'", name, type_name<Ty_>()};

    return typed;
}

template <typename Enc_>
template <typename Ty_>
auto codec_core<Enc_>::get_type_constructor() -> type_constructor_ptr<Ty_>
{
    auto found = _constructors.template resolve<type_constructor_ref<Ty_>>(
            type_name<Ty_>(), [] { return default_type_constructor<Ty_>(); });

    auto typed = std::dynamic_pointer_cast<type_constructor<Ty_> const>(std::move(found));
    if (typed == nullptr)
        throw error::instantiation_failure{"type constructor of '{}' constructs another type", type_name<Ty_>()};

    return typed;
}

template <typename Enc_>
template <typename Ty_>
auto codec_core<Enc_>::make_null_safe(codec_ptr<Ty_> base) -> codec_ptr<Ty_>
{
    return std::make_shared<detail::null_safe_codec<Ty_, Enc_>>(this, std::move(base));
}

template <typename Enc_>
template <typename Ty_>
auto codec_core<Enc_>::create_object_codec() -> codec_ptr<Ty_>
{
    if constexpr (has_object_description_v<Ty_>) {
        return object_factory<Ty_, Enc_>{this}.create();
    } else {
        throw error::construction_failure{
                "'{}' has neither a registered codec nor an object description", type_name<Ty_>()};
    }
}

template <typename Enc_>
template <typename Ty_>
auto codec_core<Enc_>::_build_codec() -> codec_ptr<Ty_>
{
    using namespace detail;
    CODECORE_DEBUG("building codec of '{}'", type_name<Ty_>());

    if constexpr (is_primitive_kind_v<Ty_>) {
        return codec_ptr<Ty_>{std::shared_ptr<void>{}, &primitive<Ty_>()};
    } else if constexpr (is_primitive_v<Ty_>) {
        return std::make_shared<integral_codec<Ty_, Enc_>>(this);
    } else if constexpr (is_primitive_array_v<Ty_>) {
        return std::make_shared<primitive_array_codec<typename Ty_::value_type, Enc_>>(this);
    } else if constexpr (std::is_enum_v<Ty_>) {
        return std::make_shared<enum_codec<Ty_, Enc_>>(this);
    } else if constexpr (std::is_same_v<Ty_, std::string>) {
        return codec_ptr<Ty_>{std::shared_ptr<void>{}, &string_codec()};
    } else if constexpr (is_map_like_v<Ty_>) {
        using key_type    = typename Ty_::key_type;
        using mapped_type = typename Ty_::mapped_type;

        if constexpr (std::is_same_v<key_type, std::string>)
            return std::make_shared<string_map_codec<Ty_, Enc_>>(this, get_codec<mapped_type>());
        else
            return std::make_shared<map_codec<Ty_, Enc_>>(this, get_codec<key_type>(), get_codec<mapped_type>());
    } else if constexpr (is_collection_v<Ty_>) {
        return std::make_shared<collection_codec<Ty_, Enc_>>(this, get_codec<typename Ty_::value_type>());
    } else if constexpr (is_nullable_v<Ty_>) {
        return make_null_safe<Ty_>(_build_non_null_codec<Ty_>());
    } else {
        return create_object_codec<Ty_>();
    }
}

template <typename Enc_>
template <typename Ty_>
auto codec_core<Enc_>::_build_non_null_codec() -> codec_ptr<Ty_>
{
    using namespace detail;
    using element_type = typename nullable_traits<Ty_>::element_type;

    if constexpr (is_template_instance_of<Ty_, std::optional>::value) {
        return std::make_shared<optional_value_codec<element_type, Enc_>>(get_codec<element_type>());
    } else if constexpr (is_dynamic_v<element_type>) {
        codec_ptr<Ty_> base;

        if constexpr (not std::is_abstract_v<element_type>)
            base = std::make_shared<pointer_codec<Ty_, Enc_>>(get_codec<element_type>());

        return std::make_shared<dynamic_codec<Ty_, Enc_>>(this, std::move(base));
    } else {
        return std::make_shared<pointer_codec<Ty_, Enc_>>(get_codec<element_type>());
    }
}
}  // namespace codecore
