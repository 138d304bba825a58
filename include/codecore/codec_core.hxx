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
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <typeindex>

#include "codec.hxx"
#include "codec_core_fwd.hxx"
#include "codec_ref.hxx"
#include "config.hxx"
#include "detail/subtype.hxx"
#include "detail/traits.hxx"
#include "helper/logging.hxx"
#include "registry.hxx"
#include "thread/spinlock.hxx"
#include "type_constructor.hxx"

namespace codecore {
/**
 * Carrier independent core of codec resolution.
 *
 * Resolves, composes and caches codecs of arbitrary types against carrier Enc_.
 * A concrete carrier derives from this and implements the primitive codecs and
 * the structural node operations declared pure virtual below.
 *
 * Registration is expected during setup. Resolution, encode and decode may be
 * invoked concurrently from any number of threads.
 */
template <typename Enc_>
class codec_core
{
   public:
    using encoded_type = Enc_;

    template <typename Ty_>
    using codec_ptr = codecore::codec_ptr<Ty_, Enc_>;

    template <typename Base_>
    using subtype_ptr = std::shared_ptr<detail::subtype_entry<Base_, Enc_> const>;

    using entry_visitor = std::function<void(Enc_ const&)>;
    using field_visitor = std::function<void(std::string_view, Enc_ const&)>;
    using name_set      = std::set<std::string, std::less<>>;

    struct type_tag_view {
        std::string_view name;
        Enc_ const* value = nullptr;
    };

   public:
    codec_config config;

   private:
    struct subtype_table {
        std::map<std::string, std::shared_ptr<detail::if_subtype_base const>, std::less<>> by_name;
        std::map<std::type_index, std::shared_ptr<detail::if_subtype_base const>> by_type;
    };

    lazy_registry<if_codec_base> _codecs;
    lazy_registry<if_type_constructor_base> _constructors;

    mutable thread::spinlock _table_lock;
    std::map<std::string, std::string, std::less<>> _proxies;
    std::map<std::string, subtype_table, std::less<>> _subtypes;

   public:
    codec_core() = default;
    codec_core(codec_core const&) = delete;
    codec_core& operator=(codec_core const&) = delete;
    virtual ~codec_core() = default;

   public:
    /*
     * Carrier contract
     */
    virtual null_codec<Enc_> const& null_marker() const = 0;

    virtual primitive_codec<bool, Enc_> const& bool_codec() const     = 0;
    virtual primitive_codec<int8_t, Enc_> const& byte_codec() const   = 0;
    virtual primitive_codec<char, Enc_> const& char_codec() const     = 0;
    virtual primitive_codec<int16_t, Enc_> const& short_codec() const = 0;
    virtual primitive_codec<int32_t, Enc_> const& int_codec() const   = 0;
    virtual primitive_codec<int64_t, Enc_> const& long_codec() const  = 0;
    virtual primitive_codec<float, Enc_> const& float_codec() const   = 0;
    virtual primitive_codec<double, Enc_> const& double_codec() const = 0;
    virtual codec<std::string, Enc_> const& string_codec() const      = 0;

    //! Turns node into an empty sequence of entries
    virtual Enc_& make_sequence(Enc_& enc) const = 0;

    //! Appends an empty entry to the sequence
    virtual Enc_& add_entry(Enc_& seq) const = 0;

    //! Visits each entry. Fails with structure_mismatch if seq is not a sequence.
    virtual void for_each_entry(Enc_ const& seq, entry_visitor const& visit) const = 0;

    //! Number of entries if known in advance, otherwise ~size_t{}
    virtual size_t entry_count(Enc_ const& seq) const { return ~size_t{}; }

    //! Turns node into an object without fields
    virtual Enc_& make_object(Enc_& enc) const = 0;

    virtual Enc_& add_field(Enc_& obj, std::string_view name) const = 0;

    //! nullptr if absent. Fails with structure_mismatch if obj is not an object.
    virtual Enc_ const* find_field(Enc_ const& obj, std::string_view name) const = 0;

    virtual void for_each_field(Enc_ const& obj, field_visitor const& visit) const = 0;

    /**
     * Marks node with a type identity.
     *
     * @return Node which receives the encoding of the tagged value
     */
    virtual Enc_& set_type_tag(Enc_& enc, std::string_view name) const = 0;

    //! Reads back the tag written by set_type_tag(), if any.
    virtual std::optional<type_tag_view> read_type_tag(Enc_ const& enc) const = 0;

    //! Name of a reflected field, made unique among already declared names.
    virtual std::string field_name(std::string_view name, int depth, name_set const& existing) const
    {
        std::string result{name};

        while (existing.find(result) != existing.end())
            result.insert(result.begin(), config.field_name_marker);

        return result;
    }

    template <typename Prim_>
    primitive_codec<Prim_, Enc_> const& primitive() const
    {
        static_assert(detail::is_primitive_kind_v<Prim_>, "not a primitive kind");

        if constexpr (std::is_same_v<Prim_, bool>) return bool_codec();
        else if constexpr (std::is_same_v<Prim_, char>) return char_codec();
        else if constexpr (std::is_same_v<Prim_, int8_t>) return byte_codec();
        else if constexpr (std::is_same_v<Prim_, int16_t>) return short_codec();
        else if constexpr (std::is_same_v<Prim_, int32_t>) return int_codec();
        else if constexpr (std::is_same_v<Prim_, int64_t>) return long_codec();
        else if constexpr (std::is_same_v<Prim_, float>) return float_codec();
        else return double_codec();
    }

   public:
    /*
     * Registration
     */
    template <typename Ty_>
    void register_codec(codec_ptr<Ty_> codec)
    {
        register_codec<Ty_>(type_name<Ty_>(), std::move(codec));
    }

    template <typename Ty_>
    void register_codec(std::string_view name, codec_ptr<Ty_> codec)
    {
        CODECORE_DEBUG("codec of '{}' registered", name);
        _codecs.assign(name, std::move(codec));
    }

    //! Starts a field builder whose result is registered as codec of Ty_.
    template <typename Ty_>
    object_codec_stage<Ty_, Enc_> register_codec();

    //! Starts a field builder. The result is returned only.
    template <typename Ty_>
    object_codec_stage<Ty_, Enc_> define_object();

    template <typename Ty_, typename ToStr_, typename FromStr_>
    void register_string_proxy_codec(ToStr_&& to_string, FromStr_&& from_string);

    template <typename Ty_, typename Fn_>
    void register_type_constructor(Fn_&& fn)
    {
        CODECORE_DEBUG("type constructor of '{}' registered", type_name<Ty_>());
        _constructors.assign(type_name<Ty_>(), make_type_constructor<Ty_>(std::forward<Fn_>(fn)));
    }

    /**
     * Pointers declared as name are decoded as substitute when untagged.
     * The substitute must be registered as subtype.
     */
    void register_type_proxy(std::string_view name, std::string_view substitute)
    {
        std::lock_guard _{_table_lock};
        _proxies[std::string{name}] = std::string{substitute};
    }

    template <typename Ty_, typename Proxy_>
    void register_type_proxy()
    {
        register_subtype<Ty_, Proxy_>();
        register_type_proxy(type_name<Ty_>(), type_name<Proxy_>());
    }

    //! Makes Derived_ known to the dynamic dispatch of pointers to Base_.
    template <typename Base_, typename Derived_>
    void register_subtype();

    std::string remap_type(std::string_view name) const
    {
        std::lock_guard _{_table_lock};
        auto iter = _proxies.find(name);
        return iter != _proxies.end() ? iter->second : std::string{name};
    }

    template <typename Base_>
    subtype_ptr<Base_> find_subtype(std::type_info const& type) const;

    template <typename Base_>
    subtype_ptr<Base_> find_subtype(std::string_view name) const;

   public:
    /*
     * Resolution
     */

    //! Cached codec of Ty_, built on first request
    template <typename Ty_>
    codec_ptr<Ty_> get_codec();

    //! Cached codec registered under name, built by build() on first request
    template <typename Ty_, typename Build_>
    codec_ptr<Ty_> resolve(std::string_view name, Build_&& build);

    template <typename Ty_>
    type_constructor_ptr<Ty_> get_type_constructor();

    template <typename Ty_>
    codec_ptr<Ty_> make_null_safe(codec_ptr<Ty_> base);

    //! Reflective object codec of a described type
    template <typename Ty_>
    codec_ptr<Ty_> create_object_codec();

   public:
    /*
     * Encode and decode
     */
    template <typename Ty_>
    Enc_& encode(Ty_ const& val, Enc_& root)
    {
        return get_codec<Ty_>()->encode(val, root);
    }

    template <typename Ty_>
    Enc_ encode(Ty_ const& val)
    {
        Enc_ root{};
        encode(val, root);
        return root;
    }

    //! Encodes val with the codec of its declared type
    template <typename Declared_>
    Enc_& encode_as(Declared_ const& val, Enc_& root)
    {
        return get_codec<Declared_>()->encode(val, root);
    }

    template <typename Ty_>
    Ty_ decode(Enc_ const& enc)
    {
        return get_codec<Ty_>()->decode(enc);
    }

    template <typename Ty_>
    Ty_ decode(type_id const& dyn_type, Enc_ const& enc)
    {
        return get_codec<Ty_>()->decode(dyn_type, enc);
    }

   private:
    template <typename Ty_>
    codec_ptr<Ty_> _build_codec();

    template <typename Ty_>
    codec_ptr<Ty_> _build_non_null_codec();
};
}  // namespace codecore

#include "detail/codec_core_impl.hxx"
