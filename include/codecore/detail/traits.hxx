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
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "../template_utils.hxx"

namespace codecore::detail {
/*
 * Primitive kinds are bool, char, int8..int64, float and double. Every other
 * arithmetic type is carried by the kind of the same width.
 */
template <typename Ty_>
constexpr bool is_primitive_v = std::is_arithmetic_v<Ty_> && not std::is_same_v<Ty_, long double>;

template <typename Ty_, class = void>
struct primitive_kind {
    using type = Ty_;
};

template <typename Ty_>
struct primitive_kind<Ty_, std::enable_if_t<std::is_integral_v<Ty_>                //
                                            && not std::is_same_v<Ty_, bool>       //
                                            && not std::is_same_v<Ty_, char>>> {
    using type = sized_int_t<sizeof(Ty_)>;
};

template <typename Ty_>
using primitive_kind_t = typename primitive_kind<Ty_>::type;

template <typename Ty_>
constexpr bool is_primitive_kind_v = is_primitive_v<Ty_> && std::is_same_v<Ty_, primitive_kind_t<Ty_>>;

template <typename Ty_, class = void>
constexpr bool is_primitive_array_v = false;

template <typename Ty_>
constexpr bool is_primitive_array_v<Ty_, std::enable_if_t<is_template_instance_of<Ty_, std::vector>::value>>
        = is_primitive_v<typename Ty_::value_type>;

template <typename Ty_>
constexpr bool is_map_like_v = is_any_instance_of_v<Ty_, std::map, std::unordered_map>;

template <typename Ty_>
constexpr bool is_collection_v = is_any_instance_of_v<Ty_,
                                                      std::vector, std::deque, std::list,
                                                      std::set, std::multiset, std::unordered_set>;

INTERNAL_CODECORE_pewpew(has_reserve_v, T, std::declval<T&>().reserve(0));
INTERNAL_CODECORE_pewpew(has_emplace_back_v, T, std::declval<T&>().emplace_back(std::declval<typename T::value_type>()));

/**
 * Absence of nullable value types
 */
template <typename Ty_>
struct nullable_traits {
    enum { value = false };
};

template <typename Ty_>
struct nullable_traits<std::optional<Ty_>> {
    enum { value = true };
    using element_type = Ty_;

    static bool is_null(std::optional<Ty_> const& v) noexcept { return not v.has_value(); }
    static std::optional<Ty_> null() noexcept { return std::nullopt; }
};

template <typename Ty_>
struct nullable_traits<std::shared_ptr<Ty_>> {
    enum { value = true };
    using element_type = Ty_;

    static bool is_null(std::shared_ptr<Ty_> const& v) noexcept { return v == nullptr; }
    static std::shared_ptr<Ty_> null() noexcept { return nullptr; }
};

template <typename Ty_>
struct nullable_traits<std::unique_ptr<Ty_>> {
    enum { value = true };
    using element_type = Ty_;

    static bool is_null(std::unique_ptr<Ty_> const& v) noexcept { return v == nullptr; }
    static std::unique_ptr<Ty_> null() noexcept { return nullptr; }
};

template <typename Ty_>
constexpr bool is_nullable_v = nullable_traits<Ty_>::value;

//! Pointers to these are tagged with their runtime type
template <typename Ty_>
constexpr bool is_dynamic_v = std::is_polymorphic_v<Ty_> && not std::is_final_v<Ty_>;
}  // namespace codecore::detail
