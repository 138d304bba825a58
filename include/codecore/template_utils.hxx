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
#include <type_traits>
#include <utility>

namespace codecore {
template <typename Ty_>
using remove_cvr_t = std::remove_cv_t<std::remove_reference_t<Ty_>>;

template <typename Ty_, template <typename...> class Template_>
struct is_template_instance_of : std::false_type {};

template <template <typename...> class Template_, typename... Args_>
struct is_template_instance_of<Template_<Args_...>, Template_> : std::true_type {};

template <typename Ty_, template <typename...> class... Templates_>
constexpr bool is_any_instance_of_v = (is_template_instance_of<Ty_, Templates_>::value || ...);

//! Signed integer of given byte width
template <size_t Size_> struct sized_int;
template <> struct sized_int<1> { using type = int8_t; };
template <> struct sized_int<2> { using type = int16_t; };
template <> struct sized_int<4> { using type = int32_t; };
template <> struct sized_int<8> { using type = int64_t; };

template <size_t Size_>
using sized_int_t = typename sized_int<Size_>::type;
}  // namespace codecore

#define INTERNAL_CODECORE_pewpew(Name, T, Expr) \
    template <typename, class = void>           \
    constexpr bool Name = false;                \
    template <typename T>                       \
    constexpr bool Name<T, std::void_t<decltype(Expr)>> = true;
