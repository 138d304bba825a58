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
class if_type_constructor_base
{
   public:
    virtual ~if_type_constructor_base() = default;
    virtual std::type_info const& type_info() const noexcept = 0;
};

/**
 * Allocates a bare instance of Ty_, whose fields are assigned afterwards.
 */
template <typename Ty_>
class type_constructor : public if_type_constructor_base
{
   public:
    std::type_info const& type_info() const noexcept override { return typeid(Ty_); }
    virtual Ty_ construct() const = 0;
};

template <typename Ty_>
using type_constructor_ptr = std::shared_ptr<type_constructor<Ty_> const>;

template <typename Ty_, typename Fn_>
class function_type_constructor : public type_constructor<Ty_>
{
    Fn_ _fn;

   public:
    explicit function_type_constructor(Fn_ fn) : _fn(std::move(fn)) {}
    Ty_ construct() const override { return _fn(); }
};

template <typename Ty_, typename Fn_>
type_constructor_ptr<Ty_> make_type_constructor(Fn_&& fn)
{
    return std::make_shared<function_type_constructor<Ty_, std::decay_t<Fn_>>>(std::forward<Fn_>(fn));
}

//! Value-initializes Ty_, or fails if it cannot be.
template <typename Ty_>
type_constructor_ptr<Ty_> default_type_constructor()
{
    if constexpr (std::is_default_constructible_v<Ty_>) {
        return make_type_constructor<Ty_>([] { return Ty_{}; });
    } else {
        throw error::instantiation_failure{
                "'{}' is not default constructible; register a type constructor for it",
                type_name<Ty_>()};
    }
}
}  // namespace codecore
