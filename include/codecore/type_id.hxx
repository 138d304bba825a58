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
#include <string>
#include <string_view>
#include <typeinfo>

namespace codecore {
template <typename Ty_>
struct type_tag {
    using type = Ty_;
};

template <typename Ty_>
constexpr type_tag<Ty_> type_tag_v = {};

//! Demangles a name returned by std::type_info::name()
std::string demangle(char const* mangled);

/**
 * Canonical identity string of a type. Used as registry key.
 */
template <typename Ty_>
std::string const& type_name()
{
    static std::string const name = demangle(typeid(Ty_).name());
    return name;
}

/**
 * Type identity threaded through decode calls.
 *
 * Identities read back from a carrier's type tag carry no type_info, and their
 * name refers to the carrier node's storage.
 */
class type_id
{
    std::string_view _name;
    std::type_info const* _info = nullptr;

   public:
    type_id() noexcept = default;
    explicit type_id(std::string_view name, std::type_info const* info = nullptr) noexcept
            : _name(name), _info(info) {}

    template <typename Ty_>
    static type_id of()
    {
        return type_id{type_name<Ty_>(), &typeid(Ty_)};
    }

    std::string_view name() const noexcept { return _name; }
    std::type_info const* info() const noexcept { return _info; }
    bool empty() const noexcept { return _name.empty(); }

    bool operator==(type_id const& other) const noexcept { return _name == other._name; }
    bool operator!=(type_id const& other) const noexcept { return _name != other._name; }
};
}  // namespace codecore
