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
#include <exception>
#include <string>
#include <string_view>
#include <typeinfo>

#include <spdlog/fmt/fmt.h>

namespace codecore {

template <typename Ty_>
struct basic_exception : std::exception {
   private:
    mutable std::string _message = {};

   public:
    void message(std::string_view content)
    {
        _setmsg(content);
    }

    template <typename Arg0_, typename... Args_>
    void message(std::string_view fmt_str, Arg0_&& arg0, Args_&&... args)
    {
        _setmsg(fmt::format(fmt::runtime(fmt_str), std::forward<Arg0_>(arg0), std::forward<Args_>(args)...));
    }

    const char* what() const noexcept override
    {
        if (_message.empty()) { _setmsg({}); }
        return _message.c_str();
    }

   private:
    void _setmsg(std::string_view content) const
    {
        if (_message.empty()) {
            _message = "error (";
            _message += typeid(*this).name();
            _message += "): ";
        }
        _message += content;
    }
};

}  // namespace codecore

#ifndef CODECORE_DECLARE_EXCEPTION
#    define CODECORE_DECLARE_EXCEPTION(Name, Base)                \
        struct Name : Base {                                      \
            using _codecore_internal_super = Base;                \
            using _codecore_internal_super::_codecore_internal_super; \
        }
#endif
