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
#include "helper/exception.hxx"

namespace codecore::error {
/**
 * Root of every failure raised while resolving, encoding or decoding.
 *
 * A failure raised by the underlying carrier library is attached as nested
 * exception, and can be recovered with std::rethrow_if_nested().
 */
struct codec_exception : basic_exception<codec_exception> {
    codec_exception() noexcept = default;

    explicit codec_exception(std::string_view content) { message(content); }

    template <typename Arg0_, typename... Args_>
    codec_exception(std::string_view fmt_str, Arg0_&& arg0, Args_&&... args)
    {
        message(fmt_str, std::forward<Arg0_>(arg0), std::forward<Args_>(args)...);
    }
};

//! A default operation that a concrete codec was expected to override
CODECORE_DECLARE_EXCEPTION(operation_not_implemented, codec_exception);

//! Type tag names a type that is not known to the core
CODECORE_DECLARE_EXCEPTION(unknown_type_name, codec_exception);

//! Carrier node does not have the shape the codec expects
CODECORE_DECLARE_EXCEPTION(structure_mismatch, codec_exception);

//! No usable type constructor, or the type cannot be instantiated at all
CODECORE_DECLARE_EXCEPTION(instantiation_failure, codec_exception);

//! A codec could not be derived for the type
CODECORE_DECLARE_EXCEPTION(construction_failure, codec_exception);
}  // namespace codecore::error
