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
#include "../type_id.hxx"

/*
 * Describes the fields of a class for reflective object codecs.
 *
 *   CODECORE_DEFINE_OBJECT(point, (), (x), (y), (z, "depth"));
 *   CODECORE_DEFINE_OBJECT(circle, (.extend(codecore::type_tag_v<shape>)), (radius));
 *
 * AttrOps is a parenthesized sequence of calls applied to the factory before any
 * field. The namespace scope form must be placed in the namespace of the class.
 * The inline form is placed inside the class body, and may name private members.
 */
#define CODECORE_DEFINE_OBJECT(ClassName, AttrOps, ...)                                              \
    template <typename Factory_>                                                                     \
    void describe_object(::codecore::type_tag<ClassName>, Factory_& _codecore_internal_factory)       \
    {                                                                                                \
        using self_t = ClassName;                                                                    \
        _codecore_internal_factory INTERNAL_CODECORE_UNWRAP AttrOps;                                 \
        INTERNAL_CODECORE_EACH_FIELD(INTERNAL_CODECORE_ITERATE_OBJECT_VAR, __VA_ARGS__);             \
    }

#define CODECORE_DEFINE_OBJECT_inline(ClassName, AttrOps, ...)                                       \
    template <typename Factory_>                                                                     \
    friend void describe_object(::codecore::type_tag<ClassName>, Factory_& _codecore_internal_factory) \
    {                                                                                                \
        using self_t = ClassName;                                                                    \
        _codecore_internal_factory INTERNAL_CODECORE_UNWRAP AttrOps;                                 \
        INTERNAL_CODECORE_EACH_FIELD(INTERNAL_CODECORE_ITERATE_OBJECT_VAR, __VA_ARGS__);             \
    }

#define INTERNAL_CODECORE_ITERATE_OBJECT_VAR_3(VarName, ...) \
    _codecore_internal_factory.property(&self_t::VarName, #VarName, ##__VA_ARGS__)

#define INTERNAL_CODECORE_ITERATE_OBJECT_VAR(Param) \
    INTERNAL_CODECORE_ITERATE_OBJECT_VAR_3 Param

#define INTERNAL_CODECORE_UNWRAP(...) __VA_ARGS__

// Field lists of up to 32 entries; each entry becomes one property() call.
#define INTERNAL_CODECORE_EACH_FIELD(Fn, ...) \
    INTERNAL_CODECORE_CAT(INTERNAL_CODECORE_FIELDS_, INTERNAL_CODECORE_COUNT(__VA_ARGS__))(Fn, __VA_ARGS__)

#define INTERNAL_CODECORE_CAT(A, B)   INTERNAL_CODECORE_CAT_I(A, B)
#define INTERNAL_CODECORE_CAT_I(A, B) A##B

#define INTERNAL_CODECORE_COUNT(...) \
    INTERNAL_CODECORE_COUNT_I(__VA_ARGS__, 32, 31, 30, 29, 28, 27, 26, 25, 24, 23, 22, 21, 20, 19, 18, 17, 16, 15, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1)
#define INTERNAL_CODECORE_COUNT_I(_1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, _17, _18, _19, _20, _21, _22, _23, _24, _25, _26, _27, _28, _29, _30, _31, _32, Count, ...) Count

#define INTERNAL_CODECORE_FIELDS_1(Fn, Head) Fn(Head)
#define INTERNAL_CODECORE_FIELDS_2(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_1(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_3(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_2(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_4(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_3(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_5(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_4(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_6(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_5(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_7(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_6(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_8(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_7(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_9(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_8(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_10(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_9(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_11(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_10(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_12(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_11(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_13(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_12(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_14(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_13(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_15(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_14(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_16(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_15(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_17(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_16(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_18(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_17(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_19(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_18(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_20(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_19(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_21(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_20(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_22(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_21(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_23(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_22(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_24(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_23(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_25(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_24(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_26(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_25(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_27(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_26(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_28(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_27(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_29(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_28(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_30(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_29(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_31(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_30(Fn, __VA_ARGS__)
#define INTERNAL_CODECORE_FIELDS_32(Fn, Head, ...) Fn(Head); INTERNAL_CODECORE_FIELDS_31(Fn, __VA_ARGS__)
