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

#include <spdlog/spdlog.h>

namespace codecore::detail {
//! Logger shared by every codec core. Reuses an application logger named "codecore" if one exists.
spdlog::logger* logger();
}  // namespace codecore::detail

#ifndef CODECORE_LOGGER
#    define CODECORE_LOGGER() (::codecore::detail::logger())
#endif

#define CODECORE_TRACE(...) SPDLOG_LOGGER_TRACE(CODECORE_LOGGER(), __VA_ARGS__)
#define CODECORE_DEBUG(...) SPDLOG_LOGGER_DEBUG(CODECORE_LOGGER(), __VA_ARGS__)
#define CODECORE_INFO(...)  SPDLOG_LOGGER_INFO(CODECORE_LOGGER(), __VA_ARGS__)
#define CODECORE_WARN(...)  SPDLOG_LOGGER_WARN(CODECORE_LOGGER(), __VA_ARGS__)
#define CODECORE_ERROR(...) SPDLOG_LOGGER_ERROR(CODECORE_LOGGER(), __VA_ARGS__)
