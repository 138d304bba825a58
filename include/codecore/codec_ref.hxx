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
#include <atomic>
#include <exception>
#include <memory>
#include <thread>

#include "codec.hxx"
#include "thread/event_wait.hxx"
#include "type_constructor.hxx"

namespace codecore {
namespace detail {
/**
 * Target of a forward reference, installed at most once.
 */
template <typename Target_>
class forward_slot
{
    std::atomic<Target_ const*> _target{nullptr};
    std::shared_ptr<Target_ const> _owner;
    std::exception_ptr _failure;
    std::thread::id _builder = std::this_thread::get_id();
    thread::event_wait _ready;

   public:
    void install(std::shared_ptr<Target_ const> target)
    {
        _ready.notify_all([&] {
            _owner = std::move(target);
            _target.store(_owner.get(), std::memory_order_release);
        });
    }

    void abandon(std::exception_ptr failure)
    {
        _ready.notify_all([&] { _failure = std::move(failure); });
    }

    Target_ const& get(std::string const& name) const
    {
        if (auto ptr = _target.load(std::memory_order_acquire))
            return *ptr;

        if (std::this_thread::get_id() == _builder && not _ready.critical([&] { return bool(_failure); }))
            throw error::construction_failure{"'{}' used before its construction completed", name};

        _ready.wait([&] { return _target.load(std::memory_order_relaxed) || _failure; });

        if (auto ptr = _target.load(std::memory_order_acquire))
            return *ptr;

        try {
            std::rethrow_exception(_failure);
        } catch (...) {
            std::throw_with_nested(error::construction_failure{"construction of '{}' failed", name});
        }
    }
};
}  // namespace detail

/**
 * Placeholder handed out while the codec of Ty_ is under construction.
 *
 * Every call is forwarded to the codec installed later. Calls from other
 * threads block until it is installed; calls from the building thread itself
 * would never complete, and fail instead.
 */
template <typename Ty_, typename Enc_>
class codec_ref : public codec<Ty_, Enc_>
{
    detail::forward_slot<codec<Ty_, Enc_>> _slot;

   public:
    void install(codec_ptr<Ty_, Enc_> target) { _slot.install(std::move(target)); }
    void abandon(std::exception_ptr failure) { _slot.abandon(std::move(failure)); }

   public:
    Enc_& encode(Ty_ const& val, Enc_& enc) const override
    {
        return _get().encode(val, enc);
    }

    Ty_ decode(Enc_ const& enc) const override
    {
        return _get().decode(enc);
    }

    Ty_ decode(type_id const& dyn_type, Enc_ const& enc) const override
    {
        return _get().decode(dyn_type, enc);
    }

    if_codec_base const* resolved() const override
    {
        return _get().resolved();
    }

   private:
    codec<Ty_, Enc_> const& _get() const { return _slot.get(type_name<Ty_>()); }
};

template <typename Ty_>
class type_constructor_ref : public type_constructor<Ty_>
{
    detail::forward_slot<type_constructor<Ty_>> _slot;

   public:
    void install(type_constructor_ptr<Ty_> target) { _slot.install(std::move(target)); }
    void abandon(std::exception_ptr failure) { _slot.abandon(std::move(failure)); }

    Ty_ construct() const override { return _slot.get(type_name<Ty_>()).construct(); }
};
}  // namespace codecore
