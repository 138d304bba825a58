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
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "../codec.hxx"
#include "../codec_core_fwd.hxx"

namespace codecore {
/**
 * Encodes one named field of Ty_, and folds its decoded form into Acc_.
 */
template <typename Ty_, typename Enc_, typename Acc_>
class field_meta
{
    std::string _name;

   public:
    explicit field_meta(std::string name) noexcept : _name(std::move(name)) {}
    virtual ~field_meta() = default;

    std::string const& name() const noexcept { return _name; }

    virtual void encode_field(Ty_ const& val, Enc_& enc) const = 0;
    virtual void decode_field(Acc_& acc, Enc_ const& enc) const = 0;
};

/**
 * Ordered field descriptors of an object codec, and the start of its decode.
 *
 * The accumulator returned by start_decode() receives every decoded field, then
 * yields the decoded value from its construct().
 */
template <typename Ty_, typename Enc_, typename Acc_>
struct object_meta {
    using field_type = field_meta<Ty_, Enc_, Acc_>;

    std::vector<std::unique_ptr<field_type const>> fields;
    std::function<Acc_(type_id const&)> start_decode;
};

/**
 * Drives encode and decode of composite values over their field descriptors.
 */
template <typename Ty_, typename Enc_, typename Acc_>
class object_codec : public codec<Ty_, Enc_>
{
    codec_core<Enc_>* _core;
    object_meta<Ty_, Enc_, Acc_> _meta;
    std::set<std::string, std::less<>> _names;

   public:
    object_codec(codec_core<Enc_>* core, object_meta<Ty_, Enc_, Acc_> meta)
            : _core(core), _meta(std::move(meta))
    {
        for (auto& field : _meta.fields)
            _names.insert(field->name());
    }

    auto const& fields() const noexcept { return _meta.fields; }

    Enc_& encode(Ty_ const& val, Enc_& enc) const override
    {
        _core->make_object(enc);

        for (auto& field : _meta.fields)
            field->encode_field(val, _core->add_field(enc, field->name()));

        return enc;
    }

    Ty_ decode(Enc_ const& enc) const override
    {
        return decode(type_id::of<Ty_>(), enc);
    }

    Ty_ decode(type_id const& dyn_type, Enc_ const& enc) const override
    {
        auto& config = _core->config;

        if (not config.allow_unknown_field) {
            _core->for_each_field(enc, [&](std::string_view name, Enc_ const&) {
                if (_names.find(name) == _names.end())
                    throw error::structure_mismatch{"unknown field '{}' for '{}'", name, type_name<Ty_>()};
            });
        }

        auto acc = _meta.start_decode(dyn_type);

        for (auto& field : _meta.fields) {
            auto node = _core->find_field(enc, field->name());

            if (node == nullptr) {
                if (not config.allow_missing_field)
                    throw error::structure_mismatch{"field '{}' of '{}' is missing", field->name(), type_name<Ty_>()};

                node = &_core->null_marker().null_node();
            }

            field->decode_field(acc, *node);
        }

        return acc.construct();
    }
};
}  // namespace codecore
