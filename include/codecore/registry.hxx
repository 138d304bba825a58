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
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "helper/logging.hxx"
#include "thread/spinlock.hxx"

namespace codecore {
/**
 * Lazily populated map from type identity to a shared, immutable value.
 *
 * Each entry is either a placeholder handed out while the value is under
 * construction, or the resolved value itself. The lock is held only around the
 * lookup and check-then-insert steps, never across a build.
 */
template <typename Value_>
class lazy_registry
{
   public:
    using value_ptr = std::shared_ptr<Value_ const>;

   private:
    struct entry_t {
        value_ptr value;
        bool resolved = false;
    };

   private:
    mutable thread::spinlock _lock;
    std::map<std::string, entry_t, std::less<>> _table;

   public:
    /**
     * Puts given value as resolved entry. Last write wins.
     *
     * @return true if an existing entry was replaced
     */
    bool assign(std::string_view name, value_ptr value)
    {
        bool replaced_resolved = false;
        {
            std::lock_guard _{_lock};
            auto iter = _table.find(name);

            if (iter == _table.end()) {
                _table.emplace(std::string{name}, entry_t{std::move(value), true});
                return false;
            }

            replaced_resolved = iter->second.resolved;
            iter->second      = entry_t{std::move(value), true};
        }

        if (replaced_resolved)
            CODECORE_WARN("'{}' replaced after it was already resolved", name);

        return true;
    }

    value_ptr find(std::string_view name) const
    {
        std::lock_guard _{_lock};
        auto iter = _table.find(name);
        return iter != _table.end() ? iter->second.value : nullptr;
    }

    /**
     * Returns the entry of name, building it if absent.
     *
     * A placeholder of type Ref_ is registered before build() is invoked, thus
     * any recursive resolution of the same name during build receives the
     * placeholder. On failure the placeholder is removed and abandoned, and the
     * exception propagates.
     *
     * Entries resolved on this thread while build() runs may hold the
     * placeholder, so they are removed too when build() fails.
     *
     * @tparam Ref_ Placeholder type, which provides install() and abandon()
     */
    template <typename Ref_, typename Build_>
    value_ptr resolve(std::string_view name, Build_&& build)
    {
        std::shared_ptr<Ref_> ref;
        {
            std::lock_guard _{_lock};
            if (auto iter = _table.find(name); iter != _table.end())
                return iter->second.value;

            ref = std::make_shared<Ref_>();
            _table.emplace(std::string{name}, entry_t{ref, false});
        }

        CODECORE_TRACE("forward reference of '{}' registered", name);

        auto& journal        = _journal();
        auto const mark      = journal.resolved.size();
        bool const outermost = journal.depth == 0;
        build_scope scope{journal};

        try {
            auto built = build();
            ref->install(built);

            value_ptr result;
            {
                std::lock_guard _{_lock};
                auto& entry = _table.find(name)->second;

                if (entry.value == ref)
                    entry = entry_t{std::move(built), true};

                result = entry.value;
            }

            if (outermost)
                journal.resolved.clear();
            else
                journal.resolved.push_back({this, std::string{name}, result});

            return result;
        } catch (...) {
            CODECORE_DEBUG("construction of '{}' failed; removing its forward reference", name);
            ref->abandon(std::current_exception());

            size_t num_dropped = 0;
            {
                std::lock_guard _{_lock};
                if (auto iter = _table.find(name); iter != _table.end() && iter->second.value == ref)
                    _table.erase(iter);

                for (auto i = mark; i < journal.resolved.size(); ++i) {
                    auto& record = journal.resolved[i];
                    if (record.owner != this)
                        continue;

                    if (auto iter = _table.find(record.name); iter != _table.end() && iter->second.value == record.value) {
                        _table.erase(iter);
                        ++num_dropped;
                    }
                }
            }

            if (num_dropped > 0)
                CODECORE_DEBUG("{} entries resolved while building '{}' dropped", num_dropped, name);

            journal.resolved.erase(journal.resolved.begin() + mark, journal.resolved.end());
            throw;
        }
    }

   private:
    struct journal_record {
        lazy_registry const* owner = nullptr;
        std::string name;
        value_ptr value;
    };

    //! Entries resolved on one thread while an enclosing build is in progress
    struct build_journal {
        int depth = 0;
        std::vector<journal_record> resolved;
    };

    struct build_scope {
        build_journal& journal;

        explicit build_scope(build_journal& j) noexcept : journal(j) { ++journal.depth; }
        ~build_scope() { --journal.depth; }
    };

    static build_journal& _journal()
    {
        thread_local build_journal journal;
        return journal;
    }
};
}  // namespace codecore
