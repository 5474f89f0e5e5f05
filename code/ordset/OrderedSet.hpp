// Copyright (c) Borislav Stanimirov
// SPDX-License-Identifier: MIT
//
#pragma once
#include "Errors.hpp"

#include <itlib/span.hpp>

#include <vector>
#include <unordered_set>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <type_traits>
#include <algorithm>
#include <cassert>

namespace ordset {

// A sequence of unique values which keeps them in the order of their first insertion.
// Values are stored twice: in a vector which gives the order and indexed access,
// and in a hash set which gives the membership tests.
// Both are private and every mutating method updates both of them, so the two
// always hold the same values.
//
// Only const iterators and const references are given out.
//
// Indexed and range writes refuse to store a value which is already present at
// another position and throw DuplicateElementError instead.
// A call which throws leaves the set unchanged. The ordset errors are thrown
// before anything is touched, and failures of T's copy or assignment are rolled
// back (provided T's assignment leaves its target unchanged when it throws).
//
// Not thread safe. Concurrent access must be synchronized externally.
template <typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
class OrderedSet {
public:
    using value_type = T;
    using size_type = size_t;
    using hasher = Hash;
    using key_equal = KeyEqual;
    using sequence = std::vector<T>;
    using membership = std::unordered_set<T, Hash, KeyEqual>;
    using const_reference = const T&;
    using const_iterator = typename sequence::const_iterator;
    using iterator = const_iterator;
    using const_reverse_iterator = typename sequence::const_reverse_iterator;
    using reverse_iterator = const_reverse_iterator;
    using slice_view = itlib::span<const T>;

    OrderedSet() = default;

    explicit OrderedSet(size_t bucketCount, const Hash& hash = Hash(), const KeyEqual& equal = KeyEqual())
        : m_membership(bucketCount, hash, equal)
    {}

    // only the first occurrence of repeated values is kept
    template <typename InputIt, typename = std::enable_if_t<!std::is_integral_v<InputIt>>>
    OrderedSet(InputIt first, InputIt last) {
        for (; first != last; ++first) {
            append(*first);
        }
    }

    OrderedSet(std::initializer_list<T> il)
        : OrderedSet(il.begin(), il.end())
    {}

    template <typename Range>
    static OrderedSet fromRange(const Range& r) {
        using std::begin;
        using std::end;
        return OrderedSet(begin(r), end(r));
    }

    OrderedSet(const OrderedSet&) = default;
    OrderedSet& operator=(const OrderedSet&) = default;
    OrderedSet(OrderedSet&&) = default;
    OrderedSet& operator=(OrderedSet&&) = default;

    size_t size() const noexcept { return m_sequence.size(); }
    bool empty() const noexcept { return m_sequence.empty(); }

    size_t capacity() const noexcept { return m_sequence.capacity(); }
    void reserve(size_t n) {
        m_sequence.reserve(n);
        m_membership.reserve(n);
    }

    const sequence& contents() const noexcept { return m_sequence; }

    bool contains(const T& value) const {
        return m_membership.find(value) != m_membership.end();
    }

    // position of value or nullopt if it's not in the set
    std::optional<size_t> indexOf(const T& value) const {
        if (!contains(value)) return std::nullopt;
        auto eq = m_membership.key_eq();
        auto i = std::find_if(m_sequence.begin(), m_sequence.end(), [&](const T& e) {
            return eq(e, value);
        });
        assert(i != m_sequence.end());
        return size_t(i - m_sequence.begin());
    }

    const T& at(size_t index) const {
        checkIndex(index);
        return m_sequence[index];
    }

    const T& operator[](size_t index) const {
        assert(index < size());
        return m_sequence[index];
    }

    const T& front() const {
        assert(!empty());
        return m_sequence.front();
    }

    const T& back() const {
        assert(!empty());
        return m_sequence.back();
    }

    // view of [begin, end)
    // invalidated by any mutation of the set
    slice_view slice(size_t begin, size_t end) const {
        checkRange(begin, end);
        return slice_view(m_sequence.data() + begin, end - begin);
    }

    const_iterator begin() const noexcept { return m_sequence.begin(); }
    const_iterator end() const noexcept { return m_sequence.end(); }
    const_iterator cbegin() const noexcept { return m_sequence.cbegin(); }
    const_iterator cend() const noexcept { return m_sequence.cend(); }
    const_reverse_iterator rbegin() const noexcept { return m_sequence.rbegin(); }
    const_reverse_iterator rend() const noexcept { return m_sequence.rend(); }

    hasher hash_function() const { return m_membership.hash_function(); }
    key_equal key_eq() const { return m_membership.key_eq(); }

    // add value to the end of the set
    // returns false and leaves the set unchanged if the value is already present
    bool append(const T& value) { return doAppend(value); }
    bool append(T&& value) { return doAppend(std::move(value)); }

    // remove and return the last value
    T removeLast() {
        if (empty()) throw EmptyCollectionError("removeLast");
        m_membership.erase(m_sequence.back());
        T last = std::move(m_sequence.back());
        m_sequence.pop_back();
        return last;
    }

    // keepCapacity = true retains the allocated storage for reuse
    void removeAll(bool keepCapacity = false) {
        if (keepCapacity) {
            m_sequence.clear();
            m_membership.clear();
        }
        else {
            sequence().swap(m_sequence);
            membership(0, m_membership.hash_function(), m_membership.key_eq()).swap(m_membership);
        }
    }

    // overwrite the value at index
    // writing a value which is present at another index throws DuplicateElementError
    void set(size_t index, const T& value) { doSet(index, value); }
    void set(size_t index, T&& value) { doSet(index, std::move(value)); }

    // replace [begin, end) with the values of the given range
    // the size of the set changes if the lengths differ
    // values which are only present in [begin, end) may be reused in the new values
    // a value present outside of [begin, end) or repeated in the new values throws DuplicateElementError
    template <typename Range>
    void setSlice(size_t from, size_t to, const Range& values) {
        using std::begin;
        using std::end;
        replaceSubrange(from, to, begin(values), end(values));
    }

    void setSlice(size_t from, size_t to, std::initializer_list<T> values) {
        replaceSubrange(from, to, values.begin(), values.end());
    }

    // the new values may be read from the set itself
    // the updated sequence is built aside and nothing is changed until it's complete
    template <typename InputIt>
    void replaceSubrange(size_t begin, size_t end, InputIt first, InputIt last) {
        checkRange(begin, end);

        auto rfirst = m_sequence.cbegin() + begin;
        auto rlast = m_sequence.cbegin() + end;

        sequence updated(m_sequence.cbegin(), rfirst);
        updated.insert(updated.end(), first, last);
        const size_t numNew = updated.size() - begin;
        updated.insert(updated.end(), rlast, m_sequence.cend());

        auto hash = m_membership.hash_function();
        auto eq = m_membership.key_eq();

        membership replaced(rfirst, rlast, 0, hash, eq);
        membership incoming(0, hash, eq);
        for (size_t pos = 0; pos < numNew; ++pos) {
            const auto& v = updated[begin + pos];
            if (!incoming.insert(v).second) {
                throw DuplicateElementError(pos);
            }
            if (contains(v) && replaced.find(v) == replaced.end()) {
                throw DuplicateElementError(pos);
            }
        }

        // the merge below must not rehash
        m_membership.reserve(m_membership.size() + numNew);

        // no allocations from here on
        for (auto i = rfirst; i != rlast; ++i) {
            m_membership.erase(*i);
        }
        // no value of incoming is in m_membership any more, so all nodes are transferred
        m_membership.merge(incoming);
        assert(incoming.empty());
        m_sequence.swap(updated);
    }

    void swap(OrderedSet& other) noexcept {
        m_sequence.swap(other.m_sequence);
        m_membership.swap(other.m_membership);
    }

private:
    sequence m_sequence;
    membership m_membership;

    void checkIndex(size_t index) const {
        if (index >= size()) throw IndexOutOfBoundsError(index, size());
    }

    void checkRange(size_t begin, size_t end) const {
        if (begin > end || end > size()) throw IndexOutOfBoundsError(begin, end, size());
    }

    template <typename U>
    bool doAppend(U&& value) {
        auto r = m_membership.insert(value);
        if (!r.second) return false;
        try {
            m_sequence.push_back(std::forward<U>(value));
        }
        catch (...) {
            // keep the views in sync and let the caller deal with the failure
            m_membership.erase(r.first);
            throw;
        }
        return true;
    }

    template <typename U>
    void doSet(size_t index, U&& value) {
        checkIndex(index);
        auto& slot = m_sequence[index];
        if (!m_membership.key_eq()(slot, value) && contains(value)) {
            throw DuplicateElementError(0);
        }

        // the old value is kept aside until the write succeeds
        // value may refer to slot, which is still untouched when the new node is created
        auto old = m_membership.extract(slot);
        typename membership::iterator fresh;
        try {
            fresh = m_membership.insert(std::forward<U>(value)).first;
        }
        catch (...) {
            m_membership.insert(std::move(old));
            throw;
        }

        try {
            slot = *fresh;
        }
        catch (...) {
            m_membership.erase(fresh);
            m_membership.insert(std::move(old));
            throw;
        }
    }
};

// order matters and values are compared with the key equality of the sets
template <typename T, typename Hash, typename KeyEqual>
bool operator==(const OrderedSet<T, Hash, KeyEqual>& a, const OrderedSet<T, Hash, KeyEqual>& b) {
    if (a.size() != b.size()) return false;
    return std::equal(a.begin(), a.end(), b.begin(), a.key_eq());
}

template <typename T, typename Hash, typename KeyEqual>
bool operator!=(const OrderedSet<T, Hash, KeyEqual>& a, const OrderedSet<T, Hash, KeyEqual>& b) {
    return !(a == b);
}

template <typename T, typename Hash, typename KeyEqual>
void swap(OrderedSet<T, Hash, KeyEqual>& a, OrderedSet<T, Hash, KeyEqual>& b) noexcept {
    a.swap(b);
}

}
