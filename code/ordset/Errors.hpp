// Copyright (c) Borislav Stanimirov
// SPDX-License-Identifier: MIT
//
#pragma once
#include "API.h"

#include <stdexcept>
#include <cstddef>

namespace ordset {

// thrown by removeLast on an empty set
class ORDSET_API EmptyCollectionError : public std::logic_error {
public:
    explicit EmptyCollectionError(const char* operation);
    virtual ~EmptyCollectionError();
};

// thrown when an index or a range falls outside the set
// for single indices the valid range is [0, size)
// for ranges both ends must be in [0, size] and begin <= end
class ORDSET_API IndexOutOfBoundsError : public std::out_of_range {
public:
    IndexOutOfBoundsError(size_t index, size_t size);
    IndexOutOfBoundsError(size_t begin, size_t end, size_t size);
    virtual ~IndexOutOfBoundsError();

    // for single index errors begin() == index() and end() == index() + 1
    // end() saturates at SIZE_MAX (what a caller's -1 becomes) instead of wrapping to 0
    size_t index() const noexcept { return m_begin; }
    size_t begin() const noexcept { return m_begin; }
    size_t end() const noexcept { return m_end; }
    size_t size() const noexcept { return m_size; }
private:
    size_t m_begin;
    size_t m_end;
    size_t m_size;
};

// thrown by indexed and range writes which would store a value twice
// position is the index in the sequence of new values which collided
// (always 0 for single value writes)
class ORDSET_API DuplicateElementError : public std::invalid_argument {
public:
    explicit DuplicateElementError(size_t position);
    virtual ~DuplicateElementError();

    size_t position() const noexcept { return m_position; }
private:
    size_t m_position;
};

}
