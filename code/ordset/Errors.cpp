// Copyright (c) Borislav Stanimirov
// SPDX-License-Identifier: MIT
//
#include "Errors.hpp"

#include <string>
#include <limits>

namespace ordset {

namespace {
std::string rangeMessage(size_t begin, size_t end, size_t size) {
    std::string msg = "range [";
    msg += std::to_string(begin);
    msg += ", ";
    msg += std::to_string(end);
    msg += ") out of range [0, ";
    msg += std::to_string(size);
    msg += "]";
    return msg;
}

std::string indexMessage(size_t index, size_t size) {
    std::string msg = "index ";
    msg += std::to_string(index);
    msg += " out of range [0, ";
    msg += std::to_string(size);
    msg += ")";
    return msg;
}
}

EmptyCollectionError::EmptyCollectionError(const char* operation)
    : std::logic_error(std::string(operation) + " on an empty set")
{}

IndexOutOfBoundsError::IndexOutOfBoundsError(size_t index, size_t size)
    : std::out_of_range(indexMessage(index, size))
    , m_begin(index)
    , m_end(index == std::numeric_limits<size_t>::max() ? index : index + 1)
    , m_size(size)
{}

IndexOutOfBoundsError::IndexOutOfBoundsError(size_t begin, size_t end, size_t size)
    : std::out_of_range(rangeMessage(begin, end, size))
    , m_begin(begin)
    , m_end(end)
    , m_size(size)
{}

DuplicateElementError::DuplicateElementError(size_t position)
    : std::invalid_argument("value at position " + std::to_string(position) + " is already in the set")
    , m_position(position)
{}

// export vtables
EmptyCollectionError::~EmptyCollectionError() = default;
IndexOutOfBoundsError::~IndexOutOfBoundsError() = default;
DuplicateElementError::~DuplicateElementError() = default;

}
