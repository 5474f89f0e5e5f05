// ordset
// Copyright (c) 2026 Borislav Stanimirov
//
// Distributed under the MIT Software License
// See accompanying file LICENSE.txt or copy at
// https://opensource.org/licenses/MIT
//
#include <doctest/doctest.h>
#include <ordset/Errors.hpp>

#include <string>

TEST_SUITE_BEGIN("Errors");

TEST_CASE("Empty collection")
{
    ordset::EmptyCollectionError e("removeLast");
    CHECK(std::string(e.what()) == "removeLast on an empty set");

    const std::logic_error& base = e;
    CHECK(std::string(base.what()) == "removeLast on an empty set");
}

TEST_CASE("Index out of bounds")
{
    ordset::IndexOutOfBoundsError i(5, 3);
    CHECK(i.index() == 5);
    CHECK(i.begin() == 5);
    CHECK(i.end() == 6);
    CHECK(i.size() == 3);
    CHECK(std::string(i.what()) == "index 5 out of range [0, 3)");

    ordset::IndexOutOfBoundsError r(2, 7, 4);
    CHECK(r.begin() == 2);
    CHECK(r.end() == 7);
    CHECK(r.size() == 4);
    CHECK(std::string(r.what()) == "range [2, 7) out of range [0, 4]");

    ordset::IndexOutOfBoundsError m(size_t(-1), 3);
    CHECK(m.index() == size_t(-1));
    CHECK(m.end() == size_t(-1));
    CHECK(m.end() >= m.begin());

    const std::out_of_range& base = r;
    CHECK(std::string(base.what()) == "range [2, 7) out of range [0, 4]");
}

TEST_CASE("Duplicate element")
{
    ordset::DuplicateElementError d(3);
    CHECK(d.position() == 3);
    CHECK(std::string(d.what()) == "value at position 3 is already in the set");

    CHECK_THROWS_AS(throw d, std::invalid_argument);
}

TEST_SUITE_END();
