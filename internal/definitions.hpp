// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * definitions.hpp
 *
 * Basic types shared by all components of the index: offsets, search
 * intervals, hits and the error taxonomy.
 *
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>

namespace fmdex{

using ulint = uint64_t;
using uchar = unsigned char;

/*
 * half-open interval [lo,hi) of suffix array slots. lo == hi means no match,
 * which is a valid state and not an error
 */
struct interval{

	ulint lo = 0;
	ulint hi = 0;

	ulint size() const {
		return hi - lo;
	}

	bool empty() const {
		return lo == hi;
	}

	bool operator==(const interval& other) const {
		return lo == other.lo && hi == other.hi;
	}

	bool operator!=(const interval& other) const {
		return !(*this == other);
	}

};

/*
 * an occurrence of a query: text id and position inside that text
 */
struct hit{

	ulint text_id = 0;
	ulint position = 0;

	bool operator==(const hit& other) const {
		return text_id == other.text_id && position == other.position;
	}

	bool operator!=(const hit& other) const {
		return !(*this == other);
	}

	bool operator<(const hit& other) const {
		return std::tie(text_id,position) < std::tie(other.text_id,other.position);
	}

};

/*
 * invalid build parameters, or a corpus that does not fit the offset type
 */
class configuration_error : public std::invalid_argument{

public:

	explicit configuration_error(const std::string& what) : std::invalid_argument(what) {}

};

/*
 * a text handed to the construction contains a byte outside the alphabet
 */
class input_error : public std::invalid_argument{

public:

	input_error(const std::string& what, ulint text_id, ulint position)
		: std::invalid_argument(what), text_id_(text_id), position_(position) {}

	ulint text_id() const {
		return text_id_;
	}

	ulint position() const {
		return position_;
	}

private:

	ulint text_id_;
	ulint position_;

};

/*
 * a query contains a byte outside the alphabet. Only the query is affected.
 */
class query_input_error : public std::invalid_argument{

public:

	query_input_error(const std::string& what, ulint position)
		: std::invalid_argument(what), position_(position) {}

	ulint position() const {
		return position_;
	}

private:

	ulint position_;

};

}
