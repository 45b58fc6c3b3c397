// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * cursor.hpp
 *
 * Resumable backward search. A cursor holds the interval of the suffixes
 * prefixed by the query matched so far. Cursors are small values: copying
 * one and extending the copy leaves the original untouched.
 *
 */

#pragma once

#include <iterator>
#include <string>
#include <vector>

#include "alphabet.hpp"
#include "definitions.hpp"
#include "utils.hpp"

namespace fmdex{

/*
 * lazy sequence of the hits of an interval, in BWT order. Each hit is
 * resolved when the iterator is dereferenced.
 */
template<class index_t>
class hit_range{

public:

	class iterator{

	public:

		using iterator_category = std::input_iterator_tag;
		using value_type = hit;
		using difference_type = std::ptrdiff_t;
		using pointer = const hit*;
		using reference = hit;

		iterator(const index_t* index, ulint i) : index(index), i(i) {}

		hit operator*() const {
			return index->hit_at(i);
		}

		iterator& operator++(){
			++i;
			return *this;
		}

		iterator operator++(int){
			iterator tmp = *this;
			++i;
			return tmp;
		}

		bool operator==(const iterator& other) const {
			return i == other.i;
		}

		bool operator!=(const iterator& other) const {
			return i != other.i;
		}

	private:

		const index_t* index;
		ulint i;

	};

	hit_range(const index_t* index, interval I) : index(index), I(I) {}

	iterator begin() const {
		return iterator(index,I.lo);
	}

	iterator end() const {
		return iterator(index,I.hi);
	}

	ulint size() const {
		return I.size();
	}

	bool empty() const {
		return I.empty();
	}

	std::vector<hit> to_vector() const {
		return std::vector<hit>(begin(),end());
	}

private:

	const index_t* index;
	interval I;

};

template<class index_t>
class cursor{

public:

	cursor(const index_t* index, interval I, ulint length) : index(index), I(I), len(length) {}

	/*
	 * prepends the IO symbol c to the matched query. Throws
	 * query_input_error (position 0) if c is not in the alphabet
	 */
	void extend_left(uchar c){

		uchar dense = index->get_alphabet().to_dense(c);

		if(dense == alphabet::INVALID)
			throw query_input_error("query symbol " + std::to_string(ulint(c)) + " is not in the alphabet",0);

		extend_left_dense(dense);

	}

	void extend_left(char c){
		extend_left(char_to_uchar(c));
	}

	/*
	 * as extend_left, with a dense symbol of the alphabet
	 */
	void extend_left_dense(uchar dense){

		I = index->lf_step_unchecked(dense,I);
		len++;

	}

	ulint count() const {
		return I.size();
	}

	bool empty() const {
		return I.empty();
	}

	interval get_interval() const {
		return I;
	}

	/*
	 * number of query symbols matched so far
	 */
	ulint length() const {
		return len;
	}

	hit_range<index_t> locate() const {
		return hit_range<index_t>(index,I);
	}

private:

	const index_t* index;
	interval I;
	ulint len;

};

}
