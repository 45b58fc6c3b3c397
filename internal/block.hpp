// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * block.hpp
 *
 * Fixed size bit blocks used as bit planes by text_with_rank_support.
 * block64 is the better choice for small alphabets like DNA, block512
 * uses less memory for large alphabets at slightly higher query cost.
 *
 */

#pragma once

#include <sdsl/bits.hpp>

#include "definitions.hpp"

namespace fmdex{

template<ulint num_words_>
struct alignas(num_words_*8) bit_block{

	static constexpr ulint num_words = num_words_;
	static constexpr ulint num_bits = num_words_*64;

	uint64_t data[num_words_];

	static bit_block zeroes(){
		bit_block b;
		for(ulint w=0;w<num_words;++w) b.data[w] = 0;
		return b;
	}

	// the bit at index must still be 0
	void set_bit_assuming_zero(ulint index, uint64_t bit){
		data[index/64] |= bit << (index%64);
	}

	uchar get_bit(ulint index) const {
		return uchar((data[index/64] >> (index%64)) & 1);
	}

	void negate(){
		for(ulint w=0;w<num_words;++w) data[w] = ~data[w];
	}

	void set_to_self_and(const bit_block& other){
		for(ulint w=0;w<num_words;++w) data[w] &= other.data[w];
	}

	/*
	 * number of set bits at positions [0,index)
	 */
	ulint count_ones_before(ulint index) const {

		ulint full_words = index/64;
		ulint cnt = 0;

		for(ulint w=0;w<full_words;++w)
			cnt += sdsl::bits::cnt(data[w]);

		ulint rest = index%64;

		if(rest > 0)
			cnt += sdsl::bits::cnt(data[full_words] & sdsl::bits::lo_set[rest]);

		return cnt;

	}

};

using block64 = bit_block<1>;
using block512 = bit_block<8>;

}
