// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * text_with_rank_support.hpp
 *
 * Encoded text (the BWT) answering rank(c,i) = number of c in text[0,i).
 *
 * Positions are grouped into blocks of block_t::num_bits positions and
 * blocks into superblocks. For every block, ceil(log2(sigma)) bit planes
 * store the bits of its symbols (plane j holds bit j of every symbol). Every
 * block stores a 16 bit count per symbol, relative to the start of its
 * superblock, and every superblock stores the absolute count per symbol
 * before its start. A rank query reads one superblock count, one block count
 * and popcounts the AND of the bit planes of one block.
 *
 * Counts are interleaved: the values for all symbols of the same block
 * (superblock) are next to each other.
 *
 */

#pragma once

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <omp.h>
#include <sdsl/int_vector.hpp>
#include <ips4o.hpp>

#include "block.hpp"
#include "definitions.hpp"
#include "packing.hpp"
#include "utils.hpp"

namespace fmdex{

template<class block_t = block64>
class text_with_rank_support{

public:

	static constexpr ulint MAX_SUPERBLOCK_SIZE = ulint(UINT16_MAX)+1;

	text_with_rank_support(){}

	/*
	 * \param text dense symbols, read through packing_t
	 * \param n number of symbols in text
	 * \param sigma all symbols are smaller than sigma
	 * \param superblock_size multiple of block_t::num_bits, at most 2^16
	 * \param packing_t how symbols are stored in text (byte_packing, half_byte_packing)
	 * \param threads OpenMP threads for the construction, 0 means OpenMP default
	 */
	template<class packing_t = byte_packing>
	text_with_rank_support(const uchar* text, ulint n, ulint sigma, ulint superblock_size = MAX_SUPERBLOCK_SIZE, packing_t = packing_t(), int threads = 0){

		if(sigma < 2 || sigma > 256)
			throw configuration_error("alphabet size must be in [2,256], got " + std::to_string(sigma));

		if(
			superblock_size == 0 ||
			superblock_size % block_t::num_bits != 0 ||
			superblock_size > MAX_SUPERBLOCK_SIZE
		)
			throw configuration_error(
				"superblock size must be a positive multiple of " + std::to_string(block_t::num_bits) +
				" and at most " + std::to_string(MAX_SUPERBLOCK_SIZE) + ", got " + std::to_string(superblock_size)
			);

		this->n = n;
		this->sigma = sigma;
		this->superblock_size = superblock_size;
		bits_per_symbol = ilog2_ceil(sigma);

		// positions 0..n are covered, so that rank(c,n) works
		ulint num_blocks = div_ceil(n+1,block_t::num_bits);
		ulint num_superblocks = div_ceil(n+1,superblock_size);
		ulint blocks_per_superblock = superblock_size/block_t::num_bits;

		blocks = std::vector<block_t>(num_blocks*bits_per_symbol,block_t::zeroes());
		block_counts = std::vector<uint16_t>(num_blocks*sigma,0);

		// number of occurrences of each symbol inside each superblock
		std::vector<ulint> superblock_totals(num_superblocks*sigma,0);

		if(threads <= 0) threads = omp_get_max_threads();

		#pragma omp parallel for schedule(dynamic,1) num_threads(threads)
		for(int64_t s=0;s<int64_t(num_superblocks);++s){
			fill_superblock<packing_t>(
				text,
				ulint(s)*blocks_per_superblock,
				std::min((ulint(s)+1)*blocks_per_superblock,num_blocks),
				&superblock_totals[ulint(s)*sigma]
			);
		}

		// prefix sums over the superblock totals
		superblock_counts.width(bitsize(n));
		superblock_counts.resize(num_superblocks*sigma);

		std::vector<ulint> sum_of_previous(sigma,0);

		for(ulint s=0;s<num_superblocks;++s){

			for(ulint c=0;c<sigma;++c){
				superblock_counts[s*sigma+c] = sum_of_previous[c];
				sum_of_previous[c] += superblock_totals[s*sigma+c];
			}

		}

	}

	/*
	 * number of occurrences of symbol c in text[0,i)
	 */
	ulint rank(uchar c, ulint i) const {

		if(c >= sigma)
			throw std::out_of_range("rank: symbol " + std::to_string(c) + " not smaller than alphabet size " + std::to_string(sigma));

		if(i > n)
			throw std::out_of_range("rank: position " + std::to_string(i) + " larger than text length " + std::to_string(n));

		return rank_unchecked(c,i);

	}

	/*
	 * as rank, requires c < sigma and i <= n
	 */
	ulint rank_unchecked(uchar c, ulint i) const {

		ulint superblock_count = superblock_counts[(i/superblock_size)*sigma+c];
		ulint block_count = block_counts[(i/block_t::num_bits)*sigma+c];

		const block_t* planes = &blocks[(i/block_t::num_bits)*bits_per_symbol];

		// keep the positions whose symbol matches c in every bit plane
		block_t acc = planes[0];
		if((c & 1) == 0) acc.negate();

		for(ulint j=1;j<bits_per_symbol;++j){

			block_t plane = planes[j];
			if(((c >> j) & 1) == 0) plane.negate();

			acc.set_to_self_and(plane);

		}

		return superblock_count + block_count + acc.count_ones_before(i%block_t::num_bits);

	}

	/*
	 * rank for many (symbol,position) pairs. Queries are grouped by block
	 * before they are answered, results are in input order
	 */
	std::vector<ulint> rank_many(const std::vector<std::pair<uchar,ulint>>& queries) const {

		for(auto& q : queries)
			if(q.first >= sigma || q.second > n)
				throw std::out_of_range("rank_many: query (" + std::to_string(q.first) + "," + std::to_string(q.second) + ") out of range");

		std::vector<ulint> order(queries.size());
		for(ulint i=0;i<order.size();++i) order[i] = i;

		ips4o::sort(order.begin(),order.end(),[&](ulint a, ulint b){
			return queries[a].second < queries[b].second;
		});

		std::vector<ulint> result(queries.size());

		for(ulint q : order)
			result[q] = rank_unchecked(queries[q].first,queries[q].second);

		return result;

	}

	/*
	 * hints the cache about the memory touched by rank(*,i)
	 */
	void prefetch(ulint i) const {
		__builtin_prefetch(&blocks[(i/block_t::num_bits)*bits_per_symbol]);
		__builtin_prefetch(&block_counts[(i/block_t::num_bits)*sigma]);
	}

	/*
	 * symbol at position i < n
	 */
	uchar symbol_at(ulint i) const {

		if(i >= n)
			throw std::out_of_range("symbol_at: position " + std::to_string(i) + " not smaller than text length " + std::to_string(n));

		return symbol_at_unchecked(i);

	}

	uchar symbol_at_unchecked(ulint i) const {

		const block_t* planes = &blocks[(i/block_t::num_bits)*bits_per_symbol];
		ulint index_in_block = i%block_t::num_bits;

		uchar c = 0;

		for(ulint j=0;j<bits_per_symbol;++j)
			c |= planes[j].get_bit(index_in_block) << j;

		return c;

	}

	ulint size() const {
		return n;
	}

	ulint alphabet_size() const {
		return sigma;
	}

	/* serialize the structure to the ostream
	 * \param out	 the ostream
	 */
	ulint serialize(std::ostream& out) const {

		ulint w_bytes = 0;

		w_bytes += write_value(out,n);
		w_bytes += write_value(out,sigma);
		w_bytes += write_value(out,superblock_size);

		w_bytes += write_vector(out,blocks);
		w_bytes += write_vector(out,block_counts);
		w_bytes += superblock_counts.serialize(out);

		return w_bytes;

	}

	/* load the structure from the istream
	 * \param in the istream
	 */
	void load(std::istream& in){

		read_value(in,n);
		read_value(in,sigma);
		read_value(in,superblock_size);
		bits_per_symbol = ilog2_ceil(sigma);

		read_vector(in,blocks);
		read_vector(in,block_counts);
		superblock_counts.load(in);

	}

	uint64_t size_in_bytes() const {

		uint64_t size = 0;

		size += blocks.size()*sizeof(block_t);
		size += block_counts.size()*sizeof(uint16_t);
		size += sdsl::size_in_bytes(superblock_counts);

		return size;

	}

private:

	/*
	 * fills bit planes and block counts of blocks [first_block,last_block),
	 * which form one superblock, and writes the number of occurrences of
	 * each symbol in it to totals
	 */
	template<class packing_t>
	void fill_superblock(const uchar* text, ulint first_block, ulint last_block, ulint* totals){

		std::vector<ulint> block_sum(sigma,0);

		for(ulint b=first_block;b<last_block;++b){

			for(ulint c=0;c<sigma;++c)
				block_counts[b*sigma+c] = uint16_t(block_sum[c]);

			block_t* planes = &blocks[b*bits_per_symbol];

			ulint begin = b*block_t::num_bits;
			ulint end = std::min(begin+block_t::num_bits,n);

			for(ulint i=begin;i<end;++i){

				uchar c = packing_t::get(text,i);
				block_sum[c]++;

				for(ulint j=0;j<bits_per_symbol;++j)
					planes[j].set_bit_assuming_zero(i-begin,(c >> j) & 1);

			}

		}

		for(ulint c=0;c<sigma;++c)
			totals[c] = block_sum[c];

	}

	ulint n = 0;
	ulint sigma = 0;
	ulint bits_per_symbol = 0;
	ulint superblock_size = MAX_SUPERBLOCK_SIZE;

	std::vector<block_t> blocks; // bit planes, bits_per_symbol per block
	std::vector<uint16_t> block_counts; // counts relative to the superblock, sigma per block
	sdsl::int_vector<> superblock_counts; // absolute counts, sigma per superblock

};

}
