// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * config.hpp
 *
 * Build parameters of an fm_index.
 *
 */

#pragma once

#include <iostream>
#include <limits>
#include <string>

#include <omp.h>

#include "definitions.hpp"
#include "suffix_array_construction.hpp"
#include "utils.hpp"

namespace fmdex{

struct fm_index_config{

	// SA values divisible by this are kept
	ulint sa_sampling_rate = 4;

	// k of the k-mer lookup table, 0 disables the table
	ulint lookup_table_depth = 8;

	// symbols per superblock of the rank structure
	ulint superblock_size = 65536;

	// pack text and BWT into half bytes during construction (only used if sigma <= 16)
	bool low_memory = false;

	saca_algorithm saca = saca_algorithm::libsais;

	// OpenMP threads used during construction, 0 means OpenMP default
	int threads = 0;

	bool log = false;

	ulint serialize(std::ostream& out) const {

		ulint w_bytes = 0;

		w_bytes += write_value(out,sa_sampling_rate);
		w_bytes += write_value(out,lookup_table_depth);
		w_bytes += write_value(out,superblock_size);
		w_bytes += write_value(out,uchar(low_memory));
		w_bytes += write_value(out,uchar(saca));

		return w_bytes;

	}

	void load(std::istream& in){

		uchar low_memory_byte = 0;
		uchar saca_byte = 0;

		read_value(in,sa_sampling_rate);
		read_value(in,lookup_table_depth);
		read_value(in,superblock_size);
		read_value(in,low_memory_byte);
		read_value(in,saca_byte);

		low_memory = low_memory_byte != 0;
		saca = saca_algorithm(saca_byte);

	}

};

// lookup tables with more entries than this are rejected
static constexpr ulint MAX_LOOKUP_TABLE_ENTRIES = ulint(1) << 32;

// deeper tables are rejected, also for a single searchable symbol where the
// number of entries does not grow with the depth
static constexpr ulint MAX_LOOKUP_TABLE_DEPTH = 32;

/*
 * number of entries of a lookup table of depth k over num_symbols symbols,
 * or MAX_LOOKUP_TABLE_ENTRIES+1 if it exceeds the limit
 */
inline ulint lookup_table_entries(ulint num_symbols, ulint k){

	ulint entries = 1;

	for(ulint d=0;d<k;++d){

		if(num_symbols > 0 && entries > MAX_LOOKUP_TABLE_ENTRIES/num_symbols)
			return MAX_LOOKUP_TABLE_ENTRIES+1;

		entries *= num_symbols;

	}

	return entries;

}

/*
 * number of OpenMP threads of the construction loops. Passed to each loop
 * with num_threads, the caller's OpenMP setting is not changed
 */
inline int construction_threads(const fm_index_config& config){
	return config.threads > 0 ? config.threads : omp_get_max_threads();
}

/*
 * throws configuration_error if the parameters cannot be used to build an
 * index with block size block_bits over num_searchable_symbols searchable symbols
 */
inline void validate_config(const fm_index_config& config, ulint block_bits, ulint num_searchable_symbols){

	if(config.sa_sampling_rate == 0)
		throw configuration_error("suffix array sampling rate must be positive");

	if(
		config.superblock_size == 0 ||
		config.superblock_size % block_bits != 0 ||
		config.superblock_size > ulint(UINT16_MAX)+1
	)
		throw configuration_error(
			"superblock size must be a positive multiple of the block size (" + std::to_string(block_bits) +
			") and at most 65536, got " + std::to_string(config.superblock_size)
		);

	if(config.lookup_table_depth > MAX_LOOKUP_TABLE_DEPTH)
		throw configuration_error(
			"lookup table depth must be at most " + std::to_string(MAX_LOOKUP_TABLE_DEPTH) +
			", got " + std::to_string(config.lookup_table_depth)
		);

	if(lookup_table_entries(num_searchable_symbols,config.lookup_table_depth) > MAX_LOOKUP_TABLE_ENTRIES)
		throw configuration_error(
			"lookup table of depth " + std::to_string(config.lookup_table_depth) + " over " +
			std::to_string(num_searchable_symbols) + " symbols has more than 2^32 entries"
		);

	if(config.threads < 0)
		throw configuration_error("number of threads must not be negative");

	if(config.saca != saca_algorithm::libsais && config.saca != saca_algorithm::sais_lite)
		throw configuration_error("unknown suffix array construction algorithm");

}

/*
 * throws configuration_error if a corpus of length n (sentinels included)
 * cannot be indexed with offset type uint_t
 */
template<typename uint_t>
void validate_corpus_length(ulint n){

	if(n > ulint(std::numeric_limits<uint_t>::max()))
		throw configuration_error(
			"corpus length " + std::to_string(n) + " exceeds the maximum " +
			std::to_string(ulint(std::numeric_limits<uint_t>::max())) + " of the offset type"
		);

}

}
